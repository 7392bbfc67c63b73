/**
 * @file dashboard_client.hpp
 * @brief Authenticated client for the monitoring dashboard REST API.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/core/node.hpp"
#include "storjcloud/net/http_client.hpp"
#include "storjcloud/services/export.hpp"
#include "storjcloud/utils/cancellation.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace storjcloud {
namespace services {

/// Default dashboard API base URL.
constexpr const char* kDefaultDashboardUrl = "https://storj.cloud/api/v1";

/**
 * @brief Classification of one dashboard call.
 */
enum class ApiStatus {
    OK,            ///< 2xx
    CONFLICT,      ///< 409
    UNAUTHORIZED,  ///< 401
    REJECTED,      ///< Any other non-2xx
    UNREACHABLE,   ///< No HTTP answer
    MALFORMED,     ///< 2xx with an unparsable body
    CANCELLED
};

STORJCLOUD_SERVICES_API const char* apiStatusToString(ApiStatus status);

struct ApiResult {
    ApiStatus status = ApiStatus::OK;
    long httpStatus = 0;
    std::string message;   ///< "HTTP 422: quota exceeded", transport error text

    bool ok() const { return status == ApiStatus::OK; }
};

struct UserInfo {
    std::string email;
    std::string name;
    std::vector<std::string> permissions;
};

/**
 * @class DashboardApi
 * @brief Dashboard operations used by the registrar and the sync engine.
 */
class STORJCLOUD_SERVICES_API DashboardApi {
public:
    virtual ~DashboardApi() = default;

    /// GET /auth/me
    virtual ApiResult whoAmI(UserInfo& user, const utils::CancellationToken* cancel = nullptr) = 0;

    /// POST /storj/nodes
    virtual ApiResult registerNode(const core::Node& node,
                                   const utils::CancellationToken* cancel = nullptr) = 0;

    /// PATCH /storj/nodes/{nodeId} with the registration body
    virtual ApiResult updateRegistration(const core::Node& node,
                                         const utils::CancellationToken* cancel = nullptr) = 0;

    /// GET /storj/nodes
    virtual ApiResult listNodes(std::vector<core::RegisteredNode>& nodes,
                                const utils::CancellationToken* cancel = nullptr) = 0;

    /// PATCH /storj/nodes/{id} with a metrics snapshot
    virtual ApiResult pushMetrics(const core::RegisteredNode& node,
                                  const core::MetricsSnapshot& snapshot,
                                  const utils::CancellationToken* cancel = nullptr) = 0;
};

struct DashboardSettings {
    std::string baseUrl = kDefaultDashboardUrl;
    std::string token;
    std::chrono::milliseconds timeout{30000};
};

/**
 * @class DashboardClient
 * @brief DashboardApi over HTTPS with a bearer token.
 */
class STORJCLOUD_SERVICES_API DashboardClient : public DashboardApi {
public:
    DashboardClient(DashboardSettings settings, std::shared_ptr<net::HttpClient> http);

    ApiResult whoAmI(UserInfo& user, const utils::CancellationToken* cancel = nullptr) override;

    ApiResult registerNode(const core::Node& node,
                           const utils::CancellationToken* cancel = nullptr) override;

    ApiResult updateRegistration(const core::Node& node,
                                 const utils::CancellationToken* cancel = nullptr) override;

    ApiResult listNodes(std::vector<core::RegisteredNode>& nodes,
                        const utils::CancellationToken* cancel = nullptr) override;

    ApiResult pushMetrics(const core::RegisteredNode& node,
                          const core::MetricsSnapshot& snapshot,
                          const utils::CancellationToken* cancel = nullptr) override;

    const std::string& baseUrl() const { return settings_.baseUrl; }

private:
    net::HttpResponse call(const std::string& method, const std::string& path,
                           const std::string& body, const utils::CancellationToken* cancel);

    DashboardSettings settings_;
    std::shared_ptr<net::HttpClient> http_;
};

/**
 * @brief Registration body (POST and conflict PATCH).
 */
STORJCLOUD_SERVICES_API std::string registrationBody(const core::Node& node);

/**
 * @brief Metrics push body.
 */
STORJCLOUD_SERVICES_API std::string metricsBody(const core::MetricsSnapshot& snapshot);

/**
 * @brief Classify a dashboard response; for errors the message carries the
 * body's error text.
 */
STORJCLOUD_SERVICES_API ApiResult classifyResponse(const net::HttpResponse& response);

}  // namespace services
}  // namespace storjcloud
