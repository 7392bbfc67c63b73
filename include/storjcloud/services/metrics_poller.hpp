/**
 * @file metrics_poller.hpp
 * @brief Fetches a registered node's status and maps it to a sync payload.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/core/node.hpp"
#include "storjcloud/net/http_client.hpp"
#include "storjcloud/proto/node_api.pb.h"
#include "storjcloud/services/export.hpp"
#include "storjcloud/utils/cancellation.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace storjcloud {
namespace services {

enum class PollError {
    NONE,
    UNREACHABLE,
    UNAUTHORIZED,        ///< Node answered 401/403
    MALFORMED_RESPONSE,
    CANCELLED
};

STORJCLOUD_SERVICES_API const char* pollErrorToString(PollError error);

struct PollResult {
    std::optional<core::MetricsSnapshot> snapshot;
    PollError error = PollError::NONE;
    std::string message;

    bool ok() const { return snapshot.has_value(); }
};

/**
 * @class NodePoller
 * @brief Poll seam used by the sync engine.
 */
class STORJCLOUD_SERVICES_API NodePoller {
public:
    virtual ~NodePoller() = default;

    virtual PollResult poll(const core::RegisteredNode& node,
                            const utils::CancellationToken* cancel) = 0;
};

/**
 * @class MetricsPoller
 * @brief GET http://address:dashboardPort/api/sno with a per-request timeout.
 */
class STORJCLOUD_SERVICES_API MetricsPoller : public NodePoller {
public:
    MetricsPoller(std::shared_ptr<net::HttpClient> http, std::chrono::milliseconds timeout);

    PollResult poll(const core::RegisteredNode& node,
                    const utils::CancellationToken* cancel) override;

private:
    std::shared_ptr<net::HttpClient> http_;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Map a node status document to the sync payload.
 * @param lastSeen Poll time, already formatted.
 */
STORJCLOUD_SERVICES_API core::MetricsSnapshot toSnapshot(const proto::NodeStatus& status,
                                                         const std::string& lastSeen);

}  // namespace services
}  // namespace storjcloud
