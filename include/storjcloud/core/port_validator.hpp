/**
 * @file port_validator.hpp
 * @brief Confirms that a candidate endpoint serves a storage node status API.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/core/export.hpp"
#include "storjcloud/core/node.hpp"
#include "storjcloud/net/http_client.hpp"
#include "storjcloud/net/tcp_socket.hpp"
#include "storjcloud/utils/cancellation.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace storjcloud {
namespace core {

/**
 * @brief Why a candidate was not confirmed.
 */
enum class RejectReason {
    UNREACHABLE,       ///< Connect or request failed on every attempt
    INVALID_RESPONSE,  ///< Non-2xx, unparsable body or no node ID
    CANCELLED
};

STORJCLOUD_CORE_API const char* rejectReasonToString(RejectReason reason);

struct ProbeSettings {
    std::chrono::milliseconds timeout{5000};   ///< Per connect and per request
    int retryAttempts = 1;                     ///< Extra attempts after the first
};

/**
 * @brief Result of probing one candidate: a Node or a rejection.
 */
struct ProbeResult {
    std::optional<Node> node;
    RejectReason reason = RejectReason::UNREACHABLE;
    std::string detail;
    int attempts = 0;

    bool confirmed() const { return node.has_value(); }
};

/**
 * @class NodeProber
 * @brief Probe seam used by the discovery engine.
 */
class STORJCLOUD_CORE_API NodeProber {
public:
    virtual ~NodeProber() = default;

    /**
     * @param candidate Endpoint to probe; host must be a dotted quad.
     */
    virtual ProbeResult probe(const Candidate& candidate,
                              const utils::CancellationToken* cancel) = 0;
};

/**
 * @class PortValidator
 * @brief TCP connect followed by one GET /api/sno per attempt.
 *
 * Connect and transport failures are retried up to retryAttempts times;
 * an answer that is not a node status document is rejected at once.
 */
class STORJCLOUD_CORE_API PortValidator : public NodeProber {
public:
    PortValidator(ProbeSettings settings,
                  std::shared_ptr<net::TcpConnector> connector,
                  std::shared_ptr<net::HttpClient> http);

    ProbeResult probe(const Candidate& candidate,
                      const utils::CancellationToken* cancel) override;

    const ProbeSettings& settings() const { return settings_; }

private:
    ProbeSettings settings_;
    std::shared_ptr<net::TcpConnector> connector_;
    std::shared_ptr<net::HttpClient> http_;
};

}  // namespace core
}  // namespace storjcloud
