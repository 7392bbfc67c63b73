/**
 * @file metrics_poller.cpp
 * @brief MetricsPoller implementation.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/services/metrics_poller.hpp"
#include "storjcloud/core/node_codec.hpp"
#include "storjcloud/utils/logger.hpp"

namespace storjcloud {
namespace services {

const char* pollErrorToString(PollError error) {
    switch (error) {
        case PollError::NONE:               return "none";
        case PollError::UNREACHABLE:        return "Unreachable";
        case PollError::UNAUTHORIZED:       return "Unauthorized";
        case PollError::MALFORMED_RESPONSE: return "MalformedResponse";
        case PollError::CANCELLED:          return "Cancelled";
        default:                            return "Unknown";
    }
}

core::MetricsSnapshot toSnapshot(const proto::NodeStatus& status, const std::string& lastSeen) {
    core::MetricsSnapshot snapshot;
    snapshot.status = core::determineHealth(status);
    snapshot.version = status.version();
    snapshot.diskSpace.used = status.disk_space().used();
    snapshot.diskSpace.available = status.disk_space().available();
    snapshot.diskSpace.total = snapshot.diskSpace.used + snapshot.diskSpace.available;
    snapshot.bandwidthUsed = status.bandwidth().used();
    snapshot.uptime = status.uptime();
    snapshot.lastSeen = lastSeen;
    if (status.reputation().has_audit_score()) {
        snapshot.auditScore = status.reputation().audit_score();
    }
    if (status.reputation().has_suspension_score()) {
        snapshot.suspensionScore = status.reputation().suspension_score();
    }
    snapshot.earnings = status.earnings();
    snapshot.satellites = core::satelliteLinks(status);
    return snapshot;
}

MetricsPoller::MetricsPoller(std::shared_ptr<net::HttpClient> http, std::chrono::milliseconds timeout)
    : http_(std::move(http))
    , timeout_(timeout)
{
}

PollResult MetricsPoller::poll(const core::RegisteredNode& node,
                               const utils::CancellationToken* cancel) {
    PollResult result;

    net::HttpRequest request = net::HttpRequest::get(
        "http://" + node.endpoint() + core::kNodeStatusPath);
    request.timeout = timeout_;

    auto response = http_->send(request, cancel);
    if (response.error == net::TransportError::CANCELLED) {
        result.error = PollError::CANCELLED;
        result.message = "cancelled";
        return result;
    }
    if (!response.delivered()) {
        result.error = PollError::UNREACHABLE;
        result.message = response.error_message;
        return result;
    }
    if (response.status == 401 || response.status == 403) {
        result.error = PollError::UNAUTHORIZED;
        result.message = "HTTP " + std::to_string(response.status);
        return result;
    }
    if (!response.ok()) {
        result.error = PollError::MALFORMED_RESPONSE;
        result.message = "HTTP " + std::to_string(response.status);
        return result;
    }

    proto::NodeStatus status;
    std::string error;
    if (!core::parseNodeStatus(response.body, status, error)) {
        result.error = PollError::MALFORMED_RESPONSE;
        result.message = error;
        return result;
    }

    if (!node.nodeId.empty() && !status.node_id().empty() && status.node_id() != node.nodeId) {
        LOG_WARN("Poller", "{} reports node {} but is registered as {}",
                 node.endpoint(), status.node_id(), node.nodeId);
    }

    result.snapshot = toSnapshot(status, core::formatUtcTimestamp(std::chrono::system_clock::now()));
    return result;
}

}  // namespace services
}  // namespace storjcloud
