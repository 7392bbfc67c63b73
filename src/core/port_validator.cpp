/**
 * @file port_validator.cpp
 * @brief Candidate probing with bounded retries.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/core/port_validator.hpp"
#include "storjcloud/core/node_codec.hpp"
#include "storjcloud/utils/logger.hpp"

namespace storjcloud {
namespace core {

const char* rejectReasonToString(RejectReason reason) {
    switch (reason) {
        case RejectReason::UNREACHABLE:      return "Unreachable";
        case RejectReason::INVALID_RESPONSE: return "InvalidResponse";
        case RejectReason::CANCELLED:        return "Cancelled";
        default:                             return "Unknown";
    }
}

PortValidator::PortValidator(ProbeSettings settings,
                             std::shared_ptr<net::TcpConnector> connector,
                             std::shared_ptr<net::HttpClient> http)
    : settings_(settings)
    , connector_(std::move(connector))
    , http_(std::move(http))
{
    if (settings_.retryAttempts < 0) {
        settings_.retryAttempts = 0;
    }
}

ProbeResult PortValidator::probe(const Candidate& candidate,
                                 const utils::CancellationToken* cancel) {
    ProbeResult result;
    const net::SocketAddress peer(candidate.host, candidate.port);
    const int maxAttempts = 1 + settings_.retryAttempts;

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        if (utils::isCancelled(cancel)) {
            result.reason = RejectReason::CANCELLED;
            result.detail = "cancelled";
            return result;
        }
        result.attempts = attempt;

        auto connected = connector_->probe(peer, settings_.timeout, cancel);
        if (connected == net::ConnectStatus::CANCELLED) {
            result.reason = RejectReason::CANCELLED;
            result.detail = "cancelled";
            return result;
        }
        if (connected != net::ConnectStatus::CONNECTED) {
            result.reason = RejectReason::UNREACHABLE;
            result.detail = net::connectStatusToString(connected);
            LOG_TRACE("PortValidator", "{} attempt {}/{}: {}",
                      peer.toString(), attempt, maxAttempts, result.detail);
            continue;
        }

        net::HttpRequest request = net::HttpRequest::get(
            "http://" + peer.toString() + kNodeStatusPath);
        request.timeout = settings_.timeout;

        auto response = http_->send(request, cancel);
        if (response.error == net::TransportError::CANCELLED) {
            result.reason = RejectReason::CANCELLED;
            result.detail = "cancelled";
            return result;
        }
        if (!response.delivered()) {
            result.reason = RejectReason::UNREACHABLE;
            result.detail = response.error_message;
            LOG_TRACE("PortValidator", "{} attempt {}/{}: {}",
                      peer.toString(), attempt, maxAttempts, result.detail);
            continue;
        }

        if (!response.ok()) {
            result.reason = RejectReason::INVALID_RESPONSE;
            result.detail = "HTTP " + std::to_string(response.status);
            return result;
        }

        proto::NodeStatus status;
        std::string error;
        if (!parseNodeStatus(response.body, status, error)) {
            result.reason = RejectReason::INVALID_RESPONSE;
            result.detail = "unparsable status body: " + error;
            return result;
        }
        if (status.node_id().empty()) {
            result.reason = RejectReason::INVALID_RESPONSE;
            result.detail = "status body has no nodeID";
            return result;
        }

        result.node = buildNode(status, candidate);
        return result;
    }

    return result;
}

}  // namespace core
}  // namespace storjcloud
