/**
 * @file dashboard_client.cpp
 * @brief DashboardClient implementation and wire bodies.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/services/dashboard_client.hpp"
#include "storjcloud/proto/dashboard.pb.h"
#include "storjcloud/utils/logger.hpp"

#include <google/protobuf/util/json_util.h>

#include <cstdio>

namespace storjcloud {
namespace services {

namespace {

constexpr size_t kMaxErrorSnippet = 200;

std::string toJson(const google::protobuf::Message& message) {
    google::protobuf::util::JsonPrintOptions options;
    options.always_print_primitive_fields = true;

    std::string out;
    auto status = google::protobuf::util::MessageToJsonString(message, &out, options);
    if (!status.ok()) {
        // Only reachable with invalid UTF-8 in string fields
        LOG_ERROR("Dashboard", "Cannot encode {}: {}", message.GetTypeName(), status.ToString());
        return "{}";
    }
    return out;
}

bool fromJson(const std::string& json, google::protobuf::Message& message, std::string& error) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
    if (!status.ok()) {
        error = status.ToString();
        return false;
    }
    return true;
}

std::string errorText(const std::string& body) {
    proto::ApiError apiError;
    std::string ignored;
    if (!body.empty() && fromJson(body, apiError, ignored)) {
        if (!apiError.error().empty()) return apiError.error();
        if (!apiError.message().empty()) return apiError.message();
        if (!apiError.code().empty()) return apiError.code();
    }
    return body.size() > kMaxErrorSnippet ? body.substr(0, kMaxErrorSnippet) : body;
}

std::string recordId(const google::protobuf::Value& value) {
    switch (value.kind_case()) {
        case google::protobuf::Value::kStringValue:
            return value.string_value();
        case google::protobuf::Value::kNumberValue: {
            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), "%.0f", value.number_value());
            return buffer;
        }
        default:
            return "";
    }
}

proto::SatelliteLink toWire(const core::SatelliteLink& link) {
    proto::SatelliteLink out;
    out.set_id(link.id);
    out.set_url(link.url);
    out.set_disqualified(link.disqualified);
    out.set_suspended(link.suspended);
    return out;
}

}  // namespace

const char* apiStatusToString(ApiStatus status) {
    switch (status) {
        case ApiStatus::OK:           return "ok";
        case ApiStatus::CONFLICT:     return "conflict";
        case ApiStatus::UNAUTHORIZED: return "unauthorized";
        case ApiStatus::REJECTED:     return "rejected";
        case ApiStatus::UNREACHABLE:  return "unreachable";
        case ApiStatus::MALFORMED:    return "malformed response";
        case ApiStatus::CANCELLED:    return "cancelled";
        default:                      return "unknown";
    }
}

ApiResult classifyResponse(const net::HttpResponse& response) {
    ApiResult result;
    result.httpStatus = response.status;

    if (response.error == net::TransportError::CANCELLED) {
        result.status = ApiStatus::CANCELLED;
        result.message = "cancelled";
        return result;
    }
    if (!response.delivered()) {
        result.status = ApiStatus::UNREACHABLE;
        result.message = response.error_message;
        return result;
    }
    if (response.ok()) {
        result.status = ApiStatus::OK;
        return result;
    }

    switch (response.status) {
        case 401: result.status = ApiStatus::UNAUTHORIZED; break;
        case 409: result.status = ApiStatus::CONFLICT; break;
        default:  result.status = ApiStatus::REJECTED; break;
    }
    std::string text = errorText(response.body);
    result.message = "HTTP " + std::to_string(response.status);
    if (!text.empty()) {
        result.message += ": " + text;
    }
    return result;
}

std::string registrationBody(const core::Node& node) {
    proto::NodeRegistration body;
    body.set_node_id(node.nodeId());
    body.set_name(node.name);
    body.set_address(node.dashboardHost);
    body.set_port(node.storagePort);
    body.set_dashboard_port(node.dashboardPort);
    body.set_version(node.version);
    body.set_status(core::nodeHealthToString(node.status));
    body.set_allocated_space(node.diskSpace.total);
    body.set_used_space(node.diskSpace.used);
    body.set_available_space(node.diskSpace.available);
    body.set_bandwidth_used(node.bandwidth.used);
    body.set_uptime(node.uptime);
    body.set_last_seen(node.lastContact);

    auto* config = body.mutable_config();
    config->set_detected_from(core::originToString(node.origin));
    config->set_container_id(node.containerId);
    config->set_container_name(node.containerName);
    config->set_image(node.image);
    return toJson(body);
}

std::string metricsBody(const core::MetricsSnapshot& snapshot) {
    proto::NodeUpdate body;
    body.set_status(core::nodeHealthToString(snapshot.status));
    body.set_version(snapshot.version);
    body.set_used_space(snapshot.diskSpace.used);
    body.set_available_space(snapshot.diskSpace.available);
    body.set_total_space(snapshot.diskSpace.total);
    body.set_bandwidth_used(snapshot.bandwidthUsed);
    body.set_uptime(snapshot.uptime);
    body.set_last_seen(snapshot.lastSeen);
    body.mutable_reputation()->set_audit_score(snapshot.auditScore);
    body.mutable_reputation()->set_suspension_score(snapshot.suspensionScore);
    body.set_audit_score(snapshot.auditScore);
    body.set_suspension_score(snapshot.suspensionScore);
    body.set_earnings(snapshot.earnings);
    for (const auto& link : snapshot.satellites) {
        *body.add_satellites() = toWire(link);
    }
    return toJson(body);
}

DashboardClient::DashboardClient(DashboardSettings settings, std::shared_ptr<net::HttpClient> http)
    : settings_(std::move(settings))
    , http_(std::move(http))
{
    while (!settings_.baseUrl.empty() && settings_.baseUrl.back() == '/') {
        settings_.baseUrl.pop_back();
    }
}

net::HttpResponse DashboardClient::call(const std::string& method, const std::string& path,
                                        const std::string& body,
                                        const utils::CancellationToken* cancel) {
    net::HttpRequest request;
    request.method = method;
    request.url = settings_.baseUrl + path;
    request.body = body;
    request.timeout = settings_.timeout;
    request.header("Authorization", "Bearer " + settings_.token);

    auto response = http_->send(request, cancel);
    LOG_DEBUG("Dashboard", "{} {} -> {}", method, path,
              response.delivered() ? std::to_string(response.status) : response.error_message);
    return response;
}

ApiResult DashboardClient::whoAmI(UserInfo& user, const utils::CancellationToken* cancel) {
    auto response = call("GET", "/auth/me", "", cancel);
    ApiResult result = classifyResponse(response);
    if (!result.ok()) {
        return result;
    }

    proto::UserInfo wire;
    std::string error;
    if (!fromJson(response.body, wire, error)) {
        result.status = ApiStatus::MALFORMED;
        result.message = error;
        return result;
    }
    user.email = wire.email();
    user.name = wire.name();
    user.permissions.assign(wire.permissions().begin(), wire.permissions().end());
    return result;
}

ApiResult DashboardClient::registerNode(const core::Node& node,
                                        const utils::CancellationToken* cancel) {
    return classifyResponse(call("POST", "/storj/nodes", registrationBody(node), cancel));
}

ApiResult DashboardClient::updateRegistration(const core::Node& node,
                                              const utils::CancellationToken* cancel) {
    return classifyResponse(call("PATCH", "/storj/nodes/" + node.nodeId(),
                                 registrationBody(node), cancel));
}

ApiResult DashboardClient::listNodes(std::vector<core::RegisteredNode>& nodes,
                                     const utils::CancellationToken* cancel) {
    auto response = call("GET", "/storj/nodes", "", cancel);
    ApiResult result = classifyResponse(response);
    if (!result.ok()) {
        return result;
    }

    proto::RegisteredNodeList list;
    std::string error;
    if (!fromJson(response.body, list, error)) {
        result.status = ApiStatus::MALFORMED;
        result.message = error;
        return result;
    }

    nodes.clear();
    nodes.reserve(list.nodes_size());
    for (const auto& wire : list.nodes()) {
        core::RegisteredNode node;
        node.id = recordId(wire.id());
        node.nodeId = wire.node_id();
        node.name = wire.name();
        if (!wire.address().empty()) {
            node.address = wire.address();
        }
        if (wire.dashboard_port() > 0 && wire.dashboard_port() <= 65535) {
            node.dashboardPort = static_cast<uint16_t>(wire.dashboard_port());
        }
        if (node.id.empty()) {
            node.id = node.nodeId;
        }
        nodes.push_back(std::move(node));
    }
    return result;
}

ApiResult DashboardClient::pushMetrics(const core::RegisteredNode& node,
                                       const core::MetricsSnapshot& snapshot,
                                       const utils::CancellationToken* cancel) {
    return classifyResponse(call("PATCH", "/storj/nodes/" + node.id, metricsBody(snapshot), cancel));
}

}  // namespace services
}  // namespace storjcloud
