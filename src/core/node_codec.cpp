/**
 * @file node_codec.cpp
 * @brief Node status parsing, health derivation and discovery output.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/core/node_codec.hpp"
#include "storjcloud/proto/dashboard.pb.h"
#include "storjcloud/utils/logger.hpp"

#include <google/protobuf/util/json_util.h>

#include <ctime>
#include <stdexcept>

namespace storjcloud {
namespace core {

namespace {

proto::SatelliteLink toWire(const SatelliteLink& link) {
    proto::SatelliteLink out;
    out.set_id(link.id);
    out.set_url(link.url);
    out.set_disqualified(link.disqualified);
    out.set_suspended(link.suspended);
    return out;
}

proto::DiscoveredNode toDiscovered(const Node& node) {
    proto::DiscoveredNode out;
    out.set_node_id(node.nodeId());
    out.set_name(node.name);
    out.set_address(node.dashboardHost);
    out.set_dashboard_port(node.dashboardPort);
    out.set_storage_port(node.storagePort);
    out.set_version(node.version);
    out.set_status(nodeHealthToString(node.status));
    out.mutable_disk_space()->set_used(node.diskSpace.used);
    out.mutable_disk_space()->set_available(node.diskSpace.available);
    out.mutable_disk_space()->set_total(node.diskSpace.total);
    out.set_bandwidth_used(node.bandwidth.used);
    out.set_earnings(node.earnings);
    out.set_audit_score(node.auditScore);
    out.set_uptime(node.uptime);
    out.set_last_contact(node.lastContact);
    for (const auto& link : node.satellites) {
        *out.add_satellites() = toWire(link);
    }
    out.set_detected_from(originToString(node.origin));
    out.set_container_id(node.containerId);
    out.set_container_name(node.containerName);
    out.set_image(node.image);
    return out;
}

}  // namespace

const char* nodeHealthToString(NodeHealth health) {
    switch (health) {
        case NodeHealth::ONLINE:       return "ONLINE";
        case NodeHealth::WARNING:      return "WARNING";
        case NodeHealth::SUSPENDED:    return "SUSPENDED";
        case NodeHealth::DISQUALIFIED: return "DISQUALIFIED";
        case NodeHealth::OFFLINE:      return "OFFLINE";
        default:                       return "UNKNOWN";
    }
}

const char* originToString(Origin origin) {
    switch (origin) {
        case Origin::PORT_SCAN: return "port_scan";
        case Origin::DOCKER:    return "docker";
        default:                return "unknown";
    }
}

bool parseNodeStatus(const std::string& json, proto::NodeStatus& status, std::string& error) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    status.Clear();
    auto result = google::protobuf::util::JsonStringToMessage(json, &status, options);
    if (!result.ok()) {
        error = result.ToString();
        return false;
    }
    return true;
}

bool isTruthy(const google::protobuf::Value& value) {
    switch (value.kind_case()) {
        case google::protobuf::Value::kBoolValue:   return value.bool_value();
        case google::protobuf::Value::kNumberValue: return value.number_value() != 0;
        case google::protobuf::Value::kStringValue: return !value.string_value().empty();
        case google::protobuf::Value::kStructValue: return value.struct_value().fields_size() > 0;
        case google::protobuf::Value::kListValue:   return value.list_value().values_size() > 0;
        default:                                    return false;
    }
}

std::string lastContactOf(const proto::NodeStatus& status) {
    if (!status.last_contact_success().empty()) {
        return status.last_contact_success();
    }
    return status.last_pinged();
}

NodeHealth determineHealth(const proto::NodeStatus& status) {
    if (lastContactOf(status).empty()) {
        return NodeHealth::OFFLINE;
    }
    if (status.has_disqualified() && isTruthy(status.disqualified())) {
        return NodeHealth::DISQUALIFIED;
    }
    if (status.has_reputation()) {
        const auto& reputation = status.reputation();
        if (reputation.has_suspension_score() && reputation.suspension_score() > 0) {
            return NodeHealth::SUSPENDED;
        }
        if (reputation.has_audit_score() && reputation.audit_score() < kAuditWarningThreshold) {
            return NodeHealth::WARNING;
        }
    }
    return NodeHealth::ONLINE;
}

std::vector<SatelliteLink> satelliteLinks(const proto::NodeStatus& status) {
    std::vector<SatelliteLink> links;
    links.reserve(status.satellites_size());
    for (const auto& satellite : status.satellites()) {
        SatelliteLink link;
        link.id = satellite.id();
        link.url = satellite.url();
        link.disqualified = satellite.has_disqualified() && isTruthy(satellite.disqualified());
        link.suspended = satellite.has_suspended() && isTruthy(satellite.suspended());
        links.push_back(std::move(link));
    }
    return links;
}

Node buildNode(const proto::NodeStatus& status, const Candidate& candidate) {
    if (status.node_id().empty()) {
        throw std::invalid_argument("node status carries no nodeID");
    }

    Node node(status.node_id());
    node.dashboardHost = candidate.host;
    node.dashboardPort = candidate.port;
    node.storagePort = candidate.storagePort;
    node.origin = candidate.origin;
    node.containerId = candidate.containerId;
    node.containerName = candidate.containerName;
    node.image = candidate.image;
    node.name = candidate.origin == Origin::DOCKER && !candidate.containerName.empty()
        ? candidate.containerName
        : "Node-" + std::to_string(candidate.port);

    node.version = status.version();
    node.status = determineHealth(status);
    node.diskSpace.used = status.disk_space().used();
    node.diskSpace.available = status.disk_space().available();
    node.diskSpace.total = node.diskSpace.used + node.diskSpace.available;
    node.bandwidth.used = status.bandwidth().used();
    node.bandwidth.available = status.bandwidth().available();
    node.earnings = status.earnings();
    if (status.reputation().has_audit_score()) {
        node.auditScore = status.reputation().audit_score();
    }
    if (status.reputation().has_suspension_score()) {
        node.suspensionScore = status.reputation().suspension_score();
    }
    node.uptime = status.uptime();
    node.lastContact = lastContactOf(status);
    node.satellites = satelliteLinks(status);
    return node;
}

std::string formatUtcTimestamp(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buffer;
}

std::string nodesToJson(const std::vector<Node>& nodes) {
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.always_print_primitive_fields = true;

    std::string out = "[";
    for (size_t i = 0; i < nodes.size(); ++i) {
        std::string item;
        auto result = google::protobuf::util::MessageToJsonString(toDiscovered(nodes[i]), &item, options);
        if (!result.ok()) {
            LOG_ERROR("NodeCodec", "Cannot render node {}: {}", nodes[i].nodeId(), result.ToString());
            continue;
        }
        while (!item.empty() && item.back() == '\n') {
            item.pop_back();
        }
        out += (out.size() > 1 ? ",\n" : "\n") + item;
    }
    out += nodes.empty() ? "]" : "\n]";
    return out;
}

}  // namespace core
}  // namespace storjcloud
