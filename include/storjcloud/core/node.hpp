/**
 * @file node.hpp
 * @brief Storage node domain types shared by discovery and sync.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/core/export.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace storjcloud {
namespace core {

/// Default node dashboard (status API) port.
constexpr uint16_t kDefaultDashboardPort = 14002;

/// Default node storage (satellite traffic) port.
constexpr uint16_t kDefaultStoragePort = 28967;

/// Audit score below which a node is reported as WARNING.
constexpr double kAuditWarningThreshold = 0.95;

/**
 * @brief Health derived from a node status document.
 */
enum class NodeHealth {
    ONLINE,
    WARNING,
    SUSPENDED,
    DISQUALIFIED,
    OFFLINE
};

STORJCLOUD_CORE_API const char* nodeHealthToString(NodeHealth health);

/**
 * @brief How a candidate or node was found.
 */
enum class Origin {
    PORT_SCAN,
    DOCKER
};

STORJCLOUD_CORE_API const char* originToString(Origin origin);

/**
 * @brief Unvalidated endpoint considered during discovery.
 */
struct Candidate {
    std::string host;
    uint16_t port = 0;
    std::string sourceHint;   ///< Human-readable provenance ("port-list", container name)
    Origin origin = Origin::PORT_SCAN;

    // Populated for Origin::DOCKER
    std::string containerId;
    std::string containerName;
    std::string image;
    uint16_t storagePort = kDefaultStoragePort;

    std::string endpoint() const { return host + ":" + std::to_string(port); }
};

struct SatelliteLink {
    std::string id;
    std::string url;
    bool disqualified = false;
    bool suspended = false;
};

struct DiskSpace {
    double used = 0;
    double available = 0;
    double total = 0;
};

struct BandwidthUsage {
    double used = 0;
    double available = 0;
};

/**
 * @class Node
 * @brief A validated storage node endpoint with its current metrics.
 *
 * The node ID is fixed at construction. Everything else describes the
 * node as observed by the probe that produced it.
 */
class STORJCLOUD_CORE_API Node {
public:
    explicit Node(std::string nodeId) : nodeId_(std::move(nodeId)) {}

    const std::string& nodeId() const { return nodeId_; }

    std::string name;
    std::string dashboardHost;
    uint16_t dashboardPort = kDefaultDashboardPort;
    uint16_t storagePort = kDefaultStoragePort;
    std::string version;
    NodeHealth status = NodeHealth::OFFLINE;
    DiskSpace diskSpace;
    BandwidthUsage bandwidth;
    double earnings = 0;
    double auditScore = 1.0;
    double suspensionScore = 0;
    double uptime = 0;
    std::string lastContact;
    std::vector<SatelliteLink> satellites;

    Origin origin = Origin::PORT_SCAN;
    std::string containerId;
    std::string containerName;
    std::string image;

private:
    std::string nodeId_;
};

/**
 * @brief The dashboard's view of a node, as returned by the node list.
 */
struct RegisteredNode {
    std::string id;          ///< Dashboard record ID (used in update URLs)
    std::string nodeId;      ///< Storage node ID
    std::string name;
    std::string address = "127.0.0.1";
    uint16_t dashboardPort = kDefaultDashboardPort;

    std::string endpoint() const { return address + ":" + std::to_string(dashboardPort); }
};

/**
 * @brief Metrics pushed to the dashboard for one node on one tick.
 */
struct MetricsSnapshot {
    NodeHealth status = NodeHealth::OFFLINE;
    std::string version;
    DiskSpace diskSpace;
    double bandwidthUsed = 0;
    double uptime = 0;
    std::string lastSeen;      ///< UTC ISO-8601, time of the poll
    double auditScore = 1.0;
    double suspensionScore = 0;
    double earnings = 0;
    std::vector<SatelliteLink> satellites;
};

}  // namespace core
}  // namespace storjcloud
