/**
 * @file node_codec.hpp
 * @brief Mapping between the node status API document and domain types.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/core/export.hpp"
#include "storjcloud/core/node.hpp"
#include "storjcloud/proto/node_api.pb.h"

#include <chrono>
#include <string>
#include <vector>

namespace storjcloud {
namespace core {

/// Status API path served on the node dashboard port.
constexpr const char* kNodeStatusPath = "/api/sno";

/**
 * @brief Parse a GET /api/sno body. Unknown fields are ignored.
 * @return False with a message if the body is not a node status object.
 */
STORJCLOUD_CORE_API bool parseNodeStatus(const std::string& json,
                                         proto::NodeStatus& status,
                                         std::string& error);

/**
 * @brief JSON truthiness of a dynamically typed field.
 */
STORJCLOUD_CORE_API bool isTruthy(const google::protobuf::Value& value);

/**
 * @brief Last successful contact, falling back to last ping. Empty if neither.
 */
STORJCLOUD_CORE_API std::string lastContactOf(const proto::NodeStatus& status);

/**
 * @brief Derive health. Checks, first match wins: no contact (OFFLINE),
 * disqualified, suspension score > 0, audit score < 0.95, else ONLINE.
 */
STORJCLOUD_CORE_API NodeHealth determineHealth(const proto::NodeStatus& status);

STORJCLOUD_CORE_API std::vector<SatelliteLink> satelliteLinks(const proto::NodeStatus& status);

/**
 * @brief Build a complete Node from a parsed status document.
 * @throws std::invalid_argument if the document carries no node ID.
 */
STORJCLOUD_CORE_API Node buildNode(const proto::NodeStatus& status, const Candidate& candidate);

/**
 * @brief "2024-05-01T12:00:00Z"
 */
STORJCLOUD_CORE_API std::string formatUtcTimestamp(std::chrono::system_clock::time_point when);

/**
 * @brief Pretty JSON array of discovered nodes for --json output.
 */
STORJCLOUD_CORE_API std::string nodesToJson(const std::vector<Node>& nodes);

}  // namespace core
}  // namespace storjcloud
