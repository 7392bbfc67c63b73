/**
 * @file test_node_codec.cpp
 * @brief Unit tests for node status parsing and health derivation
 */

#include <gtest/gtest.h>
#include <storjcloud/core/node_codec.hpp>

#include "support/mocks.hpp"

#include <chrono>
#include <stdexcept>

using namespace storjcloud::core;
using storjcloud::test::nodeStatusJson;

namespace {

storjcloud::proto::NodeStatus parsed(const std::string& json) {
    storjcloud::proto::NodeStatus status;
    std::string error;
    EXPECT_TRUE(parseNodeStatus(json, status, error)) << error;
    return status;
}

Candidate portCandidate(uint16_t port) {
    Candidate candidate;
    candidate.host = "127.0.0.1";
    candidate.port = port;
    candidate.sourceHint = "port-list";
    return candidate;
}

}  // namespace

// =============================================================================
// Parsing
// =============================================================================

TEST(NodeCodecTest, ParsesStatusDocument) {
    auto status = parsed(nodeStatusJson("ABCDEF1234567890", 5e9, 1e12));
    EXPECT_EQ(status.node_id(), "ABCDEF1234567890");
    EXPECT_EQ(status.version(), "1.95.1");
    EXPECT_DOUBLE_EQ(status.disk_space().used(), 5e9);
    EXPECT_DOUBLE_EQ(status.disk_space().available(), 1e12);
    EXPECT_EQ(status.satellites_size(), 1);
    EXPECT_DOUBLE_EQ(status.reputation().audit_score(), 1.0);
}

TEST(NodeCodecTest, IgnoresUnknownFields) {
    auto status = parsed("{\"nodeID\":\"X\",\"somethingNew\":{\"a\":[1,2]},\"quicStatus\":\"OK\"}");
    EXPECT_EQ(status.node_id(), "X");
}

TEST(NodeCodecTest, RejectsNonObjects) {
    storjcloud::proto::NodeStatus status;
    std::string error;
    EXPECT_FALSE(parseNodeStatus("<html>not json</html>", status, error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(parseNodeStatus("[1,2,3]", status, error));
}

TEST(NodeCodecTest, Truthiness) {
    google::protobuf::Value value;
    value.set_null_value(google::protobuf::NULL_VALUE);
    EXPECT_FALSE(isTruthy(value));
    value.set_bool_value(true);
    EXPECT_TRUE(isTruthy(value));
    value.set_string_value("");
    EXPECT_FALSE(isTruthy(value));
    value.set_string_value("2024-01-01T00:00:00Z");
    EXPECT_TRUE(isTruthy(value));
    value.set_number_value(0);
    EXPECT_FALSE(isTruthy(value));
}

// =============================================================================
// Health
// =============================================================================

TEST(NodeCodecTest, HealthyNodeIsOnline) {
    EXPECT_EQ(determineHealth(parsed(nodeStatusJson("A"))), NodeHealth::ONLINE);
}

TEST(NodeCodecTest, NoContactIsOffline) {
    auto status = parsed(nodeStatusJson("A", 5e9, 1e12, 0.5, 0.3, ""));
    EXPECT_EQ(determineHealth(status), NodeHealth::OFFLINE);
}

TEST(NodeCodecTest, LastPingedCountsAsContact) {
    auto status = parsed("{\"nodeID\":\"A\",\"lastPinged\":\"2024-05-01T12:00:00Z\"}");
    EXPECT_EQ(lastContactOf(status), "2024-05-01T12:00:00Z");
    EXPECT_EQ(determineHealth(status), NodeHealth::ONLINE);
}

TEST(NodeCodecTest, DisqualifiedWinsOverScores) {
    auto status = parsed("{\"nodeID\":\"A\",\"lastContactSuccess\":\"2024-05-01T12:00:00Z\","
                         "\"disqualified\":\"2024-04-01T00:00:00Z\","
                         "\"reputation\":{\"auditScore\":0.5,\"suspensionScore\":0.2}}");
    EXPECT_EQ(determineHealth(status), NodeHealth::DISQUALIFIED);
}

TEST(NodeCodecTest, SuspensionBeforeAuditWarning) {
    EXPECT_EQ(determineHealth(parsed(nodeStatusJson("A", 1, 1, 0.5, 0.1))), NodeHealth::SUSPENDED);
    EXPECT_EQ(determineHealth(parsed(nodeStatusJson("A", 1, 1, 0.94, 0))), NodeHealth::WARNING);
    EXPECT_EQ(determineHealth(parsed(nodeStatusJson("A", 1, 1, 0.95, 0))), NodeHealth::ONLINE);
}

// =============================================================================
// Node building
// =============================================================================

TEST(NodeCodecTest, BuildNodeFromPortScan) {
    Node node = buildNode(parsed(nodeStatusJson("ABCDEF12", 5e9, 1e12)), portCandidate(14000));

    EXPECT_EQ(node.nodeId(), "ABCDEF12");
    EXPECT_EQ(node.name, "Node-14000");
    EXPECT_EQ(node.dashboardHost, "127.0.0.1");
    EXPECT_EQ(node.dashboardPort, 14000);
    EXPECT_EQ(node.storagePort, kDefaultStoragePort);
    EXPECT_EQ(node.origin, Origin::PORT_SCAN);
    EXPECT_DOUBLE_EQ(node.diskSpace.used, 5e9);
    EXPECT_DOUBLE_EQ(node.diskSpace.total, 5e9 + 1e12);
    EXPECT_DOUBLE_EQ(node.bandwidth.used, 123456789);
    EXPECT_DOUBLE_EQ(node.earnings, 12.5);
    EXPECT_DOUBLE_EQ(node.uptime, 86400);
    EXPECT_EQ(node.lastContact, "2024-05-01T12:00:00Z");
    ASSERT_EQ(node.satellites.size(), 1u);
    EXPECT_EQ(node.satellites[0].url, "us1.storj.io:7777");
    EXPECT_FALSE(node.satellites[0].disqualified);
}

TEST(NodeCodecTest, BuildNodeFromContainerUsesContainerName) {
    Candidate candidate = portCandidate(14002);
    candidate.origin = Origin::DOCKER;
    candidate.containerName = "storagenode-2";
    candidate.containerId = "c0ffee";
    candidate.storagePort = 28968;

    Node node = buildNode(parsed(nodeStatusJson("B")), candidate);
    EXPECT_EQ(node.name, "storagenode-2");
    EXPECT_EQ(node.origin, Origin::DOCKER);
    EXPECT_EQ(node.containerId, "c0ffee");
    EXPECT_EQ(node.storagePort, 28968);
}

TEST(NodeCodecTest, BuildNodeRequiresNodeId) {
    storjcloud::proto::NodeStatus status;
    EXPECT_THROW(buildNode(status, portCandidate(14000)), std::invalid_argument);
}

// =============================================================================
// Output
// =============================================================================

TEST(NodeCodecTest, FormatUtcTimestamp) {
    auto epoch = std::chrono::system_clock::from_time_t(1714564800);
    EXPECT_EQ(formatUtcTimestamp(epoch), "2024-05-01T12:00:00Z");
}

TEST(NodeCodecTest, NodesToJson) {
    EXPECT_EQ(nodesToJson({}), "[]");

    std::vector<Node> nodes;
    nodes.push_back(buildNode(parsed(nodeStatusJson("FIRST")), portCandidate(14000)));
    nodes.push_back(buildNode(parsed(nodeStatusJson("SECOND")), portCandidate(14001)));

    const std::string json = nodesToJson(nodes);
    EXPECT_EQ(json.front(), '[');
    EXPECT_EQ(json.back(), ']');
    EXPECT_NE(json.find("\"nodeId\": \"FIRST\""), std::string::npos);
    EXPECT_NE(json.find("\"nodeId\": \"SECOND\""), std::string::npos);
    EXPECT_NE(json.find("\"detectedFrom\": \"port_scan\""), std::string::npos);
    EXPECT_NE(json.find("\"status\": \"ONLINE\""), std::string::npos);
}

TEST(NodeCodecTest, HealthNames) {
    EXPECT_STREQ(nodeHealthToString(NodeHealth::ONLINE), "ONLINE");
    EXPECT_STREQ(nodeHealthToString(NodeHealth::DISQUALIFIED), "DISQUALIFIED");
    EXPECT_STREQ(originToString(Origin::DOCKER), "docker");
}
