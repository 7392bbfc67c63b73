/**
 * @file test_metrics_poller.cpp
 * @brief Unit tests for polling node status into metrics snapshots
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <storjcloud/core/node_codec.hpp>
#include <storjcloud/services/metrics_poller.hpp>

#include "support/mocks.hpp"

using namespace storjcloud;
using namespace storjcloud::services;
using test::MockHttpClient;
using test::httpResponse;
using test::nodeStatusJson;
using test::registeredNode;
using test::transportFailure;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::Return;

class MetricsPollerTest : public ::testing::Test {
protected:
    std::shared_ptr<MockHttpClient> http_ = std::make_shared<MockHttpClient>();
    MetricsPoller poller_{http_, std::chrono::milliseconds(2500)};
};

TEST_F(MetricsPollerTest, MapsStatusToSnapshot) {
    auto node = registeredNode("1", 14005);
    node.address = "10.0.0.7";
    EXPECT_CALL(*http_, send(AllOf(Field(&net::HttpRequest::url, "http://10.0.0.7:14005/api/sno"),
                                   Field(&net::HttpRequest::timeout, std::chrono::milliseconds(2500))), _))
        .WillOnce(Return(httpResponse(200, nodeStatusJson("node-1", 7e9, 3e12, 0.97, 0))));

    auto result = poller_.poll(node, nullptr);
    ASSERT_TRUE(result.ok()) << result.message;
    const auto& snap = *result.snapshot;
    EXPECT_EQ(snap.status, core::NodeHealth::ONLINE);
    EXPECT_EQ(snap.version, "1.95.1");
    EXPECT_DOUBLE_EQ(snap.diskSpace.used, 7e9);
    EXPECT_DOUBLE_EQ(snap.diskSpace.total, 7e9 + 3e12);
    EXPECT_DOUBLE_EQ(snap.bandwidthUsed, 123456789);
    EXPECT_DOUBLE_EQ(snap.auditScore, 0.97);
    EXPECT_DOUBLE_EQ(snap.earnings, 12.5);
    EXPECT_EQ(snap.satellites.size(), 1u);
    EXPECT_EQ(snap.lastSeen.size(), std::string("2024-05-01T12:00:00Z").size());
    EXPECT_EQ(snap.lastSeen.back(), 'Z');
}

TEST_F(MetricsPollerTest, ClassifiesFailures) {
    EXPECT_CALL(*http_, send(_, _))
        .WillOnce(Return(transportFailure(net::TransportError::TIMED_OUT, "timed out")))
        .WillOnce(Return(httpResponse(401)))
        .WillOnce(Return(httpResponse(403)))
        .WillOnce(Return(httpResponse(500, "oops")))
        .WillOnce(Return(httpResponse(200, "garbage")))
        .WillOnce(Return(transportFailure(net::TransportError::CANCELLED, "cancelled")));

    auto node = registeredNode("1");
    auto timedOut = poller_.poll(node, nullptr);
    EXPECT_EQ(timedOut.error, PollError::UNREACHABLE);
    EXPECT_EQ(timedOut.message, "timed out");
    EXPECT_EQ(poller_.poll(node, nullptr).error, PollError::UNAUTHORIZED);
    EXPECT_EQ(poller_.poll(node, nullptr).error, PollError::UNAUTHORIZED);

    auto serverError = poller_.poll(node, nullptr);
    EXPECT_EQ(serverError.error, PollError::MALFORMED_RESPONSE);
    EXPECT_EQ(serverError.message, "HTTP 500");

    EXPECT_EQ(poller_.poll(node, nullptr).error, PollError::MALFORMED_RESPONSE);
    EXPECT_EQ(poller_.poll(node, nullptr).error, PollError::CANCELLED);
}

TEST_F(MetricsPollerTest, IdentityMismatchStillSyncs) {
    EXPECT_CALL(*http_, send(_, _)).WillOnce(Return(httpResponse(200, nodeStatusJson("someone-else"))));
    EXPECT_TRUE(poller_.poll(registeredNode("1"), nullptr).ok());
}

TEST(SnapshotTest, DerivesHealthFromStatus) {
    proto::NodeStatus status;
    std::string error;
    ASSERT_TRUE(core::parseNodeStatus(nodeStatusJson("X", 1, 1, 0.99, 0.25), status, error));

    auto snap = toSnapshot(status, "2024-06-01T00:00:00Z");
    EXPECT_EQ(snap.status, core::NodeHealth::SUSPENDED);
    EXPECT_DOUBLE_EQ(snap.suspensionScore, 0.25);
    EXPECT_EQ(snap.lastSeen, "2024-06-01T00:00:00Z");
}

TEST(SnapshotTest, ErrorNames) {
    EXPECT_STREQ(pollErrorToString(PollError::UNREACHABLE), "Unreachable");
    EXPECT_STREQ(pollErrorToString(PollError::MALFORMED_RESPONSE), "MalformedResponse");
}
