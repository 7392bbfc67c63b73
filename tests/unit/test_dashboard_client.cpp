/**
 * @file test_dashboard_client.cpp
 * @brief Unit tests for the dashboard REST client and its wire bodies
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <storjcloud/core/node_codec.hpp>
#include <storjcloud/services/dashboard_client.hpp>

#include "support/mocks.hpp"

using namespace storjcloud;
using namespace storjcloud::services;
using test::MockHttpClient;
using test::httpResponse;
using test::nodeStatusJson;
using test::transportFailure;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Contains;
using ::testing::DoAll;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Pair;
using ::testing::Return;
using ::testing::SaveArg;

namespace {

core::Node sampleNode() {
    proto::NodeStatus status;
    std::string error;
    EXPECT_TRUE(core::parseNodeStatus(nodeStatusJson("ABCDEF1234567890", 5e9, 1e12), status, error));
    core::Candidate candidate;
    candidate.host = "192.168.1.10";
    candidate.port = 14002;
    return core::buildNode(status, candidate);
}

}  // namespace

class DashboardClientTest : public ::testing::Test {
protected:
    DashboardClientTest()
        : http_(std::make_shared<MockHttpClient>())
        , client_(DashboardSettings{"https://dash.example.com/api/v1/", "tok-123", std::chrono::milliseconds(7000)},
                  http_)
    {
    }

    std::shared_ptr<MockHttpClient> http_;
    DashboardClient client_;
};

// =============================================================================
// Classification
// =============================================================================

TEST(ClassifyResponseTest, MapsStatuses) {
    EXPECT_EQ(classifyResponse(httpResponse(201)).status, ApiStatus::OK);
    EXPECT_EQ(classifyResponse(httpResponse(401)).status, ApiStatus::UNAUTHORIZED);
    EXPECT_EQ(classifyResponse(httpResponse(409)).status, ApiStatus::CONFLICT);
    EXPECT_EQ(classifyResponse(httpResponse(500)).status, ApiStatus::REJECTED);
    EXPECT_EQ(classifyResponse(transportFailure(net::TransportError::CONNECT_FAILED)).status,
              ApiStatus::UNREACHABLE);
    EXPECT_EQ(classifyResponse(transportFailure(net::TransportError::CANCELLED)).status,
              ApiStatus::CANCELLED);
}

TEST(ClassifyResponseTest, MessageCarriesErrorText) {
    EXPECT_EQ(classifyResponse(httpResponse(422, "{\"error\":\"quota exceeded\"}")).message,
              "HTTP 422: quota exceeded");
    EXPECT_EQ(classifyResponse(httpResponse(400, "{\"message\":\"bad port\"}")).message,
              "HTTP 400: bad port");
    EXPECT_EQ(classifyResponse(httpResponse(502, "Bad Gateway")).message, "HTTP 502: Bad Gateway");
    EXPECT_EQ(classifyResponse(httpResponse(503)).message, "HTTP 503");
    EXPECT_EQ(classifyResponse(httpResponse(500, std::string(500, 'x'))).message.size(),
              std::string("HTTP 500: ").size() + 200);
}

// =============================================================================
// Requests
// =============================================================================

TEST_F(DashboardClientTest, RegisterPostsWithBearerToken) {
    net::HttpRequest sent;
    EXPECT_CALL(*http_, send(_, _)).WillOnce(DoAll(SaveArg<0>(&sent), Return(httpResponse(201, "{}"))));

    EXPECT_TRUE(client_.registerNode(sampleNode()).ok());
    EXPECT_EQ(sent.method, "POST");
    EXPECT_EQ(sent.url, "https://dash.example.com/api/v1/storj/nodes");
    EXPECT_EQ(sent.timeout, std::chrono::milliseconds(7000));
    EXPECT_THAT(sent.headers, Contains(Pair("Authorization", "Bearer tok-123")));
    EXPECT_THAT(sent.body, HasSubstr("\"nodeId\":\"ABCDEF1234567890\""));
}

TEST_F(DashboardClientTest, UpdateRegistrationPatchesByNodeId) {
    EXPECT_CALL(*http_, send(AllOf(Field(&net::HttpRequest::method, "PATCH"),
                                   Field(&net::HttpRequest::url,
                                         "https://dash.example.com/api/v1/storj/nodes/ABCDEF1234567890")), _))
        .WillOnce(Return(httpResponse(200, "{}")));
    EXPECT_TRUE(client_.updateRegistration(sampleNode()).ok());
}

TEST_F(DashboardClientTest, WhoAmI) {
    EXPECT_CALL(*http_, send(Field(&net::HttpRequest::url, "https://dash.example.com/api/v1/auth/me"), _))
        .WillOnce(Return(httpResponse(200,
            R"({"email":"op@example.com","name":"Operator","permissions":["nodes:read","nodes:write"],"extra":1})")));

    UserInfo user;
    ASSERT_TRUE(client_.whoAmI(user).ok());
    EXPECT_EQ(user.email, "op@example.com");
    EXPECT_EQ(user.permissions, (std::vector<std::string>{"nodes:read", "nodes:write"}));
}

TEST_F(DashboardClientTest, WhoAmIMalformed) {
    EXPECT_CALL(*http_, send(_, _)).WillOnce(Return(httpResponse(200, "<html>")));
    UserInfo user;
    EXPECT_EQ(client_.whoAmI(user).status, ApiStatus::MALFORMED);
}

TEST_F(DashboardClientTest, ListNodesNormalisesIds) {
    EXPECT_CALL(*http_, send(Field(&net::HttpRequest::method, "GET"), _))
        .WillOnce(Return(httpResponse(200, R"({"nodes":[
            {"id":"rec-1","nodeId":"AAA","name":"one","address":"10.0.0.5","dashboardPort":14003},
            {"id":42,"nodeId":"BBB","name":"two"},
            {"nodeId":"CCC","name":"three","dashboardPort":0}
        ],"total":3})")));

    std::vector<core::RegisteredNode> nodes;
    ASSERT_TRUE(client_.listNodes(nodes).ok());
    ASSERT_EQ(nodes.size(), 3u);

    EXPECT_EQ(nodes[0].id, "rec-1");
    EXPECT_EQ(nodes[0].address, "10.0.0.5");
    EXPECT_EQ(nodes[0].dashboardPort, 14003);

    EXPECT_EQ(nodes[1].id, "42");
    EXPECT_EQ(nodes[1].address, "127.0.0.1");
    EXPECT_EQ(nodes[1].dashboardPort, core::kDefaultDashboardPort);

    EXPECT_EQ(nodes[2].id, "CCC");
}

TEST_F(DashboardClientTest, ListNodesFailures) {
    EXPECT_CALL(*http_, send(_, _))
        .WillOnce(Return(httpResponse(401, "{\"error\":\"invalid token\"}")))
        .WillOnce(Return(httpResponse(200, "[]")))
        .WillOnce(Return(transportFailure(net::TransportError::TIMED_OUT, "timed out")));

    std::vector<core::RegisteredNode> nodes;
    auto unauthorized = client_.listNodes(nodes);
    EXPECT_EQ(unauthorized.status, ApiStatus::UNAUTHORIZED);
    EXPECT_EQ(unauthorized.message, "HTTP 401: invalid token");
    EXPECT_EQ(client_.listNodes(nodes).status, ApiStatus::MALFORMED);
    EXPECT_EQ(client_.listNodes(nodes).status, ApiStatus::UNREACHABLE);
}

TEST_F(DashboardClientTest, PushMetricsPatchesByRecordId) {
    net::HttpRequest sent;
    EXPECT_CALL(*http_, send(_, _)).WillOnce(DoAll(SaveArg<0>(&sent), Return(httpResponse(200, "{}"))));

    EXPECT_TRUE(client_.pushMetrics(test::registeredNode("rec-9"), test::snapshot()).ok());
    EXPECT_EQ(sent.method, "PATCH");
    EXPECT_EQ(sent.url, "https://dash.example.com/api/v1/storj/nodes/rec-9");
    EXPECT_THAT(sent.body, HasSubstr("\"status\":\"ONLINE\""));
    EXPECT_THAT(sent.body, HasSubstr("\"lastSeen\":\"2024-05-01T12:00:00Z\""));
}

// =============================================================================
// Bodies
// =============================================================================

TEST(DashboardBodiesTest, RegistrationBody) {
    const std::string body = registrationBody(sampleNode());
    EXPECT_THAT(body, HasSubstr("\"name\":\"Node-14002\""));
    EXPECT_THAT(body, HasSubstr("\"address\":\"192.168.1.10\""));
    EXPECT_THAT(body, HasSubstr("\"port\":28967"));
    EXPECT_THAT(body, HasSubstr("\"dashboardPort\":14002"));
    EXPECT_THAT(body, HasSubstr("\"status\":\"ONLINE\""));
    EXPECT_THAT(body, HasSubstr("\"detectedFrom\":\"port_scan\""));
}

TEST(DashboardBodiesTest, MetricsBodyCarriesReputation) {
    core::MetricsSnapshot snap = test::snapshot(core::NodeHealth::WARNING);
    snap.auditScore = 0.9;
    const std::string body = metricsBody(snap);
    EXPECT_THAT(body, HasSubstr("\"status\":\"WARNING\""));
    EXPECT_THAT(body, HasSubstr("\"auditScore\":0.9"));
    EXPECT_THAT(body, HasSubstr("\"reputation\":{"));
}
