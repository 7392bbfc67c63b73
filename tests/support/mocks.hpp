/**
 * @file mocks.hpp
 * @brief GoogleMock doubles for the transport and service seams.
 */

#pragma once

#include <gmock/gmock.h>

#include "storjcloud/core/container_runtime.hpp"
#include "storjcloud/core/port_validator.hpp"
#include "storjcloud/net/http_client.hpp"
#include "storjcloud/net/tcp_socket.hpp"
#include "storjcloud/services/dashboard_client.hpp"
#include "storjcloud/services/metrics_poller.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace storjcloud {
namespace test {

class MockHttpClient : public net::HttpClient {
public:
    MOCK_METHOD(net::HttpResponse, send,
                (const net::HttpRequest& request, const utils::CancellationToken* cancel),
                (override));
};

class MockTcpConnector : public net::TcpConnector {
public:
    MOCK_METHOD(net::ConnectStatus, probe,
                (const net::SocketAddress& peer, std::chrono::milliseconds timeout,
                 const utils::CancellationToken* cancel),
                (override));
};

class MockContainerRuntime : public core::ContainerRuntime {
public:
    MOCK_METHOD(bool, listRunning,
                (std::vector<core::ContainerInfo>& containers, std::string& error,
                 const utils::CancellationToken* cancel),
                (override));
    MOCK_METHOD(bool, environment,
                (const std::string& containerId, std::vector<std::string>& env, std::string& error,
                 const utils::CancellationToken* cancel),
                (override));
    MOCK_METHOD(std::string, describe, (), (const, override));
};

class MockNodeProber : public core::NodeProber {
public:
    MOCK_METHOD(core::ProbeResult, probe,
                (const core::Candidate& candidate, const utils::CancellationToken* cancel),
                (override));
};

class MockDashboardApi : public services::DashboardApi {
public:
    MOCK_METHOD(services::ApiResult, whoAmI,
                (services::UserInfo& user, const utils::CancellationToken* cancel), (override));
    MOCK_METHOD(services::ApiResult, registerNode,
                (const core::Node& node, const utils::CancellationToken* cancel), (override));
    MOCK_METHOD(services::ApiResult, updateRegistration,
                (const core::Node& node, const utils::CancellationToken* cancel), (override));
    MOCK_METHOD(services::ApiResult, listNodes,
                (std::vector<core::RegisteredNode>& nodes, const utils::CancellationToken* cancel),
                (override));
    MOCK_METHOD(services::ApiResult, pushMetrics,
                (const core::RegisteredNode& node, const core::MetricsSnapshot& snapshot,
                 const utils::CancellationToken* cancel),
                (override));
};

class MockNodePoller : public services::NodePoller {
public:
    MOCK_METHOD(services::PollResult, poll,
                (const core::RegisteredNode& node, const utils::CancellationToken* cancel),
                (override));
};

// =============================================================================
// Canned values
// =============================================================================

inline net::HttpResponse httpResponse(long status, std::string body = "") {
    net::HttpResponse response;
    response.status = status;
    response.body = std::move(body);
    return response;
}

inline net::HttpResponse transportFailure(net::TransportError error,
                                          std::string message = "connection refused") {
    net::HttpResponse response;
    response.error = error;
    response.error_message = std::move(message);
    return response;
}

inline services::ApiResult apiResult(services::ApiStatus status, long httpStatus = 0,
                                     std::string message = "") {
    services::ApiResult result;
    result.status = status;
    result.httpStatus = httpStatus;
    result.message = std::move(message);
    return result;
}

/**
 * @brief A node status document as served on /api/sno.
 */
inline std::string nodeStatusJson(const std::string& nodeId,
                                  double used = 5e9,
                                  double available = 1e12,
                                  double auditScore = 1.0,
                                  double suspensionScore = 0.0,
                                  const std::string& lastContact = "2024-05-01T12:00:00Z") {
    std::ostringstream json;
    json << "{"
         << "\"nodeID\":\"" << nodeId << "\","
         << "\"wallet\":\"0x0000000000000000000000000000000000000000\","
         << "\"version\":\"1.95.1\","
         << "\"upToDate\":true,"
         << "\"diskSpace\":{\"used\":" << used << ",\"available\":" << available
         << ",\"trash\":0,\"overused\":0},"
         << "\"bandwidth\":{\"used\":123456789,\"available\":0},"
         << "\"satellites\":[{\"id\":\"12EayRS2V1kEsWESU9QMRseFhdxYxKicsiFmxrsLZHeLUtdps3S\","
         << "\"url\":\"us1.storj.io:7777\",\"disqualified\":null,\"suspended\":null}],"
         << "\"lastPinged\":\"" << lastContact << "\","
         << "\"lastContactSuccess\":\"" << lastContact << "\","
         << "\"startedAt\":\"2024-04-01T00:00:00Z\","
         << "\"uptime\":86400,"
         << "\"reputation\":{\"auditScore\":" << auditScore
         << ",\"suspensionScore\":" << suspensionScore << "},"
         << "\"earnings\":12.5,"
         << "\"disqualified\":null,"
         << "\"quicStatus\":\"OK\""
         << "}";
    return json.str();
}

inline core::RegisteredNode registeredNode(const std::string& id, uint16_t port = 14002) {
    core::RegisteredNode node;
    node.id = id;
    node.nodeId = "node-" + id;
    node.name = "Node-" + std::to_string(port);
    node.address = "127.0.0.1";
    node.dashboardPort = port;
    return node;
}

inline core::MetricsSnapshot snapshot(core::NodeHealth status = core::NodeHealth::ONLINE) {
    core::MetricsSnapshot snap;
    snap.status = status;
    snap.version = "1.95.1";
    snap.diskSpace.used = 5e9;
    snap.diskSpace.available = 1e12;
    snap.diskSpace.total = 5e9 + 1e12;
    snap.lastSeen = "2024-05-01T12:00:00Z";
    return snap;
}

inline services::PollResult pollOk() {
    services::PollResult result;
    result.snapshot = snapshot();
    return result;
}

inline services::PollResult pollFailure(services::PollError error, std::string message = "") {
    services::PollResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
}

}  // namespace test
}  // namespace storjcloud
