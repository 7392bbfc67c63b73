/**
 * @file test_discover_and_sync.cpp
 * @brief Integration test: discover a node over real sockets, register it and sync its metrics
 *
 * A fake storage node dashboard and a fake StorjCloud API run on loopback;
 * everything between them is the production stack.
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <storjcloud/core/candidate_source.hpp>
#include <storjcloud/core/discovery_engine.hpp>
#include <storjcloud/core/node_codec.hpp>
#include <storjcloud/core/port_validator.hpp>
#include <storjcloud/daemon/commands.hpp>
#include <storjcloud/net/http_client.hpp>
#include <storjcloud/net/tcp_socket.hpp>
#include <storjcloud/services/dashboard_client.hpp>
#include <storjcloud/services/metrics_poller.hpp>
#include <storjcloud/services/registrar.hpp>
#include <storjcloud/services/sync_engine.hpp>
#include <storjcloud/utils/logger.hpp>

#include "support/fake_http_server.hpp"
#include "support/mocks.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <thread>

using namespace storjcloud;
using namespace storjcloud::test;
using ::testing::HasSubstr;

namespace {

constexpr const char* kNodeId = "1ntegrationN0de5erv1ce";

}  // namespace

class DiscoverAndSyncTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);

        node_ = std::make_unique<FakeHttpServer>([](const FakeRequest& request) {
            FakeResponse response;
            if (request.method == "GET" && request.path == "/api/sno") {
                response.body = nodeStatusJson(kNodeId, 5e9, 1e12, 1.0, 0.0,
                    core::formatUtcTimestamp(std::chrono::system_clock::now()));
            } else {
                response.status = 404;
                response.body = "{\"error\":\"not found\"}";
            }
            return response;
        });
        ASSERT_TRUE(node_->start());

        dashboard_ = std::make_unique<FakeHttpServer>([this](const FakeRequest& request) {
            return handleDashboard(request);
        });
        ASSERT_TRUE(dashboard_->start());

        http_ = std::make_shared<net::BeastHttpClient>();
        connector_ = std::make_shared<net::SocketConnector>();
    }

    void TearDown() override {
        dashboard_->stop();
        node_->stop();
        utils::Logger::instance().setLevel(utils::LogLevel::INFO);
    }

    FakeResponse handleDashboard(const FakeRequest& request) {
        FakeResponse response;
        if (request.header("authorization") != "Bearer it-token") {
            response.status = 401;
            response.body = "{\"error\":\"invalid token\"}";
            return response;
        }
        if (request.method == "POST" && request.path == "/api/v1/storj/nodes") {
            if (alreadyRegistered_) {
                response.status = 409;
                response.body = "{\"error\":\"node already registered\"}";
            } else {
                response.status = 201;
                response.body = "{\"id\":\"rec-1\"}";
            }
        } else if (request.method == "GET" && request.path == "/api/v1/storj/nodes") {
            std::ostringstream body;
            body << "{\"nodes\":[{\"id\":\"rec-1\",\"nodeId\":\"" << kNodeId
                 << "\",\"name\":\"Node-" << node_->port()
                 << "\",\"address\":\"127.0.0.1\",\"dashboardPort\":" << node_->port()
                 << "}],\"total\":1}";
            response.body = body.str();
        } else if (request.method == "PATCH") {
            response.body = "{}";
        } else {
            response.status = 404;
            response.body = "{\"error\":\"not found\"}";
        }
        return response;
    }

    std::shared_ptr<services::DashboardClient> dashboardClient() {
        services::DashboardSettings settings;
        settings.baseUrl = dashboard_->url() + "/api/v1";
        settings.token = "it-token";
        settings.timeout = std::chrono::seconds(5);
        return std::make_shared<services::DashboardClient>(settings, http_);
    }

    daemon::Config discoverConfig() {
        daemon::Config config;
        config.command = daemon::Command::DISCOVER;
        config.api.url = dashboard_->url() + "/api/v1";
        config.api.token = "it-token";
        config.api.timeout = std::chrono::seconds(5);
        config.discovery.server = "127.0.0.1";
        config.discovery.ports = {node_->port(), closedPort()};
        config.discovery.portsGiven = true;
        config.discovery.timeout = std::chrono::seconds(2);
        config.discovery.retries = 0;
        return config;
    }

    std::unique_ptr<FakeHttpServer> node_;
    std::unique_ptr<FakeHttpServer> dashboard_;
    std::shared_ptr<net::BeastHttpClient> http_;
    std::shared_ptr<net::SocketConnector> connector_;
    std::atomic<bool> alreadyRegistered_{false};
};

// =============================================================================
// Engine level
// =============================================================================

TEST_F(DiscoverAndSyncTest, DiscoverRegisterAndSyncOneTick) {
    core::ProbeSettings probe;
    probe.timeout = std::chrono::seconds(2);
    probe.retryAttempts = 0;

    core::DiscoveryEngine engine(std::make_shared<core::PortValidator>(probe, connector_, http_));
    core::PortListSource source("127.0.0.1", {node_->port(), closedPort()});
    core::ScanReport report = engine.scan("127.0.0.1", source, 4);

    ASSERT_EQ(report.nodes.size(), 1u);
    EXPECT_EQ(report.candidates, 2u);
    EXPECT_EQ(report.nodes[0].nodeId(), kNodeId);
    EXPECT_EQ(report.nodes[0].dashboardPort, node_->port());
    EXPECT_EQ(report.nodes[0].status, core::NodeHealth::ONLINE);
    ASSERT_EQ(report.rejections.size(), 1u);
    EXPECT_EQ(report.rejections[0].reason, core::RejectReason::UNREACHABLE);

    auto dashboard = dashboardClient();
    services::Registrar registrar(dashboard);
    services::RegistrationReport registered = registrar.registerNodes(report.nodes);
    EXPECT_EQ(registered.accepted, 1u);

    auto posts = dashboard_->requests();
    ASSERT_EQ(dashboard_->count("POST", "/api/v1/storj/nodes"), 1u);
    for (const auto& request : posts) {
        if (request.method == "POST") {
            EXPECT_THAT(request.body, HasSubstr(std::string("\"nodeId\":\"") + kNodeId + "\""));
            EXPECT_EQ(request.header("content-type"), "application/json");
        }
    }

    services::SyncSettings settings;
    settings.retryDelay = std::chrono::milliseconds(1);
    settings.pollTimeout = std::chrono::seconds(2);
    settings.tickDeadline = std::chrono::seconds(10);

    services::SyncEngine sync(settings, dashboard,
                              std::make_shared<services::MetricsPoller>(http_, settings.pollTimeout));
    auto cancel = utils::CancellationToken::create();
    services::TickSummary summary = sync.runTick(*cancel);

    EXPECT_EQ(summary.nodes, 1u);
    EXPECT_EQ(summary.succeeded, 1u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(summary.systemicError, services::SystemicError::NONE);
    EXPECT_EQ(dashboard_->count("GET", "/api/v1/storj/nodes"), 1u);
    EXPECT_EQ(dashboard_->count("PATCH", "/api/v1/storj/nodes/rec-1"), 1u);

    // one probe plus one poll
    EXPECT_EQ(node_->count("GET", "/api/sno"), 2u);

    for (const auto& request : dashboard_->requests()) {
        if (request.method == "PATCH") {
            EXPECT_THAT(request.body, HasSubstr("\"status\":\"ONLINE\""));
            EXPECT_THAT(request.body, HasSubstr("\"version\":\"1.95.1\""));
        }
    }
}

TEST_F(DiscoverAndSyncTest, WrongTokenIsReportedAsSystemic) {
    services::DashboardSettings settings;
    settings.baseUrl = dashboard_->url() + "/api/v1";
    settings.token = "wrong";
    auto dashboard = std::make_shared<services::DashboardClient>(settings, http_);

    services::SyncEngine sync(services::SyncSettings{}, dashboard,
                              std::make_shared<services::MetricsPoller>(http_, std::chrono::seconds(2)));
    auto cancel = utils::CancellationToken::create();
    services::TickSummary summary = sync.runTick(*cancel);

    EXPECT_EQ(summary.systemicError, services::SystemicError::AUTHENTICATION);
    EXPECT_EQ(node_->count("GET", "/api/sno"), 0u);
}

// =============================================================================
// Commands
// =============================================================================

TEST_F(DiscoverAndSyncTest, DiscoverCommandPrintsJsonAndRegisters) {
    daemon::Config config = discoverConfig();
    config.discovery.json = true;

    std::ostringstream out;
    daemon::CommandContext context;
    context.http = http_;
    context.connector = connector_;
    context.out = &out;

    auto cancel = utils::CancellationToken::create();
    EXPECT_EQ(daemon::runCommand(config, context, *cancel), 0);

    EXPECT_THAT(out.str(), HasSubstr(kNodeId));
    EXPECT_EQ(dashboard_->count("POST", "/api/v1/storj/nodes"), 1u);
}

TEST_F(DiscoverAndSyncTest, DiscoverCommandUpdatesKnownNode) {
    alreadyRegistered_ = true;

    daemon::CommandContext context;
    context.http = http_;
    context.connector = connector_;

    auto cancel = utils::CancellationToken::create();
    EXPECT_EQ(daemon::discoverCommand(discoverConfig(), context, *cancel), 0);

    EXPECT_EQ(dashboard_->count("POST", "/api/v1/storj/nodes"), 1u);
    EXPECT_EQ(dashboard_->count("PATCH", std::string("/api/v1/storj/nodes/") + kNodeId), 1u);
}

TEST_F(DiscoverAndSyncTest, SyncCommandRunsUntilCancelled) {
    daemon::Config config;
    config.command = daemon::Command::SYNC;
    config.api.url = dashboard_->url() + "/api/v1";
    config.api.token = "it-token";
    config.sync.interval = std::chrono::seconds(60);
    config.sync.pollTimeout = std::chrono::seconds(2);

    daemon::CommandContext context;
    context.http = http_;
    context.connector = connector_;

    auto cancel = utils::CancellationToken::create();
    std::atomic<int> exitCode{-1};
    std::thread runner([&]() {
        exitCode = daemon::syncCommand(config, context, *cancel);
    });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (dashboard_->count("PATCH", "/api/v1/storj/nodes/rec-1") == 0 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    cancel->cancel();
    runner.join();

    EXPECT_EQ(exitCode.load(), 0);
    EXPECT_EQ(dashboard_->count("PATCH", "/api/v1/storj/nodes/rec-1"), 1u);
}
