/**
 * @file discover_cmd.cpp
 * @brief discover command - scan, print and register storage nodes
 */

#include "storjcloud/core/candidate_source.hpp"
#include "storjcloud/core/discovery_engine.hpp"
#include "storjcloud/core/errors.hpp"
#include "storjcloud/core/node_codec.hpp"
#include "storjcloud/core/port_validator.hpp"
#include "storjcloud/daemon/commands.hpp"
#include "storjcloud/net/udp_socket.hpp"
#include "storjcloud/services/dashboard_client.hpp"
#include "storjcloud/services/docker_client.hpp"
#include "storjcloud/services/registrar.hpp"
#include "storjcloud/utils/logger.hpp"
#include "storjcloud/utils/string_utils.hpp"

#include <memory>
#include <vector>

namespace storjcloud {
namespace daemon {

namespace {

std::string scanHost(const DiscoverySettings& settings) {
    if (!settings.server.empty()) {
        return settings.server;
    }
    auto detected = net::detectLocalAddress();
    if (!detected) {
        throw core::EnvironmentError("Could not detect the local IP address; pass --server");
    }
    LOG_INFO("Discover", "Using detected local IP: {}", *detected);
    return *detected;
}

std::unique_ptr<core::CandidateSource> buildSource(const DiscoverySettings& settings,
                                                   const CommandContext& context,
                                                   const std::string& host,
                                                   const utils::CancellationToken& cancel) {
    std::vector<std::unique_ptr<core::CandidateSource>> sources;

    if (settings.scansContainers()) {
        auto docker = std::make_shared<services::DockerClient>(context.http, settings.dockerHost);
        sources.push_back(std::make_unique<core::ContainerSource>(docker, host, &cancel));
    }
    if (settings.scansPorts()) {
        if (settings.portRange) {
            sources.push_back(std::make_unique<core::PortRangeSource>(
                host, settings.portRange->first, settings.portRange->second));
        }
        if (settings.portsGiven || !settings.portRange) {
            sources.push_back(std::make_unique<core::PortListSource>(host, settings.ports));
        }
    }

    if (sources.size() == 1) {
        return std::move(sources.front());
    }
    return std::make_unique<core::ChainedSource>(std::move(sources));
}

}  // namespace

int discoverCommand(const Config& config, const CommandContext& context,
                    utils::CancellationToken& cancel) {
    const DiscoverySettings& settings = config.discovery;
    const std::string host = scanHost(settings);

    auto source = buildSource(settings, context, host, cancel);
    LOG_INFO("Discover", "Scanning {} using {}", host, source->describe());

    core::ProbeSettings probe;
    probe.timeout = settings.timeout;
    probe.retryAttempts = settings.retries;

    core::DiscoveryEngine engine(
        std::make_shared<core::PortValidator>(probe, context.connector, context.http));
    core::ScanReport report = engine.scan(host, *source, settings.concurrency, &cancel);

    for (const auto& rejection : report.rejections) {
        LOG_DEBUG("Discover", "Rejected {} ({}): {}",
                  rejection.candidate.endpoint(),
                  core::rejectReasonToString(rejection.reason),
                  rejection.detail);
    }

    if (settings.json) {
        *context.out << core::nodesToJson(report.nodes) << std::endl;
    }

    if (report.cancelled) {
        LOG_WARN("Discover", "Scan interrupted; skipping registration");
        return 0;
    }
    if (report.nodes.empty()) {
        LOG_WARN("Discover", "No Storj nodes found");
        return 0;
    }

    LOG_INFO("Discover", "Found {} node(s) out of {} candidate(s), {} rejected",
             report.nodes.size(), report.candidates, report.rejections.size());

    services::DashboardSettings dashboard;
    dashboard.baseUrl = config.api.url;
    dashboard.token = config.api.token;
    dashboard.timeout = config.api.timeout;

    services::Registrar registrar(
        std::make_shared<services::DashboardClient>(dashboard, context.http));
    services::RegistrationReport registered = registrar.registerNodes(report.nodes, &cancel);

    for (const auto& result : registered.results) {
        const std::string id = utils::short_id(result.node.nodeId());
        if (result.accepted) {
            LOG_INFO("Discover", "Registered node {}{}", id, result.updated ? " (updated)" : "");
        } else {
            LOG_WARN("Discover", "Node {} was not registered: {}", id,
                     result.reason ? *result.reason : std::string("unknown reason"));
        }
    }

    LOG_INFO("Discover", "Successfully registered {} nodes with Storj Cloud dashboard",
             registered.accepted);
    return 0;
}

}  // namespace daemon
}  // namespace storjcloud
