/**
 * @file commands.hpp
 * @brief storjcloud-client command entry points
 *
 * Each command returns the process exit code. Session-level failures
 * (configuration, environment, authentication, unreachable dashboard)
 * propagate as exceptions to main().
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/daemon/config.hpp"
#include "storjcloud/net/http_client.hpp"
#include "storjcloud/net/tcp_socket.hpp"
#include "storjcloud/utils/cancellation.hpp"

#include <iostream>
#include <memory>
#include <ostream>

namespace storjcloud {
namespace daemon {

/**
 * @brief Transports and output stream shared by the commands.
 */
struct CommandContext {
    std::shared_ptr<net::HttpClient> http;
    std::shared_ptr<net::TcpConnector> connector;
    std::ostream* out = &std::cout;     ///< JSON output (discover --json)

    /// Beast HTTP client and real sockets, JSON to stdout.
    static CommandContext standard();
};

/// Scan, print and register local storage nodes.
int discoverCommand(const Config& config, const CommandContext& context,
                    utils::CancellationToken& cancel);

/// Run the sync loop until cancelled.
int syncCommand(const Config& config, const CommandContext& context,
                utils::CancellationToken& cancel);

/// Check the API token against the dashboard.
int authCommand(const Config& config, const CommandContext& context,
                utils::CancellationToken& cancel);

/**
 * @brief Dispatch config.command.
 */
int runCommand(const Config& config, const CommandContext& context,
               utils::CancellationToken& cancel);

}  // namespace daemon
}  // namespace storjcloud
