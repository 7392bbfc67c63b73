/**
 * @file commands.cpp
 * @brief Command dispatch and default transports
 */

#include "storjcloud/core/errors.hpp"
#include "storjcloud/daemon/commands.hpp"

namespace storjcloud {
namespace daemon {

CommandContext CommandContext::standard() {
    CommandContext context;
    context.http = std::make_shared<net::BeastHttpClient>();
    context.connector = std::make_shared<net::SocketConnector>();
    context.out = &std::cout;
    return context;
}

int runCommand(const Config& config, const CommandContext& context,
               utils::CancellationToken& cancel) {
    switch (config.command) {
        case Command::DISCOVER: return discoverCommand(config, context, cancel);
        case Command::SYNC:     return syncCommand(config, context, cancel);
        case Command::AUTH:     return authCommand(config, context, cancel);
        default:
            throw core::ConfigurationError("No command given (expected discover, sync or auth)");
    }
}

}  // namespace daemon
}  // namespace storjcloud
