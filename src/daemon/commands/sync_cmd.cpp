/**
 * @file sync_cmd.cpp
 * @brief sync command - periodic metrics push
 */

#include "storjcloud/daemon/commands.hpp"
#include "storjcloud/services/dashboard_client.hpp"
#include "storjcloud/services/metrics_poller.hpp"
#include "storjcloud/services/sync_engine.hpp"
#include "storjcloud/utils/logger.hpp"

#include <memory>

namespace storjcloud {
namespace daemon {

int syncCommand(const Config& config, const CommandContext& context,
                utils::CancellationToken& cancel) {
    services::DashboardSettings dashboard;
    dashboard.baseUrl = config.api.url;
    dashboard.token = config.api.token;
    dashboard.timeout = config.api.timeout;

    const services::SyncSettings& sync = config.sync;
    LOG_INFO("Sync", "Dashboard {}, backoff {}, poll timeout {} ms",
             dashboard.baseUrl, services::backoffPolicyToString(sync.backoff),
             sync.pollTimeout.count());

    services::SyncEngine engine(
        sync,
        std::make_shared<services::DashboardClient>(dashboard, context.http),
        std::make_shared<services::MetricsPoller>(context.http, sync.pollTimeout));

    engine.run(cancel);
    return 0;
}

}  // namespace daemon
}  // namespace storjcloud
