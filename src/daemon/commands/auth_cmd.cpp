/**
 * @file auth_cmd.cpp
 * @brief auth command - token check
 */

#include "storjcloud/core/errors.hpp"
#include "storjcloud/daemon/commands.hpp"
#include "storjcloud/services/dashboard_client.hpp"
#include "storjcloud/utils/logger.hpp"
#include "storjcloud/utils/string_utils.hpp"

#include <memory>

namespace storjcloud {
namespace daemon {

int authCommand(const Config& config, const CommandContext& context,
                utils::CancellationToken& cancel) {
    services::DashboardSettings settings;
    settings.baseUrl = config.api.url;
    settings.token = config.api.token;
    settings.timeout = config.api.timeout;

    services::DashboardClient dashboard(settings, context.http);
    services::UserInfo user;
    services::ApiResult result = dashboard.whoAmI(user, &cancel);

    switch (result.status) {
        case services::ApiStatus::OK:
            break;
        case services::ApiStatus::UNAUTHORIZED:
            throw core::AuthenticationError("Invalid API token: " + result.message);
        case services::ApiStatus::UNREACHABLE:
            throw core::DashboardUnavailableError("Dashboard unreachable: " + result.message);
        case services::ApiStatus::CANCELLED:
            LOG_WARN("Auth", "Token check interrupted");
            return 1;
        default:
            LOG_ERROR("Auth", "Token check failed: {}", result.message);
            return 1;
    }

    LOG_INFO("Auth", "Token valid for user: {}", user.email);
    if (!user.permissions.empty()) {
        LOG_INFO("Auth", "Permissions: {}", utils::join(user.permissions, ", "));
    }
    return 0;
}

}  // namespace daemon
}  // namespace storjcloud
