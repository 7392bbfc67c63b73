/**
 * @file registrar.cpp
 * @brief Registrar implementation.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/services/registrar.hpp"
#include "storjcloud/core/errors.hpp"
#include "storjcloud/utils/logger.hpp"
#include "storjcloud/utils/string_utils.hpp"

namespace storjcloud {
namespace services {

Registrar::Registrar(std::shared_ptr<DashboardApi> dashboard)
    : dashboard_(std::move(dashboard))
{
}

RegistrationReport Registrar::registerNodes(const std::vector<core::Node>& nodes,
                                            const utils::CancellationToken* cancel) {
    RegistrationReport report;
    size_t unreachable = 0;

    for (const auto& node : nodes) {
        RegistrationResult result{node, false, false, std::nullopt};
        const std::string shortId = utils::short_id(node.nodeId());

        if (utils::isCancelled(cancel)) {
            result.reason = "cancelled";
            report.results.push_back(std::move(result));
            continue;
        }

        ApiResult api = dashboard_->registerNode(node, cancel);
        if (api.status == ApiStatus::CONFLICT) {
            LOG_DEBUG("Registrar", "Node {} already registered, updating", shortId);
            api = dashboard_->updateRegistration(node, cancel);
            result.updated = api.ok();
        }

        switch (api.status) {
            case ApiStatus::OK:
                result.accepted = true;
                ++report.accepted;
                LOG_INFO("Registrar", "{} node {} ({})", result.updated ? "Updated" : "Registered",
                         shortId, node.name);
                break;
            case ApiStatus::UNAUTHORIZED:
                LOG_ERROR("Registrar", "Authentication failed - check API token");
                throw core::AuthenticationError("dashboard rejected the API token (" + api.message + ")");
            case ApiStatus::UNREACHABLE:
                ++unreachable;
                result.reason = api.message;
                LOG_WARN("Registrar", "Cannot reach dashboard for node {}: {}", shortId, api.message);
                break;
            default:
                result.reason = api.message.empty() ? apiStatusToString(api.status) : api.message;
                LOG_WARN("Registrar", "Node {} rejected: {}", shortId, *result.reason);
                break;
        }
        report.results.push_back(std::move(result));
    }

    if (!nodes.empty() && unreachable == nodes.size()) {
        throw core::DashboardUnavailableError("dashboard unreachable for all " +
                                              std::to_string(nodes.size()) + " registrations");
    }
    return report;
}

}  // namespace services
}  // namespace storjcloud
