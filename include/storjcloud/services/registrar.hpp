/**
 * @file registrar.hpp
 * @brief Registers discovered nodes with the dashboard.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/core/node.hpp"
#include "storjcloud/services/dashboard_client.hpp"
#include "storjcloud/services/export.hpp"
#include "storjcloud/utils/cancellation.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace storjcloud {
namespace services {

struct RegistrationResult {
    core::Node node;
    bool accepted = false;
    bool updated = false;               ///< Already known; updated in place
    std::optional<std::string> reason;  ///< Set when not accepted
};

struct RegistrationReport {
    size_t accepted = 0;
    std::vector<RegistrationResult> results;
};

/**
 * @class Registrar
 * @brief One registration request per node; outcomes are independent.
 *
 * A node the dashboard already knows (409) is updated with PATCH instead.
 */
class STORJCLOUD_SERVICES_API Registrar {
public:
    explicit Registrar(std::shared_ptr<DashboardApi> dashboard);

    /**
     * @throws core::AuthenticationError when the dashboard rejects the token.
     * @throws core::DashboardUnavailableError when no request got an answer.
     */
    RegistrationReport registerNodes(const std::vector<core::Node>& nodes,
                                     const utils::CancellationToken* cancel = nullptr);

private:
    std::shared_ptr<DashboardApi> dashboard_;
};

}  // namespace services
}  // namespace storjcloud
