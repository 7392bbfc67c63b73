/**
 * @file container_runtime.hpp
 * @brief Read-only view of a container runtime used by discovery.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/utils/cancellation.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace storjcloud {
namespace core {

struct PortBinding {
    std::string ip;
    uint16_t privatePort = 0;
    uint16_t publicPort = 0;     ///< 0 when the port is exposed but not published
    std::string type = "tcp";
};

struct ContainerInfo {
    std::string id;
    std::string name;            ///< Without the leading '/'
    std::string image;
    std::string state;
    std::vector<PortBinding> ports;
};

/**
 * @class ContainerRuntime
 * @brief Container listing/inspection seam.
 *
 * Implementations report failures through the return value and the error
 * string; they do not throw for an unavailable daemon.
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /**
     * @brief List running containers.
     */
    virtual bool listRunning(std::vector<ContainerInfo>& containers,
                             std::string& error,
                             const utils::CancellationToken* cancel = nullptr) = 0;

    /**
     * @brief Read a container's environment ("KEY=VALUE" entries).
     */
    virtual bool environment(const std::string& containerId,
                             std::vector<std::string>& env,
                             std::string& error,
                             const utils::CancellationToken* cancel = nullptr) = 0;

    /**
     * @brief Endpoint description for log lines.
     */
    virtual std::string describe() const = 0;
};

}  // namespace core
}  // namespace storjcloud
