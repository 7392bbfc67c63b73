/**
 * @file docker_client.hpp
 * @brief Docker Engine API client (container list and inspect only).
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/core/container_runtime.hpp"
#include "storjcloud/net/http_client.hpp"
#include "storjcloud/services/export.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace storjcloud {
namespace services {

/// Default Docker daemon endpoint.
constexpr const char* kDefaultDockerHost = "unix:///var/run/docker.sock";

/**
 * @brief Where to send Docker API requests.
 */
struct STORJCLOUD_SERVICES_API DockerEndpoint {
    std::string unixSocket;   ///< Non-empty for unix:// endpoints
    std::string baseUrl;      ///< Scheme, host and port

    /**
     * @brief Parse a DOCKER_HOST value (unix://, tcp://, http://, https://).
     * @throws core::ConfigurationError on an unsupported scheme.
     */
    static DockerEndpoint parse(const std::string& dockerHost);
};

/**
 * @class DockerClient
 * @brief ContainerRuntime over the Docker Engine REST API.
 */
class STORJCLOUD_SERVICES_API DockerClient : public core::ContainerRuntime {
public:
    DockerClient(std::shared_ptr<net::HttpClient> http,
                 const std::string& dockerHost,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds(10000));

    bool listRunning(std::vector<core::ContainerInfo>& containers,
                     std::string& error,
                     const utils::CancellationToken* cancel = nullptr) override;

    bool environment(const std::string& containerId,
                     std::vector<std::string>& env,
                     std::string& error,
                     const utils::CancellationToken* cancel = nullptr) override;

    std::string describe() const override { return dockerHost_; }

private:
    bool fetch(const std::string& path, std::string& body, std::string& error,
               const utils::CancellationToken* cancel);

    std::shared_ptr<net::HttpClient> http_;
    std::string dockerHost_;
    DockerEndpoint endpoint_;
    std::chrono::milliseconds timeout_;
};

}  // namespace services
}  // namespace storjcloud
