/**
 * @file docker_client.cpp
 * @brief DockerClient implementation.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/services/docker_client.hpp"
#include "storjcloud/core/errors.hpp"
#include "storjcloud/proto/docker.pb.h"
#include "storjcloud/utils/logger.hpp"
#include "storjcloud/utils/string_utils.hpp"

#include <google/protobuf/util/json_util.h>

namespace storjcloud {
namespace services {

namespace {

bool parseJson(const std::string& json, google::protobuf::Message& message, std::string& error) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
    if (!status.ok()) {
        error = status.ToString();
        return false;
    }
    return true;
}

}  // namespace

DockerEndpoint DockerEndpoint::parse(const std::string& dockerHost) {
    DockerEndpoint endpoint;
    if (utils::starts_with(dockerHost, "unix://")) {
        endpoint.unixSocket = dockerHost.substr(7);
        endpoint.baseUrl = "http://localhost";
        if (endpoint.unixSocket.empty()) {
            throw core::ConfigurationError("empty unix socket path in DOCKER_HOST");
        }
    } else if (utils::starts_with(dockerHost, "tcp://")) {
        endpoint.baseUrl = "http://" + dockerHost.substr(6);
    } else if (utils::starts_with(dockerHost, "http://") || utils::starts_with(dockerHost, "https://")) {
        endpoint.baseUrl = dockerHost;
    } else {
        throw core::ConfigurationError("unsupported DOCKER_HOST '" + dockerHost + "'");
    }
    while (!endpoint.baseUrl.empty() && endpoint.baseUrl.back() == '/') {
        endpoint.baseUrl.pop_back();
    }
    return endpoint;
}

DockerClient::DockerClient(std::shared_ptr<net::HttpClient> http,
                           const std::string& dockerHost,
                           std::chrono::milliseconds timeout)
    : http_(std::move(http))
    , dockerHost_(dockerHost)
    , endpoint_(DockerEndpoint::parse(dockerHost))
    , timeout_(timeout)
{
}

bool DockerClient::fetch(const std::string& path, std::string& body, std::string& error,
                         const utils::CancellationToken* cancel) {
    net::HttpRequest request = net::HttpRequest::get(endpoint_.baseUrl + path);
    request.unix_socket = endpoint_.unixSocket;
    request.timeout = timeout_;

    auto response = http_->send(request, cancel);
    if (!response.delivered()) {
        error = response.error_message;
        return false;
    }
    if (!response.ok()) {
        error = "HTTP " + std::to_string(response.status);
        return false;
    }
    body = std::move(response.body);
    return true;
}

bool DockerClient::listRunning(std::vector<core::ContainerInfo>& containers,
                               std::string& error,
                               const utils::CancellationToken* cancel) {
    std::string body;
    if (!fetch("/containers/json", body, error, cancel)) {
        return false;
    }

    // The endpoint returns a bare array
    proto::ContainerSummaryList list;
    if (!parseJson("{\"containers\":" + body + "}", list, error)) {
        return false;
    }

    containers.clear();
    for (const auto& summary : list.containers()) {
        if (!summary.state().empty() && summary.state() != "running") {
            continue;
        }
        core::ContainerInfo info;
        info.id = summary.id();
        if (summary.names_size() > 0) {
            info.name = summary.names(0);
            if (!info.name.empty() && info.name.front() == '/') {
                info.name.erase(0, 1);
            }
        }
        info.image = summary.image();
        info.state = summary.state();
        for (const auto& port : summary.ports()) {
            core::PortBinding binding;
            binding.ip = port.ip();
            binding.privatePort = static_cast<uint16_t>(port.private_port());
            binding.publicPort = static_cast<uint16_t>(port.public_port());
            binding.type = port.type().empty() ? "tcp" : port.type();
            info.ports.push_back(std::move(binding));
        }
        containers.push_back(std::move(info));
    }

    LOG_DEBUG("Docker", "{} running containers on {}", containers.size(), dockerHost_);
    return true;
}

bool DockerClient::environment(const std::string& containerId,
                               std::vector<std::string>& env,
                               std::string& error,
                               const utils::CancellationToken* cancel) {
    std::string body;
    if (!fetch("/containers/" + containerId + "/json", body, error, cancel)) {
        return false;
    }

    proto::ContainerInspect inspect;
    if (!parseJson(body, inspect, error)) {
        return false;
    }

    env.assign(inspect.config().env().begin(), inspect.config().env().end());
    return true;
}

}  // namespace services
}  // namespace storjcloud
