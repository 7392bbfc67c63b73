/**
 * @file candidate_source.cpp
 * @brief Port list, port range, container and chained candidate sources.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/core/candidate_source.hpp"
#include "storjcloud/core/errors.hpp"
#include "storjcloud/utils/logger.hpp"
#include "storjcloud/utils/string_utils.hpp"

namespace storjcloud {
namespace core {

namespace {

constexpr uint16_t kDashboardRangeFirst = 14000;
constexpr uint16_t kDashboardRangeLast = 15000;

const char* const kNodeImages[] = {
    "storjlabs/storagenode",
    "storj/storagenode",
};

// "docker.io/storjlabs/storagenode:latest@sha256:..." -> "storjlabs/storagenode"
std::string imageRepository(const std::string& image) {
    std::string repo = image;
    auto at = repo.find('@');
    if (at != std::string::npos) {
        repo = repo.substr(0, at);
    }
    auto slash = repo.rfind('/');
    auto colon = repo.rfind(':');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        repo = repo.substr(0, colon);
    }
    for (const char* registry : {"docker.io/", "index.docker.io/"}) {
        if (utils::starts_with(repo, registry)) {
            repo = repo.substr(std::string(registry).size());
        }
    }
    return utils::to_lower(repo);
}

std::optional<std::string> envValue(const std::vector<std::string>& env, const std::string& key) {
    const std::string prefix = key + "=";
    for (const auto& entry : env) {
        if (utils::starts_with(entry, prefix)) {
            return entry.substr(prefix.size());
        }
    }
    return std::nullopt;
}

const PortBinding* findPublished(const ContainerInfo& container, uint16_t privatePort) {
    for (const auto& binding : container.ports) {
        if (binding.privatePort == privatePort && binding.publicPort != 0 &&
            utils::to_lower(binding.type) == "tcp") {
            return &binding;
        }
    }
    return nullptr;
}

// A binding on a specific host address is only reachable there
std::string bindingHost(const PortBinding& binding, const std::string& scanHost) {
    if (binding.ip.empty() || binding.ip == "0.0.0.0" || binding.ip == "::") {
        return scanHost;
    }
    return binding.ip;
}

uint16_t storagePortFor(const ContainerInfo& container, const std::vector<std::string>& env) {
    if (const auto* binding = findPublished(container, kDefaultStoragePort)) {
        return binding->publicPort;
    }
    if (auto address = envValue(env, kStorageAddressVar)) {
        auto colon = address->rfind(':');
        uint16_t port = 0;
        if (colon != std::string::npos && utils::parse_port(address->substr(colon + 1), port)) {
            return port;
        }
    }
    return kDefaultStoragePort;
}

}  // namespace

// =============================================================================
// PortListSource
// =============================================================================

PortListSource::PortListSource(std::string host, std::vector<uint16_t> ports)
    : host_(std::move(host))
    , ports_(std::move(ports))
{
}

std::optional<Candidate> PortListSource::next() {
    if (index_ >= ports_.size()) {
        return std::nullopt;
    }
    Candidate candidate;
    candidate.host = host_;
    candidate.port = ports_[index_++];
    candidate.sourceHint = "port-list";
    return candidate;
}

std::string PortListSource::describe() const {
    std::vector<std::string> parts;
    parts.reserve(ports_.size());
    for (auto port : ports_) {
        parts.push_back(std::to_string(port));
    }
    return host_ + " ports [" + utils::join(parts, ",") + "]";
}

// =============================================================================
// PortRangeSource
// =============================================================================

PortRangeSource::PortRangeSource(std::string host, uint16_t first, uint16_t last)
    : host_(std::move(host))
    , first_(first)
    , last_(last)
    , cursor_(first)
{
    if (first == 0 || first > last) {
        throw ConfigurationError("invalid port range " + std::to_string(first) +
                                 "-" + std::to_string(last));
    }
}

std::optional<Candidate> PortRangeSource::next() {
    if (done_) {
        return std::nullopt;
    }
    Candidate candidate;
    candidate.host = host_;
    candidate.port = cursor_;
    candidate.sourceHint = "port-range";

    if (cursor_ == last_) {
        done_ = true;
    } else {
        ++cursor_;
    }
    return candidate;
}

std::string PortRangeSource::describe() const {
    return host_ + " ports " + std::to_string(first_) + "-" + std::to_string(last_);
}

// =============================================================================
// ContainerSource
// =============================================================================

bool isStorageNodeContainer(const ContainerInfo& container) {
    const std::string repo = imageRepository(container.image);
    for (const char* image : kNodeImages) {
        if (repo == image) {
            return true;
        }
    }
    const std::string name = utils::to_lower(container.name);
    return utils::contains(name, "storj") || utils::contains(name, "storagenode");
}

std::optional<Candidate> candidateFromContainer(const ContainerInfo& container,
                                                const std::vector<std::string>& env,
                                                const std::string& host) {
    Candidate candidate;
    candidate.host = host;
    candidate.origin = Origin::DOCKER;
    candidate.sourceHint = container.name;
    candidate.containerId = container.id;
    candidate.containerName = container.name;
    candidate.image = container.image;
    candidate.storagePort = storagePortFor(container, env);

    if (const auto* binding = findPublished(container, kDefaultDashboardPort)) {
        candidate.host = bindingHost(*binding, host);
        candidate.port = binding->publicPort;
        return candidate;
    }

    if (auto consoleAddress = envValue(env, kConsoleAddressVar)) {
        auto colon = consoleAddress->rfind(':');
        uint16_t port = 0;
        if (colon == std::string::npos ||
            !utils::parse_port(utils::trim(consoleAddress->substr(colon + 1)), port)) {
            LOG_WARN("ContainerSource", "Ignoring container {}: malformed {}='{}'",
                     container.name, kConsoleAddressVar, *consoleAddress);
            return std::nullopt;
        }
        std::string overrideHost = utils::trim(consoleAddress->substr(0, colon));
        if (!overrideHost.empty() && overrideHost != "0.0.0.0") {
            candidate.host = overrideHost;
        }
        candidate.port = port;
        return candidate;
    }

    for (const auto& binding : container.ports) {
        if (binding.publicPort != 0 && utils::to_lower(binding.type) == "tcp" &&
            binding.privatePort >= kDashboardRangeFirst &&
            binding.privatePort <= kDashboardRangeLast) {
            candidate.host = bindingHost(binding, host);
            candidate.port = binding.publicPort;
            return candidate;
        }
    }

    LOG_DEBUG("ContainerSource", "Container {} publishes no dashboard port", container.name);
    return std::nullopt;
}

ContainerSource::ContainerSource(std::shared_ptr<ContainerRuntime> runtime, std::string host,
                                 const utils::CancellationToken* cancel)
    : runtime_(std::move(runtime))
    , host_(std::move(host))
    , cancel_(cancel)
{
}

void ContainerSource::reset() {
    candidates_.clear();
    index_ = 0;
    loaded_ = true;

    std::vector<ContainerInfo> containers;
    std::string error;
    if (!runtime_->listRunning(containers, error, cancel_)) {
        LOG_WARN("ContainerSource", "Cannot list containers on {}: {}", runtime_->describe(), error);
        return;
    }

    size_t matched = 0;
    for (const auto& container : containers) {
        if (utils::isCancelled(cancel_)) {
            LOG_WARN("ContainerSource", "Container inspection cancelled");
            break;
        }
        if (!isStorageNodeContainer(container)) {
            continue;
        }
        ++matched;

        std::vector<std::string> env;
        if (!runtime_->environment(container.id, env, error, cancel_)) {
            LOG_WARN("ContainerSource", "Cannot inspect container {}: {}", container.name, error);
        }

        if (auto candidate = candidateFromContainer(container, env, host_)) {
            LOG_DEBUG("ContainerSource", "Container {} -> {}", container.name, candidate->endpoint());
            candidates_.push_back(std::move(*candidate));
        }
    }

    LOG_INFO("ContainerSource", "Found {} storage node containers ({} running), {} candidates",
             matched, containers.size(), candidates_.size());
}

std::optional<Candidate> ContainerSource::next() {
    if (!loaded_) {
        reset();
    }
    if (index_ >= candidates_.size()) {
        return std::nullopt;
    }
    return candidates_[index_++];
}

std::string ContainerSource::describe() const {
    return "containers on " + runtime_->describe();
}

// =============================================================================
// ChainedSource
// =============================================================================

ChainedSource::ChainedSource(std::vector<std::unique_ptr<CandidateSource>> sources)
    : sources_(std::move(sources))
{
}

void ChainedSource::reset() {
    for (auto& source : sources_) {
        source->reset();
    }
    current_ = 0;
}

std::optional<Candidate> ChainedSource::next() {
    while (current_ < sources_.size()) {
        if (auto candidate = sources_[current_]->next()) {
            return candidate;
        }
        ++current_;
    }
    return std::nullopt;
}

std::string ChainedSource::describe() const {
    std::vector<std::string> parts;
    for (const auto& source : sources_) {
        parts.push_back(source->describe());
    }
    return utils::join(parts, " + ");
}

}  // namespace core
}  // namespace storjcloud
