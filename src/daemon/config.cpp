/**
 * @file config.cpp
 * @brief Command line, environment and config file parsing
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/daemon/config.hpp"
#include "storjcloud/core/errors.hpp"
#include "storjcloud/utils/logger.hpp"
#include "storjcloud/utils/string_utils.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>

namespace storjcloud {
namespace daemon {

using core::ConfigurationError;

namespace {

enum class Scope {
    GLOBAL,
    DISCOVER,
    SYNC
};

bool isTrue(const std::string& text) {
    const std::string lower = utils::to_lower(utils::trim(text));
    return lower == "1" || lower == "true" || lower == "yes";
}

long parseInteger(const std::string& option, const std::string& text) {
    const std::string trimmed = utils::trim(text);
    if (trimmed.empty()) {
        throw ConfigurationError("Option " + option + " requires a number");
    }
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(trimmed.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        throw ConfigurationError("Option " + option + " expects a number, got '" + text + "'");
    }
    return value;
}

size_t parseCount(const std::string& option, const std::string& text) {
    long value = parseInteger(option, text);
    if (value < 0) {
        throw ConfigurationError("Option " + option + " must not be negative");
    }
    return static_cast<size_t>(value);
}

services::BackoffPolicy parseBackoff(const std::string& text) {
    const std::string lower = utils::to_lower(utils::trim(text));
    if (lower == "fixed") return services::BackoffPolicy::FIXED;
    if (lower == "exponential") return services::BackoffPolicy::EXPONENTIAL;
    throw ConfigurationError("Unknown backoff policy '" + text + "' (expected fixed or exponential)");
}

utils::LogLevel parseLevel(const std::string& text) {
    utils::LogLevel level = utils::LogLevel::INFO;
    if (!utils::parseLogLevel(text, level)) {
        throw ConfigurationError("Unknown log level '" + text + "'");
    }
    return level;
}

Command parseCommand(const std::string& word) {
    if (word == "discover") return Command::DISCOVER;
    if (word == "sync") return Command::SYNC;
    if (word == "auth") return Command::AUTH;
    throw ConfigurationError("Unknown command '" + word + "'");
}

void applyEnvironment(Config& config, const EnvLookup& env) {
    if (auto value = env("STORJCLOUD_API_TOKEN")) {
        config.api.token = *value;
    }
    if (auto value = env("STORJCLOUD_DASHBOARD_URL")) {
        config.api.url = *value;
    }
    if (auto value = env("STORJCLOUD_API_TIMEOUT")) {
        config.api.timeout = parseDuration(*value);
    }
    if (auto value = env("STORJCLOUD_FROM_DOCKER")) {
        config.discovery.fromDocker = isTrue(*value);
    }
    if (auto value = env("DOCKER_HOST")) {
        if (!value->empty()) {
            config.discovery.dockerHost = *value;
        }
    }
    if (auto value = env("STORJCLOUD_SYNC_INTERVAL")) {
        config.sync.interval = parseDuration(*value);
    }
    if (auto value = env("STORJCLOUD_LOG_LEVEL")) {
        config.logging.level = parseLevel(*value);
    }
    if (auto value = env("STORJCLOUD_LOG_FILE")) {
        config.logging.file = *value;
    }
}

Scope scopeOf(const std::string& name) {
    static const char* const kDiscover[] = {
        "--server", "-s", "--ports", "-p", "--port-range", "--auto", "--from-docker",
        "--docker-host", "--timeout", "--retries", "--concurrency", "--json"};
    static const char* const kSync[] = {
        "--interval", "-i", "--batch-size", "--retry-failed", "--no-retry-failed",
        "--retry-attempts", "--backoff", "--retry-delay", "--concurrent-batches",
        "--poll-timeout", "--tick-deadline", "--grace-period", "--cache-nodes",
        "--exit-on-dashboard-error"};
    for (const char* flag : kDiscover) {
        if (name == flag) return Scope::DISCOVER;
    }
    for (const char* flag : kSync) {
        if (name == flag) return Scope::SYNC;
    }
    return Scope::GLOBAL;
}

// Config file values

std::string scalarOf(const YAML::Node& node, const std::string& key) {
    if (!node.IsScalar()) {
        throw ConfigurationError("Config key " + key + " must be a single value");
    }
    return node.Scalar();
}

bool booleanOf(const YAML::Node& node, const std::string& key) {
    bool value = false;
    if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value)) {
        throw ConfigurationError("Config key " + key + " must be true or false");
    }
    return value;
}

int boundedOf(const YAML::Node& node, const std::string& key) {
    long value = parseInteger(key, scalarOf(node, key));
    if (value < 0 || value > std::numeric_limits<int>::max()) {
        throw ConfigurationError("Config key " + key + " must not be negative");
    }
    return static_cast<int>(value);
}

uint16_t portOf(const YAML::Node& node, const std::string& key) {
    uint16_t port = 0;
    const std::string text = scalarOf(node, key);
    if (!utils::parse_port(text, port)) {
        throw ConfigurationError("Config key " + key + " has invalid port '" + text + "'");
    }
    return port;
}

std::vector<uint16_t> portsOf(const YAML::Node& node, const std::string& key) {
    if (!node.IsSequence()) {
        return parsePortList(scalarOf(node, key));
    }
    std::vector<uint16_t> ports;
    for (const auto& item : node) {
        ports.push_back(portOf(item, key));
    }
    if (ports.empty()) {
        throw ConfigurationError("Config key " + key + " is empty");
    }
    return ports;
}

// [14000, 14010] or "14000-14010"
std::pair<uint16_t, uint16_t> rangeOf(const YAML::Node& node, const std::string& key) {
    if (!node.IsSequence()) {
        return parsePortRange(scalarOf(node, key));
    }
    if (node.size() != 2) {
        throw ConfigurationError("Config key " + key + " must list exactly two ports");
    }
    const uint16_t first = portOf(node[0], key);
    const uint16_t last = portOf(node[1], key);
    if (first > last) {
        throw ConfigurationError("Config key " + key + ": first port exceeds last");
    }
    return {first, last};
}

using KeyHandler = std::function<bool(const std::string&, const YAML::Node&)>;

// Calls handler for every key of root[section]; handler returns false for unknown keys.
void applySection(const YAML::Node& root, const std::string& section, const KeyHandler& handler) {
    const YAML::Node node = root[section];
    if (!node || node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        throw ConfigurationError("Config section " + section + " must be a mapping");
    }
    for (const auto& entry : node) {
        const std::string key = entry.first.as<std::string>();
        if (!handler(key, entry.second)) {
            LOG_WARN("Config", "Ignoring unknown config key {}.{}", section, key);
        }
    }
}

void applyFile(Config& config, const YAML::Node& root) {
    applySection(root, "api", [&](const std::string& key, const YAML::Node& value) {
        const std::string name = "api." + key;
        if (key == "token") {
            config.api.token = scalarOf(value, name);
        } else if (key == "endpoint" || key == "url") {
            config.api.url = scalarOf(value, name);
        } else if (key == "timeout") {
            config.api.timeout = parseDuration(scalarOf(value, name));
        } else {
            return false;
        }
        return true;
    });

    applySection(root, "discovery", [&](const std::string& key, const YAML::Node& value) {
        DiscoverySettings& d = config.discovery;
        const std::string name = "discovery." + key;
        if (key == "server") {
            d.server = scalarOf(value, name);
        } else if (key == "common_ports" || key == "ports") {
            d.ports = portsOf(value, name);
        } else if (key == "port_range") {
            d.portRange = rangeOf(value, name);
        } else if (key == "from_docker") {
            d.fromDocker = booleanOf(value, name);
        } else if (key == "auto") {
            d.autoDetect = booleanOf(value, name);
        } else if (key == "docker_host") {
            d.dockerHost = scalarOf(value, name);
        } else if (key == "timeout") {
            d.timeout = parseDuration(scalarOf(value, name));
        } else if (key == "retry_attempts" || key == "retries") {
            d.retries = boundedOf(value, name);
        } else if (key == "concurrency") {
            d.concurrency = parseCount(name, scalarOf(value, name));
        } else {
            return false;
        }
        return true;
    });

    applySection(root, "sync", [&](const std::string& key, const YAML::Node& value) {
        services::SyncSettings& s = config.sync;
        const std::string name = "sync." + key;
        if (key == "interval") {
            s.interval = parseDuration(scalarOf(value, name));
        } else if (key == "batch_size") {
            s.batchSize = parseCount(name, scalarOf(value, name));
        } else if (key == "retry_failed") {
            s.retryFailed = booleanOf(value, name);
        } else if (key == "retry_attempts") {
            s.retryAttempts = boundedOf(value, name);
        } else if (key == "backoff") {
            s.backoff = parseBackoff(scalarOf(value, name));
        } else if (key == "retry_delay") {
            s.retryDelay = parseDuration(scalarOf(value, name));
        } else if (key == "concurrent_batches") {
            s.maxConcurrentBatches = parseCount(name, scalarOf(value, name));
        } else if (key == "poll_timeout") {
            s.pollTimeout = parseDuration(scalarOf(value, name));
        } else if (key == "tick_deadline") {
            s.tickDeadline = parseDuration(scalarOf(value, name));
        } else if (key == "grace_period") {
            s.gracePeriod = parseDuration(scalarOf(value, name));
        } else if (key == "cache_nodes") {
            s.refreshEachTick = !booleanOf(value, name);
        } else if (key == "exit_on_dashboard_error") {
            s.exitOnDashboardUnreachable = booleanOf(value, name);
        } else {
            return false;
        }
        return true;
    });

    applySection(root, "logging", [&](const std::string& key, const YAML::Node& value) {
        const std::string name = "logging." + key;
        if (key == "level") {
            config.logging.level = parseLevel(scalarOf(value, name));
        } else if (key == "file") {
            config.logging.file = scalarOf(value, name);
        } else if (key == "color") {
            config.logging.color = booleanOf(value, name);
        } else {
            return false;
        }
        return true;
    });
}

bool fileExists(const std::string& path) {
    std::ifstream file(path);
    return file.good();
}

// Finds --config ahead of the main pass; the file is applied before env and flags
std::optional<std::string> findConfigFlag(int argc, char* argv[]) {
    std::optional<std::string> path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                throw ConfigurationError("Option --config requires a value");
            }
            path = argv[++i];
        } else if (utils::starts_with(arg, "--config=")) {
            path = arg.substr(std::strlen("--config="));
        }
    }
    if (path && utils::trim(*path).empty()) {
        throw ConfigurationError("Option --config requires a value");
    }
    return path;
}

bool helpRequested(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            return true;
        }
    }
    return false;
}

}  // namespace

const char* commandToString(Command command) {
    switch (command) {
        case Command::NONE:     return "none";
        case Command::DISCOVER: return "discover";
        case Command::SYNC:     return "sync";
        case Command::AUTH:     return "auth";
        default:                return "unknown";
    }
}

EnvLookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::chrono::milliseconds parseDuration(const std::string& text) {
    const std::string value = utils::to_lower(utils::trim(text));
    size_t digits = 0;
    while (digits < value.size() && std::isdigit(static_cast<unsigned char>(value[digits]))) {
        ++digits;
    }
    if (digits == 0 || digits > 12) {
        throw ConfigurationError("Invalid duration '" + text + "'");
    }

    const long long amount = std::stoll(value.substr(0, digits));
    const std::string unit = value.substr(digits);

    if (unit == "ms") return std::chrono::milliseconds(amount);
    if (unit.empty() || unit == "s") return std::chrono::seconds(amount);
    if (unit == "m") return std::chrono::minutes(amount);
    if (unit == "h") return std::chrono::hours(amount);

    throw ConfigurationError("Invalid duration '" + text + "' (use ms, s, m or h)");
}

std::vector<uint16_t> parsePortList(const std::string& text) {
    std::vector<uint16_t> ports;
    for (const auto& token : utils::split(text, ',')) {
        uint16_t port = 0;
        if (!utils::parse_port(token, port)) {
            throw ConfigurationError("Invalid port '" + token + "'");
        }
        ports.push_back(port);
    }
    if (ports.empty()) {
        throw ConfigurationError("Port list '" + text + "' is empty");
    }
    return ports;
}

std::pair<uint16_t, uint16_t> parsePortRange(const std::string& text) {
    const size_t dash = text.find('-');
    if (dash == std::string::npos) {
        throw ConfigurationError("Invalid port range '" + text + "' (expected FIRST-LAST)");
    }
    uint16_t first = 0;
    uint16_t last = 0;
    if (!utils::parse_port(utils::trim(text.substr(0, dash)), first) ||
        !utils::parse_port(utils::trim(text.substr(dash + 1)), last)) {
        throw ConfigurationError("Invalid port range '" + text + "'");
    }
    if (first > last) {
        throw ConfigurationError("Invalid port range '" + text + "': first port exceeds last");
    }
    return {first, last};
}

std::vector<std::string> defaultConfigPaths(const EnvLookup& env) {
    std::vector<std::string> paths;
    if (auto home = env("HOME")) {
        if (!home->empty()) {
            paths.push_back(*home + "/.storjcloud/config.yaml");
            paths.push_back(*home + "/.storjcloud.yaml");
        }
    }
    paths.push_back("/etc/storjcloud/config.yaml");
    paths.push_back("config.yaml");
    return paths;
}

void loadConfigFile(Config& config, const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigurationError("Cannot read config file " + path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid config file " + path + ": " + e.what());
    }

    if (!root.IsNull()) {
        if (!root.IsMap()) {
            throw ConfigurationError("Invalid config file " + path + ": top level must be a mapping");
        }
        try {
            applyFile(config, root);
        } catch (const YAML::Exception& e) {
            throw ConfigurationError("Invalid config file " + path + ": " + e.what());
        }
    }
    config.configFile = path;
}

Config parseArgs(int argc, char* argv[], const EnvLookup& env) {
    Config config;

    if (!helpRequested(argc, argv)) {
        if (auto explicitPath = findConfigFlag(argc, argv)) {
            if (!fileExists(*explicitPath)) {
                throw ConfigurationError("Config file not found: " + *explicitPath);
            }
            loadConfigFile(config, *explicitPath);
        } else {
            for (const auto& path : defaultConfigPaths(env)) {
                if (fileExists(path)) {
                    loadConfigFile(config, path);
                    break;
                }
            }
        }
    }

    applyEnvironment(config, env);

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        if (arg[0] != '-') {
            if (config.command != Command::NONE) {
                throw ConfigurationError(std::string("Unexpected argument '") + arg + "'");
            }
            config.command = parseCommand(arg);
            continue;
        }

        // --name=value is accepted as well as --name value
        std::string name = arg;
        std::optional<std::string> inlineValue;
        const size_t eq = name.find('=');
        if (eq != std::string::npos) {
            inlineValue = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        const Scope scope = scopeOf(name);
        if (scope == Scope::DISCOVER && config.command != Command::DISCOVER) {
            throw ConfigurationError("Option " + name + " is only valid after the discover command");
        }
        if (scope == Scope::SYNC && config.command != Command::SYNC) {
            throw ConfigurationError("Option " + name + " is only valid after the sync command");
        }

        auto value = [&]() -> std::string {
            if (inlineValue) {
                return *inlineValue;
            }
            if (i + 1 >= argc) {
                throw ConfigurationError("Option " + name + " requires a value");
            }
            return argv[++i];
        };
        auto noValue = [&]() {
            if (inlineValue) {
                throw ConfigurationError("Option " + name + " does not take a value");
            }
        };

        // Global
        if (name == "--config") {
            value();  // already loaded
        } else if (name == "--token" || name == "-t") {
            config.api.token = value();
        } else if (name == "--url") {
            config.api.url = value();
        } else if (name == "--log-level") {
            config.logging.level = parseLevel(value());
        } else if (name == "--log-file") {
            config.logging.file = value();
        } else if (name == "--no-color") {
            noValue();
            config.logging.color = false;
        }
        // discover
        else if (name == "--server" || name == "-s") {
            config.discovery.server = value();
        } else if (name == "--ports" || name == "-p") {
            config.discovery.ports = parsePortList(value());
            config.discovery.portsGiven = true;
        } else if (name == "--port-range") {
            config.discovery.portRange = parsePortRange(value());
        } else if (name == "--auto") {
            noValue();
            config.discovery.autoDetect = true;
        } else if (name == "--from-docker") {
            noValue();
            config.discovery.fromDocker = true;
        } else if (name == "--docker-host") {
            config.discovery.dockerHost = value();
        } else if (name == "--timeout") {
            config.discovery.timeout = parseDuration(value());
        } else if (name == "--retries") {
            long retries = parseInteger(name, value());
            if (retries < 0 || retries > std::numeric_limits<int>::max()) {
                throw ConfigurationError("Option --retries must not be negative");
            }
            config.discovery.retries = static_cast<int>(retries);
        } else if (name == "--concurrency") {
            config.discovery.concurrency = parseCount(name, value());
        } else if (name == "--json") {
            noValue();
            config.discovery.json = true;
        }
        // sync
        else if (name == "--interval" || name == "-i") {
            config.sync.interval = parseDuration(value());
        } else if (name == "--batch-size") {
            config.sync.batchSize = parseCount(name, value());
        } else if (name == "--retry-failed") {
            noValue();
            config.sync.retryFailed = true;
        } else if (name == "--no-retry-failed") {
            noValue();
            config.sync.retryFailed = false;
        } else if (name == "--retry-attempts") {
            long attempts = parseInteger(name, value());
            if (attempts < 0 || attempts > std::numeric_limits<int>::max()) {
                throw ConfigurationError("Option --retry-attempts must not be negative");
            }
            config.sync.retryAttempts = static_cast<int>(attempts);
        } else if (name == "--backoff") {
            config.sync.backoff = parseBackoff(value());
        } else if (name == "--retry-delay") {
            config.sync.retryDelay = parseDuration(value());
        } else if (name == "--concurrent-batches") {
            config.sync.maxConcurrentBatches = parseCount(name, value());
        } else if (name == "--poll-timeout") {
            config.sync.pollTimeout = parseDuration(value());
        } else if (name == "--tick-deadline") {
            config.sync.tickDeadline = parseDuration(value());
        } else if (name == "--grace-period") {
            config.sync.gracePeriod = parseDuration(value());
        } else if (name == "--cache-nodes") {
            noValue();
            config.sync.refreshEachTick = false;
        } else if (name == "--exit-on-dashboard-error") {
            noValue();
            config.sync.exitOnDashboardUnreachable = true;
        } else {
            throw ConfigurationError("Unknown option " + name);
        }
    }

    return config;
}

void validate(const Config& config) {
    if (config.command == Command::NONE) {
        throw ConfigurationError("No command given (expected discover, sync or auth)");
    }

    const std::string url = utils::trim(config.api.url);
    if (!utils::starts_with(url, "http://") && !utils::starts_with(url, "https://")) {
        throw ConfigurationError("Dashboard URL must start with http:// or https://: " + config.api.url);
    }
    if (utils::trim(config.api.token).empty()) {
        std::string base = url;
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        throw ConfigurationError("API token required. Get one from " + base + "/settings/api-tokens");
    }
    if (config.api.timeout.count() <= 0) {
        throw ConfigurationError("API timeout must be positive");
    }

    if (config.command == Command::DISCOVER) {
        const DiscoverySettings& d = config.discovery;
        if (d.timeout.count() <= 0) {
            throw ConfigurationError("Discovery timeout must be positive");
        }
        if (d.retries < 0 || d.retries > 10) {
            throw ConfigurationError("Discovery retries must be between 0 and 10");
        }
        if (d.concurrency < 1 || d.concurrency > 256) {
            throw ConfigurationError("Discovery concurrency must be between 1 and 256");
        }
        if (d.scansContainers() && utils::trim(d.dockerHost).empty()) {
            throw ConfigurationError("Docker host must not be empty");
        }
    }

    if (config.command == Command::SYNC) {
        const services::SyncSettings& s = config.sync;
        if (s.interval < std::chrono::seconds(1)) {
            throw ConfigurationError("Sync interval must be at least 1s");
        }
        if (s.batchSize < 1 || s.batchSize > 100) {
            throw ConfigurationError("Batch size must be between 1 and 100");
        }
        if (s.maxConcurrentBatches < 1 || s.maxConcurrentBatches > 16) {
            throw ConfigurationError("Concurrent batches must be between 1 and 16");
        }
        if (s.retryAttempts < 0 || s.retryAttempts > 10) {
            throw ConfigurationError("Retry attempts must be between 0 and 10");
        }
        if (s.retryDelay.count() <= 0 || s.pollTimeout.count() <= 0 ||
            s.tickDeadline.count() <= 0 || s.gracePeriod.count() <= 0) {
            throw ConfigurationError("Sync durations must be positive");
        }
    }
}

void printUsage(const char* program_name) {
    std::cout << "storjcloud-client - Storj node discovery and monitoring for StorjCloud\n\n"
              << "Usage: " << program_name << " [GLOBAL OPTIONS] <command> [OPTIONS]\n\n"
              << "Commands:\n"
              << "  discover              Find local storage nodes and register them\n"
              << "  sync                  Push node metrics to the dashboard periodically\n"
              << "  auth                  Check the API token\n"
              << "\nGlobal Options:\n"
              << "  --config <path>       YAML config file (default: first of ~/.storjcloud/config.yaml,\n"
              << "                        ~/.storjcloud.yaml, /etc/storjcloud/config.yaml, ./config.yaml)\n"
              << "  -t, --token <token>   API token (env STORJCLOUD_API_TOKEN)\n"
              << "  --url <url>           Dashboard API URL (default: " << services::kDefaultDashboardUrl << ")\n"
              << "  --log-level <level>   TRACE, DEBUG, INFO, WARN, ERROR, OFF (default: INFO)\n"
              << "  --log-file <path>     Also append log lines to a file\n"
              << "  --no-color            Disable colored console output\n"
              << "  -h, --help            Show this help message\n"
              << "\nDiscover Options:\n"
              << "  -s, --server <ip>     Host to scan (default: detected local IP)\n"
              << "  -p, --ports <list>    Comma-separated ports (default: 14000-14005)\n"
              << "  --port-range <a-b>    Inclusive port range\n"
              << "  --auto                Scan Docker containers and ports\n"
              << "  --from-docker         Scan Docker containers only\n"
              << "  --docker-host <url>   Docker endpoint (default: " << services::kDefaultDockerHost << ")\n"
              << "  --timeout <dur>       Per-probe timeout (default: 5s)\n"
              << "  --retries <n>         Retries per probe (default: 1)\n"
              << "  --concurrency <n>     Parallel probes (default: 8)\n"
              << "  --json                Print discovered nodes as JSON\n"
              << "\nSync Options:\n"
              << "  -i, --interval <dur>        Time between ticks (default: 5m)\n"
              << "  --batch-size <n>            Nodes per batch (default: 10)\n"
              << "  --concurrent-batches <n>    Batches in parallel (default: 2)\n"
              << "  --retry-failed              Retry failed polls (default)\n"
              << "  --no-retry-failed           Do not retry failed polls\n"
              << "  --retry-attempts <n>        Retries per node (default: 3)\n"
              << "  --backoff <policy>          fixed or exponential (default: exponential)\n"
              << "  --retry-delay <dur>         Base retry delay (default: 1s)\n"
              << "  --poll-timeout <dur>        Node status request timeout (default: 10s)\n"
              << "  --tick-deadline <dur>       Upper bound for one tick (default: 2m)\n"
              << "  --grace-period <dur>        Wait for in-flight polls on stop (default: 5s)\n"
              << "  --cache-nodes               Reuse the node list between ticks\n"
              << "  --exit-on-dashboard-error   Exit when the dashboard is unreachable for a tick\n"
              << "\nDurations accept ms, s, m and h suffixes; plain numbers are seconds.\n"
              << "Settings are layered: config file, then environment, then flags.\n\n"
              << "Example:\n"
              << "  " << program_name << " --token $TOKEN discover --server 192.168.1.10 --ports 14002,14003\n"
              << "  " << program_name << " discover --auto --json\n"
              << "  " << program_name << " sync --interval 5m --batch-size 20\n";
}

}  // namespace daemon
}  // namespace storjcloud
