/**
 * @file config.hpp
 * @brief storjcloud-client configuration and CLI parsing
 *
 * The configuration is built once at startup from defaults, an optional
 * YAML config file, environment variables and command-line flags (later
 * sources win) and then passed by reference into each command. Nothing
 * reads the environment or the file afterwards.
 */

#pragma once

#include "storjcloud/services/docker_client.hpp"
#include "storjcloud/services/dashboard_client.hpp"
#include "storjcloud/services/sync_engine.hpp"
#include "storjcloud/utils/logger.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace storjcloud {
namespace daemon {

enum class Command {
    NONE,
    DISCOVER,
    SYNC,
    AUTH
};

const char* commandToString(Command command);

/**
 * @brief Dashboard API access.
 */
struct ApiConfig {
    std::string token;
    std::string url = services::kDefaultDashboardUrl;
    std::chrono::milliseconds timeout{30000};
};

/**
 * @brief discover command settings.
 */
struct DiscoverySettings {
    std::string server;                        ///< Empty: detect the local address
    std::vector<uint16_t> ports = {14000, 14001, 14002, 14003, 14004, 14005};
    bool portsGiven = false;                   ///< --ports was passed
    std::optional<std::pair<uint16_t, uint16_t>> portRange;
    bool fromDocker = false;
    bool autoDetect = false;                   ///< Containers and ports together
    std::string dockerHost = services::kDefaultDockerHost;
    std::chrono::milliseconds timeout{5000};
    int retries = 1;
    size_t concurrency = 8;
    bool json = false;

    bool scansContainers() const { return fromDocker || autoDetect; }
    bool scansPorts() const { return !fromDocker || autoDetect || portsGiven || portRange.has_value(); }
};

struct LoggingSettings {
    utils::LogLevel level = utils::LogLevel::INFO;
    std::string file;
    bool color = true;
};

/**
 * @brief Complete client configuration.
 */
struct Config {
    Command command = Command::NONE;
    ApiConfig api;
    DiscoverySettings discovery;
    services::SyncSettings sync;
    LoggingSettings logging;
    std::string configFile;                    ///< File the settings were read from, empty if none
    bool help = false;
};

/**
 * @brief Environment lookup; returns nullopt for unset variables.
 */
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Lookup backed by the process environment.
 */
EnvLookup processEnvironment();

/**
 * @brief Parse "500ms", "5s", "5m", "1h" or plain seconds.
 * @throws core::ConfigurationError on malformed input.
 */
std::chrono::milliseconds parseDuration(const std::string& text);

/**
 * @brief Parse "14000,14001,14002".
 * @throws core::ConfigurationError on an invalid port.
 */
std::vector<uint16_t> parsePortList(const std::string& text);

/**
 * @brief Parse "14000-14010" (inclusive).
 * @throws core::ConfigurationError on malformed input or first > last.
 */
std::pair<uint16_t, uint16_t> parsePortRange(const std::string& text);

/**
 * @brief Config file locations tried when --config is not given, in order.
 *
 * $HOME/.storjcloud/config.yaml, $HOME/.storjcloud.yaml,
 * /etc/storjcloud/config.yaml and ./config.yaml. The HOME entries are
 * left out when HOME is unset.
 */
std::vector<std::string> defaultConfigPaths(const EnvLookup& env);

/**
 * @brief Apply the settings of a YAML config file on top of @p config.
 *
 * Recognised sections are api, discovery, sync and logging; keys that are
 * absent leave the current value alone. Unknown keys are logged and skipped.
 *
 * @throws core::ConfigurationError if the file cannot be read, is not valid
 *         YAML, or holds an invalid value.
 */
void loadConfigFile(Config& config, const std::string& path);

/**
 * @brief Parse command line arguments
 *
 * The config file named by --config (or the first existing default path)
 * is applied first, then the environment, then the remaining flags.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param env Environment lookup (defaults apply where unset)
 * @return Parsed configuration
 * @throws core::ConfigurationError on unknown options, invalid values, or
 *         an unreadable config file
 */
Config parseArgs(int argc, char* argv[], const EnvLookup& env);

/**
 * @brief Check a parsed configuration before any network activity.
 * @throws core::ConfigurationError with an operator-facing message.
 */
void validate(const Config& config);

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
void printUsage(const char* program_name);

}  // namespace daemon
}  // namespace storjcloud
