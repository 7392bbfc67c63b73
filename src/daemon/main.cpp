/**
 * @file main.cpp
 * @brief storjcloud-client entry point
 *
 * Thin executable that wires the libraries together:
 * - Configuration from config file, environment and flags
 * - Logger setup
 * - Signal handling mapped onto a root cancellation token
 * - Command dispatch (discover, sync, auth)
 */

#include "storjcloud/daemon/commands.hpp"
#include "storjcloud/daemon/config.hpp"
#include "storjcloud/net/platform.hpp"
#include "storjcloud/utils/cancellation.hpp"
#include "storjcloud/utils/logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

using namespace storjcloud;
using namespace storjcloud::daemon;

// Global shutdown flag
static std::atomic<int> g_signal{0};

// Signal handler
extern "C" void signalHandler(int signal) {
    g_signal.store(signal);
}

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = parseArgs(argc, argv, processEnvironment());
        if (config.help) {
            printUsage(argv[0]);
            return 0;
        }
        if (config.command == Command::NONE) {
            printUsage(argv[0]);
            return 1;
        }
        validate(config);
    } catch (const std::exception& e) {
        LOG_ERROR("Client", "{}", e.what());
        return 1;
    }

    // Configure logging
    auto& logger = utils::Logger::instance();
    logger.setLevel(config.logging.level);
    logger.setColorEnabled(config.logging.color);
    if (!config.logging.file.empty() && !logger.setLogFile(config.logging.file)) {
        LOG_WARN("Client", "Cannot open log file {}; logging to console only", config.logging.file);
    }

    LOG_INFO("Client", "storjcloud-client {} starting (dashboard: {})",
             commandToString(config.command), config.api.url);
    if (!config.configFile.empty()) {
        LOG_INFO("Client", "Using config file {}", config.configFile);
    }

    net::SocketInitializer sockets;

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto root = utils::CancellationToken::create();
    std::atomic<bool> finished{false};

    // Main-side watcher: the handler only stores the signal number
    std::thread watcher([&]() {
        while (!finished.load()) {
            int signal = g_signal.load();
            if (signal != 0) {
                LOG_INFO("Client", "Received signal {}, shutting down...", signal);
                root->cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int exitCode = 0;
    try {
        exitCode = runCommand(config, CommandContext::standard(), *root);
    } catch (const std::exception& e) {
        LOG_ERROR("Client", "{}", e.what());
        exitCode = 1;
    }

    finished.store(true);
    watcher.join();
    return exitCode;
}
