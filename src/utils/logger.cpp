/**
 * @file logger.cpp
 * @brief Logger file sink and level parsing.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/utils/logger.hpp"
#include "storjcloud/utils/string_utils.hpp"

namespace storjcloud {
namespace utils {

bool parseLogLevel(const std::string& name, LogLevel& level) {
    const std::string lower = to_lower(trim(name));
    if (lower == "trace") {
        level = LogLevel::TRACE;
    } else if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warn" || lower == "warning") {
        level = LogLevel::WARN;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else if (lower == "off") {
        level = LogLevel::OFF;
    } else {
        return false;
    }
    return true;
}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (path.empty()) {
        return true;
    }
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

}  // namespace utils
}  // namespace storjcloud
