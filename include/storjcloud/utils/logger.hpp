/**
 * @file logger.hpp
 * @brief Thread-safe native logging framework for storjcloud-client.
 *
 * Structured log lines with configurable levels, component tags,
 * timestamps and an optional append-mode log file.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace storjcloud {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

/**
 * @brief Convert LogLevel to its fixed-width tag.
 */
inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF  ";
        default:              return "?????";
    }
}

/**
 * @brief Parse a level name (case-insensitive, "warning" accepted).
 * @param name Level name.
 * @param level Output level.
 * @return False if the name is not a known level.
 */
STORJCLOUD_UTILS_API bool parseLogLevel(const std::string& name, LogLevel& level);

/**
 * @class Logger
 * @brief Thread-safe singleton logger with configurable output.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Discovery", "Found node {} on port {}", node_id, port);
 * LOG_ERROR("Dashboard", "Request failed: {}", error_msg);
 * @endcode
 */
class STORJCLOUD_UTILS_API Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable colored output (ANSI terminals).
     * Colors are never written to the log file.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Mirror every log line into a file (append mode).
     * @param path File path; empty closes the current file.
     * @return False if the file could not be opened.
     */
    bool setLogFile(const std::string& path);

    /**
     * @brief Redirect console output (defaults to std::cerr).
     */
    void setConsole(std::ostream* stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_ = stream ? stream : &std::cerr;
    }

    /**
     * @brief Log a message with the given level and component.
     */
    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::string message = formatMessage(format, std::forward<Args>(args)...);
        std::string prefix = timestamp();
        std::string tag = std::string("[") + logLevelToString(level) + "]";
        std::string tail = std::string(" [") + component + "] " + message;

        std::lock_guard<std::mutex> lock(mutex_);
        if (colorEnabled_.load(std::memory_order_relaxed)) {
            *console_ << prefix << getColorCode(level) << tag << "\033[0m" << tail << std::endl;
        } else {
            *console_ << prefix << tag << tail << std::endl;
        }
        if (file_.is_open()) {
            file_ << prefix << tag << tail << std::endl;
        }
    }

private:
    Logger() : level_(static_cast<int>(LogLevel::INFO)), colorEnabled_(true), console_(&std::cerr) {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // [YYYY-MM-DD HH:MM:SS.mmm]
    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif

        std::ostringstream oss;
        oss << "["
            << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << "] ";
        return oss.str();
    }

    std::string formatMessage(const char* format) {
        return std::string(format);
    }

    template<typename T, typename... Args>
    std::string formatMessage(const char* format, T&& value, Args&&... args) {
        std::ostringstream oss;

        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                return oss.str() + formatMessage(format + 2, std::forward<Args>(args)...);
            }
            oss << *format++;
        }

        return oss.str();
    }

    const char* getColorCode(LogLevel level) const {
        switch (level) {
            case LogLevel::TRACE: return "\033[90m";    // Gray
            case LogLevel::DEBUG: return "\033[36m";    // Cyan
            case LogLevel::INFO:  return "\033[32m";    // Green
            case LogLevel::WARN:  return "\033[33m";    // Yellow
            case LogLevel::ERROR: return "\033[31m";    // Red
            default:              return "";
        }
    }

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::ostream* console_;
    std::ofstream file_;
    std::mutex mutex_;
};

}  // namespace utils
}  // namespace storjcloud

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::storjcloud::utils::Logger::instance().log(::storjcloud::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::storjcloud::utils::Logger::instance().log(::storjcloud::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::storjcloud::utils::Logger::instance().log(::storjcloud::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::storjcloud::utils::Logger::instance().log(::storjcloud::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::storjcloud::utils::Logger::instance().log(::storjcloud::utils::LogLevel::ERROR, component, __VA_ARGS__)
