/**
 * @file errors.hpp
 * @brief Session-level error types.
 *
 * These are thrown only for failures that end a command: bad
 * configuration, a broken environment, a rejected token, or a dashboard
 * that cannot be reached at all. Per-node failures are reported through
 * result structs instead.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include <stdexcept>
#include <string>

namespace storjcloud {
namespace core {

/// Invalid flags, missing token, empty candidate set.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

/// Host cannot be resolved, local address cannot be detected.
class EnvironmentError : public std::runtime_error {
public:
    explicit EnvironmentError(const std::string& what) : std::runtime_error(what) {}
};

/// The dashboard rejected the API token (HTTP 401).
class AuthenticationError : public std::runtime_error {
public:
    explicit AuthenticationError(const std::string& what) : std::runtime_error(what) {}
};

/// The dashboard could not be reached for a whole pass.
class DashboardUnavailableError : public std::runtime_error {
public:
    explicit DashboardUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace core
}  // namespace storjcloud
