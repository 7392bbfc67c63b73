/**
 * @file string_utils.hpp
 * @brief String helpers shared by configuration and discovery.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace storjcloud {
namespace utils {

inline std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

inline std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

/**
 * @brief Split string by delimiter, dropping empty tokens.
 */
inline std::vector<std::string> split(const std::string& str, char delimiter = ' ') {
    std::vector<std::string> tokens;
    std::istringstream stream(str);
    std::string token;
    while (std::getline(stream, token, delimiter)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

inline bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

inline bool contains(const std::string& str, const std::string& needle) {
    return str.find(needle) != std::string::npos;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& delimiter = " ") {
    if (parts.empty()) return "";
    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        result += delimiter + parts[i];
    }
    return result;
}

/**
 * @brief Parse a TCP port (1-65535). Rejects signs, spaces and trailing text.
 */
inline bool parse_port(const std::string& text, uint16_t& port) {
    if (text.empty() || text.size() > 5) return false;
    unsigned long value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value == 0 || value > 65535) return false;
    port = static_cast<uint16_t>(value);
    return true;
}

/**
 * @brief Format bytes as gigabytes with two decimals ("5.00").
 */
inline std::string format_gb(double bytes) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", bytes / 1e9);
    return buffer;
}

/**
 * @brief Shorten an identifier for log lines (first n characters).
 */
inline std::string short_id(const std::string& id, size_t n = 8) {
    return id.size() <= n ? id : id.substr(0, n);
}

}  // namespace utils
}  // namespace storjcloud
