/**
 * @file address.hpp
 * @brief IPv4 endpoint type and host name resolution.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/net/export.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace storjcloud {
namespace net {

/**
 * @struct SocketAddress
 * @brief IP address and port pair.
 */
struct STORJCLOUD_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @brief Resolve a host name or dotted quad to an IPv4 address string.
 * @return The first IPv4 address, or nullopt if the name does not resolve.
 */
STORJCLOUD_NET_API std::optional<std::string> resolveIPv4(const std::string& host);

}  // namespace net
}  // namespace storjcloud
