/**
 * @file address.cpp
 * @brief Host name resolution via getaddrinfo.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/net/address.hpp"
#include "storjcloud/net/platform.hpp"
#include "storjcloud/utils/logger.hpp"

#include <memory>

namespace storjcloud {
namespace net {

std::optional<std::string> resolveIPv4(const std::string& host) {
    if (host.empty()) {
        return std::nullopt;
    }

    struct in_addr literal{};
    if (inet_pton(AF_INET, host.c_str(), &literal) == 1) {
        return host;
    }

    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* raw = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &raw);
    if (rc != 0 || raw == nullptr) {
        LOG_DEBUG("Resolver", "getaddrinfo({}) failed: {}", host, gai_strerror(rc));
        return std::nullopt;
    }
    std::unique_ptr<struct addrinfo, decltype(&::freeaddrinfo)> result(raw, &::freeaddrinfo);

    auto* addr = reinterpret_cast<struct sockaddr_in*>(result->ai_addr);
    char ipStr[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr->sin_addr, ipStr, sizeof(ipStr)) == nullptr) {
        return std::nullopt;
    }
    return std::string(ipStr);
}

}  // namespace net
}  // namespace storjcloud
