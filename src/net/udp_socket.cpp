/**
 * @file udp_socket.cpp
 * @brief Cross-platform UDP socket implementation.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/net/udp_socket.hpp"
#include "storjcloud/utils/logger.hpp"

namespace storjcloud {
namespace net {

UdpSocket::UdpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
{
    socket_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        LOG_ERROR("UdpSocket", "Failed to create socket: error {}", lastError_);
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool UdpSocket::connect(const SocketAddress& peer) {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(peer.port);

    if (inet_pton(AF_INET, peer.ip.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid peer address: {}", peer.ip);
        return false;
    }

    if (::connect(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_DEBUG("UdpSocket", "connect({}) failed: error {}", peer.toString(), lastError_);
        return false;
    }
    return true;
}

std::optional<SocketAddress> UdpSocket::localAddress() const {
    if (!isValid()) {
        return std::nullopt;
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);

    if (getsockname(socket_, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) != 0) {
        return std::nullopt;
    }

    char ipStr[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr.sin_addr, ipStr, sizeof(ipStr)) == nullptr) {
        return std::nullopt;
    }
    return SocketAddress(ipStr, ntohs(addr.sin_port));
}

void UdpSocket::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

void UdpSocket::setLastError() {
    lastError_ = getLastSocketError();
}

std::optional<std::string> detectLocalAddress(const SocketAddress& probe) {
    UdpSocket sock;
    if (!sock.isValid() || !sock.connect(probe)) {
        return std::nullopt;
    }

    auto local = sock.localAddress();
    if (!local || local->ip == "0.0.0.0") {
        return std::nullopt;
    }
    return local->ip;
}

}  // namespace net
}  // namespace storjcloud
