/**
 * @file udp_socket.hpp
 * @brief RAII UDP socket used for outbound-interface detection.
 *
 * Connecting a datagram socket sends no packets; it only makes the kernel
 * pick a route, which reveals the local address of the outbound interface.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/net/address.hpp"
#include "storjcloud/net/export.hpp"
#include "storjcloud/net/platform.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace storjcloud {
namespace net {

/**
 * @class UdpSocket
 * @brief RAII UDP socket wrapper.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * if (sock.connect(SocketAddress("8.8.8.8", 80))) {
 *     auto local = sock.localAddress();
 * }
 * @endcode
 */
class STORJCLOUD_NET_API UdpSocket {
public:
    /**
     * @brief Create an unbound UDP socket.
     */
    UdpSocket();

    /**
     * @brief Destructor - closes the socket.
     */
    ~UdpSocket();

    // Non-copyable, but movable
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Set the default peer. No datagram is sent.
     */
    bool connect(const SocketAddress& peer);

    /**
     * @brief Local address chosen by the kernel after connect().
     */
    std::optional<SocketAddress> localAddress() const;

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    void setLastError();
};

/**
 * @brief Detect the address of the interface used to reach a public host.
 * @param probe Destination used only for route selection.
 * @return Dotted-quad address, or nullopt when there is no route.
 */
STORJCLOUD_NET_API std::optional<std::string> detectLocalAddress(
    const SocketAddress& probe = SocketAddress("8.8.8.8", 80));

}  // namespace net
}  // namespace storjcloud
