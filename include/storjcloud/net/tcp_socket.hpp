/**
 * @file tcp_socket.hpp
 * @brief RAII TCP socket with a bounded, cancellable connect.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/net/address.hpp"
#include "storjcloud/net/export.hpp"
#include "storjcloud/net/platform.hpp"
#include "storjcloud/utils/cancellation.hpp"

#include <chrono>

namespace storjcloud {
namespace net {

/**
 * @brief Outcome of a connection attempt.
 */
enum class ConnectStatus {
    CONNECTED,
    REFUSED,        ///< Nothing listening (RST)
    TIMED_OUT,      ///< No answer within the timeout
    UNREACHABLE,    ///< No route to host/network
    CANCELLED,      ///< Cancellation observed while waiting
    SOCKET_FAILURE  ///< Local socket error
};

STORJCLOUD_NET_API const char* connectStatusToString(ConnectStatus status);

/**
 * @class TcpSocket
 * @brief Owns one TCP socket handle; the handle is closed on every exit path.
 */
class STORJCLOUD_NET_API TcpSocket {
public:
    TcpSocket();
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Connect with a hard timeout.
     *
     * The wait is sliced into 100 ms poll() calls and the token is
     * checked between slices, so cancellation is observed within one slice.
     */
    ConnectStatus connect(const SocketAddress& peer,
                          std::chrono::milliseconds timeout,
                          const utils::CancellationToken* cancel = nullptr);

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    ConnectStatus classify(int error);
};

/**
 * @class TcpConnector
 * @brief Connection probe seam; tests substitute scripted outcomes.
 */
class STORJCLOUD_NET_API TcpConnector {
public:
    virtual ~TcpConnector() = default;

    /**
     * @brief Check that something accepts connections at the address.
     * The connection is closed before returning.
     */
    virtual ConnectStatus probe(const SocketAddress& peer,
                                std::chrono::milliseconds timeout,
                                const utils::CancellationToken* cancel) = 0;
};

/**
 * @class SocketConnector
 * @brief TcpConnector backed by a real TcpSocket.
 */
class STORJCLOUD_NET_API SocketConnector : public TcpConnector {
public:
    ConnectStatus probe(const SocketAddress& peer,
                        std::chrono::milliseconds timeout,
                        const utils::CancellationToken* cancel) override;
};

}  // namespace net
}  // namespace storjcloud
