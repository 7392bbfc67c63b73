/**
 * @file tcp_socket.cpp
 * @brief Non-blocking connect with poll()-based timeout.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/net/tcp_socket.hpp"
#include "storjcloud/utils/logger.hpp"

#include <algorithm>

namespace storjcloud {
namespace net {

namespace {

constexpr std::chrono::milliseconds kPollSlice(100);

}  // namespace

const char* connectStatusToString(ConnectStatus status) {
    switch (status) {
        case ConnectStatus::CONNECTED:      return "connected";
        case ConnectStatus::REFUSED:        return "connection refused";
        case ConnectStatus::TIMED_OUT:      return "connection timed out";
        case ConnectStatus::UNREACHABLE:    return "host unreachable";
        case ConnectStatus::CANCELLED:      return "cancelled";
        case ConnectStatus::SOCKET_FAILURE: return "socket error";
        default:                            return "unknown";
    }
}

TcpSocket::TcpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
{
    socket_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        lastError_ = getLastSocketError();
        LOG_ERROR("TcpSocket", "Failed to create socket: error {}", lastError_);
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

ConnectStatus TcpSocket::classify(int error) {
    lastError_ = error;
#ifdef _WIN32
    switch (error) {
        case WSAECONNREFUSED: return ConnectStatus::REFUSED;
        case WSAETIMEDOUT:    return ConnectStatus::TIMED_OUT;
        case WSAEHOSTUNREACH:
        case WSAENETUNREACH:  return ConnectStatus::UNREACHABLE;
        default:              return ConnectStatus::SOCKET_FAILURE;
    }
#else
    switch (error) {
        case ECONNREFUSED: return ConnectStatus::REFUSED;
        case ETIMEDOUT:    return ConnectStatus::TIMED_OUT;
        case EHOSTUNREACH:
        case ENETUNREACH:  return ConnectStatus::UNREACHABLE;
        default:           return ConnectStatus::SOCKET_FAILURE;
    }
#endif
}

ConnectStatus TcpSocket::connect(const SocketAddress& peer,
                                 std::chrono::milliseconds timeout,
                                 const utils::CancellationToken* cancel) {
    if (!isValid()) {
        return ConnectStatus::SOCKET_FAILURE;
    }
    if (utils::isCancelled(cancel)) {
        return ConnectStatus::CANCELLED;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(peer.port);
    if (inet_pton(AF_INET, peer.ip.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("TcpSocket", "Invalid peer address: {}", peer.ip);
        return ConnectStatus::SOCKET_FAILURE;
    }

    if (!setNonBlocking(socket_, true)) {
        lastError_ = getLastSocketError();
        return ConnectStatus::SOCKET_FAILURE;
    }

    int rc = ::connect(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (rc == 0) {
        return ConnectStatus::CONNECTED;
    }

    int error = getLastSocketError();
    if (!isConnectInProgress(error)) {
        return classify(error);
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (utils::isCancelled(cancel)) {
            return ConnectStatus::CANCELLED;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            lastError_ = 0;
            return ConnectStatus::TIMED_OUT;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto slice = std::min(remaining, kPollSlice);

        int pollResult = pollWritable(socket_, static_cast<int>(slice.count()));
        if (pollResult < 0) {
            error = getLastSocketError();
            if (isInterrupted(error)) {
                continue;
            }
            return classify(error);
        }
        if (pollResult == 0) {
            continue;
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
#ifdef _WIN32
        getsockopt(socket_, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&soError), &len);
#else
        getsockopt(socket_, SOL_SOCKET, SO_ERROR, &soError, &len);
#endif
        if (soError == 0) {
            return ConnectStatus::CONNECTED;
        }
        return classify(soError);
    }
}

void TcpSocket::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

ConnectStatus SocketConnector::probe(const SocketAddress& peer,
                                     std::chrono::milliseconds timeout,
                                     const utils::CancellationToken* cancel) {
    TcpSocket sock;
    ConnectStatus status = sock.connect(peer, timeout, cancel);
    LOG_TRACE("TcpSocket", "probe {} -> {}", peer.toString(), connectStatusToString(status));
    return status;
}

}  // namespace net
}  // namespace storjcloud
