/**
 * @file http_client.cpp
 * @brief Boost.Beast-backed HttpClient.
 *
 * Each request runs an asynchronous resolve/connect/handshake/write/read
 * chain on a private io_context, driven in short slices so that the
 * deadline and the cancellation token are checked between slices. An
 * interrupted request closes its socket; nothing outlives send().
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/net/http_client.hpp"
#include "storjcloud/utils/logger.hpp"
#include "storjcloud/utils/string_utils.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include <algorithm>

namespace storjcloud {
namespace net {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;
using local = boost::asio::local::stream_protocol;

namespace {

constexpr std::chrono::milliseconds kPollSlice{100};

/**
 * @brief State of one request/response exchange.
 */
struct Exchange {
    http::request<http::string_body> request;
    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    bool done = false;
    TransportError failure = TransportError::NONE;
    std::string message;

    void fail(TransportError kind, const std::string& stage, const beast::error_code& ec) {
        if (done) return;
        done = true;
        failure = kind;
        message = stage + ": " + ec.message();
    }

    void complete() { done = true; }
};

template <typename Stream>
void writeAndRead(Stream& stream, Exchange& ex) {
    http::async_write(stream, ex.request,
        [&stream, &ex](const beast::error_code& ec, std::size_t) {
            if (ec) {
                ex.fail(TransportError::OTHER, "write", ec);
                return;
            }
            http::async_read(stream, ex.buffer, ex.response,
                [&ex](const beast::error_code& ec, std::size_t) {
                    if (ec) {
                        ex.fail(TransportError::OTHER, "read", ec);
                        return;
                    }
                    ex.complete();
                });
        });
}

/**
 * @brief Run the io_context until the exchange completes, the deadline
 * passes or the token is cancelled. abort() closes the transport.
 */
template <typename Abort>
void drive(asio::io_context& io, Exchange& ex,
           std::chrono::steady_clock::time_point deadline,
           const utils::CancellationToken* cancel, Abort abort) {
    while (!ex.done) {
        io.run_for(kPollSlice);
        if (ex.done) {
            return;
        }
        if (io.stopped()) {
            ex.failure = TransportError::OTHER;
            ex.message = "request did not complete";
            ex.done = true;
            return;
        }
        if (utils::isCancelled(cancel)) {
            abort();
            ex.failure = TransportError::CANCELLED;
            ex.message = "cancelled";
            ex.done = true;
            return;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            abort();
            ex.failure = TransportError::TIMED_OUT;
            ex.message = "timed out";
            ex.done = true;
            return;
        }
    }
}

void runPlain(const UrlParts& url, Exchange& ex,
              std::chrono::steady_clock::time_point deadline,
              const utils::CancellationToken* cancel) {
    asio::io_context io;
    tcp::resolver resolver(io);
    tcp::socket socket(io);

    resolver.async_resolve(url.host, url.port,
        [&](const beast::error_code& ec, tcp::resolver::results_type results) {
            if (ec) {
                ex.fail(TransportError::CONNECT_FAILED, "resolve", ec);
                return;
            }
            asio::async_connect(socket, results,
                [&](const beast::error_code& ec, const tcp::endpoint&) {
                    if (ec) {
                        ex.fail(TransportError::CONNECT_FAILED, "connect", ec);
                        return;
                    }
                    writeAndRead(socket, ex);
                });
        });

    drive(io, ex, deadline, cancel, [&]() {
        beast::error_code ignored;
        resolver.cancel();
        socket.close(ignored);
    });
}

void runTls(const UrlParts& url, ssl::context& tls, Exchange& ex,
            std::chrono::steady_clock::time_point deadline,
            const utils::CancellationToken* cancel) {
    asio::io_context io;
    tcp::resolver resolver(io);
    ssl::stream<tcp::socket> stream(io, tls);

    // SNI
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        ex.failure = TransportError::OTHER;
        ex.message = "unable to set TLS server name";
        ex.done = true;
        return;
    }
    stream.set_verify_mode(ssl::verify_peer);
    stream.set_verify_callback(ssl::host_name_verification(url.host));

    resolver.async_resolve(url.host, url.port,
        [&](const beast::error_code& ec, tcp::resolver::results_type results) {
            if (ec) {
                ex.fail(TransportError::CONNECT_FAILED, "resolve", ec);
                return;
            }
            asio::async_connect(stream.next_layer(), results,
                [&](const beast::error_code& ec, const tcp::endpoint&) {
                    if (ec) {
                        ex.fail(TransportError::CONNECT_FAILED, "connect", ec);
                        return;
                    }
                    stream.async_handshake(ssl::stream_base::client,
                        [&](const beast::error_code& ec) {
                            if (ec) {
                                ex.fail(TransportError::OTHER, "TLS handshake", ec);
                                return;
                            }
                            writeAndRead(stream, ex);
                        });
                });
        });

    drive(io, ex, deadline, cancel, [&]() {
        beast::error_code ignored;
        resolver.cancel();
        stream.next_layer().close(ignored);
    });
}

void runUnix(const std::string& path, Exchange& ex,
             std::chrono::steady_clock::time_point deadline,
             const utils::CancellationToken* cancel) {
    asio::io_context io;
    local::socket socket(io);

    socket.async_connect(local::endpoint(path),
        [&](const beast::error_code& ec) {
            if (ec) {
                ex.fail(TransportError::CONNECT_FAILED, "connect " + path, ec);
                return;
            }
            writeAndRead(socket, ex);
        });

    drive(io, ex, deadline, cancel, [&]() {
        beast::error_code ignored;
        socket.close(ignored);
    });
}

}  // namespace

const char* transportErrorToString(TransportError error) {
    switch (error) {
        case TransportError::NONE:            return "none";
        case TransportError::CONNECT_FAILED:  return "connection failed";
        case TransportError::TIMED_OUT:       return "timed out";
        case TransportError::CANCELLED:       return "cancelled";
        case TransportError::INVALID_REQUEST: return "invalid request";
        case TransportError::OTHER:           return "transport error";
        default:                              return "unknown";
    }
}

bool parseUrl(const std::string& url, UrlParts& parts) {
    const size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return false;
    }
    parts.scheme = utils::to_lower(url.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https") {
        return false;
    }

    const size_t authorityStart = schemeEnd + 3;
    const size_t pathStart = url.find_first_of("/?", authorityStart);
    const std::string authority = url.substr(authorityStart,
        pathStart == std::string::npos ? std::string::npos : pathStart - authorityStart);
    parts.target = pathStart == std::string::npos ? "/" : url.substr(pathStart);
    if (parts.target[0] == '?') {
        parts.target = "/" + parts.target;
    }

    const size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        uint16_t port = 0;
        if (!utils::parse_port(parts.port, port)) {
            return false;
        }
    } else {
        parts.host = authority;
        parts.port = parts.scheme == "https" ? "443" : "80";
    }
    if (parts.host.size() > 2 && parts.host.front() == '[' && parts.host.back() == ']') {
        parts.host = parts.host.substr(1, parts.host.size() - 2);
    }
    return !parts.host.empty();
}

BeastHttpClient::BeastHttpClient(std::string userAgent)
    : userAgent_(std::move(userAgent))
    , tls_(std::make_unique<ssl::context>(ssl::context::tls_client))
{
    beast::error_code ec;
    tls_->set_default_verify_paths(ec);
    if (ec) {
        LOG_WARN("HttpClient", "Unable to load system CA certificates: {}", ec.message());
    }
}

BeastHttpClient::~BeastHttpClient() = default;

HttpResponse BeastHttpClient::send(const HttpRequest& request,
                                   const utils::CancellationToken* cancel) {
    HttpResponse response;

    if (utils::isCancelled(cancel)) {
        response.error = TransportError::CANCELLED;
        response.error_message = "cancelled before request";
        return response;
    }

    UrlParts url;
    const http::verb verb = http::string_to_verb(request.method);
    if (!parseUrl(request.url, url) || verb == http::verb::unknown) {
        response.error = TransportError::INVALID_REQUEST;
        response.error_message = "unsupported request: " + request.method + " " + request.url;
        return response;
    }

    Exchange ex;
    ex.request.version(11);
    ex.request.method(verb);
    ex.request.target(url.target);
    const bool defaultPort = (url.scheme == "http" && url.port == "80") ||
                             (url.scheme == "https" && url.port == "443");
    ex.request.set(http::field::host, defaultPort ? url.host : url.host + ":" + url.port);
    ex.request.set(http::field::user_agent, userAgent_);
    ex.request.set(http::field::connection, "close");
    for (const auto& [name, value] : request.headers) {
        ex.request.set(name, value);
    }
    if (ex.request.find(http::field::accept) == ex.request.end()) {
        ex.request.set(http::field::accept, "application/json");
    }
    if (!request.body.empty() &&
        ex.request.find(http::field::content_type) == ex.request.end()) {
        ex.request.set(http::field::content_type, "application/json");
    }
    ex.request.body() = request.body;
    ex.request.prepare_payload();

    const auto deadline = std::chrono::steady_clock::now() +
                          std::max(request.timeout, std::chrono::milliseconds(1));

    if (!request.unix_socket.empty()) {
        runUnix(request.unix_socket, ex, deadline, cancel);
    } else if (url.scheme == "https") {
        runTls(url, *tls_, ex, deadline, cancel);
    } else {
        runPlain(url, ex, deadline, cancel);
    }

    if (ex.failure != TransportError::NONE) {
        response.error = ex.failure;
        response.error_message = ex.message;
        LOG_DEBUG("HttpClient", "{} {} failed: {}", request.method, request.url, response.error_message);
        return response;
    }

    response.status = static_cast<long>(ex.response.result_int());
    response.body = std::move(ex.response.body());
    LOG_TRACE("HttpClient", "{} {} -> {}", request.method, request.url, response.status);
    return response;
}

}  // namespace net
}  // namespace storjcloud
