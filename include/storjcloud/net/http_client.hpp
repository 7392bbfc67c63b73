/**
 * @file http_client.hpp
 * @brief Minimal blocking HTTP client interface and its Boost.Beast backend.
 *
 * One request per call, no connection reuse across calls. Every call is
 * bounded by the request timeout and aborts early when the cancellation
 * token fires.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/net/export.hpp"
#include "storjcloud/utils/cancellation.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace boost {
namespace asio {
namespace ssl {
class context;
}  // namespace ssl
}  // namespace asio
}  // namespace boost

namespace storjcloud {
namespace net {

/**
 * @brief Why a request produced no HTTP status.
 */
enum class TransportError {
    NONE,
    CONNECT_FAILED,    ///< Resolve or connect failure
    TIMED_OUT,
    CANCELLED,
    INVALID_REQUEST,   ///< Malformed URL or unsupported scheme
    OTHER
};

STORJCLOUD_NET_API const char* transportErrorToString(TransportError error);

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
    std::string unix_socket;   ///< Route the request over a unix domain socket

    static HttpRequest get(const std::string& url) {
        HttpRequest req;
        req.url = url;
        return req;
    }

    HttpRequest& header(const std::string& name, const std::string& value) {
        headers.emplace_back(name, value);
        return *this;
    }
};

struct HttpResponse {
    long status = 0;
    std::string body;
    TransportError error = TransportError::NONE;
    std::string error_message;

    /// A status line was received (any code).
    bool delivered() const { return error == TransportError::NONE; }

    /// A 2xx status was received.
    bool ok() const { return delivered() && status >= 200 && status < 300; }
};

/**
 * @class HttpClient
 * @brief Transport seam shared by the node, dashboard and Docker clients.
 */
class STORJCLOUD_NET_API HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Perform one request. Never throws for transport failures;
     *        they are reported through HttpResponse::error.
     */
    virtual HttpResponse send(const HttpRequest& request,
                              const utils::CancellationToken* cancel = nullptr) = 0;
};

/**
 * @class BeastHttpClient
 * @brief HttpClient on Boost.Beast over Boost.Asio (http, https, unix sockets).
 *
 * Thread-safe: each call runs on its own io_context. HTTPS verifies the
 * peer against the system trust store.
 */
class STORJCLOUD_NET_API BeastHttpClient : public HttpClient {
public:
    explicit BeastHttpClient(std::string userAgent = "storjcloud-client");
    ~BeastHttpClient() override;

    BeastHttpClient(const BeastHttpClient&) = delete;
    BeastHttpClient& operator=(const BeastHttpClient&) = delete;

    HttpResponse send(const HttpRequest& request,
                      const utils::CancellationToken* cancel = nullptr) override;

private:
    std::string userAgent_;
    std::unique_ptr<boost::asio::ssl::context> tls_;
};

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;   ///< Path and query, at least "/"
};

/**
 * @brief Split an http(s) URL into its parts; the port defaults per scheme.
 * @return False if the scheme is not http/https or the host is missing.
 */
STORJCLOUD_NET_API bool parseUrl(const std::string& url, UrlParts& parts);

}  // namespace net
}  // namespace storjcloud
