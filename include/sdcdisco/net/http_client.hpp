/**
 * @file http_client.hpp
 * @brief Minimal blocking HTTP/1.1 client for SOAP-over-HTTP requests.
 *
 * One request per connection (Connection: close). HTTPS uses an
 * OpenSSL context supplied by the caller; certificate policy is the
 * caller's business.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/net/export.hpp"
#include "sdcdisco/net/udp_socket.hpp"

#include <openssl/ssl.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sdcdisco {
namespace net {

/**
 * @brief Connection, TLS or protocol failure of an HTTP exchange.
 */
class SDCDISCO_NET_API HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @struct HttpUrl
 * @brief Parsed http(s) URL.
 */
struct SDCDISCO_NET_API HttpUrl {
    std::string scheme;   ///< "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string target;   ///< Path plus query, at least "/"

    /**
     * @throws HttpError for other schemes or a malformed authority.
     */
    static HttpUrl parse(const std::string& url);

    bool isTls() const { return scheme == "https"; }
};

/**
 * @struct HttpResponse
 */
struct SDCDISCO_NET_API HttpResponse {
    int status = 0;
    std::string reason;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /**
     * @brief Case-insensitive header lookup, empty when absent.
     */
    std::string header(const std::string& name) const;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @class HttpClient
 * @brief Sends requests to one fixed URL.
 *
 * Usage:
 * @code
 * HttpClient client("http://proxy.local:8080/discovery");
 * HttpResponse resp = client.post(envelopeXml, "application/soap+xml; charset=utf-8");
 * @endcode
 */
class SDCDISCO_NET_API HttpClient {
public:
    /**
     * @param url Target URL.
     * @param sslContext Required for https URLs, not owned.
     * @param timeoutMs Connect, send and receive timeout.
     * @throws HttpError when the URL is invalid or https lacks a context.
     */
    explicit HttpClient(const std::string& url, SSL_CTX* sslContext = nullptr,
                        int timeoutMs = 5000);

    /**
     * @brief POST a body and read the full response.
     * @throws HttpError on any network, TLS or parse failure.
     */
    HttpResponse post(const std::string& body, const std::string& contentType);

    /**
     * @brief Open a TCP connection to the server and report its local end.
     * @throws HttpError when the server is unreachable.
     */
    SocketAddress probeLocalAddress();

    const HttpUrl& url() const { return url_; }

private:
    HttpUrl url_;
    SSL_CTX* sslContext_;
    int timeoutMs_;
};

}  // namespace net
}  // namespace sdcdisco
