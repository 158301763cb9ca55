/**
 * @file http_client.cpp
 * @brief HttpClient implementation over plain sockets and OpenSSL.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/net/http_client.hpp"
#include "sdcdisco/net/platform.hpp"
#include "sdcdisco/utils/logger.hpp"
#include "sdcdisco/utils/url.hpp"

#include <openssl/err.h>

#include <cstdlib>
#include <cstring>

namespace sdcdisco {
namespace net {

namespace {

#ifdef MSG_NOSIGNAL
constexpr int SEND_FLAGS = MSG_NOSIGNAL;
#else
constexpr int SEND_FLAGS = 0;
#endif

std::string sslErrorString() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown TLS error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

bool setNonBlocking(SocketHandle fd, bool enable) {
#ifdef _WIN32
    u_long mode = enable ? 1 : 0;
    return ioctlsocket(fd, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
#endif
}

void setIoTimeout(SocketHandle fd, int timeoutMs) {
#ifdef _WIN32
    DWORD tv = static_cast<DWORD>(timeoutMs);
#else
    struct timeval tv;
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;
#endif
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&tv), sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, reinterpret_cast<const char*>(&tv), sizeof(tv));
}

/**
 * One TCP (optionally TLS) connection, closed on destruction.
 */
class TcpConnection {
public:
    TcpConnection(const HttpUrl& url, SSL_CTX* sslContext, int timeoutMs)
        : fd_(INVALID_SOCKET_HANDLE)
        , ssl_(nullptr)
    {
        connectTcp(url, timeoutMs);
        if (url.isTls()) {
            try {
                startTls(url, sslContext);
            } catch (const HttpError&) {
                release();
                throw;
            }
        }
    }

    ~TcpConnection() {
        release();
    }

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    void writeAll(const std::string& data) {
        size_t offset = 0;
        while (offset < data.size()) {
            int n;
            if (ssl_ != nullptr) {
                n = SSL_write(ssl_, data.data() + offset, static_cast<int>(data.size() - offset));
                if (n <= 0) {
                    throw HttpError("TLS write failed: " + sslErrorString());
                }
            } else {
                n = static_cast<int>(::send(fd_, data.data() + offset, data.size() - offset, SEND_FLAGS));
                if (n < 0) {
                    throw HttpError("send failed: error " + std::to_string(getLastSocketError()));
                }
            }
            offset += static_cast<size_t>(n);
        }
    }

    /**
     * @return Bytes read, 0 at end of stream.
     */
    size_t readSome(char* buffer, size_t size) {
        if (ssl_ != nullptr) {
            int n = SSL_read(ssl_, buffer, static_cast<int>(size));
            if (n > 0) {
                return static_cast<size_t>(n);
            }
            int err = SSL_get_error(ssl_, n);
            if (err == SSL_ERROR_ZERO_RETURN || err == SSL_ERROR_SYSCALL) {
                return 0;
            }
            throw HttpError("TLS read failed: " + sslErrorString());
        }
        auto n = ::recv(fd_, buffer, size, 0);
        if (n < 0) {
            throw HttpError("recv failed: error " + std::to_string(getLastSocketError()));
        }
        return static_cast<size_t>(n);
    }

    SocketAddress localAddress() const {
        struct sockaddr_in addr{};
        socklen_t len = sizeof(addr);
        if (getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
            throw HttpError("getsockname failed: error " + std::to_string(getLastSocketError()));
        }
        return SocketAddress(formatIpv4(addr.sin_addr), ntohs(addr.sin_port));
    }

private:
    SocketHandle fd_;
    SSL* ssl_;

    void release() {
        if (ssl_ != nullptr) {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
        if (fd_ != INVALID_SOCKET_HANDLE) {
            closeSocket(fd_);
            fd_ = INVALID_SOCKET_HANDLE;
        }
    }

    void connectTcp(const HttpUrl& url, int timeoutMs) {
        struct addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        struct addrinfo* results = nullptr;
        std::string port = std::to_string(url.port);
        int rc = getaddrinfo(url.host.c_str(), port.c_str(), &hints, &results);
        if (rc != 0 || results == nullptr) {
            throw HttpError("cannot resolve " + url.host + ": " + gai_strerror(rc));
        }

        std::string lastError = "no address";
        for (auto* ai = results; ai != nullptr && fd_ == INVALID_SOCKET_HANDLE; ai = ai->ai_next) {
            SocketHandle fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd == INVALID_SOCKET_HANDLE) {
                lastError = "socket() error " + std::to_string(getLastSocketError());
                continue;
            }
            if (connectWithTimeout(fd, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen),
                                   timeoutMs, lastError)) {
                fd_ = fd;
            } else {
                closeSocket(fd);
            }
        }
        freeaddrinfo(results);

        if (fd_ == INVALID_SOCKET_HANDLE) {
            throw HttpError("cannot connect to " + url.host + ":" + port + ": " + lastError);
        }
        setIoTimeout(fd_, timeoutMs);
    }

    static bool connectWithTimeout(SocketHandle fd, const struct sockaddr* addr, socklen_t len,
                                   int timeoutMs, std::string& error) {
        if (!setNonBlocking(fd, true)) {
            error = "cannot switch to non-blocking mode";
            return false;
        }
        if (::connect(fd, addr, len) != 0) {
            int err = getLastSocketError();
#ifdef _WIN32
            bool pending = err == WSAEWOULDBLOCK;
#else
            bool pending = err == EINPROGRESS;
#endif
            if (!pending) {
                error = "connect() error " + std::to_string(err);
                return false;
            }

            fd_set writeSet;
            FD_ZERO(&writeSet);
            FD_SET(fd, &writeSet);
            struct timeval tv;
            tv.tv_sec = timeoutMs / 1000;
            tv.tv_usec = (timeoutMs % 1000) * 1000;
            int sel = ::select(static_cast<int>(fd) + 1, nullptr, &writeSet, nullptr, &tv);
            if (sel <= 0) {
                error = sel == 0 ? "connect timed out" : "select() failed";
                return false;
            }
            int soError = 0;
            socklen_t soLen = sizeof(soError);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&soError), &soLen);
            if (soError != 0) {
                error = "connect() error " + std::to_string(soError);
                return false;
            }
        }
        if (!setNonBlocking(fd, false)) {
            error = "cannot switch to blocking mode";
            return false;
        }
        return true;
    }

    void startTls(const HttpUrl& url, SSL_CTX* sslContext) {
        ssl_ = SSL_new(sslContext);
        if (ssl_ == nullptr) {
            throw HttpError("SSL_new failed: " + sslErrorString());
        }
        SSL_set_fd(ssl_, static_cast<int>(fd_));
        SSL_set_tlsext_host_name(ssl_, url.host.c_str());
        if (SSL_connect(ssl_) != 1) {
            throw HttpError("TLS handshake with " + url.host + " failed: " + sslErrorString());
        }
    }
};

/**
 * Decode a chunked body. Returns false while more input is needed.
 */
bool decodeChunked(const std::string& data, std::string& out) {
    out.clear();
    size_t pos = 0;
    while (true) {
        auto lineEnd = data.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            return false;
        }
        std::string sizeField = data.substr(pos, lineEnd - pos);
        auto semicolon = sizeField.find(';');
        if (semicolon != std::string::npos) {
            sizeField.resize(semicolon);
        }
        char* end = nullptr;
        unsigned long chunkSize = std::strtoul(sizeField.c_str(), &end, 16);
        if (end == sizeField.c_str()) {
            throw HttpError("malformed chunk size '" + sizeField + "'");
        }
        pos = lineEnd + 2;
        if (chunkSize == 0) {
            return true;
        }
        if (data.size() < pos + chunkSize + 2) {
            return false;
        }
        out.append(data, pos, chunkSize);
        pos += chunkSize + 2;
    }
}

HttpResponse readResponse(TcpConnection& conn) {
    std::string raw;
    char buffer[4096];
    size_t headerEnd = std::string::npos;
    bool eof = false;

    while (headerEnd == std::string::npos) {
        size_t n = conn.readSome(buffer, sizeof(buffer));
        if (n == 0) {
            throw HttpError("connection closed before response headers");
        }
        raw.append(buffer, n);
        headerEnd = raw.find("\r\n\r\n");
    }

    HttpResponse response;
    std::string head = raw.substr(0, headerEnd);
    std::string rest = raw.substr(headerEnd + 4);

    auto lineEnd = head.find("\r\n");
    std::string statusLine = head.substr(0, lineEnd);
    if (statusLine.compare(0, 5, "HTTP/") != 0) {
        throw HttpError("malformed status line '" + statusLine + "'");
    }
    auto sp1 = statusLine.find(' ');
    if (sp1 == std::string::npos) {
        throw HttpError("malformed status line '" + statusLine + "'");
    }
    response.status = std::atoi(statusLine.c_str() + sp1 + 1);
    auto sp2 = statusLine.find(' ', sp1 + 1);
    if (sp2 != std::string::npos) {
        response.reason = statusLine.substr(sp2 + 1);
    }

    size_t pos = lineEnd == std::string::npos ? head.size() : lineEnd + 2;
    while (pos < head.size()) {
        auto next = head.find("\r\n", pos);
        std::string line = head.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            std::string value = line.substr(colon + 1);
            auto first = value.find_first_not_of(" \t");
            value = first == std::string::npos ? std::string() : value.substr(first);
            response.headers.emplace_back(line.substr(0, colon), value);
        }
        if (next == std::string::npos) {
            break;
        }
        pos = next + 2;
    }

    bool chunked = utils::toLower(response.header("Transfer-Encoding")).find("chunked") != std::string::npos;
    std::string lengthHeader = response.header("Content-Length");
    size_t contentLength = lengthHeader.empty() ? 0 : std::strtoul(lengthHeader.c_str(), nullptr, 10);

    while (!eof) {
        if (chunked) {
            if (decodeChunked(rest, response.body)) {
                return response;
            }
        } else if (!lengthHeader.empty() && rest.size() >= contentLength) {
            response.body = rest.substr(0, contentLength);
            return response;
        }
        size_t n = conn.readSome(buffer, sizeof(buffer));
        if (n == 0) {
            eof = true;
        } else {
            rest.append(buffer, n);
        }
    }

    if (chunked) {
        throw HttpError("connection closed inside chunked body");
    }
    if (!lengthHeader.empty() && rest.size() < contentLength) {
        throw HttpError("connection closed after " + std::to_string(rest.size()) + " of " +
                        std::to_string(contentLength) + " body bytes");
    }
    response.body = rest;
    return response;
}

}  // namespace

HttpUrl HttpUrl::parse(const std::string& url) {
    utils::UrlParts parts = utils::splitUrl(url);
    HttpUrl result;
    result.scheme = parts.scheme;
    if (result.scheme != "http" && result.scheme != "https") {
        throw HttpError("unsupported URL scheme in '" + url + "'");
    }

    std::string authority = parts.netloc;
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        result.host = authority.substr(0, colon);
        char* end = nullptr;
        unsigned long port = std::strtoul(authority.c_str() + colon + 1, &end, 10);
        if (*end != '\0' || port == 0 || port > 65535) {
            throw HttpError("invalid port in '" + url + "'");
        }
        result.port = static_cast<uint16_t>(port);
    } else {
        result.host = authority;
        result.port = result.isTls() ? 443 : 80;
    }
    if (result.host.empty()) {
        throw HttpError("missing host in '" + url + "'");
    }

    result.target = parts.path.empty() ? "/" : parts.path;
    if (!parts.query.empty()) {
        result.target += "?" + parts.query;
    }
    return result;
}

std::string HttpResponse::header(const std::string& name) const {
    std::string wanted = utils::toLower(name);
    for (const auto& [key, value] : headers) {
        if (utils::toLower(key) == wanted) {
            return value;
        }
    }
    return std::string();
}

HttpClient::HttpClient(const std::string& url, SSL_CTX* sslContext, int timeoutMs)
    : url_(HttpUrl::parse(url))
    , sslContext_(sslContext)
    , timeoutMs_(timeoutMs)
{
    if (url_.isTls() && sslContext_ == nullptr) {
        throw HttpError("https URL '" + url + "' requires an SSL context");
    }
}

HttpResponse HttpClient::post(const std::string& body, const std::string& contentType) {
    TcpConnection conn(url_, sslContext_, timeoutMs_);

    std::string request;
    request.reserve(body.size() + 256);
    request += "POST " + url_.target + " HTTP/1.1\r\n";
    request += "Host: " + url_.host + ":" + std::to_string(url_.port) + "\r\n";
    request += "Content-Type: " + contentType + "\r\n";
    request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    request += "Connection: close\r\n\r\n";
    request += body;

    LOG_DEBUG("HttpClient", "POST {}://{}:{}{} ({} bytes)",
              url_.scheme, url_.host, url_.port, url_.target, body.size());
    conn.writeAll(request);

    HttpResponse response = readResponse(conn);
    LOG_DEBUG("HttpClient", "Response {} {} ({} bytes)",
              response.status, response.reason, response.body.size());
    return response;
}

SocketAddress HttpClient::probeLocalAddress() {
    HttpUrl plain = url_;
    plain.scheme = "http";
    TcpConnection conn(plain, nullptr, timeoutMs_);
    return conn.localAddress();
}

}  // namespace net
}  // namespace sdcdisco
