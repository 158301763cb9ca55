/**
 * @file udp_socket.cpp
 * @brief UdpSocket implementation.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/net/udp_socket.hpp"
#include "sdcdisco/utils/logger.hpp"

#include <algorithm>

namespace sdcdisco {
namespace net {

bool parseIpv4(const std::string& text, struct in_addr& out) {
    if (text.empty() || text == "0.0.0.0") {
        out.s_addr = htonl(INADDR_ANY);
        return true;
    }
    return inet_pton(AF_INET, text.c_str(), &out) == 1;
}

std::string formatIpv4(const struct in_addr& addr) {
    char buf[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) {
        return std::string();
    }
    return buf;
}

UdpSocket::UdpSocket()
    : socket_(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP))
    , lastError_(0)
{
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

template<typename T>
bool UdpSocket::setOption(int level, int name, const T& value, const char* label) {
    if (!isValid()) {
        return false;
    }
    if (setsockopt(socket_, level, name,
                   reinterpret_cast<const char*>(&value), sizeof(value)) != 0) {
        setLastError();
        LOG_WARN("UdpSocket", "setsockopt {} failed: error {}", label, lastError_);
        return false;
    }
    return true;
}

bool UdpSocket::bind(uint16_t port, const std::string& address) {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (!parseIpv4(address, addr.sin_addr)) {
        LOG_ERROR("UdpSocket", "Invalid bind address: {}", address);
        return false;
    }

    if (::bind(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_ERROR("UdpSocket", "Failed to bind to {}:{} - error {}", address, port, lastError_);
        return false;
    }

    LOG_DEBUG("UdpSocket", "Bound to {}", getLocalAddress().toString());
    return true;
}

SocketAddress UdpSocket::getLocalAddress() const {
    SocketAddress result("0.0.0.0", 0);
    if (!isValid()) {
        return result;
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);
    if (getsockname(socket_, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) != 0) {
        return result;
    }
    result.ip = formatIpv4(addr.sin_addr);
    result.port = ntohs(addr.sin_port);
    return result;
}

bool UdpSocket::setReuseAddress(bool enable) {
    int optval = enable ? 1 : 0;
    if (!setOption(SOL_SOCKET, SO_REUSEADDR, optval, "SO_REUSEADDR")) {
        return false;
    }
#if defined(SO_REUSEPORT) && !defined(_WIN32)
    if (!setOption(SOL_SOCKET, SO_REUSEPORT, optval, "SO_REUSEPORT")) {
        return false;
    }
#endif
    return true;
}

bool UdpSocket::setMulticastTTL(int ttl) {
    unsigned char ttlVal = static_cast<unsigned char>(ttl);
    return setOption(IPPROTO_IP, IP_MULTICAST_TTL, ttlVal, "IP_MULTICAST_TTL");
}

bool UdpSocket::setMulticastLoopback(bool enable) {
    unsigned char loop = enable ? 1 : 0;
    return setOption(IPPROTO_IP, IP_MULTICAST_LOOP, loop, "IP_MULTICAST_LOOP");
}

bool UdpSocket::setMulticastInterface(const std::string& interfaceAddress) {
    struct in_addr addr{};
    if (!parseIpv4(interfaceAddress, addr)) {
        LOG_ERROR("UdpSocket", "Invalid interface address: {}", interfaceAddress);
        return false;
    }
    return setOption(IPPROTO_IP, IP_MULTICAST_IF, addr, "IP_MULTICAST_IF");
}

bool UdpSocket::joinMulticastGroup(const std::string& groupAddress,
                                   const std::string& interfaceAddress) {
    struct ip_mreq mreq{};
    if (inet_pton(AF_INET, groupAddress.c_str(), &mreq.imr_multiaddr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid multicast group address: {}", groupAddress);
        return false;
    }
    if (!parseIpv4(interfaceAddress, mreq.imr_interface)) {
        LOG_ERROR("UdpSocket", "Invalid interface address: {}", interfaceAddress);
        return false;
    }
    if (!setOption(IPPROTO_IP, IP_ADD_MEMBERSHIP, mreq, "IP_ADD_MEMBERSHIP")) {
        return false;
    }
    LOG_DEBUG("UdpSocket", "Joined multicast group {} on {}", groupAddress,
              interfaceAddress.empty() ? std::string("any") : interfaceAddress);
    return true;
}

int UdpSocket::sendTo(const SocketAddress& dest, const void* data, size_t length) {
    if (!isValid()) {
        return -1;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(dest.port);
    if (inet_pton(AF_INET, dest.ip.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid destination address: {}", dest.ip);
        return -1;
    }

#ifdef _WIN32
    int result = ::sendto(socket_, static_cast<const char*>(data), static_cast<int>(length), 0,
                          reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
#else
    ssize_t result = ::sendto(socket_, data, length, 0,
                              reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
#endif
    if (result < 0) {
        setLastError();
        return -1;
    }
    return static_cast<int>(result);
}

int UdpSocket::receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                           SocketAddress& sender) {
    if (!isValid()) {
        return -1;
    }

    if (timeoutMs >= 0 && waitReadable({socket_}, timeoutMs).empty()) {
        return 0;
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);
#ifdef _WIN32
    int result = ::recvfrom(socket_, static_cast<char*>(buffer), static_cast<int>(bufferSize), 0,
                            reinterpret_cast<struct sockaddr*>(&addr), &addrLen);
#else
    ssize_t result = ::recvfrom(socket_, buffer, bufferSize, 0,
                                reinterpret_cast<struct sockaddr*>(&addr), &addrLen);
#endif
    if (result < 0) {
        setLastError();
        return -1;
    }

    sender.ip = formatIpv4(addr.sin_addr);
    sender.port = ntohs(addr.sin_port);
    return static_cast<int>(result);
}

std::vector<SocketHandle> UdpSocket::waitReadable(const std::vector<SocketHandle>& handles,
                                                  int timeoutMs) {
    std::vector<SocketHandle> ready;
    if (handles.empty()) {
        return ready;
    }

    fd_set readSet;
    FD_ZERO(&readSet);
    SocketHandle maxHandle = handles.front();
    for (SocketHandle h : handles) {
        FD_SET(h, &readSet);
        maxHandle = std::max(maxHandle, h);
    }

    struct timeval tv;
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;

#ifdef _WIN32
    int selectResult = ::select(0, &readSet, nullptr, nullptr, &tv);
#else
    int selectResult = ::select(maxHandle + 1, &readSet, nullptr, nullptr, &tv);
#endif
    if (selectResult <= 0) {
        return ready;
    }
    for (SocketHandle h : handles) {
        if (FD_ISSET(h, &readSet)) {
            ready.push_back(h);
        }
    }
    return ready;
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

}  // namespace net
}  // namespace sdcdisco
