/**
 * @file udp_socket.hpp
 * @brief IPv4 UDP socket with the multicast options WS-Discovery needs.
 *
 * RAII wrapper: one instance owns one datagram socket. Configuration
 * calls return false on failure and keep the OS error code in
 * getLastError().
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/net/export.hpp"
#include "sdcdisco/net/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sdcdisco {
namespace net {

/**
 * @struct SocketAddress
 * @brief IPv4 address and port pair.
 */
struct SDCDISCO_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
    bool operator!=(const SocketAddress& other) const { return !(*this == other); }
};

/**
 * @class UdpSocket
 * @brief RAII IPv4 datagram socket.
 *
 * Usage:
 * @code
 * UdpSocket in;
 * in.setReuseAddress(true);
 * in.bind(3702, "239.255.255.250");
 * in.joinMulticastGroup("239.255.255.250", "192.168.1.20");
 *
 * UdpSocket out;
 * out.bind(0, "192.168.1.20");
 * out.setMulticastInterface("192.168.1.20");
 * out.sendTo(SocketAddress("239.255.255.250", 3702), data.data(), data.size());
 * @endcode
 */
class SDCDISCO_NET_API UdpSocket {
public:
    UdpSocket();
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }
    SocketHandle handle() const { return socket_; }

    /**
     * @brief Bind to a local address and port.
     * @param port Port, 0 lets the OS choose.
     * @param address Local IPv4 address, or a multicast group on POSIX.
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Address the socket is bound to (port 0 when unbound).
     */
    SocketAddress getLocalAddress() const;

    uint16_t getLocalPort() const { return getLocalAddress().port; }

    /**
     * @brief SO_REUSEADDR, plus SO_REUSEPORT where available. Call before bind().
     */
    bool setReuseAddress(bool enable);

    bool setMulticastTTL(int ttl);
    bool setMulticastLoopback(bool enable);

    /**
     * @brief Choose the interface used for outgoing multicast.
     */
    bool setMulticastInterface(const std::string& interfaceAddress);

    /**
     * @brief IP_ADD_MEMBERSHIP on the given interface (empty = any).
     */
    bool joinMulticastGroup(const std::string& groupAddress,
                            const std::string& interfaceAddress = "");

    /**
     * @brief Send one datagram.
     * @return Bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Receive one datagram.
     * @param timeoutMs 0 = poll, -1 = block.
     * @return Bytes received, 0 on timeout, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    /**
     * @brief Wait until at least one of the handles is readable.
     * @return The readable handles; empty on timeout or error.
     */
    static std::vector<SocketHandle> waitReadable(const std::vector<SocketHandle>& handles,
                                                  int timeoutMs);

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    template<typename T>
    bool setOption(int level, int name, const T& value, const char* label);

    void setLastError();
};

/**
 * @brief Parse a dotted IPv4 address.
 */
SDCDISCO_NET_API bool parseIpv4(const std::string& text, struct in_addr& out);

/**
 * @brief Format an IPv4 address as dotted text.
 */
SDCDISCO_NET_API std::string formatIpv4(const struct in_addr& addr);

}  // namespace net
}  // namespace sdcdisco
