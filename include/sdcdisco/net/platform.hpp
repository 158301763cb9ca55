/**
 * @file platform.hpp
 * @brief Socket handle type and platform includes.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>
    #include <iphlpapi.h>

    #pragma comment(lib, "Ws2_32.lib")
    #pragma comment(lib, "Iphlpapi.lib")

    namespace sdcdisco {
    namespace net {
        using SocketHandle = SOCKET;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;

        inline int getLastSocketError() { return WSAGetLastError(); }
        inline void closeSocket(SocketHandle s) { ::closesocket(s); }

        inline bool initializeSockets() {
            WSADATA wsaData;
            return WSAStartup(MAKEWORD(2, 2), &wsaData) == 0;
        }
        inline void cleanupSockets() { WSACleanup(); }
    }  // namespace net
    }  // namespace sdcdisco

#else
    #include <arpa/inet.h>
    #include <errno.h>
    #include <fcntl.h>
    #include <ifaddrs.h>
    #include <net/if.h>
    #include <netdb.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <unistd.h>

    namespace sdcdisco {
    namespace net {
        using SocketHandle = int;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

        inline int getLastSocketError() { return errno; }
        inline void closeSocket(SocketHandle s) { ::close(s); }

        inline bool initializeSockets() { return true; }
        inline void cleanupSockets() {}
    }  // namespace net
    }  // namespace sdcdisco

#endif

namespace sdcdisco {
namespace net {

/**
 * @brief Keeps the socket subsystem initialised for its lifetime.
 *
 * Create one instance in main(); a no-op on POSIX.
 */
class SocketInitializer {
public:
    SocketInitializer() : initialized_(initializeSockets()) {}
    ~SocketInitializer() { if (initialized_) cleanupSockets(); }

    bool isInitialized() const { return initialized_; }

    SocketInitializer(const SocketInitializer&) = delete;
    SocketInitializer& operator=(const SocketInitializer&) = delete;

private:
    bool initialized_;
};

}  // namespace net
}  // namespace sdcdisco
