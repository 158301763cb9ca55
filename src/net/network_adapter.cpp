/**
 * @file network_adapter.cpp
 * @brief Adapter enumeration via getifaddrs / GetAdaptersAddresses.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/net/network_adapter.hpp"
#include "sdcdisco/net/platform.hpp"
#include "sdcdisco/net/udp_socket.hpp"
#include "sdcdisco/utils/logger.hpp"

#include <algorithm>

namespace sdcdisco {
namespace net {

std::vector<NetworkAdapter> getNetworkAdapters() {
    std::vector<NetworkAdapter> adapters;

#ifdef _WIN32
    ULONG bufferSize = 15000;
    std::vector<unsigned char> buffer(bufferSize);
    auto* info = reinterpret_cast<IP_ADAPTER_ADDRESSES*>(buffer.data());
    ULONG rc = GetAdaptersAddresses(AF_INET, GAA_FLAG_SKIP_ANYCAST | GAA_FLAG_SKIP_MULTICAST,
                                    nullptr, info, &bufferSize);
    if (rc == ERROR_BUFFER_OVERFLOW) {
        buffer.resize(bufferSize);
        info = reinterpret_cast<IP_ADAPTER_ADDRESSES*>(buffer.data());
        rc = GetAdaptersAddresses(AF_INET, GAA_FLAG_SKIP_ANYCAST | GAA_FLAG_SKIP_MULTICAST,
                                  nullptr, info, &bufferSize);
    }
    if (rc != NO_ERROR) {
        LOG_ERROR("NetworkAdapter", "GetAdaptersAddresses failed: error {}", rc);
        return adapters;
    }
    for (auto* a = info; a != nullptr; a = a->Next) {
        for (auto* u = a->FirstUnicastAddress; u != nullptr; u = u->Next) {
            auto* sin = reinterpret_cast<sockaddr_in*>(u->Address.lpSockaddr);
            std::string ip = formatIpv4(sin->sin_addr);
            if (!ip.empty() && ip != "0.0.0.0") {
                adapters.push_back(NetworkAdapter{a->AdapterName, ip});
            }
        }
    }
#else
    ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0 || ifaddr == nullptr) {
        LOG_ERROR("NetworkAdapter", "getifaddrs failed: error {}", errno);
        return adapters;
    }
    for (ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
        std::string ip = formatIpv4(sin->sin_addr);
        if (ip.empty() || ip == "0.0.0.0") {
            continue;
        }
        adapters.push_back(NetworkAdapter{ifa->ifa_name ? ifa->ifa_name : "", ip});
    }
    freeifaddrs(ifaddr);
#endif

    return adapters;
}

std::vector<std::string> getIpv4Addresses() {
    std::vector<std::string> result;
    for (const auto& adapter : getNetworkAdapters()) {
        if (std::find(result.begin(), result.end(), adapter.ip) == result.end()) {
            result.push_back(adapter.ip);
        }
    }
    return result;
}

}  // namespace net
}  // namespace sdcdisco
