/**
 * @file network_adapter.hpp
 * @brief Enumeration of the host's IPv4 network adapters.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/net/export.hpp"

#include <functional>
#include <string>
#include <vector>

namespace sdcdisco {
namespace net {

/**
 * @struct NetworkAdapter
 * @brief One IPv4 address of one interface.
 */
struct SDCDISCO_NET_API NetworkAdapter {
    std::string friendly_name;  ///< Interface name, e.g. "eth0"
    std::string ip;             ///< Dotted IPv4 address

    bool isLoopback() const { return ip.compare(0, 4, "127.") == 0; }

    bool operator==(const NetworkAdapter& other) const {
        return friendly_name == other.friendly_name && ip == other.ip;
    }
};

/**
 * @brief Source of the current adapter list. Replaceable in tests.
 */
using AdapterProvider = std::function<std::vector<NetworkAdapter>()>;

/**
 * @brief Current IPv4 adapters; 0.0.0.0 entries are skipped.
 *
 * Returns an empty list (and logs) when the OS query fails.
 */
SDCDISCO_NET_API std::vector<NetworkAdapter> getNetworkAdapters();

/**
 * @brief IPv4 addresses of getNetworkAdapters(), without duplicates.
 */
SDCDISCO_NET_API std::vector<std::string> getIpv4Addresses();

}  // namespace net
}  // namespace sdcdisco
