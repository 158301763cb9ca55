/**
 * @file service.hpp
 * @brief A discoverable service, local or remote.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/wsd/export.hpp"
#include "sdcdisco/wsd/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sdcdisco {
namespace wsd {

/// Placeholder in a local x-addr, replaced by each local IPv4 address
constexpr const char* IP_PLACEHOLDER = "{ip}";

/**
 * @struct Service
 * @brief Registry entry keyed by its endpoint reference.
 */
struct SDCDISCO_WSD_API Service {
    std::string epr;
    std::vector<QName> types;
    std::vector<Scope> scopes;
    std::vector<std::string> x_addrs;
    uint32_t instance_id = 0;
    uint32_t message_number = 0;
    uint32_t metadata_version = 1;

    Service() = default;
    Service(std::string epr_, std::vector<QName> types_, std::vector<Scope> scopes_,
            std::vector<std::string> xAddrs, uint32_t instanceId, uint32_t metadataVersion = 1);

    /**
     * @brief Service data as carried by a ProbeMatch/ResolveMatch entry.
     */
    static Service fromMatch(const ProbeResolveMatch& match);

    /**
     * @brief x_addrs with every "{ip}" entry expanded once per address.
     *
     * Entries without the placeholder are returned unchanged.
     */
    std::vector<std::string> resolvedXAddrs(const std::vector<std::string>& localAddresses) const;

    /**
     * @brief True when the host of one of the x-addrs is in `addresses`.
     */
    bool isLocatedOn(const std::vector<std::string>& addresses) const;

    bool operator==(const Service& other) const;
};

}  // namespace wsd
}  // namespace sdcdisco
