/**
 * @file service.cpp
 * @brief Service helpers.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/wsd/service.hpp"
#include "sdcdisco/utils/url.hpp"

#include <algorithm>

namespace sdcdisco {
namespace wsd {

Service::Service(std::string epr_, std::vector<QName> types_, std::vector<Scope> scopes_,
                 std::vector<std::string> xAddrs, uint32_t instanceId, uint32_t metadataVersion)
    : epr(std::move(epr_))
    , types(std::move(types_))
    , scopes(std::move(scopes_))
    , x_addrs(std::move(xAddrs))
    , instance_id(instanceId)
    , message_number(0)
    , metadata_version(metadataVersion)
{}

Service Service::fromMatch(const ProbeResolveMatch& match) {
    return Service(match.epr, match.types, match.scopes, match.x_addrs, 0, match.metadata_version);
}

std::vector<std::string> Service::resolvedXAddrs(const std::vector<std::string>& localAddresses) const {
    const std::string placeholder = IP_PLACEHOLDER;
    std::vector<std::string> result;
    for (const auto& addr : x_addrs) {
        auto pos = addr.find(placeholder);
        if (pos == std::string::npos) {
            result.push_back(addr);
            continue;
        }
        for (const auto& ip : localAddresses) {
            if (ip == "0.0.0.0") {
                continue;
            }
            std::string expanded = addr;
            expanded.replace(pos, placeholder.size(), ip);
            result.push_back(expanded);
        }
    }
    return result;
}

bool Service::isLocatedOn(const std::vector<std::string>& addresses) const {
    for (const auto& addr : x_addrs) {
        std::string host = utils::splitUrl(addr).netloc;
        auto at = host.rfind('@');
        if (at != std::string::npos) {
            host = host.substr(at + 1);
        }
        auto colon = host.rfind(':');
        if (colon != std::string::npos) {
            host.resize(colon);
        }
        host = utils::toLower(host);
        if (std::find(addresses.begin(), addresses.end(), host) != addresses.end()) {
            return true;
        }
    }
    return false;
}

bool Service::operator==(const Service& other) const {
    return epr == other.epr && types == other.types && scopes == other.scopes &&
           x_addrs == other.x_addrs && instance_id == other.instance_id &&
           metadata_version == other.metadata_version;
}

}  // namespace wsd
}  // namespace sdcdisco
