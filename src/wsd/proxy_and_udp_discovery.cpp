/**
 * @file proxy_and_udp_discovery.cpp
 * @brief ProxyAndUdpDiscovery implementation.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/wsd/proxy_and_udp_discovery.hpp"
#include "sdcdisco/utils/logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace sdcdisco {
namespace wsd {

namespace {

// later results replace earlier ones with the same epr
void mergeByEpr(std::vector<Service>& into, std::vector<Service> more) {
    for (auto& service : more) {
        auto it = std::find_if(into.begin(), into.end(),
                               [&](const Service& s) { return s.epr == service.epr; });
        if (it != into.end()) {
            *it = std::move(service);
        } else {
            into.push_back(std::move(service));
        }
    }
}

}  // namespace

ProxyAndUdpDiscovery::ProxyAndUdpDiscovery(std::shared_ptr<Discovery> proxy, std::shared_ptr<Discovery> udp)
    : proxy_(std::move(proxy))
    , udp_(std::move(udp))
{
    if (!proxy_ || !udp_) {
        throw std::invalid_argument("ProxyAndUdpDiscovery needs both engines");
    }
}

void ProxyAndUdpDiscovery::start() {
    proxy_->start();
    udp_->start();
}

void ProxyAndUdpDiscovery::stop() {
    proxy_->stop();
    udp_->stop();
}

void ProxyAndUdpDiscovery::publishService(const std::string& epr, const std::vector<QName>& types,
                                          const std::vector<Scope>& scopes,
                                          const std::vector<std::string>& xAddrs) {
    proxy_->publishService(epr, types, scopes, xAddrs);
    udp_->publishService(epr, types, scopes, xAddrs);
}

void ProxyAndUdpDiscovery::clearService(const std::string& epr) {
    proxy_->clearService(epr);
    udp_->clearService(epr);
}

void ProxyAndUdpDiscovery::clearLocalServices() {
    proxy_->clearLocalServices();
    udp_->clearLocalServices();
}

void ProxyAndUdpDiscovery::clearRemoteServices() {
    proxy_->clearRemoteServices();
    udp_->clearRemoteServices();
}

void ProxyAndUdpDiscovery::setSearchTargets(bool searchProxy, bool searchUdp) {
    if (!searchProxy && !searchUdp) {
        LOG_WARN("Discovery", "Neither proxy nor UDP selected for searching");
    }
    searchProxy_.store(searchProxy);
    searchUdp_.store(searchUdp);
}

std::vector<Service> ProxyAndUdpDiscovery::searchServices(const TypeFilter& types, const ScopeFilter& scopes,
                                                          std::chrono::milliseconds timeout,
                                                          std::chrono::milliseconds repeatProbeInterval) {
    std::vector<Service> result;
    if (searchProxy_.load()) {
        mergeByEpr(result, proxy_->searchServices(types, scopes, timeout, repeatProbeInterval));
    }
    if (searchUdp_.load()) {
        mergeByEpr(result, udp_->searchServices(types, scopes, timeout, repeatProbeInterval));
    }
    return result;
}

std::vector<Service> ProxyAndUdpDiscovery::searchMultipleTypes(const std::vector<std::vector<QName>>& typesList,
                                                               const ScopeFilter& scopes,
                                                               std::chrono::milliseconds timeout,
                                                               std::chrono::milliseconds repeatProbeInterval) {
    std::vector<Service> result;
    if (searchProxy_.load()) {
        mergeByEpr(result, proxy_->searchMultipleTypes(typesList, scopes, timeout, repeatProbeInterval));
    }
    if (searchUdp_.load()) {
        mergeByEpr(result, udp_->searchMultipleTypes(typesList, scopes, timeout, repeatProbeInterval));
    }
    return result;
}

std::vector<std::string> ProxyAndUdpDiscovery::getActiveAddresses() const {
    std::vector<std::string> result = proxy_->getActiveAddresses();
    for (auto& address : udp_->getActiveAddresses()) {
        if (std::find(result.begin(), result.end(), address) == result.end()) {
            result.push_back(std::move(address));
        }
    }
    return result;
}

}  // namespace wsd
}  // namespace sdcdisco
