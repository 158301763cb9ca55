/**
 * @file proxy_and_udp_discovery.hpp
 * @brief Discovery proxy and UDP multicast used side by side.
 *
 * Services are published and cleared on both engines. Searches go to
 * the proxy, to UDP, or to both, merged by epr.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/wsd/discovery.hpp"
#include "sdcdisco/wsd/export.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace sdcdisco {
namespace wsd {

/**
 * @class ProxyAndUdpDiscovery
 */
class SDCDISCO_WSD_API ProxyAndUdpDiscovery : public Discovery {
public:
    ProxyAndUdpDiscovery(std::shared_ptr<Discovery> proxy, std::shared_ptr<Discovery> udp);

    void start() override;
    void stop() override;

    void publishService(const std::string& epr, const std::vector<QName>& types,
                        const std::vector<Scope>& scopes,
                        const std::vector<std::string>& xAddrs) override;
    void clearService(const std::string& epr) override;
    void clearLocalServices() override;
    void clearRemoteServices() override;

    std::vector<Service> searchServices(const TypeFilter& types, const ScopeFilter& scopes,
                                        std::chrono::milliseconds timeout,
                                        std::chrono::milliseconds repeatProbeInterval) override;
    std::vector<Service> searchMultipleTypes(const std::vector<std::vector<QName>>& typesList,
                                             const ScopeFilter& scopes,
                                             std::chrono::milliseconds timeout,
                                             std::chrono::milliseconds repeatProbeInterval) override;

    /**
     * @brief Union of both engines' addresses.
     */
    std::vector<std::string> getActiveAddresses() const override;

    /**
     * @brief Select the engines searched (default: proxy only).
     */
    void setSearchTargets(bool searchProxy, bool searchUdp);

private:
    std::shared_ptr<Discovery> proxy_;
    std::shared_ptr<Discovery> udp_;
    std::atomic<bool> searchProxy_{true};
    std::atomic<bool> searchUdp_{false};
};

}  // namespace wsd
}  // namespace sdcdisco
