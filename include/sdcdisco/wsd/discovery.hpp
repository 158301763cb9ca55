/**
 * @file discovery.hpp
 * @brief Common interface of the discovery engines.
 *
 * Implemented by WsDiscovery (UDP multicast), HttpProxyDiscovery
 * (HTTP discovery proxy) and ProxyAndUdpDiscovery (both).
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/wsd/export.hpp"
#include "sdcdisco/wsd/location.hpp"
#include "sdcdisco/wsd/matching.hpp"
#include "sdcdisco/wsd/service.hpp"
#include "sdcdisco/wsd/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace sdcdisco {
namespace wsd {

constexpr std::chrono::milliseconds DEFAULT_SEARCH_TIMEOUT{5000};
constexpr std::chrono::milliseconds DEFAULT_PROBE_INTERVAL{3000};

/**
 * @brief Types every SDC medical device announces:
 * {dpws}Device and {11073-20702-2016}MedicalDevice.
 */
SDCDISCO_WSD_API std::vector<QName> medicalDeviceTypes();

/**
 * @class Discovery
 * @brief Publish local services and search remote ones.
 */
class SDCDISCO_WSD_API Discovery {
public:
    virtual ~Discovery() = default;

    virtual void start() = 0;

    /**
     * @brief Sends Bye for every local service, then shuts down.
     */
    virtual void stop() = 0;

    /**
     * @brief Announce a service, or a new metadata version of it.
     *
     * x-addrs containing "{ip}" are expanded once per local address.
     */
    virtual void publishService(const std::string& epr, const std::vector<QName>& types,
                                const std::vector<Scope>& scopes,
                                const std::vector<std::string>& xAddrs) = 0;

    /**
     * @brief Send Bye and forget the local service.
     * @throws std::out_of_range for an epr that was never published.
     */
    virtual void clearService(const std::string& epr) = 0;

    virtual void clearLocalServices() = 0;
    virtual void clearRemoteServices() = 0;

    /**
     * @brief Find services having all `types` and all `scopes`.
     *
     * Blocks for up to `timeout`. Finding nothing is not an error.
     */
    virtual std::vector<Service> searchServices(const TypeFilter& types, const ScopeFilter& scopes,
                                                std::chrono::milliseconds timeout,
                                                std::chrono::milliseconds repeatProbeInterval) = 0;

    /**
     * @brief Services matching any one of the type lists, unique by epr.
     */
    virtual std::vector<Service> searchMultipleTypes(const std::vector<std::vector<QName>>& typesList,
                                                     const ScopeFilter& scopes,
                                                     std::chrono::milliseconds timeout,
                                                     std::chrono::milliseconds repeatProbeInterval) = 0;

    virtual std::vector<std::string> getActiveAddresses() const = 0;

    /**
     * @brief searchServices() restricted to medicalDeviceTypes().
     */
    std::vector<Service> searchMedicalDeviceServices(const ScopeFilter& scopes,
                                                     std::chrono::milliseconds timeout = DEFAULT_SEARCH_TIMEOUT,
                                                     std::chrono::milliseconds repeatProbeInterval = DEFAULT_PROBE_INTERVAL);

    /**
     * @brief All medical devices, filtered locally for being inside `location`.
     */
    std::vector<Service> searchMedicalDeviceServicesInLocation(const SdcLocation& location,
                                                               std::chrono::milliseconds timeout);
};

}  // namespace wsd
}  // namespace sdcdisco
