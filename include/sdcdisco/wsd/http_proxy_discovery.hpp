/**
 * @file http_proxy_discovery.hpp
 * @brief Discovery through an HTTP discovery proxy.
 *
 * Every operation is one synchronous POST of a discovery envelope to
 * the proxy URL. Probe and Resolve are answered in the HTTP response;
 * Hello and Bye responses are not inspected beyond the status code.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/net/http_client.hpp"
#include "sdcdisco/wsd/discovery.hpp"
#include "sdcdisco/wsd/export.hpp"
#include "sdcdisco/wsd/service_registry.hpp"

#include <atomic>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace sdcdisco {
namespace wsd {

/// Content type of SOAP 1.2 requests
constexpr const char* SOAP_CONTENT_TYPE = "application/soap+xml; charset=utf-8";

/**
 * @class HttpProxyDiscovery
 * @brief Discovery implementation backed by a discovery proxy.
 *
 * Usage:
 * @code
 * HttpProxyDiscovery proxy("https://dp.hospital.local/discovery", sslCtx);
 * proxy.start();
 * auto devices = proxy.searchMedicalDeviceServices(std::nullopt);
 * @endcode
 */
class SDCDISCO_WSD_API HttpProxyDiscovery : public Discovery {
public:
    /**
     * @param proxyUrl http:// or https:// URL of the proxy.
     * @param sslContext Trust context for https, not owned.
     * @param timeoutMs Per-request socket timeout.
     * @throws net::HttpError for an invalid URL or https without a context.
     */
    explicit HttpProxyDiscovery(const std::string& proxyUrl, SSL_CTX* sslContext = nullptr,
                                int timeoutMs = 5000);

    void start() override;
    void stop() override;

    /**
     * @throws net::HttpError when the proxy cannot be reached or rejects the Hello.
     */
    void publishService(const std::string& epr, const std::vector<QName>& types,
                        const std::vector<Scope>& scopes,
                        const std::vector<std::string>& xAddrs) override;
    void clearService(const std::string& epr) override;
    void clearLocalServices() override;

    /// The proxy keeps no remote registry on this side; nothing to clear.
    void clearRemoteServices() override {}

    /**
     * @brief One Probe (and optionally one Resolve per match).
     *
     * The request timeout applies instead of `timeout`; the probe interval
     * is not used.
     * @throws net::HttpError on transport failures or an invalid response.
     */
    std::vector<Service> searchServices(const TypeFilter& types, const ScopeFilter& scopes,
                                        std::chrono::milliseconds timeout,
                                        std::chrono::milliseconds repeatProbeInterval) override;
    std::vector<Service> searchMultipleTypes(const std::vector<std::vector<QName>>& typesList,
                                             const ScopeFilter& scopes,
                                             std::chrono::milliseconds timeout,
                                             std::chrono::milliseconds repeatProbeInterval) override;

    /**
     * @brief The local address used to reach the proxy.
     * @throws net::HttpError when the proxy is unreachable.
     */
    std::vector<std::string> getActiveAddresses() const override;

    /**
     * @brief Follow every probe match with a Resolve to get complete data.
     */
    void setResolveServices(bool resolve) { resolveServices_.store(resolve); }

    std::vector<Service> getLocalServices() const;

private:
    mutable net::HttpClient client_;
    std::atomic<bool> resolveServices_{false};

    mutable std::mutex mutex_;
    ServiceRegistry local_;
    std::mt19937 rng_;

    net::HttpResponse postEnvelope(const Envelope& env) const;
    Envelope exchange(const Envelope& request) const;
    std::vector<Service> probe(const TypeFilter& types, const ScopeFilter& scopes) const;
    std::vector<Service> resolve(const std::string& epr) const;
    void sendHelloLocked(Service& service);
    void sendByeLocked(Service& service);
};

}  // namespace wsd
}  // namespace sdcdisco
