/**
 * @file http_proxy_discovery.cpp
 * @brief HttpProxyDiscovery implementation.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/wsd/http_proxy_discovery.hpp"
#include "sdcdisco/wsd/codec.hpp"
#include "sdcdisco/net/network_adapter.hpp"
#include "sdcdisco/utils/logger.hpp"

#include <set>
#include <stdexcept>

namespace sdcdisco {
namespace wsd {

HttpProxyDiscovery::HttpProxyDiscovery(const std::string& proxyUrl, SSL_CTX* sslContext, int timeoutMs)
    : client_(proxyUrl, sslContext, timeoutMs)
    , local_("proxy-local")
    , rng_(std::random_device{}())
{}

void HttpProxyDiscovery::start() {
    LOG_INFO("HttpProxy", "Using discovery proxy {}://{}:{}{}", client_.url().scheme,
             client_.url().host, client_.url().port, client_.url().target);
}

void HttpProxyDiscovery::stop() {
    clearLocalServices();
}

// =============================================================================
// Publishing
// =============================================================================

void HttpProxyDiscovery::publishService(const std::string& epr, const std::vector<QName>& types,
                                        const std::vector<Scope>& scopes,
                                        const std::vector<std::string>& xAddrs) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t version = 1;
    if (const Service* prior = local_.find(epr)) {
        version = prior->metadata_version + 1;
    }
    std::uniform_int_distribution<uint32_t> dist(1, 0xFFFFFFFFu);
    Service service(epr, types, scopes, xAddrs, dist(rng_), version);

    LOG_INFO("HttpProxy", "Publishing {} (version {})", epr, version);
    local_.put(service);
    sendHelloLocked(*local_.find(epr));
}

void HttpProxyDiscovery::clearService(const std::string& epr) {
    std::lock_guard<std::mutex> lock(mutex_);
    Service* service = local_.find(epr);
    if (!service) {
        throw std::out_of_range("unknown local service: " + epr);
    }
    sendByeLocked(*service);
    local_.remove(epr);
}

void HttpProxyDiscovery::clearLocalServices() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& service : local_.all()) {
        try {
            sendByeLocked(*local_.find(service.epr));
        } catch (const net::HttpError& e) {
            LOG_WARN("HttpProxy", "Bye for {} failed: {}", service.epr, e.what());
        }
    }
    local_.clear();
}

std::vector<Service> HttpProxyDiscovery::getLocalServices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_.all();
}

void HttpProxyDiscovery::sendHelloLocked(Service& service) {
    ++service.message_number;

    Envelope env(action::HELLO);
    env.to = ADDRESS_ALL;
    env.instance_id = service.instance_id;
    env.message_number = service.message_number;
    env.epr = service.epr;
    env.types = service.types;
    env.scopes = service.scopes;
    env.x_addrs = service.resolvedXAddrs(net::getIpv4Addresses());
    env.metadata_version = service.metadata_version;

    net::HttpResponse resp = postEnvelope(env);
    if (!resp.ok()) {
        throw net::HttpError("proxy rejected Hello: " + std::to_string(resp.status) + " " + resp.reason);
    }
}

void HttpProxyDiscovery::sendByeLocked(Service& service) {
    Envelope env(action::BYE);
    env.to = ADDRESS_ALL;
    env.instance_id = service.instance_id;
    env.message_number = service.message_number;
    env.epr = service.epr;
    ++service.message_number;

    net::HttpResponse resp = postEnvelope(env);
    if (!resp.ok()) {
        LOG_WARN("HttpProxy", "Proxy answered Bye for {} with {}", service.epr, resp.status);
    }
}

// =============================================================================
// Searching
// =============================================================================

std::vector<Service> HttpProxyDiscovery::searchServices(const TypeFilter& types, const ScopeFilter& scopes,
                                                        std::chrono::milliseconds /*timeout*/,
                                                        std::chrono::milliseconds /*repeatProbeInterval*/) {
    std::vector<Service> found = filterServices(probe(types, scopes), types, scopes);
    if (!resolveServices_.load()) {
        return found;
    }

    std::vector<Service> resolved;
    for (const auto& service : found) {
        for (auto& r : resolve(service.epr)) {
            resolved.push_back(std::move(r));
        }
    }
    return resolved;
}

std::vector<Service> HttpProxyDiscovery::searchMultipleTypes(const std::vector<std::vector<QName>>& typesList,
                                                             const ScopeFilter& scopes,
                                                             std::chrono::milliseconds timeout,
                                                             std::chrono::milliseconds repeatProbeInterval) {
    std::vector<Service> result;
    std::set<std::string> seen;
    for (const auto& types : typesList) {
        for (auto& service : searchServices(types, scopes, timeout, repeatProbeInterval)) {
            if (seen.insert(service.epr).second) {
                result.push_back(std::move(service));
            }
        }
    }
    return result;
}

std::vector<std::string> HttpProxyDiscovery::getActiveAddresses() const {
    return {client_.probeLocalAddress().ip};
}

std::vector<Service> HttpProxyDiscovery::probe(const TypeFilter& types, const ScopeFilter& scopes) const {
    Envelope env(action::PROBE);
    env.to = ADDRESS_ALL;
    if (types) {
        env.types = *types;
    }
    if (scopes) {
        env.scopes = *scopes;
    }

    Envelope response = exchange(env);
    std::vector<Service> services;
    for (const auto& match : response.probe_resolve_matches) {
        Service service = Service::fromMatch(match);
        service.instance_id = response.instance_id;
        services.push_back(std::move(service));
    }
    LOG_DEBUG("HttpProxy", "Probe returned {} matches", services.size());
    return services;
}

std::vector<Service> HttpProxyDiscovery::resolve(const std::string& epr) const {
    Envelope env(action::RESOLVE);
    env.to = ADDRESS_ALL;
    env.epr = epr;

    Envelope response = exchange(env);
    std::vector<Service> services;
    for (const auto& match : response.probe_resolve_matches) {
        Service service = Service::fromMatch(match);
        service.instance_id = response.instance_id;
        services.push_back(std::move(service));
    }
    return services;
}

// =============================================================================
// HTTP
// =============================================================================

net::HttpResponse HttpProxyDiscovery::postEnvelope(const Envelope& env) const {
    LOG_DEBUG("HttpProxy", "POST {} to {}", actionName(env.action), client_.url().host);
    return client_.post(encodeEnvelope(env), SOAP_CONTENT_TYPE);
}

Envelope HttpProxyDiscovery::exchange(const Envelope& request) const {
    net::HttpResponse resp = postEnvelope(request);
    if (!resp.ok()) {
        throw net::HttpError("proxy answered " + actionName(request.action) + " with " +
                             std::to_string(resp.status) + " " + resp.reason);
    }
    auto response = decodeEnvelope(resp.body, client_.url().host);
    if (!response) {
        throw net::HttpError("invalid " + actionName(request.action) + " response from proxy");
    }
    return *response;
}

}  // namespace wsd
}  // namespace sdcdisco
