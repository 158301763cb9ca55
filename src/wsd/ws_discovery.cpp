/**
 * @file ws_discovery.cpp
 * @brief WsDiscovery implementation.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/wsd/ws_discovery.hpp"
#include "sdcdisco/wsd/networking_thread.hpp"
#include "sdcdisco/utils/logger.hpp"
#include "sdcdisco/utils/url.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <stdexcept>
#include <utility>

namespace sdcdisco {
namespace wsd {

namespace {

template <typename Fn>
void invokeCallback(const char* name, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        LOG_ERROR("Discovery", "{} callback failed: {}", name, e.what());
    }
}

std::string typesInfo(const TypeFilter& types) {
    if (!types) {
        return "any";
    }
    std::string out;
    for (const auto& t : *types) {
        if (!out.empty()) {
            out += " ";
        }
        out += t.toString();
    }
    return out;
}

}  // namespace

std::optional<ProxyAddress> parseSoapUdpAddress(const std::string& xAddr) {
    utils::UrlParts parts = utils::splitUrl(xAddr);
    if (parts.scheme != "soap.udp" || parts.netloc.empty()) {
        return std::nullopt;
    }

    ProxyAddress proxy;
    proxy.port = MULTICAST_PORT;
    auto colon = parts.netloc.rfind(':');
    if (colon == std::string::npos) {
        proxy.host = parts.netloc;
        return proxy;
    }

    proxy.host = parts.netloc.substr(0, colon);
    const std::string portText = parts.netloc.substr(colon + 1);
    if (proxy.host.empty() || portText.empty() || portText.size() > 5 ||
        !std::all_of(portText.begin(), portText.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    unsigned long port = std::stoul(portText);
    if (port == 0 || port > 65535) {
        return std::nullopt;
    }
    proxy.port = static_cast<uint16_t>(port);
    return proxy;
}

// =============================================================================
// Lifecycle
// =============================================================================

WsDiscovery::WsDiscovery(const DiscoveryConfig& config,
                         std::shared_ptr<const AdapterFilter> filter,
                         net::AdapterProvider provider,
                         TransportFactory factory)
    : config_(config)
    , filter_(filter ? std::move(filter) : std::make_shared<BlacklistFilter>())
    , provider_(provider ? std::move(provider) : net::AdapterProvider(net::getNetworkAdapters))
    , factory_(std::move(factory))
    , local_("local")
    , remote_("remote")
    , rng_(std::random_device{}())
{
    if (!factory_) {
        factory_ = [](const DiscoveryConfig& cfg,
                      EnvelopeObserver& observer) -> std::unique_ptr<MessageTransport> {
            return std::make_unique<NetworkingThread>(cfg, observer);
        };
    }
}

WsDiscovery::~WsDiscovery() {
    try {
        WsDiscovery::stop();
    } catch (const std::exception& e) {
        LOG_ERROR("Discovery", "Error during shutdown: {}", e.what());
    }
}

void WsDiscovery::start() {
    if (started_.load()) {
        LOG_WARN("Discovery", "Already started");
        return;
    }

    LOG_INFO("Discovery", "Starting on {} (group {}:{})", filter_->describe(),
             config_.mcast_addr, config_.mcast_port);

    std::shared_ptr<MessageTransport> transport = factory_(config_, *this);
    transport->start();

    AddressMonitor* monitor = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport_ = transport;
        monitor_ = std::make_unique<AddressMonitor>(*this, provider_, config_.address_check_interval);
        monitor = monitor_.get();
        started_.store(true);
    }

    // first scan runs here, so sockets exist when start() returns
    monitor->start();

    if (transport->getActiveAddresses().empty()) {
        LOG_WARN("Discovery", "No usable local address yet ({})", filter_->describe());
    }
}

void WsDiscovery::stop() {
    std::shared_ptr<MessageTransport> transport;
    std::unique_ptr<AddressMonitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_.load()) {
            return;
        }
        LOG_INFO("Discovery", "Stopping");

        remote_.clear();
        for (auto& service : local_.all()) {
            sendByeLocked(*local_.find(service.epr));
        }
        local_.clear();

        started_.store(false);
        transport = transport_;
        monitor = std::move(monitor_);
    }
    stopCv_.notify_all();

    if (monitor) {
        monitor->stop();
    }
    // pending Byes go out before the transport threads exit
    if (transport) {
        transport->stop();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    remote_.clear();
    activeProxy_.reset();
    LOG_INFO("Discovery", "Stopped");
}

void WsDiscovery::requireStarted(const char* operation) const {
    if (!started_.load()) {
        throw ApiUsageError(std::string(operation) + ": discovery not started");
    }
}

// =============================================================================
// Publishing
// =============================================================================

void WsDiscovery::publishService(const std::string& epr, const std::vector<QName>& types,
                                 const std::vector<Scope>& scopes,
                                 const std::vector<std::string>& xAddrs) {
    requireStarted("publishService");

    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t version = 1;
    if (const Service* prior = local_.find(epr)) {
        version = prior->metadata_version + 1;
    }

    Service service(epr, types, scopes, xAddrs, randomInstanceIdLocked(), version);
    LOG_INFO("Discovery", "Publishing {} (version {}, {} types, {} scopes)", epr, version,
             types.size(), scopes.size());
    local_.put(service);
    sendHelloLocked(*local_.find(epr));
}

void WsDiscovery::clearService(const std::string& epr) {
    std::lock_guard<std::mutex> lock(mutex_);
    Service* service = local_.find(epr);
    if (!service) {
        throw std::out_of_range("unknown local service: " + epr);
    }
    if (started_.load()) {
        sendByeLocked(*service);
    }
    local_.remove(epr);
}

void WsDiscovery::clearLocalServices() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_.load()) {
        for (auto& service : local_.all()) {
            sendByeLocked(*local_.find(service.epr));
        }
    }
    local_.clear();
}

void WsDiscovery::clearRemoteServices() {
    std::lock_guard<std::mutex> lock(mutex_);
    remote_.clear();
}

// =============================================================================
// Searching
// =============================================================================

bool WsDiscovery::waitUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !stopCv_.wait_until(lock, deadline, [this]() { return !started_.load(); });
}

std::vector<Service> WsDiscovery::searchServices(const TypeFilter& types, const ScopeFilter& scopes,
                                                 std::chrono::milliseconds timeout,
                                                 std::chrono::milliseconds repeatProbeInterval) {
    requireStarted("searchServices");

    auto interval = repeatProbeInterval.count() > 0 ? repeatProbeInterval : timeout;
    auto now = std::chrono::steady_clock::now();
    const auto end = now + timeout;
    while (now < end) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sendProbeLocked(types, scopes);
        }
        if (!waitUntil(std::min(now + interval, end))) {
            break;
        }
        now = std::chrono::steady_clock::now();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto result = filterServices(remote_.all(), types, scopes);
    LOG_DEBUG("Discovery", "Search for types {} found {} services", typesInfo(types), result.size());
    return result;
}

std::vector<Service> WsDiscovery::searchMultipleTypes(const std::vector<std::vector<QName>>& typesList,
                                                      const ScopeFilter& scopes,
                                                      std::chrono::milliseconds timeout,
                                                      std::chrono::milliseconds repeatProbeInterval) {
    requireStarted("searchMultipleTypes");

    auto interval = repeatProbeInterval.count() > 0 ? repeatProbeInterval : timeout;
    auto now = std::chrono::steady_clock::now();
    const auto end = now + timeout;
    while (now < end) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& types : typesList) {
                sendProbeLocked(types, scopes);
            }
        }
        if (!waitUntil(std::min(now + interval, end))) {
            break;
        }
        now = std::chrono::steady_clock::now();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto remote = remote_.all();
    std::vector<Service> result;
    std::set<std::string> seen;
    for (const auto& types : typesList) {
        for (auto& service : filterServices(remote, types, scopes)) {
            if (seen.insert(service.epr).second) {
                result.push_back(std::move(service));
            }
        }
    }
    return result;
}

std::vector<std::string> WsDiscovery::getActiveAddresses() const {
    std::shared_ptr<MessageTransport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport = transport_;
    }
    if (!transport) {
        return {};
    }
    return transport->getActiveAddresses();
}

// =============================================================================
// Callbacks
// =============================================================================

void WsDiscovery::setHelloCallback(HelloCallback callback, TypeFilter types, ScopeFilter scopes) {
    std::lock_guard<std::mutex> lock(mutex_);
    helloCallback_ = std::move(callback);
    helloTypes_ = std::move(types);
    helloScopes_ = std::move(scopes);
}

void WsDiscovery::setByeCallback(ByeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    byeCallback_ = std::move(callback);
}

void WsDiscovery::setProbeCallback(ProbeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    probeCallback_ = std::move(callback);
}

void WsDiscovery::setProbeMatchCallback(ProbeMatchCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    probeMatchCallback_ = std::move(callback);
}

void WsDiscovery::setResolveMatchCallback(ResolveMatchCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    resolveMatchCallback_ = std::move(callback);
}

// =============================================================================
// Registry Access
// =============================================================================

std::vector<Service> WsDiscovery::getRemoteServices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_.all();
}

std::optional<Service> WsDiscovery::getRemoteService(const std::string& epr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_.get(epr);
}

std::vector<Service> WsDiscovery::getLocalServices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_.all();
}

std::optional<ProxyAddress> WsDiscovery::activeProxy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeProxy_;
}

// =============================================================================
// Address Changes
// =============================================================================

void WsDiscovery::onAddressAdded(const std::string& address) {
    if (!filter_->accept(address)) {
        LOG_DEBUG("Discovery", "Address {} not accepted by {}", address, filter_->describe());
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_.load() || !transport_) {
        return;
    }
    if (!transport_->addSourceAddress(address)) {
        LOG_WARN("Discovery", "Could not open sockets on {}", address);
        return;
    }
    // consumers on the new network have not seen our services yet
    for (auto& service : local_.all()) {
        sendHelloLocked(*local_.find(service.epr));
    }
}

void WsDiscovery::onAddressRemoved(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (transport_) {
        transport_->removeSourceAddress(address);
    }
}

// =============================================================================
// Received Envelopes
// =============================================================================

void WsDiscovery::onEnvelopeReceived(const Envelope& env, const net::SocketAddress& from) {
    LOG_DEBUG("Discovery", "Received {} from {}", actionName(env.action), from.toString());

    if (env.action == action::PROBE) {
        handleProbe(env, from);
    } else if (env.action == action::PROBE_MATCHES) {
        handleProbeMatches(env, from);
    } else if (env.action == action::RESOLVE) {
        handleResolve(env, from);
    } else if (env.action == action::RESOLVE_MATCHES) {
        handleResolveMatches(env, from);
    } else if (env.action == action::HELLO) {
        handleHello(env, from);
    } else if (env.action == action::BYE) {
        handleBye(env, from);
    } else {
        LOG_WARN("Discovery", "Unknown action {} from {}", env.action, from.toString());
    }
}

void WsDiscovery::handleProbe(const Envelope& env, const net::SocketAddress& from) {
    ProbeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto matches = filterServices(local_.all(), env.types, env.scopes);
        if (!matches.empty()) {
            LOG_INFO("Discovery", "Sending probe matches to {} for {} services", from.toString(),
                     matches.size());
        }
        for (const auto& match : matches) {
            sendProbeMatchLocked(*local_.find(match.epr), env.message_id, from);
        }
        callback = probeCallback_;
    }

    if (callback) {
        invokeCallback("Probe", [&]() { callback(from, env); });
    }
}

void WsDiscovery::handleProbeMatches(const Envelope& env, const net::SocketAddress& from) {
    std::vector<Service> received;
    ProbeMatchCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& match : env.probe_resolve_matches) {
            Service service = Service::fromMatch(match);
            service.instance_id = env.instance_id;
            remote_.upsert(service);

            if (!match.epr.empty()) {
                if (match.x_addrs.empty()) {
                    LOG_INFO("Discovery", "{}({}) has no x-addrs, sending resolve", match.epr, from.toString());
                    sendResolveLocked(match.epr);
                } else if (match.types.empty()) {
                    LOG_INFO("Discovery", "{}({}) has no types, sending resolve", match.epr, from.toString());
                    sendResolveLocked(match.epr);
                } else if (match.scopes.empty()) {
                    LOG_INFO("Discovery", "{}({}) has no scopes, sending resolve", match.epr, from.toString());
                    sendResolveLocked(match.epr);
                }
            }
            received.push_back(std::move(service));
        }
        callback = probeMatchCallback_;
    }

    if (callback) {
        for (const auto& service : received) {
            invokeCallback("ProbeMatch", [&]() { callback(from, service); });
        }
    }
}

void WsDiscovery::handleResolve(const Envelope& env, const net::SocketAddress& from) {
    std::lock_guard<std::mutex> lock(mutex_);
    Service* service = local_.find(env.epr);
    if (service) {
        sendResolveMatchLocked(*service, env.message_id, from);
    }
}

void WsDiscovery::handleResolveMatches(const Envelope& env, const net::SocketAddress& /*from*/) {
    std::vector<Service> received;
    ResolveMatchCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& match : env.probe_resolve_matches) {
            Service service = Service::fromMatch(match);
            service.instance_id = env.instance_id;
            remote_.upsert(service);
            received.push_back(std::move(service));
        }
        callback = resolveMatchCallback_;
    }

    if (callback) {
        for (const auto& service : received) {
            invokeCallback("ResolveMatch", [&]() { callback(service); });
        }
    }
}

void WsDiscovery::handleHello(const Envelope& env, const net::SocketAddress& from) {
    HelloCallback callback;
    Service service(env.epr, env.types, env.scopes, env.x_addrs, env.instance_id, env.metadata_version);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (env.isSuppression() && !env.x_addrs.empty() &&
            env.x_addrs.front().compare(0, 9, "soap.udp:") == 0) {
            auto proxy = parseSoapUdpAddress(env.x_addrs.front());
            if (proxy) {
                proxy->epr = env.epr;
                LOG_INFO("Discovery", "Discovery proxy {} active at {}:{}", env.epr, proxy->host, proxy->port);
                activeProxy_ = std::move(proxy);
            } else {
                LOG_WARN("Discovery", "Ignoring proxy address {}", env.x_addrs.front());
            }
        }

        remote_.upsert(service);
        if (env.x_addrs.empty() && !env.epr.empty()) {
            LOG_DEBUG("Discovery", "{}({}) has no x-addrs, sending resolve", env.epr, from.toString());
            sendResolveLocked(env.epr);
        }
        if (helloCallback_ && matchesFilter(service, helloTypes_, helloScopes_)) {
            callback = helloCallback_;
        }
    }

    if (callback) {
        invokeCallback("Hello", [&]() { callback(from, service); });
    }
}

void WsDiscovery::handleBye(const Envelope& env, const net::SocketAddress& from) {
    ByeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (activeProxy_ && activeProxy_->epr == env.epr) {
            LOG_INFO("Discovery", "Discovery proxy {} left, reverting to multicast", env.epr);
            activeProxy_.reset();
        }
        remote_.remove(env.epr);
        callback = byeCallback_;
    }

    if (callback) {
        invokeCallback("Bye", [&]() { callback(from, env.epr); });
    }
}

// =============================================================================
// Outgoing Envelopes
// =============================================================================

void WsDiscovery::sendHelloLocked(Service& service) {
    ++service.message_number;

    Envelope env(action::HELLO);
    env.to = ADDRESS_ALL;
    env.instance_id = service.instance_id;
    env.message_number = service.message_number;
    env.epr = service.epr;
    env.types = service.types;
    env.scopes = service.scopes;
    env.x_addrs = service.resolvedXAddrs(localAddresses());
    env.metadata_version = service.metadata_version;

    LOG_INFO("Discovery", "Sending hello for {}", service.epr);
    transport_->sendMulticast(env, randomAppDelayLocked());
}

void WsDiscovery::sendByeLocked(Service& service) {
    Envelope env(action::BYE);
    env.to = ADDRESS_ALL;
    env.instance_id = service.instance_id;
    env.message_number = service.message_number;
    env.epr = service.epr;
    ++service.message_number;

    LOG_DEBUG("Discovery", "Sending bye for {}", service.epr);
    transport_->sendMulticast(env, std::chrono::milliseconds(0));
}

void WsDiscovery::sendProbeLocked(const TypeFilter& types, const ScopeFilter& scopes) {
    Envelope env(action::PROBE);
    env.to = ADDRESS_ALL;
    if (types) {
        env.types = *types;
    }
    if (scopes) {
        env.scopes = *scopes;
    }

    LOG_DEBUG("Discovery", "Sending probe types={}", typesInfo(types));
    sendQueryLocked(env);
}

void WsDiscovery::sendResolveLocked(const std::string& epr) {
    Envelope env(action::RESOLVE);
    env.to = ADDRESS_ALL;
    env.epr = epr;

    LOG_DEBUG("Discovery", "Sending resolve for {}", epr);
    sendQueryLocked(env);
}

void WsDiscovery::sendQueryLocked(const Envelope& env) {
    if (activeProxy_) {
        transport_->sendUnicast(env, activeProxy_->host, activeProxy_->port, std::chrono::milliseconds(0));
    } else {
        transport_->sendMulticast(env, std::chrono::milliseconds(0));
    }
}

void WsDiscovery::sendProbeMatchLocked(Service& service, const std::string& relatesTo,
                                       const net::SocketAddress& to) {
    ++service.message_number;

    ProbeResolveMatch match;
    match.metadata_version = service.metadata_version;
    if (config_.probe_match_include_epr) {
        match.epr = service.epr;
    }
    if (config_.probe_match_include_types) {
        match.types = service.types;
    }
    if (config_.probe_match_include_scopes) {
        match.scopes = service.scopes;
    }
    if (config_.probe_match_include_x_addrs) {
        match.x_addrs = service.resolvedXAddrs(localAddresses());
    }

    // one envelope per service; some consumers cannot handle large ProbeMatches
    Envelope env(action::PROBE_MATCHES);
    env.to = ADDRESS_ANONYMOUS;
    env.relates_to = relatesTo;
    env.instance_id = service.instance_id;
    env.message_number = service.message_number;
    env.probe_resolve_matches.push_back(std::move(match));

    transport_->sendUnicast(env, to.ip, to.port, randomAppDelayLocked());
}

void WsDiscovery::sendResolveMatchLocked(Service& service, const std::string& relatesTo,
                                         const net::SocketAddress& to) {
    ++service.message_number;

    ProbeResolveMatch match;
    match.epr = service.epr;
    match.types = service.types;
    match.scopes = service.scopes;
    match.x_addrs = service.resolvedXAddrs(localAddresses());
    match.metadata_version = service.metadata_version;

    Envelope env(action::RESOLVE_MATCHES);
    env.to = ADDRESS_ANONYMOUS;
    env.relates_to = relatesTo;
    env.instance_id = service.instance_id;
    env.message_number = service.message_number;
    env.probe_resolve_matches.push_back(std::move(match));

    LOG_INFO("Discovery", "Sending resolve match for {} to {}", service.epr, to.toString());
    transport_->sendUnicast(env, to.ip, to.port, std::chrono::milliseconds(0));
}

// =============================================================================
// Helpers
// =============================================================================

std::vector<std::string> WsDiscovery::localAddresses() const {
    std::vector<std::string> result;
    for (const auto& adapter : provider_()) {
        if (adapter.ip != "0.0.0.0" &&
            std::find(result.begin(), result.end(), adapter.ip) == result.end()) {
            result.push_back(adapter.ip);
        }
    }
    return result;
}

std::chrono::milliseconds WsDiscovery::randomAppDelayLocked() {
    std::uniform_int_distribution<long long> dist(0, config_.app_max_delay.count());
    return std::chrono::milliseconds(dist(rng_));
}

uint32_t WsDiscovery::randomInstanceIdLocked() {
    std::uniform_int_distribution<uint32_t> dist(1, 0xFFFFFFFFu);
    return dist(rng_);
}

}  // namespace wsd
}  // namespace sdcdisco
