/**
 * @file ws_discovery.hpp
 * @brief WS-Discovery engine over UDP multicast.
 *
 * WsDiscovery owns:
 * - the local registry (services published by this process)
 * - the remote registry (services learnt from Hello/ProbeMatches/ResolveMatches)
 * - the active discovery proxy, if one announced itself
 * - a MessageTransport and an AddressMonitor
 *
 * One mutex guards both registries and the proxy. Envelopes arrive on
 * the transport's queue thread, address changes on the monitor thread,
 * API calls on the caller's thread. User callbacks run on the
 * transport's queue thread without the lock held.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/net/network_adapter.hpp"
#include "sdcdisco/net/udp_socket.hpp"
#include "sdcdisco/wsd/adapter_filter.hpp"
#include "sdcdisco/wsd/address_monitor.hpp"
#include "sdcdisco/wsd/config.hpp"
#include "sdcdisco/wsd/discovery.hpp"
#include "sdcdisco/wsd/export.hpp"
#include "sdcdisco/wsd/message_transport.hpp"
#include "sdcdisco/wsd/service_registry.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace sdcdisco {
namespace wsd {

using HelloCallback = std::function<void(const net::SocketAddress& from, const Service& service)>;
using ByeCallback = std::function<void(const net::SocketAddress& from, const std::string& epr)>;
using ProbeCallback = std::function<void(const net::SocketAddress& from, const Envelope& probe)>;
using ProbeMatchCallback = std::function<void(const net::SocketAddress& from, const Service& service)>;
using ResolveMatchCallback = std::function<void(const Service& service)>;

/**
 * @brief Creates the transport when the engine starts. Replaceable in tests.
 */
using TransportFactory =
    std::function<std::unique_ptr<MessageTransport>(const DiscoveryConfig&, EnvelopeObserver&)>;

/**
 * @struct ProxyAddress
 * @brief A discovery proxy that announced itself with a Suppression Hello.
 */
struct SDCDISCO_WSD_API ProxyAddress {
    std::string epr;
    std::string host;
    uint16_t port = 0;
};

/**
 * @brief Host and port of a "soap.udp://host:port[/path]" address.
 *
 * A missing port means the discovery port 3702.
 * @return std::nullopt for another scheme or an invalid port.
 */
SDCDISCO_WSD_API std::optional<ProxyAddress> parseSoapUdpAddress(const std::string& xAddr);

/**
 * @class WsDiscovery
 * @brief Publishes local services and discovers remote ones.
 *
 * Usage:
 * @code
 * auto filter = std::make_shared<BlacklistFilter>(std::vector<std::string>{"127\\."});
 * WsDiscovery discovery(DiscoveryConfig(), filter);
 * discovery.start();
 * discovery.publishService("urn:uuid:...", medicalDeviceTypes(), scopes,
 *                          {"https://{ip}:6464/device"});
 * auto found = discovery.searchServices(medicalDeviceTypes(), std::nullopt,
 *                                       std::chrono::seconds(2), std::chrono::seconds(1));
 * discovery.stop();
 * @endcode
 */
class SDCDISCO_WSD_API WsDiscovery : public Discovery,
                                     public EnvelopeObserver,
                                     public AddressObserver {
public:
    /**
     * @param config Engine configuration.
     * @param filter Decides which local addresses are used.
     * @param provider Adapter list source (defaults to the OS).
     * @param factory Transport factory (defaults to NetworkingThread).
     */
    WsDiscovery(const DiscoveryConfig& config,
                std::shared_ptr<const AdapterFilter> filter,
                net::AdapterProvider provider = net::getNetworkAdapters,
                TransportFactory factory = nullptr);

    ~WsDiscovery() override;

    // Non-copyable
    WsDiscovery(const WsDiscovery&) = delete;
    WsDiscovery& operator=(const WsDiscovery&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Start the transport and the address monitor.
     * @throws std::runtime_error if the transport cannot start.
     */
    void start() override;
    void stop() override;
    bool isRunning() const { return started_.load(); }

    // =========================================================================
    // Discovery
    // =========================================================================

    /**
     * @throws ApiUsageError when not started.
     */
    void publishService(const std::string& epr, const std::vector<QName>& types,
                        const std::vector<Scope>& scopes,
                        const std::vector<std::string>& xAddrs) override;
    void clearService(const std::string& epr) override;
    void clearLocalServices() override;
    void clearRemoteServices() override;

    /**
     * @brief Probe every repeatProbeInterval until timeout, then filter the remote registry.
     * @throws ApiUsageError when not started.
     */
    std::vector<Service> searchServices(const TypeFilter& types, const ScopeFilter& scopes,
                                        std::chrono::milliseconds timeout,
                                        std::chrono::milliseconds repeatProbeInterval) override;

    /**
     * @throws ApiUsageError when not started.
     */
    std::vector<Service> searchMultipleTypes(const std::vector<std::vector<QName>>& typesList,
                                             const ScopeFilter& scopes,
                                             std::chrono::milliseconds timeout,
                                             std::chrono::milliseconds repeatProbeInterval) override;

    std::vector<std::string> getActiveAddresses() const override;

    // =========================================================================
    // Callbacks (pass nullptr to disable)
    // =========================================================================

    /**
     * @brief Called for Hellos of services passing the type and scope filter.
     */
    void setHelloCallback(HelloCallback callback, TypeFilter types = std::nullopt,
                          ScopeFilter scopes = std::nullopt);
    void setByeCallback(ByeCallback callback);

    /**
     * @brief Called for every received Probe, matching or not.
     */
    void setProbeCallback(ProbeCallback callback);
    void setProbeMatchCallback(ProbeMatchCallback callback);
    void setResolveMatchCallback(ResolveMatchCallback callback);

    // =========================================================================
    // Registry Access
    // =========================================================================

    std::vector<Service> getRemoteServices() const;
    std::optional<Service> getRemoteService(const std::string& epr) const;
    std::vector<Service> getLocalServices() const;
    std::optional<ProxyAddress> activeProxy() const;

    // =========================================================================
    // Observers
    // =========================================================================

    void onEnvelopeReceived(const Envelope& env, const net::SocketAddress& from) override;
    void onAddressAdded(const std::string& address) override;
    void onAddressRemoved(const std::string& address) override;

private:
    DiscoveryConfig config_;
    std::shared_ptr<const AdapterFilter> filter_;
    net::AdapterProvider provider_;
    TransportFactory factory_;

    mutable std::mutex mutex_;
    std::condition_variable stopCv_;
    ServiceRegistry local_;
    ServiceRegistry remote_;
    std::optional<ProxyAddress> activeProxy_;
    std::shared_ptr<MessageTransport> transport_;
    std::unique_ptr<AddressMonitor> monitor_;
    std::atomic<bool> started_{false};
    std::mt19937 rng_;

    HelloCallback helloCallback_;
    TypeFilter helloTypes_;
    ScopeFilter helloScopes_;
    ByeCallback byeCallback_;
    ProbeCallback probeCallback_;
    ProbeMatchCallback probeMatchCallback_;
    ResolveMatchCallback resolveMatchCallback_;

    // Received envelopes
    void handleProbe(const Envelope& env, const net::SocketAddress& from);
    void handleProbeMatches(const Envelope& env, const net::SocketAddress& from);
    void handleResolve(const Envelope& env, const net::SocketAddress& from);
    void handleResolveMatches(const Envelope& env, const net::SocketAddress& from);
    void handleHello(const Envelope& env, const net::SocketAddress& from);
    void handleBye(const Envelope& env, const net::SocketAddress& from);

    // Outgoing envelopes; callers hold mutex_
    void sendHelloLocked(Service& service);
    void sendByeLocked(Service& service);
    void sendProbeLocked(const TypeFilter& types, const ScopeFilter& scopes);
    void sendResolveLocked(const std::string& epr);
    void sendProbeMatchLocked(Service& service, const std::string& relatesTo,
                              const net::SocketAddress& to);
    void sendResolveMatchLocked(Service& service, const std::string& relatesTo,
                                const net::SocketAddress& to);
    void sendQueryLocked(const Envelope& env);

    std::vector<std::string> localAddresses() const;
    std::chrono::milliseconds randomAppDelayLocked();
    uint32_t randomInstanceIdLocked();

    /**
     * @brief Sleep until `deadline` or until stop(), whichever comes first.
     * @return False if the engine was stopped.
     */
    bool waitUntil(std::chrono::steady_clock::time_point deadline);

    void requireStarted(const char* operation) const;
};

}  // namespace wsd
}  // namespace sdcdisco
