/**
 * @file main.cpp
 * @brief sdcdiscod entry point
 *
 * This is the thin executable that wires together the library components:
 * - Adapter filter chosen from the command line
 * - WS-Discovery multicast engine, optionally paired with a discovery proxy
 * - DiscoveryService gRPC API for local applications
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include <sdcdisco/daemon/config.hpp>
#include <sdcdisco/net/network_adapter.hpp>
#include <sdcdisco/net/platform.hpp>
#include <sdcdisco/services/discovery_service.hpp>
#include <sdcdisco/utils/logger.hpp>
#include <sdcdisco/wsd/adapter_filter.hpp>
#include <sdcdisco/wsd/http_proxy_discovery.hpp>
#include <sdcdisco/wsd/proxy_and_udp_discovery.hpp>
#include <sdcdisco/wsd/ws_discovery.hpp>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>
#include <openssl/ssl.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace sdcdisco;
using namespace sdcdisco::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler
void signalHandler(int /*signal*/) {
    g_shutdown.store(true);
}

namespace {

using SslContextPtr = std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)>;

std::shared_ptr<const wsd::AdapterFilter> makeAdapterFilter(const Config& config) {
    if (config.adapter_mode == "whitelist") {
        return std::make_shared<wsd::WhitelistFilter>(config.adapters);
    }
    if (config.adapter_mode == "single") {
        return std::make_shared<wsd::SingleAdapterFilter>(
            config.adapter_name, net::getNetworkAdapters(), config.force_adapter);
    }
    if (config.adapter_mode == "blacklist") {
        return std::make_shared<wsd::BlacklistFilter>(config.adapters);
    }
    return std::make_shared<wsd::BlacklistFilter>();
}

SslContextPtr makeSslContext(const Config& config) {
    SslContextPtr ctx(SSL_CTX_new(TLS_client_method()), &SSL_CTX_free);
    if (!ctx) {
        throw std::runtime_error("SSL_CTX_new failed");
    }
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
    int loaded = config.proxy_ca_file.empty()
                     ? SSL_CTX_set_default_verify_paths(ctx.get())
                     : SSL_CTX_load_verify_locations(ctx.get(), config.proxy_ca_file.c_str(), nullptr);
    if (loaded != 1) {
        throw std::runtime_error("cannot load CA certificates " + config.proxy_ca_file);
    }
    return ctx;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return config.error ? 1 : 0;
    }

    // Configure logging
    utils::Logger::instance().setLevel(utils::parseLogLevel(config.log_level));

    net::SocketInitializer sockets;
    if (!sockets.isInitialized()) {
        LOG_ERROR("Daemon", "Socket subsystem initialization failed");
        return 1;
    }

    LOG_INFO("Daemon", "sdcdiscod starting...");
    LOG_INFO("Daemon", "Discovery port: {}", config.mcast_port);
    LOG_INFO("Daemon", "API: {}:{}", config.bind_addr, config.api_port);

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif

    try {
        auto filter = makeAdapterFilter(config);
        LOG_INFO("Daemon", "Adapter filter: {}", filter->describe());

        wsd::DiscoveryConfig discoveryConfig;
        discoveryConfig.mcast_port = config.mcast_port;
        discoveryConfig.multicast_ttl = config.mcast_ttl;

        auto udp = std::make_shared<wsd::WsDiscovery>(discoveryConfig, filter);

        SslContextPtr sslContext(nullptr, &SSL_CTX_free);
        std::shared_ptr<wsd::Discovery> discovery = udp;
        if (!config.proxy_url.empty()) {
            if (config.proxy_url.compare(0, 8, "https://") == 0) {
                sslContext = makeSslContext(config);
            }
            auto proxy = std::make_shared<wsd::HttpProxyDiscovery>(config.proxy_url, sslContext.get());
            auto combined = std::make_shared<wsd::ProxyAndUdpDiscovery>(proxy, udp);
            combined->setSearchTargets(true, config.search_udp);
            discovery = combined;
        }

        discovery->start();
        LOG_INFO("Daemon", "Discovery started");

        services::DiscoveryServiceImpl service(discovery, udp);

        std::string apiAddr = config.bind_addr + ":" + std::to_string(config.api_port);
        grpc::ServerBuilder builder;
        builder.AddListeningPort(apiAddr, grpc::InsecureServerCredentials());
        builder.RegisterService(&service);
        auto server = builder.BuildAndStart();

        if (!server) {
            LOG_ERROR("Daemon", "Failed to start API server on {}", apiAddr);
            discovery->stop();
            return 1;
        }
        LOG_INFO("Daemon", "API server listening on {}", apiAddr);
        LOG_INFO("Daemon", "sdcdiscod is ready");

        // Main loop - wait for shutdown signal
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // Graceful shutdown
        LOG_INFO("Daemon", "Shutting down...");

        // Stopping the engine first wakes blocked searches
        discovery->stop();

        auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
        server->Shutdown(deadline);
        service.shutdown();

        LOG_INFO("Daemon", "sdcdiscod stopped");
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}
