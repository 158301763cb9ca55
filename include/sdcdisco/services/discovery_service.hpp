/**
 * @file discovery_service.hpp
 * @brief gRPC front end of a discovery engine.
 *
 * DiscoveryService is the API local applications use:
 * - Publish / Clear: announce or withdraw local services
 * - Search: blocking Probe round, answered from a worker thread
 * - GetRemoteServices / GetActiveAddresses: monitoring endpoints
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/services/export.hpp"
#include "sdcdisco/wsd/discovery.hpp"
#include "sdcdisco/wsd/ws_discovery.hpp"

#include <grpcpp/grpcpp.h>
#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

// Include generated gRPC service base
#include "sdcdisco/proto/discovery_api.grpc.pb.h"

namespace sdcdisco {
namespace services {

/**
 * @brief Convert between the RPC schema and the engine types.
 */
SDCDISCO_SERVICES_API wsd::QName fromProto(const api::QName& qname);
SDCDISCO_SERVICES_API wsd::Scope fromProto(const api::Scope& scope);
SDCDISCO_SERVICES_API void toProto(const wsd::Service& service, api::ServiceRecord* record);

/**
 * @brief Map an engine exception to a gRPC status.
 *
 * ApiUsageError -> FAILED_PRECONDITION, std::out_of_range -> NOT_FOUND,
 * net::HttpError -> UNAVAILABLE, std::invalid_argument -> INVALID_ARGUMENT,
 * anything else -> INTERNAL.
 */
SDCDISCO_SERVICES_API grpc::Status statusFromException(const std::exception& e);

/**
 * @class DiscoveryServiceImpl
 * @brief Implementation of the DiscoveryService gRPC service.
 *
 * Usage:
 * @code
 * auto udp = std::make_shared<wsd::WsDiscovery>(wsd::DiscoveryConfig(), filter);
 * udp->start();
 * DiscoveryServiceImpl service(udp, udp);
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("127.0.0.1:50061", grpc::InsecureServerCredentials());
 * builder.RegisterService(&service);
 * auto server = builder.BuildAndStart();
 * @endcode
 */
class SDCDISCO_SERVICES_API DiscoveryServiceImpl final : public api::DiscoveryService::CallbackService {
public:
    /**
     * @param discovery Engine used for publishing and searching.
     * @param udp Multicast engine whose remote registry GetRemoteServices
     *            reports. May be null when only a proxy is used.
     */
    explicit DiscoveryServiceImpl(std::shared_ptr<wsd::Discovery> discovery,
                                  std::shared_ptr<wsd::WsDiscovery> udp = nullptr);

    ~DiscoveryServiceImpl() override;

    // Non-copyable
    DiscoveryServiceImpl(const DiscoveryServiceImpl&) = delete;
    DiscoveryServiceImpl& operator=(const DiscoveryServiceImpl&) = delete;

    // =========================================================================
    // gRPC Service Methods (Async Callback API)
    // =========================================================================

    grpc::ServerUnaryReactor* Publish(
        grpc::CallbackServerContext* context,
        const api::PublishRequest* request,
        api::PublishResponse* response) override;

    /**
     * @brief Clear one local service, or all of them for an empty epr.
     */
    grpc::ServerUnaryReactor* Clear(
        grpc::CallbackServerContext* context,
        const api::ClearRequest* request,
        api::ClearResponse* response) override;

    /**
     * @brief Handle Search RPC.
     * The search blocks for the requested timeout, so it runs on a
     * worker thread that finishes the reactor.
     */
    grpc::ServerUnaryReactor* Search(
        grpc::CallbackServerContext* context,
        const api::SearchRequest* request,
        api::SearchResponse* response) override;

    grpc::ServerUnaryReactor* GetRemoteServices(
        grpc::CallbackServerContext* context,
        const api::GetRemoteServicesRequest* request,
        api::GetRemoteServicesResponse* response) override;

    grpc::ServerUnaryReactor* GetActiveAddresses(
        grpc::CallbackServerContext* context,
        const api::GetActiveAddressesRequest* request,
        api::GetActiveAddressesResponse* response) override;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Refuse new searches and join the running ones.
     * Call after the gRPC server has been shut down.
     */
    void shutdown();

    /**
     * @brief Run a task on a worker thread joined by shutdown().
     * @return false once shutdown() has been called.
     */
    bool submit(std::function<void()> task);

    std::shared_ptr<wsd::Discovery> discovery() const { return discovery_; }
    std::shared_ptr<wsd::WsDiscovery> udp() const { return udp_; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::shared_ptr<wsd::Discovery> discovery_;
    std::shared_ptr<wsd::WsDiscovery> udp_;

    std::mutex workersMutex_;
    std::list<Worker> workers_;
    bool shuttingDown_ = false;

    void reapFinishedLocked();
};

}  // namespace services
}  // namespace sdcdisco
