/**
 * @file discovery_service.cpp
 * @brief DiscoveryServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/services/discovery_service.hpp"
#include "sdcdisco/net/http_client.hpp"
#include "sdcdisco/utils/logger.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace sdcdisco {
namespace services {

// =============================================================================
// Conversions
// =============================================================================

wsd::QName fromProto(const api::QName& qname) {
    return wsd::QName(qname.ns(), qname.local_name());
}

wsd::Scope fromProto(const api::Scope& scope) {
    return wsd::Scope(scope.value(), scope.match_by());
}

void toProto(const wsd::Service& service, api::ServiceRecord* record) {
    record->set_epr(service.epr);
    for (const auto& type : service.types) {
        auto* qname = record->add_types();
        qname->set_ns(type.ns);
        qname->set_local_name(type.local_name);
    }
    for (const auto& scope : service.scopes) {
        auto* s = record->add_scopes();
        s->set_value(scope.value);
        s->set_match_by(scope.match_by);
    }
    for (const auto& xAddr : service.x_addrs) {
        record->add_x_addrs(xAddr);
    }
    record->set_metadata_version(service.metadata_version);
    record->set_instance_id(service.instance_id);
}

grpc::Status statusFromException(const std::exception& e) {
    if (dynamic_cast<const wsd::ApiUsageError*>(&e)) {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, e.what());
    }
    if (dynamic_cast<const std::out_of_range*>(&e)) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, e.what());
    }
    if (dynamic_cast<const std::invalid_argument*>(&e)) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
    }
    if (dynamic_cast<const net::HttpError*>(&e)) {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, e.what());
    }
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
}

namespace {

std::vector<wsd::QName> typesFromProto(const google::protobuf::RepeatedPtrField<api::QName>& types) {
    std::vector<wsd::QName> result;
    result.reserve(types.size());
    for (const auto& type : types) {
        result.push_back(fromProto(type));
    }
    return result;
}

std::vector<wsd::Scope> scopesFromProto(const google::protobuf::RepeatedPtrField<api::Scope>& scopes) {
    std::vector<wsd::Scope> result;
    result.reserve(scopes.size());
    for (const auto& scope : scopes) {
        result.push_back(fromProto(scope));
    }
    return result;
}

}  // namespace

// =============================================================================
// Publish Reactor
// =============================================================================

class PublishReactor : public grpc::ServerUnaryReactor {
public:
    PublishReactor(wsd::Discovery& discovery,
                   const api::PublishRequest* request,
                   api::PublishResponse* response)
    {
        if (request->epr().empty()) {
            Finish(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "epr is required"));
            return;
        }

        std::vector<std::string> xAddrs(request->x_addrs().begin(), request->x_addrs().end());
        try {
            discovery.publishService(request->epr(), typesFromProto(request->types()),
                                     scopesFromProto(request->scopes()), xAddrs);
        } catch (const std::exception& e) {
            LOG_WARN("DiscoveryService", "Publish {} failed: {}", request->epr(), e.what());
            Finish(statusFromException(e));
            return;
        }

        LOG_INFO("DiscoveryService", "Publish: epr={}, types={}, scopes={}",
                 request->epr(), request->types_size(), request->scopes_size());
        response->set_success(true);
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

// =============================================================================
// Clear Reactor
// =============================================================================

class ClearReactor : public grpc::ServerUnaryReactor {
public:
    ClearReactor(wsd::Discovery& discovery,
                 const api::ClearRequest* request,
                 api::ClearResponse* response)
    {
        try {
            if (request->epr().empty()) {
                discovery.clearLocalServices();
            } else {
                discovery.clearService(request->epr());
            }
        } catch (const std::exception& e) {
            LOG_WARN("DiscoveryService", "Clear {} failed: {}", request->epr(), e.what());
            Finish(statusFromException(e));
            return;
        }

        response->set_success(true);
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

// =============================================================================
// Search Reactor
// =============================================================================

class SearchReactor : public grpc::ServerUnaryReactor {
public:
    SearchReactor(DiscoveryServiceImpl* service,
                  const api::SearchRequest* request,
                  api::SearchResponse* response)
        : discovery_(service->discovery())
        , response_(response)
        , timeout_(request->timeout_ms() > 0
                       ? std::chrono::milliseconds(request->timeout_ms())
                       : wsd::DEFAULT_SEARCH_TIMEOUT)
        , interval_(request->probe_interval_ms() > 0
                        ? std::chrono::milliseconds(request->probe_interval_ms())
                        : wsd::DEFAULT_PROBE_INTERVAL)
    {
        if (request->types_size() > 0) {
            types_ = typesFromProto(request->types());
        }
        if (request->scopes_size() > 0) {
            scopes_ = scopesFromProto(request->scopes());
        }

        LOG_DEBUG("DiscoveryService", "Search: types={}, scopes={}, timeout={}ms",
                  request->types_size(), request->scopes_size(), timeout_.count());

        if (!service->submit([this]() { run(); })) {
            Finish(grpc::Status(grpc::StatusCode::UNAVAILABLE, "service is shutting down"));
        }
    }

    void OnDone() override {
        delete this;
    }

private:
    std::shared_ptr<wsd::Discovery> discovery_;
    api::SearchResponse* response_;
    wsd::TypeFilter types_;
    wsd::ScopeFilter scopes_;
    std::chrono::milliseconds timeout_;
    std::chrono::milliseconds interval_;

    void run() {
        std::vector<wsd::Service> found;
        try {
            found = discovery_->searchServices(types_, scopes_, timeout_, interval_);
        } catch (const std::exception& e) {
            LOG_WARN("DiscoveryService", "Search failed: {}", e.what());
            Finish(statusFromException(e));
            return;
        }

        for (const auto& service : found) {
            toProto(service, response_->add_services());
        }
        LOG_DEBUG("DiscoveryService", "Search found {} services", found.size());
        Finish(grpc::Status::OK);
    }
};

// =============================================================================
// GetRemoteServices Reactor
// =============================================================================

class GetRemoteServicesReactor : public grpc::ServerUnaryReactor {
public:
    GetRemoteServicesReactor(const std::shared_ptr<wsd::WsDiscovery>& udp,
                             api::GetRemoteServicesResponse* response)
    {
        if (!udp) {
            Finish(grpc::Status(grpc::StatusCode::UNIMPLEMENTED,
                                "no multicast engine, remote registry unavailable"));
            return;
        }
        for (const auto& service : udp->getRemoteServices()) {
            toProto(service, response->add_services());
        }
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

// =============================================================================
// GetActiveAddresses Reactor
// =============================================================================

class GetActiveAddressesReactor : public grpc::ServerUnaryReactor {
public:
    GetActiveAddressesReactor(const wsd::Discovery& discovery,
                              api::GetActiveAddressesResponse* response)
    {
        try {
            for (const auto& address : discovery.getActiveAddresses()) {
                response->add_addresses(address);
            }
        } catch (const std::exception& e) {
            Finish(statusFromException(e));
            return;
        }
        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

// =============================================================================
// DiscoveryServiceImpl
// =============================================================================

DiscoveryServiceImpl::DiscoveryServiceImpl(std::shared_ptr<wsd::Discovery> discovery,
                                           std::shared_ptr<wsd::WsDiscovery> udp)
    : discovery_(std::move(discovery))
    , udp_(std::move(udp))
{
    if (!discovery_) {
        throw std::invalid_argument("DiscoveryServiceImpl needs a discovery engine");
    }
    LOG_INFO("DiscoveryService", "DiscoveryService initialized");
}

DiscoveryServiceImpl::~DiscoveryServiceImpl() {
    shutdown();
}

grpc::ServerUnaryReactor* DiscoveryServiceImpl::Publish(
    grpc::CallbackServerContext* /*context*/,
    const api::PublishRequest* request,
    api::PublishResponse* response)
{
    return new PublishReactor(*discovery_, request, response);
}

grpc::ServerUnaryReactor* DiscoveryServiceImpl::Clear(
    grpc::CallbackServerContext* /*context*/,
    const api::ClearRequest* request,
    api::ClearResponse* response)
{
    return new ClearReactor(*discovery_, request, response);
}

grpc::ServerUnaryReactor* DiscoveryServiceImpl::Search(
    grpc::CallbackServerContext* /*context*/,
    const api::SearchRequest* request,
    api::SearchResponse* response)
{
    return new SearchReactor(this, request, response);
}

grpc::ServerUnaryReactor* DiscoveryServiceImpl::GetRemoteServices(
    grpc::CallbackServerContext* /*context*/,
    const api::GetRemoteServicesRequest* /*request*/,
    api::GetRemoteServicesResponse* response)
{
    return new GetRemoteServicesReactor(udp_, response);
}

grpc::ServerUnaryReactor* DiscoveryServiceImpl::GetActiveAddresses(
    grpc::CallbackServerContext* /*context*/,
    const api::GetActiveAddressesRequest* /*request*/,
    api::GetActiveAddressesResponse* response)
{
    return new GetActiveAddressesReactor(*discovery_, response);
}

bool DiscoveryServiceImpl::submit(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(workersMutex_);
    if (shuttingDown_) {
        return false;
    }
    reapFinishedLocked();

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([task = std::move(task), done]() {
        task();
        done->store(true);
    });
    workers_.push_back(Worker{std::move(thread), std::move(done)});
    return true;
}

void DiscoveryServiceImpl::reapFinishedLocked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void DiscoveryServiceImpl::shutdown() {
    std::list<Worker> running;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        if (shuttingDown_) {
            return;
        }
        shuttingDown_ = true;
        running.swap(workers_);
    }

    if (!running.empty()) {
        LOG_INFO("DiscoveryService", "Waiting for {} searches", running.size());
    }
    for (auto& worker : running) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

}  // namespace services
}  // namespace sdcdisco
