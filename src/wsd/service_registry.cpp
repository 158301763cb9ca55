/**
 * @file service_registry.cpp
 * @brief ServiceRegistry implementation.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/wsd/service_registry.hpp"
#include "sdcdisco/utils/logger.hpp"

#include <utility>

namespace sdcdisco {
namespace wsd {

namespace {

template <typename T>
bool keepLonger(std::vector<T>& existing, const std::vector<T>& incoming) {
    if (incoming.size() > existing.size()) {
        existing = incoming;
        return true;
    }
    return false;
}

}  // namespace

ServiceRegistry::ServiceRegistry(std::string name)
    : name_(std::move(name))
{}

MergeResult ServiceRegistry::upsert(const Service& service) {
    if (service.epr.empty()) {
        LOG_INFO("Discovery", "{}: ignoring service without epr", name_);
        return MergeResult::REJECTED;
    }

    auto it = services_.find(service.epr);
    if (it == services_.end()) {
        services_.emplace(service.epr, service);
        LOG_INFO("Discovery", "{}: new service {} (version {}, {} x-addrs)", name_, service.epr,
                 service.metadata_version, service.x_addrs.size());
        return MergeResult::ADDED;
    }

    Service& known = it->second;
    if (service.metadata_version == known.metadata_version) {
        bool grew = keepLonger(known.x_addrs, service.x_addrs);
        grew = keepLonger(known.scopes, service.scopes) || grew;
        grew = keepLonger(known.types, service.types) || grew;
        if (grew) {
            LOG_DEBUG("Discovery", "{}: updated {} (version {})", name_, service.epr,
                      service.metadata_version);
            return MergeResult::UPDATED;
        }
        return MergeResult::UNCHANGED;
    }

    if (service.metadata_version > known.metadata_version) {
        LOG_INFO("Discovery", "{}: {} metadata version {} -> {}", name_, service.epr,
                 known.metadata_version, service.metadata_version);
        known = service;
        return MergeResult::REPLACED;
    }

    LOG_DEBUG("Discovery", "{}: outdated version {} of {} (have {})", name_,
              service.metadata_version, service.epr, known.metadata_version);
    return MergeResult::STALE;
}

void ServiceRegistry::put(const Service& service) {
    services_[service.epr] = service;
}

bool ServiceRegistry::remove(const std::string& epr) {
    auto it = services_.find(epr);
    if (it == services_.end()) {
        return false;
    }
    LOG_INFO("Discovery", "{}: removing {}", name_, epr);
    services_.erase(it);
    return true;
}

std::optional<Service> ServiceRegistry::get(const std::string& epr) const {
    auto it = services_.find(epr);
    if (it != services_.end()) {
        return it->second;
    }
    return std::nullopt;
}

Service* ServiceRegistry::find(const std::string& epr) {
    auto it = services_.find(epr);
    return it != services_.end() ? &it->second : nullptr;
}

std::vector<Service> ServiceRegistry::all() const {
    std::vector<Service> result;
    result.reserve(services_.size());
    for (const auto& [epr, service] : services_) {
        result.push_back(service);
    }
    return result;
}

}  // namespace wsd
}  // namespace sdcdisco
