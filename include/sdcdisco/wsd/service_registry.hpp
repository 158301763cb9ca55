/**
 * @file service_registry.hpp
 * @brief Services keyed by endpoint reference.
 *
 * The registry applies the metadata-version merge rule for remote
 * services:
 * - same version: keep the longer types, scopes and x-addr lists
 * - higher version: replace the entry
 * - lower version: ignore the update
 *
 * Not thread-safe; WsDiscovery guards its registries with one mutex.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/wsd/export.hpp"
#include "sdcdisco/wsd/service.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sdcdisco {
namespace wsd {

/**
 * @enum MergeResult
 * @brief Outcome of ServiceRegistry::upsert().
 */
enum class MergeResult {
    ADDED,      ///< Unknown epr, stored
    UPDATED,    ///< Same version, at least one list grew
    REPLACED,   ///< Higher version, entry replaced
    UNCHANGED,  ///< Same version, nothing new
    STALE,      ///< Lower version, ignored
    REJECTED    ///< Empty epr, ignored
};

inline const char* mergeResultToString(MergeResult result) {
    switch (result) {
        case MergeResult::ADDED: return "added";
        case MergeResult::UPDATED: return "updated";
        case MergeResult::REPLACED: return "replaced";
        case MergeResult::UNCHANGED: return "unchanged";
        case MergeResult::STALE: return "stale";
        case MergeResult::REJECTED: return "rejected";
        default: return "unknown";
    }
}

/**
 * @class ServiceRegistry
 * @brief Map of epr to Service.
 */
class SDCDISCO_WSD_API ServiceRegistry {
public:
    explicit ServiceRegistry(std::string name);

    /**
     * @brief Merge a service into the registry.
     */
    MergeResult upsert(const Service& service);

    /**
     * @brief Store the service as is, replacing any existing entry.
     */
    void put(const Service& service);

    /**
     * @return True if the epr was known.
     */
    bool remove(const std::string& epr);

    std::optional<Service> get(const std::string& epr) const;

    /**
     * @brief Direct access for in-place updates (message numbers).
     * @return nullptr for an unknown epr.
     */
    Service* find(const std::string& epr);

    bool contains(const std::string& epr) const { return services_.count(epr) != 0; }

    std::vector<Service> all() const;

    void clear() { services_.clear(); }
    size_t size() const { return services_.size(); }
    bool empty() const { return services_.empty(); }

private:
    std::string name_;
    std::map<std::string, Service> services_;
};

}  // namespace wsd
}  // namespace sdcdisco
