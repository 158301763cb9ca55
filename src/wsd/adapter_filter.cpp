/**
 * @file adapter_filter.cpp
 * @brief Adapter selection strategies.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/wsd/adapter_filter.hpp"
#include "sdcdisco/utils/logger.hpp"

#include <algorithm>
#include <iterator>

namespace sdcdisco {
namespace wsd {

namespace {

std::vector<std::regex> compile(const std::vector<std::string>& patterns) {
    std::vector<std::regex> result;
    result.reserve(patterns.size());
    for (const auto& p : patterns) {
        result.emplace_back(p, std::regex::ECMAScript);
    }
    return result;
}

bool matchesAny(const std::vector<std::regex>& patterns, const std::string& address) {
    return std::any_of(patterns.begin(), patterns.end(), [&](const std::regex& re) {
        return std::regex_search(address, re, std::regex_constants::match_continuous);
    });
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += item;
    }
    return out;
}

std::string adapterNames(const std::vector<net::NetworkAdapter>& adapters) {
    std::vector<std::string> names;
    for (const auto& a : adapters) {
        names.push_back(a.friendly_name + "(" + a.ip + ")");
    }
    return "[" + join(names) + "]";
}

}  // namespace

// =============================================================================
// BlacklistFilter
// =============================================================================

BlacklistFilter::BlacklistFilter(const std::vector<std::string>& ignoredPatterns)
    : sources_(ignoredPatterns)
    , patterns_(compile(ignoredPatterns))
{}

bool BlacklistFilter::accept(const std::string& address) const {
    return !matchesAny(patterns_, address);
}

std::string BlacklistFilter::describe() const {
    if (sources_.empty()) {
        return "all adapters";
    }
    return "all adapters except [" + join(sources_) + "]";
}

// =============================================================================
// WhitelistFilter
// =============================================================================

WhitelistFilter::WhitelistFilter(const std::vector<std::string>& acceptedPatterns)
    : sources_(acceptedPatterns)
    , patterns_(compile(acceptedPatterns))
{}

bool WhitelistFilter::accept(const std::string& address) const {
    return matchesAny(patterns_, address);
}

std::string WhitelistFilter::describe() const {
    return "adapters matching [" + join(sources_) + "]";
}

// =============================================================================
// SingleAdapterFilter
// =============================================================================

SingleAdapterFilter::SingleAdapterFilter(const std::string& adapterName,
                                         const std::vector<net::NetworkAdapter>& adapters,
                                         bool forceAdapterName)
    : adapterName_(adapterName)
{
    std::vector<net::NetworkAdapter> named;
    std::copy_if(adapters.begin(), adapters.end(), std::back_inserter(named),
                 [&](const net::NetworkAdapter& a) { return a.friendly_name == adapterName; });
    if (named.size() == 1) {
        address_ = named.front().ip;
        LOG_INFO("AdapterFilter", "Using adapter {} ({})", adapterName, address_);
        return;
    }
    if (forceAdapterName) {
        throw AdapterNotFoundError("no unique adapter \"" + adapterName + "\" found, having " +
                                   adapterNames(adapters));
    }

    std::vector<net::NetworkAdapter> external;
    std::copy_if(adapters.begin(), adapters.end(), std::back_inserter(external),
                 [](const net::NetworkAdapter& a) { return !a.isLoopback(); });
    if (external.size() != 1) {
        throw AdapterNotFoundError("no adapter \"" + adapterName + "\" found, cannot use default, having " +
                                   adapterNames(adapters));
    }

    address_ = external.front().ip;
    LOG_WARN("AdapterFilter", "Adapter {} not found, falling back to {} ({})",
             adapterName, external.front().friendly_name, address_);
}

bool SingleAdapterFilter::accept(const std::string& address) const {
    return address == address_;
}

std::string SingleAdapterFilter::describe() const {
    return "adapter " + adapterName_ + " (" + address_ + ")";
}

}  // namespace wsd
}  // namespace sdcdisco
