/**
 * @file adapter_filter.hpp
 * @brief Strategies deciding which local addresses the engine binds to.
 *
 * The address monitor asks the active filter before opening sockets
 * for a newly seen address:
 * - BlacklistFilter: every address except those matching a pattern
 * - WhitelistFilter: only addresses matching a pattern
 * - SingleAdapterFilter: only the address of one named adapter
 *
 * Patterns are ECMAScript regular expressions anchored at the start of
 * the address ("192\.168\." accepts 192.168.0.4, "168" does not).
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/net/network_adapter.hpp"
#include "sdcdisco/wsd/export.hpp"

#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace sdcdisco {
namespace wsd {

/**
 * @brief No usable adapter could be resolved for a SingleAdapterFilter.
 */
class SDCDISCO_WSD_API AdapterNotFoundError : public std::runtime_error {
public:
    explicit AdapterNotFoundError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class AdapterFilter
 * @brief Predicate over local IPv4 addresses.
 */
class SDCDISCO_WSD_API AdapterFilter {
public:
    virtual ~AdapterFilter() = default;

    virtual bool accept(const std::string& address) const = 0;

    /// Human readable summary for log lines
    virtual std::string describe() const = 0;
};

/**
 * @class BlacklistFilter
 * @brief Accepts an address unless one of the patterns matches it.
 *
 * An empty pattern list accepts every address.
 *
 * @throws std::regex_error from the constructor for an invalid pattern.
 */
class SDCDISCO_WSD_API BlacklistFilter : public AdapterFilter {
public:
    explicit BlacklistFilter(const std::vector<std::string>& ignoredPatterns = {});

    bool accept(const std::string& address) const override;
    std::string describe() const override;

private:
    std::vector<std::string> sources_;
    std::vector<std::regex> patterns_;
};

/**
 * @class WhitelistFilter
 * @brief Accepts an address only if one of the patterns matches it.
 *
 * @throws std::regex_error from the constructor for an invalid pattern.
 */
class SDCDISCO_WSD_API WhitelistFilter : public AdapterFilter {
public:
    explicit WhitelistFilter(const std::vector<std::string>& acceptedPatterns);

    bool accept(const std::string& address) const override;
    std::string describe() const override;

private:
    std::vector<std::string> sources_;
    std::vector<std::regex> patterns_;
};

/**
 * @class SingleAdapterFilter
 * @brief Accepts exactly the address of one adapter, resolved at construction.
 *
 * The adapter is looked up by friendly name. If the name is unknown
 * and forceAdapterName is false, the only non-loopback adapter is used
 * when there is exactly one.
 *
 * @code
 * SingleAdapterFilter filter("eth0", net::getNetworkAdapters());
 * LOG_INFO("Daemon", "Using {}", filter.address());
 * @endcode
 */
class SDCDISCO_WSD_API SingleAdapterFilter : public AdapterFilter {
public:
    /**
     * @throws AdapterNotFoundError if no adapter can be resolved.
     */
    SingleAdapterFilter(const std::string& adapterName,
                        const std::vector<net::NetworkAdapter>& adapters,
                        bool forceAdapterName = false);

    bool accept(const std::string& address) const override;
    std::string describe() const override;

    const std::string& address() const { return address_; }

private:
    std::string adapterName_;
    std::string address_;
};

}  // namespace wsd
}  // namespace sdcdisco
