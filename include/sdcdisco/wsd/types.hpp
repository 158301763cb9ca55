/**
 * @file types.hpp
 * @brief WS-Discovery wire model: names, scopes, envelopes.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/wsd/export.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sdcdisco {
namespace wsd {

// =============================================================================
// Protocol Constants
// =============================================================================

namespace ns {
constexpr const char* SOAP = "http://www.w3.org/2003/05/soap-envelope";
constexpr const char* ADDRESSING = "http://www.w3.org/2005/08/addressing";
constexpr const char* DISCOVERY = "http://docs.oasis-open.org/ws-dd/ns/discovery/2009/01";
constexpr const char* DPWS = "http://docs.oasis-open.org/ws-dd/ns/dpws/2009/01";
constexpr const char* MDPWS = "http://standards.ieee.org/downloads/11073/11073-20702-2016";
}  // namespace ns

namespace action {
constexpr const char* HELLO = "http://docs.oasis-open.org/ws-dd/ns/discovery/2009/01/Hello";
constexpr const char* BYE = "http://docs.oasis-open.org/ws-dd/ns/discovery/2009/01/Bye";
constexpr const char* PROBE = "http://docs.oasis-open.org/ws-dd/ns/discovery/2009/01/Probe";
constexpr const char* PROBE_MATCHES = "http://docs.oasis-open.org/ws-dd/ns/discovery/2009/01/ProbeMatches";
constexpr const char* RESOLVE = "http://docs.oasis-open.org/ws-dd/ns/discovery/2009/01/Resolve";
constexpr const char* RESOLVE_MATCHES = "http://docs.oasis-open.org/ws-dd/ns/discovery/2009/01/ResolveMatches";
}  // namespace action

namespace match_by {
constexpr const char* LDAP = "http://docs.oasis-open.org/ws-dd/ns/discovery/2009/01/ldap";
constexpr const char* URI = "http://docs.oasis-open.org/ws-dd/ns/discovery/2009/01/rfc3986";
constexpr const char* UUID = "http://docs.oasis-open.org/ws-dd/ns/discovery/2009/01/uuid";
constexpr const char* STRCMP = "http://docs.oasis-open.org/ws-dd/ns/discovery/2009/01/strcmp0";
}  // namespace match_by

/// `To` of multicast announcements and queries
constexpr const char* ADDRESS_ALL = "urn:docs-oasis-open-org:ws-dd:ns:discovery:2009:01";
/// `To` of unicast replies
constexpr const char* ADDRESS_ANONYMOUS = "http://www.w3.org/2005/08/addressing/anonymous";

constexpr const char* MULTICAST_IPV4_ADDRESS = "239.255.255.250";
constexpr uint16_t MULTICAST_PORT = 3702;

// =============================================================================
// Errors
// =============================================================================

/**
 * @brief Encoding was asked for an action outside the six discovery actions.
 */
class SDCDISCO_WSD_API UnsupportedActionError : public std::logic_error {
public:
    explicit UnsupportedActionError(const std::string& action)
        : std::logic_error("unsupported discovery action: " + action) {}
};

/**
 * @brief An operation was called in a state that does not allow it.
 */
class SDCDISCO_WSD_API ApiUsageError : public std::logic_error {
public:
    explicit ApiUsageError(const std::string& what) : std::logic_error(what) {}
};

// =============================================================================
// Wire Model
// =============================================================================

/**
 * @struct QName
 * @brief Namespace-qualified name of a service type.
 */
struct SDCDISCO_WSD_API QName {
    std::string ns;
    std::string local_name;

    QName() = default;
    QName(std::string ns_, std::string localName)
        : ns(std::move(ns_)), local_name(std::move(localName)) {}

    bool empty() const { return ns.empty() && local_name.empty(); }

    /// "{namespace}local_name"
    std::string toString() const { return "{" + ns + "}" + local_name; }

    bool operator==(const QName& other) const {
        return ns == other.ns && local_name == other.local_name;
    }
    bool operator!=(const QName& other) const { return !(*this == other); }
};

/**
 * @struct Scope
 * @brief Scope URI with its matching dialect (empty = RFC 3986 default).
 */
struct SDCDISCO_WSD_API Scope {
    std::string value;
    std::string match_by;

    Scope() = default;
    explicit Scope(std::string value_, std::string matchBy = std::string())
        : value(std::move(value_)), match_by(std::move(matchBy)) {}

    /// The value as written on the wire: spaces become %20.
    std::string quotedValue() const;

    bool operator==(const Scope& other) const {
        return value == other.value && match_by == other.match_by;
    }
    bool operator!=(const Scope& other) const { return !(*this == other); }
};

/**
 * @struct ProbeResolveMatch
 * @brief One entry of a ProbeMatches or ResolveMatches body.
 */
struct SDCDISCO_WSD_API ProbeResolveMatch {
    std::string epr;
    std::vector<QName> types;
    std::vector<Scope> scopes;
    std::vector<std::string> x_addrs;
    uint32_t metadata_version = 1;
};

/**
 * @struct Envelope
 * @brief Decoded (or to-be-encoded) discovery SOAP envelope.
 *
 * Which fields are meaningful depends on `action`.
 */
struct SDCDISCO_WSD_API Envelope {
    std::string action;
    std::string message_id;        ///< Fresh urn:uuid by default
    std::string relates_to;
    QName relationship_type;       ///< {wsd}Suppression on proxy announcements
    std::string to;
    std::string reply_to;
    uint32_t instance_id = 0;
    std::string sequence_id;
    uint32_t message_number = 0;
    std::string epr;
    std::vector<QName> types;
    std::vector<Scope> scopes;
    std::vector<std::string> x_addrs;
    uint32_t metadata_version = 1;
    std::vector<ProbeResolveMatch> probe_resolve_matches;

    Envelope();
    explicit Envelope(std::string action_);

    bool isSuppression() const;
};

/**
 * @brief Short name of an action URI for log lines ("Hello", "Probe", ...).
 */
SDCDISCO_WSD_API std::string actionName(const std::string& action);

/**
 * @brief True for the six actions the codec understands.
 */
SDCDISCO_WSD_API bool isKnownAction(const std::string& action);

}  // namespace wsd
}  // namespace sdcdisco
