/**
 * @file matching.hpp
 * @brief Type and scope matching rules of WS-Discovery.
 *
 * All functions are pure and thread-safe.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/wsd/export.hpp"
#include "sdcdisco/wsd/service.hpp"
#include "sdcdisco/wsd/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sdcdisco {
namespace wsd {

using TypeFilter = std::optional<std::vector<QName>>;
using ScopeFilter = std::optional<std::vector<Scope>>;

SDCDISCO_WSD_API bool matchType(const QName& a, const QName& b);

/**
 * @brief Does `candidate` (the requested scope) match `target` (a service scope)?
 *
 * Default, RFC 3986, UUID and LDAP dialects: scheme and authority compare
 * case-insensitively, query and fragment are ignored, and the
 * percent-decoded path segments of the candidate must be a prefix of
 * those of the target. STRCMP requires exact equality. Any other
 * dialect never matches.
 */
SDCDISCO_WSD_API bool matchScope(const std::string& candidate, const std::string& target,
                                 const std::string& matchBy);

/**
 * @brief Every requested type and every requested scope must match.
 *
 * A std::nullopt filter disables that dimension.
 */
SDCDISCO_WSD_API bool matchesFilter(const Service& service, const TypeFilter& types,
                                    const ScopeFilter& scopes);

SDCDISCO_WSD_API std::vector<Service> filterServices(const std::vector<Service>& services,
                                                     const TypeFilter& types,
                                                     const ScopeFilter& scopes);

}  // namespace wsd
}  // namespace sdcdisco
