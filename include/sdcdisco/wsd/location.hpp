/**
 * @file location.hpp
 * @brief SDC location context as a discovery scope.
 *
 * A location is published as a scope like
 * `sdc.ctxt.loc:/sdc.ctxt.loc.detail/HOSP1%2Fb1%2F1%2FCU1%2Fr2%2FBed?fac=HOSP1&bldng=b1&flr=1&poc=CU1&rm=r2&bed=Bed`.
 * The path carries all six identifiers (empty ones included), the
 * query only the set ones.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/wsd/export.hpp"
#include "sdcdisco/wsd/service.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sdcdisco {
namespace wsd {

/**
 * @brief A scope string is not an SDC location.
 */
class SDCDISCO_WSD_API LocationParseError : public std::runtime_error {
public:
    explicit LocationParseError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @struct SdcLocation
 * @brief Facility / building / point of care / floor / room / bed.
 */
struct SDCDISCO_WSD_API SdcLocation {
    static constexpr const char* SCHEME = "sdc.ctxt.loc";
    static constexpr const char* DETAIL_ROOT = "sdc.ctxt.loc.detail";

    std::string root = DETAIL_ROOT;
    std::optional<std::string> fac;   ///< Facility
    std::optional<std::string> bld;   ///< Building
    std::optional<std::string> poc;   ///< Point of care
    std::optional<std::string> flr;   ///< Floor
    std::optional<std::string> rm;    ///< Room
    std::optional<std::string> bed;

    /**
     * @brief The location as discovery scope URI.
     */
    std::string scopeString() const;

    /**
     * @brief Identifiers joined with '/' (the extension of a location context).
     */
    std::string extensionString() const;

    /**
     * @throws LocationParseError for another scheme or a malformed path.
     */
    static SdcLocation fromScopeString(const std::string& scope);

    /**
     * @brief True if `other` lies inside this location.
     *
     * Roots must be equal; every identifier set here must be equal in
     * `other`. Unset identifiers match anything.
     */
    bool contains(const SdcLocation& other) const;

    /**
     * @brief Services with at least one location scope inside this location.
     */
    std::vector<Service> filterServicesInside(const std::vector<Service>& services) const;

    bool operator==(const SdcLocation& other) const;
    bool operator!=(const SdcLocation& other) const { return !(*this == other); }
};

}  // namespace wsd
}  // namespace sdcdisco
