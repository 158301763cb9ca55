/**
 * @file location.cpp
 * @brief SdcLocation implementation.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/wsd/location.hpp"
#include "sdcdisco/utils/url.hpp"

#include <algorithm>
#include <utility>

namespace sdcdisco {
namespace wsd {

namespace {

// Order of the identifiers in path and query
struct Member {
    const char* urlName;
    std::optional<std::string> SdcLocation::*field;
};

constexpr Member MEMBERS[] = {
    {"fac", &SdcLocation::fac},
    {"bldng", &SdcLocation::bld},
    {"flr", &SdcLocation::flr},
    {"poc", &SdcLocation::poc},
    {"rm", &SdcLocation::rm},
    {"bed", &SdcLocation::bed},
};

}  // namespace

std::string SdcLocation::scopeString() const {
    std::string identifiers;
    utils::QueryItems query;
    bool first = true;
    for (const auto& m : MEMBERS) {
        const auto& value = this->*m.field;
        if (!first) {
            identifiers += "%2F";
        }
        first = false;
        if (value && !value->empty()) {
            identifiers += utils::percentEncode(*value);
            query.emplace_back(m.urlName, *value);
        }
    }

    std::string result = std::string(SCHEME) + ":/" + utils::percentEncode(root) + "/" + identifiers;
    if (!query.empty()) {
        result += "?" + utils::encodeQuery(query);
    }
    return result;
}

std::string SdcLocation::extensionString() const {
    std::string result;
    bool first = true;
    for (const auto& m : MEMBERS) {
        if (!first) {
            result += "/";
        }
        first = false;
        const auto& value = this->*m.field;
        if (value) {
            result += *value;
        }
    }
    return result;
}

SdcLocation SdcLocation::fromScopeString(const std::string& scope) {
    utils::UrlParts parts = utils::splitUrl(scope);
    if (parts.scheme != SCHEME) {
        throw LocationParseError("scheme \"" + parts.scheme + "\" not accepted, must be \"" + SCHEME + "\"");
    }

    // "/<root>/<identifiers>"
    if (parts.path.empty() || parts.path[0] != '/' ||
        std::count(parts.path.begin(), parts.path.end(), '/') != 2) {
        throw LocationParseError("malformed location path \"" + parts.path + "\"");
    }
    auto second = parts.path.find('/', 1);

    SdcLocation location;
    location.root = utils::percentDecode(parts.path.substr(1, second - 1));

    utils::QueryItems query = utils::parseQuery(parts.query);
    for (const auto& m : MEMBERS) {
        // a repeated key keeps its last value
        for (const auto& item : query) {
            if (item.first == m.urlName) {
                location.*m.field = item.second;
            }
        }
    }
    return location;
}

bool SdcLocation::contains(const SdcLocation& other) const {
    if (root != other.root) {
        return false;
    }
    for (const auto& m : MEMBERS) {
        const auto& mine = this->*m.field;
        if (mine && mine != other.*m.field) {
            return false;
        }
    }
    return true;
}

std::vector<Service> SdcLocation::filterServicesInside(const std::vector<Service>& services) const {
    std::vector<Service> result;
    for (const auto& service : services) {
        bool inside = std::any_of(service.scopes.begin(), service.scopes.end(), [this](const Scope& s) {
            try {
                return contains(fromScopeString(s.value));
            } catch (const LocationParseError&) {
                return false;
            }
        });
        if (inside) {
            result.push_back(service);
        }
    }
    return result;
}

bool SdcLocation::operator==(const SdcLocation& other) const {
    if (root != other.root) {
        return false;
    }
    return std::all_of(std::begin(MEMBERS), std::end(MEMBERS),
                       [&](const Member& m) { return this->*m.field == other.*m.field; });
}

}  // namespace wsd
}  // namespace sdcdisco
