/**
 * @file matching.cpp
 * @brief Matching rule implementation.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/wsd/matching.hpp"
#include "sdcdisco/utils/url.hpp"

#include <algorithm>
#include <iterator>

namespace sdcdisco {
namespace wsd {

namespace {

std::vector<std::string> decodedSegments(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        auto slash = path.find('/', start);
        segments.push_back(utils::percentDecode(path.substr(start, slash == std::string::npos
                                                                   ? std::string::npos
                                                                   : slash - start)));
        if (slash == std::string::npos) {
            return segments;
        }
        start = slash + 1;
    }
}

bool matchUri(const std::string& candidate, const std::string& target) {
    utils::UrlParts c = utils::splitUrl(candidate);
    utils::UrlParts t = utils::splitUrl(target);

    if (c.scheme != t.scheme || utils::toLower(c.netloc) != utils::toLower(t.netloc)) {
        return false;
    }
    if (c.path == t.path) {
        return true;
    }

    auto cSegments = decodedSegments(c.path);
    auto tSegments = decodedSegments(t.path);
    if (cSegments.size() > tSegments.size()) {
        return false;
    }
    return std::equal(cSegments.begin(), cSegments.end(), tSegments.begin());
}

}  // namespace

bool matchType(const QName& a, const QName& b) {
    return a == b;
}

bool matchScope(const std::string& candidate, const std::string& target,
                const std::string& matchBy) {
    if (matchBy.empty() || matchBy == match_by::URI || matchBy == match_by::UUID ||
        matchBy == match_by::LDAP) {
        return matchUri(candidate, target);
    }
    if (matchBy == match_by::STRCMP) {
        return candidate == target;
    }
    return false;
}

bool matchesFilter(const Service& service, const TypeFilter& types, const ScopeFilter& scopes) {
    if (types) {
        for (const auto& wanted : *types) {
            bool found = std::any_of(service.types.begin(), service.types.end(),
                                     [&](const QName& t) { return matchType(wanted, t); });
            if (!found) {
                return false;
            }
        }
    }
    if (scopes) {
        for (const auto& wanted : *scopes) {
            bool found = std::any_of(service.scopes.begin(), service.scopes.end(),
                                     [&](const Scope& s) {
                                         return matchScope(wanted.value, s.value, wanted.match_by);
                                     });
            if (!found) {
                return false;
            }
        }
    }
    return true;
}

std::vector<Service> filterServices(const std::vector<Service>& services,
                                    const TypeFilter& types, const ScopeFilter& scopes) {
    std::vector<Service> result;
    std::copy_if(services.begin(), services.end(), std::back_inserter(result),
                 [&](const Service& s) { return matchesFilter(s, types, scopes); });
    return result;
}

}  // namespace wsd
}  // namespace sdcdisco
