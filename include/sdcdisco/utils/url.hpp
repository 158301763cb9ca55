/**
 * @file url.hpp
 * @brief URL splitting and percent-encoding helpers.
 *
 * Used by scope matching, location scopes and the HTTP client.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/utils/export.hpp"

#include <string>
#include <utility>
#include <vector>

namespace sdcdisco {
namespace utils {

/**
 * @struct UrlParts
 * @brief Components of `scheme:[//netloc]path[?query][#fragment]`.
 *
 * The scheme is lower-cased; everything else is kept verbatim.
 */
struct SDCDISCO_UTILS_API UrlParts {
    std::string scheme;
    std::string netloc;
    std::string path;
    std::string query;
    std::string fragment;
};

using QueryItems = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Split a URL. Never fails; a string without a valid scheme
 * is returned as a bare path.
 */
SDCDISCO_UTILS_API UrlParts splitUrl(const std::string& url);

/**
 * @brief Decode %XX escapes. Malformed escapes are kept literally.
 * @param plusAsSpace Also turn '+' into ' ' (form encoding).
 */
SDCDISCO_UTILS_API std::string percentDecode(const std::string& text, bool plusAsSpace = false);

/**
 * @brief Escape every byte except unreserved characters and `safe`.
 */
SDCDISCO_UTILS_API std::string percentEncode(const std::string& text, const std::string& safe = "/");

/**
 * @brief Form encoding: like percentEncode with no safe characters, spaces become '+'.
 */
SDCDISCO_UTILS_API std::string quotePlus(const std::string& text);

/**
 * @brief Parse `a=1&b=2` into ordered key/value pairs; empty values are dropped.
 */
SDCDISCO_UTILS_API QueryItems parseQuery(const std::string& query);

/**
 * @brief Build `a=1&b=2` with form encoding.
 */
SDCDISCO_UTILS_API std::string encodeQuery(const QueryItems& items);

/**
 * @brief ASCII lower-case copy.
 */
SDCDISCO_UTILS_API std::string toLower(std::string text);

}  // namespace utils
}  // namespace sdcdisco
