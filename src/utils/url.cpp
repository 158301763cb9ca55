/**
 * @file url.cpp
 * @brief URL helper implementation.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/utils/url.hpp"

#include <algorithm>
#include <cctype>

namespace sdcdisco {
namespace utils {

namespace {

bool isSchemeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

bool isUnreserved(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-' || c == '~';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void appendEscaped(std::string& out, unsigned char c) {
    static const char* HEX = "0123456789ABCDEF";
    out += '%';
    out += HEX[c >> 4];
    out += HEX[c & 0x0F];
}

}  // namespace

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

UrlParts splitUrl(const std::string& url) {
    UrlParts parts;
    std::string rest = url;

    auto colon = rest.find(':');
    if (colon != std::string::npos && colon > 0 &&
        std::isalpha(static_cast<unsigned char>(rest[0])) &&
        std::all_of(rest.begin(), rest.begin() + colon, isSchemeChar)) {
        parts.scheme = toLower(rest.substr(0, colon));
        rest = rest.substr(colon + 1);
    }

    if (rest.compare(0, 2, "//") == 0) {
        auto end = rest.find_first_of("/?#", 2);
        parts.netloc = rest.substr(2, end == std::string::npos ? std::string::npos : end - 2);
        rest = end == std::string::npos ? std::string() : rest.substr(end);
    }

    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        parts.fragment = rest.substr(hash + 1);
        rest.resize(hash);
    }
    auto question = rest.find('?');
    if (question != std::string::npos) {
        parts.query = rest.substr(question + 1);
        rest.resize(question);
    }
    parts.path = rest;
    return parts;
}

std::string percentDecode(const std::string& text, bool plusAsSpace) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '%' && i + 2 < text.size()) {
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        if (plusAsSpace && c == '+') {
            out += ' ';
        } else {
            out += c;
        }
    }
    return out;
}

std::string percentEncode(const std::string& text, const std::string& safe) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (isUnreserved(c) || safe.find(c) != std::string::npos) {
            out += c;
        } else {
            appendEscaped(out, static_cast<unsigned char>(c));
        }
    }
    return out;
}

std::string quotePlus(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == ' ') {
            out += '+';
        } else if (isUnreserved(c)) {
            out += c;
        } else {
            appendEscaped(out, static_cast<unsigned char>(c));
        }
    }
    return out;
}

QueryItems parseQuery(const std::string& query) {
    QueryItems items;
    size_t start = 0;
    while (start <= query.size()) {
        auto end = query.find_first_of("&;", start);
        if (end == std::string::npos) {
            end = query.size();
        }
        std::string field = query.substr(start, end - start);
        auto eq = field.find('=');
        if (eq != std::string::npos && eq + 1 < field.size()) {
            items.emplace_back(percentDecode(field.substr(0, eq), true),
                               percentDecode(field.substr(eq + 1), true));
        }
        start = end + 1;
    }
    return items;
}

std::string encodeQuery(const QueryItems& items) {
    std::string out;
    for (const auto& [key, value] : items) {
        if (!out.empty()) {
            out += '&';
        }
        out += quotePlus(key) + "=" + quotePlus(value);
    }
    return out;
}

}  // namespace utils
}  // namespace sdcdisco
