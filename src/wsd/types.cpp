/**
 * @file types.cpp
 * @brief Wire model helpers.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/wsd/types.hpp"
#include "sdcdisco/utils/uuid.hpp"

#include <cstring>

namespace sdcdisco {
namespace wsd {

std::string Scope::quotedValue() const {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == ' ') {
            out += "%20";
        } else {
            out += c;
        }
    }
    return out;
}

Envelope::Envelope()
    : message_id(utils::UUIDGenerator::generateUrn())
{}

Envelope::Envelope(std::string action_)
    : action(std::move(action_))
    , message_id(utils::UUIDGenerator::generateUrn())
{}

bool Envelope::isSuppression() const {
    // an undeclared prefix decodes with an empty namespace
    return relationship_type.local_name == "Suppression" &&
           (relationship_type.ns == ns::DISCOVERY || relationship_type.ns.empty());
}

std::string actionName(const std::string& action) {
    std::string prefix = std::string(ns::DISCOVERY) + "/";
    if (action.compare(0, prefix.size(), prefix) == 0) {
        return action.substr(prefix.size());
    }
    return action;
}

bool isKnownAction(const std::string& action) {
    for (const char* known : {action::HELLO, action::BYE, action::PROBE, action::PROBE_MATCHES,
                              action::RESOLVE, action::RESOLVE_MATCHES}) {
        if (action == known) {
            return true;
        }
    }
    return false;
}

}  // namespace wsd
}  // namespace sdcdisco
