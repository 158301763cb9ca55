/**
 * @file uuid.hpp
 * @brief UUID v4 generation for WS-Addressing message identifiers.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/utils/export.hpp"

#include <string>

namespace sdcdisco {
namespace utils {

/**
 * @class UUIDGenerator
 * @brief Thread-safe RFC 4122 version 4 UUID generator.
 *
 * Usage:
 * @code
 * std::string id = UUIDGenerator::generate();     // "550e8400-e29b-41d4-a716-446655440000"
 * std::string msgId = UUIDGenerator::generateUrn(); // "urn:uuid:550e8400-..."
 * @endcode
 */
class SDCDISCO_UTILS_API UUIDGenerator {
public:
    /**
     * @brief Generate a new random UUID v4 in canonical lower-case form.
     */
    static std::string generate();

    /**
     * @brief Generate a new UUID v4 with the "urn:uuid:" prefix.
     */
    static std::string generateUrn();

    /**
     * @brief Check the 8-4-4-4-12 hex layout. A "urn:uuid:" prefix is accepted.
     */
    static bool isValid(const std::string& uuid);

    /**
     * @brief "00000000-0000-0000-0000-000000000000"
     */
    static std::string nil() {
        return "00000000-0000-0000-0000-000000000000";
    }
};

}  // namespace utils
}  // namespace sdcdisco
