/**
 * @file uuid.cpp
 * @brief UUIDGenerator implementation.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/utils/uuid.hpp"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace sdcdisco {
namespace utils {

namespace {
const std::string URN_PREFIX = "urn:uuid:";
}

std::string UUIDGenerator::generate() {
    thread_local std::random_device rd;
    thread_local std::mt19937_64 gen(rd());
    thread_local std::uniform_int_distribution<uint64_t> dist;

    uint64_t ab = dist(gen);
    uint64_t cd = dist(gen);

    // version 4, variant 10xx
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << ((ab >> 32) & 0xFFFFFFFF) << "-"
        << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-"
        << std::setw(4) << (ab & 0xFFFF) << "-"
        << std::setw(4) << ((cd >> 48) & 0xFFFF) << "-"
        << std::setw(12) << (cd & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

std::string UUIDGenerator::generateUrn() {
    return URN_PREFIX + generate();
}

bool UUIDGenerator::isValid(const std::string& uuid) {
    std::string body = uuid;
    if (body.compare(0, URN_PREFIX.size(), URN_PREFIX) == 0) {
        body = body.substr(URN_PREFIX.size());
    }
    if (body.length() != 36) {
        return false;
    }
    for (size_t i = 0; i < body.length(); ++i) {
        char c = body[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

}  // namespace utils
}  // namespace sdcdisco
