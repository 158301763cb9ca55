/**
 * @file config.hpp
 * @brief Tunables of the discovery engine.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/wsd/export.hpp"
#include "sdcdisco/wsd/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace sdcdisco {
namespace wsd {

/**
 * @struct RepeatParams
 * @brief Retransmission schedule of one logical send (SOAP-over-UDP).
 *
 * The first copy goes out after the initial delay. `repeat` copies
 * follow; the first gap is random in [min_delay, max_delay] and each
 * further gap doubles, capped at upper_delay.
 */
struct SDCDISCO_WSD_API RepeatParams {
    int repeat;
    std::chrono::milliseconds min_delay;
    std::chrono::milliseconds max_delay;
    std::chrono::milliseconds upper_delay;

    RepeatParams(int repeat_, int minMs, int maxMs, int upperMs)
        : repeat(repeat_)
        , min_delay(minMs)
        , max_delay(maxMs)
        , upper_delay(upperMs)
    {}

    static RepeatParams unicast() { return RepeatParams(2, 50, 250, 500); }
    static RepeatParams multicast() { return RepeatParams(4, 50, 250, 500); }
};

/**
 * @struct DiscoveryConfig
 * @brief Configuration for WsDiscovery and its transport.
 */
struct SDCDISCO_WSD_API DiscoveryConfig {
    std::string mcast_addr;                      ///< Multicast group
    uint16_t mcast_port;                         ///< Multicast port (3702, other values for tests)
    int multicast_ttl;                           ///< TTL of outgoing multicast
    RepeatParams unicast_repeat;
    RepeatParams multicast_repeat;
    std::chrono::milliseconds app_max_delay;     ///< Upper bound of random Hello/ProbeMatches delay
    std::chrono::milliseconds address_check_interval;
    size_t receive_queue_capacity;
    size_t message_id_cache_size;                ///< Recently seen message ids kept for dedup
    size_t own_message_id_cache_size;            ///< Ids of our own sends, kept apart from the above

    // Fields included in ProbeMatch entries sent in reply to a Probe
    bool probe_match_include_epr;
    bool probe_match_include_types;
    bool probe_match_include_scopes;
    bool probe_match_include_x_addrs;

    DiscoveryConfig()
        : mcast_addr(MULTICAST_IPV4_ADDRESS)
        , mcast_port(MULTICAST_PORT)
        , multicast_ttl(15)
        , unicast_repeat(RepeatParams::unicast())
        , multicast_repeat(RepeatParams::multicast())
        , app_max_delay(500)
        , address_check_interval(5000)
        , receive_queue_capacity(10000)
        , message_id_cache_size(50)
        , own_message_id_cache_size(1000)
        , probe_match_include_epr(true)
        , probe_match_include_types(true)
        , probe_match_include_scopes(true)
        , probe_match_include_x_addrs(true)
    {}
};

}  // namespace wsd
}  // namespace sdcdisco
