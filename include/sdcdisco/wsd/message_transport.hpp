/**
 * @file message_transport.hpp
 * @brief Seam between the discovery state machine and the network.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/net/udp_socket.hpp"
#include "sdcdisco/wsd/export.hpp"
#include "sdcdisco/wsd/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace sdcdisco {
namespace wsd {

/**
 * @class EnvelopeObserver
 * @brief Receives every decoded, de-duplicated inbound envelope.
 *
 * Called from the transport's queue-processing thread.
 */
class SDCDISCO_WSD_API EnvelopeObserver {
public:
    virtual ~EnvelopeObserver() = default;

    virtual void onEnvelopeReceived(const Envelope& env, const net::SocketAddress& from) = 0;
};

/**
 * @class MessageTransport
 * @brief Sends envelopes and manages the per-address sockets.
 *
 * Sends are asynchronous: they enqueue the encoded envelope together
 * with its retransmissions and return.
 */
class SDCDISCO_WSD_API MessageTransport {
public:
    virtual ~MessageTransport() = default;

    virtual void start() = 0;

    /**
     * @brief Stop all threads; pending sends are flushed first.
     */
    virtual void stop() = 0;

    /**
     * @brief Open the socket pair for a local address.
     * @return False if the sockets could not be set up.
     */
    virtual bool addSourceAddress(const std::string& address) = 0;

    virtual void removeSourceAddress(const std::string& address) = 0;

    virtual std::vector<std::string> getActiveAddresses() const = 0;

    /**
     * @throws UnsupportedActionError if the envelope cannot be encoded.
     */
    virtual void sendUnicast(const Envelope& env, const std::string& host, uint16_t port,
                             std::chrono::milliseconds initialDelay) = 0;

    /**
     * @brief Send on every registered local address.
     * @throws UnsupportedActionError if the envelope cannot be encoded.
     */
    virtual void sendMulticast(const Envelope& env, std::chrono::milliseconds initialDelay) = 0;
};

}  // namespace wsd
}  // namespace sdcdisco
