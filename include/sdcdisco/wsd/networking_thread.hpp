/**
 * @file networking_thread.hpp
 * @brief UDP transport of the discovery engine.
 *
 * NetworkingThread runs three background threads:
 * - Receiver: select() over every registered socket, queues raw datagrams
 * - Queue reader: decodes, drops duplicates, hands envelopes to the observer
 * - Sender: transmits the time-ordered send queue, including retransmissions
 *
 * Each local address gets a socket pair: a multicast listener bound to
 * the group port, and a socket bound to (address, ephemeral port) that
 * sends multicast on that interface and receives unicast replies.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/net/udp_socket.hpp"
#include "sdcdisco/wsd/config.hpp"
#include "sdcdisco/wsd/export.hpp"
#include "sdcdisco/wsd/message_transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <random>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

namespace sdcdisco {
namespace wsd {

using SteadyTime = std::chrono::steady_clock::time_point;

/**
 * @brief Times at which the copies of one logical send go out.
 * @return 1 + params.repeat ascending time points.
 */
SDCDISCO_WSD_API std::vector<SteadyTime> computeSendSchedule(SteadyTime now,
                                                             std::chrono::milliseconds initialDelay,
                                                             const RepeatParams& params,
                                                             std::mt19937& rng);

/**
 * @class MessageIdCache
 * @brief Bounded FIFO set of recently seen message ids. Thread-safe.
 */
class SDCDISCO_WSD_API MessageIdCache {
public:
    explicit MessageIdCache(size_t capacity);

    /**
     * @brief Record an id.
     * @return False if it was already present.
     */
    bool insert(const std::string& messageId);

    bool contains(const std::string& messageId) const;
    size_t size() const;

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<std::string> order_;
    std::unordered_set<std::string> ids_;
};

/**
 * @class NetworkingThread
 * @brief MessageTransport over IPv4 UDP multicast.
 *
 * Usage:
 * @code
 * NetworkingThread transport(config, observer);
 * transport.start();
 * transport.addSourceAddress("192.168.1.20");
 * transport.sendMulticast(hello, std::chrono::milliseconds(120));
 * transport.stop();  // flushes pending sends
 * @endcode
 */
class SDCDISCO_WSD_API NetworkingThread : public MessageTransport {
public:
    NetworkingThread(const DiscoveryConfig& config, EnvelopeObserver& observer);
    ~NetworkingThread() override;

    NetworkingThread(const NetworkingThread&) = delete;
    NetworkingThread& operator=(const NetworkingThread&) = delete;

    /**
     * @throws std::runtime_error if the unicast send socket cannot be created.
     */
    void start() override;
    void stop() override;
    bool isRunning() const { return running_.load(); }

    bool addSourceAddress(const std::string& address) override;
    void removeSourceAddress(const std::string& address) override;
    std::vector<std::string> getActiveAddresses() const override;

    void sendUnicast(const Envelope& env, const std::string& host, uint16_t port,
                     std::chrono::milliseconds initialDelay) override;
    void sendMulticast(const Envelope& env, std::chrono::milliseconds initialDelay) override;

    /**
     * @brief Queue a raw datagram for decoding as if it had been received.
     *
     * This is the receiver thread's hand-off point.
     */
    void enqueueReceived(const net::SocketAddress& from, std::string data);

    /**
     * @brief Number of datagrams (including retransmissions) not yet sent.
     */
    size_t pendingSends() const;

private:
    struct SocketPair {
        std::shared_ptr<net::UdpSocket> multicastIn;
        std::shared_ptr<net::UdpSocket> multicastOut;
        net::SocketAddress outAddress;
    };

    struct OutboundMessage {
        std::string payload;
        std::string messageId;
        std::string actionName;
        net::SocketAddress dest;
        bool multicast;
    };

    struct QueuedSend {
        SteadyTime sendTime;
        uint64_t sequence;
        int copy;
        std::shared_ptr<const OutboundMessage> message;

        bool operator>(const QueuedSend& other) const {
            if (sendTime != other.sendTime) {
                return sendTime > other.sendTime;
            }
            return sequence > other.sequence;
        }
    };

    DiscoveryConfig config_;
    EnvelopeObserver& observer_;

    // Sockets
    mutable std::mutex socketsMutex_;
    std::map<std::string, SocketPair> sockets_;
    std::shared_ptr<net::UdpSocket> unicastOut_;

    // Receive queue
    std::mutex recvMutex_;
    std::condition_variable recvCv_;
    std::deque<std::pair<net::SocketAddress, std::string>> recvQueue_;

    // Send queue
    mutable std::mutex sendMutex_;
    std::priority_queue<QueuedSend, std::vector<QueuedSend>, std::greater<QueuedSend>> sendQueue_;
    uint64_t sendSequence_;
    std::mt19937 rng_;

    MessageIdCache knownIds_;   // received
    MessageIdCache ownIds_;     // sent by this transport

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};

    std::thread receiverThread_;
    std::thread queueThread_;
    std::thread senderThread_;

    void receiverLoop();
    void queueLoop();
    void senderLoop();

    void enqueueSend(const Envelope& env, const net::SocketAddress& dest, bool multicast,
                     std::chrono::milliseconds initialDelay, const RepeatParams& params);
    void transmit(const QueuedSend& item);
    bool isOwnDatagram(const net::SocketAddress& from) const;
    void processDatagram(const net::SocketAddress& from, const std::string& data);
};

}  // namespace wsd
}  // namespace sdcdisco
