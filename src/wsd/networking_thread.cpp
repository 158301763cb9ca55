/**
 * @file networking_thread.cpp
 * @brief NetworkingThread implementation.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/wsd/networking_thread.hpp"
#include "sdcdisco/wsd/codec.hpp"
#include "sdcdisco/utils/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace sdcdisco {
namespace wsd {

namespace {

constexpr size_t BUFFER_SIZE = 0xffff;
constexpr int SELECT_TIMEOUT_MS = 100;
constexpr auto SEND_LOOP_IDLE_SLEEP = std::chrono::milliseconds(100);
constexpr auto SEND_LOOP_BUSY_SLEEP = std::chrono::milliseconds(10);

// Messages of the 2005/04 draft are not answered
constexpr const char* LEGACY_DISCOVERY_NS = "http://schemas.xmlsoap.org/ws/2005/04/discovery";

}  // namespace

// =============================================================================
// Send Schedule
// =============================================================================

std::vector<SteadyTime> computeSendSchedule(SteadyTime now, std::chrono::milliseconds initialDelay,
                                            const RepeatParams& params, std::mt19937& rng) {
    std::vector<SteadyTime> times;
    times.reserve(static_cast<size_t>(std::max(params.repeat, 0)) + 1);

    SteadyTime t = now + initialDelay;
    times.push_back(t);

    auto lo = params.min_delay.count();
    auto hi = std::max(params.max_delay.count(), lo);
    std::uniform_int_distribution<long long> dist(lo, hi);
    std::chrono::milliseconds gap(dist(rng));

    for (int i = 0; i < params.repeat; ++i) {
        t += gap;
        times.push_back(t);
        gap = std::min(gap * 2, params.upper_delay);
    }
    return times;
}

// =============================================================================
// MessageIdCache
// =============================================================================

MessageIdCache::MessageIdCache(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1))
{}

bool MessageIdCache::insert(const std::string& messageId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ids_.count(messageId) != 0) {
        return false;
    }
    order_.push_back(messageId);
    ids_.insert(messageId);
    while (order_.size() > capacity_) {
        ids_.erase(order_.front());
        order_.pop_front();
    }
    return true;
}

bool MessageIdCache::contains(const std::string& messageId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.count(messageId) != 0;
}

size_t MessageIdCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

// =============================================================================
// Lifecycle
// =============================================================================

NetworkingThread::NetworkingThread(const DiscoveryConfig& config, EnvelopeObserver& observer)
    : config_(config)
    , observer_(observer)
    , sendSequence_(0)
    , rng_(std::random_device{}())
    , knownIds_(config.message_id_cache_size)
    , ownIds_(config.own_message_id_cache_size)
{}

NetworkingThread::~NetworkingThread() {
    stop();
}

void NetworkingThread::start() {
    if (running_.load()) {
        LOG_WARN("Networking", "Already running");
        return;
    }

    auto unicastOut = std::make_shared<net::UdpSocket>();
    if (!unicastOut->isValid() || !unicastOut->bind(0)) {
        throw std::runtime_error("cannot create unicast send socket (error " +
                                 std::to_string(unicastOut->getLastError()) + ")");
    }
    unicastOut->setMulticastTTL(config_.multicast_ttl);
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        unicastOut_ = std::move(unicastOut);
    }

    stopRequested_.store(false);
    running_.store(true);

    receiverThread_ = std::thread(&NetworkingThread::receiverLoop, this);
    queueThread_ = std::thread(&NetworkingThread::queueLoop, this);
    senderThread_ = std::thread(&NetworkingThread::senderLoop, this);

    LOG_INFO("Networking", "Started on {}:{}", config_.mcast_addr, config_.mcast_port);
}

void NetworkingThread::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Networking", "Stopping, {} datagrams left to send", pendingSends());
    {
        std::lock_guard<std::mutex> lock(sendMutex_);
        stopRequested_.store(true);
    }
    recvCv_.notify_all();

    if (senderThread_.joinable()) {
        senderThread_.join();
    }
    if (receiverThread_.joinable()) {
        receiverThread_.join();
    }
    if (queueThread_.joinable()) {
        queueThread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        sockets_.clear();
        unicastOut_.reset();
    }
    {
        std::lock_guard<std::mutex> lock(recvMutex_);
        recvQueue_.clear();
    }
    LOG_INFO("Networking", "Stopped");
}

// =============================================================================
// Socket Management
// =============================================================================

bool NetworkingThread::addSourceAddress(const std::string& address) {
    std::lock_guard<std::mutex> lock(socketsMutex_);
    if (sockets_.count(address) != 0) {
        return true;
    }

    SocketPair pair;
    pair.multicastIn = std::make_shared<net::UdpSocket>();
    if (!pair.multicastIn->isValid()) {
        return false;
    }
    if (!pair.multicastIn->setReuseAddress(true)) {
        LOG_WARN("Networking", "Address reuse not available on {}", address);
    }
#ifdef _WIN32
    const std::string bindAddress = address;
#else
    const std::string bindAddress = config_.mcast_addr;
#endif
    if (!pair.multicastIn->bind(config_.mcast_port, bindAddress)) {
        LOG_ERROR("Networking", "Cannot listen on {}:{} for {}", bindAddress, config_.mcast_port, address);
        return false;
    }
    if (!pair.multicastIn->joinMulticastGroup(config_.mcast_addr, address)) {
        LOG_ERROR("Networking", "Could not join {} on {}, multicast reception may not work",
                  config_.mcast_addr, address);
    }

    pair.multicastOut = std::make_shared<net::UdpSocket>();
    if (!pair.multicastOut->isValid() || !pair.multicastOut->bind(0, address)) {
        LOG_ERROR("Networking", "Cannot bind send socket to {}", address);
        return false;
    }
    if (!pair.multicastOut->setMulticastInterface(address)) {
        LOG_ERROR("Networking", "Cannot select {} for outgoing multicast", address);
    }
    pair.multicastOut->setMulticastTTL(config_.multicast_ttl);
    pair.multicastOut->setMulticastLoopback(true);
    pair.outAddress = pair.multicastOut->getLocalAddress();

    LOG_INFO("Networking", "Listening on {} (multicast {}:{}, unicast {})",
             address, config_.mcast_addr, config_.mcast_port, pair.outAddress.toString());
    sockets_[address] = std::move(pair);
    return true;
}

void NetworkingThread::removeSourceAddress(const std::string& address) {
    std::lock_guard<std::mutex> lock(socketsMutex_);
    // the receiver may still hold references; sockets close with the last one
    if (sockets_.erase(address) != 0) {
        LOG_INFO("Networking", "Removed sockets of {}", address);
    }
}

std::vector<std::string> NetworkingThread::getActiveAddresses() const {
    std::lock_guard<std::mutex> lock(socketsMutex_);
    std::vector<std::string> result;
    result.reserve(sockets_.size());
    for (const auto& [address, pair] : sockets_) {
        result.push_back(address);
    }
    return result;
}

bool NetworkingThread::isOwnDatagram(const net::SocketAddress& from) const {
    std::lock_guard<std::mutex> lock(socketsMutex_);
    for (const auto& [address, pair] : sockets_) {
        if (from.ip == address && from.port == pair.outAddress.port) {
            return true;
        }
    }
    return false;
}

// =============================================================================
// Sending
// =============================================================================

void NetworkingThread::sendUnicast(const Envelope& env, const std::string& host, uint16_t port,
                                   std::chrono::milliseconds initialDelay) {
    enqueueSend(env, net::SocketAddress(host, port), false, initialDelay, config_.unicast_repeat);
}

void NetworkingThread::sendMulticast(const Envelope& env, std::chrono::milliseconds initialDelay) {
    enqueueSend(env, net::SocketAddress(config_.mcast_addr, config_.mcast_port), true,
                initialDelay, config_.multicast_repeat);
}

void NetworkingThread::enqueueSend(const Envelope& env, const net::SocketAddress& dest, bool multicast,
                                   std::chrono::milliseconds initialDelay, const RepeatParams& params) {
    auto message = std::make_shared<OutboundMessage>();
    message->payload = encodeEnvelope(env);
    message->messageId = env.message_id;
    message->actionName = actionName(env.action);
    message->dest = dest;
    message->multicast = multicast;

    std::lock_guard<std::mutex> lock(sendMutex_);
    if (!running_.load() || stopRequested_.load()) {
        LOG_WARN("Networking", "Not running, dropping {} to {}", message->actionName, dest.toString());
        return;
    }

    // our own copies looped back by the network are not processed
    ownIds_.insert(env.message_id);

    auto times = computeSendSchedule(std::chrono::steady_clock::now(), initialDelay, params, rng_);
    for (size_t i = 0; i < times.size(); ++i) {
        sendQueue_.push(QueuedSend{times[i], sendSequence_++, static_cast<int>(i), message});
    }
    LOG_DEBUG("Networking", "Queued {} {} to {} ({} copies)", message->actionName,
              message->messageId, dest.toString(), times.size());
}

size_t NetworkingThread::pendingSends() const {
    std::lock_guard<std::mutex> lock(sendMutex_);
    return sendQueue_.size();
}

void NetworkingThread::senderLoop() {
    LOG_DEBUG("Networking", "Sender thread started");

    while (true) {
        bool haveItem = false;
        bool idle = false;
        QueuedSend item{};
        {
            std::lock_guard<std::mutex> lock(sendMutex_);
            if (sendQueue_.empty()) {
                if (stopRequested_.load()) {
                    break;
                }
                idle = true;
            } else if (sendQueue_.top().sendTime <= std::chrono::steady_clock::now()) {
                item = sendQueue_.top();
                sendQueue_.pop();
                haveItem = true;
            }
        }

        if (haveItem) {
            transmit(item);
        } else {
            std::this_thread::sleep_for(idle ? SEND_LOOP_IDLE_SLEEP : SEND_LOOP_BUSY_SLEEP);
        }
    }

    LOG_DEBUG("Networking", "Sender thread stopped");
}

void NetworkingThread::transmit(const QueuedSend& item) {
    const OutboundMessage& msg = *item.message;

    std::vector<std::shared_ptr<net::UdpSocket>> sockets;
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        if (msg.multicast) {
            for (const auto& [address, pair] : sockets_) {
                sockets.push_back(pair.multicastOut);
            }
        } else if (unicastOut_) {
            sockets.push_back(unicastOut_);
        }
    }

    if (sockets.empty()) {
        LOG_WARN("Networking", "No socket to send {} to {}", msg.actionName, msg.dest.toString());
        return;
    }

    for (const auto& sock : sockets) {
        int sent = sock->sendTo(msg.dest, msg.payload.data(), msg.payload.size());
        if (sent < 0) {
            LOG_ERROR("Networking", "Sending {} to {} failed: error {}",
                      msg.actionName, msg.dest.toString(), sock->getLastError());
        } else {
            LOG_TRACE("Networking", "Sent {} copy {} ({} bytes) to {} id={}", msg.actionName,
                      item.copy, sent, msg.dest.toString(), msg.messageId);
        }
    }
}

// =============================================================================
// Receiving
// =============================================================================

void NetworkingThread::receiverLoop() {
    LOG_DEBUG("Networking", "Receiver thread started");
    std::vector<char> buffer(BUFFER_SIZE);

    while (!stopRequested_.load()) {
        std::vector<std::shared_ptr<net::UdpSocket>> sockets;
        {
            std::lock_guard<std::mutex> lock(socketsMutex_);
            for (const auto& [address, pair] : sockets_) {
                sockets.push_back(pair.multicastIn);
                sockets.push_back(pair.multicastOut);
            }
            if (unicastOut_) {
                sockets.push_back(unicastOut_);
            }
        }
        if (sockets.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(SELECT_TIMEOUT_MS));
            continue;
        }

        std::vector<net::SocketHandle> handles;
        for (const auto& sock : sockets) {
            handles.push_back(sock->handle());
        }
        auto ready = net::UdpSocket::waitReadable(handles, SELECT_TIMEOUT_MS);

        for (const auto& sock : sockets) {
            if (std::find(ready.begin(), ready.end(), sock->handle()) == ready.end()) {
                continue;
            }
            net::SocketAddress from;
            int received = sock->receiveFrom(buffer.data(), buffer.size(), 0, from);
            if (received < 0) {
                LOG_WARN("Networking", "Socket read error {}", sock->getLastError());
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }
            if (received == 0) {
                continue;
            }
            if (isOwnDatagram(from)) {
                LOG_TRACE("Networking", "Ignoring own datagram from {}", from.toString());
                continue;
            }
            enqueueReceived(from, std::string(buffer.data(), static_cast<size_t>(received)));
        }
    }

    LOG_DEBUG("Networking", "Receiver thread stopped");
}

void NetworkingThread::enqueueReceived(const net::SocketAddress& from, std::string data) {
    {
        std::lock_guard<std::mutex> lock(recvMutex_);
        if (recvQueue_.size() >= config_.receive_queue_capacity) {
            LOG_WARN("Networking", "Receive queue full, dropping datagram from {}", from.toString());
            return;
        }
        recvQueue_.emplace_back(from, std::move(data));
    }
    recvCv_.notify_one();
}

void NetworkingThread::queueLoop() {
    LOG_DEBUG("Networking", "Queue reader thread started");

    while (true) {
        std::pair<net::SocketAddress, std::string> item;
        {
            std::unique_lock<std::mutex> lock(recvMutex_);
            recvCv_.wait_for(lock, std::chrono::milliseconds(SELECT_TIMEOUT_MS), [this]() {
                return !recvQueue_.empty() || stopRequested_.load();
            });
            if (stopRequested_.load()) {
                break;
            }
            if (recvQueue_.empty()) {
                continue;
            }
            item = std::move(recvQueue_.front());
            recvQueue_.pop_front();
        }
        processDatagram(item.first, item.second);
    }

    LOG_DEBUG("Networking", "Queue reader thread stopped");
}

void NetworkingThread::processDatagram(const net::SocketAddress& from, const std::string& data) {
    if (data.find(LEGACY_DISCOVERY_NS) != std::string::npos) {
        LOG_DEBUG("Networking", "Ignoring 2005/04 discovery message from {}", from.toString());
        return;
    }

    auto env = decodeEnvelope(data, from.toString());
    if (!env) {
        return;
    }
    if (!env->message_id.empty() && ownIds_.contains(env->message_id)) {
        LOG_DEBUG("Networking", "Own {} echoed from {}", actionName(env->action), from.toString());
        return;
    }
    if (!env->message_id.empty() && !knownIds_.insert(env->message_id)) {
        LOG_DEBUG("Networking", "Duplicate {} from {} id={}", actionName(env->action),
                  from.toString(), env->message_id);
        return;
    }

    LOG_DEBUG("Networking", "Received {} from {} id={}", actionName(env->action),
              from.toString(), env->message_id);
    try {
        observer_.onEnvelopeReceived(*env, from);
    } catch (const std::exception& e) {
        LOG_ERROR("Networking", "Handling {} from {} failed: {}", actionName(env->action),
                  from.toString(), e.what());
    }
}

}  // namespace wsd
}  // namespace sdcdisco
