/**
 * @file test_networking_thread.cpp
 * @brief Unit tests for the send schedule, duplicate suppression and the transport threads
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sdcdisco/net/udp_socket.hpp>
#include <sdcdisco/wsd/codec.hpp>
#include <sdcdisco/wsd/networking_thread.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace sdcdisco::wsd;
using sdcdisco::net::SocketAddress;
using sdcdisco::net::UdpSocket;
using namespace std::chrono_literals;

namespace {

// Records every dispatched envelope
class RecordingObserver : public EnvelopeObserver {
public:
    void onEnvelopeReceived(const Envelope& env, const SocketAddress& from) override {
        std::lock_guard<std::mutex> lock(mutex_);
        received_.push_back(env);
        lastFrom_ = from;
        cv_.notify_all();
    }

    bool waitForCount(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return received_.size() >= count; });
    }

    std::vector<Envelope> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Envelope> received_;
    SocketAddress lastFrom_;
};

Envelope makeHello(const std::string& epr) {
    Envelope hello(action::HELLO);
    hello.to = ADDRESS_ALL;
    hello.epr = epr;
    hello.types = {QName(ns::DPWS, "Device")};
    return hello;
}

}  // namespace

// =============================================================================
// Send schedule
// =============================================================================

TEST(SendScheduleTest, UnicastHasInitialPlusTwoRepeats) {
    std::mt19937 rng(1);
    auto now = std::chrono::steady_clock::now();
    auto times = computeSendSchedule(now, 0ms, RepeatParams::unicast(), rng);
    ASSERT_EQ(times.size(), 3u);
    EXPECT_EQ(times[0], now);
}

TEST(SendScheduleTest, MulticastGapsDoubleUpToCap) {
    auto now = std::chrono::steady_clock::now();
    for (unsigned seed = 0; seed < 50; ++seed) {
        std::mt19937 rng(seed);
        auto times = computeSendSchedule(now, 100ms, RepeatParams::multicast(), rng);
        ASSERT_EQ(times.size(), 5u);
        EXPECT_EQ(times[0], now + 100ms);

        auto first = times[1] - times[0];
        EXPECT_GE(first, 50ms);
        EXPECT_LE(first, 250ms);
        for (size_t i = 2; i < times.size(); ++i) {
            auto gap = times[i] - times[i - 1];
            auto previous = times[i - 1] - times[i - 2];
            EXPECT_EQ(gap, std::min<std::chrono::steady_clock::duration>(previous * 2, 500ms));
        }
    }
}

TEST(SendScheduleTest, ZeroRepeatsMeansSingleSend) {
    std::mt19937 rng(3);
    auto now = std::chrono::steady_clock::now();
    auto times = computeSendSchedule(now, 10ms, RepeatParams(0, 50, 250, 500), rng);
    ASSERT_EQ(times.size(), 1u);
    EXPECT_EQ(times[0], now + 10ms);
}

// =============================================================================
// MessageIdCache
// =============================================================================

TEST(MessageIdCacheTest, RejectsKnownIds) {
    MessageIdCache cache(50);
    EXPECT_TRUE(cache.insert("urn:uuid:1"));
    EXPECT_FALSE(cache.insert("urn:uuid:1"));
    EXPECT_TRUE(cache.contains("urn:uuid:1"));
    EXPECT_EQ(cache.size(), 1u);
}

TEST(MessageIdCacheTest, EvictsOldestFirst) {
    MessageIdCache cache(3);
    cache.insert("a");
    cache.insert("b");
    cache.insert("c");
    cache.insert("d");

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_FALSE(cache.contains("a"));
    EXPECT_TRUE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("d"));
    // an evicted id is accepted again
    EXPECT_TRUE(cache.insert("a"));
}

// =============================================================================
// NetworkingThread
// =============================================================================

class NetworkingThreadTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.app_max_delay = 0ms;
        config_.mcast_port = 53702;
        transport_ = std::make_unique<NetworkingThread>(config_, observer_);
        transport_->start();
    }

    void TearDown() override {
        transport_->stop();
    }

    DiscoveryConfig config_;
    RecordingObserver observer_;
    std::unique_ptr<NetworkingThread> transport_;
};

TEST_F(NetworkingThreadTest, RetransmittedDatagramIsDispatchedOnce) {
    std::string payload = encodeEnvelope(makeHello("urn:uuid:a"));
    SocketAddress from("10.0.0.99", 3702);

    transport_->enqueueReceived(from, payload);
    transport_->enqueueReceived(from, payload);
    transport_->enqueueReceived(from, encodeEnvelope(makeHello("urn:uuid:b")));

    ASSERT_TRUE(observer_.waitForCount(2, 2s));
    std::this_thread::sleep_for(100ms);
    auto received = observer_.received();
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0].epr, "urn:uuid:a");
    EXPECT_EQ(received[1].epr, "urn:uuid:b");
}

TEST_F(NetworkingThreadTest, MalformedAndLegacyDatagramsAreDropped) {
    SocketAddress from("10.0.0.99", 3702);
    transport_->enqueueReceived(from, "<garbage");
    transport_->enqueueReceived(from, "<x xmlns=\"http://schemas.xmlsoap.org/ws/2005/04/discovery\"/>");
    transport_->enqueueReceived(from, encodeEnvelope(makeHello("urn:uuid:c")));

    ASSERT_TRUE(observer_.waitForCount(1, 2s));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(observer_.received().size(), 1u);
}

TEST_F(NetworkingThreadTest, OwnMessagesAreNotDispatched) {
    UdpSocket sink;
    ASSERT_TRUE(sink.bind(0, "127.0.0.1"));

    Envelope hello = makeHello("urn:uuid:own");
    transport_->sendUnicast(hello, "127.0.0.1", sink.getLocalPort(), 0ms);
    transport_->enqueueReceived(SocketAddress("10.0.0.99", 3702), encodeEnvelope(hello));

    std::this_thread::sleep_for(200ms);
    EXPECT_TRUE(observer_.received().empty());
}

TEST_F(NetworkingThreadTest, UnicastIsRepeatedWithSameMessageId) {
    UdpSocket sink;
    ASSERT_TRUE(sink.bind(0, "127.0.0.1"));

    Envelope probe(action::PROBE);
    probe.to = ADDRESS_ALL;
    transport_->sendUnicast(probe, "127.0.0.1", sink.getLocalPort(), 0ms);

    std::set<std::string> ids;
    int copies = 0;
    char buffer[65536];
    for (int i = 0; i < 3; ++i) {
        SocketAddress from;
        int n = sink.receiveFrom(buffer, sizeof(buffer), 2000, from);
        ASSERT_GT(n, 0) << "copy " << i;
        auto decoded = decodeEnvelope(std::string(buffer, static_cast<size_t>(n)), from.toString());
        ASSERT_TRUE(decoded.has_value());
        ids.insert(decoded->message_id);
        ++copies;
    }
    EXPECT_EQ(copies, 3);
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(*ids.begin(), probe.message_id);
}

TEST_F(NetworkingThreadTest, StopDrainsPendingSends) {
    UdpSocket sink;
    ASSERT_TRUE(sink.bind(0, "127.0.0.1"));

    transport_->sendUnicast(makeHello("urn:uuid:d"), "127.0.0.1", sink.getLocalPort(), 0ms);
    EXPECT_GT(transport_->pendingSends(), 0u);
    transport_->stop();
    EXPECT_EQ(transport_->pendingSends(), 0u);

    char buffer[65536];
    int received = 0;
    SocketAddress from;
    while (sink.receiveFrom(buffer, sizeof(buffer), 100, from) > 0) {
        ++received;
    }
    EXPECT_EQ(received, 3);
}

TEST_F(NetworkingThreadTest, SendAfterStopIsDropped) {
    transport_->stop();
    EXPECT_FALSE(transport_->isRunning());
    transport_->sendMulticast(makeHello("urn:uuid:e"), 0ms);
    EXPECT_EQ(transport_->pendingSends(), 0u);
}

TEST_F(NetworkingThreadTest, UnsupportedActionReachesCaller) {
    Envelope env("urn:not-a-discovery-action");
    EXPECT_THROW(transport_->sendMulticast(env, 0ms), UnsupportedActionError);
}

TEST_F(NetworkingThreadTest, LoopbackSourceAddress) {
    EXPECT_TRUE(transport_->addSourceAddress("127.0.0.1"));
    auto active = transport_->getActiveAddresses();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0], "127.0.0.1");

    transport_->removeSourceAddress("127.0.0.1");
    EXPECT_TRUE(transport_->getActiveAddresses().empty());
}

namespace {

// Answers every Probe with one ProbeMatches per simulated local service
class ReplyingObserver : public RecordingObserver {
public:
    ReplyingObserver(int replies, uint16_t replyPort) : replies_(replies), replyPort_(replyPort) {}

    void setTransport(MessageTransport* transport) { transport_ = transport; }

    void onEnvelopeReceived(const Envelope& env, const SocketAddress& from) override {
        RecordingObserver::onEnvelopeReceived(env, from);
        if (env.action != action::PROBE || transport_ == nullptr) {
            return;
        }
        for (int i = 0; i < replies_; ++i) {
            Envelope reply(action::PROBE_MATCHES);
            reply.to = ADDRESS_ANONYMOUS;
            reply.relates_to = env.message_id;
            ProbeResolveMatch match;
            match.epr = "urn:uuid:service-" + std::to_string(i);
            reply.probe_resolve_matches.push_back(match);
            transport_->sendUnicast(reply, "127.0.0.1", replyPort_, 0ms);
        }
    }

private:
    int replies_;
    uint16_t replyPort_;
    MessageTransport* transport_ = nullptr;
};

}  // namespace

TEST(NetworkingThreadDedupTest, OwnRepliesDoNotEvictReceivedIds) {
    UdpSocket sink;
    ASSERT_TRUE(sink.bind(0, "127.0.0.1"));

    DiscoveryConfig config;
    config.app_max_delay = 0ms;
    config.mcast_port = 53702;
    ReplyingObserver observer(60, sink.getLocalPort());
    NetworkingThread transport(config, observer);
    observer.setTransport(&transport);
    transport.start();

    Envelope probe(action::PROBE);
    probe.to = ADDRESS_ALL;
    probe.types = {QName(ns::DPWS, "Device")};
    std::string payload = encodeEnvelope(probe);
    SocketAddress from("10.0.0.99", 3702);

    transport.enqueueReceived(from, payload);
    ASSERT_TRUE(observer.waitForCount(1, 2s));
    // the retransmitted copy arrives after more than a cache's worth of replies went out
    std::this_thread::sleep_for(200ms);
    transport.enqueueReceived(from, payload);
    std::this_thread::sleep_for(200ms);

    EXPECT_EQ(observer.received().size(), 1u);
    transport.stop();
}
