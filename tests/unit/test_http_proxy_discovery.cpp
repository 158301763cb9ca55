/**
 * @file test_http_proxy_discovery.cpp
 * @brief Unit tests for proxy discovery, the HTTP client and the combined engine
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sdcdisco/net/http_client.hpp>
#include <sdcdisco/wsd/codec.hpp>
#include <sdcdisco/wsd/http_proxy_discovery.hpp>
#include <sdcdisco/wsd/proxy_and_udp_discovery.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace sdcdisco::wsd;
using sdcdisco::net::HttpClient;
using sdcdisco::net::HttpError;
using sdcdisco::net::HttpUrl;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

/**
 * One-request-per-connection HTTP server on 127.0.0.1. The handler
 * turns each request body into a raw response.
 */
class TestHttpServer {
public:
    using Handler = std::function<std::string(const std::string& body)>;

    explicit TestHttpServer(Handler handler) : handler_(std::move(handler)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int on = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(fd_, 8);
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this]() { run(); });
    }

    ~TestHttpServer() {
        running_.store(false);
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        thread_.join();
    }

    std::string url(const std::string& path = "/discovery") const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::vector<std::string> requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::vector<Envelope> decodedRequests() {
        std::vector<Envelope> result;
        for (const auto& body : requests()) {
            auto env = decodeEnvelope(body, "test");
            if (env) {
                result.push_back(*env);
            }
        }
        return result;
    }

private:
    int fd_;
    uint16_t port_ = 0;
    Handler handler_;
    std::atomic<bool> running_{true};
    std::thread thread_;
    std::mutex mutex_;
    std::vector<std::string> requests_;

    void run() {
        while (running_.load()) {
            int client = ::accept(fd_, nullptr, nullptr);
            if (client < 0) {
                break;
            }
            serve(client);
            ::close(client);
        }
    }

    void serve(int client) {
        std::string data;
        char buffer[4096];
        size_t headerEnd = std::string::npos;
        size_t contentLength = 0;
        while (true) {
            if (headerEnd == std::string::npos) {
                headerEnd = data.find("\r\n\r\n");
                if (headerEnd != std::string::npos) {
                    auto pos = data.find("Content-Length: ");
                    if (pos != std::string::npos && pos < headerEnd) {
                        contentLength = std::strtoul(data.c_str() + pos + 16, nullptr, 10);
                    }
                }
            }
            if (headerEnd != std::string::npos && data.size() >= headerEnd + 4 + contentLength) {
                break;
            }
            auto n = ::recv(client, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                return;
            }
            data.append(buffer, static_cast<size_t>(n));
        }

        std::string body = data.substr(headerEnd + 4, contentLength);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(body);
        }
        std::string response = handler_(body);
        ::send(client, response.data(), response.size(), 0);
    }
};

std::string httpResponse(int status, const std::string& body) {
    return "HTTP/1.1 " + std::to_string(status) + (status == 200 ? " OK" : " Error") + "\r\n"
           "Content-Type: application/soap+xml\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n"
           "Connection: close\r\n\r\n" + body;
}

ProbeResolveMatch proxyMatch(const std::string& epr, std::vector<QName> types) {
    ProbeResolveMatch match;
    match.epr = epr;
    match.types = std::move(types);
    match.x_addrs = {"https://10.1.1.1/" + epr};
    match.metadata_version = 3;
    return match;
}

// Answers Probe with two matches and Resolve with the requested epr
std::string proxyHandler(const std::string& body) {
    auto request = decodeEnvelope(body, "test");
    if (!request) {
        return httpResponse(400, "");
    }
    if (request->action == action::PROBE) {
        Envelope reply(action::PROBE_MATCHES);
        reply.relates_to = request->message_id;
        reply.instance_id = 9;
        reply.probe_resolve_matches = {
            proxyMatch("urn:uuid:p1", {QName(ns::DPWS, "Device")}),
            proxyMatch("urn:uuid:p2", {QName(ns::DPWS, "Device"), QName("http://example.com", "X")}),
        };
        return httpResponse(200, encodeEnvelope(reply));
    }
    if (request->action == action::RESOLVE) {
        Envelope reply(action::RESOLVE_MATCHES);
        reply.relates_to = request->message_id;
        ProbeResolveMatch match = proxyMatch(request->epr, {QName(ns::DPWS, "Device")});
        match.x_addrs.push_back("https://10.1.1.2/resolved");
        reply.probe_resolve_matches = {match};
        return httpResponse(200, encodeEnvelope(reply));
    }
    return httpResponse(200, "");
}

class MockDiscovery : public Discovery {
public:
    MOCK_METHOD(void, start, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(void, publishService,
                (const std::string&, const std::vector<QName>&, const std::vector<Scope>&,
                 const std::vector<std::string>&),
                (override));
    MOCK_METHOD(void, clearService, (const std::string&), (override));
    MOCK_METHOD(void, clearLocalServices, (), (override));
    MOCK_METHOD(void, clearRemoteServices, (), (override));
    MOCK_METHOD(std::vector<Service>, searchServices,
                (const TypeFilter&, const ScopeFilter&, std::chrono::milliseconds, std::chrono::milliseconds),
                (override));
    MOCK_METHOD(std::vector<Service>, searchMultipleTypes,
                (const std::vector<std::vector<QName>>&, const ScopeFilter&, std::chrono::milliseconds,
                 std::chrono::milliseconds),
                (override));
    MOCK_METHOD(std::vector<std::string>, getActiveAddresses, (), (const, override));
};

Service namedService(const std::string& epr, const std::string& xAddr) {
    Service s;
    s.epr = epr;
    s.x_addrs = {xAddr};
    return s;
}

}  // namespace

// =============================================================================
// HttpUrl / HttpClient
// =============================================================================

TEST(HttpUrlTest, ParsesDefaultsAndTarget) {
    auto url = HttpUrl::parse("http://proxy.local/discovery?x=1");
    EXPECT_EQ(url.scheme, "http");
    EXPECT_EQ(url.host, "proxy.local");
    EXPECT_EQ(url.port, 80);
    EXPECT_EQ(url.target, "/discovery?x=1");
    EXPECT_FALSE(url.isTls());

    auto tls = HttpUrl::parse("https://10.0.0.1:8443");
    EXPECT_EQ(tls.port, 8443);
    EXPECT_EQ(tls.target, "/");
    EXPECT_TRUE(tls.isTls());
}

TEST(HttpUrlTest, RejectsOtherSchemes) {
    EXPECT_THROW(HttpUrl::parse("ftp://host/x"), HttpError);
    EXPECT_THROW(HttpUrl::parse("soap.udp://host:3702"), HttpError);
    EXPECT_THROW(HttpUrl::parse("http://host:notaport/"), HttpError);
}

TEST(HttpClientTest, HttpsRequiresContext) {
    EXPECT_THROW(HttpClient("https://proxy.local/"), HttpError);
}

TEST(HttpClientTest, PostReadsContentLengthBody) {
    TestHttpServer server([](const std::string& body) { return httpResponse(200, "echo:" + body); });
    HttpClient client(server.url());

    auto resp = client.post("hello", "text/plain");
    EXPECT_EQ(resp.status, 200);
    EXPECT_TRUE(resp.ok());
    EXPECT_EQ(resp.body, "echo:hello");
    EXPECT_EQ(resp.header("content-type"), "application/soap+xml");
}

TEST(HttpClientTest, PostReadsChunkedBody) {
    TestHttpServer server([](const std::string&) {
        return std::string("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                           "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n");
    });
    HttpClient client(server.url());
    EXPECT_EQ(client.post("x", "text/plain").body, "hello world");
}

TEST(HttpClientTest, UnreachableServerThrows) {
    uint16_t port;
    {
        TestHttpServer server([](const std::string&) { return httpResponse(200, ""); });
        port = static_cast<uint16_t>(std::stoi(server.url("").substr(17)));
    }
    HttpClient client("http://127.0.0.1:" + std::to_string(port) + "/", nullptr, 500);
    EXPECT_THROW(client.post("x", "text/plain"), HttpError);
}

// =============================================================================
// HttpProxyDiscovery
// =============================================================================

TEST(HttpProxyDiscoveryTest, PublishPostsHello) {
    TestHttpServer server(proxyHandler);
    HttpProxyDiscovery proxy(server.url());
    proxy.start();

    proxy.publishService("urn:uuid:local", {QName(ns::DPWS, "Device")}, {Scope("http://s")},
                         {"https://fixed.example.com/x"});

    auto requests = server.decodedRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].action, action::HELLO);
    EXPECT_EQ(requests[0].epr, "urn:uuid:local");
    EXPECT_EQ(requests[0].message_number, 1u);
    EXPECT_EQ(requests[0].x_addrs, std::vector<std::string>{"https://fixed.example.com/x"});
    EXPECT_EQ(proxy.getLocalServices().size(), 1u);
}

TEST(HttpProxyDiscoveryTest, RejectedHelloThrows) {
    TestHttpServer server([](const std::string&) { return httpResponse(500, ""); });
    HttpProxyDiscovery proxy(server.url());
    EXPECT_THROW(proxy.publishService("urn:uuid:local", {}, {}, {}), HttpError);
}

TEST(HttpProxyDiscoveryTest, ClearPostsByeAndForgetsService) {
    TestHttpServer server(proxyHandler);
    HttpProxyDiscovery proxy(server.url());
    proxy.publishService("urn:uuid:local", {}, {}, {});
    proxy.clearService("urn:uuid:local");

    auto requests = server.decodedRequests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].action, action::BYE);
    EXPECT_TRUE(proxy.getLocalServices().empty());
    EXPECT_THROW(proxy.clearService("urn:uuid:local"), std::out_of_range);
}

TEST(HttpProxyDiscoveryTest, StopSendsByeForLocalServices) {
    TestHttpServer server(proxyHandler);
    HttpProxyDiscovery proxy(server.url());
    proxy.publishService("urn:uuid:a", {}, {}, {});
    proxy.publishService("urn:uuid:b", {}, {}, {});
    proxy.stop();

    int byes = 0;
    for (const auto& env : server.decodedRequests()) {
        byes += env.action == action::BYE ? 1 : 0;
    }
    EXPECT_EQ(byes, 2);
    EXPECT_TRUE(proxy.getLocalServices().empty());
}

TEST(HttpProxyDiscoveryTest, SearchFiltersProbeMatches) {
    TestHttpServer server(proxyHandler);
    HttpProxyDiscovery proxy(server.url());

    auto all = proxy.searchServices(std::nullopt, std::nullopt, std::chrono::seconds(1),
                                    std::chrono::seconds(1));
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].instance_id, 9u);
    EXPECT_EQ(all[0].metadata_version, 3u);

    auto onlyX = proxy.searchServices(std::vector<QName>{QName("http://example.com", "X")}, std::nullopt,
                                      std::chrono::seconds(1), std::chrono::seconds(1));
    ASSERT_EQ(onlyX.size(), 1u);
    EXPECT_EQ(onlyX[0].epr, "urn:uuid:p2");

    auto requests = server.decodedRequests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].action, action::PROBE);
    EXPECT_EQ(requests[1].types.size(), 1u);
}

TEST(HttpProxyDiscoveryTest, SearchCanResolveEachMatch) {
    TestHttpServer server(proxyHandler);
    HttpProxyDiscovery proxy(server.url());
    proxy.setResolveServices(true);

    auto found = proxy.searchServices(std::nullopt, std::nullopt, std::chrono::seconds(1),
                                      std::chrono::seconds(1));
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].x_addrs.back(), "https://10.1.1.2/resolved");
    EXPECT_EQ(server.requests().size(), 3u);
}

TEST(HttpProxyDiscoveryTest, SearchMultipleTypesIsUniqueByEpr) {
    TestHttpServer server(proxyHandler);
    HttpProxyDiscovery proxy(server.url());

    auto found = proxy.searchMultipleTypes({{QName(ns::DPWS, "Device")}, {QName("http://example.com", "X")}},
                                           std::nullopt, std::chrono::seconds(1), std::chrono::seconds(1));
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].epr, "urn:uuid:p1");
    EXPECT_EQ(found[1].epr, "urn:uuid:p2");
}

TEST(HttpProxyDiscoveryTest, InvalidResponseThrows) {
    TestHttpServer server([](const std::string&) { return httpResponse(200, "<not-soap/>"); });
    HttpProxyDiscovery proxy(server.url());
    EXPECT_THROW(proxy.searchServices(std::nullopt, std::nullopt, std::chrono::seconds(1),
                                      std::chrono::seconds(1)),
                 HttpError);
}

TEST(HttpProxyDiscoveryTest, ActiveAddressIsLocalEndOfConnection) {
    TestHttpServer server(proxyHandler);
    HttpProxyDiscovery proxy(server.url());
    EXPECT_EQ(proxy.getActiveAddresses(), std::vector<std::string>{"127.0.0.1"});
}

// =============================================================================
// ProxyAndUdpDiscovery
// =============================================================================

TEST(ProxyAndUdpDiscoveryTest, RequiresBothEngines) {
    auto udp = std::make_shared<MockDiscovery>();
    EXPECT_THROW(ProxyAndUdpDiscovery(nullptr, udp), std::invalid_argument);
}

TEST(ProxyAndUdpDiscoveryTest, PublishGoesToBoth) {
    auto proxy = std::make_shared<MockDiscovery>();
    auto udp = std::make_shared<MockDiscovery>();
    ProxyAndUdpDiscovery both(proxy, udp);

    EXPECT_CALL(*proxy, publishService("urn:uuid:a", _, _, _));
    EXPECT_CALL(*udp, publishService("urn:uuid:a", _, _, _));
    EXPECT_CALL(*proxy, clearService("urn:uuid:a"));
    EXPECT_CALL(*udp, clearService("urn:uuid:a"));
    EXPECT_CALL(*proxy, start());
    EXPECT_CALL(*udp, start());

    both.start();
    both.publishService("urn:uuid:a", {}, {}, {});
    both.clearService("urn:uuid:a");
}

TEST(ProxyAndUdpDiscoveryTest, SearchesProxyOnlyByDefault) {
    auto proxy = std::make_shared<MockDiscovery>();
    auto udp = std::make_shared<MockDiscovery>();
    ProxyAndUdpDiscovery both(proxy, udp);

    EXPECT_CALL(*proxy, searchServices(_, _, _, _))
        .WillOnce(Return(std::vector<Service>{namedService("urn:uuid:a", "http://proxy")}));
    EXPECT_CALL(*udp, searchServices(_, _, _, _)).Times(0);

    auto found = both.searchServices(std::nullopt, std::nullopt, std::chrono::seconds(1),
                                     std::chrono::seconds(1));
    ASSERT_EQ(found.size(), 1u);
}

TEST(ProxyAndUdpDiscoveryTest, UdpResultsReplaceProxyResultsByEpr) {
    auto proxy = std::make_shared<MockDiscovery>();
    auto udp = std::make_shared<MockDiscovery>();
    ProxyAndUdpDiscovery both(proxy, udp);
    both.setSearchTargets(true, true);

    EXPECT_CALL(*proxy, searchServices(_, _, _, _))
        .WillOnce(Return(std::vector<Service>{namedService("urn:uuid:a", "http://proxy"),
                                              namedService("urn:uuid:b", "http://proxy")}));
    EXPECT_CALL(*udp, searchServices(_, _, _, _))
        .WillOnce(Return(std::vector<Service>{namedService("urn:uuid:a", "http://udp"),
                                              namedService("urn:uuid:c", "http://udp")}));

    auto found = both.searchServices(std::nullopt, std::nullopt, std::chrono::seconds(1),
                                     std::chrono::seconds(1));
    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0].epr, "urn:uuid:a");
    EXPECT_EQ(found[0].x_addrs.front(), "http://udp");
    EXPECT_EQ(found[2].epr, "urn:uuid:c");
}

TEST(ProxyAndUdpDiscoveryTest, ActiveAddressesAreUnion) {
    auto proxy = std::make_shared<MockDiscovery>();
    auto udp = std::make_shared<MockDiscovery>();
    ProxyAndUdpDiscovery both(proxy, udp);

    EXPECT_CALL(*proxy, getActiveAddresses()).WillOnce(Return(std::vector<std::string>{"10.0.0.1"}));
    EXPECT_CALL(*udp, getActiveAddresses())
        .WillOnce(Return(std::vector<std::string>{"10.0.0.1", "192.168.0.2"}));

    EXPECT_EQ(both.getActiveAddresses(), (std::vector<std::string>{"10.0.0.1", "192.168.0.2"}));
}

TEST(ProxyAndUdpDiscoveryTest, ProxyFailurePropagates) {
    auto proxy = std::make_shared<MockDiscovery>();
    auto udp = std::make_shared<MockDiscovery>();
    ProxyAndUdpDiscovery both(proxy, udp);

    EXPECT_CALL(*proxy, publishService(_, _, _, _)).WillOnce(Throw(HttpError("proxy down")));
    EXPECT_CALL(*udp, publishService(_, _, _, _)).Times(0);
    EXPECT_THROW(both.publishService("urn:uuid:a", {}, {}, {}), HttpError);
}
