/**
 * @file test_discovery_service.cpp
 * @brief Unit tests for the gRPC discovery API over an in-process server
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sdcdisco/net/http_client.hpp>
#include <sdcdisco/services/discovery_service.hpp>

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sdcdisco;
using namespace sdcdisco::services;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using ::testing::Truly;

namespace {

class MockDiscovery : public wsd::Discovery {
public:
    MOCK_METHOD(void, start, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(void, publishService,
                (const std::string&, const std::vector<wsd::QName>&, const std::vector<wsd::Scope>&,
                 const std::vector<std::string>&),
                (override));
    MOCK_METHOD(void, clearService, (const std::string&), (override));
    MOCK_METHOD(void, clearLocalServices, (), (override));
    MOCK_METHOD(void, clearRemoteServices, (), (override));
    MOCK_METHOD(std::vector<wsd::Service>, searchServices,
                (const wsd::TypeFilter&, const wsd::ScopeFilter&, std::chrono::milliseconds,
                 std::chrono::milliseconds),
                (override));
    MOCK_METHOD(std::vector<wsd::Service>, searchMultipleTypes,
                (const std::vector<std::vector<wsd::QName>>&, const wsd::ScopeFilter&,
                 std::chrono::milliseconds, std::chrono::milliseconds),
                (override));
    MOCK_METHOD(std::vector<std::string>, getActiveAddresses, (), (const, override));
};

// Transport that opens nothing; the engine is driven through onEnvelopeReceived
class NullTransport : public wsd::MessageTransport {
public:
    void start() override {}
    void stop() override {}
    bool addSourceAddress(const std::string&) override { return true; }
    void removeSourceAddress(const std::string&) override {}
    std::vector<std::string> getActiveAddresses() const override { return {}; }
    void sendUnicast(const wsd::Envelope&, const std::string&, uint16_t, std::chrono::milliseconds) override {}
    void sendMulticast(const wsd::Envelope&, std::chrono::milliseconds) override {}
};

wsd::Service remoteDevice(const std::string& epr) {
    return wsd::Service(epr, {wsd::QName(wsd::ns::DPWS, "Device")},
                        {wsd::Scope("sdc.mds.pkp:1.2.840.10004.20701.1.1", wsd::match_by::STRCMP)},
                        {"https://10.0.0.8:6464/" + epr}, 77, 4);
}

}  // namespace

class DiscoveryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        discovery_ = std::make_shared<::testing::StrictMock<MockDiscovery>>();
    }

    void TearDown() override {
        if (server_) {
            server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
        }
        if (service_) {
            service_->shutdown();
        }
    }

    void startServer(std::shared_ptr<wsd::WsDiscovery> udp = nullptr) {
        service_ = std::make_unique<DiscoveryServiceImpl>(discovery_, std::move(udp));

        int port = 0;
        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port);
        builder.RegisterService(service_.get());
        server_ = builder.BuildAndStart();
        ASSERT_NE(server_, nullptr);
        ASSERT_GT(port, 0);

        auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(port),
                                           grpc::InsecureChannelCredentials());
        stub_ = api::DiscoveryService::NewStub(channel);
    }

    std::unique_ptr<grpc::ClientContext> context() {
        auto ctx = std::make_unique<grpc::ClientContext>();
        ctx->set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(10));
        return ctx;
    }

    std::shared_ptr<::testing::StrictMock<MockDiscovery>> discovery_;
    std::unique_ptr<DiscoveryServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
    std::unique_ptr<api::DiscoveryService::Stub> stub_;
};

// =============================================================================
// Conversions
// =============================================================================

TEST(DiscoveryConversionTest, ServiceToRecord) {
    api::ServiceRecord record;
    toProto(remoteDevice("urn:uuid:d1"), &record);

    EXPECT_EQ(record.epr(), "urn:uuid:d1");
    ASSERT_EQ(record.types_size(), 1);
    EXPECT_EQ(record.types(0).ns(), wsd::ns::DPWS);
    EXPECT_EQ(record.types(0).local_name(), "Device");
    ASSERT_EQ(record.scopes_size(), 1);
    EXPECT_EQ(record.scopes(0).match_by(), wsd::match_by::STRCMP);
    ASSERT_EQ(record.x_addrs_size(), 1);
    EXPECT_EQ(record.metadata_version(), 4u);
    EXPECT_EQ(record.instance_id(), 77u);
}

TEST(DiscoveryConversionTest, ProtoToWire) {
    api::QName qname;
    qname.set_ns("http://example.com");
    qname.set_local_name("X");
    EXPECT_EQ(fromProto(qname), wsd::QName("http://example.com", "X"));

    api::Scope scope;
    scope.set_value("http://example.com/a");
    EXPECT_EQ(fromProto(scope), wsd::Scope("http://example.com/a"));
}

TEST(DiscoveryConversionTest, ExceptionsMapToStatusCodes) {
    EXPECT_EQ(statusFromException(wsd::ApiUsageError("x")).error_code(), grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(statusFromException(std::out_of_range("x")).error_code(), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(statusFromException(std::invalid_argument("x")).error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(statusFromException(net::HttpError("x")).error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(statusFromException(std::runtime_error("x")).error_code(), grpc::StatusCode::INTERNAL);
}

TEST(DiscoveryConversionTest, NullEngineRejected) {
    EXPECT_THROW(DiscoveryServiceImpl(nullptr), std::invalid_argument);
}

// =============================================================================
// Publish / Clear
// =============================================================================

TEST_F(DiscoveryServiceTest, PublishForwardsToEngine) {
    startServer();
    EXPECT_CALL(*discovery_, publishService("urn:uuid:local",
                                            std::vector<wsd::QName>{wsd::QName(wsd::ns::DPWS, "Device")},
                                            std::vector<wsd::Scope>{wsd::Scope("http://s")},
                                            std::vector<std::string>{"https://{ip}:6464/x"}));

    api::PublishRequest request;
    request.set_epr("urn:uuid:local");
    auto* type = request.add_types();
    type->set_ns(wsd::ns::DPWS);
    type->set_local_name("Device");
    request.add_scopes()->set_value("http://s");
    request.add_x_addrs("https://{ip}:6464/x");

    api::PublishResponse response;
    auto ctx = context();
    grpc::Status status = stub_->Publish(ctx.get(), request, &response);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_TRUE(response.success());
}

TEST_F(DiscoveryServiceTest, PublishWithoutEprIsInvalid) {
    startServer();
    api::PublishRequest request;
    api::PublishResponse response;
    auto ctx = context();
    EXPECT_EQ(stub_->Publish(ctx.get(), request, &response).error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(DiscoveryServiceTest, PublishBeforeStartIsFailedPrecondition) {
    startServer();
    EXPECT_CALL(*discovery_, publishService(_, _, _, _))
        .WillOnce(Throw(wsd::ApiUsageError("publishService: discovery not started")));

    api::PublishRequest request;
    request.set_epr("urn:uuid:local");
    api::PublishResponse response;
    auto ctx = context();
    grpc::Status status = stub_->Publish(ctx.get(), request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
}

TEST_F(DiscoveryServiceTest, ClearOneOrAll) {
    startServer();
    EXPECT_CALL(*discovery_, clearService("urn:uuid:local"));
    EXPECT_CALL(*discovery_, clearLocalServices());

    api::ClearRequest one;
    one.set_epr("urn:uuid:local");
    api::ClearResponse response;
    auto ctx = context();
    ASSERT_TRUE(stub_->Clear(ctx.get(), one, &response).ok());
    EXPECT_TRUE(response.success());

    api::ClearRequest all;
    auto ctx2 = context();
    ASSERT_TRUE(stub_->Clear(ctx2.get(), all, &response).ok());
}

TEST_F(DiscoveryServiceTest, ClearUnknownIsNotFound) {
    startServer();
    EXPECT_CALL(*discovery_, clearService("urn:uuid:nope"))
        .WillOnce(Throw(std::out_of_range("unknown local service: urn:uuid:nope")));

    api::ClearRequest request;
    request.set_epr("urn:uuid:nope");
    api::ClearResponse response;
    auto ctx = context();
    EXPECT_EQ(stub_->Clear(ctx.get(), request, &response).error_code(), grpc::StatusCode::NOT_FOUND);
}

// =============================================================================
// Search
// =============================================================================

TEST_F(DiscoveryServiceTest, SearchUsesDefaultsAndReturnsRecords) {
    startServer();
    EXPECT_CALL(*discovery_, searchServices(Truly([](const wsd::TypeFilter& t) { return !t; }),
                                            Truly([](const wsd::ScopeFilter& s) { return !s; }),
                                            wsd::DEFAULT_SEARCH_TIMEOUT, wsd::DEFAULT_PROBE_INTERVAL))
        .WillOnce(Return(std::vector<wsd::Service>{remoteDevice("urn:uuid:d1"), remoteDevice("urn:uuid:d2")}));

    api::SearchRequest request;
    api::SearchResponse response;
    auto ctx = context();
    grpc::Status status = stub_->Search(ctx.get(), request, &response);
    ASSERT_TRUE(status.ok()) << status.error_message();
    ASSERT_EQ(response.services_size(), 2);
    EXPECT_EQ(response.services(0).epr(), "urn:uuid:d1");
    EXPECT_EQ(response.services(1).instance_id(), 77u);
}

TEST_F(DiscoveryServiceTest, SearchPassesFilters) {
    startServer();
    EXPECT_CALL(*discovery_,
                searchServices(Truly([](const wsd::TypeFilter& t) {
                                   return t && t->size() == 1 && (*t)[0].local_name == "MedicalDevice";
                               }),
                               Truly([](const wsd::ScopeFilter& s) {
                                   return s && s->size() == 1 && (*s)[0].match_by == wsd::match_by::STRCMP;
                               }),
                               std::chrono::milliseconds(250), std::chrono::milliseconds(100)))
        .WillOnce(Return(std::vector<wsd::Service>{}));

    api::SearchRequest request;
    auto* type = request.add_types();
    type->set_ns(wsd::ns::MDPWS);
    type->set_local_name("MedicalDevice");
    auto* scope = request.add_scopes();
    scope->set_value("sdc.mds.pkp:1");
    scope->set_match_by(wsd::match_by::STRCMP);
    request.set_timeout_ms(250);
    request.set_probe_interval_ms(100);

    api::SearchResponse response;
    auto ctx = context();
    ASSERT_TRUE(stub_->Search(ctx.get(), request, &response).ok());
    EXPECT_EQ(response.services_size(), 0);
}

TEST_F(DiscoveryServiceTest, SearchFailureFromProxyIsUnavailable) {
    startServer();
    EXPECT_CALL(*discovery_, searchServices(_, _, _, _)).WillOnce(Throw(net::HttpError("proxy down")));

    api::SearchRequest request;
    api::SearchResponse response;
    auto ctx = context();
    EXPECT_EQ(stub_->Search(ctx.get(), request, &response).error_code(), grpc::StatusCode::UNAVAILABLE);
}

TEST_F(DiscoveryServiceTest, SearchAfterShutdownIsUnavailable) {
    startServer();
    service_->shutdown();

    api::SearchRequest request;
    api::SearchResponse response;
    auto ctx = context();
    EXPECT_EQ(stub_->Search(ctx.get(), request, &response).error_code(), grpc::StatusCode::UNAVAILABLE);
}

// =============================================================================
// Registry and addresses
// =============================================================================

TEST_F(DiscoveryServiceTest, RemoteServicesNeedMulticastEngine) {
    startServer();
    api::GetRemoteServicesRequest request;
    api::GetRemoteServicesResponse response;
    auto ctx = context();
    EXPECT_EQ(stub_->GetRemoteServices(ctx.get(), request, &response).error_code(),
              grpc::StatusCode::UNIMPLEMENTED);
}

TEST_F(DiscoveryServiceTest, RemoteServicesFromMulticastRegistry) {
    auto udp = std::make_shared<wsd::WsDiscovery>(
        wsd::DiscoveryConfig(), std::make_shared<wsd::BlacklistFilter>(),
        []() { return std::vector<net::NetworkAdapter>{}; },
        [](const wsd::DiscoveryConfig&, wsd::EnvelopeObserver&) {
            return std::unique_ptr<wsd::MessageTransport>(new NullTransport());
        });
    udp->start();

    wsd::Envelope hello(wsd::action::HELLO);
    hello.epr = "urn:uuid:remote";
    hello.types = {wsd::QName(wsd::ns::DPWS, "Device")};
    hello.x_addrs = {"https://10.0.0.8/remote"};
    hello.metadata_version = 2;
    udp->onEnvelopeReceived(hello, net::SocketAddress("10.0.0.8", 3702));

    startServer(udp);
    api::GetRemoteServicesRequest request;
    api::GetRemoteServicesResponse response;
    auto ctx = context();
    ASSERT_TRUE(stub_->GetRemoteServices(ctx.get(), request, &response).ok());
    ASSERT_EQ(response.services_size(), 1);
    EXPECT_EQ(response.services(0).epr(), "urn:uuid:remote");
    EXPECT_EQ(response.services(0).metadata_version(), 2u);

    udp->stop();
}

TEST_F(DiscoveryServiceTest, ActiveAddresses) {
    startServer();
    EXPECT_CALL(*discovery_, getActiveAddresses())
        .WillOnce(Return(std::vector<std::string>{"10.0.0.5", "192.168.1.9"}));

    api::GetActiveAddressesRequest request;
    api::GetActiveAddressesResponse response;
    auto ctx = context();
    ASSERT_TRUE(stub_->GetActiveAddresses(ctx.get(), request, &response).ok());
    ASSERT_EQ(response.addresses_size(), 2);
    EXPECT_EQ(response.addresses(1), "192.168.1.9");
}
