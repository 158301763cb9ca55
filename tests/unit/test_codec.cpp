/**
 * @file test_codec.cpp
 * @brief Unit tests for the SOAP envelope codec
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sdcdisco/wsd/codec.hpp>

#include <string>

using namespace sdcdisco::wsd;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

const QName DEVICE(ns::DPWS, "Device");
const QName MEDICAL(ns::MDPWS, "MedicalDevice");
const QName CUSTOM("http://example.com/custom", "Thing");

Envelope roundTrip(const Envelope& env) {
    auto decoded = decodeEnvelope(encodeEnvelope(env), "127.0.0.1");
    EXPECT_TRUE(decoded.has_value());
    return decoded ? *decoded : Envelope();
}

// Minimal SOAP envelope with the given header and body content
std::string soap(const std::string& header, const std::string& body) {
    return std::string("<?xml version=\"1.0\"?>"
                       "<s12:Envelope xmlns:s12=\"http://www.w3.org/2003/05/soap-envelope\""
                       " xmlns:wsa=\"http://www.w3.org/2005/08/addressing\""
                       " xmlns:wsd=\"http://docs.oasis-open.org/ws-dd/ns/discovery/2009/01\">"
                       "<s12:Header>") + header + "</s12:Header><s12:Body>" + body +
           "</s12:Body></s12:Envelope>";
}

std::string actionHeader(const char* action) {
    return std::string("<wsa:Action>") + action + "</wsa:Action><wsa:MessageID>urn:uuid:m1</wsa:MessageID>";
}

}  // namespace

// =============================================================================
// Round trips
// =============================================================================

TEST(CodecTest, HelloCarriesAllFields) {
    Envelope hello(action::HELLO);
    hello.to = ADDRESS_ALL;
    hello.instance_id = 42;
    hello.message_number = 7;
    hello.epr = "urn:uuid:device";
    hello.types = {DEVICE, MEDICAL, CUSTOM};
    hello.scopes = {Scope("sdc.ctxt.loc:/sdc.ctxt.loc.detail/a%2Fb?fac=F"), Scope("urn:x:y")};
    hello.x_addrs = {"https://10.0.0.1:6464/dev", "https://10.0.0.2:6464/dev"};
    hello.metadata_version = 3;

    Envelope decoded = roundTrip(hello);
    EXPECT_EQ(decoded.action, action::HELLO);
    EXPECT_EQ(decoded.message_id, hello.message_id);
    EXPECT_EQ(decoded.to, ADDRESS_ALL);
    EXPECT_EQ(decoded.instance_id, 42u);
    EXPECT_EQ(decoded.message_number, 7u);
    EXPECT_EQ(decoded.epr, "urn:uuid:device");
    EXPECT_THAT(decoded.types, ElementsAre(DEVICE, MEDICAL, CUSTOM));
    EXPECT_EQ(decoded.scopes, hello.scopes);
    EXPECT_EQ(decoded.x_addrs, hello.x_addrs);
    EXPECT_EQ(decoded.metadata_version, 3u);
    EXPECT_FALSE(decoded.isSuppression());
}

TEST(CodecTest, SuppressionHello) {
    Envelope hello(action::HELLO);
    hello.epr = "urn:uuid:proxy";
    hello.relates_to = "urn:uuid:probe";
    hello.relationship_type = QName(ns::DISCOVERY, "Suppression");
    hello.x_addrs = {"soap.udp://10.0.0.9:3702"};

    Envelope decoded = roundTrip(hello);
    EXPECT_EQ(decoded.relates_to, "urn:uuid:probe");
    EXPECT_TRUE(decoded.isSuppression());
}

TEST(CodecTest, ByeCarriesEpr) {
    Envelope bye(action::BYE);
    bye.epr = "urn:uuid:device";
    bye.message_number = 9;

    Envelope decoded = roundTrip(bye);
    EXPECT_EQ(decoded.action, action::BYE);
    EXPECT_EQ(decoded.epr, "urn:uuid:device");
    EXPECT_EQ(decoded.message_number, 9u);
    EXPECT_TRUE(decoded.types.empty());
}

TEST(CodecTest, ProbeDoesNotPopulateMatches) {
    Envelope probe(action::PROBE);
    probe.to = ADDRESS_ALL;
    probe.reply_to = ADDRESS_ANONYMOUS;
    probe.types = {DEVICE};
    probe.scopes = {Scope("urn:x:y", match_by::STRCMP)};

    Envelope decoded = roundTrip(probe);
    EXPECT_EQ(decoded.action, action::PROBE);
    EXPECT_EQ(decoded.reply_to, ADDRESS_ANONYMOUS);
    EXPECT_THAT(decoded.types, ElementsAre(DEVICE));
    ASSERT_EQ(decoded.scopes.size(), 1u);
    EXPECT_EQ(decoded.scopes[0].match_by, match_by::STRCMP);
    EXPECT_TRUE(decoded.probe_resolve_matches.empty());
    EXPECT_TRUE(decoded.epr.empty());
}

TEST(CodecTest, ScopesElementUsesDialectOfFirstScope) {
    Envelope probe(action::PROBE);
    probe.to = ADDRESS_ALL;
    probe.scopes = {Scope("urn:x:y", match_by::STRCMP), Scope("http://a/b", match_by::URI)};

    Envelope decoded = roundTrip(probe);
    ASSERT_EQ(decoded.scopes.size(), 2u);
    EXPECT_EQ(decoded.scopes[0].match_by, match_by::STRCMP);
    EXPECT_EQ(decoded.scopes[1].value, "http://a/b");
    EXPECT_EQ(decoded.scopes[1].match_by, match_by::STRCMP);
}

TEST(CodecTest, DefaultDialectWritesNoMatchBy) {
    Envelope probe(action::PROBE);
    probe.to = ADDRESS_ALL;
    probe.scopes = {Scope("http://a/b"), Scope("http://a/c")};

    std::string xml = encodeEnvelope(probe);
    EXPECT_EQ(xml.find("MatchBy"), std::string::npos);
    Envelope decoded = roundTrip(probe);
    ASSERT_EQ(decoded.scopes.size(), 2u);
    EXPECT_TRUE(decoded.scopes[1].match_by.empty());
}

TEST(CodecTest, ProbeMatchesWithSeveralMatches) {
    Envelope matches(action::PROBE_MATCHES);
    matches.relates_to = "urn:uuid:probe";
    matches.to = ADDRESS_ANONYMOUS;
    matches.instance_id = 5;

    ProbeResolveMatch a;
    a.epr = "urn:a";
    a.types = {DEVICE};
    a.x_addrs = {"http://10.0.0.1/a"};
    a.metadata_version = 2;
    ProbeResolveMatch b;
    b.epr = "urn:b";
    b.scopes = {Scope("urn:x:y")};
    matches.probe_resolve_matches = {a, b};

    Envelope decoded = roundTrip(matches);
    EXPECT_EQ(decoded.relates_to, "urn:uuid:probe");
    EXPECT_EQ(decoded.instance_id, 5u);
    ASSERT_EQ(decoded.probe_resolve_matches.size(), 2u);
    EXPECT_EQ(decoded.probe_resolve_matches[0].epr, "urn:a");
    EXPECT_THAT(decoded.probe_resolve_matches[0].types, ElementsAre(DEVICE));
    EXPECT_THAT(decoded.probe_resolve_matches[0].x_addrs, ElementsAre("http://10.0.0.1/a"));
    EXPECT_EQ(decoded.probe_resolve_matches[0].metadata_version, 2u);
    EXPECT_EQ(decoded.probe_resolve_matches[1].epr, "urn:b");
    EXPECT_TRUE(decoded.probe_resolve_matches[1].x_addrs.empty());
}

TEST(CodecTest, ResolveAndResolveMatches) {
    Envelope resolve(action::RESOLVE);
    resolve.epr = "urn:uuid:device";
    Envelope decodedResolve = roundTrip(resolve);
    EXPECT_EQ(decodedResolve.action, action::RESOLVE);
    EXPECT_EQ(decodedResolve.epr, "urn:uuid:device");

    Envelope matches(action::RESOLVE_MATCHES);
    matches.relates_to = resolve.message_id;
    ProbeResolveMatch m;
    m.epr = "urn:uuid:device";
    m.types = {MEDICAL};
    m.x_addrs = {"https://10.0.0.1:6464/dev"};
    matches.probe_resolve_matches = {m};

    Envelope decoded = roundTrip(matches);
    EXPECT_EQ(decoded.relates_to, resolve.message_id);
    ASSERT_EQ(decoded.probe_resolve_matches.size(), 1u);
    EXPECT_EQ(decoded.probe_resolve_matches[0].epr, "urn:uuid:device");
    EXPECT_THAT(decoded.probe_resolve_matches[0].x_addrs, ElementsAre("https://10.0.0.1:6464/dev"));
}

TEST(CodecTest, SpacesInScopesAreEscaped) {
    Envelope probe(action::PROBE);
    probe.scopes = {Scope("urn:with space")};
    std::string xml = encodeEnvelope(probe);
    EXPECT_THAT(xml, HasSubstr("urn:with%20space"));
}

// =============================================================================
// Errors
// =============================================================================

TEST(CodecTest, EncodingUnknownActionThrows) {
    Envelope env("http://example.com/NotDiscovery");
    EXPECT_THROW(encodeEnvelope(env), UnsupportedActionError);
}

TEST(CodecTest, GarbageDecodesToNothing) {
    EXPECT_FALSE(decodeEnvelope("", "1.2.3.4").has_value());
    EXPECT_FALSE(decodeEnvelope("not xml at all", "1.2.3.4").has_value());
    EXPECT_FALSE(decodeEnvelope("<a><b></a>", "1.2.3.4").has_value());
    EXPECT_FALSE(decodeEnvelope("<root/>", "1.2.3.4").has_value());
}

TEST(CodecTest, MissingActionHeader) {
    EXPECT_FALSE(decodeEnvelope(soap("<wsa:MessageID>urn:uuid:m1</wsa:MessageID>", ""), "h").has_value());
}

TEST(CodecTest, UnknownActionIsRejected) {
    std::string xml = soap(actionHeader("http://example.com/Other"), "");
    EXPECT_FALSE(decodeEnvelope(xml, "h").has_value());
}

TEST(CodecTest, UndeclaredTypePrefixIsRejected) {
    std::string xml = soap(actionHeader(action::PROBE),
                           "<wsd:Probe><wsd:Types>nope:Device</wsd:Types></wsd:Probe>");
    EXPECT_FALSE(decodeEnvelope(xml, "h").has_value());
}

TEST(CodecTest, InvalidMetadataVersionIsRejected) {
    std::string xml = soap(actionHeader(action::HELLO),
                           "<wsd:Hello><wsa:EndpointReference><wsa:Address>urn:a</wsa:Address>"
                           "</wsa:EndpointReference><wsd:MetadataVersion>abc</wsd:MetadataVersion>"
                           "</wsd:Hello>");
    EXPECT_FALSE(decodeEnvelope(xml, "h").has_value());
}

TEST(CodecTest, HandWrittenProbeIsAccepted) {
    std::string xml = soap(actionHeader(action::PROBE),
                           "<wsd:Probe xmlns:dpws=\"http://docs.oasis-open.org/ws-dd/ns/dpws/2009/01\">"
                           "<wsd:Types>dpws:Device</wsd:Types>"
                           "<wsd:Scopes>urn:a urn:b</wsd:Scopes></wsd:Probe>");
    auto decoded = decodeEnvelope(xml, "h");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->message_id, "urn:uuid:m1");
    EXPECT_THAT(decoded->types, ElementsAre(DEVICE));
    ASSERT_EQ(decoded->scopes.size(), 2u);
    EXPECT_EQ(decoded->scopes[1].value, "urn:b");
}

TEST(CodecTest, ActionName) {
    EXPECT_EQ(actionName(action::PROBE_MATCHES), "ProbeMatches");
    EXPECT_EQ(actionName("urn:other"), "urn:other");
    EXPECT_TRUE(isKnownAction(action::BYE));
    EXPECT_FALSE(isKnownAction("urn:other"));
}
