/**
 * @file codec.cpp
 * @brief Envelope codec on top of libxml2.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#include "sdcdisco/wsd/codec.hpp"
#include "sdcdisco/utils/logger.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <climits>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <sstream>

namespace sdcdisco {
namespace wsd {

namespace {

using XmlDoc = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

const xmlChar* X(const char* s) {
    return reinterpret_cast<const xmlChar*>(s);
}

const xmlChar* X(const std::string& s) {
    return reinterpret_cast<const xmlChar*>(s.c_str());
}

void ensureParserInitialized() {
    static std::once_flag once;
    std::call_once(once, []() { xmlInitParser(); });
}

std::vector<std::string> splitWhitespace(const std::string& text) {
    std::vector<std::string> parts;
    std::istringstream iss(text);
    std::string item;
    while (iss >> item) {
        parts.push_back(item);
    }
    return parts;
}

std::string joinSpace(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ' ';
        }
        out += item;
    }
    return out;
}

// =============================================================================
// Encoding
// =============================================================================

struct Namespaces {
    xmlNsPtr s12 = nullptr;
    xmlNsPtr wsa = nullptr;
    xmlNsPtr wsd = nullptr;
};

xmlNodePtr addText(xmlNodePtr parent, xmlNsPtr ns, const char* name, const std::string& text) {
    return xmlNewTextChild(parent, ns, X(name), X(text));
}

/**
 * Prefix bound to `href` at `node`, declaring a new one on `node` if needed.
 */
std::string prefixFor(xmlNodePtr node, const std::string& href, int& generated) {
    xmlNsPtr ns = xmlSearchNsByHref(node->doc, node, X(href));
    if (ns == nullptr || ns->prefix == nullptr) {
        std::string prefix = "t" + std::to_string(generated++);
        ns = xmlNewNs(node, X(href), X(prefix));
        if (ns == nullptr) {
            throw std::runtime_error("cannot declare namespace " + href);
        }
    }
    return reinterpret_cast<const char*>(ns->prefix);
}

void addEpr(xmlNodePtr parent, const Namespaces& n, const std::string& epr) {
    xmlNodePtr ref = xmlNewChild(parent, n.wsa, X("EndpointReference"), nullptr);
    addText(ref, n.wsa, "Address", epr);
}

void addTypes(xmlNodePtr parent, const Namespaces& n, const std::vector<QName>& types) {
    if (types.empty()) {
        return;
    }
    xmlNodePtr node = xmlNewChild(parent, n.wsd, X("Types"), nullptr);
    int generated = 0;
    std::vector<std::string> names;
    for (const auto& type : types) {
        names.push_back(prefixFor(node, type.ns, generated) + ":" + type.local_name);
    }
    xmlNodeAddContent(node, X(joinSpace(names)));
}

void addScopes(xmlNodePtr parent, const Namespaces& n, const std::vector<Scope>& scopes) {
    if (scopes.empty()) {
        return;
    }
    std::vector<std::string> values;
    for (const auto& scope : scopes) {
        values.push_back(scope.quotedValue());
    }
    xmlNodePtr node = addText(parent, n.wsd, "Scopes", joinSpace(values));
    // one element carries one dialect
    const std::string& matchBy = scopes.front().match_by;
    for (const auto& scope : scopes) {
        if (scope.match_by != matchBy) {
            LOG_WARN("Codec", "Scopes mix dialects, sending all as '{}' (got '{}' for {})",
                     matchBy, scope.match_by, scope.value);
        }
    }
    if (!matchBy.empty()) {
        xmlNewProp(node, X("MatchBy"), X(matchBy));
    }
}

void addXAddrs(xmlNodePtr parent, const Namespaces& n, const std::vector<std::string>& xAddrs) {
    if (!xAddrs.empty()) {
        addText(parent, n.wsd, "XAddrs", joinSpace(xAddrs));
    }
}

void addMetadataVersion(xmlNodePtr parent, const Namespaces& n, uint32_t version) {
    addText(parent, n.wsd, "MetadataVersion", std::to_string(version));
}

void addAppSequence(xmlNodePtr header, const Namespaces& n, const Envelope& env) {
    xmlNodePtr node = xmlNewChild(header, n.wsd, X("AppSequence"), nullptr);
    xmlNewProp(node, X("InstanceId"), X(std::to_string(env.instance_id)));
    if (!env.sequence_id.empty()) {
        xmlNewProp(node, X("SequenceId"), X(env.sequence_id));
    }
    xmlNewProp(node, X("MessageNumber"), X(std::to_string(env.message_number)));
}

void addMatch(xmlNodePtr parent, const Namespaces& n, const char* name, const ProbeResolveMatch& match) {
    xmlNodePtr node = xmlNewChild(parent, n.wsd, X(name), nullptr);
    addEpr(node, n, match.epr);
    addTypes(node, n, match.types);
    addScopes(node, n, match.scopes);
    addXAddrs(node, n, match.x_addrs);
    addMetadataVersion(node, n, match.metadata_version);
}

// =============================================================================
// Decoding
// =============================================================================

bool isElement(xmlNodePtr node, const char* href, const char* name) {
    return node != nullptr && node->type == XML_ELEMENT_NODE && node->ns != nullptr &&
           xmlStrEqual(node->ns->href, X(href)) && xmlStrEqual(node->name, X(name));
}

xmlNodePtr findChild(xmlNodePtr parent, const char* href, const char* name) {
    if (parent == nullptr) {
        return nullptr;
    }
    for (xmlNodePtr child = parent->children; child != nullptr; child = child->next) {
        if (isElement(child, href, name)) {
            return child;
        }
    }
    return nullptr;
}

std::string nodeText(xmlNodePtr node) {
    if (node == nullptr) {
        return std::string();
    }
    xmlChar* content = xmlNodeGetContent(node);
    if (content == nullptr) {
        return std::string();
    }
    std::string text(reinterpret_cast<const char*>(content));
    xmlFree(content);

    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string attribute(xmlNodePtr node, const char* name) {
    xmlChar* value = xmlGetProp(node, X(name));
    if (value == nullptr) {
        return std::string();
    }
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

bool parseUint32(const std::string& text, uint32_t& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (*end != '\0' || text[0] == '-' || value > 0xFFFFFFFFULL) {
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

/**
 * Resolve "prefix:local" (or "local" for the default namespace) in the
 * scope of `node`. Returns false for an undeclared prefix.
 */
bool resolveQName(xmlNodePtr node, const std::string& text, QName& out) {
    auto colon = text.find(':');
    std::string prefix = colon == std::string::npos ? std::string() : text.substr(0, colon);
    std::string local = colon == std::string::npos ? text : text.substr(colon + 1);

    xmlNsPtr ns = xmlSearchNs(node->doc, node, prefix.empty() ? nullptr : X(prefix));
    if (ns == nullptr || ns->href == nullptr) {
        return false;
    }
    out = QName(reinterpret_cast<const char*>(ns->href), local);
    return true;
}

class EnvelopeReader {
public:
    explicit EnvelopeReader(const std::string& source) : source_(source) {}

    bool types(xmlNodePtr parent, std::vector<QName>& out) {
        xmlNodePtr node = findChild(parent, ns::DISCOVERY, "Types");
        if (node == nullptr) {
            return true;
        }
        for (const auto& item : splitWhitespace(nodeText(node))) {
            QName qname;
            if (!resolveQName(node, item, qname)) {
                return fail("undeclared prefix in type '" + item + "'");
            }
            out.push_back(qname);
        }
        return true;
    }

    void scopes(xmlNodePtr parent, std::vector<Scope>& out) {
        xmlNodePtr node = findChild(parent, ns::DISCOVERY, "Scopes");
        if (node == nullptr) {
            return;
        }
        std::string matchBy = attribute(node, "MatchBy");
        for (const auto& item : splitWhitespace(nodeText(node))) {
            out.emplace_back(item, matchBy);
        }
    }

    void xAddrs(xmlNodePtr parent, std::vector<std::string>& out) {
        xmlNodePtr node = findChild(parent, ns::DISCOVERY, "XAddrs");
        if (node != nullptr) {
            out = splitWhitespace(nodeText(node));
        }
    }

    std::string epr(xmlNodePtr parent) {
        xmlNodePtr ref = findChild(parent, ns::ADDRESSING, "EndpointReference");
        return nodeText(findChild(ref, ns::ADDRESSING, "Address"));
    }

    bool metadataVersion(xmlNodePtr parent, uint32_t& out) {
        xmlNodePtr node = findChild(parent, ns::DISCOVERY, "MetadataVersion");
        if (node == nullptr) {
            return true;
        }
        if (!parseUint32(nodeText(node), out)) {
            return fail("invalid MetadataVersion '" + nodeText(node) + "'");
        }
        return true;
    }

    bool appSequence(xmlNodePtr header, Envelope& env) {
        xmlNodePtr node = findChild(header, ns::DISCOVERY, "AppSequence");
        if (node == nullptr) {
            return true;
        }
        std::string instance = attribute(node, "InstanceId");
        std::string number = attribute(node, "MessageNumber");
        if (!instance.empty() && !parseUint32(instance, env.instance_id)) {
            return fail("invalid InstanceId '" + instance + "'");
        }
        if (!number.empty() && !parseUint32(number, env.message_number)) {
            return fail("invalid MessageNumber '" + number + "'");
        }
        env.sequence_id = attribute(node, "SequenceId");
        return true;
    }

    void relatesTo(xmlNodePtr header, Envelope& env) {
        xmlNodePtr node = findChild(header, ns::ADDRESSING, "RelatesTo");
        if (node == nullptr) {
            return;
        }
        env.relates_to = nodeText(node);
        std::string relType = attribute(node, "RelationshipType");
        if (relType.empty()) {
            return;
        }
        if (!resolveQName(node, relType, env.relationship_type)) {
            // keep the local part of an undeclared prefix
            auto colon = relType.find(':');
            env.relationship_type = QName("", colon == std::string::npos ? relType : relType.substr(colon + 1));
        }
    }

    void replyTo(xmlNodePtr header, Envelope& env) {
        xmlNodePtr node = findChild(header, ns::ADDRESSING, "ReplyTo");
        if (node == nullptr) {
            return;
        }
        xmlNodePtr address = findChild(node, ns::ADDRESSING, "Address");
        env.reply_to = nodeText(address != nullptr ? address : node);
    }

    bool match(xmlNodePtr node, ProbeResolveMatch& out) {
        out.epr = epr(node);
        scopes(node, out.scopes);
        xAddrs(node, out.x_addrs);
        return types(node, out.types) && metadataVersion(node, out.metadata_version);
    }

    bool fail(const std::string& reason) {
        LOG_WARN("Codec", "Discarding message from {}: {}", source_, reason);
        return false;
    }

private:
    std::string source_;
};

}  // namespace

std::string encodeEnvelope(const Envelope& env) {
    if (!isKnownAction(env.action)) {
        throw UnsupportedActionError(env.action);
    }
    ensureParserInitialized();

    XmlDoc doc(xmlNewDoc(X("1.0")), xmlFreeDoc);
    xmlNodePtr root = xmlNewDocNode(doc.get(), nullptr, X("Envelope"), nullptr);
    xmlDocSetRootElement(doc.get(), root);

    Namespaces n;
    n.s12 = xmlNewNs(root, X(ns::SOAP), X("s12"));
    n.wsa = xmlNewNs(root, X(ns::ADDRESSING), X("wsa"));
    n.wsd = xmlNewNs(root, X(ns::DISCOVERY), X("wsd"));
    xmlNewNs(root, X(ns::DPWS), X("dpws"));
    xmlSetNs(root, n.s12);

    xmlNodePtr header = xmlNewChild(root, n.s12, X("Header"), nullptr);
    xmlNodePtr body = xmlNewChild(root, n.s12, X("Body"), nullptr);

    addText(header, n.wsa, "Action", env.action);
    addText(header, n.wsa, "MessageID", env.message_id);
    if (!env.relates_to.empty()) {
        xmlNodePtr rel = addText(header, n.wsa, "RelatesTo", env.relates_to);
        if (!env.relationship_type.empty()) {
            int generated = 0;
            std::string prefix = prefixFor(rel, env.relationship_type.ns, generated);
            xmlNewProp(rel, X("RelationshipType"), X(prefix + ":" + env.relationship_type.local_name));
        }
    }
    if (!env.to.empty()) {
        addText(header, n.wsa, "To", env.to);
    }
    if (!env.reply_to.empty()) {
        xmlNodePtr reply = xmlNewChild(header, n.wsa, X("ReplyTo"), nullptr);
        addText(reply, n.wsa, "Address", env.reply_to);
    }

    if (env.action == action::HELLO) {
        addAppSequence(header, n, env);
        xmlNodePtr hello = xmlNewChild(body, n.wsd, X("Hello"), nullptr);
        addEpr(hello, n, env.epr);
        addTypes(hello, n, env.types);
        addScopes(hello, n, env.scopes);
        addXAddrs(hello, n, env.x_addrs);
        addMetadataVersion(hello, n, env.metadata_version);
    } else if (env.action == action::BYE) {
        addAppSequence(header, n, env);
        xmlNodePtr bye = xmlNewChild(body, n.wsd, X("Bye"), nullptr);
        addEpr(bye, n, env.epr);
    } else if (env.action == action::PROBE) {
        xmlNodePtr probe = xmlNewChild(body, n.wsd, X("Probe"), nullptr);
        addTypes(probe, n, env.types);
        addScopes(probe, n, env.scopes);
    } else if (env.action == action::PROBE_MATCHES) {
        addAppSequence(header, n, env);
        xmlNodePtr matches = xmlNewChild(body, n.wsd, X("ProbeMatches"), nullptr);
        for (const auto& match : env.probe_resolve_matches) {
            addMatch(matches, n, "ProbeMatch", match);
        }
    } else if (env.action == action::RESOLVE) {
        xmlNodePtr resolve = xmlNewChild(body, n.wsd, X("Resolve"), nullptr);
        addEpr(resolve, n, env.epr);
    } else {
        addAppSequence(header, n, env);
        xmlNodePtr matches = xmlNewChild(body, n.wsd, X("ResolveMatches"), nullptr);
        if (!env.probe_resolve_matches.empty()) {
            addMatch(matches, n, "ResolveMatch", env.probe_resolve_matches.front());
        }
    }

    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpMemoryEnc(doc.get(), &buffer, &size, "UTF-8");
    if (buffer == nullptr) {
        throw std::runtime_error("failed to serialize " + actionName(env.action) + " envelope");
    }
    std::string result(reinterpret_cast<const char*>(buffer), static_cast<size_t>(size));
    xmlFree(buffer);
    return result;
}

std::optional<Envelope> decodeEnvelope(const std::string& data, const std::string& source) {
    EnvelopeReader reader(source);
    if (data.empty() || data.size() > static_cast<size_t>(INT_MAX)) {
        reader.fail("empty or oversized payload");
        return std::nullopt;
    }
    ensureParserInitialized();

    XmlDoc doc(xmlReadMemory(data.data(), static_cast<int>(data.size()), "envelope.xml", nullptr,
                             XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
               xmlFreeDoc);
    if (!doc) {
        reader.fail("not well-formed XML");
        return std::nullopt;
    }

    xmlNodePtr root = xmlDocGetRootElement(doc.get());
    if (!isElement(root, ns::SOAP, "Envelope")) {
        reader.fail("root is not a SOAP 1.2 Envelope");
        return std::nullopt;
    }
    xmlNodePtr header = findChild(root, ns::SOAP, "Header");
    xmlNodePtr body = findChild(root, ns::SOAP, "Body");
    if (header == nullptr || body == nullptr) {
        reader.fail("missing Header or Body");
        return std::nullopt;
    }
    xmlNodePtr actionNode = findChild(header, ns::ADDRESSING, "Action");
    if (actionNode == nullptr) {
        reader.fail("missing Action header");
        return std::nullopt;
    }

    Envelope env(nodeText(actionNode));
    env.message_id = nodeText(findChild(header, ns::ADDRESSING, "MessageID"));
    env.to = nodeText(findChild(header, ns::ADDRESSING, "To"));

    bool ok = true;
    if (env.action == action::PROBE) {
        reader.replyTo(header, env);
        xmlNodePtr probe = findChild(body, ns::DISCOVERY, "Probe");
        ok = probe != nullptr ? reader.types(probe, env.types) : reader.fail("Probe body missing");
        if (ok) {
            reader.scopes(probe, env.scopes);
        }
    } else if (env.action == action::PROBE_MATCHES) {
        reader.relatesTo(header, env);
        ok = reader.appSequence(header, env);
        xmlNodePtr matches = findChild(body, ns::DISCOVERY, "ProbeMatches");
        for (xmlNodePtr child = matches ? matches->children : nullptr; ok && child; child = child->next) {
            if (isElement(child, ns::DISCOVERY, "ProbeMatch")) {
                ProbeResolveMatch match;
                ok = reader.match(child, match);
                env.probe_resolve_matches.push_back(std::move(match));
            }
        }
    } else if (env.action == action::RESOLVE) {
        reader.replyTo(header, env);
        env.epr = reader.epr(findChild(body, ns::DISCOVERY, "Resolve"));
    } else if (env.action == action::RESOLVE_MATCHES) {
        reader.relatesTo(header, env);
        ok = reader.appSequence(header, env);
        xmlNodePtr matches = findChild(body, ns::DISCOVERY, "ResolveMatches");
        xmlNodePtr match = findChild(matches, ns::DISCOVERY, "ResolveMatch");
        if (ok && match != nullptr) {
            ProbeResolveMatch entry;
            ok = reader.match(match, entry);
            env.probe_resolve_matches.push_back(std::move(entry));
        }
    } else if (env.action == action::HELLO) {
        reader.relatesTo(header, env);
        ok = reader.appSequence(header, env);
        xmlNodePtr hello = findChild(body, ns::DISCOVERY, "Hello");
        if (ok && hello == nullptr) {
            ok = reader.fail("Hello body missing");
        }
        if (ok) {
            env.epr = reader.epr(hello);
            reader.scopes(hello, env.scopes);
            reader.xAddrs(hello, env.x_addrs);
            ok = reader.types(hello, env.types) && reader.metadataVersion(hello, env.metadata_version);
        }
    } else if (env.action == action::BYE) {
        ok = reader.appSequence(header, env);
        env.epr = reader.epr(findChild(body, ns::DISCOVERY, "Bye"));
    } else {
        ok = reader.fail("unknown action '" + env.action + "'");
    }

    if (!ok) {
        return std::nullopt;
    }
    return env;
}

}  // namespace wsd
}  // namespace sdcdisco
