#include "onvif_scanner.h"

#include "discovery_text.h"
#include "../../utils/cpp_logger.h"
#include "../../utils/socket_utils.h"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <cstdio>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <random>

namespace capturehub {
namespace devices {
namespace scanners {

namespace {

const char* kLogPrefix = "[Scanner:onvif]";
const char* kScopeNamePrefix = "onvif://www.onvif.org/name/";
const char* kScopeHardwarePrefix = "onvif://www.onvif.org/hardware/";

std::string random_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned long long> dist;
    const unsigned long long hi = dist(gen);
    const unsigned long long lo = dist(gen);
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%08llx-%04llx-4%03llx-a%03llx-%012llx",
                  (hi >> 32) & 0xffffffffULL, (hi >> 16) & 0xffffULL, hi & 0xfffULL,
                  (lo >> 48) & 0xfffULL, lo & 0xffffffffffffULL);
    return buffer;
}

struct XmlDocFree {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocument = std::unique_ptr<xmlDoc, XmlDocFree>;

std::once_flag g_libxml_init;

// Element local names; prefixes vary between vendors.
bool is_element(const xmlNode* node, const char* local_name) {
    return node != nullptr && node->type == XML_ELEMENT_NODE && node->name != nullptr &&
           std::strcmp(reinterpret_cast<const char*>(node->name), local_name) == 0;
}

const xmlNode* first_child(const xmlNode* parent, const char* local_name) {
    if (parent == nullptr) {
        return nullptr;
    }
    for (const xmlNode* child = parent->children; child != nullptr; child = child->next) {
        if (is_element(child, local_name)) {
            return child;
        }
    }
    return nullptr;
}

// Entity-decoded, trimmed text of `node`; empty when the node is absent.
std::string text_of(const xmlNode* node) {
    if (node == nullptr) {
        return {};
    }
    xmlChar* content = xmlNodeGetContent(node);
    if (content == nullptr) {
        return {};
    }
    std::string text = trim_copy(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return text;
}

std::string scope_value(const std::vector<std::string>& scopes, const std::string& prefix) {
    for (const auto& scope : scopes) {
        if (scope.rfind(prefix, 0) == 0) {
            return percent_decode(scope.substr(prefix.size()));
        }
    }
    return {};
}

} // namespace

OnvifScanner::OnvifScanner(config::ScannerSettings settings)
    : settings_(std::move(settings)) {}

std::string OnvifScanner::build_probe(const std::string& message_id) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
           "<e:Envelope xmlns:e=\"http://www.w3.org/2003/05/soap-envelope\""
           " xmlns:w=\"http://schemas.xmlsoap.org/ws/2004/08/addressing\""
           " xmlns:d=\"http://schemas.xmlsoap.org/ws/2005/04/discovery\""
           " xmlns:dn=\"http://www.onvif.org/ver10/network/wsdl\">"
           "<e:Header>"
           "<w:MessageID>" + message_id + "</w:MessageID>"
           "<w:To e:mustUnderstand=\"true\">urn:schemas-xmlsoap-org:ws:2005:04:discovery</w:To>"
           "<w:Action e:mustUnderstand=\"true\">http://schemas.xmlsoap.org/ws/2005/04/discovery/Probe</w:Action>"
           "</e:Header>"
           "<e:Body><d:Probe><d:Types>dn:NetworkVideoTransmitter</d:Types></d:Probe></e:Body>"
           "</e:Envelope>";
}

namespace {

DiscoveryResult result_from_match(const xmlNode* match, const std::string& sender_ip) {
    DiscoveryResult result;
    result.source_protocol = OnvifScanner::kProtocol;
    result.kind = DeviceKind::NETWORK;
    result.type = DeviceType::VIDEO;
    result.protocol = "rtsp";
    result.capabilities = {"onvif", "rtsp"};
    result.ip = sender_ip;
    result.port = 80;
    result.raw_identity = text_of(first_child(first_child(match, "EndpointReference"), "Address"));

    for (const auto& candidate : split_whitespace(text_of(first_child(match, "XAddrs")))) {
        ParsedUrl url;
        if (!parse_url(candidate, url) || (url.scheme != "http" && url.scheme != "https")) {
            continue;
        }
        result.ip = url.host;
        result.port = url.port > 0 ? url.port : default_port_for_scheme(url.scheme);
        break;
    }

    const std::vector<std::string> scopes = split_whitespace(text_of(first_child(match, "Scopes")));
    std::string name = scope_value(scopes, kScopeNamePrefix);
    const std::string hardware = scope_value(scopes, kScopeHardwarePrefix);
    if (name.empty()) {
        name = hardware.empty() ? "ONVIF Camera" : hardware;
    } else if (!hardware.empty() && hardware != name) {
        name += " (" + hardware + ")";
    }
    result.name = name;
    if (result.raw_identity.empty()) {
        result.raw_identity = sender_ip;
    }

    const std::string device_id = make_network_device_id(result.ip, result.port);
    result.streams[device_id + "_main"] = "rtsp://" + result.ip + std::string(OnvifScanner::kDefaultMediaPath);
    return result;
}

} // namespace

std::vector<DiscoveryResult> OnvifScanner::parse_probe_matches(const std::string& xml, const std::string& sender_ip) {
    std::call_once(g_libxml_init, xmlInitParser);
    std::vector<DiscoveryResult> results;
    XmlDocument doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "probe-matches.xml", nullptr,
                                  XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        LOG_CPP_DEBUG("%s Reply from %s is not well-formed XML", kLogPrefix, sender_ip.c_str());
        return results;
    }
    const xmlNode* envelope = xmlDocGetRootElement(doc.get());
    if (!is_element(envelope, "Envelope")) {
        return results;
    }
    const xmlNode* matches = first_child(first_child(envelope, "Body"), "ProbeMatches");
    if (matches == nullptr) {
        return results;
    }
    for (const xmlNode* child = matches->children; child != nullptr; child = child->next) {
        if (is_element(child, "ProbeMatch")) {
            results.push_back(result_from_match(child, sender_ip));
        }
    }
    return results;
}

std::vector<DiscoveryResult> OnvifScanner::scan(std::chrono::milliseconds timeout, const utils::StopSignal& stop) {
    const std::string message_id = "uuid:" + random_uuid();
    const auto replies = utils::multicast_query(kMulticastGroup, kPort, build_probe(message_id),
                                                timeout, stop, kLogPrefix);

    std::map<std::string, DiscoveryResult> unique;
    size_t ignored = 0;
    for (const auto& reply : replies) {
        auto matches = parse_probe_matches(reply.data, reply.sender_ip);
        if (matches.empty()) {
            ++ignored;
            continue;
        }
        for (auto& result : matches) {
            result.username = settings_.username;
            result.password = settings_.password;
            const std::string device_id = derive_device_id(result);
            if (device_id.empty()) {
                ++ignored;
                continue;
            }
            unique.emplace(device_id, std::move(result));
        }
    }

    std::vector<DiscoveryResult> results;
    results.reserve(unique.size());
    for (auto& entry : unique) {
        results.push_back(std::move(entry.second));
    }
    LOG_CPP_INFO("%s %zu devices from %zu replies (%zu ignored)", kLogPrefix, results.size(), replies.size(), ignored);
    return results;
}

} // namespace scanners
} // namespace devices
} // namespace capturehub
