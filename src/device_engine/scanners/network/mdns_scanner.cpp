#include "mdns_scanner.h"

#include "discovery_text.h"
#include "dns_message.h"
#include "../../utils/cpp_logger.h"
#include "../../utils/socket_utils.h"

#include <map>

namespace capturehub {
namespace devices {
namespace scanners {

namespace {

const char* kLogPrefix = "[Scanner:mdns]";

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "_rtsp._tcp.local" -> "rtsp"
std::string protocol_for_service(const std::string& service) {
    const size_t dot = service.find('.');
    std::string head = service.substr(0, dot);
    if (!head.empty() && head.front() == '_') {
        head.erase(0, 1);
    }
    return head;
}

std::string txt_value(const std::vector<std::string>& entries, const std::string& key) {
    const std::string prefix = key + "=";
    for (const auto& entry : entries) {
        if (to_lower_copy(entry.substr(0, prefix.size())) == prefix) {
            return entry.substr(prefix.size());
        }
    }
    return {};
}

} // namespace

MdnsScanner::MdnsScanner(config::ScannerSettings settings)
    : settings_(std::move(settings)) {}

const std::vector<std::string>& MdnsScanner::service_types() {
    static const std::vector<std::string> kServices = {"_rtsp._tcp.local", "_http._tcp.local"};
    return kServices;
}

std::vector<DiscoveryResult> MdnsScanner::parse_response(const std::vector<uint8_t>& packet,
                                                         const std::string& sender_ip) {
    std::vector<DiscoveryResult> results;
    std::vector<DnsRecord> records;
    if (!parse_dns_response(packet.data(), packet.size(), records)) {
        return results;
    }

    std::map<std::string, std::string> addresses;
    std::map<std::string, std::vector<std::string>> txt;
    for (const auto& record : records) {
        if (record.type == kDnsTypeA) {
            addresses[to_lower_copy(record.name)] = record.address;
        } else if (record.type == kDnsTypeTxt) {
            txt[to_lower_copy(record.name)] = record.txt;
        }
    }

    for (const auto& record : records) {
        if (record.type != kDnsTypeSrv || record.port == 0) {
            continue;
        }
        const std::string instance_lower = to_lower_copy(record.name);
        std::string service;
        for (const auto& candidate : service_types()) {
            if (ends_with(instance_lower, "." + candidate)) {
                service = candidate;
                break;
            }
        }
        if (service.empty()) {
            continue;
        }

        DiscoveryResult result;
        result.source_protocol = kProtocol;
        result.kind = DeviceKind::NETWORK;
        result.type = DeviceType::VIDEO;
        result.raw_identity = record.name;
        result.protocol = protocol_for_service(service);
        result.capabilities = {"mdns", result.protocol};
        result.port = record.port;
        auto address = addresses.find(to_lower_copy(record.target));
        result.ip = address != addresses.end() ? address->second : sender_ip;
        result.name = record.name.substr(0, record.name.size() - service.size() - 1);

        std::string path = txt_value(txt[instance_lower], "path");
        if (!path.empty() && path.front() != '/') {
            path.insert(path.begin(), '/');
        }
        const std::string device_id = make_network_device_id(result.ip, result.port);
        result.streams[device_id + "_" + result.protocol] =
            result.protocol + "://" + result.ip + ":" + std::to_string(result.port) + (path.empty() ? "/" : path);
        results.push_back(std::move(result));
    }
    return results;
}

std::vector<DiscoveryResult> MdnsScanner::scan(std::chrono::milliseconds timeout, const utils::StopSignal& stop) {
    const std::vector<uint8_t> query = build_ptr_query(service_types(), true);
    const auto replies = utils::multicast_query(kMulticastGroup, kPort,
                                                std::string(query.begin(), query.end()),
                                                timeout, stop, kLogPrefix, 255);

    std::map<std::string, DiscoveryResult> unique;
    for (const auto& reply : replies) {
        const std::vector<uint8_t> packet(reply.data.begin(), reply.data.end());
        for (auto& result : parse_response(packet, reply.sender_ip)) {
            result.username = settings_.username;
            result.password = settings_.password;
            const std::string device_id = derive_device_id(result);
            auto it = unique.find(device_id);
            if (it == unique.end()) {
                unique.emplace(device_id, std::move(result));
            } else {
                it->second.capabilities.insert(result.capabilities.begin(), result.capabilities.end());
                it->second.streams.insert(result.streams.begin(), result.streams.end());
            }
        }
    }

    std::vector<DiscoveryResult> results;
    for (auto& entry : unique) {
        results.push_back(std::move(entry.second));
    }
    LOG_CPP_INFO("%s %zu services from %zu replies", kLogPrefix, results.size(), replies.size());
    return results;
}

} // namespace scanners
} // namespace devices
} // namespace capturehub
