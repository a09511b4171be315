#include "upnp_scanner.h"

#include "discovery_text.h"
#include "../../utils/cpp_logger.h"
#include "../../utils/socket_utils.h"

#include <algorithm>
#include <sstream>

namespace capturehub {
namespace devices {
namespace scanners {

namespace {

const char* kLogPrefix = "[Scanner:upnp]";
const std::vector<std::string> kMediaKeywords = {"camera", "video", "audio", "media", "sound"};

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&](const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

} // namespace

UpnpScanner::UpnpScanner(config::ScannerSettings settings)
    : settings_(std::move(settings)) {}

std::string UpnpScanner::build_msearch(const std::string& search_target, int mx_seconds) {
    std::ostringstream oss;
    oss << "M-SEARCH * HTTP/1.1\r\n"
        << "HOST: " << kMulticastGroup << ":" << kPort << "\r\n"
        << "MAN: \"ssdp:discover\"\r\n"
        << "MX: " << std::max(1, mx_seconds) << "\r\n"
        << "ST: " << search_target << "\r\n"
        << "\r\n";
    return oss.str();
}

std::optional<std::map<std::string, std::string>> UpnpScanner::parse_ssdp_headers(const std::string& response) {
    std::istringstream stream(response);
    std::string line;
    if (!std::getline(stream, line)) {
        return std::nullopt;
    }
    const std::string status = to_lower_copy(trim_copy(line));
    if (status.rfind("http/1.", 0) != 0 || status.find(" 200") == std::string::npos) {
        return std::nullopt;
    }

    std::map<std::string, std::string> headers;
    while (std::getline(stream, line)) {
        const std::string trimmed = trim_copy(line);
        if (trimmed.empty()) {
            break;
        }
        const size_t colon = trimmed.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        headers[to_lower_copy(trim_copy(trimmed.substr(0, colon)))] = trim_copy(trimmed.substr(colon + 1));
    }
    return headers;
}

std::optional<DiscoveryResult> UpnpScanner::parse_response(const std::string& response, const std::string& sender_ip) {
    auto headers = parse_ssdp_headers(response);
    if (!headers) {
        return std::nullopt;
    }
    auto header = [&headers](const char* name) {
        auto it = headers->find(name);
        return it == headers->end() ? std::string() : it->second;
    };

    const std::string lowered = to_lower_copy(header("st") + " " + header("usn") + " " + header("server"));
    if (!contains_any(lowered, kMediaKeywords)) {
        return std::nullopt;
    }

    DiscoveryResult result;
    result.source_protocol = kProtocol;
    result.kind = DeviceKind::NETWORK;
    result.raw_identity = header("usn");
    result.type = (lowered.find("audio") != std::string::npos || lowered.find("sound") != std::string::npos)
                      ? DeviceType::AUDIO
                      : DeviceType::VIDEO;
    result.protocol = "http";
    result.capabilities = {"upnp", "http"};
    result.ip = sender_ip;
    result.port = 80;

    const std::string location = header("location");
    ParsedUrl url;
    if (!location.empty() && parse_url(location, url)) {
        result.ip = url.host;
        result.port = url.port > 0 ? url.port : default_port_for_scheme(url.scheme);
        result.streams[make_network_device_id(result.ip, result.port) + "_description"] = location;
    }

    const std::string server = header("server");
    result.name = !server.empty() ? server : (!result.raw_identity.empty() ? result.raw_identity : "UPnP Device");
    if (result.raw_identity.empty()) {
        result.raw_identity = sender_ip;
    }
    return result;
}

std::vector<DiscoveryResult> UpnpScanner::scan(std::chrono::milliseconds timeout, const utils::StopSignal& stop) {
    const int mx = static_cast<int>(std::max<long long>(1, std::min<long long>(5, timeout.count() / 1000)));
    const auto replies = utils::multicast_query(kMulticastGroup, kPort, build_msearch("ssdp:all", mx),
                                                timeout, stop, kLogPrefix, 4);

    std::map<std::string, DiscoveryResult> unique;
    for (const auto& reply : replies) {
        auto result = parse_response(reply.data, reply.sender_ip);
        if (!result) {
            continue;
        }
        result->username = settings_.username;
        result->password = settings_.password;
        const std::string device_id = derive_device_id(*result);
        if (device_id.empty()) {
            continue;
        }
        // A device answers once per service; merge their capability tags.
        auto it = unique.find(device_id);
        if (it == unique.end()) {
            unique.emplace(device_id, std::move(*result));
        } else {
            it->second.capabilities.insert(result->capabilities.begin(), result->capabilities.end());
            it->second.streams.insert(result->streams.begin(), result->streams.end());
        }
    }

    std::vector<DiscoveryResult> results;
    for (auto& entry : unique) {
        results.push_back(std::move(entry.second));
    }
    LOG_CPP_INFO("%s %zu media devices from %zu replies", kLogPrefix, results.size(), replies.size());
    return results;
}

} // namespace scanners
} // namespace devices
} // namespace capturehub
