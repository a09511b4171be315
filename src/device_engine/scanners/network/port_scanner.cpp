#include "port_scanner.h"

#include "../../utils/cpp_logger.h"
#include "../../utils/socket_utils.h"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <mutex>
#include <thread>

#include <arpa/inet.h>

namespace capturehub {
namespace devices {
namespace scanners {

namespace {

const char* kLogPrefix = "[Scanner:port_scan]";
constexpr std::chrono::milliseconds kMaxConnectTimeout{500};

struct Target {
    std::string ip;
    int port;
};

} // namespace

PortScanner::PortScanner(config::ScannerSettings settings)
    : settings_(std::move(settings)) {
    if (settings_.ports.empty()) {
        settings_.ports = {554, 8554};
    }
}

bool PortScanner::expand_range(const std::string& range, std::vector<std::string>& hosts) {
    const size_t slash = range.find('/');
    const std::string base = range.substr(0, slash);
    if (!utils::is_valid_ipv4(base)) {
        return false;
    }
    if (slash == std::string::npos) {
        hosts.push_back(base);
        return true;
    }

    const std::string prefix_text = range.substr(slash + 1);
    if (prefix_text.empty() || prefix_text.size() > 2 ||
        !std::all_of(prefix_text.begin(), prefix_text.end(), ::isdigit)) {
        return false;
    }
    const int prefix = std::atoi(prefix_text.c_str());
    if (prefix < kMinPrefixLength || prefix > 32) {
        return false;
    }

    in_addr addr {};
    inet_pton(AF_INET, base.c_str(), &addr);
    const uint32_t host_order = ntohl(addr.s_addr);
    const uint32_t size = 1u << (32 - prefix);
    const uint32_t network = host_order & ~(size - 1);
    const bool skip_edges = size > 2;
    for (uint32_t offset = 0; offset < size; ++offset) {
        if (skip_edges && (offset == 0 || offset == size - 1)) {
            continue;
        }
        in_addr host {};
        host.s_addr = htonl(network + offset);
        char buffer[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &host, buffer, sizeof(buffer));
        hosts.emplace_back(buffer);
    }
    return true;
}

std::vector<DiscoveryResult> PortScanner::scan(std::chrono::milliseconds timeout, const utils::StopSignal& stop) {
    std::vector<DiscoveryResult> results;
    if (settings_.scan_ranges.empty()) {
        LOG_CPP_DEBUG("%s No scan ranges configured.", kLogPrefix);
        return results;
    }

    std::vector<Target> targets;
    for (const auto& range : settings_.scan_ranges) {
        std::vector<std::string> hosts;
        if (!expand_range(range, hosts)) {
            LOG_CPP_WARNING("%s Ignoring invalid scan range '%s' (single IPv4 or /%d and narrower)",
                            kLogPrefix, range.c_str(), kMinPrefixLength);
            continue;
        }
        for (const auto& host : hosts) {
            for (int port : settings_.ports) {
                if (port > 0 && port <= 65535) {
                    targets.push_back({host, port});
                }
            }
        }
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto connect_timeout = std::min(kMaxConnectTimeout, timeout);
    std::atomic<size_t> next{0};
    std::mutex results_mutex;

    auto worker = [&]() {
        while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            const size_t index = next.fetch_add(1);
            if (index >= targets.size()) {
                return;
            }
            const Target& target = targets[index];
            const auto outcome = utils::tcp_connect_probe(target.ip, static_cast<uint16_t>(target.port),
                                                          connect_timeout, stop);
            if (outcome != utils::ConnectOutcome::CONNECTED) {
                continue;
            }
            DiscoveryResult result;
            result.source_protocol = kProtocol;
            result.raw_identity = target.ip + ":" + std::to_string(target.port);
            result.kind = DeviceKind::NETWORK;
            result.type = DeviceType::VIDEO;
            result.ip = target.ip;
            result.port = target.port;
            result.protocol = "rtsp";
            result.username = settings_.username;
            result.password = settings_.password;
            result.capabilities = {"rtsp"};
            result.name = "RTSP endpoint " + result.raw_identity;
            result.streams[make_network_device_id(target.ip, target.port) + "_main"] =
                "rtsp://" + target.ip + ":" + std::to_string(target.port) + "/";
            std::lock_guard<std::mutex> lock(results_mutex);
            results.push_back(std::move(result));
        }
    };

    std::vector<std::thread> workers;
    const size_t worker_count = std::min(kWorkerCount, std::max<size_t>(targets.size(), 1));
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    LOG_CPP_INFO("%s %zu open endpoints out of %zu probed targets", kLogPrefix, results.size(),
                 std::min(next.load(), targets.size()));
    return results;
}

} // namespace scanners
} // namespace devices
} // namespace capturehub
