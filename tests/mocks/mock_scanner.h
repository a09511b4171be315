#pragma once
/**
 * Scripted scanner and prober implementations for discovery and monitoring tests.
 * They let the engine be exercised without multicast traffic or real devices.
 */

#include "monitor/device_prober.h"
#include "scanners/protocol_scanner.h"
#include "scanners/scanner_factory.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace capturehub {
namespace devices {
namespace testing {

/**
 * Mock scanner returning whatever results the test scripted last.
 */
class MockScanner : public scanners::ProtocolScanner {
public:
    explicit MockScanner(std::string protocol) : protocol_(std::move(protocol)) {}

    std::string protocol() const override { return protocol_; }

    std::vector<DiscoveryResult> scan(std::chrono::milliseconds timeout,
                                      const utils::StopSignal& stop) override {
        ++scan_count_;
        last_timeout_ms_ = timeout.count();
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!failure_.empty()) {
                throw std::runtime_error(failure_);
            }
            delay = delay_;
        }
        if (delay.count() > 0 && stop.wait_for(delay)) {
            return {};
        }
        if (stubborn_) {
            // Ignores the stop signal until the test releases it.
            std::unique_lock<std::mutex> lock(mutex_);
            entered_stubborn_ = true;
            release_cv_.wait(lock, [this] { return released_; });
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return results_;
    }

    void set_results(std::vector<DiscoveryResult> results) {
        std::lock_guard<std::mutex> lock(mutex_);
        results_ = std::move(results);
    }

    void set_failure(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = message;
    }

    /** Honours the stop signal while sleeping. */
    void set_delay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = delay;
    }

    void make_stubborn() { stubborn_ = true; }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        release_cv_.notify_all();
    }

    bool entered_stubborn_wait() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entered_stubborn_;
    }

    int scan_count() const { return scan_count_.load(); }
    long long last_timeout_ms() const { return last_timeout_ms_.load(); }

private:
    std::string protocol_;
    mutable std::mutex mutex_;
    std::condition_variable release_cv_;
    std::vector<DiscoveryResult> results_;
    std::string failure_;
    std::chrono::milliseconds delay_{0};
    std::atomic<bool> stubborn_{false};
    bool released_ = false;
    bool entered_stubborn_ = false;
    std::atomic<int> scan_count_{0};
    std::atomic<long long> last_timeout_ms_{0};
};

/**
 * Builds a factory whose creators hand out the given mock instances, so tests keep a handle
 * to script them after the engine created its scanners.
 */
inline scanners::ScannerFactory make_mock_factory(const std::vector<std::shared_ptr<MockScanner>>& mocks) {
    scanners::ScannerFactory factory;
    for (const auto& mock : mocks) {
        factory.register_scanner(mock->protocol(), [mock](const config::ScannerSettings&) {
            return std::static_pointer_cast<scanners::ProtocolScanner>(mock);
        });
    }
    return factory;
}

inline DiscoveryResult make_network_result(const std::string& protocol, const std::string& ip, int port,
                                           const std::string& name,
                                           std::set<std::string> capabilities = {}) {
    DiscoveryResult result;
    result.source_protocol = protocol;
    result.raw_identity = protocol + ":" + ip;
    result.kind = DeviceKind::NETWORK;
    result.type = DeviceType::VIDEO;
    result.ip = ip;
    result.port = port;
    result.protocol = "rtsp";
    result.name = name;
    result.capabilities = std::move(capabilities);
    return result;
}

inline DiscoveryResult make_local_result(const std::string& protocol, DeviceType type,
                                         const std::string& system_path, const std::string& name) {
    DiscoveryResult result;
    result.source_protocol = protocol;
    result.raw_identity = system_path;
    result.kind = DeviceKind::LOCAL;
    result.type = type;
    result.system_path = system_path;
    result.driver = protocol;
    result.name = name;
    result.capabilities = {protocol};
    result.streams[make_local_device_id(type, system_path)] = system_path;
    return result;
}

/**
 * Mock prober with per-device scripted outcomes. Unscripted devices use the default outcome.
 */
class MockProber : public monitor::DeviceProber {
public:
    monitor::ProbeResult probe(const DeviceInfo& device,
                               std::chrono::milliseconds /*timeout*/,
                               const utils::StopSignal& stop) override {
        std::chrono::milliseconds delay;
        monitor::ProbeResult result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++probe_counts_[device.device_id];
            auto it = outcomes_.find(device.device_id);
            result.ok = it != outcomes_.end() ? it->second : default_outcome_;
            delay = delay_;
        }
        if (delay.count() > 0 && stop.wait_for(delay)) {
            result.ok = false;
            result.detail = "cancelled";
            return result;
        }
        result.detail = result.ok ? "reachable" : "unreachable";
        return result;
    }

    void set_outcome(const std::string& device_id, bool ok) {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_[device_id] = ok;
    }

    void set_default_outcome(bool ok) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_outcome_ = ok;
    }

    void set_delay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = delay;
    }

    int probe_count(const std::string& device_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = probe_counts_.find(device_id);
        return it != probe_counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, bool> outcomes_;
    std::map<std::string, int> probe_counts_;
    bool default_outcome_ = true;
    std::chrono::milliseconds delay_{0};
};

} // namespace testing
} // namespace devices
} // namespace capturehub
