#ifndef CAPTUREHUB_DEVICE_ENGINE_SETTINGS_H
#define CAPTUREHUB_DEVICE_ENGINE_SETTINGS_H

#include <map>
#include <string>
#include <vector>

namespace capturehub {
namespace config {

inline constexpr const char* kLocalDomain = "local_devices";
inline constexpr const char* kNetworkDomain = "network_devices";

inline constexpr double kDefaultScanIntervalSec = 60.0;
inline constexpr double kDefaultProbeIntervalSec = 30.0;
inline constexpr int kDefaultProbeFailureThreshold = 3;
inline constexpr int kDefaultRemovalGraceCycles = 3;
inline constexpr long kDefaultScannerTimeoutMs = 5000;
inline constexpr long kDefaultProbeTimeoutMs = 2000;
inline constexpr long kDefaultStopGraceMs = 2000;

/** Per-protocol scanner tuning, keyed by protocol name in ManagerSettings::scanners. */
struct ScannerSettings {
    long timeout_ms = kDefaultScannerTimeoutMs;
    std::string username;                  // Applied to devices this scanner reports.
    std::string password;
    std::vector<std::string> scan_ranges;  // port_scan: "192.168.1.0/24" or single addresses
    std::vector<int> ports;                // port_scan: TCP ports to try
};

struct ManagerSettings {
    double scan_interval_sec = kDefaultScanIntervalSec;
    bool discovery_enabled = true;
    std::vector<std::string> discovery_methods;   // Also the merge precedence, highest first.
    double probe_interval_sec = kDefaultProbeIntervalSec;
    int probe_failure_threshold = kDefaultProbeFailureThreshold;
    int removal_grace_cycles = kDefaultRemovalGraceCycles;
    long probe_timeout_ms = kDefaultProbeTimeoutMs;
    long stop_grace_ms = kDefaultStopGraceMs;
    bool enable_video = true;                     // local only
    bool enable_audio = true;                     // local only
    std::map<std::string, ScannerSettings> scanners;

    /** @brief Settings for `protocol`, or defaults if none were configured. */
    ScannerSettings scanner(const std::string& protocol) const {
        auto it = scanners.find(protocol);
        return it != scanners.end() ? it->second : ScannerSettings{};
    }
};

struct SystemSettings {
    std::string log_level = "INFO";
    std::string storage_path = "storage";
    bool persist_credentials = false;
};

struct EngineSettings {
    SystemSettings system;
    ManagerSettings local_devices;
    ManagerSettings network_devices;
};

inline ManagerSettings default_local_settings() {
    ManagerSettings settings;
    settings.discovery_methods = {"v4l2", "alsa"};
    settings.probe_interval_sec = 10.0;
    return settings;
}

inline ManagerSettings default_network_settings() {
    ManagerSettings settings;
    settings.discovery_methods = {"onvif", "upnp", "mdns"};
    ScannerSettings port_scan;
    port_scan.ports = {554, 8554};
    settings.scanners["port_scan"] = port_scan;
    return settings;
}

inline EngineSettings default_engine_settings() {
    EngineSettings settings;
    settings.local_devices = default_local_settings();
    settings.network_devices = default_network_settings();
    return settings;
}

/** @brief Replaces out-of-range values with defaults. */
inline void sanitize_manager_settings(ManagerSettings& settings) {
    if (settings.scan_interval_sec <= 0.0) {
        settings.scan_interval_sec = kDefaultScanIntervalSec;
    }
    if (settings.probe_interval_sec <= 0.0) {
        settings.probe_interval_sec = kDefaultProbeIntervalSec;
    }
    if (settings.probe_failure_threshold <= 0) {
        settings.probe_failure_threshold = kDefaultProbeFailureThreshold;
    }
    if (settings.removal_grace_cycles <= 0) {
        settings.removal_grace_cycles = kDefaultRemovalGraceCycles;
    }
    if (settings.probe_timeout_ms <= 0) {
        settings.probe_timeout_ms = kDefaultProbeTimeoutMs;
    }
    if (settings.stop_grace_ms < 0) {
        settings.stop_grace_ms = kDefaultStopGraceMs;
    }
    for (auto& entry : settings.scanners) {
        if (entry.second.timeout_ms <= 0) {
            entry.second.timeout_ms = kDefaultScannerTimeoutMs;
        }
    }
}

} // namespace config
} // namespace capturehub

#endif // CAPTUREHUB_DEVICE_ENGINE_SETTINGS_H
