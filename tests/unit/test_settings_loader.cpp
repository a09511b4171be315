#include <gtest/gtest.h>
#include "configuration/settings_loader.h"

#include <filesystem>
#include <fstream>
#include <map>
#include <unistd.h>

using namespace capturehub::config;

namespace {

EnvLookup env_from(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

TEST(SettingsLoaderTest, DefaultsMatchDocumentedValues) {
    const EngineSettings settings = default_engine_settings();
    EXPECT_DOUBLE_EQ(settings.network_devices.scan_interval_sec, 60.0);
    EXPECT_DOUBLE_EQ(settings.network_devices.probe_interval_sec, 30.0);
    EXPECT_EQ(settings.network_devices.probe_failure_threshold, 3);
    EXPECT_EQ(settings.network_devices.removal_grace_cycles, 3);
    EXPECT_EQ(settings.network_devices.discovery_methods, (std::vector<std::string>{"onvif", "upnp", "mdns"}));
    EXPECT_EQ(settings.local_devices.discovery_methods, (std::vector<std::string>{"v4l2", "alsa"}));
    EXPECT_FALSE(settings.system.persist_credentials);
}

TEST(SettingsLoaderTest, YamlOverridesOnlyProvidedKeys) {
    EngineSettings settings = default_engine_settings();
    const char* yaml = R"(
system:
  log_level: DEBUG
  storage_path: /var/lib/capturehub
network_devices:
  scan_interval: 15
  discovery_methods: [mdns, onvif, port_scan]
  removal_grace_cycles: 5
  scanners:
    port_scan:
      scan_ranges: ["192.168.1.0/24"]
      ports: [554]
      timeout_ms: 3000
    onvif:
      username: viewer
      password: pw
local_devices:
  enable_audio: false
)";
    ASSERT_TRUE(apply_yaml_text(yaml, settings));

    EXPECT_EQ(settings.system.log_level, "DEBUG");
    EXPECT_EQ(settings.system.storage_path, "/var/lib/capturehub");
    EXPECT_DOUBLE_EQ(settings.network_devices.scan_interval_sec, 15.0);
    EXPECT_EQ(settings.network_devices.discovery_methods,
              (std::vector<std::string>{"mdns", "onvif", "port_scan"}));
    EXPECT_EQ(settings.network_devices.removal_grace_cycles, 5);
    EXPECT_EQ(settings.network_devices.probe_failure_threshold, 3);

    const ScannerSettings port_scan = settings.network_devices.scanner("port_scan");
    EXPECT_EQ(port_scan.scan_ranges, std::vector<std::string>{"192.168.1.0/24"});
    EXPECT_EQ(port_scan.ports, std::vector<int>{554});
    EXPECT_EQ(port_scan.timeout_ms, 3000);
    EXPECT_EQ(settings.network_devices.scanner("onvif").username, "viewer");

    EXPECT_FALSE(settings.local_devices.enable_audio);
    EXPECT_TRUE(settings.local_devices.enable_video);
}

TEST(SettingsLoaderTest, MalformedValuesKeepPreviousLayer) {
    EngineSettings settings = default_engine_settings();
    const char* yaml = R"(
network_devices:
  scan_interval: often
  probe_failure_threshold: [1, 2]
  probe_interval: 12
)";
    ASSERT_TRUE(apply_yaml_text(yaml, settings));
    EXPECT_DOUBLE_EQ(settings.network_devices.scan_interval_sec, 60.0);
    EXPECT_EQ(settings.network_devices.probe_failure_threshold, 3);
    EXPECT_DOUBLE_EQ(settings.network_devices.probe_interval_sec, 12.0);
}

TEST(SettingsLoaderTest, UnparseableDocumentIsRejected) {
    EngineSettings settings = default_engine_settings();
    EXPECT_FALSE(apply_yaml_text("network_devices: [unclosed", settings));
    EXPECT_FALSE(apply_yaml_text("- just\n- a list\n", settings));
    EXPECT_TRUE(apply_yaml_text("", settings));
    EXPECT_DOUBLE_EQ(settings.network_devices.scan_interval_sec, 60.0);
}

TEST(SettingsLoaderTest, EnvironmentOverridesYaml) {
    EngineSettings settings = default_engine_settings();
    ASSERT_TRUE(apply_yaml_text("network_devices:\n  scan_interval: 15\n", settings));

    apply_environment(env_from({
        {"CAPTUREHUB_NETWORK_SCAN_INTERVAL", "45"},
        {"CAPTUREHUB_NETWORK_DISCOVERY_METHODS", "upnp, mdns"},
        {"CAPTUREHUB_LOCAL_DISCOVERY_ENABLED", "false"},
        {"CAPTUREHUB_LOCAL_PROBE_FAILURE_THRESHOLD", "2"},
        {"CAPTUREHUB_LOG_LEVEL", "WARNING"},
    }), settings);

    EXPECT_DOUBLE_EQ(settings.network_devices.scan_interval_sec, 45.0);
    EXPECT_EQ(settings.network_devices.discovery_methods, (std::vector<std::string>{"upnp", "mdns"}));
    EXPECT_FALSE(settings.local_devices.discovery_enabled);
    EXPECT_EQ(settings.local_devices.probe_failure_threshold, 2);
    EXPECT_EQ(settings.system.log_level, "WARNING");
}

TEST(SettingsLoaderTest, MalformedEnvironmentValuesAreIgnored) {
    EngineSettings settings = default_engine_settings();
    apply_environment(env_from({
        {"CAPTUREHUB_NETWORK_SCAN_INTERVAL", "soon"},
        {"CAPTUREHUB_NETWORK_REMOVAL_GRACE_CYCLES", "2.5"},
        {"CAPTUREHUB_NETWORK_DISCOVERY_ENABLED", "maybe"},
    }), settings);
    EXPECT_DOUBLE_EQ(settings.network_devices.scan_interval_sec, 60.0);
    EXPECT_EQ(settings.network_devices.removal_grace_cycles, 3);
    EXPECT_TRUE(settings.network_devices.discovery_enabled);
}

TEST(SettingsLoaderTest, SanitizeRestoresDefaultsForOutOfRangeValues) {
    ManagerSettings settings;
    settings.scan_interval_sec = -1;
    settings.probe_interval_sec = 0;
    settings.probe_failure_threshold = 0;
    settings.removal_grace_cycles = -3;
    settings.scanners["onvif"].timeout_ms = 0;
    sanitize_manager_settings(settings);

    EXPECT_DOUBLE_EQ(settings.scan_interval_sec, kDefaultScanIntervalSec);
    EXPECT_DOUBLE_EQ(settings.probe_interval_sec, kDefaultProbeIntervalSec);
    EXPECT_EQ(settings.probe_failure_threshold, kDefaultProbeFailureThreshold);
    EXPECT_EQ(settings.removal_grace_cycles, kDefaultRemovalGraceCycles);
    EXPECT_EQ(settings.scanner("onvif").timeout_ms, kDefaultScannerTimeoutMs);
}

TEST(SettingsLoaderTest, LoadsExplicitFileThenEnvironment) {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("capturehub_settings_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    const auto path = dir / "config.yaml";
    {
        std::ofstream out(path);
        out << "network_devices:\n  probe_interval: 7\n  removal_grace_cycles: 0\n";
    }

    const EngineSettings settings = load_engine_settings(path.string(),
                                                         env_from({{"CAPTUREHUB_NETWORK_PROBE_INTERVAL", "9"}}));
    EXPECT_DOUBLE_EQ(settings.network_devices.probe_interval_sec, 9.0);
    EXPECT_EQ(settings.network_devices.removal_grace_cycles, kDefaultRemovalGraceCycles);

    std::filesystem::remove_all(dir);
}
