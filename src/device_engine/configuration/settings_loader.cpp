#include "settings_loader.h"

#include "../utils/cpp_logger.h"
#include "../utils/string_utils.h"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <sys/stat.h>

namespace capturehub {
namespace config {

namespace {

template <typename T>
void read_value(const YAML::Node& node, const char* key, T& out, const std::string& context) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return;
    }
    try {
        out = value.as<T>();
    } catch (const YAML::Exception& e) {
        LOG_CPP_WARNING("[Settings] Ignoring malformed %s.%s: %s", context.c_str(), key, e.what());
    }
}

void read_scanner(const YAML::Node& node, ScannerSettings& scanner, const std::string& context) {
    if (!node.IsMap()) {
        LOG_CPP_WARNING("[Settings] %s is not a mapping; ignored", context.c_str());
        return;
    }
    read_value(node, "timeout_ms", scanner.timeout_ms, context);
    read_value(node, "username", scanner.username, context);
    read_value(node, "password", scanner.password, context);
    read_value(node, "scan_ranges", scanner.scan_ranges, context);
    read_value(node, "ports", scanner.ports, context);
}

void read_manager(const YAML::Node& node, ManagerSettings& settings, const std::string& context) {
    if (!node) {
        return;
    }
    if (!node.IsMap()) {
        LOG_CPP_WARNING("[Settings] %s is not a mapping; ignored", context.c_str());
        return;
    }
    read_value(node, "scan_interval", settings.scan_interval_sec, context);
    read_value(node, "discovery_enabled", settings.discovery_enabled, context);
    read_value(node, "discovery_methods", settings.discovery_methods, context);
    read_value(node, "probe_interval", settings.probe_interval_sec, context);
    read_value(node, "probe_failure_threshold", settings.probe_failure_threshold, context);
    read_value(node, "removal_grace_cycles", settings.removal_grace_cycles, context);
    read_value(node, "probe_timeout_ms", settings.probe_timeout_ms, context);
    read_value(node, "stop_grace_ms", settings.stop_grace_ms, context);
    read_value(node, "enable_video", settings.enable_video, context);
    read_value(node, "enable_audio", settings.enable_audio, context);

    const YAML::Node scanners = node["scanners"];
    if (scanners && scanners.IsMap()) {
        for (const auto& entry : scanners) {
            const std::string protocol = entry.first.as<std::string>();
            ScannerSettings scanner = settings.scanner(protocol);
            read_scanner(entry.second, scanner, context + ".scanners." + protocol);
            settings.scanners[protocol] = scanner;
        }
    }
}

void apply_root(const YAML::Node& root, EngineSettings& settings) {
    const YAML::Node system = root["system"];
    if (system && system.IsMap()) {
        read_value(system, "log_level", settings.system.log_level, "system");
        read_value(system, "storage_path", settings.system.storage_path, "system");
        read_value(system, "persist_credentials", settings.system.persist_credentials, "system");
    }
    read_manager(root[kLocalDomain], settings.local_devices, kLocalDomain);
    read_manager(root[kNetworkDomain], settings.network_devices, kNetworkDomain);
}

bool file_exists(const std::string& path) {
    struct stat st {};
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

template <typename T>
bool parse_number(const std::string& text, T& out) {
    std::istringstream iss(text);
    T value{};
    iss >> value;
    if (iss.fail() || !iss.eof()) {
        return false;
    }
    out = value;
    return true;
}

void apply_manager_environment(const EnvLookup& env, const std::string& prefix, ManagerSettings& settings) {
    auto number = [&](const std::string& name, auto& target) {
        auto value = env(prefix + name);
        if (!value) {
            return;
        }
        if (!parse_number(*value, target)) {
            LOG_CPP_WARNING("[Settings] Ignoring malformed %s%s='%s'", prefix.c_str(), name.c_str(), value->c_str());
        }
    };
    number("SCAN_INTERVAL", settings.scan_interval_sec);
    number("PROBE_INTERVAL", settings.probe_interval_sec);
    number("PROBE_FAILURE_THRESHOLD", settings.probe_failure_threshold);
    number("REMOVAL_GRACE_CYCLES", settings.removal_grace_cycles);

    if (auto methods = env(prefix + "DISCOVERY_METHODS")) {
        settings.discovery_methods = devices::utils::split_list(*methods);
    }
    if (auto enabled = env(prefix + "DISCOVERY_ENABLED")) {
        if (*enabled == "true" || *enabled == "1") {
            settings.discovery_enabled = true;
        } else if (*enabled == "false" || *enabled == "0") {
            settings.discovery_enabled = false;
        } else {
            LOG_CPP_WARNING("[Settings] Ignoring malformed %sDISCOVERY_ENABLED='%s'", prefix.c_str(), enabled->c_str());
        }
    }
}

} // namespace

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::vector<std::string> default_config_search_paths() {
    std::vector<std::string> paths;
    paths.emplace_back("/etc/capturehub/config.yaml");
    if (const char* home = std::getenv("HOME")) {
        paths.emplace_back(std::string(home) + "/.config/capturehub/config.yaml");
    }
    paths.emplace_back(".capturehub/config.yaml");
    return paths;
}

bool apply_yaml_text(const std::string& yaml_text, EngineSettings& settings) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        LOG_CPP_WARNING("[Settings] Failed to parse YAML: %s", e.what());
        return false;
    }
    if (root.IsNull()) {
        return true;
    }
    if (!root.IsMap()) {
        LOG_CPP_WARNING("[Settings] Top-level YAML node is not a mapping");
        return false;
    }
    apply_root(root, settings);
    return true;
}

bool apply_config_file(const std::string& path, EngineSettings& settings) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        LOG_CPP_WARNING("[Settings] Failed to load %s: %s", path.c_str(), e.what());
        return false;
    }
    if (!root.IsNull() && !root.IsMap()) {
        LOG_CPP_WARNING("[Settings] %s: top-level node is not a mapping", path.c_str());
        return false;
    }
    if (!root.IsNull()) {
        apply_root(root, settings);
    }
    LOG_CPP_INFO("[Settings] Loaded configuration from %s", path.c_str());
    return true;
}

void apply_environment(const EnvLookup& env, EngineSettings& settings) {
    if (auto level = env("CAPTUREHUB_LOG_LEVEL")) {
        settings.system.log_level = *level;
    }
    if (auto storage = env("CAPTUREHUB_STORAGE_PATH")) {
        settings.system.storage_path = *storage;
    }
    apply_manager_environment(env, "CAPTUREHUB_LOCAL_", settings.local_devices);
    apply_manager_environment(env, "CAPTUREHUB_NETWORK_", settings.network_devices);
}

EngineSettings load_engine_settings(const std::string& explicit_path, const EnvLookup& env) {
    EngineSettings settings = default_engine_settings();

    bool loaded = false;
    if (!explicit_path.empty()) {
        loaded = apply_config_file(explicit_path, settings);
    }
    if (!loaded) {
        for (const auto& path : default_config_search_paths()) {
            if (file_exists(path) && apply_config_file(path, settings)) {
                break;
            }
        }
    }

    apply_environment(env, settings);
    sanitize_manager_settings(settings.local_devices);
    sanitize_manager_settings(settings.network_devices);
    return settings;
}

} // namespace config
} // namespace capturehub
