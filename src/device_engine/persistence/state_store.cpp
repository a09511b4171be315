#include "state_store.h"

#include "../utils/cpp_logger.h"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>

namespace capturehub {
namespace devices {
namespace persistence {

namespace fs = std::filesystem;

namespace {

YAML::Node encode_device(const DeviceInfo& device, bool persist_credentials) {
    YAML::Node node;
    node["device_id"] = device.device_id;
    node["name"] = device.name;
    node["kind"] = to_string(device.kind);
    node["type"] = to_string(device.type);
    node["origin"] = to_string(device.origin);
    if (!device.source_protocol.empty()) {
        node["source_protocol"] = device.source_protocol;
    }
    for (const auto& entry : device.field_origins) {
        node["field_origins"][entry.first] = to_string(entry.second);
    }
    for (const auto& entry : device.streams) {
        node["streams"][entry.first] = entry.second;
    }
    for (const auto& tag : device.capabilities) {
        node["capabilities"].push_back(tag);
    }
    if (device.kind == DeviceKind::NETWORK) {
        node["ip"] = device.network.ip;
        node["port"] = device.network.port;
        node["protocol"] = device.network.protocol;
        if (persist_credentials) {
            node["username"] = device.network.username;
            node["password"] = device.network.password;
        }
    } else {
        node["system_path"] = device.local.system_path;
        node["driver"] = device.local.driver;
    }
    return node;
}

DeviceInfo decode_device(const YAML::Node& node, bool persist_credentials) {
    DeviceInfo device;
    device.device_id = node["device_id"].as<std::string>();
    device.name = node["name"].as<std::string>(device.device_id);
    device.kind = node["kind"].as<std::string>("network") == "local" ? DeviceKind::LOCAL : DeviceKind::NETWORK;
    if (!parse_device_type(node["type"].as<std::string>("video"), device.type)) {
        throw YAML::Exception(node["type"].Mark(), "invalid device type");
    }
    device.origin = node["origin"].as<std::string>("manual") == "discovered" ? DeviceOrigin::DISCOVERED
                                                                           : DeviceOrigin::MANUAL;
    device.source_protocol = node["source_protocol"].as<std::string>("");
    if (const YAML::Node origins = node["field_origins"]) {
        for (const auto& entry : origins) {
            device.field_origins[entry.first.as<std::string>()] =
                entry.second.as<std::string>() == "discovery" ? FieldOrigin::DISCOVERY : FieldOrigin::USER;
        }
    }
    if (const YAML::Node streams = node["streams"]) {
        device.streams = streams.as<std::map<std::string, std::string>>();
    }
    if (const YAML::Node capabilities = node["capabilities"]) {
        for (const auto& tag : capabilities) {
            device.capabilities.insert(tag.as<std::string>());
        }
    }
    if (device.kind == DeviceKind::NETWORK) {
        device.network.ip = node["ip"].as<std::string>();
        device.network.port = node["port"].as<int>();
        device.network.protocol = node["protocol"].as<std::string>("");
        if (persist_credentials) {
            device.network.username = node["username"].as<std::string>("");
            device.network.password = node["password"].as<std::string>("");
        }
    } else {
        device.local.system_path = node["system_path"].as<std::string>();
        device.local.driver = node["driver"].as<std::string>("");
    }
    return device;
}

} // namespace

StateStore::StateStore(std::string storage_path, std::string domain, bool persist_credentials)
    : storage_path_(std::move(storage_path)), domain_(std::move(domain)), persist_credentials_(persist_credentials) {}

std::string StateStore::file_path() const {
    return (fs::path(storage_path_) / (domain_ + ".yaml")).string();
}

bool StateStore::save(const std::vector<DeviceInfo>& devices) const {
    YAML::Node root;
    root["domain"] = domain_;
    root["devices"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& device : devices) {
        root["devices"].push_back(encode_device(device, persist_credentials_));
    }

    const std::string path = file_path();
    const std::string temp_path = path + ".tmp";
    std::error_code ec;
    fs::create_directories(storage_path_, ec);
    if (ec) {
        LOG_CPP_ERROR("[StateStore:%s] Cannot create %s: %s", domain_.c_str(), storage_path_.c_str(), ec.message().c_str());
        return false;
    }
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out) {
            LOG_CPP_ERROR("[StateStore:%s] Cannot open %s for writing", domain_.c_str(), temp_path.c_str());
            return false;
        }
        YAML::Emitter emitter;
        emitter << root;
        out << emitter.c_str() << "\n";
        if (!out.good()) {
            LOG_CPP_ERROR("[StateStore:%s] Write to %s failed", domain_.c_str(), temp_path.c_str());
            return false;
        }
    }
    fs::rename(temp_path, path, ec);
    if (ec) {
        LOG_CPP_ERROR("[StateStore:%s] Cannot replace %s: %s", domain_.c_str(), path.c_str(), ec.message().c_str());
        return false;
    }
    LOG_CPP_DEBUG("[StateStore:%s] Saved %zu devices to %s", domain_.c_str(), devices.size(), path.c_str());
    return true;
}

std::vector<DeviceInfo> StateStore::load() const {
    std::vector<DeviceInfo> devices;
    const std::string path = file_path();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return devices;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        LOG_CPP_ERROR("[StateStore:%s] Cannot parse %s: %s", domain_.c_str(), path.c_str(), e.what());
        return devices;
    }
    if (!root.IsMap()) {
        LOG_CPP_ERROR("[StateStore:%s] %s is not a mapping; ignoring it", domain_.c_str(), path.c_str());
        return devices;
    }
    const YAML::Node entries = root["devices"];
    if (!entries || !entries.IsSequence()) {
        return devices;
    }
    for (const auto& entry : entries) {
        try {
            devices.push_back(decode_device(entry, persist_credentials_));
        } catch (const YAML::Exception& e) {
            LOG_CPP_WARNING("[StateStore:%s] Skipping malformed device entry: %s", domain_.c_str(), e.what());
        }
    }
    LOG_CPP_INFO("[StateStore:%s] Loaded %zu devices from %s", domain_.c_str(), devices.size(), path.c_str());
    return devices;
}

} // namespace persistence
} // namespace devices
} // namespace capturehub
