#include "device_types.h"

#include "utils/string_utils.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace capturehub {
namespace devices {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

} // namespace

const char* to_string(DeviceKind kind) {
    return kind == DeviceKind::LOCAL ? "local" : "network";
}

const char* to_string(DeviceType type) {
    return type == DeviceType::AUDIO ? "audio" : "video";
}

const char* to_string(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::ONLINE: return "online";
        case DeviceStatus::OFFLINE: return "offline";
        case DeviceStatus::UNKNOWN: break;
    }
    return "unknown";
}

const char* to_string(DeviceOrigin origin) {
    return origin == DeviceOrigin::DISCOVERED ? "discovered" : "manual";
}

const char* to_string(FieldOrigin origin) {
    return origin == FieldOrigin::DISCOVERY ? "discovery" : "user";
}

bool parse_device_type(const std::string& text, DeviceType& out) {
    const std::string lower = to_lower(utils::trim(text));
    if (lower == "video") {
        out = DeviceType::VIDEO;
        return true;
    }
    if (lower == "audio") {
        out = DeviceType::AUDIO;
        return true;
    }
    return false;
}

bool parse_device_status(const std::string& text, DeviceStatus& out) {
    const std::string lower = to_lower(utils::trim(text));
    if (lower == "online") {
        out = DeviceStatus::ONLINE;
    } else if (lower == "offline") {
        out = DeviceStatus::OFFLINE;
    } else if (lower == "unknown") {
        out = DeviceStatus::UNKNOWN;
    } else {
        return false;
    }
    return true;
}

std::string make_network_device_id(const std::string& ip, int port) {
    return ip + ":" + std::to_string(port);
}

std::string make_local_device_id(DeviceType type, const std::string& system_path) {
    return std::string(to_string(type)) + ":" + system_path;
}

std::string derive_device_id(const DiscoveryResult& result) {
    if (result.kind == DeviceKind::NETWORK) {
        if (result.ip.empty() || result.port <= 0 || result.port > 65535) {
            return {};
        }
        return make_network_device_id(result.ip, result.port);
    }
    if (result.system_path.empty()) {
        return {};
    }
    return make_local_device_id(result.type, result.system_path);
}

DeviceInfo device_from_discovery(const DiscoveryResult& result) {
    DeviceInfo info;
    info.device_id = derive_device_id(result);
    info.kind = result.kind;
    info.type = result.type;
    info.name = result.name.empty() ? info.device_id : result.name;
    info.status = DeviceStatus::UNKNOWN;
    info.streams = result.streams;
    info.capabilities = result.capabilities;
    info.origin = DeviceOrigin::DISCOVERED;
    info.source_protocol = result.source_protocol;
    info.field_origins[kFieldName] = FieldOrigin::DISCOVERY;
    info.field_origins[kFieldType] = FieldOrigin::DISCOVERY;
    if (result.kind == DeviceKind::NETWORK) {
        info.network.ip = result.ip;
        info.network.port = result.port;
        info.network.protocol = result.protocol;
        info.network.username = result.username;
        info.network.password = result.password;
        info.field_origins[kFieldProtocol] = FieldOrigin::DISCOVERY;
    } else {
        info.local.system_path = result.system_path;
        info.local.driver = result.driver;
    }
    return info;
}

std::string join_capabilities(const std::set<std::string>& capabilities) {
    std::string joined;
    for (const auto& tag : capabilities) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += tag;
    }
    return joined;
}

std::set<std::string> split_capabilities(const std::string& text) {
    const std::vector<std::string> tokens = utils::split_list(text);
    return std::set<std::string>(tokens.begin(), tokens.end());
}

FieldMap to_fields(const DeviceInfo& device, bool redact_credentials) {
    FieldMap fields;
    fields["device_id"] = device.device_id;
    fields["name"] = device.name;
    fields["kind"] = std::string(to_string(device.kind));
    fields["type"] = std::string(to_string(device.type));
    fields["status"] = std::string(to_string(device.status));
    fields["origin"] = std::string(to_string(device.origin));
    fields["capabilities"] = join_capabilities(device.capabilities);
    if (!device.source_protocol.empty()) {
        fields["source_protocol"] = device.source_protocol;
    }
    for (const auto& entry : device.streams) {
        fields["stream." + entry.first] = entry.second;
    }
    for (const auto& entry : device.field_origins) {
        fields["origin." + entry.first] = std::string(to_string(entry.second));
    }

    if (device.kind == DeviceKind::NETWORK) {
        fields["ip"] = device.network.ip;
        fields["port"] = static_cast<long long>(device.network.port);
        fields["protocol"] = device.network.protocol;
        auto credential = [redact_credentials](const std::string& value) {
            if (redact_credentials && !value.empty()) {
                return std::string(kRedactedValue);
            }
            return value;
        };
        fields["username"] = credential(device.network.username);
        fields["password"] = credential(device.network.password);
    } else {
        fields["system_path"] = device.local.system_path;
        fields["driver"] = device.local.driver;
    }
    return fields;
}

FieldMap devices_to_fields(const DeviceMap& devices) {
    FieldMap fields;
    fields["count"] = static_cast<long long>(devices.size());
    size_t index = 0;
    for (const auto& entry : devices) {
        const std::string prefix = "device." + std::to_string(index++) + ".";
        for (auto& field : to_fields(entry.second, true)) {
            fields[prefix + field.first] = std::move(field.second);
        }
    }
    return fields;
}

std::string describe(const DeviceInfo& device) {
    std::ostringstream oss;
    oss << device.device_id << " '" << device.name << "' (" << to_string(device.kind) << "/"
        << to_string(device.type) << ", " << to_string(device.status) << ", "
        << to_string(device.origin);
    if (device.kind == DeviceKind::NETWORK) {
        oss << ", " << (device.network.protocol.empty() ? "?" : device.network.protocol);
        if (!device.network.username.empty()) {
            oss << ", auth";
        }
    } else {
        oss << ", " << (device.local.driver.empty() ? "?" : device.local.driver);
    }
    oss << ", " << device.streams.size() << " streams)";
    return oss.str();
}

} // namespace devices
} // namespace capturehub
