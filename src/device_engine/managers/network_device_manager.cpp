#include "network_device_manager.h"

#include "../device_errors.h"
#include "../utils/socket_utils.h"
#include "../utils/string_utils.h"

#include <set>

namespace capturehub {
namespace devices {

NetworkDeviceManager::NetworkDeviceManager(config::ManagerSettings settings,
                                           config::SystemSettings system,
                                           std::shared_ptr<bus::MessageBus> bus,
                                           const scanners::ScannerFactory& factory,
                                           std::shared_ptr<monitor::DeviceProber> prober)
    : DeviceManager(config::kNetworkDomain, std::move(settings), std::move(system), std::move(bus), factory,
                    std::move(prober)) {}

NetworkDeviceManager::~NetworkDeviceManager() {
    stop();
}

DeviceInfo NetworkDeviceManager::build_device(const FieldMap& spec) const {
    return device_from_spec(spec);
}

DeviceInfo NetworkDeviceManager::device_from_spec(const FieldMap& spec) {
    static const std::set<std::string> kKnownKeys = {"name", "ip", "port", "type", "protocol",
                                                     "username", "password", "paths", "capabilities"};
    for (const auto& entry : spec) {
        if (kKnownKeys.count(entry.first) == 0) {
            throw ValidationError("unknown field '" + entry.first + "'");
        }
    }

    DeviceInfo device;
    device.kind = DeviceKind::NETWORK;
    if (!get_string_field(spec, "name", device.name) || device.name.empty()) {
        throw ValidationError("name is required");
    }
    if (!get_string_field(spec, "ip", device.network.ip) || device.network.ip.empty()) {
        throw ValidationError("ip is required");
    }
    if (!utils::is_valid_ipv4(device.network.ip)) {
        throw ValidationError("invalid IPv4 address '" + device.network.ip + "'");
    }

    long long port = kDefaultPort;
    if (spec.count("port") != 0 && !get_int_field(spec, "port", port)) {
        throw ValidationError("port must be an integer");
    }
    if (port < 1 || port > 65535) {
        throw ValidationError("port must be between 1 and 65535");
    }
    device.network.port = static_cast<int>(port);

    std::string text;
    if (get_string_field(spec, "type", text) && !parse_device_type(text, device.type)) {
        throw ValidationError("type must be video or audio");
    }
    device.network.protocol = "rtsp";
    if (get_string_field(spec, "protocol", text)) {
        if (!is_supported_network_protocol(text)) {
            throw ValidationError("unsupported protocol '" + text + "'");
        }
        device.network.protocol = text;
    }
    if (get_string_field(spec, "username", text)) {
        device.network.username = text;
    }
    if (get_string_field(spec, "password", text)) {
        device.network.password = text;
    }

    device.device_id = make_network_device_id(device.network.ip, device.network.port);
    if (get_string_field(spec, "paths", text)) {
        for (const auto& path : utils::split_list(text)) {
            device.streams.insert(network_stream_entry(device.device_id, device.network, path));
        }
    }
    device.capabilities.insert(device.network.protocol);
    if (get_string_field(spec, "capabilities", text)) {
        for (const auto& tag : utils::split_list(text)) {
            device.capabilities.insert(tag);
        }
    }
    return device;
}

} // namespace devices
} // namespace capturehub
