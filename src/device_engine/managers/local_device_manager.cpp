#include "local_device_manager.h"

#include "../device_errors.h"
#include "../utils/string_utils.h"

#include <set>

namespace capturehub {
namespace devices {

LocalDeviceManager::LocalDeviceManager(config::ManagerSettings settings,
                                       config::SystemSettings system,
                                       std::shared_ptr<bus::MessageBus> bus,
                                       const scanners::ScannerFactory& factory,
                                       std::shared_ptr<monitor::DeviceProber> prober)
    : DeviceManager(config::kLocalDomain, std::move(settings), std::move(system), std::move(bus), factory,
                    std::move(prober)) {}

LocalDeviceManager::~LocalDeviceManager() {
    stop();
}

DeviceInfo LocalDeviceManager::build_device(const FieldMap& spec) const {
    return device_from_spec(spec);
}

DeviceInfo LocalDeviceManager::device_from_spec(const FieldMap& spec) {
    static const std::set<std::string> kKnownKeys = {"name", "system_path", "driver", "type", "capabilities"};
    for (const auto& entry : spec) {
        if (kKnownKeys.count(entry.first) == 0) {
            throw ValidationError("unknown field '" + entry.first + "'");
        }
    }

    DeviceInfo device;
    device.kind = DeviceKind::LOCAL;
    if (!get_string_field(spec, "system_path", device.local.system_path) || device.local.system_path.empty()) {
        throw ValidationError("system_path is required");
    }
    if (!get_string_field(spec, "driver", device.local.driver) || device.local.driver.empty()) {
        throw ValidationError("driver is required");
    }
    if (device.local.driver == "v4l2") {
        device.type = DeviceType::VIDEO;
    } else if (device.local.driver == "alsa") {
        device.type = DeviceType::AUDIO;
    } else {
        throw ValidationError("unsupported driver '" + device.local.driver + "' (v4l2 or alsa)");
    }

    std::string text;
    if (get_string_field(spec, "type", text) && !parse_device_type(text, device.type)) {
        throw ValidationError("type must be video or audio");
    }
    if (!get_string_field(spec, "name", device.name) || device.name.empty()) {
        device.name = device.local.system_path;
    }

    device.device_id = make_local_device_id(device.type, device.local.system_path);
    device.streams[device.device_id] = device.local.system_path;
    device.capabilities.insert(device.local.driver);
    if (get_string_field(spec, "capabilities", text)) {
        for (const auto& tag : utils::split_list(text)) {
            device.capabilities.insert(tag);
        }
    }
    return device;
}

} // namespace devices
} // namespace capturehub
