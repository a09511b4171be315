#include "status_debouncer.h"

namespace capturehub {
namespace devices {
namespace monitor {

StatusDebouncer::StatusDebouncer(int failure_threshold)
    : failure_threshold_(failure_threshold > 0 ? failure_threshold : 1) {}

std::optional<DeviceStatus> StatusDebouncer::observe(const std::string& device_id, bool success, DeviceStatus current) {
    if (success) {
        failures_.erase(device_id);
        if (current != DeviceStatus::ONLINE) {
            return DeviceStatus::ONLINE;
        }
        return std::nullopt;
    }
    const int count = ++failures_[device_id];
    if (count >= failure_threshold_ && current != DeviceStatus::OFFLINE) {
        return DeviceStatus::OFFLINE;
    }
    return std::nullopt;
}

int StatusDebouncer::consecutive_failures(const std::string& device_id) const {
    auto it = failures_.find(device_id);
    return it != failures_.end() ? it->second : 0;
}

void StatusDebouncer::forget(const std::string& device_id) {
    failures_.erase(device_id);
}

void StatusDebouncer::retain(const std::set<std::string>& device_ids) {
    for (auto it = failures_.begin(); it != failures_.end();) {
        if (device_ids.count(it->first) == 0) {
            it = failures_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace monitor
} // namespace devices
} // namespace capturehub
