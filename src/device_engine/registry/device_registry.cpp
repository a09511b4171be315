#include "device_registry.h"

#include "../bus/message_bus.h"
#include "../device_errors.h"
#include "../utils/cpp_logger.h"

#include <mutex>

namespace capturehub {
namespace devices {

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += name;
    }
    return joined;
}

} // namespace

FieldOrigin field_origin(const DeviceInfo& device, const std::string& field) {
    auto it = device.field_origins.find(field);
    if (it != device.field_origins.end()) {
        return it->second;
    }
    return device.origin == DeviceOrigin::DISCOVERED ? FieldOrigin::DISCOVERY : FieldOrigin::USER;
}

DeviceRegistry::DeviceRegistry(std::string domain, std::shared_ptr<bus::MessageBus> bus)
    : domain_(std::move(domain)), bus_(std::move(bus)) {}

void DeviceRegistry::validate_new_device(const DeviceInfo& device) const {
    if (device.device_id.empty()) {
        throw ValidationError("device_id must not be empty");
    }
    if (device.name.empty()) {
        throw ValidationError("name must not be empty for " + device.device_id);
    }
    if (device.kind == DeviceKind::NETWORK) {
        if (device.network.ip.empty()) {
            throw ValidationError("network device " + device.device_id + " has no ip");
        }
        if (device.network.port <= 0 || device.network.port > 65535) {
            throw ValidationError("network device " + device.device_id + " has invalid port " +
                                  std::to_string(device.network.port));
        }
    } else if (device.local.system_path.empty()) {
        throw ValidationError("local device " + device.device_id + " has no system path");
    }
    for (const auto& stream : device.streams) {
        if (stream.first.empty()) {
            throw ValidationError("stream id must not be empty for " + device.device_id);
        }
    }
}

void DeviceRegistry::add(DeviceInfo device) {
    validate_new_device(device);
    device.status = DeviceStatus::UNKNOWN;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (devices_.count(device.device_id) != 0) {
        LOG_CPP_DEBUG("[DeviceRegistry:%s] Duplicate add for %s", domain_.c_str(), device.device_id.c_str());
        throw DuplicateIdentityError(device.device_id);
    }
    auto inserted = devices_.emplace(device.device_id, std::move(device));
    const DeviceInfo& stored = inserted.first->second;
    LOG_CPP_INFO("[DeviceRegistry:%s] Added %s", domain_.c_str(), describe(stored).c_str());
    emit("added", stored);
}

bool DeviceRegistry::update(const std::string& device_id, const DevicePatch& patch, FieldOrigin source) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
        throw NotFoundError(device_id);
    }
    const DeviceInfo& current = it->second;
    const bool is_network = current.kind == DeviceKind::NETWORK;

    if (patch.name && patch.name->empty()) {
        throw ValidationError("name must not be empty");
    }
    if (!is_network && (patch.protocol || patch.username || patch.password || patch.clear_credentials)) {
        throw ValidationError("protocol and credentials apply to network devices only");
    }
    for (const auto& stream : patch.streams_to_add) {
        if (stream.first.empty()) {
            throw ValidationError("stream id must not be empty");
        }
    }

    DeviceInfo next = current;
    std::vector<std::string> changed;

    auto allowed = [&](const char* field) {
        return source == FieldOrigin::USER || field_origin(current, field) != FieldOrigin::USER;
    };
    // Origin-only changes are committed silently; only value changes are reported.
    bool origin_only = false;
    auto set_tracked = [&](const char* field, auto& target, const auto& value) {
        if (!allowed(field)) {
            return;
        }
        if (!(target == value)) {
            target = value;
            next.field_origins[field] = source;
            changed.emplace_back(field);
        } else if (field_origin(current, field) != source) {
            next.field_origins[field] = source;
            origin_only = true;
        }
    };

    if (patch.name) {
        set_tracked(kFieldName, next.name, *patch.name);
    }
    if (patch.type) {
        set_tracked(kFieldType, next.type, *patch.type);
    }
    if (patch.protocol) {
        set_tracked(kFieldProtocol, next.network.protocol, *patch.protocol);
    }

    if (patch.clear_credentials && source == FieldOrigin::USER) {
        if (!next.network.username.empty() || !next.network.password.empty()) {
            next.network.username.clear();
            next.network.password.clear();
            changed.emplace_back("credentials");
        }
    }
    auto set_credential = [&](const char* field, std::string& target, const std::optional<std::string>& value) {
        if (!value || value->empty()) {
            return;
        }
        if (source == FieldOrigin::DISCOVERY && !target.empty()) {
            return;
        }
        if (target != *value) {
            target = *value;
            changed.emplace_back(field);
        }
    };
    set_credential("username", next.network.username, patch.username);
    set_credential("password", next.network.password, patch.password);

    bool streams_changed = false;
    for (const auto& stream_id : patch.streams_to_remove) {
        if (source == FieldOrigin::USER && next.streams.erase(stream_id) != 0) {
            streams_changed = true;
        }
    }
    for (const auto& stream : patch.streams_to_add) {
        auto existing = next.streams.find(stream.first);
        if (existing == next.streams.end()) {
            next.streams.emplace(stream.first, stream.second);
            streams_changed = true;
        } else if (source == FieldOrigin::USER && existing->second != stream.second) {
            existing->second = stream.second;
            streams_changed = true;
        }
    }
    if (streams_changed) {
        changed.emplace_back("streams");
    }

    bool capabilities_changed = false;
    for (const auto& tag : patch.capabilities_to_remove) {
        if (source == FieldOrigin::USER && next.capabilities.erase(tag) != 0) {
            capabilities_changed = true;
        }
    }
    for (const auto& tag : patch.capabilities_to_add) {
        if (next.capabilities.insert(tag).second) {
            capabilities_changed = true;
        }
    }
    if (capabilities_changed) {
        changed.emplace_back("capabilities");
    }

    if (changed.empty()) {
        if (origin_only) {
            LOG_CPP_DEBUG("[DeviceRegistry:%s] Field origins of %s set by %s; values unchanged", domain_.c_str(),
                          device_id.c_str(), to_string(source));
            it->second = std::move(next);
        }
        return false;
    }

    it->second = std::move(next);
    const std::string changed_fields = join_names(changed);
    LOG_CPP_INFO("[DeviceRegistry:%s] Updated %s (%s, by %s)", domain_.c_str(), device_id.c_str(),
                 changed_fields.c_str(), to_string(source));
    FieldMap extra;
    extra["changed"] = changed_fields;
    extra["changed_by"] = std::string(to_string(source));
    emit("updated", it->second, std::move(extra));
    return true;
}

void DeviceRegistry::remove(const std::string& device_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
        throw NotFoundError(device_id);
    }
    DeviceInfo removed = std::move(it->second);
    devices_.erase(it);
    LOG_CPP_INFO("[DeviceRegistry:%s] Removed %s", domain_.c_str(), describe(removed).c_str());
    emit("removed", removed);
}

bool DeviceRegistry::set_status(const std::string& device_id, DeviceStatus status) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
        throw NotFoundError(device_id);
    }
    const DeviceStatus previous = it->second.status;
    if (previous == status) {
        return false;
    }
    it->second.status = status;
    LOG_CPP_INFO("[DeviceRegistry:%s] Status of %s: %s -> %s", domain_.c_str(), device_id.c_str(),
                 to_string(previous), to_string(status));
    FieldMap extra;
    extra["previous_status"] = std::string(to_string(previous));
    emit("status", it->second, std::move(extra));
    return true;
}

std::optional<DeviceInfo> DeviceRegistry::get(const std::string& device_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

DeviceMap DeviceRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_;
}

bool DeviceRegistry::contains(const std::string& device_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.count(device_id) != 0;
}

std::size_t DeviceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

// Called with the write lock held so events for one device keep mutation order.
// MessageBus::publish only enqueues; handlers run later on the bus thread.
void DeviceRegistry::emit(const std::string& action, const DeviceInfo& device, FieldMap extra) const {
    if (!bus_) {
        return;
    }
    FieldMap payload = to_fields(device, true);
    for (auto& entry : extra) {
        payload[entry.first] = std::move(entry.second);
    }
    payload["action"] = action;
    payload["domain"] = domain_;
    bus_->publish(bus::event_topic(domain_, action, device.device_id), std::move(payload), "registry:" + domain_);
}

} // namespace devices
} // namespace capturehub
