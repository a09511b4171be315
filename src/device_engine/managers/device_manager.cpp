#include "device_manager.h"

#include "../device_errors.h"
#include "../utils/cpp_logger.h"
#include "../utils/string_utils.h"

#include <cstring>

namespace capturehub {
namespace devices {

namespace {

const char* kCommandScan = "scan";
const char* kCommandAdd = "add";
const char* kCommandUpdate = "update";
const char* kCommandRemove = "remove";
const char* kCommandGetDevices = "get_devices";
const char* kSnapshotAction = "devices";
const char* kRequestIdKey = "request_id";
const char* kStreamPrefix = "stream.";

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::string require_string(const FieldMap& fields, const std::string& key) {
    std::string value;
    if (!get_string_field(fields, key, value)) {
        throw ValidationError("field '" + key + "' must be a string");
    }
    return value;
}

} // namespace

bool is_supported_network_protocol(const std::string& protocol) {
    return protocol == "rtsp" || protocol == "rtmp" || protocol == "http" || protocol == "onvif";
}

std::pair<std::string, std::string> network_stream_entry(const std::string& device_id,
                                                         const NetworkEndpoint& endpoint,
                                                         const std::string& path) {
    std::string clean = path;
    while (!clean.empty() && clean.front() == '/') {
        clean.erase(0, 1);
    }
    return {device_id + "_" + clean,
            endpoint.protocol + "://" + endpoint.ip + ":" + std::to_string(endpoint.port) + "/" + clean};
}

DeviceManager::DeviceManager(std::string domain,
                             config::ManagerSettings settings,
                             config::SystemSettings system,
                             std::shared_ptr<bus::MessageBus> bus,
                             const scanners::ScannerFactory& factory,
                             std::shared_ptr<monitor::DeviceProber> prober)
    : log_prefix_("[DeviceManager:" + domain + "]"),
      domain_(std::move(domain)),
      settings_(std::move(settings)),
      system_(std::move(system)),
      bus_(std::move(bus)),
      store_(system_.storage_path, domain_, system_.persist_credentials) {
    config::sanitize_manager_settings(settings_);
    registry_ = std::make_shared<DeviceRegistry>(domain_, bus_);
    discovery_engine_ = std::make_shared<discovery::DiscoveryEngine>(domain_, factory, settings_, registry_);
    discovery_loop_ = std::make_unique<discovery::DiscoveryLoop>(discovery_engine_, seconds_to_ms(settings_.scan_interval_sec),
                                                                 settings_.discovery_enabled);
    state_monitor_ = std::make_unique<monitor::StateMonitor>(domain_, registry_, std::move(prober), settings_);
    // The loop is stopped and joined in stop(), before this manager goes away.
    discovery_loop_->set_cycle_callback([this](const discovery::CycleReport&) { publish_device_snapshot("cycle"); });
}

DeviceManager::~DeviceManager() {
    stop();
}

void DeviceManager::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (is_running()) {
        LOG_CPP_DEBUG("%s Already running.", log_prefix_.c_str());
        return;
    }
    LOG_CPP_INFO("%s Starting (scan_interval=%.1fs, probe_interval=%.1fs, discovery=%s).", log_prefix_.c_str(),
                 settings_.scan_interval_sec, settings_.probe_interval_sec,
                 settings_.discovery_enabled ? "periodic" : "on demand");
    restore_devices();
    discovery_loop_->start();
    state_monitor_->start();
    {
        std::lock_guard<std::mutex> lock(manager_mutex_);
        running_ = true;
    }
    register_command_handlers();
}

void DeviceManager::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(manager_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    LOG_CPP_INFO("%s Stopping...", log_prefix_.c_str());
    // Waits for a command already running on the bus; it may still need manager_mutex_.
    unregister_command_handlers();
    discovery_loop_->stop();
    state_monitor_->stop();
    save_devices();
    LOG_CPP_INFO("%s Stopped.", log_prefix_.c_str());
}

bool DeviceManager::is_running() const {
    std::lock_guard<std::mutex> lock(manager_mutex_);
    return running_;
}

std::string DeviceManager::add_device(const FieldMap& spec) {
    DeviceInfo device = build_device(spec);
    device.origin = DeviceOrigin::MANUAL;
    device.field_origins[kFieldName] = FieldOrigin::USER;
    device.field_origins[kFieldType] = FieldOrigin::USER;
    if (device.kind == DeviceKind::NETWORK) {
        device.field_origins[kFieldProtocol] = FieldOrigin::USER;
    }
    const std::string device_id = device.device_id;
    registry_->add(std::move(device));
    save_devices();
    return device_id;
}

bool DeviceManager::remove_device(const std::string& device_id) {
    registry_->remove(device_id);
    save_devices();
    return true;
}

bool DeviceManager::update_device(const std::string& device_id, const FieldMap& fields) {
    auto current = registry_->get(device_id);
    if (!current) {
        throw NotFoundError(device_id);
    }
    return update_device(device_id, build_patch(*current, fields));
}

bool DeviceManager::update_device(const std::string& device_id, const DevicePatch& patch) {
    const bool changed = registry_->update(device_id, patch, FieldOrigin::USER);
    if (changed) {
        save_devices();
    }
    return changed;
}

DeviceMap DeviceManager::get_devices() const {
    return registry_->list();
}

std::optional<DeviceInfo> DeviceManager::get_device(const std::string& device_id) const {
    return registry_->get(device_id);
}

bool DeviceManager::request_scan() {
    std::lock_guard<std::mutex> lock(manager_mutex_);
    if (!running_) {
        return false;
    }
    discovery_loop_->request_scan();
    return true;
}

bool DeviceManager::publish_device_snapshot(const std::string& reason) {
    if (!bus_) {
        return false;
    }
    FieldMap snapshot = devices_to_fields(registry_->list());
    snapshot["domain"] = domain_;
    snapshot["reason"] = reason;
    return bus_->publish("event/" + domain_ + "/" + kSnapshotAction, std::move(snapshot), "manager:" + domain_);
}

discovery::CycleReport DeviceManager::scan_now() {
    return discovery_engine_->run_cycle(std::make_shared<utils::StopSignal>());
}

size_t DeviceManager::probe_now() {
    return state_monitor_->probe_once();
}

DevicePatch DeviceManager::build_patch(const DeviceInfo& current, const FieldMap& fields) const {
    DevicePatch patch;
    for (const auto& entry : fields) {
        const std::string& key = entry.first;
        if (key == "name") {
            patch.name = require_string(fields, key);
        } else if (key == "type") {
            DeviceType type;
            if (!parse_device_type(require_string(fields, key), type)) {
                throw ValidationError("type must be video or audio");
            }
            patch.type = type;
        } else if (key == "protocol") {
            const std::string protocol = require_string(fields, key);
            if (!is_supported_network_protocol(protocol)) {
                throw ValidationError("unsupported protocol '" + protocol + "'");
            }
            patch.protocol = protocol;
        } else if (key == "username") {
            patch.username = require_string(fields, key);
        } else if (key == "password") {
            patch.password = require_string(fields, key);
        } else if (key == "clear_credentials") {
            bool clear = false;
            if (!get_bool_field(fields, key, clear)) {
                throw ValidationError("clear_credentials must be a boolean");
            }
            patch.clear_credentials = clear;
        } else if (key == "paths") {
            if (current.kind != DeviceKind::NETWORK) {
                throw ValidationError("paths apply to network devices only");
            }
            NetworkEndpoint endpoint = current.network;
            std::string protocol;
            if (get_string_field(fields, "protocol", protocol) && !protocol.empty()) {
                endpoint.protocol = protocol;
            }
            for (const auto& path : utils::split_list(require_string(fields, key))) {
                patch.streams_to_add.insert(network_stream_entry(current.device_id, endpoint, path));
            }
        } else if (key == "capabilities") {
            for (const auto& tag : utils::split_list(require_string(fields, key))) {
                patch.capabilities_to_add.insert(tag);
            }
        } else if (key == "remove_capabilities") {
            for (const auto& tag : utils::split_list(require_string(fields, key))) {
                patch.capabilities_to_remove.insert(tag);
            }
        } else if (key == "remove_streams") {
            for (const auto& stream_id : utils::split_list(require_string(fields, key))) {
                patch.streams_to_remove.push_back(stream_id);
            }
        } else if (key.compare(0, std::strlen(kStreamPrefix), kStreamPrefix) == 0) {
            const std::string stream_id = key.substr(std::strlen(kStreamPrefix));
            patch.streams_to_add[stream_id] = require_string(fields, key);
        } else if (key == "device_id" || key == "ip" || key == "port" || key == "system_path" || key == "driver" ||
                   key == "kind") {
            throw ValidationError("field '" + key + "' is part of the device identity and cannot be updated");
        } else {
            throw ValidationError("unknown field '" + key + "'");
        }
    }
    return patch;
}

void DeviceManager::register_command_handlers() {
    if (!bus_) {
        return;
    }
    for (const char* command : {kCommandScan, kCommandAdd, kCommandUpdate, kCommandRemove, kCommandGetDevices}) {
        const std::string topic = bus::command_topic(domain_, command);
        const std::string name = command;
        const bool registered = bus_->register_command_handler(topic, [this, name](const bus::BusMessage& message) {
            handle_command(name, message);
        });
        if (registered) {
            command_topics_.push_back(topic);
        } else {
            LOG_CPP_WARNING("%s Command topic %s already has a handler.", log_prefix_.c_str(), topic.c_str());
        }
    }
}

void DeviceManager::unregister_command_handlers() {
    if (!bus_) {
        return;
    }
    for (const auto& topic : command_topics_) {
        bus_->unregister_command_handler(topic);
    }
    command_topics_.clear();
}

void DeviceManager::handle_command(const std::string& command, const bus::BusMessage& message) {
    FieldMap fields = message.payload;
    fields.erase(kRequestIdKey);
    std::string device_id;
    try {
        if (command == kCommandScan) {
            if (!request_scan()) {
                throw DeviceError("manager is not running");
            }
            publish_device_snapshot(kCommandScan);
        } else if (command == kCommandGetDevices) {
            publish_device_snapshot(kCommandGetDevices);
        } else if (command == kCommandAdd) {
            device_id = add_device(fields);
        } else {
            if (!get_string_field(fields, "device_id", device_id) || device_id.empty()) {
                throw ValidationError("device_id is required");
            }
            fields.erase("device_id");
            if (command == kCommandUpdate) {
                update_device(device_id, fields);
            } else {
                remove_device(device_id);
            }
        }
    } catch (const std::exception& e) {
        LOG_CPP_WARNING("%s Command '%s' from '%s' failed: %s", log_prefix_.c_str(), command.c_str(),
                        message.sender.c_str(), e.what());
        publish_command_result(command, message.payload, false, device_id, e.what());
        return;
    }
    LOG_CPP_INFO("%s Command '%s' from '%s' succeeded%s%s", log_prefix_.c_str(), command.c_str(),
                 message.sender.c_str(), device_id.empty() ? "" : " for ", device_id.c_str());
    publish_command_result(command, message.payload, true, device_id, "");
}

void DeviceManager::publish_command_result(const std::string& command, const FieldMap& request, bool success,
                                           const std::string& device_id, const std::string& error) {
    FieldMap result;
    result["command"] = command;
    result["success"] = success;
    result["domain"] = domain_;
    if (!device_id.empty()) {
        result["device_id"] = device_id;
    }
    if (!error.empty()) {
        result["error"] = error;
    }
    auto request_id = request.find(kRequestIdKey);
    if (request_id != request.end()) {
        result[kRequestIdKey] = request_id->second;
    }
    bus_->publish(bus::event_topic(domain_, "command_result", command), std::move(result), "manager:" + domain_);
}

void DeviceManager::restore_devices() {
    std::vector<DeviceInfo> stored;
    {
        std::lock_guard<std::mutex> lock(store_mutex_);
        stored = store_.load();
    }
    for (auto& device : stored) {
        if (device.origin != DeviceOrigin::MANUAL) {
            continue;
        }
        try {
            registry_->add(std::move(device));
        } catch (const DuplicateIdentityError& e) {
            LOG_CPP_DEBUG("%s Persisted device %s is already registered.", log_prefix_.c_str(), e.device_id().c_str());
        } catch (const ValidationError& e) {
            LOG_CPP_WARNING("%s Ignoring invalid persisted device: %s", log_prefix_.c_str(), e.what());
        }
    }
}

void DeviceManager::save_devices() {
    std::vector<DeviceInfo> manual;
    for (auto& entry : registry_->list()) {
        if (entry.second.origin == DeviceOrigin::MANUAL) {
            manual.push_back(std::move(entry.second));
        }
    }
    std::lock_guard<std::mutex> lock(store_mutex_);
    if (!store_.save(manual)) {
        LOG_CPP_WARNING("%s %zu manual devices were not persisted.", log_prefix_.c_str(), manual.size());
    }
}

} // namespace devices
} // namespace capturehub
