/**
 * @file device_manager.h
 * @brief Defines the DeviceManager base shared by the local and network device managers.
 * @details A manager wires one registry, one discovery loop, one state monitor and the bus into
 *          a start/stop-able unit. CRUD calls from code and from `command/<domain>/...` topics go
 *          through the same registry operations as discovery.
 */
#ifndef CAPTUREHUB_DEVICE_MANAGER_H
#define CAPTUREHUB_DEVICE_MANAGER_H

#include "../bus/message_bus.h"
#include "../configuration/device_engine_settings.h"
#include "../device_types.h"
#include "../discovery/discovery_engine.h"
#include "../discovery/discovery_loop.h"
#include "../monitor/device_prober.h"
#include "../monitor/state_monitor.h"
#include "../persistence/state_store.h"
#include "../registry/device_registry.h"
#include "../scanners/scanner_factory.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace capturehub {
namespace devices {

/**
 * @class DeviceManager
 * @brief Lifecycle, CRUD and command handling common to both device domains.
 */
class DeviceManager {
public:
    DeviceManager(std::string domain,
                  config::ManagerSettings settings,
                  config::SystemSettings system,
                  std::shared_ptr<bus::MessageBus> bus,
                  const scanners::ScannerFactory& factory,
                  std::shared_ptr<monitor::DeviceProber> prober);
    virtual ~DeviceManager();

    DeviceManager(const DeviceManager&) = delete;
    DeviceManager& operator=(const DeviceManager&) = delete;

    /**
     * @brief Restores persisted devices, registers command handlers and starts both loops.
     * @details Does nothing if already running.
     */
    void start();

    /**
     * @brief Unregisters command handlers, waiting for one that is already running, then
     *        cancels both loops and waits for them, bounded by `stop_grace_ms` for in-flight
     *        scans, and saves manual devices.
     * @details Must not be called from a command handler of this manager.
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Validates `spec` and adds a manual device.
     * @return the new device id.
     * @throws ValidationError, DuplicateIdentityError
     */
    std::string add_device(const FieldMap& spec);

    /** @throws NotFoundError */
    bool remove_device(const std::string& device_id);

    /**
     * @brief Applies user-supplied fields to a device.
     * @details Recognized keys: name, type, protocol, username, password, clear_credentials,
     *          paths, capabilities, remove_capabilities, remove_streams and `stream.<id>`.
     *          Identity fields cannot be changed.
     * @return true if anything changed.
     * @throws NotFoundError, ValidationError
     */
    bool update_device(const std::string& device_id, const FieldMap& fields);
    bool update_device(const std::string& device_id, const DevicePatch& patch);

    DeviceMap get_devices() const;
    std::optional<DeviceInfo> get_device(const std::string& device_id) const;

    /** @brief Asks the running discovery loop for an immediate cycle. @return false if stopped. */
    bool request_scan();

    /**
     * @brief Publishes the domain's full device list on `event/<domain>/devices`.
     * @details Payload: `domain`, `count`, `reason` and `device.<index>.<field>` per device.
     *          Also sent after every completed discovery-loop cycle and on the `scan` and
     *          `get_devices` commands.
     * @return false if the bus refused the message.
     */
    bool publish_device_snapshot(const std::string& reason);

    /** @brief Runs one discovery cycle on the calling thread. */
    discovery::CycleReport scan_now();

    /** @brief Runs one probe cycle on the calling thread. @return number of status transitions. */
    size_t probe_now();

    const std::string& domain() const { return domain_; }
    const config::ManagerSettings& settings() const { return settings_; }
    std::shared_ptr<DeviceRegistry> registry() const { return registry_; }
    std::shared_ptr<discovery::DiscoveryEngine> discovery_engine() const { return discovery_engine_; }

protected:
    /**
     * @brief Turns an add request into a complete manual device record.
     * @throws ValidationError
     */
    virtual DeviceInfo build_device(const FieldMap& spec) const = 0;

    std::string log_prefix_;

private:
    DevicePatch build_patch(const DeviceInfo& current, const FieldMap& fields) const;
    void register_command_handlers();
    void unregister_command_handlers();
    void handle_command(const std::string& command, const bus::BusMessage& message);
    void publish_command_result(const std::string& command, const FieldMap& request, bool success,
                                const std::string& device_id, const std::string& error);
    void restore_devices();
    void save_devices();

    std::string domain_;
    config::ManagerSettings settings_;
    config::SystemSettings system_;
    std::shared_ptr<bus::MessageBus> bus_;
    std::shared_ptr<DeviceRegistry> registry_;
    std::shared_ptr<discovery::DiscoveryEngine> discovery_engine_;
    std::unique_ptr<discovery::DiscoveryLoop> discovery_loop_;
    std::unique_ptr<monitor::StateMonitor> state_monitor_;
    persistence::StateStore store_;

    // Serializes start() and stop(); never held by command handlers.
    std::mutex lifecycle_mutex_;
    mutable std::mutex manager_mutex_;
    bool running_ = false;
    std::vector<std::string> command_topics_;
    std::mutex store_mutex_;
};


/** @brief rtsp, rtmp, http or onvif. */
bool is_supported_network_protocol(const std::string& protocol);

/**
 * @brief The stream entry a manual path produces on a network device:
 *        `{device_id}_{path}` -> `{protocol}://{ip}:{port}/{path}`.
 */
std::pair<std::string, std::string> network_stream_entry(const std::string& device_id,
                                                         const NetworkEndpoint& endpoint,
                                                         const std::string& path);

} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_DEVICE_MANAGER_H
