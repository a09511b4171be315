/**
 * @file device_engine.h
 * @brief Top-level owner of the bus and both device managers.
 */
#ifndef CAPTUREHUB_DEVICE_ENGINE_H
#define CAPTUREHUB_DEVICE_ENGINE_H

#include "local_device_manager.h"
#include "network_device_manager.h"
#include "../configuration/settings_loader.h"

#include <memory>
#include <string>

namespace capturehub {
namespace devices {

/**
 * @class DeviceEngine
 * @brief Creates the shared bus and the local and network managers from one EngineSettings.
 * @details Applies `system.log_level` on construction. Destruction stops both managers and
 *          drains the bus.
 */
class DeviceEngine {
public:
    explicit DeviceEngine(config::EngineSettings settings,
                          const scanners::ScannerFactory& factory = scanners::ScannerFactory::with_builtin_scanners());
    ~DeviceEngine();

    DeviceEngine(const DeviceEngine&) = delete;
    DeviceEngine& operator=(const DeviceEngine&) = delete;

    /** @brief Loads settings (defaults, config file, environment) and builds an engine. */
    static std::unique_ptr<DeviceEngine> from_config(const std::string& config_path = "");

    void start();
    void stop();
    bool is_running() const;

    std::shared_ptr<bus::MessageBus> bus() const { return bus_; }
    LocalDeviceManager& local_devices() { return *local_; }
    NetworkDeviceManager& network_devices() { return *network_; }
    const config::EngineSettings& settings() const { return settings_; }

private:
    config::EngineSettings settings_;
    std::shared_ptr<bus::MessageBus> bus_;
    std::unique_ptr<LocalDeviceManager> local_;
    std::unique_ptr<NetworkDeviceManager> network_;
};

} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_DEVICE_ENGINE_H
