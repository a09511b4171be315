#ifndef CAPTUREHUB_NETWORK_DEVICE_MANAGER_H
#define CAPTUREHUB_NETWORK_DEVICE_MANAGER_H

#include "device_manager.h"

namespace capturehub {
namespace devices {

/**
 * @class NetworkDeviceManager
 * @brief Manages IP cameras and other network capture endpoints (`network_devices` domain).
 */
class NetworkDeviceManager : public DeviceManager {
public:
    static constexpr int kDefaultPort = 554;

    NetworkDeviceManager(config::ManagerSettings settings,
                         config::SystemSettings system,
                         std::shared_ptr<bus::MessageBus> bus,
                         const scanners::ScannerFactory& factory,
                         std::shared_ptr<monitor::DeviceProber> prober = std::make_shared<monitor::NetworkProber>());
    ~NetworkDeviceManager() override;

    /**
     * @brief Validates a manual add request.
     * @details Keys: name and ip (required), port (default 554), type (default video), protocol
     *          (rtsp|rtmp|http|onvif, default rtsp), username, password, paths (comma list, each
     *          becomes a stream) and capabilities (comma list).
     * @throws ValidationError
     */
    static DeviceInfo device_from_spec(const FieldMap& spec);

protected:
    DeviceInfo build_device(const FieldMap& spec) const override;
};

} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_NETWORK_DEVICE_MANAGER_H
