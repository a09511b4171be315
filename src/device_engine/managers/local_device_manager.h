#ifndef CAPTUREHUB_LOCAL_DEVICE_MANAGER_H
#define CAPTUREHUB_LOCAL_DEVICE_MANAGER_H

#include "device_manager.h"

namespace capturehub {
namespace devices {

/**
 * @class LocalDeviceManager
 * @brief Manages cameras and microphones attached to this host (`local_devices` domain).
 */
class LocalDeviceManager : public DeviceManager {
public:
    LocalDeviceManager(config::ManagerSettings settings,
                       config::SystemSettings system,
                       std::shared_ptr<bus::MessageBus> bus,
                       const scanners::ScannerFactory& factory,
                       std::shared_ptr<monitor::DeviceProber> prober = std::make_shared<monitor::LocalProber>());
    ~LocalDeviceManager() override;

    /**
     * @brief Validates a manual add request.
     * @details Keys: system_path and driver (v4l2|alsa) required; type defaults to the driver's
     *          media type; name defaults to the system path; capabilities (comma list).
     * @throws ValidationError
     */
    static DeviceInfo device_from_spec(const FieldMap& spec);

protected:
    DeviceInfo build_device(const FieldMap& spec) const override;
};

} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_LOCAL_DEVICE_MANAGER_H
