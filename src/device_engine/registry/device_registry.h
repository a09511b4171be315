/**
 * @file device_registry.h
 * @brief The authoritative, thread-safe store of devices for one domain.
 * @details All mutations, whether they come from the discovery engine, the state monitor or
 *          a manager command, go through this class so the merge policy applies uniformly.
 *          Each effective change publishes exactly one event on the bus:
 *          `event/<domain>/{added,updated,removed,status}/<device_id>`.
 *          Readers take a shared lock and receive copies.
 */
#ifndef CAPTUREHUB_REGISTRY_DEVICE_REGISTRY_H
#define CAPTUREHUB_REGISTRY_DEVICE_REGISTRY_H

#include "../device_types.h"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace capturehub {
namespace devices {

namespace bus {
class MessageBus;
}

/** @brief Provenance of a tracked field, defaulting to the device's own origin when unset. */
FieldOrigin field_origin(const DeviceInfo& device, const std::string& field);

class DeviceRegistry {
public:
    /**
     * @param domain Topic domain of emitted events (`local_devices`, `network_devices`).
     * @param bus Event sink. May be null, in which case no events are emitted.
     */
    DeviceRegistry(std::string domain, std::shared_ptr<bus::MessageBus> bus);

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Inserts a device with status reset to unknown.
     * @throws DuplicateIdentityError if the id is taken; the registry is left unchanged.
     * @throws ValidationError if identity or addressing fields are missing.
     */
    void add(DeviceInfo device);

    /**
     * @brief Merges the provided fields of `patch` into an existing device.
     * @param source Provenance of the patch. A DISCOVERY patch never overrides a field whose
     *        current value was set by the user, and only fills credentials that are empty.
     *        A USER patch repeating a field's current value only moves its origin to USER.
     * @return true if at least one value changed (and an `updated` event was emitted).
     * @throws NotFoundError, ValidationError
     */
    bool update(const std::string& device_id, const DevicePatch& patch, FieldOrigin source = FieldOrigin::USER);

    /**
     * @brief Removes a device and emits `removed` with its last known fields.
     * @throws NotFoundError
     */
    void remove(const std::string& device_id);

    /**
     * @brief Sets the health status of a device.
     * @return true if the status changed (and a `status` event was emitted).
     * @throws NotFoundError
     */
    bool set_status(const std::string& device_id, DeviceStatus status);

    std::optional<DeviceInfo> get(const std::string& device_id) const;
    DeviceMap list() const;
    bool contains(const std::string& device_id) const;
    std::size_t size() const;

    const std::string& domain() const { return domain_; }

private:
    void validate_new_device(const DeviceInfo& device) const;
    void emit(const std::string& action, const DeviceInfo& device, FieldMap extra = {}) const;

    std::string domain_;
    std::shared_ptr<bus::MessageBus> bus_;
    mutable std::shared_mutex mutex_;
    DeviceMap devices_;
};

} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_REGISTRY_DEVICE_REGISTRY_H
