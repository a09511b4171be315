/**
 * @file device_errors.h
 * @brief Exceptions raised by registry and manager CRUD operations.
 * @details Scanner, probe and bus delivery failures are not represented here: they are
 *          absorbed by the component that observes them and only logged.
 */
#ifndef CAPTUREHUB_DEVICE_ERRORS_H
#define CAPTUREHUB_DEVICE_ERRORS_H

#include <stdexcept>
#include <string>

namespace capturehub {
namespace devices {

class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief A device with the same identity is already registered. */
class DuplicateIdentityError : public DeviceError {
public:
    explicit DuplicateIdentityError(const std::string& device_id)
        : DeviceError("device already exists: " + device_id), device_id_(device_id) {}

    const std::string& device_id() const { return device_id_; }

private:
    std::string device_id_;
};

class NotFoundError : public DeviceError {
public:
    explicit NotFoundError(const std::string& device_id)
        : DeviceError("device not found: " + device_id), device_id_(device_id) {}

    const std::string& device_id() const { return device_id_; }

private:
    std::string device_id_;
};

/** @brief A malformed add or update request. */
class ValidationError : public DeviceError {
public:
    explicit ValidationError(const std::string& message) : DeviceError(message) {}
};

} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_DEVICE_ERRORS_H
