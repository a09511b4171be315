/**
 * @file device_prober.h
 * @brief Lightweight reachability checks used by the state monitor.
 */
#ifndef CAPTUREHUB_DEVICE_PROBER_H
#define CAPTUREHUB_DEVICE_PROBER_H

#include "../device_types.h"
#include "../utils/stop_signal.h"

#include <chrono>
#include <string>

namespace capturehub {
namespace devices {
namespace monitor {

struct ProbeResult {
    bool ok = false;
    bool timed_out = false;
    std::string detail;
};

/**
 * @class DeviceProber
 * @brief Checks whether one device is currently reachable.
 * @details Implementations bound their work by `timeout`, return early once `stop` is requested
 *          and report failures through ProbeResult rather than exceptions. They are called
 *          concurrently for different devices.
 */
class DeviceProber {
public:
    virtual ~DeviceProber() = default;

    virtual ProbeResult probe(const DeviceInfo& device,
                              std::chrono::milliseconds timeout,
                              const utils::StopSignal& stop) = 0;
};

/** @brief TCP connect to the device's ip:port. */
class NetworkProber : public DeviceProber {
public:
    ProbeResult probe(const DeviceInfo& device,
                      std::chrono::milliseconds timeout,
                      const utils::StopSignal& stop) override;
};

/**
 * @brief Path existence for V4L2 nodes, control handle open for ALSA cards.
 */
class LocalProber : public DeviceProber {
public:
    ProbeResult probe(const DeviceInfo& device,
                      std::chrono::milliseconds timeout,
                      const utils::StopSignal& stop) override;

    /** @brief "hw:1,0" -> "hw:1"; empty if `system_path` is not a hw: address. */
    static std::string alsa_control_name(const std::string& system_path);
};

} // namespace monitor
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_DEVICE_PROBER_H
