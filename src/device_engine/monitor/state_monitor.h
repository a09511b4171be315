/**
 * @file state_monitor.h
 * @brief Periodic reachability probing that drives the device status state machine.
 */
#ifndef CAPTUREHUB_STATE_MONITOR_H
#define CAPTUREHUB_STATE_MONITOR_H

#include "device_prober.h"
#include "status_debouncer.h"
#include "../configuration/device_engine_settings.h"
#include "../utils/device_component.h"

#include <memory>
#include <mutex>
#include <string>

namespace capturehub {
namespace devices {

class DeviceRegistry;

namespace monitor {

/**
 * @class StateMonitor
 * @brief Probes every registered device each `probe_interval` and applies debounced transitions.
 * @details Probes of one cycle run concurrently (at most kMaxConcurrentProbes at a time) and the
 *          cycle joins them all before applying results, so a device is never probed twice at
 *          once. Transitions go through DeviceRegistry::set_status, which emits the status event.
 */
class StateMonitor : public DeviceComponent {
public:
    static constexpr size_t kMaxConcurrentProbes = 8;

    StateMonitor(std::string domain,
                 std::shared_ptr<DeviceRegistry> registry,
                 std::shared_ptr<DeviceProber> prober,
                 const config::ManagerSettings& settings);
    ~StateMonitor() override;

    /** @brief Runs one probe cycle on the calling thread. @return number of transitions. */
    size_t probe_once();

    int consecutive_failures(const std::string& device_id) const;

protected:
    void run() override;

private:
    size_t probe_cycle(const utils::StopSignal& stop);

    std::string log_prefix_;
    std::shared_ptr<DeviceRegistry> registry_;
    std::shared_ptr<DeviceProber> prober_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds probe_timeout_;

    mutable std::mutex cycle_mutex_;
    StatusDebouncer debouncer_;
};

} // namespace monitor
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_STATE_MONITOR_H
