#ifndef CAPTUREHUB_DISCOVERY_LOOP_H
#define CAPTUREHUB_DISCOVERY_LOOP_H

#include "discovery_engine.h"
#include "../utils/device_component.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace capturehub {
namespace devices {
namespace discovery {

/**
 * @class DiscoveryLoop
 * @brief Periodic driver of a DiscoveryEngine.
 * @details Runs a cycle immediately on start and then every `scan_interval`. With periodic
 *          discovery disabled, cycles only run on `request_scan()`.
 */
class DiscoveryLoop : public DeviceComponent {
public:
    DiscoveryLoop(std::shared_ptr<DiscoveryEngine> engine, std::chrono::milliseconds interval, bool periodic);
    ~DiscoveryLoop() override;

    using CycleCallback = std::function<void(const CycleReport&)>;

    /** @brief Starts a cycle as soon as the current one (if any) finishes. */
    void request_scan();

    /** @brief Called on the loop thread after every cycle that was not cancelled. Set before start(). */
    void set_cycle_callback(CycleCallback callback) { cycle_callback_ = std::move(callback); }

    size_t completed_cycles() const { return completed_cycles_.load(); }

protected:
    void run() override;

private:
    std::shared_ptr<DiscoveryEngine> engine_;
    std::chrono::milliseconds interval_;
    bool periodic_;
    std::atomic<bool> scan_requested_{false};
    std::atomic<size_t> completed_cycles_{0};
    CycleCallback cycle_callback_;
};

} // namespace discovery
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_DISCOVERY_LOOP_H
