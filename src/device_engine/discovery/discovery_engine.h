/**
 * @file discovery_engine.h
 * @brief Runs one discovery cycle: concurrent scanners, precedence merge, registry reconcile.
 */
#ifndef CAPTUREHUB_DISCOVERY_ENGINE_H
#define CAPTUREHUB_DISCOVERY_ENGINE_H

#include "reconciler.h"
#include "../configuration/device_engine_settings.h"
#include "../scanners/scanner_factory.h"
#include "../utils/stop_signal.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace capturehub {
namespace devices {

class DeviceRegistry;

namespace discovery {

/** @brief Summary of one cycle, for logs and tests. */
struct CycleReport {
    size_t raw_results = 0;
    size_t candidates = 0;
    size_t added = 0;
    size_t updated = 0;
    size_t removal_candidates = 0;
    size_t removed = 0;
    std::vector<std::string> completed_protocols;
    std::vector<std::string> abandoned_protocols;  ///< Timed out, or still running after the stop grace.
    bool cancelled = false;                        ///< Stop was requested; nothing was applied.
};

/**
 * @class DiscoveryEngine
 * @brief Owns the enabled scanners of one domain and reconciles their output into a registry.
 * @details Each scanner runs on its own detached thread bounded by its protocol timeout. A scanner
 *          that overruns its timeout, or that is still running `stop_grace_ms` after a stop was
 *          requested, is abandoned: its result is discarded and the thread finishes on its own,
 *          holding shared ownership of the scanner and the stop signal.
 *          Cycles are serialized; the miss counters persist across cycles.
 */
class DiscoveryEngine {
public:
    DiscoveryEngine(std::string domain,
                    const scanners::ScannerFactory& factory,
                    config::ManagerSettings settings,
                    std::shared_ptr<DeviceRegistry> registry);

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /** @brief Collects, merges, reconciles and applies. */
    CycleReport run_cycle(const std::shared_ptr<utils::StopSignal>& stop);

    /** @brief Protocols with an instantiated scanner, in precedence order. */
    std::vector<std::string> active_protocols() const;

    MissCounters miss_counters() const;

    /**
     * @brief Scanner threads, across all engines, that have not returned yet.
     * @details Abandoned scanners keep running detached; hosts can poll this before exiting.
     */
    static size_t scanner_threads_running();

private:
    std::vector<DiscoveryResult> collect(const std::shared_ptr<utils::StopSignal>& stop, CycleReport& report);
    void apply(const ReconcilePlan& plan, CycleReport& report);
    bool accepts(const DiscoveryResult& result) const;

    std::string domain_;
    std::string log_prefix_;
    config::ManagerSettings settings_;
    std::shared_ptr<DeviceRegistry> registry_;
    std::vector<std::shared_ptr<scanners::ProtocolScanner>> scanners_;

    std::mutex cycle_mutex_;
    mutable std::mutex misses_mutex_;
    MissCounters misses_;
};

} // namespace discovery
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_DISCOVERY_ENGINE_H
