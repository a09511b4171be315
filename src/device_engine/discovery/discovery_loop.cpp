#include "discovery_loop.h"

#include "../utils/cpp_logger.h"

#include <exception>

namespace capturehub {
namespace devices {
namespace discovery {

DiscoveryLoop::DiscoveryLoop(std::shared_ptr<DiscoveryEngine> engine, std::chrono::milliseconds interval, bool periodic)
    : engine_(std::move(engine)), interval_(interval), periodic_(periodic) {}

DiscoveryLoop::~DiscoveryLoop() {
    stop();
}

void DiscoveryLoop::request_scan() {
    scan_requested_ = true;
    wake();
}

void DiscoveryLoop::run() {
    const std::shared_ptr<utils::StopSignal> stop = stop_signal_;
    LOG_CPP_INFO("[DiscoveryLoop] Started (interval=%lld ms, periodic=%s).",
                 static_cast<long long>(interval_.count()), periodic_ ? "true" : "false");
    while (!stop->stop_requested()) {
        const bool requested = scan_requested_.exchange(false);
        if (periodic_ || requested) {
            const CycleReport report = engine_->run_cycle(stop);
            if (!report.cancelled) {
                ++completed_cycles_;
                if (cycle_callback_) {
                    try {
                        cycle_callback_(report);
                    } catch (const std::exception& e) {
                        LOG_CPP_ERROR("[DiscoveryLoop] Cycle callback failed: %s", e.what());
                    }
                }
            }
        }
        if (!sleep_until_woken(interval_)) {
            break;
        }
    }
    LOG_CPP_INFO("[DiscoveryLoop] Exiting.");
}

} // namespace discovery
} // namespace devices
} // namespace capturehub
