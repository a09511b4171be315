#include "state_monitor.h"

#include "../device_errors.h"
#include "../registry/device_registry.h"
#include "../utils/cpp_logger.h"

#include <algorithm>
#include <atomic>
#include <set>
#include <thread>
#include <vector>

namespace capturehub {
namespace devices {
namespace monitor {

StateMonitor::StateMonitor(std::string domain,
                           std::shared_ptr<DeviceRegistry> registry,
                           std::shared_ptr<DeviceProber> prober,
                           const config::ManagerSettings& settings)
    : log_prefix_("[StateMonitor:" + domain + "]"),
      registry_(std::move(registry)),
      prober_(std::move(prober)),
      interval_(static_cast<long long>(settings.probe_interval_sec * 1000.0)),
      probe_timeout_(settings.probe_timeout_ms),
      debouncer_(settings.probe_failure_threshold) {}

StateMonitor::~StateMonitor() {
    stop();
}

int StateMonitor::consecutive_failures(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    return debouncer_.consecutive_failures(device_id);
}

size_t StateMonitor::probe_once() {
    utils::StopSignal never_stopped;
    return probe_cycle(never_stopped);
}

size_t StateMonitor::probe_cycle(const utils::StopSignal& stop) {
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    const DeviceMap snapshot = registry_->list();

    std::set<std::string> ids;
    std::vector<const DeviceInfo*> devices;
    for (const auto& entry : snapshot) {
        ids.insert(entry.first);
        devices.push_back(&entry.second);
    }
    debouncer_.retain(ids);
    if (devices.empty()) {
        return 0;
    }

    std::vector<ProbeResult> results(devices.size());
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t index = next.fetch_add(1); index < devices.size(); index = next.fetch_add(1)) {
            if (stop.stop_requested()) {
                return;
            }
            results[index] = prober_->probe(*devices[index], probe_timeout_, stop);
        }
    };
    std::vector<std::thread> workers;
    const size_t worker_count = std::min(kMaxConcurrentProbes, devices.size());
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }
    if (stop.stop_requested()) {
        LOG_CPP_DEBUG("%s Probe cycle interrupted by stop; results discarded.", log_prefix_.c_str());
        return 0;
    }

    size_t transitions = 0;
    for (size_t i = 0; i < devices.size(); ++i) {
        const DeviceInfo& device = *devices[i];
        const ProbeResult& result = results[i];
        if (!result.ok) {
            LOG_CPP_DEBUG("%s Probe of %s failed%s: %s", log_prefix_.c_str(), device.device_id.c_str(),
                          result.timed_out ? " (timeout)" : "", result.detail.c_str());
        }
        auto transition = debouncer_.observe(device.device_id, result.ok, device.status);
        if (!transition) {
            continue;
        }
        try {
            if (registry_->set_status(device.device_id, *transition)) {
                ++transitions;
            }
        } catch (const NotFoundError&) {
            // Removed while the probe was in flight.
            debouncer_.forget(device.device_id);
        }
    }
    return transitions;
}

void StateMonitor::run() {
    const std::shared_ptr<utils::StopSignal> stop = stop_signal_;
    LOG_CPP_INFO("%s Started (interval=%lld ms, timeout=%lld ms, threshold=%d).", log_prefix_.c_str(),
                 static_cast<long long>(interval_.count()), static_cast<long long>(probe_timeout_.count()),
                 debouncer_.failure_threshold());
    while (!stop->stop_requested()) {
        probe_cycle(*stop);
        if (!sleep_until_woken(interval_)) {
            break;
        }
    }
    LOG_CPP_INFO("%s Exiting.", log_prefix_.c_str());
}

} // namespace monitor
} // namespace devices
} // namespace capturehub
