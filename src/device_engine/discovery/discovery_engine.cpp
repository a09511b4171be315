#include "discovery_engine.h"

#include "../device_errors.h"
#include "../registry/device_registry.h"
#include "../utils/cpp_logger.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <optional>
#include <thread>

namespace capturehub {
namespace devices {
namespace discovery {

namespace {

constexpr std::chrono::milliseconds kWaitSlice{50};
// Scanners enforce their own timeout; this covers socket teardown and result translation.
constexpr std::chrono::milliseconds kScanSlack{500};

// Scanner threads of every engine that have not returned yet, abandoned ones included.
std::atomic<size_t> g_scanner_threads_running{0};

// Shared between the cycle and the scanner threads it launches.
struct CycleState {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::optional<std::vector<DiscoveryResult>>> results;
};

} // namespace

DiscoveryEngine::DiscoveryEngine(std::string domain,
                                 const scanners::ScannerFactory& factory,
                                 config::ManagerSettings settings,
                                 std::shared_ptr<DeviceRegistry> registry)
    : domain_(std::move(domain)),
      log_prefix_("[DiscoveryEngine:" + domain_ + "]"),
      settings_(std::move(settings)),
      registry_(std::move(registry)) {
    for (const auto& protocol : settings_.discovery_methods) {
        auto scanner = factory.create(protocol, settings_.scanner(protocol));
        if (!scanner) {
            LOG_CPP_WARNING("%s No scanner registered for protocol '%s'; skipping.", log_prefix_.c_str(), protocol.c_str());
            continue;
        }
        scanners_.push_back(std::move(scanner));
    }
    LOG_CPP_INFO("%s Initialized with %zu scanners.", log_prefix_.c_str(), scanners_.size());
}

std::vector<std::string> DiscoveryEngine::active_protocols() const {
    std::vector<std::string> names;
    for (const auto& scanner : scanners_) {
        names.push_back(scanner->protocol());
    }
    return names;
}

size_t DiscoveryEngine::scanner_threads_running() {
    return g_scanner_threads_running.load();
}

MissCounters DiscoveryEngine::miss_counters() const {
    std::lock_guard<std::mutex> lock(misses_mutex_);
    return misses_;
}

bool DiscoveryEngine::accepts(const DiscoveryResult& result) const {
    if (result.kind != DeviceKind::LOCAL) {
        return true;
    }
    return result.type == DeviceType::VIDEO ? settings_.enable_video : settings_.enable_audio;
}

std::vector<DiscoveryResult> DiscoveryEngine::collect(const std::shared_ptr<utils::StopSignal>& stop,
                                                      CycleReport& report) {
    auto state = std::make_shared<CycleState>();
    state->results.resize(scanners_.size());

    const auto started = std::chrono::steady_clock::now();
    std::vector<std::chrono::steady_clock::time_point> deadlines;
    for (size_t i = 0; i < scanners_.size(); ++i) {
        const auto timeout = std::chrono::milliseconds(settings_.scanner(scanners_[i]->protocol()).timeout_ms);
        deadlines.push_back(started + timeout + kScanSlack);

        std::shared_ptr<scanners::ProtocolScanner> scanner = scanners_[i];
        std::shared_ptr<utils::StopSignal> signal = stop;
        const std::string prefix = log_prefix_;
        ++g_scanner_threads_running;
        std::thread([state, scanner, signal, timeout, i, prefix]() {
            std::vector<DiscoveryResult> found;
            try {
                found = scanner->scan(timeout, *signal);
            } catch (const std::exception& e) {
                LOG_CPP_ERROR("%s Scanner '%s' failed: %s", prefix.c_str(), scanner->protocol().c_str(), e.what());
            } catch (...) {
                LOG_CPP_ERROR("%s Scanner '%s' failed with an unknown exception.", prefix.c_str(),
                              scanner->protocol().c_str());
            }
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->results[i] = std::move(found);
            }
            state->cv.notify_all();
            --g_scanner_threads_running;
        }).detach();
    }

    std::optional<std::chrono::steady_clock::time_point> grace_deadline;
    std::vector<DiscoveryResult> pooled;
    std::unique_lock<std::mutex> lock(state->mutex);
    for (size_t i = 0; i < scanners_.size(); ++i) {
        const std::string protocol = scanners_[i]->protocol();
        while (!state->results[i]) {
            if (!grace_deadline && stop->stop_requested()) {
                grace_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(settings_.stop_grace_ms);
            }
            auto limit = deadlines[i];
            if (grace_deadline && *grace_deadline < limit) {
                limit = *grace_deadline;
            }
            const auto now = std::chrono::steady_clock::now();
            if (now >= limit) {
                break;
            }
            state->cv.wait_for(lock, std::min<std::chrono::steady_clock::duration>(kWaitSlice, limit - now));
        }
        if (!state->results[i]) {
            LOG_CPP_WARNING("%s Scanner '%s' did not return in time; abandoning its result.",
                            log_prefix_.c_str(), protocol.c_str());
            report.abandoned_protocols.push_back(protocol);
            continue;
        }
        report.completed_protocols.push_back(protocol);
        size_t accepted = 0;
        for (auto& result : *state->results[i]) {
            if (!accepts(result)) {
                continue;
            }
            if (result.source_protocol.empty()) {
                result.source_protocol = protocol;
            }
            pooled.push_back(std::move(result));
            ++accepted;
        }
        LOG_CPP_DEBUG("%s Scanner '%s' returned %zu results.", log_prefix_.c_str(), protocol.c_str(), accepted);
    }
    return pooled;
}

void DiscoveryEngine::apply(const ReconcilePlan& plan, CycleReport& report) {
    for (const auto& device : plan.added) {
        try {
            registry_->add(device);
            ++report.added;
        } catch (const DuplicateIdentityError&) {
            // Added manually while the scanners ran; the next cycle patches it.
            LOG_CPP_DEBUG("%s %s appeared during the cycle; skipping add.", log_prefix_.c_str(), device.device_id.c_str());
        } catch (const ValidationError& e) {
            LOG_CPP_WARNING("%s Rejected discovered device %s: %s", log_prefix_.c_str(), device.device_id.c_str(), e.what());
        }
    }
    for (const auto& entry : plan.updated) {
        try {
            if (registry_->update(entry.first, entry.second, FieldOrigin::DISCOVERY)) {
                ++report.updated;
            }
        } catch (const DeviceError& e) {
            LOG_CPP_DEBUG("%s Skipping update of %s: %s", log_prefix_.c_str(), entry.first.c_str(), e.what());
        }
    }
    for (const auto& device_id : plan.removed) {
        try {
            registry_->remove(device_id);
            ++report.removed;
        } catch (const NotFoundError&) {
            LOG_CPP_DEBUG("%s %s already removed.", log_prefix_.c_str(), device_id.c_str());
        }
    }
}

CycleReport DiscoveryEngine::run_cycle(const std::shared_ptr<utils::StopSignal>& stop) {
    std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);
    CycleReport report;
    const auto started = std::chrono::steady_clock::now();

    std::vector<DiscoveryResult> pooled = collect(stop, report);
    report.raw_results = pooled.size();
    if (stop->stop_requested()) {
        report.cancelled = true;
        LOG_CPP_INFO("%s Cycle cancelled; discarding %zu results.", log_prefix_.c_str(), pooled.size());
        return report;
    }

    const auto candidates = merge_results(pooled, settings_.discovery_methods);
    report.candidates = candidates.size();

    ReconcilePlan plan;
    {
        std::lock_guard<std::mutex> lock(misses_mutex_);
        plan = reconcile(candidates, registry_->list(), misses_, settings_.removal_grace_cycles);
    }
    report.removal_candidates = plan.removal_candidates.size();
    apply(plan, report);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    LOG_CPP_INFO("%s Cycle done in %lld ms: results=%zu candidates=%zu added=%zu updated=%zu missing=%zu removed=%zu abandoned=%zu",
                 log_prefix_.c_str(), static_cast<long long>(elapsed.count()), report.raw_results, report.candidates,
                 report.added, report.updated, report.removal_candidates, report.removed,
                 report.abandoned_protocols.size());
    return report;
}

} // namespace discovery
} // namespace devices
} // namespace capturehub
