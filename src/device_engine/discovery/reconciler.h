/**
 * @file reconciler.h
 * @brief Pure functions that turn one cycle of pooled scanner results into registry operations.
 * @details Kept free of threads and I/O so the merge and diff rules can be exercised directly.
 */
#ifndef CAPTUREHUB_DISCOVERY_RECONCILER_H
#define CAPTUREHUB_DISCOVERY_RECONCILER_H

#include "../device_types.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace capturehub {
namespace devices {
namespace discovery {

/** @brief Consecutive-miss counters of auto-discovered devices, keyed by device id. */
using MissCounters = std::map<std::string, int>;

/**
 * @struct ReconcilePlan
 * @brief The outcome of diffing one cycle's candidates against a registry snapshot.
 */
struct ReconcilePlan {
    std::vector<DeviceInfo> added;                             ///< Fresh records, origin DISCOVERED.
    std::vector<std::pair<std::string, DevicePatch>> updated;  ///< Only entries with real deltas.
    std::vector<std::string> removal_candidates;               ///< Discovered devices missing this cycle.
    std::vector<std::string> removed;                          ///< Candidates whose misses reached the grace.

    bool empty() const {
        return added.empty() && updated.empty() && removal_candidates.empty();
    }
};

/**
 * @brief Rank of `protocol` in `precedence`; protocols not listed rank after every listed one.
 */
size_t precedence_rank(const std::string& protocol, const std::vector<std::string>& precedence);

/**
 * @brief Pools results by derived device id.
 * @details For duplicate identities the result of the higher-precedence protocol provides the
 *          attributes, capabilities are unioned, and streams are unioned with the higher-precedence
 *          URL kept on stream id conflicts. Results without addressing are dropped.
 */
std::map<std::string, DiscoveryResult> merge_results(const std::vector<DiscoveryResult>& pooled,
                                                     const std::vector<std::string>& precedence);

/**
 * @brief The DISCOVERY-origin patch that brings `current` in line with `candidate`.
 * @details Fields the user owns are left out, credentials are only offered when the device has
 *          none, and streams and capabilities are only ever added. An empty patch means no delta.
 */
DevicePatch patch_from_candidate(const DeviceInfo& current, const DiscoveryResult& candidate);

/**
 * @brief Diffs merged candidates against a registry snapshot and advances the miss counters.
 * @details A discovered device absent from `candidates` has its counter incremented and becomes a
 *          removal candidate; once the counter reaches `removal_grace_cycles` it is moved to
 *          `removed` and its counter dropped. Presence resets the counter. Manual devices never
 *          accumulate misses.
 */
ReconcilePlan reconcile(const std::map<std::string, DiscoveryResult>& candidates,
                        const DeviceMap& snapshot,
                        MissCounters& misses,
                        int removal_grace_cycles);

} // namespace discovery
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_DISCOVERY_RECONCILER_H
