#include "reconciler.h"

#include "../registry/device_registry.h"

#include <algorithm>

namespace capturehub {
namespace devices {
namespace discovery {

size_t precedence_rank(const std::string& protocol, const std::vector<std::string>& precedence) {
    auto it = std::find(precedence.begin(), precedence.end(), protocol);
    return static_cast<size_t>(std::distance(precedence.begin(), it));
}

std::map<std::string, DiscoveryResult> merge_results(const std::vector<DiscoveryResult>& pooled,
                                                     const std::vector<std::string>& precedence) {
    std::vector<const DiscoveryResult*> ordered;
    ordered.reserve(pooled.size());
    for (const auto& result : pooled) {
        ordered.push_back(&result);
    }
    // Highest precedence first; stable so equal ranks keep arrival order.
    std::stable_sort(ordered.begin(), ordered.end(), [&](const DiscoveryResult* a, const DiscoveryResult* b) {
        return precedence_rank(a->source_protocol, precedence) < precedence_rank(b->source_protocol, precedence);
    });

    std::map<std::string, DiscoveryResult> merged;
    for (const DiscoveryResult* result : ordered) {
        const std::string device_id = derive_device_id(*result);
        if (device_id.empty()) {
            continue;
        }
        auto it = merged.find(device_id);
        if (it == merged.end()) {
            merged.emplace(device_id, *result);
            continue;
        }
        DiscoveryResult& winner = it->second;
        winner.capabilities.insert(result->capabilities.begin(), result->capabilities.end());
        winner.streams.insert(result->streams.begin(), result->streams.end());
        if (winner.username.empty() && winner.password.empty()) {
            winner.username = result->username;
            winner.password = result->password;
        }
    }
    return merged;
}

DevicePatch patch_from_candidate(const DeviceInfo& current, const DiscoveryResult& candidate) {
    DevicePatch patch;
    if (!candidate.name.empty() && candidate.name != current.name &&
        field_origin(current, kFieldName) != FieldOrigin::USER) {
        patch.name = candidate.name;
    }
    if (candidate.type != current.type && field_origin(current, kFieldType) != FieldOrigin::USER) {
        patch.type = candidate.type;
    }
    if (current.kind == DeviceKind::NETWORK) {
        if (!candidate.protocol.empty() && candidate.protocol != current.network.protocol &&
            field_origin(current, kFieldProtocol) != FieldOrigin::USER) {
            patch.protocol = candidate.protocol;
        }
        if (!candidate.username.empty() && current.network.username.empty()) {
            patch.username = candidate.username;
        }
        if (!candidate.password.empty() && current.network.password.empty()) {
            patch.password = candidate.password;
        }
    }
    for (const auto& stream : candidate.streams) {
        if (current.streams.count(stream.first) == 0) {
            patch.streams_to_add.insert(stream);
        }
    }
    for (const auto& tag : candidate.capabilities) {
        if (current.capabilities.count(tag) == 0) {
            patch.capabilities_to_add.insert(tag);
        }
    }
    return patch;
}

ReconcilePlan reconcile(const std::map<std::string, DiscoveryResult>& candidates,
                        const DeviceMap& snapshot,
                        MissCounters& misses,
                        int removal_grace_cycles) {
    ReconcilePlan plan;

    for (const auto& entry : candidates) {
        misses.erase(entry.first);
        auto existing = snapshot.find(entry.first);
        if (existing == snapshot.end()) {
            plan.added.push_back(device_from_discovery(entry.second));
            continue;
        }
        DevicePatch patch = patch_from_candidate(existing->second, entry.second);
        if (!patch.empty()) {
            plan.updated.emplace_back(entry.first, std::move(patch));
        }
    }

    for (const auto& entry : snapshot) {
        const DeviceInfo& device = entry.second;
        if (device.origin != DeviceOrigin::DISCOVERED || candidates.count(entry.first) != 0) {
            continue;
        }
        const int count = ++misses[entry.first];
        plan.removal_candidates.push_back(entry.first);
        if (count >= removal_grace_cycles) {
            plan.removed.push_back(entry.first);
            misses.erase(entry.first);
        }
    }

    // Devices that left the registry some other way no longer need a counter.
    for (auto it = misses.begin(); it != misses.end();) {
        auto device = snapshot.find(it->first);
        if (device == snapshot.end() || device->second.origin != DeviceOrigin::DISCOVERED) {
            it = misses.erase(it);
        } else {
            ++it;
        }
    }
    return plan;
}

} // namespace discovery
} // namespace devices
} // namespace capturehub
