#ifndef CAPTUREHUB_STATUS_DEBOUNCER_H
#define CAPTUREHUB_STATUS_DEBOUNCER_H

#include "../device_types.h"

#include <map>
#include <optional>
#include <set>
#include <string>

namespace capturehub {
namespace devices {
namespace monitor {

/**
 * @class StatusDebouncer
 * @brief Turns raw probe outcomes into status transitions.
 * @details One success moves a device to online. Offline requires `failure_threshold`
 *          consecutive failures; any success resets the count. Not thread-safe; the state
 *          monitor serializes its probe cycles.
 */
class StatusDebouncer {
public:
    explicit StatusDebouncer(int failure_threshold);

    /**
     * @brief Records one probe outcome for a device currently in `current`.
     * @return the new status if this observation causes a transition.
     */
    std::optional<DeviceStatus> observe(const std::string& device_id, bool success, DeviceStatus current);

    int consecutive_failures(const std::string& device_id) const;

    void forget(const std::string& device_id);

    /** @brief Drops the counters of devices not in `device_ids`. */
    void retain(const std::set<std::string>& device_ids);

    int failure_threshold() const { return failure_threshold_; }

private:
    int failure_threshold_;
    std::map<std::string, int> failures_;
};

} // namespace monitor
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_STATUS_DEBOUNCER_H
