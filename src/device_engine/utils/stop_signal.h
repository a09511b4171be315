#ifndef CAPTUREHUB_STOP_SIGNAL_H
#define CAPTUREHUB_STOP_SIGNAL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace capturehub {
namespace devices {
namespace utils {

/**
 * @class StopSignal
 * @brief A one-shot cooperative cancellation flag that sleepers can wait on.
 * @details Shared (via `std::shared_ptr`) between a component and the work it launches, so
 *          that abandoned workers still hold a valid signal after the component moved on.
 */
class StopSignal {
public:
    StopSignal() = default;
    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    bool stop_requested() const {
        return stopped_.load();
    }

    /**
     * @brief Sleeps for `duration` unless a stop is requested first.
     * @return true if the stop was requested.
     */
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return stopped_.load(); });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> stopped_{false};
};

} // namespace utils
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_STOP_SIGNAL_H
