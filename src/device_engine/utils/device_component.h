/**
 * @file device_component.h
 * @brief Defines the DeviceComponent abstract base class for periodic background loops.
 * @details The discovery loop and the state monitor both run their own thread, sleep between
 *          cycles and must stop promptly. This base standardizes that lifecycle: a worker
 *          thread, a shared stop signal handed to in-flight work, and a wake condition that
 *          cuts the inter-cycle sleep short.
 */
#ifndef CAPTUREHUB_DEVICE_COMPONENT_H
#define CAPTUREHUB_DEVICE_COMPONENT_H

#include "stop_signal.h"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace capturehub {
namespace devices {

/**
 * @class DeviceComponent
 * @brief Abstract base class for threaded device engine components.
 */
class DeviceComponent {
public:
    virtual ~DeviceComponent() = default;

    // Prevent copying and moving; the worker thread holds `this`.
    DeviceComponent(const DeviceComponent&) = delete;
    DeviceComponent& operator=(const DeviceComponent&) = delete;
    DeviceComponent(DeviceComponent&&) = delete;
    DeviceComponent& operator=(DeviceComponent&&) = delete;

    /**
     * @brief Starts the worker thread. Does nothing when already running.
     */
    void start() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (component_thread_.joinable()) {
            return;
        }
        stop_signal_ = std::make_shared<utils::StopSignal>();
        component_thread_ = std::thread(&DeviceComponent::run, this);
    }

    /**
     * @brief Signals the worker to stop and joins it.
     * @details Derived classes bound the time `run()` needs to notice the signal.
     */
    void stop() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!component_thread_.joinable()) {
            return;
        }
        stop_signal_->request_stop();
        wake();
        component_thread_.join();
        component_thread_ = std::thread();
    }

    bool is_running() const {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        return component_thread_.joinable() && !stop_signal_->stop_requested();
    }

protected:
    DeviceComponent() : stop_signal_(std::make_shared<utils::StopSignal>()) {}

    /** @brief The loop body executed by the worker thread. */
    virtual void run() = 0;

    /** @brief Interrupts `sleep_until_woken()`. */
    void wake() {
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            wake_requested_ = true;
        }
        wake_cv_.notify_all();
    }

    /**
     * @brief Sleeps up to `duration`, returning early on `wake()` or stop.
     * @return true if the component should keep running.
     */
    template <typename Rep, typename Period>
    bool sleep_until_woken(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, duration, [this] { return wake_requested_ || stop_signal_->stop_requested(); });
        wake_requested_ = false;
        return !stop_signal_->stop_requested();
    }

    std::thread component_thread_;
    /** Replaced on every start so work abandoned by a previous run keeps its own signal. */
    std::shared_ptr<utils::StopSignal> stop_signal_;

private:
    mutable std::mutex lifecycle_mutex_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool wake_requested_ = false;
};

} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_DEVICE_COMPONENT_H
