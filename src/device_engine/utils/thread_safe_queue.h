/**
 * @file thread_safe_queue.h
 * @brief Blocking FIFO that hands published bus messages to the dispatch thread.
 * @details Producers never block: when a capacity is set and reached, `push()` reports
 *          `Full` and the caller decides what to count or log. Closing the queue rejects
 *          further pushes but lets the consumer drain what is already queued.
 */
#ifndef CAPTUREHUB_THREAD_SAFE_QUEUE_H
#define CAPTUREHUB_THREAD_SAFE_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace capturehub {
namespace devices {
namespace utils {

/**
 * @class ThreadSafeQueue
 * @brief Multi-producer, single-consumer queue with an optional capacity.
 * @tparam T Element type; moved in and out.
 */
template <typename T>
class ThreadSafeQueue {
public:
    enum class PushResult {
        Pushed,
        Full,
        Closed
    };

    /** @param capacity Maximum queued items; 0 means unbounded. */
    explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    PushResult push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return PushResult::Closed;
            }
            if (capacity_ > 0 && items_.size() >= capacity_) {
                return PushResult::Full;
            }
            items_.push_back(std::move(item));
            if (items_.size() > high_water_mark_) {
                high_water_mark_ = items_.size();
            }
        }
        not_empty_.notify_one();
        return PushResult::Pushed;
    }

    /**
     * @brief Blocks until an item is available or the queue is closed and empty.
     * @return false only once the queue is closed and fully drained.
     */
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return !items_.empty() || closed_; });
        return take_front(item);
    }

    /** @return false if nothing arrived within `timeout`. */
    template <typename Rep, typename Period>
    bool pop_for(T& item, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        return take_front(item);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    std::size_t capacity() const { return capacity_; }

    /** @brief Largest backlog seen since construction. */
    std::size_t high_water_mark() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return high_water_mark_;
    }

private:
    // Caller holds mutex_.
    bool take_front(T& item) {
        if (items_.empty()) {
            return false;
        }
        item = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    std::size_t high_water_mark_ = 0;
    bool closed_ = false;
};

} // namespace utils
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_THREAD_SAFE_QUEUE_H
