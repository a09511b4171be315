/**
 * @file message_bus.h
 * @brief Topic-based publish/subscribe and command dispatch.
 * @details Published messages are queued and delivered by a single dispatch thread, so every
 *          subscriber observes the messages of one publisher in publish order. Handler
 *          failures are caught, logged and counted per delivery; they never reach the
 *          publisher or other subscribers. Topics under `command/` are routed to the single
 *          handler registered for that exact topic instead of being broadcast.
 */
#ifndef CAPTUREHUB_BUS_MESSAGE_BUS_H
#define CAPTUREHUB_BUS_MESSAGE_BUS_H

#include "../field_map.h"
#include "../utils/thread_safe_queue.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace capturehub {
namespace devices {
namespace bus {

struct BusMessage {
    std::string topic;
    FieldMap payload;
    std::string sender;
    uint64_t message_id = 0;
    std::chrono::system_clock::time_point timestamp;
};

using MessageHandler = std::function<void(const BusMessage&)>;
using SubscriptionHandle = uint64_t;

inline constexpr SubscriptionHandle kInvalidSubscription = 0;

struct BusSettings {
    /** Maximum number of queued, undelivered messages. 0 means unbounded. */
    std::size_t max_pending_messages = 0;
};

/** @brief `event/<domain>/<action>/<device_id>` */
std::string event_topic(const std::string& domain, const std::string& action, const std::string& device_id);
/** @brief `command/<domain>/<action>` */
std::string command_topic(const std::string& domain, const std::string& action);

class MessageBus {
public:
    explicit MessageBus(BusSettings settings = {});
    ~MessageBus();

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;
    MessageBus(MessageBus&&) = delete;
    MessageBus& operator=(MessageBus&&) = delete;

    /**
     * @brief Registers `handler` for every topic matching `pattern`.
     * @throws std::invalid_argument if the pattern is malformed or the handler is empty.
     */
    SubscriptionHandle subscribe(const std::string& pattern, MessageHandler handler);

    /**
     * @brief Removes a subscription.
     * @details Outside a handler, also waits for a delivery to this subscription that is
     *          already running, so the handler's captures may be destroyed on return. Called
     *          from a handler it returns immediately.
     * @return false if the handle is unknown.
     */
    bool unsubscribe(SubscriptionHandle handle);

    /**
     * @brief Installs the handler for an exact `command/...` topic.
     * @return false if the topic is not a command topic or already has a handler.
     */
    bool register_command_handler(const std::string& topic, MessageHandler handler);

    /** @brief Removes a command handler, waiting for it the same way `unsubscribe()` does. */
    bool unregister_command_handler(const std::string& topic);

    /**
     * @brief Queues a message for delivery. Never blocks on handlers.
     * @return false if the bus is shut down or the pending queue is full.
     */
    bool publish(const std::string& topic, FieldMap payload = {}, const std::string& sender = "");

    /**
     * @brief Waits until every message published before the call has been dispatched.
     * @details Must not be called from inside a handler.
     * @return false on timeout or when called from the dispatch thread.
     */
    bool flush(std::chrono::milliseconds timeout);

    /** @brief Drains queued messages, then stops the dispatch thread. Idempotent. */
    void shutdown();

    std::size_t subscriber_count() const;
    uint64_t delivery_errors() const { return delivery_errors_.load(); }
    uint64_t undelivered_commands() const { return undelivered_commands_.load(); }
    uint64_t dropped_messages() const { return dropped_messages_.load(); }

private:
    struct Subscription {
        std::string pattern;
        std::vector<std::string> segments;
        std::shared_ptr<MessageHandler> handler;
    };

    void dispatch_loop();
    void dispatch(const BusMessage& message);
    void invoke(const MessageHandler& handler, const BusMessage& message, const std::string& target);
    void finish_invocation();
    // Caller holds subscriptions_mutex_ through `lock`.
    void wait_until_not_running(const MessageHandler* handler, std::unique_lock<std::mutex>& lock);

    BusSettings settings_;
    utils::ThreadSafeQueue<BusMessage> queue_;

    mutable std::mutex subscriptions_mutex_;
    std::map<SubscriptionHandle, Subscription> subscriptions_;
    std::map<std::string, std::shared_ptr<MessageHandler>> command_handlers_;
    SubscriptionHandle next_handle_ = 1;
    // Handler currently executing on the dispatch thread, guarded by subscriptions_mutex_.
    const MessageHandler* in_flight_ = nullptr;
    std::condition_variable in_flight_cv_;

    std::mutex progress_mutex_;
    std::condition_variable progress_cv_;
    uint64_t published_count_ = 0;
    uint64_t dispatched_count_ = 0;

    std::atomic<uint64_t> next_message_id_{1};
    std::atomic<uint64_t> delivery_errors_{0};
    std::atomic<uint64_t> undelivered_commands_{0};
    std::atomic<uint64_t> dropped_messages_{0};
    std::atomic<bool> running_{false};
    std::thread dispatch_thread_;
};

} // namespace bus
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_BUS_MESSAGE_BUS_H
