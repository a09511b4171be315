#include "message_bus.h"

#include "topic_matcher.h"
#include "../utils/cpp_logger.h"

#include <stdexcept>

namespace capturehub {
namespace devices {
namespace bus {

std::string event_topic(const std::string& domain, const std::string& action, const std::string& device_id) {
    return "event/" + domain + "/" + action + "/" + device_id;
}

std::string command_topic(const std::string& domain, const std::string& action) {
    return "command/" + domain + "/" + action;
}

MessageBus::MessageBus(BusSettings settings)
    : settings_(settings), queue_(settings.max_pending_messages) {
    running_ = true;
    dispatch_thread_ = std::thread(&MessageBus::dispatch_loop, this);
}

MessageBus::~MessageBus() {
    shutdown();
}

SubscriptionHandle MessageBus::subscribe(const std::string& pattern, MessageHandler handler) {
    if (!handler) {
        throw std::invalid_argument("subscription handler is empty");
    }
    if (!is_valid_pattern(pattern)) {
        throw std::invalid_argument("invalid topic pattern: " + pattern);
    }
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    const SubscriptionHandle handle = next_handle_++;
    Subscription subscription;
    subscription.pattern = pattern;
    subscription.segments = split_topic(pattern);
    subscription.handler = std::make_shared<MessageHandler>(std::move(handler));
    subscriptions_.emplace(handle, std::move(subscription));
    LOG_CPP_DEBUG("[MessageBus] Subscription %llu registered for '%s'",
                  static_cast<unsigned long long>(handle), pattern.c_str());
    return handle;
}

bool MessageBus::unsubscribe(SubscriptionHandle handle) {
    std::unique_lock<std::mutex> lock(subscriptions_mutex_);
    auto it = subscriptions_.find(handle);
    if (it == subscriptions_.end()) {
        LOG_CPP_DEBUG("[MessageBus] Unsubscribe for unknown handle %llu", static_cast<unsigned long long>(handle));
        return false;
    }
    std::shared_ptr<MessageHandler> removed = std::move(it->second.handler);
    subscriptions_.erase(it);
    wait_until_not_running(removed.get(), lock);
    return true;
}

bool MessageBus::register_command_handler(const std::string& topic, MessageHandler handler) {
    if (!is_command_topic(topic) || !handler) {
        LOG_CPP_WARNING("[MessageBus] Refusing command handler for '%s'", topic.c_str());
        return false;
    }
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    if (command_handlers_.count(topic) != 0) {
        LOG_CPP_WARNING("[MessageBus] Command topic '%s' already has a handler", topic.c_str());
        return false;
    }
    command_handlers_[topic] = std::make_shared<MessageHandler>(std::move(handler));
    return true;
}

bool MessageBus::unregister_command_handler(const std::string& topic) {
    std::unique_lock<std::mutex> lock(subscriptions_mutex_);
    auto it = command_handlers_.find(topic);
    if (it == command_handlers_.end()) {
        return false;
    }
    std::shared_ptr<MessageHandler> removed = std::move(it->second);
    command_handlers_.erase(it);
    wait_until_not_running(removed.get(), lock);
    return true;
}

void MessageBus::wait_until_not_running(const MessageHandler* handler, std::unique_lock<std::mutex>& lock) {
    if (std::this_thread::get_id() == dispatch_thread_.get_id()) {
        return;
    }
    in_flight_cv_.wait(lock, [this, handler] { return in_flight_ != handler; });
}

bool MessageBus::publish(const std::string& topic, FieldMap payload, const std::string& sender) {
    if (topic.empty() || topic.find_first_of("+#") != std::string::npos) {
        LOG_CPP_WARNING("[MessageBus] Refusing to publish on invalid topic '%s'", topic.c_str());
        return false;
    }

    BusMessage message;
    message.topic = topic;
    message.payload = std::move(payload);
    message.sender = sender;
    message.message_id = next_message_id_.fetch_add(1);
    message.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(progress_mutex_);
    using PushResult = utils::ThreadSafeQueue<BusMessage>::PushResult;
    const PushResult result = queue_.push(std::move(message));
    if (result == PushResult::Closed) {
        LOG_CPP_DEBUG("[MessageBus] Publish on '%s' after shutdown ignored", topic.c_str());
        return false;
    }
    if (result == PushResult::Full) {
        ++dropped_messages_;
        LOG_CPP_WARNING("[MessageBus] Pending queue full (%zu); dropped message on '%s'",
                        settings_.max_pending_messages, topic.c_str());
        return false;
    }
    ++published_count_;
    return true;
}

bool MessageBus::flush(std::chrono::milliseconds timeout) {
    if (std::this_thread::get_id() == dispatch_thread_.get_id()) {
        LOG_CPP_WARNING("[MessageBus] flush() called from a handler; ignoring");
        return false;
    }
    std::unique_lock<std::mutex> lock(progress_mutex_);
    const uint64_t target = published_count_;
    return progress_cv_.wait_for(lock, timeout, [this, target] { return dispatched_count_ >= target; });
}

void MessageBus::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }
    queue_.close();
    if (dispatch_thread_.joinable()) {
        if (std::this_thread::get_id() == dispatch_thread_.get_id()) {
            LOG_CPP_ERROR("[MessageBus] shutdown() called from a handler; detaching dispatch thread");
            dispatch_thread_.detach();
        } else {
            dispatch_thread_.join();
        }
    }
    LOG_CPP_INFO("[MessageBus] Shut down (delivery errors=%llu, undelivered commands=%llu, peak backlog=%zu)",
                 static_cast<unsigned long long>(delivery_errors_.load()),
                 static_cast<unsigned long long>(undelivered_commands_.load()),
                 queue_.high_water_mark());
}

std::size_t MessageBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    return subscriptions_.size();
}

void MessageBus::dispatch_loop() {
    BusMessage message;
    while (queue_.pop(message)) {
        dispatch(message);
        {
            std::lock_guard<std::mutex> lock(progress_mutex_);
            ++dispatched_count_;
        }
        progress_cv_.notify_all();
    }
}

void MessageBus::dispatch(const BusMessage& message) {
    if (is_command_topic(message.topic)) {
        std::shared_ptr<MessageHandler> handler;
        {
            std::lock_guard<std::mutex> lock(subscriptions_mutex_);
            auto it = command_handlers_.find(message.topic);
            if (it != command_handlers_.end()) {
                handler = it->second;
                in_flight_ = handler.get();
            }
        }
        if (!handler) {
            ++undelivered_commands_;
            LOG_CPP_WARNING("[MessageBus] No handler registered for command '%s' (message %llu)",
                            message.topic.c_str(), static_cast<unsigned long long>(message.message_id));
            return;
        }
        invoke(*handler, message, "command handler");
        finish_invocation();
        return;
    }

    const auto topic_segments = split_topic(message.topic);
    std::vector<std::pair<SubscriptionHandle, std::shared_ptr<MessageHandler>>> targets;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        for (const auto& entry : subscriptions_) {
            if (topic_matches(entry.second.segments, topic_segments)) {
                targets.emplace_back(entry.first, entry.second.handler);
            }
        }
    }
    for (const auto& target : targets) {
        {
            // Skip subscriptions removed while earlier targets ran.
            std::lock_guard<std::mutex> lock(subscriptions_mutex_);
            auto it = subscriptions_.find(target.first);
            if (it == subscriptions_.end() || it->second.handler != target.second) {
                continue;
            }
            in_flight_ = target.second.get();
        }
        invoke(*target.second, message, "subscription " + std::to_string(target.first));
        finish_invocation();
    }
}

void MessageBus::finish_invocation() {
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        in_flight_ = nullptr;
    }
    in_flight_cv_.notify_all();
}

void MessageBus::invoke(const MessageHandler& handler, const BusMessage& message, const std::string& target) {
    try {
        handler(message);
    } catch (const std::exception& e) {
        ++delivery_errors_;
        LOG_CPP_WARNING("[MessageBus] %s failed on '%s': %s", target.c_str(), message.topic.c_str(), e.what());
    } catch (...) {
        ++delivery_errors_;
        LOG_CPP_WARNING("[MessageBus] %s failed on '%s' with a non-standard exception",
                        target.c_str(), message.topic.c_str());
    }
}

} // namespace bus
} // namespace devices
} // namespace capturehub
