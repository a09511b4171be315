#include <gtest/gtest.h>
#include "bus/message_bus.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace capturehub::devices;
using namespace capturehub::devices::bus;
using namespace std::chrono_literals;

class MessageBusTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus_ = std::make_unique<MessageBus>();
    }

    void TearDown() override {
        bus_->shutdown();
    }

    std::unique_ptr<MessageBus> bus_;
};

TEST_F(MessageBusTest, TopicHelpersBuildHierarchicalNames) {
    EXPECT_EQ(event_topic("network_devices", "added", "cam1"), "event/network_devices/added/cam1");
    EXPECT_EQ(command_topic("local_devices", "scan"), "command/local_devices/scan");
}

TEST_F(MessageBusTest, WildcardSubscriberReceivesEachMatchingMessageOnce) {
    std::mutex mutex;
    std::vector<std::string> received;
    bus_->subscribe("event/network_devices/added/#", [&](const BusMessage& message) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(message.topic);
    });

    EXPECT_TRUE(bus_->publish("event/network_devices/added/cam1"));
    EXPECT_TRUE(bus_->publish("event/network_devices/removed/cam1"));
    EXPECT_TRUE(bus_->publish("event/network_devices/added/cam2"));
    ASSERT_TRUE(bus_->flush(2s));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], "event/network_devices/added/cam1");
    EXPECT_EQ(received[1], "event/network_devices/added/cam2");
}

TEST_F(MessageBusTest, OverlappingSubscriptionsEachReceiveTheMessage) {
    std::atomic<int> broad{0};
    std::atomic<int> narrow{0};
    bus_->subscribe("event/#", [&](const BusMessage&) { ++broad; });
    bus_->subscribe("event/+/status/#", [&](const BusMessage&) { ++narrow; });

    bus_->publish("event/local_devices/status/video:/dev/video0");
    ASSERT_TRUE(bus_->flush(2s));

    EXPECT_EQ(broad.load(), 1);
    EXPECT_EQ(narrow.load(), 1);
}

TEST_F(MessageBusTest, PreservesPublishOrderPerPublisher) {
    constexpr int kMessages = 200;
    std::mutex mutex;
    std::vector<long long> sequence;
    bus_->subscribe("event/test/#", [&](const BusMessage& message) {
        long long value = 0;
        ASSERT_TRUE(get_int_field(message.payload, "seq", value));
        std::lock_guard<std::mutex> lock(mutex);
        sequence.push_back(value);
    });

    for (int i = 0; i < kMessages; ++i) {
        FieldMap payload;
        payload["seq"] = static_cast<long long>(i);
        ASSERT_TRUE(bus_->publish("event/test/tick/x", payload, "sequencer"));
    }
    ASSERT_TRUE(bus_->flush(5s));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(sequence.size(), static_cast<size_t>(kMessages));
    for (int i = 0; i < kMessages; ++i) {
        EXPECT_EQ(sequence[i], i);
    }
}

TEST_F(MessageBusTest, ConcurrentPublishersKeepPerTopicOrder) {
    constexpr int kPublishers = 4;
    constexpr int kMessages = 250;
    std::mutex mutex;
    std::map<std::string, std::vector<long long>> sequences;
    bus_->subscribe("event/#", [&](const BusMessage& message) {
        long long value = 0;
        ASSERT_TRUE(get_int_field(message.payload, "seq", value));
        std::lock_guard<std::mutex> lock(mutex);
        sequences[message.topic].push_back(value);
    });

    std::vector<std::thread> publishers;
    for (int p = 0; p < kPublishers; ++p) {
        publishers.emplace_back([this, p] {
            const std::string topic = "event/publisher" + std::to_string(p) + "/tick/x";
            for (int i = 0; i < kMessages; ++i) {
                FieldMap payload;
                payload["seq"] = static_cast<long long>(i);
                bus_->publish(topic, payload, "publisher" + std::to_string(p));
            }
        });
    }
    for (auto& publisher : publishers) {
        publisher.join();
    }
    ASSERT_TRUE(bus_->flush(5s));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(sequences.size(), static_cast<size_t>(kPublishers));
    for (const auto& entry : sequences) {
        ASSERT_EQ(entry.second.size(), static_cast<size_t>(kMessages)) << entry.first;
        for (int i = 0; i < kMessages; ++i) {
            EXPECT_EQ(entry.second[i], i) << entry.first;
        }
    }
}

TEST_F(MessageBusTest, UnregisterWaitsForRunningCommandHandler) {
    const std::string topic = command_topic("network_devices", "add");
    std::mutex mutex;
    std::condition_variable cv;
    bool entered = false;
    bool released = false;
    std::atomic<bool> finished{false};
    ASSERT_TRUE(bus_->register_command_handler(topic, [&](const BusMessage&) {
        std::unique_lock<std::mutex> lock(mutex);
        entered = true;
        cv.notify_all();
        cv.wait(lock, [&] { return released; });
        finished = true;
    }));

    ASSERT_TRUE(bus_->publish(topic));
    {
        std::unique_lock<std::mutex> lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, 2s, [&] { return entered; }));
    }

    std::atomic<bool> unregistered{false};
    std::thread owner([&] {
        EXPECT_TRUE(bus_->unregister_command_handler(topic));
        unregistered = true;
        // The handler's captures may be torn down from here on.
        EXPECT_TRUE(finished.load());
    });
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(unregistered.load());

    {
        std::lock_guard<std::mutex> lock(mutex);
        released = true;
    }
    cv.notify_all();
    owner.join();
    EXPECT_TRUE(unregistered.load());
}

TEST_F(MessageBusTest, HandlerMayUnsubscribeItself) {
    std::atomic<int> count{0};
    SubscriptionHandle handle = kInvalidSubscription;
    std::mutex mutex;
    std::unique_lock<std::mutex> hold(mutex);
    handle = bus_->subscribe("event/#", [&](const BusMessage&) {
        std::lock_guard<std::mutex> lock(mutex);
        ++count;
        bus_->unsubscribe(handle);
    });
    hold.unlock();

    bus_->publish("event/a/b/c");
    bus_->publish("event/a/b/c");
    ASSERT_TRUE(bus_->flush(2s));
    EXPECT_EQ(count.load(), 1);
    EXPECT_EQ(bus_->subscriber_count(), 0u);
}

TEST_F(MessageBusTest, FailingHandlerDoesNotAffectOtherSubscribers) {
    std::atomic<int> healthy{0};
    bus_->subscribe("event/#", [](const BusMessage&) { throw std::runtime_error("handler failure"); });
    bus_->subscribe("event/#", [&](const BusMessage&) { ++healthy; });

    EXPECT_TRUE(bus_->publish("event/network_devices/added/cam1"));
    EXPECT_TRUE(bus_->publish("event/network_devices/added/cam2"));
    ASSERT_TRUE(bus_->flush(2s));

    EXPECT_EQ(healthy.load(), 2);
    EXPECT_EQ(bus_->delivery_errors(), 2u);
}

TEST_F(MessageBusTest, UnsubscribedHandlerStopsReceiving) {
    std::atomic<int> count{0};
    const auto handle = bus_->subscribe("event/#", [&](const BusMessage&) { ++count; });
    EXPECT_EQ(bus_->subscriber_count(), 1u);

    bus_->publish("event/a/b/c");
    ASSERT_TRUE(bus_->flush(2s));
    EXPECT_TRUE(bus_->unsubscribe(handle));
    EXPECT_FALSE(bus_->unsubscribe(handle));
    bus_->publish("event/a/b/c");
    ASSERT_TRUE(bus_->flush(2s));

    EXPECT_EQ(count.load(), 1);
    EXPECT_EQ(bus_->subscriber_count(), 0u);
}

TEST_F(MessageBusTest, RejectsMalformedSubscriptions) {
    EXPECT_THROW(bus_->subscribe("event/#/added", [](const BusMessage&) {}), std::invalid_argument);
    EXPECT_THROW(bus_->subscribe("", [](const BusMessage&) {}), std::invalid_argument);
    EXPECT_THROW(bus_->subscribe("event/#", MessageHandler()), std::invalid_argument);
}

TEST_F(MessageBusTest, RejectsPublishingToWildcardTopics) {
    EXPECT_FALSE(bus_->publish("event/network_devices/added/#"));
    EXPECT_FALSE(bus_->publish("event/+/added/cam1"));
}

TEST_F(MessageBusTest, CommandsReachOnlyTheRegisteredHandler) {
    std::atomic<int> handled{0};
    std::atomic<int> observed{0};
    const std::string topic = command_topic("network_devices", "scan");
    ASSERT_TRUE(bus_->register_command_handler(topic, [&](const BusMessage&) { ++handled; }));
    EXPECT_FALSE(bus_->register_command_handler(topic, [](const BusMessage&) {}));
    EXPECT_FALSE(bus_->register_command_handler("event/network_devices/scan", [](const BusMessage&) {}));
    bus_->subscribe("command/#", [&](const BusMessage&) { ++observed; });

    EXPECT_TRUE(bus_->publish(topic));
    ASSERT_TRUE(bus_->flush(2s));

    EXPECT_EQ(handled.load(), 1);
    EXPECT_EQ(observed.load(), 0);
    EXPECT_EQ(bus_->undelivered_commands(), 0u);
}

TEST_F(MessageBusTest, CommandWithoutHandlerIsCounted) {
    EXPECT_TRUE(bus_->publish(command_topic("local_devices", "scan")));
    ASSERT_TRUE(bus_->flush(2s));
    EXPECT_EQ(bus_->undelivered_commands(), 1u);

    ASSERT_TRUE(bus_->register_command_handler(command_topic("local_devices", "scan"), [](const BusMessage&) {}));
    EXPECT_TRUE(bus_->unregister_command_handler(command_topic("local_devices", "scan")));
    EXPECT_TRUE(bus_->publish(command_topic("local_devices", "scan")));
    ASSERT_TRUE(bus_->flush(2s));
    EXPECT_EQ(bus_->undelivered_commands(), 2u);
}

TEST_F(MessageBusTest, MessagesCarryPayloadSenderAndIncreasingIds) {
    std::mutex mutex;
    std::vector<BusMessage> received;
    bus_->subscribe("event/#", [&](const BusMessage& message) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(message);
    });

    FieldMap payload;
    payload["device_id"] = std::string("cam1");
    bus_->publish("event/network_devices/added/cam1", payload, "registry:network_devices");
    bus_->publish("event/network_devices/removed/cam1", payload, "registry:network_devices");
    ASSERT_TRUE(bus_->flush(2s));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0].sender, "registry:network_devices");
    EXPECT_EQ(std::get<std::string>(received[0].payload.at("device_id")), "cam1");
    EXPECT_LT(received[0].message_id, received[1].message_id);
}

TEST_F(MessageBusTest, HandlerMayPublishWithoutDeadlock) {
    std::atomic<int> second_stage{0};
    bus_->subscribe("event/stage/one/x", [&](const BusMessage&) {
        bus_->publish("event/stage/two/x");
    });
    bus_->subscribe("event/stage/two/x", [&](const BusMessage&) { ++second_stage; });

    bus_->publish("event/stage/one/x");
    ASSERT_TRUE(bus_->flush(2s));
    ASSERT_TRUE(bus_->flush(2s));
    EXPECT_EQ(second_stage.load(), 1);
}

TEST_F(MessageBusTest, PublishAfterShutdownIsRejected) {
    bus_->shutdown();
    EXPECT_FALSE(bus_->publish("event/network_devices/added/cam1"));
    bus_->shutdown();
}

TEST(MessageBusLimitsTest, BoundedQueueDropsWhenFull) {
    MessageBus bus(BusSettings{2});
    std::mutex gate;
    std::unique_lock<std::mutex> hold(gate);
    std::atomic<bool> entered{false};
    bus.subscribe("event/#", [&](const BusMessage&) {
        entered = true;
        std::lock_guard<std::mutex> wait(gate);
    });

    ASSERT_TRUE(bus.publish("event/a/b/0"));
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!entered && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(entered.load());

    EXPECT_TRUE(bus.publish("event/a/b/1"));
    EXPECT_TRUE(bus.publish("event/a/b/2"));
    EXPECT_FALSE(bus.publish("event/a/b/3"));
    EXPECT_EQ(bus.dropped_messages(), 1u);

    hold.unlock();
    EXPECT_TRUE(bus.flush(2s));
    bus.shutdown();
}
