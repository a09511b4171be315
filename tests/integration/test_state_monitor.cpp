#include <gtest/gtest.h>
#include "monitor/state_monitor.h"
#include "registry/device_registry.h"
#include "bus/message_bus.h"
#include "mocks/event_recorder.h"
#include "mocks/mock_scanner.h"

#include <chrono>
#include <functional>
#include <thread>

using namespace capturehub::devices;
using capturehub::devices::testing::EventRecorder;
using capturehub::devices::testing::MockProber;
using namespace std::chrono_literals;

class StateMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus_ = std::make_shared<bus::MessageBus>();
        recorder_ = std::make_unique<EventRecorder>(bus_, "event/+/status/#");
        registry_ = std::make_shared<DeviceRegistry>(capturehub::config::kNetworkDomain, bus_);
        prober_ = std::make_shared<MockProber>();

        settings_ = capturehub::config::default_network_settings();
        settings_.probe_failure_threshold = 3;
        settings_.probe_interval_sec = 0.05;
        settings_.probe_timeout_ms = 100;

        camera_id_ = AddCamera("192.168.1.10");
    }

    void TearDown() override {
        monitor_.reset();
        recorder_.reset();
        registry_.reset();
        bus_->shutdown();
    }

    std::string AddCamera(const std::string& ip) {
        DeviceInfo camera;
        camera.device_id = make_network_device_id(ip, 554);
        camera.name = "Camera " + ip;
        camera.kind = DeviceKind::NETWORK;
        camera.origin = DeviceOrigin::MANUAL;
        camera.network.ip = ip;
        camera.network.port = 554;
        camera.network.protocol = "rtsp";
        registry_->add(camera);
        return camera.device_id;
    }

    void CreateMonitor() {
        monitor_ = std::make_unique<monitor::StateMonitor>(capturehub::config::kNetworkDomain, registry_, prober_,
                                                           settings_);
    }

    DeviceStatus StatusOf(const std::string& device_id) {
        auto device = registry_->get(device_id);
        return device ? device->status : DeviceStatus::UNKNOWN;
    }

    // Helper to wait for an asynchronous condition with timeout
    bool WaitForCondition(std::function<bool()> condition,
                          std::chrono::milliseconds timeout = 5s,
                          std::chrono::milliseconds interval = 20ms) {
        auto start = std::chrono::steady_clock::now();
        while (std::chrono::steady_clock::now() - start < timeout) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(interval);
        }
        return condition();
    }

    std::shared_ptr<bus::MessageBus> bus_;
    std::unique_ptr<EventRecorder> recorder_;
    std::shared_ptr<DeviceRegistry> registry_;
    std::shared_ptr<MockProber> prober_;
    capturehub::config::ManagerSettings settings_;
    std::unique_ptr<monitor::StateMonitor> monitor_;
    std::string camera_id_;
};

TEST_F(StateMonitorTest, FirstSuccessfulProbeMarksDeviceOnline) {
    CreateMonitor();

    EXPECT_EQ(monitor_->probe_once(), 1u);
    EXPECT_EQ(StatusOf(camera_id_), DeviceStatus::ONLINE);
    EXPECT_EQ(prober_->probe_count(camera_id_), 1);

    // Staying online is not a transition.
    EXPECT_EQ(monitor_->probe_once(), 0u);

    ASSERT_TRUE(bus_->flush(2s));
    const auto messages = recorder_->messages();
    ASSERT_EQ(messages.size(), 1u);
    std::string status;
    std::string previous;
    ASSERT_TRUE(get_string_field(messages[0].payload, "status", status));
    ASSERT_TRUE(get_string_field(messages[0].payload, "previous_status", previous));
    EXPECT_EQ(status, "online");
    EXPECT_EQ(previous, "unknown");
}

TEST_F(StateMonitorTest, GoesOfflineOnlyAfterThresholdFailures) {
    CreateMonitor();
    monitor_->probe_once();
    ASSERT_EQ(StatusOf(camera_id_), DeviceStatus::ONLINE);

    prober_->set_outcome(camera_id_, false);
    EXPECT_EQ(monitor_->probe_once(), 0u);
    EXPECT_EQ(monitor_->probe_once(), 0u);
    EXPECT_EQ(StatusOf(camera_id_), DeviceStatus::ONLINE);
    EXPECT_EQ(monitor_->consecutive_failures(camera_id_), 2);

    EXPECT_EQ(monitor_->probe_once(), 1u);
    EXPECT_EQ(StatusOf(camera_id_), DeviceStatus::OFFLINE);

    prober_->set_outcome(camera_id_, true);
    EXPECT_EQ(monitor_->probe_once(), 1u);
    EXPECT_EQ(StatusOf(camera_id_), DeviceStatus::ONLINE);
    EXPECT_EQ(monitor_->consecutive_failures(camera_id_), 0);

    ASSERT_TRUE(bus_->flush(2s));
    EXPECT_EQ(recorder_->count("event/network_devices/status/" + camera_id_), 3u);
}

TEST_F(StateMonitorTest, IntermittentSuccessPreventsFlapping) {
    CreateMonitor();
    monitor_->probe_once();

    for (int round = 0; round < 3; ++round) {
        prober_->set_outcome(camera_id_, false);
        monitor_->probe_once();
        monitor_->probe_once();
        prober_->set_outcome(camera_id_, true);
        monitor_->probe_once();
    }
    EXPECT_EQ(StatusOf(camera_id_), DeviceStatus::ONLINE);
}

TEST_F(StateMonitorTest, ProbesDevicesIndependently) {
    const std::string second = AddCamera("192.168.1.11");
    prober_->set_outcome(second, false);
    settings_.probe_failure_threshold = 1;
    CreateMonitor();

    EXPECT_EQ(monitor_->probe_once(), 2u);
    EXPECT_EQ(StatusOf(camera_id_), DeviceStatus::ONLINE);
    EXPECT_EQ(StatusOf(second), DeviceStatus::OFFLINE);
}

TEST_F(StateMonitorTest, ForgetsCountersOfRemovedDevices) {
    prober_->set_outcome(camera_id_, false);
    CreateMonitor();
    monitor_->probe_once();
    monitor_->probe_once();
    ASSERT_EQ(monitor_->consecutive_failures(camera_id_), 2);

    registry_->remove(camera_id_);
    EXPECT_EQ(monitor_->probe_once(), 0u);
    EXPECT_EQ(monitor_->consecutive_failures(camera_id_), 0);

    // Re-added under the same identity it starts from a clean slate.
    AddCamera("192.168.1.10");
    monitor_->probe_once();
    EXPECT_EQ(monitor_->consecutive_failures(camera_id_), 1);
    EXPECT_EQ(StatusOf(camera_id_), DeviceStatus::UNKNOWN);
}

TEST_F(StateMonitorTest, BackgroundLoopProbesPeriodically) {
    CreateMonitor();
    monitor_->start();
    EXPECT_TRUE(monitor_->is_running());

    EXPECT_TRUE(WaitForCondition([this] { return StatusOf(camera_id_) == DeviceStatus::ONLINE; }));
    EXPECT_TRUE(WaitForCondition([this] { return prober_->probe_count(camera_id_) >= 3; }));

    prober_->set_outcome(camera_id_, false);
    EXPECT_TRUE(WaitForCondition([this] { return StatusOf(camera_id_) == DeviceStatus::OFFLINE; }));

    monitor_->stop();
    EXPECT_FALSE(monitor_->is_running());
}

TEST_F(StateMonitorTest, StopInterruptsSlowProbes) {
    prober_->set_delay(30s);
    settings_.probe_interval_sec = 60.0;
    CreateMonitor();
    monitor_->start();
    ASSERT_TRUE(WaitForCondition([this] { return prober_->probe_count(camera_id_) == 1; }));

    const auto started = std::chrono::steady_clock::now();
    monitor_->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
    EXPECT_EQ(StatusOf(camera_id_), DeviceStatus::UNKNOWN);
}
