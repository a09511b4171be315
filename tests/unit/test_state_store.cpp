#include <gtest/gtest.h>
#include "persistence/state_store.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

using namespace capturehub::devices;
using capturehub::devices::persistence::StateStore;

class StateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("capturehub_store_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    static DeviceInfo make_camera() {
        DeviceInfo camera;
        camera.device_id = "192.168.1.10:554";
        camera.name = "Front Door";
        camera.kind = DeviceKind::NETWORK;
        camera.type = DeviceType::VIDEO;
        camera.status = DeviceStatus::ONLINE;
        camera.origin = DeviceOrigin::MANUAL;
        camera.field_origins[kFieldName] = FieldOrigin::USER;
        camera.field_origins[kFieldProtocol] = FieldOrigin::USER;
        camera.network.ip = "192.168.1.10";
        camera.network.port = 554;
        camera.network.protocol = "rtsp";
        camera.network.username = "admin";
        camera.network.password = "secret";
        camera.streams["192.168.1.10:554_stream1"] = "rtsp://192.168.1.10:554/stream1";
        camera.capabilities = {"rtsp", "ptz"};
        return camera;
    }

    static DeviceInfo make_microphone() {
        DeviceInfo mic;
        mic.device_id = "audio:hw:1,0";
        mic.name = "USB Mic";
        mic.kind = DeviceKind::LOCAL;
        mic.type = DeviceType::AUDIO;
        mic.origin = DeviceOrigin::MANUAL;
        mic.local.system_path = "hw:1,0";
        mic.local.driver = "alsa";
        mic.streams["audio:hw:1,0"] = "hw:1,0";
        mic.capabilities = {"alsa"};
        return mic;
    }

    std::string ReadFile(const std::string& path) const {
        std::ifstream in(path);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::filesystem::path dir_;
};

TEST_F(StateStoreTest, MissingFileLoadsEmpty) {
    StateStore store(dir_.string(), "network_devices", false);
    EXPECT_TRUE(store.load().empty());
    EXPECT_EQ(store.file_path(), (dir_ / "network_devices.yaml").string());
}

TEST_F(StateStoreTest, RestoresDevicesWithoutStatusOrCredentials) {
    StateStore store(dir_.string(), "network_devices", false);
    ASSERT_TRUE(store.save({make_camera()}));

    const std::string text = ReadFile(store.file_path());
    EXPECT_EQ(text.find("secret"), std::string::npos);
    EXPECT_EQ(text.find("admin"), std::string::npos);

    const auto loaded = store.load();
    ASSERT_EQ(loaded.size(), 1u);
    DeviceInfo expected = make_camera();
    expected.status = DeviceStatus::UNKNOWN;
    expected.network.username.clear();
    expected.network.password.clear();
    EXPECT_EQ(loaded[0], expected);
}

TEST_F(StateStoreTest, PersistsCredentialsWhenEnabled) {
    StateStore store(dir_.string(), "network_devices", true);
    ASSERT_TRUE(store.save({make_camera()}));
    const auto loaded = store.load();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].network.username, "admin");
    EXPECT_EQ(loaded[0].network.password, "secret");
}

TEST_F(StateStoreTest, RestoresLocalDevices) {
    StateStore store(dir_.string(), "local_devices", false);
    ASSERT_TRUE(store.save({make_microphone()}));
    const auto loaded = store.load();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0], make_microphone());
}

TEST_F(StateStoreTest, SaveReplacesPreviousContents) {
    StateStore store(dir_.string(), "network_devices", false);
    ASSERT_TRUE(store.save({make_camera()}));
    ASSERT_TRUE(store.save({}));
    EXPECT_TRUE(store.load().empty());
    EXPECT_FALSE(std::filesystem::exists(store.file_path() + ".tmp"));
}

TEST_F(StateStoreTest, SkipsMalformedEntries) {
    std::filesystem::create_directories(dir_);
    {
        std::ofstream out(dir_ / "network_devices.yaml");
        out << "domain: network_devices\n"
               "devices:\n"
               "  - device_id: \"10.0.0.1:554\"\n"
               "    name: Good\n"
               "    kind: network\n"
               "    ip: 10.0.0.1\n"
               "    port: 554\n"
               "  - name: NoIdentity\n"
               "  - device_id: \"10.0.0.2:554\"\n"
               "    kind: network\n"
               "    ip: 10.0.0.2\n"
               "    port: not-a-port\n";
    }
    StateStore store(dir_.string(), "network_devices", false);
    const auto loaded = store.load();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].device_id, "10.0.0.1:554");
    EXPECT_EQ(loaded[0].origin, DeviceOrigin::MANUAL);
}

TEST_F(StateStoreTest, CorruptFileLoadsEmpty) {
    std::filesystem::create_directories(dir_);
    std::ofstream(dir_ / "network_devices.yaml") << "devices: [unterminated\n";
    StateStore store(dir_.string(), "network_devices", false);
    EXPECT_TRUE(store.load().empty());

    std::ofstream(dir_ / "network_devices.yaml", std::ios::trunc) << "just a scalar\n";
    EXPECT_TRUE(store.load().empty());
}
