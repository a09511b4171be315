#include <gtest/gtest.h>
#include "scanners/local/alsa_scanner.h"
#include "scanners/local/v4l2_scanner.h"
#include "scanners/network/port_scanner.h"
#include "monitor/device_prober.h"
#include "utils/stop_signal.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace capturehub::devices;
using namespace capturehub::devices::scanners;
using namespace std::chrono_literals;

TEST(AlsaScannerTest, ParsesNamedHardwareHints) {
    std::string card;
    std::string device;
    ASSERT_TRUE(AlsaScanner::parse_hw_name("hw:CARD=PCH,DEV=0", card, device));
    EXPECT_EQ(card, "PCH");
    EXPECT_EQ(device, "0");

    ASSERT_TRUE(AlsaScanner::parse_hw_name("hw:CARD=Device,DEV=3", card, device));
    EXPECT_EQ(card, "Device");
    EXPECT_EQ(device, "3");
}

TEST(AlsaScannerTest, ParsesPositionalHardwareHints) {
    std::string card;
    std::string device;
    ASSERT_TRUE(AlsaScanner::parse_hw_name("hw:1,2", card, device));
    EXPECT_EQ(card, "1");
    EXPECT_EQ(device, "2");

    ASSERT_TRUE(AlsaScanner::parse_hw_name("hw:CARD=USB", card, device));
    EXPECT_EQ(card, "USB");
    EXPECT_EQ(device, "0");
}

TEST(AlsaScannerTest, RejectsNonHardwareNames) {
    std::string card;
    std::string device;
    EXPECT_FALSE(AlsaScanner::parse_hw_name("default", card, device));
    EXPECT_FALSE(AlsaScanner::parse_hw_name("plughw:CARD=PCH,DEV=0", card, device));
    EXPECT_FALSE(AlsaScanner::parse_hw_name("sysdefault:CARD=PCH", card, device));
    EXPECT_FALSE(AlsaScanner::parse_hw_name("hw:", card, device));
}

TEST(AlsaScannerTest, CaptureIoidFilter) {
    EXPECT_TRUE(AlsaScanner::is_capture_ioid(""));
    EXPECT_TRUE(AlsaScanner::is_capture_ioid("Input"));
    EXPECT_FALSE(AlsaScanner::is_capture_ioid("Output"));
}

TEST(AlsaScannerTest, CleansMultiLineDescriptions) {
    EXPECT_EQ(AlsaScanner::clean_description("HDA Intel PCH, ALC3246 Analog\nDirect hardware device without any conversions"),
              "HDA Intel PCH, ALC3246 Analog Direct hardware device without any conversions");
    EXPECT_EQ(AlsaScanner::clean_description("  USB  Mic \r\n"), "USB Mic");
    EXPECT_EQ(AlsaScanner::clean_description(""), "");
}

TEST(V4l2ScannerTest, RecognizesVideoNodeNames) {
    EXPECT_TRUE(V4l2Scanner::is_video_node_name("video0"));
    EXPECT_TRUE(V4l2Scanner::is_video_node_name("video12"));
    EXPECT_FALSE(V4l2Scanner::is_video_node_name("video"));
    EXPECT_FALSE(V4l2Scanner::is_video_node_name("videox"));
    EXPECT_FALSE(V4l2Scanner::is_video_node_name("media0"));
    EXPECT_FALSE(V4l2Scanner::is_video_node_name("v4l-subdev0"));
}

TEST(V4l2ScannerTest, FormatsFourCc) {
    // 'Y' 'U' 'Y' 'V' little-endian
    EXPECT_EQ(V4l2Scanner::fourcc_to_string(0x56595559u), "YUYV");
    EXPECT_EQ(V4l2Scanner::fourcc_to_string(0x20203859u), "Y8");
    EXPECT_EQ(V4l2Scanner::fourcc_to_string(0x00000001u), "0x00000001");
}

TEST(V4l2ScannerTest, SkipsNodesThatCannotCapture) {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("capturehub_v4l2_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "video0") << "not a device";
    std::ofstream(dir / "notes.txt") << "ignored";

    V4l2Scanner scanner(dir.string());
    utils::StopSignal stop;
    EXPECT_TRUE(scanner.scan(1s, stop).empty());
    EXPECT_EQ(scanner.protocol(), "v4l2");

    std::filesystem::remove_all(dir);
}

TEST(V4l2ScannerTest, MissingDirectoryYieldsNoResults) {
    V4l2Scanner scanner("/nonexistent/capturehub/dev");
    utils::StopSignal stop;
    EXPECT_TRUE(scanner.scan(1s, stop).empty());
}

TEST(PortScannerTest, ExpandsSingleAddress) {
    std::vector<std::string> hosts;
    ASSERT_TRUE(PortScanner::expand_range("192.168.1.7", hosts));
    EXPECT_EQ(hosts, std::vector<std::string>{"192.168.1.7"});
}

TEST(PortScannerTest, ExpandsSlash24WithoutNetworkAndBroadcast) {
    std::vector<std::string> hosts;
    ASSERT_TRUE(PortScanner::expand_range("10.1.2.77/24", hosts));
    ASSERT_EQ(hosts.size(), 254u);
    EXPECT_EQ(hosts.front(), "10.1.2.1");
    EXPECT_EQ(hosts.back(), "10.1.2.254");
}

TEST(PortScannerTest, ExpandsNarrowBlocks) {
    std::vector<std::string> hosts;
    ASSERT_TRUE(PortScanner::expand_range("10.1.2.5/30", hosts));
    EXPECT_EQ(hosts, (std::vector<std::string>{"10.1.2.5", "10.1.2.6"}));

    hosts.clear();
    ASSERT_TRUE(PortScanner::expand_range("10.1.2.5/31", hosts));
    EXPECT_EQ(hosts, (std::vector<std::string>{"10.1.2.4", "10.1.2.5"}));

    hosts.clear();
    ASSERT_TRUE(PortScanner::expand_range("10.1.2.5/32", hosts));
    EXPECT_EQ(hosts, std::vector<std::string>{"10.1.2.5"});
}

TEST(PortScannerTest, RejectsWideOrMalformedRanges) {
    std::vector<std::string> hosts;
    EXPECT_FALSE(PortScanner::expand_range("10.0.0.0/16", hosts));
    EXPECT_FALSE(PortScanner::expand_range("10.0.0.0/33", hosts));
    EXPECT_FALSE(PortScanner::expand_range("10.0.0.0/", hosts));
    EXPECT_FALSE(PortScanner::expand_range("10.0.0.0/2a", hosts));
    EXPECT_FALSE(PortScanner::expand_range("camera.local", hosts));
    EXPECT_TRUE(hosts.empty());
}

TEST(PortScannerTest, NoRangesMeansNoResults) {
    PortScanner scanner(capturehub::config::ScannerSettings{});
    utils::StopSignal stop;
    EXPECT_TRUE(scanner.scan(200ms, stop).empty());
}

TEST(LocalProberTest, DerivesAlsaControlName) {
    EXPECT_EQ(monitor::LocalProber::alsa_control_name("hw:1,0"), "hw:1");
    EXPECT_EQ(monitor::LocalProber::alsa_control_name("hw:2"), "hw:2");
    EXPECT_EQ(monitor::LocalProber::alsa_control_name("/dev/video0"), "");
    EXPECT_EQ(monitor::LocalProber::alsa_control_name("hw:"), "");
}

TEST(LocalProberTest, VideoNodeProbeChecksPathExistence) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("capturehub_probe_" + std::to_string(::getpid()));
    std::ofstream(path) << "node";

    DeviceInfo device;
    device.kind = DeviceKind::LOCAL;
    device.local.system_path = path.string();
    device.local.driver = "v4l2";

    monitor::LocalProber prober;
    utils::StopSignal stop;
    EXPECT_TRUE(prober.probe(device, 100ms, stop).ok);

    std::filesystem::remove(path);
    const auto missing = prober.probe(device, 100ms, stop);
    EXPECT_FALSE(missing.ok);
    EXPECT_FALSE(missing.detail.empty());
}

TEST(LocalProberTest, RejectsNetworkDevices) {
    DeviceInfo device;
    device.kind = DeviceKind::NETWORK;
    monitor::LocalProber prober;
    utils::StopSignal stop;
    EXPECT_FALSE(prober.probe(device, 100ms, stop).ok);
}
