#include <gtest/gtest.h>
#include "monitor/device_prober.h"
#include "scanners/network/port_scanner.h"
#include "utils/socket_utils.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>

using namespace capturehub::devices;
using namespace std::chrono_literals;

namespace {

// Loopback TCP listener on an ephemeral port. Connections complete in the kernel backlog,
// so nothing needs to accept them.
class LoopbackListener {
public:
    LoopbackListener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) {
            return;
        }
        sockaddr_in addr {};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd_, 16) != 0) {
            close_fd();
            return;
        }
        socklen_t len = sizeof(addr);
        if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            close_fd();
            return;
        }
        port_ = ntohs(addr.sin_port);
    }

    ~LoopbackListener() { close_fd(); }

    LoopbackListener(const LoopbackListener&) = delete;
    LoopbackListener& operator=(const LoopbackListener&) = delete;

    bool valid() const { return fd_ >= 0 && port_ != 0; }
    uint16_t port() const { return port_; }

    void close_fd() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
};

DeviceInfo loopback_camera(int port) {
    DeviceInfo device;
    device.device_id = make_network_device_id("127.0.0.1", port);
    device.name = "Loopback";
    device.kind = DeviceKind::NETWORK;
    device.network.ip = "127.0.0.1";
    device.network.port = port;
    device.network.protocol = "rtsp";
    return device;
}

} // namespace

TEST(SocketUtilsTest, ValidatesIpv4Addresses) {
    EXPECT_TRUE(utils::is_valid_ipv4("192.168.1.10"));
    EXPECT_TRUE(utils::is_valid_ipv4("127.0.0.1"));
    EXPECT_FALSE(utils::is_valid_ipv4(""));
    EXPECT_FALSE(utils::is_valid_ipv4("256.1.1.1"));
    EXPECT_FALSE(utils::is_valid_ipv4("192.168.1"));
    EXPECT_FALSE(utils::is_valid_ipv4("camera.local"));
    EXPECT_FALSE(utils::is_valid_ipv4("::1"));
}

TEST(SocketUtilsTest, RejectsLeadingZeroOctets) {
    EXPECT_FALSE(utils::is_valid_ipv4("192.168.001.010"));
    EXPECT_FALSE(utils::is_valid_ipv4("010.0.0.1"));
    EXPECT_FALSE(utils::is_valid_ipv4("10.0.0.00"));
    EXPECT_TRUE(utils::is_valid_ipv4("10.0.0.0"));
    EXPECT_TRUE(utils::is_valid_ipv4("0.0.0.0"));
}

TEST(SocketUtilsTest, ConnectProbeReachesListener) {
    LoopbackListener listener;
    ASSERT_TRUE(listener.valid());

    utils::StopSignal stop;
    std::string detail;
    EXPECT_EQ(utils::tcp_connect_probe("127.0.0.1", listener.port(), 1s, stop, &detail),
              utils::ConnectOutcome::CONNECTED);
}

TEST(SocketUtilsTest, ConnectProbeRejectsBadAddress) {
    utils::StopSignal stop;
    std::string detail;
    EXPECT_EQ(utils::tcp_connect_probe("not-an-ip", 554, 1s, stop, &detail), utils::ConnectOutcome::FAILED);
    EXPECT_FALSE(detail.empty());
}

TEST(NetworkProberTest, ReportsReachableAndClosedPorts) {
    LoopbackListener listener;
    ASSERT_TRUE(listener.valid());
    monitor::NetworkProber prober;
    utils::StopSignal stop;

    auto result = prober.probe(loopback_camera(listener.port()), 1s, stop);
    EXPECT_TRUE(result.ok);
    EXPECT_FALSE(result.timed_out);

    const int closed_port = listener.port();
    listener.close_fd();
    result = prober.probe(loopback_camera(closed_port), 1s, stop);
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.detail.empty());
}

TEST(NetworkProberTest, RejectsLocalDevices) {
    DeviceInfo device;
    device.device_id = "video:/dev/video0";
    device.kind = DeviceKind::LOCAL;
    device.local.system_path = "/dev/video0";

    monitor::NetworkProber prober;
    utils::StopSignal stop;
    EXPECT_FALSE(prober.probe(device, 1s, stop).ok);
}

TEST(PortScannerTest, FindsOpenLoopbackPort) {
    LoopbackListener listener;
    ASSERT_TRUE(listener.valid());

    capturehub::config::ScannerSettings settings;
    settings.scan_ranges = {"127.0.0.1"};
    settings.ports = {listener.port()};
    settings.username = "viewer";
    scanners::PortScanner scanner(settings);

    utils::StopSignal stop;
    const auto results = scanner.scan(2s, stop);
    ASSERT_EQ(results.size(), 1u);
    const DiscoveryResult& found = results.front();
    EXPECT_EQ(found.source_protocol, "port_scan");
    EXPECT_EQ(found.ip, "127.0.0.1");
    EXPECT_EQ(found.port, listener.port());
    EXPECT_EQ(found.protocol, "rtsp");
    EXPECT_EQ(found.username, "viewer");
    EXPECT_EQ(derive_device_id(found), make_network_device_id("127.0.0.1", listener.port()));
}

TEST(PortScannerTest, StoppedScanReturnsNothing) {
    LoopbackListener listener;
    ASSERT_TRUE(listener.valid());

    capturehub::config::ScannerSettings settings;
    settings.scan_ranges = {"127.0.0.1"};
    settings.ports = {listener.port()};
    scanners::PortScanner scanner(settings);

    utils::StopSignal stop;
    stop.request_stop();
    EXPECT_TRUE(scanner.scan(2s, stop).empty());
}
