#include "v4l2_scanner.h"

#include "../../utils/cpp_logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#if defined(__linux__)
#include <fcntl.h>
#include <linux/videodev2.h>
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace capturehub {
namespace devices {
namespace scanners {

namespace fs = std::filesystem;

namespace {

const char* kLogPrefix = "[Scanner:v4l2]";

int node_index(const std::string& name) {
    return std::atoi(name.c_str() + 5);
}

#if defined(__linux__)
int ioctl_retry(int fd, unsigned long request, void* arg) {
    int status = 0;
    do {
        status = ioctl(fd, request, arg);
    } while (status != 0 && errno == EINTR);
    return status;
}

// Fills `result` from the node at `path`; false if it cannot capture video.
bool query_node(const std::string& path, DiscoveryResult& result) {
    const int fd = open(path.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        LOG_CPP_DEBUG("%s Cannot open %s: %s", kLogPrefix, path.c_str(), std::strerror(errno));
        return false;
    }

    v4l2_capability cap {};
    if (ioctl_retry(fd, VIDIOC_QUERYCAP, &cap) != 0) {
        LOG_CPP_DEBUG("%s VIDIOC_QUERYCAP failed on %s: %s", kLogPrefix, path.c_str(), std::strerror(errno));
        close(fd);
        return false;
    }
    const uint32_t caps = (cap.capabilities & V4L2_CAP_DEVICE_CAPS) ? cap.device_caps : cap.capabilities;
    if ((caps & V4L2_CAP_VIDEO_CAPTURE) == 0) {
        close(fd);
        return false;
    }

    result.name = reinterpret_cast<const char*>(cap.card);
    if (result.name.empty()) {
        result.name = path;
    }
    if (caps & V4L2_CAP_STREAMING) {
        result.capabilities.insert("streaming");
    }

    for (uint32_t index = 0;; ++index) {
        v4l2_fmtdesc fmt {};
        fmt.index = index;
        fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        if (ioctl_retry(fd, VIDIOC_ENUM_FMT, &fmt) != 0) {
            break;
        }
        result.capabilities.insert("format:" + V4l2Scanner::fourcc_to_string(fmt.pixelformat));
    }
    close(fd);
    return true;
}
#endif

} // namespace

V4l2Scanner::V4l2Scanner(std::string device_dir) : device_dir_(std::move(device_dir)) {}

bool V4l2Scanner::is_video_node_name(const std::string& name) {
    if (name.size() <= 5 || name.compare(0, 5, "video") != 0) {
        return false;
    }
    return std::all_of(name.begin() + 5, name.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string V4l2Scanner::fourcc_to_string(uint32_t fourcc) {
    std::string text(4, ' ');
    for (int i = 0; i < 4; ++i) {
        text[i] = static_cast<char>((fourcc >> (8 * i)) & 0xFFu);
    }
    const bool printable = std::all_of(text.begin(), text.end(), [](unsigned char c) { return c >= 32 && c <= 126; });
    if (printable) {
        while (!text.empty() && text.back() == ' ') {
            text.pop_back();
        }
        if (!text.empty()) {
            return text;
        }
    }
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%08X", fourcc);
    return buffer;
}

std::vector<DiscoveryResult> V4l2Scanner::scan(std::chrono::milliseconds /*timeout*/, const utils::StopSignal& stop) {
    std::vector<DiscoveryResult> results;

    std::vector<std::string> nodes;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(device_dir_, ec)) {
        const std::string name = entry.path().filename().string();
        if (is_video_node_name(name)) {
            nodes.push_back(name);
        }
    }
    if (ec) {
        LOG_CPP_WARNING("%s Failed to list %s: %s", kLogPrefix, device_dir_.c_str(), ec.message().c_str());
        return results;
    }
    std::sort(nodes.begin(), nodes.end(), [](const std::string& a, const std::string& b) {
        return node_index(a) < node_index(b);
    });

#if defined(__linux__)
    for (const auto& node : nodes) {
        if (stop.stop_requested()) {
            LOG_CPP_INFO("%s Stop requested during enumeration; breaking.", kLogPrefix);
            break;
        }
        const std::string path = (fs::path(device_dir_) / node).string();
        DiscoveryResult result;
        if (!query_node(path, result)) {
            continue;
        }
        result.source_protocol = kProtocol;
        result.raw_identity = path;
        result.kind = DeviceKind::LOCAL;
        result.type = DeviceType::VIDEO;
        result.system_path = path;
        result.driver = kProtocol;
        result.capabilities.insert(kProtocol);
        result.streams[make_local_device_id(DeviceType::VIDEO, path)] = path;
        LOG_CPP_DEBUG("%s Discovered %s -> %s", kLogPrefix, path.c_str(), result.name.c_str());
        results.push_back(std::move(result));
    }
#else
    (void)stop;
#endif

    LOG_CPP_INFO("%s %zu capture nodes out of %zu video nodes", kLogPrefix, results.size(), nodes.size());
    return results;
}

} // namespace scanners
} // namespace devices
} // namespace capturehub
