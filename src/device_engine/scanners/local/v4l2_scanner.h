#ifndef CAPTUREHUB_V4L2_SCANNER_H
#define CAPTUREHUB_V4L2_SCANNER_H

#include "../protocol_scanner.h"

#include <cstdint>

namespace capturehub {
namespace devices {
namespace scanners {

/**
 * @class V4l2Scanner
 * @brief Enumerates `/dev/video*` nodes that can capture video.
 * @details Metadata-only nodes (no V4L2_CAP_VIDEO_CAPTURE in the node's capabilities) are
 *          skipped. Each pixel format the node offers is reported as a `format:<FOURCC>`
 *          capability.
 */
class V4l2Scanner : public ProtocolScanner {
public:
    static constexpr const char* kProtocol = "v4l2";

    /** @param device_dir Directory holding the video nodes; tests point it elsewhere. */
    explicit V4l2Scanner(std::string device_dir = "/dev");

    std::string protocol() const override { return kProtocol; }

    std::vector<DiscoveryResult> scan(std::chrono::milliseconds timeout,
                                      const utils::StopSignal& stop) override;

    /** @brief "video12" -> true, "video" or "videox" -> false */
    static bool is_video_node_name(const std::string& name);

    static std::string fourcc_to_string(uint32_t fourcc);

private:
    std::string device_dir_;
};

} // namespace scanners
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_V4L2_SCANNER_H
