#ifndef CAPTUREHUB_UPNP_SCANNER_H
#define CAPTUREHUB_UPNP_SCANNER_H

#include "../protocol_scanner.h"
#include "../../configuration/device_engine_settings.h"

#include <map>
#include <optional>

namespace capturehub {
namespace devices {
namespace scanners {

/**
 * @class UpnpScanner
 * @brief SSDP M-SEARCH discovery of UPnP media endpoints.
 * @details Only responders whose headers mention a media keyword (camera, video, audio,
 *          media, sound) are reported; routers and printers answering `ssdp:all` are not.
 */
class UpnpScanner : public ProtocolScanner {
public:
    static constexpr const char* kProtocol = "upnp";
    static constexpr const char* kMulticastGroup = "239.255.255.250";
    static constexpr int kPort = 1900;

    explicit UpnpScanner(config::ScannerSettings settings);

    std::string protocol() const override { return kProtocol; }

    std::vector<DiscoveryResult> scan(std::chrono::milliseconds timeout,
                                      const utils::StopSignal& stop) override;

    static std::string build_msearch(const std::string& search_target, int mx_seconds);

    /** @brief Header names are lower-cased; returns nullopt unless the status line is 200 OK. */
    static std::optional<std::map<std::string, std::string>> parse_ssdp_headers(const std::string& response);

    static std::optional<DiscoveryResult> parse_response(const std::string& response, const std::string& sender_ip);

private:
    config::ScannerSettings settings_;
};

} // namespace scanners
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_UPNP_SCANNER_H
