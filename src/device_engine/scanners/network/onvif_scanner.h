/**
 * @file onvif_scanner.h
 * @brief ONVIF camera discovery over WS-Discovery.
 * @details A Probe for `dn:NetworkVideoTransmitter` is multicast to 239.255.255.250:3702 and
 *          every ProbeMatch received before the timeout becomes a discovery result addressed
 *          by the first usable XAddrs URL. Replies are parsed with libxml2; a discovery proxy
 *          may answer with several ProbeMatch elements in one envelope.
 */
#ifndef CAPTUREHUB_ONVIF_SCANNER_H
#define CAPTUREHUB_ONVIF_SCANNER_H

#include "../protocol_scanner.h"
#include "../../configuration/device_engine_settings.h"

#include <vector>

namespace capturehub {
namespace devices {
namespace scanners {

class OnvifScanner : public ProtocolScanner {
public:
    static constexpr const char* kProtocol = "onvif";
    static constexpr const char* kMulticastGroup = "239.255.255.250";
    static constexpr int kPort = 3702;
    static constexpr const char* kDefaultMediaPath = "/onvif-media/media.amp";

    explicit OnvifScanner(config::ScannerSettings settings);

    std::string protocol() const override { return kProtocol; }

    std::vector<DiscoveryResult> scan(std::chrono::milliseconds timeout,
                                      const utils::StopSignal& stop) override;

    /** @brief SOAP Probe envelope carrying `message_id` (a `uuid:` URN). */
    static std::string build_probe(const std::string& message_id);

    /**
     * @brief Converts a ProbeMatches envelope into one result per ProbeMatch.
     * @details Each match is addressed by its own first usable XAddrs URL, falling back to
     *          `sender_ip` and port 80. Malformed documents and other WS-Discovery messages
     *          yield an empty vector.
     */
    static std::vector<DiscoveryResult> parse_probe_matches(const std::string& xml, const std::string& sender_ip);

private:
    config::ScannerSettings settings_;
};

} // namespace scanners
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_ONVIF_SCANNER_H
