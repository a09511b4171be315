#ifndef CAPTUREHUB_MDNS_SCANNER_H
#define CAPTUREHUB_MDNS_SCANNER_H

#include "../protocol_scanner.h"
#include "../../configuration/device_engine_settings.h"

#include <cstdint>

namespace capturehub {
namespace devices {
namespace scanners {

/**
 * @class MdnsScanner
 * @brief DNS-SD browsing of RTSP and HTTP media services over multicast DNS.
 * @details Sends one PTR query per service type to 224.0.0.251:5353 with the unicast-response
 *          bit set and resolves each SRV record (plus its A record when present) into a result.
 */
class MdnsScanner : public ProtocolScanner {
public:
    static constexpr const char* kProtocol = "mdns";
    static constexpr const char* kMulticastGroup = "224.0.0.251";
    static constexpr int kPort = 5353;

    explicit MdnsScanner(config::ScannerSettings settings);

    std::string protocol() const override { return kProtocol; }

    std::vector<DiscoveryResult> scan(std::chrono::milliseconds timeout,
                                      const utils::StopSignal& stop) override;

    static const std::vector<std::string>& service_types();

    /** @brief Turns one mDNS response into results; the sender address backs missing A records. */
    static std::vector<DiscoveryResult> parse_response(const std::vector<uint8_t>& packet,
                                                       const std::string& sender_ip);

private:
    config::ScannerSettings settings_;
};

} // namespace scanners
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_MDNS_SCANNER_H
