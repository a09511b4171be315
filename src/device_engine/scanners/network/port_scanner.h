#ifndef CAPTUREHUB_PORT_SCANNER_H
#define CAPTUREHUB_PORT_SCANNER_H

#include "../protocol_scanner.h"
#include "../../configuration/device_engine_settings.h"

namespace capturehub {
namespace devices {
namespace scanners {

/**
 * @class PortScanner
 * @brief TCP connect sweep over configured address ranges for streaming ports.
 * @details Finds cameras that advertise nothing. Every open (host, port) pair becomes an RTSP
 *          candidate; ranges are limited to /24 so a misconfiguration cannot flood a network.
 */
class PortScanner : public ProtocolScanner {
public:
    static constexpr const char* kProtocol = "port_scan";
    static constexpr int kMinPrefixLength = 24;
    static constexpr size_t kWorkerCount = 16;

    explicit PortScanner(config::ScannerSettings settings);

    std::string protocol() const override { return kProtocol; }

    std::vector<DiscoveryResult> scan(std::chrono::milliseconds timeout,
                                      const utils::StopSignal& stop) override;

    /**
     * @brief Expands "a.b.c.d" or "a.b.c.d/NN" (NN >= 24) into host addresses.
     * @details Network and broadcast addresses are skipped for prefixes shorter than /31.
     * @return false if the range is malformed or too wide.
     */
    static bool expand_range(const std::string& range, std::vector<std::string>& hosts);

private:
    config::ScannerSettings settings_;
};

} // namespace scanners
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_PORT_SCANNER_H
