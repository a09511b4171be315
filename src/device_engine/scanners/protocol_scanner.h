/**
 * @file protocol_scanner.h
 * @brief Defines the interface implemented by every discovery protocol.
 */
#ifndef CAPTUREHUB_PROTOCOL_SCANNER_H
#define CAPTUREHUB_PROTOCOL_SCANNER_H

#include "../device_types.h"
#include "../utils/stop_signal.h"

#include <chrono>
#include <string>
#include <vector>

namespace capturehub {
namespace devices {
namespace scanners {

/**
 * @class ProtocolScanner
 * @brief One discovery method (ONVIF, UPnP, mDNS, local enumeration, ...).
 * @details `scan()` performs a complete handshake bounded by `timeout`, returns promptly once
 *          `stop` is requested, and translates native replies into `DiscoveryResult`s.
 *          Failures are logged and yield an empty result; they are never thrown.
 */
class ProtocolScanner {
public:
    virtual ~ProtocolScanner() = default;

    /** @brief Protocol name used in `discovery_methods`. */
    virtual std::string protocol() const = 0;

    virtual std::vector<DiscoveryResult> scan(std::chrono::milliseconds timeout,
                                              const utils::StopSignal& stop) = 0;
};

} // namespace scanners
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_PROTOCOL_SCANNER_H
