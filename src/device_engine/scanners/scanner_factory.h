#ifndef CAPTUREHUB_SCANNER_FACTORY_H
#define CAPTUREHUB_SCANNER_FACTORY_H

#include "protocol_scanner.h"
#include "../configuration/device_engine_settings.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace capturehub {
namespace devices {
namespace scanners {

using ScannerCreator = std::function<std::shared_ptr<ProtocolScanner>(const config::ScannerSettings&)>;

/**
 * @class ScannerFactory
 * @brief Maps protocol names to scanner constructors.
 * @details The discovery engine instantiates only the protocols listed in its
 *          `discovery_methods`; names without a registered creator are skipped with a warning.
 */
class ScannerFactory {
public:
    /** @brief Registers (or replaces) the creator for `protocol`. */
    void register_scanner(const std::string& protocol, ScannerCreator creator);

    bool has(const std::string& protocol) const;

    /** @return nullptr if `protocol` is unknown. */
    std::shared_ptr<ProtocolScanner> create(const std::string& protocol,
                                            const config::ScannerSettings& settings) const;

    std::vector<std::string> protocols() const;

    /** @brief onvif, upnp, mdns, port_scan, v4l2 and alsa. */
    static ScannerFactory with_builtin_scanners();

private:
    std::map<std::string, ScannerCreator> creators_;
};

} // namespace scanners
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_SCANNER_FACTORY_H
