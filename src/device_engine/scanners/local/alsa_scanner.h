#ifndef CAPTUREHUB_ALSA_SCANNER_H
#define CAPTUREHUB_ALSA_SCANNER_H

#include "../protocol_scanner.h"

#include <string>

namespace capturehub {
namespace devices {
namespace scanners {

/**
 * @class AlsaScanner
 * @brief Enumerates ALSA hardware capture PCMs through the device name hints.
 * @details Only `hw:` hints whose IOID is absent or Input are kept. Each becomes an audio
 *          device addressed as `hw:<card>,<device>`.
 */
class AlsaScanner : public ProtocolScanner {
public:
    static constexpr const char* kProtocol = "alsa";

    std::string protocol() const override { return kProtocol; }

    std::vector<DiscoveryResult> scan(std::chrono::milliseconds timeout,
                                      const utils::StopSignal& stop) override;

    /**
     * @brief Splits a hint name like `hw:CARD=PCH,DEV=0` into its card and device tokens.
     * @return false if the name is not a hardware PCM.
     */
    static bool parse_hw_name(const std::string& name, std::string& card_token, std::string& device_token);

    /** @brief True if an IOID hint value allows capture. */
    static bool is_capture_ioid(const std::string& ioid);

    /** @brief Collapses the multi-line DESC hint into one line. */
    static std::string clean_description(const std::string& description);
};

} // namespace scanners
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_ALSA_SCANNER_H
