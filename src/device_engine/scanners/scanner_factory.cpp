#include "scanner_factory.h"

#include "local/alsa_scanner.h"
#include "local/v4l2_scanner.h"
#include "network/mdns_scanner.h"
#include "network/onvif_scanner.h"
#include "network/port_scanner.h"
#include "network/upnp_scanner.h"

namespace capturehub {
namespace devices {
namespace scanners {

void ScannerFactory::register_scanner(const std::string& protocol, ScannerCreator creator) {
    creators_[protocol] = std::move(creator);
}

bool ScannerFactory::has(const std::string& protocol) const {
    return creators_.count(protocol) != 0;
}

std::shared_ptr<ProtocolScanner> ScannerFactory::create(const std::string& protocol,
                                                        const config::ScannerSettings& settings) const {
    auto it = creators_.find(protocol);
    if (it == creators_.end()) {
        return nullptr;
    }
    return it->second(settings);
}

std::vector<std::string> ScannerFactory::protocols() const {
    std::vector<std::string> names;
    names.reserve(creators_.size());
    for (const auto& entry : creators_) {
        names.push_back(entry.first);
    }
    return names;
}

ScannerFactory ScannerFactory::with_builtin_scanners() {
    ScannerFactory factory;
    factory.register_scanner(OnvifScanner::kProtocol, [](const config::ScannerSettings& settings) {
        return std::make_shared<OnvifScanner>(settings);
    });
    factory.register_scanner(UpnpScanner::kProtocol, [](const config::ScannerSettings& settings) {
        return std::make_shared<UpnpScanner>(settings);
    });
    factory.register_scanner(MdnsScanner::kProtocol, [](const config::ScannerSettings& settings) {
        return std::make_shared<MdnsScanner>(settings);
    });
    factory.register_scanner(PortScanner::kProtocol, [](const config::ScannerSettings& settings) {
        return std::make_shared<PortScanner>(settings);
    });
    factory.register_scanner(V4l2Scanner::kProtocol, [](const config::ScannerSettings&) {
        return std::make_shared<V4l2Scanner>();
    });
    factory.register_scanner(AlsaScanner::kProtocol, [](const config::ScannerSettings&) {
        return std::make_shared<AlsaScanner>();
    });
    return factory;
}

} // namespace scanners
} // namespace devices
} // namespace capturehub
