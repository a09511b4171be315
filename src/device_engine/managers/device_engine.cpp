#include "device_engine.h"

#include "../utils/cpp_logger.h"

namespace capturehub {
namespace devices {

namespace {
constexpr std::chrono::milliseconds kShutdownFlushTimeout{2000};
}

DeviceEngine::DeviceEngine(config::EngineSettings settings, const scanners::ScannerFactory& factory)
    : settings_(std::move(settings)), bus_(std::make_shared<bus::MessageBus>()) {
    logging::LogLevel level;
    if (logging::parse_log_level(settings_.system.log_level, level)) {
        logging::set_cpp_log_level(level);
    } else {
        LOG_CPP_WARNING("[DeviceEngine] Unknown log level '%s'; keeping the current level.",
                        settings_.system.log_level.c_str());
    }
    local_ = std::make_unique<LocalDeviceManager>(settings_.local_devices, settings_.system, bus_, factory);
    network_ = std::make_unique<NetworkDeviceManager>(settings_.network_devices, settings_.system, bus_, factory);
    LOG_CPP_INFO("[DeviceEngine] Created (storage=%s).", settings_.system.storage_path.c_str());
}

DeviceEngine::~DeviceEngine() {
    stop();
    if (!bus_->flush(kShutdownFlushTimeout)) {
        LOG_CPP_WARNING("[DeviceEngine] Bus did not drain within %lld ms.",
                        static_cast<long long>(kShutdownFlushTimeout.count()));
    }
    network_.reset();
    local_.reset();
    bus_->shutdown();
}

std::unique_ptr<DeviceEngine> DeviceEngine::from_config(const std::string& config_path) {
    return std::make_unique<DeviceEngine>(config::load_engine_settings(config_path));
}

void DeviceEngine::start() {
    local_->start();
    network_->start();
}

void DeviceEngine::stop() {
    network_->stop();
    local_->stop();
}

bool DeviceEngine::is_running() const {
    return local_->is_running() || network_->is_running();
}

} // namespace devices
} // namespace capturehub
