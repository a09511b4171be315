#include "device_prober.h"

#include <filesystem>

#include <alsa/asoundlib.h>

namespace capturehub {
namespace devices {
namespace monitor {

std::string LocalProber::alsa_control_name(const std::string& system_path) {
    if (system_path.compare(0, 3, "hw:") != 0) {
        return {};
    }
    const size_t comma = system_path.find(',');
    const std::string card = system_path.substr(3, comma == std::string::npos ? std::string::npos : comma - 3);
    return card.empty() ? std::string() : "hw:" + card;
}

ProbeResult LocalProber::probe(const DeviceInfo& device,
                               std::chrono::milliseconds /*timeout*/,
                               const utils::StopSignal& /*stop*/) {
    ProbeResult result;
    if (device.kind != DeviceKind::LOCAL) {
        result.detail = "not a local device";
        return result;
    }

    const std::string control = alsa_control_name(device.local.system_path);
    if (device.local.driver == "alsa" && !control.empty()) {
        snd_ctl_t* handle = nullptr;
        const int err = snd_ctl_open(&handle, control.c_str(), SND_CTL_NONBLOCK);
        if (err < 0) {
            result.detail = std::string("snd_ctl_open failed: ") + snd_strerror(err);
            return result;
        }
        snd_ctl_close(handle);
        result.ok = true;
        result.detail = "control handle opened";
        return result;
    }

    std::error_code ec;
    result.ok = std::filesystem::exists(device.local.system_path, ec);
    result.detail = result.ok ? "present" : (ec ? ec.message() : "missing");
    return result;
}

} // namespace monitor
} // namespace devices
} // namespace capturehub
