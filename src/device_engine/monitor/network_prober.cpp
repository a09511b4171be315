#include "device_prober.h"

#include "../utils/socket_utils.h"

namespace capturehub {
namespace devices {
namespace monitor {

ProbeResult NetworkProber::probe(const DeviceInfo& device,
                                 std::chrono::milliseconds timeout,
                                 const utils::StopSignal& stop) {
    ProbeResult result;
    if (device.kind != DeviceKind::NETWORK) {
        result.detail = "not a network device";
        return result;
    }
    std::string error;
    const auto outcome = utils::tcp_connect_probe(device.network.ip, static_cast<uint16_t>(device.network.port),
                                                  timeout, stop, &error);
    result.ok = outcome == utils::ConnectOutcome::CONNECTED;
    result.timed_out = outcome == utils::ConnectOutcome::TIMED_OUT;
    result.detail = error.empty() ? utils::to_string(outcome) : error;
    return result;
}

} // namespace monitor
} // namespace devices
} // namespace capturehub
