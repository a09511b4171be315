/**
 * @file socket_utils.h
 * @brief Bounded POSIX socket helpers shared by network scanners and probes.
 * @details Every helper enforces an explicit timeout and polls in short slices so a
 *          requested stop is honoured within roughly 100 ms.
 */
#ifndef CAPTUREHUB_SOCKET_UTILS_H
#define CAPTUREHUB_SOCKET_UTILS_H

#include "stop_signal.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace capturehub {
namespace devices {
namespace utils {

inline constexpr std::chrono::milliseconds kPollSlice{100};

enum class ConnectOutcome {
    CONNECTED,
    FAILED,     ///< Refused, unreachable or any other socket error.
    TIMED_OUT,
    CANCELLED
};

const char* to_string(ConnectOutcome outcome);

/** @brief Canonical dotted-quad IPv4 check: octets 0..255, no leading zeros, no surrounding garbage. */
bool is_valid_ipv4(const std::string& ip);

/**
 * @brief Attempts a non-blocking TCP connect and closes the socket immediately.
 * @param error_detail Receives a short reason on failure.
 */
ConnectOutcome tcp_connect_probe(const std::string& ip, uint16_t port,
                                 std::chrono::milliseconds timeout,
                                 const StopSignal& stop,
                                 std::string* error_detail = nullptr);

struct UdpDatagram {
    std::string sender_ip;
    std::string data;
};

/**
 * @brief Sends one datagram to a multicast group and gathers replies until the timeout.
 * @details Replies are collected on the same ephemeral socket, so responders that answer
 *          unicast to the query's source (SSDP, WS-Discovery, legacy-unicast mDNS) are seen.
 * @return Collected replies; empty on any socket error (already logged with `log_prefix`).
 */
std::vector<UdpDatagram> multicast_query(const std::string& group, uint16_t port,
                                         const std::string& request,
                                         std::chrono::milliseconds timeout,
                                         const StopSignal& stop,
                                         const std::string& log_prefix,
                                         int ttl = 2);

} // namespace utils
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_SOCKET_UTILS_H
