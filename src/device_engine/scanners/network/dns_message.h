#ifndef CAPTUREHUB_DNS_MESSAGE_H
#define CAPTUREHUB_DNS_MESSAGE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace capturehub {
namespace devices {
namespace scanners {

// Minimal DNS wire format support for DNS-SD over multicast.

inline constexpr uint16_t kDnsTypeA = 1;
inline constexpr uint16_t kDnsTypePtr = 12;
inline constexpr uint16_t kDnsTypeTxt = 16;
inline constexpr uint16_t kDnsTypeSrv = 33;
inline constexpr uint16_t kDnsClassIn = 1;
inline constexpr uint16_t kDnsClassUnicastResponse = 0x8000;

struct DnsRecord {
    std::string name;
    uint16_t type = 0;
    uint16_t rclass = 0;
    uint32_t ttl = 0;
    std::string target;             ///< PTR target or SRV target host
    uint16_t port = 0;              ///< SRV only
    std::string address;            ///< A only, dotted quad
    std::vector<std::string> txt;   ///< TXT only, one entry per character-string
};

/**
 * @brief Builds a query with one PTR question per service name.
 * @param unicast_response Sets the QU bit so responders reply directly to the sender.
 */
std::vector<uint8_t> build_ptr_query(const std::vector<std::string>& service_names, bool unicast_response);

/**
 * @brief Parses every answer, authority and additional record of a response.
 * @return false if the header is truncated or the packet is a query.
 *         Records decoded before a malformed one are kept.
 */
bool parse_dns_response(const uint8_t* data, size_t length, std::vector<DnsRecord>& records);

} // namespace scanners
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_DNS_MESSAGE_H
