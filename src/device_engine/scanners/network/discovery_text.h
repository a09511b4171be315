#ifndef CAPTUREHUB_DISCOVERY_TEXT_H
#define CAPTUREHUB_DISCOVERY_TEXT_H

#include <string>
#include <vector>

namespace capturehub {
namespace devices {
namespace scanners {

// Text helpers for the discovery protocols that speak HTTP-style headers or carry URLs.

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;       ///< 0 when the URL carries no explicit port.
    std::string path;   ///< Includes the leading '/', "/" when absent.
};

/** @brief Parses `scheme://host[:port][/path]`. IPv6 literals are not supported. */
bool parse_url(const std::string& url, ParsedUrl& out);

/** @brief Port implied by the scheme (http 80, https 443, rtsp 554, rtmp 1935), else 0. */
int default_port_for_scheme(const std::string& scheme);

std::string to_lower_copy(const std::string& text);
std::string trim_copy(const std::string& text);
std::string percent_decode(const std::string& text);
std::vector<std::string> split_whitespace(const std::string& text);

} // namespace scanners
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_DISCOVERY_TEXT_H
