#include "discovery_text.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace capturehub {
namespace devices {
namespace scanners {

std::string to_lower_copy(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

std::string trim_copy(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

int default_port_for_scheme(const std::string& scheme) {
    const std::string lower = to_lower_copy(scheme);
    if (lower == "http") return 80;
    if (lower == "https") return 443;
    if (lower == "rtsp") return 554;
    if (lower == "rtmp") return 1935;
    return 0;
}

bool parse_url(const std::string& url, ParsedUrl& out) {
    const std::string trimmed = trim_copy(url);
    const size_t scheme_end = trimmed.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return false;
    }
    ParsedUrl parsed;
    parsed.scheme = to_lower_copy(trimmed.substr(0, scheme_end));

    const size_t authority_start = scheme_end + 3;
    size_t path_start = trimmed.find('/', authority_start);
    std::string authority = trimmed.substr(authority_start,
                                           path_start == std::string::npos ? std::string::npos : path_start - authority_start);
    parsed.path = path_start == std::string::npos ? "/" : trimmed.substr(path_start);

    const size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty() || authority.front() == '[') {
        return false;
    }
    const size_t colon = authority.find(':');
    if (colon != std::string::npos) {
        const std::string port_text = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (port_text.empty() || !std::all_of(port_text.begin(), port_text.end(), ::isdigit) ||
            port_text.size() > 5) {
            return false;
        }
        parsed.port = std::atoi(port_text.c_str());
        if (parsed.port <= 0 || parsed.port > 65535) {
            return false;
        }
    }
    if (authority.empty()) {
        return false;
    }
    parsed.host = authority;
    out = std::move(parsed);
    return true;
}

std::string percent_decode(const std::string& text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size() &&
            std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            decoded.push_back(static_cast<char>(std::strtol(text.substr(i + 1, 2).c_str(), nullptr, 16)));
            i += 2;
        } else if (text[i] == '+') {
            decoded.push_back(' ');
        } else {
            decoded.push_back(text[i]);
        }
    }
    return decoded;
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

} // namespace scanners
} // namespace devices
} // namespace capturehub
