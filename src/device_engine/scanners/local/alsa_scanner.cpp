#include "alsa_scanner.h"

#include "../../utils/cpp_logger.h"
#include "../network/discovery_text.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>

#include <alsa/asoundlib.h>

namespace capturehub {
namespace devices {
namespace scanners {

namespace {

const char* kLogPrefix = "[Scanner:alsa]";

std::optional<int> parse_numeric_token(const std::string& token) {
    if (token.empty() || !std::all_of(token.begin(), token.end(), ::isdigit)) {
        return std::nullopt;
    }
    return std::atoi(token.c_str());
}

std::optional<int> resolve_card_index(const std::string& card_token) {
    if (card_token.empty()) {
        return std::nullopt;
    }
    if (auto numeric = parse_numeric_token(card_token)) {
        return numeric;
    }
    int resolved = snd_card_get_index(card_token.c_str());
    if (resolved >= 0) {
        return resolved;
    }
    return std::nullopt;
}

std::string take_hint(void* hint, const char* key) {
    char* raw = snd_device_name_get_hint(hint, key);
    if (!raw) {
        return {};
    }
    std::string value = raw;
    std::free(raw);
    return value;
}

} // namespace

bool AlsaScanner::parse_hw_name(const std::string& name, std::string& card_token, std::string& device_token) {
    if (name.compare(0, 3, "hw:") != 0) {
        return false;
    }
    card_token.clear();
    device_token = "0";
    const std::string body = name.substr(3);
    size_t start = 0;
    int position = 0;
    while (start <= body.size()) {
        size_t comma = body.find(',', start);
        if (comma == std::string::npos) {
            comma = body.size();
        }
        const std::string part = trim_copy(body.substr(start, comma - start));
        const size_t eq = part.find('=');
        const std::string key = eq == std::string::npos ? std::string() : to_lower_copy(part.substr(0, eq));
        const std::string value = eq == std::string::npos ? part : part.substr(eq + 1);
        if (key == "card" || (key.empty() && position == 0)) {
            card_token = value;
        } else if (key == "dev" || (key.empty() && position == 1)) {
            device_token = value;
        }
        ++position;
        start = comma + 1;
    }
    return !card_token.empty();
}

bool AlsaScanner::is_capture_ioid(const std::string& ioid) {
    const std::string lower = to_lower_copy(trim_copy(ioid));
    return lower.empty() || lower == "input" || lower == "capture";
}

std::string AlsaScanner::clean_description(const std::string& description) {
    std::string cleaned = description;
    std::replace(cleaned.begin(), cleaned.end(), '\n', ' ');
    std::replace(cleaned.begin(), cleaned.end(), '\r', ' ');
    size_t double_space;
    while ((double_space = cleaned.find("  ")) != std::string::npos) {
        cleaned.erase(double_space, 1);
    }
    return trim_copy(cleaned);
}

std::vector<DiscoveryResult> AlsaScanner::scan(std::chrono::milliseconds /*timeout*/, const utils::StopSignal& stop) {
    std::vector<DiscoveryResult> results;
    void** hints = nullptr;
    int err = snd_device_name_hint(-1, "pcm", &hints);
    if (err < 0) {
        LOG_CPP_WARNING("%s snd_device_name_hint failed: %s", kLogPrefix, snd_strerror(err));
        return results;
    }
    if (!hints) {
        LOG_CPP_DEBUG("%s No ALSA device hints returned.", kLogPrefix);
        return results;
    }

    size_t processed_hints = 0;
    for (void** hint = hints; *hint != nullptr; ++hint) {
        if (stop.stop_requested()) {
            LOG_CPP_INFO("%s Stop requested during hint scan; breaking.", kLogPrefix);
            break;
        }
        const std::string device_name = trim_copy(take_hint(*hint, "NAME"));
        if (device_name.empty()) {
            continue;
        }
        ++processed_hints;

        std::string card_token;
        std::string device_token;
        if (!parse_hw_name(device_name, card_token, device_token)) {
            continue;
        }
        if (!is_capture_ioid(take_hint(*hint, "IOID"))) {
            continue;
        }
        const auto card_index = resolve_card_index(card_token);
        const auto device_index = parse_numeric_token(device_token);
        if (!card_index || !device_index) {
            LOG_CPP_DEBUG("%s Unresolvable hardware name %s", kLogPrefix, device_name.c_str());
            continue;
        }

        DiscoveryResult result;
        result.source_protocol = kProtocol;
        result.raw_identity = device_name;
        result.kind = DeviceKind::LOCAL;
        result.type = DeviceType::AUDIO;
        result.system_path = "hw:" + std::to_string(*card_index) + "," + std::to_string(*device_index);
        result.driver = kProtocol;
        result.name = clean_description(take_hint(*hint, "DESC"));
        if (result.name.empty()) {
            result.name = device_name;
        }
        result.capabilities = {kProtocol, "capture"};
        result.streams[make_local_device_id(DeviceType::AUDIO, result.system_path)] = result.system_path;
        LOG_CPP_DEBUG("%s Discovered %s -> %s", kLogPrefix, result.system_path.c_str(), result.name.c_str());
        results.push_back(std::move(result));
    }
    snd_device_name_free_hint(hints);

    LOG_CPP_INFO("%s Enumeration pass complete: hints=%zu capture=%zu", kLogPrefix, processed_hints, results.size());
    return results;
}

} // namespace scanners
} // namespace devices
} // namespace capturehub
