#include "topic_matcher.h"

namespace capturehub {
namespace devices {
namespace bus {

std::vector<std::string> split_topic(const std::string& topic) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        const size_t slash = topic.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(topic.substr(start));
            break;
        }
        segments.push_back(topic.substr(start, slash - start));
        start = slash + 1;
    }
    return segments;
}

bool is_valid_pattern(const std::string& pattern) {
    if (pattern.empty()) {
        return false;
    }
    const auto segments = split_topic(pattern);
    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string& segment = segments[i];
        if (segment.find('#') != std::string::npos) {
            if (segment != "#" || i + 1 != segments.size()) {
                return false;
            }
        }
        if (segment.find('+') != std::string::npos && segment != "+") {
            return false;
        }
    }
    return true;
}

bool topic_matches(const std::vector<std::string>& pattern_segments, const std::vector<std::string>& topic_segments) {
    size_t i = 0;
    for (; i < pattern_segments.size(); ++i) {
        const std::string& part = pattern_segments[i];
        if (part == "#") {
            return true;
        }
        if (i >= topic_segments.size()) {
            return false;
        }
        if (part != "+" && part != topic_segments[i]) {
            return false;
        }
    }
    return i == topic_segments.size();
}

bool topic_matches(const std::string& pattern, const std::string& topic) {
    return topic_matches(split_topic(pattern), split_topic(topic));
}

bool is_command_topic(const std::string& topic) {
    return topic.rfind("command/", 0) == 0;
}

} // namespace bus
} // namespace devices
} // namespace capturehub
