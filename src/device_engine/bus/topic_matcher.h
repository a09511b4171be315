#ifndef CAPTUREHUB_BUS_TOPIC_MATCHER_H
#define CAPTUREHUB_BUS_TOPIC_MATCHER_H

#include <string>
#include <vector>

namespace capturehub {
namespace devices {
namespace bus {

/** @brief Splits a topic or pattern on '/'. Empty segments are preserved. */
std::vector<std::string> split_topic(const std::string& topic);

/**
 * @brief Checks that a subscription pattern is well formed.
 * @details `+` must occupy a whole segment; `#` must occupy the whole last segment.
 */
bool is_valid_pattern(const std::string& pattern);

/**
 * @brief Matches a concrete topic against a subscription pattern.
 * @details `+` matches exactly one segment, a trailing `#` matches zero or more remaining
 *          segments. Anything else must match the segment literally.
 */
bool topic_matches(const std::vector<std::string>& pattern_segments, const std::vector<std::string>& topic_segments);
bool topic_matches(const std::string& pattern, const std::string& topic);

/** @brief True for topics in the reserved `command/` namespace. */
bool is_command_topic(const std::string& topic);

} // namespace bus
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_BUS_TOPIC_MATCHER_H
