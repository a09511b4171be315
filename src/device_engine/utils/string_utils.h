/**
 * @file string_utils.h
 * @brief Small text helpers shared by the settings loader and the device managers.
 */
#ifndef CAPTUREHUB_STRING_UTILS_H
#define CAPTUREHUB_STRING_UTILS_H

#include <string>
#include <vector>

namespace capturehub {
namespace devices {
namespace utils {

/** @brief Copy of `text` without leading or trailing whitespace. */
std::string trim(const std::string& text);

/** @brief Comma-separated list to trimmed, non-empty tokens. */
std::vector<std::string> split_list(const std::string& text);

} // namespace utils
} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_STRING_UTILS_H
