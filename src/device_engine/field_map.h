/**
 * @file field_map.h
 * @brief Flat field-value mapping shared by the device model and the message bus.
 * @details Device exports, bus payloads and command arguments are all expressed as
 *          `FieldMap`: string keys mapped to scalar values. Nested objects are never stored;
 *          collections are flattened into dotted keys or comma-separated strings.
 */
#ifndef CAPTUREHUB_FIELD_MAP_H
#define CAPTUREHUB_FIELD_MAP_H

#include <map>
#include <string>
#include <variant>

namespace capturehub {
namespace devices {

/** A scalar payload value. Construct strings explicitly; a bare literal would select `bool`. */
using FieldValue = std::variant<std::string, long long, double, bool>;
using FieldMap = std::map<std::string, FieldValue>;

/** @brief Renders any scalar as text (booleans as "true"/"false"). */
std::string field_to_string(const FieldValue& value);

/** @brief Reads `key` as a string, converting numbers and booleans. */
bool get_string_field(const FieldMap& fields, const std::string& key, std::string& out);

/**
 * @brief Reads `key` as an integer.
 * @details Accepts integral values, doubles with no fractional part and decimal strings.
 * @return false if the key is missing or cannot be converted.
 */
bool get_int_field(const FieldMap& fields, const std::string& key, long long& out);

/** @brief Reads `key` as a boolean ("true"/"false"/"1"/"0" strings accepted). */
bool get_bool_field(const FieldMap& fields, const std::string& key, bool& out);

} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_FIELD_MAP_H
