#include "field_map.h"

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace capturehub {
namespace devices {

std::string field_to_string(const FieldValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    if (const auto* i = std::get_if<long long>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        std::ostringstream oss;
        oss << *d;
        return oss.str();
    }
    return std::get<bool>(value) ? "true" : "false";
}

bool get_string_field(const FieldMap& fields, const std::string& key, std::string& out) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return false;
    }
    out = field_to_string(it->second);
    return true;
}

bool get_int_field(const FieldMap& fields, const std::string& key, long long& out) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return false;
    }
    const FieldValue& value = it->second;
    if (const auto* i = std::get_if<long long>(&value)) {
        out = *i;
        return true;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        if (std::floor(*d) != *d) {
            return false;
        }
        out = static_cast<long long>(*d);
        return true;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        if (s->empty()) {
            return false;
        }
        char* end = nullptr;
        long long parsed = std::strtoll(s->c_str(), &end, 10);
        if (end == nullptr || *end != '\0') {
            return false;
        }
        out = parsed;
        return true;
    }
    return false;
}

bool get_bool_field(const FieldMap& fields, const std::string& key, bool& out) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return false;
    }
    const FieldValue& value = it->second;
    if (const auto* b = std::get_if<bool>(&value)) {
        out = *b;
        return true;
    }
    if (const auto* i = std::get_if<long long>(&value)) {
        out = (*i != 0);
        return true;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        if (*s == "true" || *s == "1") {
            out = true;
            return true;
        }
        if (*s == "false" || *s == "0") {
            out = false;
            return true;
        }
    }
    return false;
}

} // namespace devices
} // namespace capturehub
