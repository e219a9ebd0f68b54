/**
 * @file value.cpp
 * @brief Value normalization and display helpers.
 */

#include "termattr/value.h"

namespace termattr {

bool truthy(const Value& value) noexcept {
    switch (value.index()) {
        case 0: return false;
        case 1: return std::get<bool>(value);
        case 2: return std::get<std::int64_t>(value) != 0;
        case 3: return !std::get<std::string>(value).empty();
        case 4: return std::get<std::byte>(value) != std::byte{0};
        default: return false;
    }
}

const char* value_type_name(const Value& value) noexcept {
    switch (value.index()) {
        case 0: return "none";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "string";
        case 4: return "byte";
        default: return "unknown";
    }
}

std::string to_display_string(const Value& value) {
    switch (value.index()) {
        case 0: return "none";
        case 1: return std::get<bool>(value) ? "true" : "false";
        case 2: return std::to_string(std::get<std::int64_t>(value));
        case 3: return std::get<std::string>(value);
        case 4: return std::to_string(std::to_integer<int>(std::get<std::byte>(value)));
        default: return {};
    }
}

} // namespace termattr
