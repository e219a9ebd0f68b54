/**
 * @file value.h
 * @brief Symbolic attribute values and their normalization rules.
 *
 * A Value is what callers pass to AttributeSet::set() and what
 * AttributeSet::get() returns. Reads only ever produce bool,
 * std::int64_t or std::string; writes additionally accept
 * std::monostate ("absent") and std::byte (a single raw byte for
 * control characters).
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace termattr {

/**
 * @brief Tagged value for one symbolic attribute.
 *
 * Alternatives:
 * - std::monostate: absent / none
 * - bool: boolean flags
 * - std::int64_t: speeds, counts, window dimensions, raw enumerated values
 * - std::string: enumerated names and control-character notation
 * - std::byte: one raw control-character byte
 */
using Value = std::variant<std::monostate, bool, std::int64_t, std::string, std::byte>;

/// Ordered (name, value) pairs, applied in sequence by set_many().
using Assignments = std::vector<std::pair<std::string, Value>>;

/**
 * @brief Truthiness normalization for boolean attributes.
 *
 * Absent, false, zero, empty string and the zero byte are false;
 * everything else is true. A shell token such as "yes" or "0" is a
 * non-empty string and therefore true.
 */
[[nodiscard]] bool truthy(const Value& value) noexcept;

/**
 * @brief Name of the held alternative ("none", "bool", "int", "string", "byte").
 */
[[nodiscard]] const char* value_type_name(const Value& value) noexcept;

/**
 * @brief Render a value for listings: true/false, decimal integers,
 *        strings verbatim, bytes as their decimal code, "none".
 */
[[nodiscard]] std::string to_display_string(const Value& value);

/**
 * @brief Integer payload, if the value holds one.
 */
[[nodiscard]] inline const std::int64_t* as_integer(const Value& value) noexcept {
    return std::get_if<std::int64_t>(&value);
}

/**
 * @brief String payload, if the value holds one.
 */
[[nodiscard]] inline const std::string* as_string(const Value& value) noexcept {
    return std::get_if<std::string>(&value);
}

} // namespace termattr
