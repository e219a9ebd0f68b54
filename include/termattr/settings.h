/**
 * @file settings.h
 * @brief Catalog introspection grouped for help and describe utilities.
 *
 * Carries metadata only: names per category in catalog order and, for
 * enumerated groups, their (member name, raw value) pairs.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "catalog.h"

#include <cstdint>
#include <string>
#include <vector>

namespace termattr {

/// One enumerated group and the members this platform defines.
struct EnumGroup {
    std::string name;
    std::vector<EnumMember> members;
};

/// Supported attributes by category.
struct Settings {
    std::vector<std::string> input_flags;
    std::vector<std::string> output_flags;
    std::vector<std::string> control_flags;
    std::vector<std::string> local_flags;
    std::vector<EnumGroup> enumerated;
    std::vector<std::string> speeds;
    std::vector<std::int64_t> baud_rates;
    std::vector<std::string> control_characters;
    std::vector<std::string> non_canonical;
    std::vector<std::string> window;
};

/// Describe the process-wide catalog.
[[nodiscard]] Settings settings();

/// Describe an arbitrary catalog.
[[nodiscard]] Settings settings(const Catalog& catalog);

/// Human-readable listing of every supported attribute and its domain.
[[nodiscard]] std::string settings_help();

} // namespace termattr
