/**
 * @file settings.cpp
 * @brief Catalog introspection and help text.
 */

#include "termattr/settings.h"

#include <algorithm>
#include <sstream>

namespace termattr {

namespace {

void write_names(std::ostringstream& oss, const std::vector<std::string>& names) {
    oss << "   ";
    for (const auto& name : names) {
        oss << ' ' << name;
    }
    oss << "\n\n";
}

} // anonymous namespace

Settings settings(const Catalog& catalog) {
    Settings s;
    s.input_flags = catalog.boolean_names(FieldSelector::InputFlags);
    s.output_flags = catalog.boolean_names(FieldSelector::OutputFlags);
    s.control_flags = catalog.boolean_names(FieldSelector::ControlFlags);
    s.local_flags = catalog.boolean_names(FieldSelector::LocalFlags);

    for (const auto& entry : catalog.entries()) {
        if (entry.category == Category::EnumeratedFlag) {
            s.enumerated.push_back({entry.name, entry.members});
        }
    }

    s.speeds = catalog.names(Category::Speed);
    for (const auto& baud : catalog.baud_rates()) {
        s.baud_rates.push_back(baud.rate);
    }

    s.control_characters = catalog.names(Category::ControlCharacter);
    s.non_canonical = catalog.names(Category::NonCanonicalCount);
    s.window = catalog.names(Category::WindowDimension);
    return s;
}

Settings settings() {
    return settings(Catalog::instance());
}

std::string settings_help() {
    const Settings s = settings();
    std::ostringstream oss;

    oss << "For details on the following attributes, check the manpage of stty(1) on your system.\n\n";

    const std::pair<const char*, const std::vector<std::string>*> flag_words[] = {
        {"input mode", &s.input_flags},
        {"output mode", &s.output_flags},
        {"control mode", &s.control_flags},
        {"local mode", &s.local_flags},
    };
    for (const auto& [label, names] : flag_words) {
        oss << "  Boolean " << label << " attributes (name to enable, -name to disable):\n";
        write_names(oss, *names);
    }

    if (!s.window.empty()) {
        oss << "  Window size attributes (nonnegative integer up to 65535):\n";
        write_names(oss, s.window);
    }

    oss << "  Non-canonical mode attributes (nonnegative integer up to 255):\n";
    write_names(oss, s.non_canonical);

    oss << "  Character size and delay attributes:\n";
    std::size_t width = 9;  // "ATTRIBUTE"
    for (const auto& group : s.enumerated) {
        width = std::max(width, group.name.size());
    }
    oss << "    " << std::string("ATTRIBUTE").append(width - 9, ' ') << "  |  POSSIBLE VALUES\n";
    for (const auto& group : s.enumerated) {
        oss << "    " << group.name << std::string(width - group.name.size(), ' ') << "  |  ";
        for (std::size_t i = 0; i < group.members.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << group.members[i].name << " (" << group.members[i].raw << ')';
        }
        oss << '\n';
    }
    oss << '\n';

    oss << "  Control character attributes:\n";
    write_names(oss, s.control_characters);
    oss << "    POSSIBLE VALUES: a single character, \"^X\" for a control character,\n"
           "                     \"^?\" for DEL, \"M-\" prefix for the high bit,\n"
           "                     or \"undef\" / \"^-\" to disable\n\n";

    oss << "  Speed attributes:\n";
    write_names(oss, s.speeds);
    oss << "    POSSIBLE VALUES:";
    for (std::size_t i = 0; i < s.baud_rates.size(); ++i) {
        oss << (i > 0 ? ", " : " ") << s.baud_rates[i];
    }
    oss << '\n';

    return oss.str();
}

} // namespace termattr
