/**
 * @file composite_modes.cpp
 * @brief Named composite modes expressed as fixed attribute sequences.
 *
 * Each mode is a set_many() over catalog names and touches the raw
 * block only through the ordinary symbolic path.
 *
 * @copyright GPL-2.0-or-later
 */

#include "termattr/attribute_set.h"

#include <termios.h>

namespace termattr {

Result<void> AttributeSet::set_evenp(bool enable) {
    if (enable) {
        return set_many({{"parenb", true}, {"csize", std::string("cs7")}, {"parodd", false}});
    }
    return set_many({{"parenb", false}, {"csize", std::string("cs8")}});
}

Result<void> AttributeSet::set_oddp(bool enable) {
    if (enable) {
        return set_many({{"parenb", true}, {"csize", std::string("cs7")}, {"parodd", true}});
    }
    return set_many({{"parenb", false}, {"csize", std::string("cs8")}});
}

Result<void> AttributeSet::set_raw() {
    const Catalog& catalog = Catalog::instance();

    Assignments changes;
    for (auto word : {FieldSelector::InputFlags, FieldSelector::LocalFlags}) {
        for (auto& name : catalog.boolean_names(word)) {
            // iutf8 describes the character encoding, not line discipline
            if (name == "iutf8") {
                continue;
            }
            changes.emplace_back(std::move(name), false);
        }
    }
    changes.emplace_back("opost", false);
    changes.emplace_back("parenb", false);
    changes.emplace_back("csize", std::string("cs8"));
    changes.emplace_back("min", std::int64_t{1});
    changes.emplace_back("time", std::int64_t{0});

    return set_many(changes);
}

Result<void> AttributeSet::set_nl(bool enable) {
    if (enable) {
        return set("icrnl", false);
    }
    return set_many({{"icrnl", true}, {"inlcr", false}, {"igncr", false}});
}

Result<void> AttributeSet::set_ek() {
    Assignments changes;
#ifdef CERASE
    changes.emplace_back("erase", std::byte{static_cast<unsigned char>(CERASE)});
#endif
#ifdef CKILL
    changes.emplace_back("kill", std::byte{static_cast<unsigned char>(CKILL)});
#endif
    return set_many(changes);
}

} // namespace termattr
