/**
 * @file catalog.cpp
 * @brief Platform probing for the attribute catalog.
 *
 * Every candidate constant is guarded by its own #ifdef so that the
 * registry reflects exactly what <termios.h> on this platform defines.
 * Registration order is the listing order: boolean flags by flag word,
 * enumerated groups, speeds, control characters, non-canonical counts,
 * window dimensions.
 *
 * @copyright GPL-2.0-or-later
 */

#include "termattr/catalog.h"
#include "termattr/gsl.hpp"
#include "termattr/logging.h"

#include <algorithm>

namespace termattr {

// ─────────────────────────────────────────────────────────────────────────────
// CatalogEntry
// ─────────────────────────────────────────────────────────────────────────────

const EnumMember* CatalogEntry::find_member(std::string_view member_name) const noexcept {
    for (const auto& member : members) {
        if (member.name == member_name) {
            return &member;
        }
    }
    return nullptr;
}

const EnumMember* CatalogEntry::find_member(tcflag_t raw) const noexcept {
    for (const auto& member : members) {
        if (member.raw == raw) {
            return &member;
        }
    }
    return nullptr;
}

// ─────────────────────────────────────────────────────────────────────────────
// Registration helpers
// ─────────────────────────────────────────────────────────────────────────────

void Catalog::add(CatalogEntry entry) {
    gsl_Expects(!entry.name.empty());
    gsl_Expects(by_name_.find(entry.name) == by_name_.end());

    by_name_.emplace(entry.name, entries_.size());
    entries_.push_back(std::move(entry));
}

void Catalog::add_boolean(FieldSelector word, const char* name, tcflag_t mask) {
    CatalogEntry entry;
    entry.name = name;
    entry.category = Category::BooleanFlag;
    entry.field = word;
    entry.mask = mask;
    add(std::move(entry));
}

void Catalog::add_control_char(const char* name, std::size_t index) {
    gsl_Expects(index < kControlCharCount);

    CatalogEntry entry;
    entry.name = name;
    entry.category = Category::ControlCharacter;
    entry.field = FieldSelector::ControlChars;
    entry.index = index;
    add(std::move(entry));
}

// ─────────────────────────────────────────────────────────────────────────────
// Probing
// ─────────────────────────────────────────────────────────────────────────────

Catalog Catalog::probe() {
    Catalog catalog;

    // ── Input flags ──────────────────────────────────────────────────────────
    constexpr auto I = FieldSelector::InputFlags;
#ifdef IGNBRK
    catalog.add_boolean(I, "ignbrk", IGNBRK);
#endif
#ifdef BRKINT
    catalog.add_boolean(I, "brkint", BRKINT);
#endif
#ifdef IGNPAR
    catalog.add_boolean(I, "ignpar", IGNPAR);
#endif
#ifdef PARMRK
    catalog.add_boolean(I, "parmrk", PARMRK);
#endif
#ifdef INPCK
    catalog.add_boolean(I, "inpck", INPCK);
#endif
#ifdef ISTRIP
    catalog.add_boolean(I, "istrip", ISTRIP);
#endif
#ifdef INLCR
    catalog.add_boolean(I, "inlcr", INLCR);
#endif
#ifdef IGNCR
    catalog.add_boolean(I, "igncr", IGNCR);
#endif
#ifdef ICRNL
    catalog.add_boolean(I, "icrnl", ICRNL);
#endif
#ifdef IUCLC
    catalog.add_boolean(I, "iuclc", IUCLC);
#endif
#ifdef IXON
    catalog.add_boolean(I, "ixon", IXON);
#endif
#ifdef IXANY
    catalog.add_boolean(I, "ixany", IXANY);
#endif
#ifdef IXOFF
    catalog.add_boolean(I, "ixoff", IXOFF);
#endif
#ifdef IMAXBEL
    catalog.add_boolean(I, "imaxbel", IMAXBEL);
#endif
#ifdef IUTF8
    catalog.add_boolean(I, "iutf8", IUTF8);
#endif

    // ── Output flags ─────────────────────────────────────────────────────────
    constexpr auto O = FieldSelector::OutputFlags;
#ifdef OPOST
    catalog.add_boolean(O, "opost", OPOST);
#endif
#ifdef OLCUC
    catalog.add_boolean(O, "olcuc", OLCUC);
#endif
#ifdef ONLCR
    catalog.add_boolean(O, "onlcr", ONLCR);
#endif
#ifdef OCRNL
    catalog.add_boolean(O, "ocrnl", OCRNL);
#endif
#ifdef ONOCR
    catalog.add_boolean(O, "onocr", ONOCR);
#endif
#ifdef ONLRET
    catalog.add_boolean(O, "onlret", ONLRET);
#endif
#ifdef OFILL
    catalog.add_boolean(O, "ofill", OFILL);
#endif
#ifdef OFDEL
    catalog.add_boolean(O, "ofdel", OFDEL);
#endif

    // ── Control flags ────────────────────────────────────────────────────────
    constexpr auto C = FieldSelector::ControlFlags;
#ifdef CSTOPB
    catalog.add_boolean(C, "cstopb", CSTOPB);
#endif
#ifdef CREAD
    catalog.add_boolean(C, "cread", CREAD);
#endif
#ifdef PARENB
    catalog.add_boolean(C, "parenb", PARENB);
#endif
#ifdef PARODD
    catalog.add_boolean(C, "parodd", PARODD);
#endif
#ifdef HUPCL
    catalog.add_boolean(C, "hupcl", HUPCL);
#endif
#ifdef CLOCAL
    catalog.add_boolean(C, "clocal", CLOCAL);
#endif
#ifdef CRTSCTS
    catalog.add_boolean(C, "crtscts", CRTSCTS);
#endif

    // ── Local flags ──────────────────────────────────────────────────────────
    constexpr auto L = FieldSelector::LocalFlags;
#ifdef ISIG
    catalog.add_boolean(L, "isig", ISIG);
#endif
#ifdef ICANON
    catalog.add_boolean(L, "icanon", ICANON);
#endif
#ifdef XCASE
    catalog.add_boolean(L, "xcase", XCASE);
#endif
#ifdef ECHO
    catalog.add_boolean(L, "echo", ECHO);
#endif
#ifdef ECHOE
    catalog.add_boolean(L, "echoe", ECHOE);
#endif
#ifdef ECHOK
    catalog.add_boolean(L, "echok", ECHOK);
#endif
#ifdef ECHONL
    catalog.add_boolean(L, "echonl", ECHONL);
#endif
#ifdef ECHOCTL
    catalog.add_boolean(L, "echoctl", ECHOCTL);
#endif
#ifdef ECHOPRT
    catalog.add_boolean(L, "echoprt", ECHOPRT);
#endif
#ifdef ECHOKE
    catalog.add_boolean(L, "echoke", ECHOKE);
#endif
#ifdef FLUSHO
    catalog.add_boolean(L, "flusho", FLUSHO);
#endif
#ifdef NOFLSH
    catalog.add_boolean(L, "noflsh", NOFLSH);
#endif
#ifdef TOSTOP
    catalog.add_boolean(L, "tostop", TOSTOP);
#endif
#ifdef PENDIN
    catalog.add_boolean(L, "pendin", PENDIN);
#endif
#ifdef IEXTEN
    catalog.add_boolean(L, "iexten", IEXTEN);
#endif

    // ── Enumerated groups ────────────────────────────────────────────────────
    auto add_group = [&catalog](FieldSelector word, const char* name, tcflag_t mask,
                                std::vector<EnumMember> members) {
        CatalogEntry entry;
        entry.name = name;
        entry.category = Category::EnumeratedFlag;
        entry.field = word;
        entry.mask = mask;
        entry.members = std::move(members);
        catalog.add(std::move(entry));
    };

#ifdef CSIZE
    {
        std::vector<EnumMember> members;
#ifdef CS5
        members.push_back({"cs5", CS5});
#endif
#ifdef CS6
        members.push_back({"cs6", CS6});
#endif
#ifdef CS7
        members.push_back({"cs7", CS7});
#endif
#ifdef CS8
        members.push_back({"cs8", CS8});
#endif
        add_group(C, "csize", CSIZE, std::move(members));
    }
#endif

#ifdef CRDLY
    {
        std::vector<EnumMember> members;
#ifdef CR0
        members.push_back({"cr0", CR0});
#endif
#ifdef CR1
        members.push_back({"cr1", CR1});
#endif
#ifdef CR2
        members.push_back({"cr2", CR2});
#endif
#ifdef CR3
        members.push_back({"cr3", CR3});
#endif
        add_group(O, "crdly", CRDLY, std::move(members));
    }
#endif

#ifdef NLDLY
    {
        std::vector<EnumMember> members;
#ifdef NL0
        members.push_back({"nl0", NL0});
#endif
#ifdef NL1
        members.push_back({"nl1", NL1});
#endif
        add_group(O, "nldly", NLDLY, std::move(members));
    }
#endif

#ifdef TABDLY
    {
        std::vector<EnumMember> members;
#ifdef TAB0
        members.push_back({"tab0", TAB0});
#endif
#ifdef TAB1
        members.push_back({"tab1", TAB1});
#endif
#ifdef TAB2
        members.push_back({"tab2", TAB2});
#endif
#ifdef TAB3
        members.push_back({"tab3", TAB3});
#endif
        add_group(O, "tabdly", TABDLY, std::move(members));
    }
#endif

#ifdef BSDLY
    {
        std::vector<EnumMember> members;
#ifdef BS0
        members.push_back({"bs0", BS0});
#endif
#ifdef BS1
        members.push_back({"bs1", BS1});
#endif
        add_group(O, "bsdly", BSDLY, std::move(members));
    }
#endif

#ifdef FFDLY
    {
        std::vector<EnumMember> members;
#ifdef FF0
        members.push_back({"ff0", FF0});
#endif
#ifdef FF1
        members.push_back({"ff1", FF1});
#endif
        add_group(O, "ffdly", FFDLY, std::move(members));
    }
#endif

#ifdef VTDLY
    {
        std::vector<EnumMember> members;
#ifdef VT0
        members.push_back({"vt0", VT0});
#endif
#ifdef VT1
        members.push_back({"vt1", VT1});
#endif
        add_group(O, "vtdly", VTDLY, std::move(members));
    }
#endif

    // ── Speeds ───────────────────────────────────────────────────────────────
    auto add_baud = [&catalog](std::int64_t rate, speed_t code) {
        catalog.baud_rates_.push_back({rate, code});
    };
#ifdef B0
    add_baud(0, B0);
#endif
#ifdef B50
    add_baud(50, B50);
#endif
#ifdef B75
    add_baud(75, B75);
#endif
#ifdef B110
    add_baud(110, B110);
#endif
#ifdef B134
    add_baud(134, B134);
#endif
#ifdef B150
    add_baud(150, B150);
#endif
#ifdef B200
    add_baud(200, B200);
#endif
#ifdef B300
    add_baud(300, B300);
#endif
#ifdef B600
    add_baud(600, B600);
#endif
#ifdef B1200
    add_baud(1200, B1200);
#endif
#ifdef B1800
    add_baud(1800, B1800);
#endif
#ifdef B2400
    add_baud(2400, B2400);
#endif
#ifdef B4800
    add_baud(4800, B4800);
#endif
#ifdef B9600
    add_baud(9600, B9600);
#endif
#ifdef B19200
    add_baud(19200, B19200);
#endif
#ifdef B38400
    add_baud(38400, B38400);
#endif
#ifdef B57600
    add_baud(57600, B57600);
#endif
#ifdef B115200
    add_baud(115200, B115200);
#endif
#ifdef B230400
    add_baud(230400, B230400);
#endif
#ifdef B460800
    add_baud(460800, B460800);
#endif
#ifdef B500000
    add_baud(500000, B500000);
#endif
#ifdef B576000
    add_baud(576000, B576000);
#endif
#ifdef B921600
    add_baud(921600, B921600);
#endif
#ifdef B1000000
    add_baud(1000000, B1000000);
#endif
#ifdef B1152000
    add_baud(1152000, B1152000);
#endif
#ifdef B1500000
    add_baud(1500000, B1500000);
#endif
#ifdef B2000000
    add_baud(2000000, B2000000);
#endif
#ifdef B2500000
    add_baud(2500000, B2500000);
#endif
#ifdef B3000000
    add_baud(3000000, B3000000);
#endif
#ifdef B3500000
    add_baud(3500000, B3500000);
#endif
#ifdef B4000000
    add_baud(4000000, B4000000);
#endif

    for (auto [name, field] : {std::pair{"ispeed", FieldSelector::InputSpeed},
                               std::pair{"ospeed", FieldSelector::OutputSpeed}}) {
        CatalogEntry entry;
        entry.name = name;
        entry.category = Category::Speed;
        entry.field = field;
        catalog.add(std::move(entry));
    }

    // ── Control characters ───────────────────────────────────────────────────
#ifdef VEOF
    catalog.add_control_char("eof", VEOF);
#endif
#ifdef VEOL
    catalog.add_control_char("eol", VEOL);
#endif
#ifdef VEOL2
    catalog.add_control_char("eol2", VEOL2);
#endif
#ifdef VERASE
    catalog.add_control_char("erase", VERASE);
#endif
#ifdef VERASE2
    catalog.add_control_char("erase2", VERASE2);
#endif
#ifdef VWERASE
    catalog.add_control_char("werase", VWERASE);
#endif
#ifdef VKILL
    catalog.add_control_char("kill", VKILL);
#endif
#ifdef VREPRINT
    catalog.add_control_char("reprint", VREPRINT);
#endif
#ifdef VINTR
    catalog.add_control_char("intr", VINTR);
#endif
#ifdef VQUIT
    catalog.add_control_char("quit", VQUIT);
#endif
#ifdef VSUSP
    catalog.add_control_char("susp", VSUSP);
#endif
#ifdef VDSUSP
    catalog.add_control_char("dsusp", VDSUSP);
#endif
#ifdef VSTART
    catalog.add_control_char("start", VSTART);
#endif
#ifdef VSTOP
    catalog.add_control_char("stop", VSTOP);
#endif
#ifdef VLNEXT
    catalog.add_control_char("lnext", VLNEXT);
#endif
#ifdef VSTATUS
    catalog.add_control_char("status", VSTATUS);
#endif
#ifdef VDISCARD
    catalog.add_control_char("discard", VDISCARD);
#endif
#if defined(VSWTCH)
    catalog.add_control_char("swtch", VSWTCH);
#elif defined(VSWTC)
    catalog.add_control_char("swtch", VSWTC);
#endif

    // ── Non-canonical counts ─────────────────────────────────────────────────
    for (auto [name, index] : {std::pair{"min", std::size_t{VMIN}},
                               std::pair{"time", std::size_t{VTIME}}}) {
        CatalogEntry entry;
        entry.name = name;
        entry.category = Category::NonCanonicalCount;
        entry.field = FieldSelector::ControlChars;
        entry.index = index;
        catalog.add(std::move(entry));
    }

    // ── Window dimensions (all or nothing) ───────────────────────────────────
    if constexpr (kHaveWindowSize) {
        for (auto [name, index] : {std::pair{"rows", kWindowRowsIndex},
                                   std::pair{"cols", kWindowColsIndex}}) {
            CatalogEntry entry;
            entry.name = name;
            entry.category = Category::WindowDimension;
            entry.field = FieldSelector::WindowSize;
            entry.index = index;
            catalog.add(std::move(entry));
        }
        catalog.has_window_size_ = true;
    }

    TERMATTR_LOG_DEBUG("CATALOG", "probed %zu attributes, %zu baud rates, window size %s",
                       catalog.entries_.size(), catalog.baud_rates_.size(),
                       catalog.has_window_size_ ? "supported" : "unsupported");

    return catalog;
}

const Catalog& Catalog::instance() {
    static const Catalog catalog = probe();
    return catalog;
}

// ─────────────────────────────────────────────────────────────────────────────
// Lookup
// ─────────────────────────────────────────────────────────────────────────────

Result<const CatalogEntry*> Catalog::resolve(std::string_view name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        return make_error(ErrorCode::UnsupportedAttribute,
                          "attribute '" + std::string(name) + "' unsupported on platform");
    }
    return &entries_[it->second];
}

bool Catalog::contains(std::string_view name) const noexcept {
    return by_name_.find(name) != by_name_.end();
}

std::vector<std::string> Catalog::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.name);
    }
    return result;
}

std::vector<std::string> Catalog::names(Category category) const {
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        if (entry.category == category) {
            result.push_back(entry.name);
        }
    }
    return result;
}

std::vector<std::string> Catalog::boolean_names(FieldSelector word) const {
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        if (entry.category == Category::BooleanFlag && entry.field == word) {
            result.push_back(entry.name);
        }
    }
    return result;
}

std::optional<speed_t> Catalog::encode_speed(std::int64_t rate) const noexcept {
    auto it = std::find_if(baud_rates_.begin(), baud_rates_.end(),
                           [rate](const BaudRate& b) { return b.rate == rate; });
    if (it == baud_rates_.end()) {
        return std::nullopt;
    }
    return it->code;
}

std::optional<std::int64_t> Catalog::decode_speed(speed_t code) const noexcept {
    auto it = std::find_if(baud_rates_.begin(), baud_rates_.end(),
                           [code](const BaudRate& b) { return b.code == code; });
    if (it == baud_rates_.end()) {
        return std::nullopt;
    }
    return it->rate;
}

} // namespace termattr
