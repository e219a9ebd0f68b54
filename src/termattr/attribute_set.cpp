/**
 * @file attribute_set.cpp
 * @brief Attribute set: symbolic dispatch, device transfer, persistence.
 *
 * All name-to-field translation goes through Catalog::resolve() and the
 * two dispatch functions derive() and assign(). Multi-attribute
 * operations work on a copy and commit with one move.
 *
 * @copyright GPL-2.0-or-later
 */

#include "termattr/attribute_set.h"
#include "termattr/control_char.h"
#include "termattr/exceptions.h"
#include "termattr/gsl.hpp"
#include "termattr/logging.h"

#include <limits>

namespace termattr {

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) {
            out += ", ";
        }
        out += name;
    }
    return out;
}

std::unexpected<Error> wrong_type(const CatalogEntry& entry, const Value& value, const char* expected) {
    return make_error(ErrorCode::InvalidType,
                      "value of attribute '" + entry.name + "' must have type " + expected +
                      ", got " + value_type_name(value));
}

std::unexpected<Error> unsupported_value(const CatalogEntry& entry, const Value& value) {
    return make_error(ErrorCode::InvalidValue,
                      "unsupported value '" + to_display_string(value) +
                      "' for attribute '" + entry.name + "'");
}

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

AttributeSet::AttributeSet() {
    if (Catalog::instance().has_window_size()) {
        window_ = RawWindowSize{};
    }
}

Result<AttributeSet> AttributeSet::from_device(ITerminalDevice& device, const Assignments& initial) {
    AttributeSet attrs;
    TERMATTR_TRY(attrs.fetch_from(device));
    TERMATTR_TRY(attrs.set_many(initial));
    return attrs;
}

Result<AttributeSet> AttributeSet::from_snapshot(const Snapshot& snapshot) {
    AttributeSet attrs;
    TERMATTR_TRY(attrs.restore(snapshot));
    return attrs;
}

// ─────────────────────────────────────────────────────────────────────────────
// Raw field selection
// ─────────────────────────────────────────────────────────────────────────────

tcflag_t& AttributeSet::flag_word(FieldSelector field) {
    switch (field) {
        case FieldSelector::InputFlags:   return raw_.iflag;
        case FieldSelector::OutputFlags:  return raw_.oflag;
        case FieldSelector::ControlFlags: return raw_.cflag;
        case FieldSelector::LocalFlags:   return raw_.lflag;
        default: break;
    }
    TERMATTR_ABORT("flag_word: field is not a flag word");
}

tcflag_t AttributeSet::flag_word(FieldSelector field) const {
    return const_cast<AttributeSet*>(this)->flag_word(field);
}

// ─────────────────────────────────────────────────────────────────────────────
// Symbolic access
// ─────────────────────────────────────────────────────────────────────────────

Result<Value> AttributeSet::derive(const CatalogEntry& entry) const {
    switch (entry.category) {
        case Category::BooleanFlag:
            return Value{(flag_word(entry.field) & entry.mask) != 0};

        case Category::EnumeratedFlag: {
            tcflag_t bits = flag_word(entry.field) & entry.mask;
            const EnumMember* member = entry.find_member(bits);
            TERMATTR_CHECK(member != nullptr, ErrorCode::InvalidValue,
                           "raw value " + std::to_string(bits) + " of attribute '" +
                           entry.name + "' has no name on this platform");
            return Value{member->name};
        }

        case Category::Speed: {
            speed_t code = entry.field == FieldSelector::InputSpeed ? raw_.ispeed : raw_.ospeed;
            auto rate = Catalog::instance().decode_speed(code);
            TERMATTR_CHECK(rate.has_value(), ErrorCode::InvalidValue,
                           "raw speed " + std::to_string(code) + " of attribute '" +
                           entry.name + "' has no baud rate on this platform");
            return Value{*rate};
        }

        case Category::ControlCharacter:
            return Value{format_control_char(raw_.cc[entry.index])};

        case Category::NonCanonicalCount:
            return Value{static_cast<std::int64_t>(raw_.cc[entry.index])};

        case Category::WindowDimension: {
            RawWindowSize ws = window_.value_or(RawWindowSize{});
            unsigned short dim = entry.index == kWindowRowsIndex ? ws.rows : ws.cols;
            return Value{static_cast<std::int64_t>(dim)};
        }
    }
    return make_error(ErrorCode::UnsupportedAttribute, "attribute '" + entry.name + "' has no category");
}

Result<void> AttributeSet::assign(const CatalogEntry& entry, const Value& value) {
    switch (entry.category) {
        case Category::BooleanFlag: {
            tcflag_t& word = flag_word(entry.field);
            if (truthy(value)) {
                word |= entry.mask;
            } else {
                word &= ~entry.mask;
            }
            return Ok();
        }

        case Category::EnumeratedFlag: {
            const EnumMember* member = nullptr;
            if (const auto* number = as_integer(value)) {
                if (*number >= 0 && static_cast<std::uint64_t>(*number) <= std::numeric_limits<tcflag_t>::max()) {
                    member = entry.find_member(static_cast<tcflag_t>(*number));
                }
            } else if (const auto* text = as_string(value)) {
                member = entry.find_member(*text);
            } else {
                return wrong_type(entry, value, "int or string");
            }
            if (member == nullptr) {
                return unsupported_value(entry, value);
            }

            tcflag_t& word = flag_word(entry.field);
            word = (word & ~entry.mask) | member->raw;
            return Ok();
        }

        case Category::Speed: {
            const auto* rate = as_integer(value);
            if (rate == nullptr) {
                return wrong_type(entry, value, "int");
            }
            auto code = Catalog::instance().encode_speed(*rate);
            if (!code) {
                return unsupported_value(entry, value);
            }
            (entry.field == FieldSelector::InputSpeed ? raw_.ispeed : raw_.ospeed) = *code;
            return Ok();
        }

        case Category::ControlCharacter: {
            cc_t byte = 0;
            if (const auto* b = std::get_if<std::byte>(&value)) {
                byte = std::to_integer<cc_t>(*b);
            } else if (const auto* text = as_string(value)) {
                byte = TERMATTR_TRY(parse_control_char(*text));
            } else {
                return wrong_type(entry, value, "byte or string");
            }
            raw_.cc[entry.index] = byte;
            return Ok();
        }

        case Category::NonCanonicalCount: {
            const auto* count = as_integer(value);
            if (count == nullptr) {
                return wrong_type(entry, value, "int");
            }
            if (*count < 0 || *count > std::numeric_limits<cc_t>::max()) {
                return unsupported_value(entry, value);
            }
            raw_.cc[entry.index] = gsl::narrow_cast<cc_t>(*count);
            return Ok();
        }

        case Category::WindowDimension: {
            const auto* dim = as_integer(value);
            if (dim == nullptr) {
                return wrong_type(entry, value, "int");
            }
            if (*dim < 0 || *dim > std::numeric_limits<unsigned short>::max()) {
                return unsupported_value(entry, value);
            }
            gsl_Expects(window_.has_value());
            auto narrowed = gsl::narrow_cast<unsigned short>(*dim);
            (entry.index == kWindowRowsIndex ? window_->rows : window_->cols) = narrowed;
            return Ok();
        }
    }
    return make_error(ErrorCode::UnsupportedAttribute, "attribute '" + entry.name + "' has no category");
}

Result<Value> AttributeSet::get(std::string_view name) const {
    const CatalogEntry* entry = TERMATTR_TRY(Catalog::instance().resolve(name));
    return derive(*entry);
}

Result<Assignments> AttributeSet::get_all() const {
    Assignments all;
    const auto& entries = Catalog::instance().entries();
    all.reserve(entries.size());
    for (const auto& entry : entries) {
        all.emplace_back(entry.name, TERMATTR_TRY(derive(entry)));
    }
    return all;
}

Result<void> AttributeSet::set(std::string_view name, const Value& value) {
    const CatalogEntry* entry = TERMATTR_TRY(Catalog::instance().resolve(name));
    TERMATTR_TRY(assign(*entry, value));
    if (TERMATTR_LOG_ENABLED(Trace)) {
        TERMATTR_LOG_TRACE("ATTRS", "%s := %s", entry->name.c_str(), to_display_string(value).c_str());
    }
    return Ok();
}

Result<void> AttributeSet::set_many(const Assignments& assignments) {
    const Catalog& catalog = Catalog::instance();

    std::vector<std::string> unknown;
    for (const auto& [name, value] : assignments) {
        if (!catalog.contains(name)) {
            unknown.push_back(name);
        }
    }
    if (!unknown.empty()) {
        return make_error(ErrorCode::UnsupportedAttribute,
                          "attributes unsupported on platform: " + join_names(unknown));
    }

    AttributeSet candidate = *this;
    for (const auto& [name, value] : assignments) {
        TERMATTR_TRY(candidate.set(name, value));
    }
    *this = std::move(candidate);
    return Ok();
}

std::string AttributeSet::to_string() const {
    std::string out;
    for (const auto& entry : Catalog::instance().entries()) {
        if (!out.empty()) {
            out += ", ";
        }
        auto value = derive(entry);
        out += entry.name + "=" + (value ? to_display_string(*value) : std::string("?"));
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// Device transfer
// ─────────────────────────────────────────────────────────────────────────────

Result<void> AttributeSet::fetch_from(ITerminalDevice& device) {
    RawAttributes raw = TERMATTR_TRY(device.get_attributes());

    std::optional<RawWindowSize> window = window_;
    if (Catalog::instance().has_window_size() && device.supports_window_size()) {
        window = TERMATTR_TRY(device.get_window_size());
    }

    raw_ = raw;
    window_ = window;

    TERMATTR_LOG_DEBUG("DEVICE", "fetched attributes (iflag=%#x oflag=%#x cflag=%#x lflag=%#x)",
                       static_cast<unsigned>(raw_.iflag), static_cast<unsigned>(raw_.oflag),
                       static_cast<unsigned>(raw_.cflag), static_cast<unsigned>(raw_.lflag));
    return Ok();
}

Result<void> AttributeSet::apply_to(ITerminalDevice& device, const ApplyOptions& options) const {
    if (options.apply_attributes) {
        TERMATTR_TRY(device.set_attributes(raw_, options.when));
        TERMATTR_LOG_DEBUG("DEVICE", "applied attributes (when=%s)", termattr::to_string(options.when));
    }

    if (options.apply_window_size && window_ && device.supports_window_size()) {
        TERMATTR_TRY(device.set_window_size(*window_));
        TERMATTR_LOG_DEBUG("DEVICE", "applied window size %ux%u",
                           static_cast<unsigned>(window_->rows), static_cast<unsigned>(window_->cols));
    }
    return Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Persistence
// ─────────────────────────────────────────────────────────────────────────────

Result<Snapshot> AttributeSet::snapshot() const {
    Snapshot snap;
    snap.raw_attributes = raw_;
    snap.raw_window_size = window_;
    snap.values = TERMATTR_TRY(get_all());
    return snap;
}

Result<void> AttributeSet::restore(const Snapshot& snapshot) {
    const Catalog& catalog = Catalog::instance();

    if (!snapshot.raw_attributes) {
        TERMATTR_LOG_WARN("SNAPSHOT", "restore rejected: no raw attribute block");
        return make_error(ErrorCode::MalformedSnapshot, "snapshot does not contain a raw attribute block");
    }
    if (catalog.has_window_size() && !snapshot.raw_window_size) {
        TERMATTR_LOG_WARN("SNAPSHOT", "restore rejected: no raw window-size block");
        return make_error(ErrorCode::MalformedSnapshot, "snapshot does not contain a raw window-size block");
    }

    std::vector<std::string> missing;
    for (const auto& entry : catalog.entries()) {
        if (snapshot.find(entry.name) == nullptr) {
            missing.push_back(entry.name);
        }
    }
    if (!missing.empty()) {
        TERMATTR_LOG_WARN("SNAPSHOT", "restore rejected: %zu required attributes missing", missing.size());
        return make_error(ErrorCode::IncompleteSnapshot,
                          "snapshot lacks attributes required on platform: " + join_names(missing));
    }

    AttributeSet candidate;
    candidate.raw_ = *snapshot.raw_attributes;
    if (catalog.has_window_size()) {
        candidate.window_ = snapshot.raw_window_size;
    }

    auto applied = candidate.set_many(snapshot.values);
    if (!applied) {
        TERMATTR_LOG_WARN("SNAPSHOT", "restore rejected: %s", applied.error().message().c_str());
        return applied;
    }

    *this = std::move(candidate);
    return Ok();
}

} // namespace termattr
