/**
 * @file catalog.h
 * @brief Platform-filtered registry of symbolic terminal attributes.
 *
 * The Catalog maps every symbolic attribute name supported on the
 * running platform to the raw field it occupies, its value domain and
 * how to translate between symbolic and raw forms. Candidate names
 * whose mask, value or index constant the platform does not define are
 * never registered, so "not supported here" is a lookup failure rather
 * than a silent no-op.
 *
 * The process-wide instance is built on first use and never modified
 * afterwards; concurrent readers need no synchronization.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "error.h"
#include "raw_block.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace termattr {

// ─────────────────────────────────────────────────────────────────────────────
// Entry Classification
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Value domain of an attribute.
 */
enum class Category {
    BooleanFlag,        ///< One mask in a flag word, on/off
    EnumeratedFlag,     ///< Mask selecting one of several named values
    Speed,              ///< Encoded line speed slot
    ControlCharacter,   ///< One byte in the control-character array
    NonCanonicalCount,  ///< MIN/TIME byte in the control-character array
    WindowDimension     ///< Rows or columns of the window-size block
};

/**
 * @brief Raw word or array an attribute lives in.
 */
enum class FieldSelector {
    InputFlags,
    OutputFlags,
    ControlFlags,
    LocalFlags,
    InputSpeed,
    OutputSpeed,
    ControlChars,
    WindowSize
};

[[nodiscard]] constexpr const char* to_string(Category category) noexcept {
    switch (category) {
        case Category::BooleanFlag:       return "boolean-flag";
        case Category::EnumeratedFlag:    return "enumerated-flag";
        case Category::Speed:             return "speed";
        case Category::ControlCharacter:  return "control-character";
        case Category::NonCanonicalCount: return "non-canonical-count";
        case Category::WindowDimension:   return "window-dimension";
    }
    return "unknown";
}

[[nodiscard]] constexpr const char* to_string(FieldSelector field) noexcept {
    switch (field) {
        case FieldSelector::InputFlags:   return "iflag";
        case FieldSelector::OutputFlags:  return "oflag";
        case FieldSelector::ControlFlags: return "cflag";
        case FieldSelector::LocalFlags:   return "lflag";
        case FieldSelector::InputSpeed:   return "ispeed";
        case FieldSelector::OutputSpeed:  return "ospeed";
        case FieldSelector::ControlChars: return "cc";
        case FieldSelector::WindowSize:   return "winsize";
    }
    return "unknown";
}

/// Index of the rows/cols dimensions inside the window-size block.
inline constexpr std::size_t kWindowRowsIndex = 0;
inline constexpr std::size_t kWindowColsIndex = 1;

// ─────────────────────────────────────────────────────────────────────────────
// Catalog Entry
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief One member of an enumerated group (e.g. "cs8" <-> CS8).
 */
struct EnumMember {
    std::string name;
    tcflag_t raw = 0;
};

/**
 * @brief Description of one symbolic attribute.
 *
 * @c mask is meaningful for flag categories, @c index for control
 * characters, non-canonical counts and window dimensions.
 * @c members is the injective value table of an enumerated group,
 * holding only the values this platform defines.
 */
struct CatalogEntry {
    std::string name;
    Category category = Category::BooleanFlag;
    FieldSelector field = FieldSelector::InputFlags;
    tcflag_t mask = 0;
    std::size_t index = 0;
    std::vector<EnumMember> members;

    [[nodiscard]] const EnumMember* find_member(std::string_view member_name) const noexcept;
    [[nodiscard]] const EnumMember* find_member(tcflag_t raw) const noexcept;
};

/**
 * @brief A supported line speed: numeric rate and its Bxxx encoding.
 */
struct BaudRate {
    std::int64_t rate = 0;
    speed_t code = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Catalog
// ─────────────────────────────────────────────────────────────────────────────

class Catalog {
public:
    /**
     * @brief Process-wide catalog, probed on first call.
     */
    [[nodiscard]] static const Catalog& instance();

    /**
     * @brief Build a catalog from the constants this platform defines.
     *
     * instance() calls this once; tests may call it to compare.
     */
    [[nodiscard]] static Catalog probe();

    /**
     * @brief Resolve a symbolic name to its entry.
     * @return Entry pointer (valid for the catalog's lifetime), or
     *         ErrorCode::UnsupportedAttribute
     */
    [[nodiscard]] Result<const CatalogEntry*> resolve(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const noexcept;

    /// All entries in registration order.
    [[nodiscard]] const std::vector<CatalogEntry>& entries() const noexcept { return entries_; }

    /// All attribute names in registration order.
    [[nodiscard]] std::vector<std::string> names() const;

    /// Names of one category in registration order.
    [[nodiscard]] std::vector<std::string> names(Category category) const;

    /// Boolean flag names living in one flag word.
    [[nodiscard]] std::vector<std::string> boolean_names(FieldSelector word) const;

    /// Supported baud rates, ascending.
    [[nodiscard]] const std::vector<BaudRate>& baud_rates() const noexcept { return baud_rates_; }

    [[nodiscard]] std::optional<speed_t> encode_speed(std::int64_t rate) const noexcept;
    [[nodiscard]] std::optional<std::int64_t> decode_speed(speed_t code) const noexcept;

    /// Whether rows/cols are registered (window-size capability present).
    [[nodiscard]] bool has_window_size() const noexcept { return has_window_size_; }

private:
    /// Hash that accepts string_view keys for lookup without allocation.
    struct NameHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view name) const noexcept {
            return std::hash<std::string_view>{}(name);
        }
    };

    Catalog() = default;

    void add(CatalogEntry entry);
    void add_boolean(FieldSelector word, const char* name, tcflag_t mask);
    void add_control_char(const char* name, std::size_t index);

    std::vector<CatalogEntry> entries_;
    std::unordered_map<std::string, std::size_t, NameHash, std::equal_to<>> by_name_;
    std::vector<BaudRate> baud_rates_;
    bool has_window_size_ = false;
};

} // namespace termattr
