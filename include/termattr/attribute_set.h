/**
 * @file attribute_set.h
 * @brief Symbolic, validated view over one raw terminal attribute block.
 *
 * An AttributeSet owns one raw attribute block and, on platforms that
 * support it, one raw window-size block. Every symbolic attribute the
 * Catalog lists can be read and written by name; reads are derived from
 * the raw bits on each call, so a read always reflects the most recent
 * write and there is no separate symbolic copy that could drift.
 *
 * Every mutating operation either fully succeeds or leaves the set
 * unchanged.
 *
 * Example:
 * @code
 *   termattr::PosixTerminalDevice tty(STDIN_FILENO);
 *   auto attrs = termattr::AttributeSet::from_device(tty, {{"echo", false}});
 *   if (attrs) {
 *       attrs->set_raw();
 *       attrs->apply_to(tty, {.when = termattr::ApplyTiming::Drain});
 *   }
 * @endcode
 *
 * Not safe for concurrent mutation; serialize access externally.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "catalog.h"
#include "device.h"
#include "error.h"
#include "raw_block.h"
#include "snapshot.h"
#include "value.h"

#include <optional>
#include <string>
#include <string_view>

namespace termattr {

class AttributeSet {
public:
    /**
     * @brief Empty set: all raw fields zero.
     *
     * The window-size block is present (all zero) exactly when the
     * catalog lists window dimensions.
     */
    AttributeSet();

    // ─────────────────────────────────────────────────────────────────────────
    // Construction from external state
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Fetch from a device, then apply @p initial with set_many().
     */
    [[nodiscard]] static Result<AttributeSet> from_device(ITerminalDevice& device,
                                                          const Assignments& initial = {});

    /**
     * @brief Build a set by restoring @p snapshot.
     */
    [[nodiscard]] static Result<AttributeSet> from_snapshot(const Snapshot& snapshot);

    // ─────────────────────────────────────────────────────────────────────────
    // Symbolic access
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Current symbolic value of @p name.
     *
     * Booleans read as bool, enumerated groups as their member name,
     * control characters as canonical notation (see control_char.h),
     * speeds, counts and window dimensions as integers.
     *
     * @return UnsupportedAttribute for a name outside the catalog, or
     *         InvalidValue when the raw bits hold a value the catalog
     *         cannot name (e.g. a speed encoding this platform lacks)
     */
    [[nodiscard]] Result<Value> get(std::string_view name) const;

    /**
     * @brief Every catalog attribute with its value, in catalog order.
     */
    [[nodiscard]] Result<Assignments> get_all() const;

    /**
     * @brief Write one attribute.
     *
     * Exactly one raw field changes on success; nothing changes on
     * failure.
     *
     * @return UnsupportedAttribute, InvalidType or InvalidValue
     */
    [[nodiscard]] Result<void> set(std::string_view name, const Value& value);

    /**
     * @brief Write several attributes in order, all or nothing.
     *
     * Unknown names are rejected before anything is written and are
     * all listed in the UnsupportedAttribute message. A validation
     * failure on any later pair discards the earlier ones too.
     */
    [[nodiscard]] Result<void> set_many(const Assignments& assignments);

    // ─────────────────────────────────────────────────────────────────────────
    // Device transfer
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Replace both raw blocks with the device's live state.
     *
     * The window-size block is fetched only when both the catalog and
     * the device support it. On failure the set is unchanged.
     */
    [[nodiscard]] Result<void> fetch_from(ITerminalDevice& device);

    /**
     * @brief Push the raw attribute block and/or window-size block.
     *
     * @p options.when selects the tcsetattr(3) timing mode. Device
     * errors are returned unchanged.
     */
    [[nodiscard]] Result<void> apply_to(ITerminalDevice& device, const ApplyOptions& options = {}) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Persistence
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Self-describing copy of both raw blocks plus every symbolic value.
     */
    [[nodiscard]] Result<Snapshot> snapshot() const;

    /**
     * @brief Install a snapshot.
     *
     * @return MalformedSnapshot when the raw attribute block is absent;
     *         IncompleteSnapshot when any catalog attribute is missing from
     *         the remaining values; otherwise any error set() raises while
     *         re-applying the values over the installed raw blocks
     */
    [[nodiscard]] Result<void> restore(const Snapshot& snapshot);

    // ─────────────────────────────────────────────────────────────────────────
    // Composite modes
    // ─────────────────────────────────────────────────────────────────────────

    /// evenp / -evenp
    [[nodiscard]] Result<void> set_evenp(bool enable);

    /// oddp / -oddp
    [[nodiscard]] Result<void> set_oddp(bool enable);

    /// raw: every input and local flag off, no output processing,
    /// no parity, 8-bit characters, min=1, time=0.
    [[nodiscard]] Result<void> set_raw();

    /// nl / -nl
    [[nodiscard]] Result<void> set_nl(bool enable);

    /// ek: erase and kill to the platform's compiled-in defaults, where defined.
    [[nodiscard]] Result<void> set_ek();

    // ─────────────────────────────────────────────────────────────────────────
    // Raw access
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const RawAttributes& raw_attributes() const noexcept { return raw_; }
    [[nodiscard]] const std::optional<RawWindowSize>& raw_window_size() const noexcept { return window_; }

    /// "name=value, name=value, ..." in catalog order.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const AttributeSet&) const = default;

private:
    Result<Value> derive(const CatalogEntry& entry) const;
    Result<void> assign(const CatalogEntry& entry, const Value& value);

    tcflag_t& flag_word(FieldSelector field);
    tcflag_t flag_word(FieldSelector field) const;

    RawAttributes raw_{};
    std::optional<RawWindowSize> window_;
};

} // namespace termattr
