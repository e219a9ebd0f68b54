/**
 * @file snapshot.h
 * @brief Self-describing serialized form of an attribute set.
 *
 * A snapshot is a flat mapping from attribute name to symbolic value
 * plus two reserved keys carrying the raw blocks verbatim:
 *
 * @code
 *   {
 *     "_termios": [iflag, oflag, cflag, lflag, ispeed, ospeed, [cc0, cc1, ...]],
 *     "_winsize": [rows, cols, xpixel, ypixel],      // or null
 *     "echo": true,
 *     "csize": "cs8",
 *     "intr": "^C",
 *     ...
 *   }
 * @endcode
 *
 * Snapshots are produced by AttributeSet::snapshot() and consumed by
 * AttributeSet::restore(). Structural checks against the current
 * platform happen in restore(); this layer only encodes and decodes.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "error.h"
#include "raw_block.h"
#include "value.h"

#include <optional>
#include <string>
#include <string_view>

namespace termattr {

/// Reserved key of the raw attribute block.
inline constexpr std::string_view kSnapshotAttributesKey = "_termios";

/// Reserved key of the raw window-size block.
inline constexpr std::string_view kSnapshotWindowSizeKey = "_winsize";

/**
 * @brief Decoded snapshot data.
 *
 * @c raw_attributes is empty when the reserved key was absent from the
 * source text; restore() rejects such data as malformed.
 * @c raw_window_size is empty when the key was absent or null.
 * @c values holds every other key in document order.
 */
struct Snapshot {
    std::optional<RawAttributes> raw_attributes;
    std::optional<RawWindowSize> raw_window_size;
    Assignments values;

    /// Value stored under @p name, or nullptr.
    [[nodiscard]] const Value* find(std::string_view name) const noexcept;

    /// Encode as a JSON object.
    [[nodiscard]] std::string to_json() const;

    /**
     * @brief Decode a JSON object.
     *
     * @return ParseError for text that is not a JSON object of scalars
     *         and the reserved arrays; MalformedSnapshot when a reserved
     *         key has the wrong shape (wrong arity, non-integer fields,
     *         control-character array of the wrong length)
     */
    [[nodiscard]] static Result<Snapshot> from_json(std::string_view text);
};

/**
 * @brief Write a snapshot to @p path as JSON.
 * @return FileError if the file cannot be written
 */
[[nodiscard]] Result<void> save_snapshot_file(const Snapshot& snapshot, const std::string& path);

/**
 * @brief Read and decode a snapshot file.
 * @return FileError if the file cannot be read, otherwise as from_json()
 */
[[nodiscard]] Result<Snapshot> load_snapshot_file(const std::string& path);

} // namespace termattr
