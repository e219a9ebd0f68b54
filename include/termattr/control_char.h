/**
 * @file control_char.h
 * @brief Symbolic notation for control-character slots.
 *
 * Accepted input forms (stty(1) conventions):
 * - one character: "a", "^", " "
 * - caret notation "^X": the control code of X (X & 0x1F), letters
 *   case-insensitive; "^?" is DEL (127); "^-" means disabled
 * - "undef": disabled
 * - "M-" prefix on any of the above except the disabled forms:
 *   sets the high bit
 *
 * Output forms are canonical: "undef" for the disabled byte, "^?" for
 * DEL, "^" + upper-case letter for other control codes, the character
 * itself for printable ASCII, and "M-" + low-seven-bit form above 127.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "error.h"

#include <termios.h>
#include <unistd.h>

#include <string>
#include <string_view>

namespace termattr {

/// Byte that marks a control-character slot as disabled.
#ifdef _POSIX_VDISABLE
inline constexpr cc_t kDisabledChar = _POSIX_VDISABLE;
#else
inline constexpr cc_t kDisabledChar = 0;
#endif

/// DEL, written "^?".
inline constexpr cc_t kDeleteChar = 0x7F;

/**
 * @brief Control code for character @p c (c & 0x1F).
 */
[[nodiscard]] constexpr cc_t control_char(char c) noexcept {
    return static_cast<cc_t>(static_cast<unsigned char>(c) & 0x1F);
}

/**
 * @brief Decode symbolic notation into one raw byte.
 *
 * @return The byte, or ErrorCode::InvalidValue for any other shape
 */
[[nodiscard]] Result<cc_t> parse_control_char(std::string_view text);

/**
 * @brief Encode one raw byte in canonical symbolic notation.
 */
[[nodiscard]] std::string format_control_char(cc_t byte);

} // namespace termattr
