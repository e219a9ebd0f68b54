/**
 * @file raw_block.h
 * @brief Raw terminal attribute block and raw window-size block.
 *
 * These mirror what the terminal-control interface hands out:
 * four flag words, two encoded line speeds and the control-character
 * array, plus the optional row/column/pixel geometry block.
 * The raw block is the single source of truth for every symbolic
 * attribute; nothing else stores attribute state.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <termios.h>
#include <sys/ioctl.h>

#include <array>
#include <cstddef>

namespace termattr {

/// True when the platform can query and set the window size.
#if defined(TIOCGWINSZ) && defined(TIOCSWINSZ)
inline constexpr bool kHaveWindowSize = true;
#else
inline constexpr bool kHaveWindowSize = false;
#endif

/// Number of control-character slots in the raw block.
inline constexpr std::size_t kControlCharCount = NCCS;

/**
 * @brief Raw terminal attribute block.
 *
 * Field order follows the terminal-control interface: input flags,
 * output flags, control flags, local flags, input speed, output speed,
 * control characters. Speeds hold the encoded Bxxx constants, not
 * numeric baud rates.
 */
struct RawAttributes {
    tcflag_t iflag = 0;
    tcflag_t oflag = 0;
    tcflag_t cflag = 0;
    tcflag_t lflag = 0;
    speed_t ispeed = 0;
    speed_t ospeed = 0;
    std::array<cc_t, kControlCharCount> cc{};

    bool operator==(const RawAttributes&) const = default;
};

/**
 * @brief Raw window-size block (rows, columns and two pixel dimensions).
 *
 * The pixel fields are carried verbatim; no attribute maps onto them.
 */
struct RawWindowSize {
    unsigned short rows = 0;
    unsigned short cols = 0;
    unsigned short xpixel = 0;
    unsigned short ypixel = 0;

    bool operator==(const RawWindowSize&) const = default;
};

} // namespace termattr
