// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 termattr Contributors
//
// Device Boundary - Terminal Device Interface

#pragma once

#include "termattr/error.h"
#include "termattr/raw_block.h"

#include <termios.h>

#include <string_view>

namespace termattr {

/// When a new raw attribute block takes effect relative to pending I/O.
///
/// These are the three timing modes of tcsetattr(3), preserved verbatim.
enum class ApplyTiming {
    Now,    ///< TCSANOW: immediately
    Drain,  ///< TCSADRAIN: after all queued output has been transmitted
    Flush   ///< TCSAFLUSH: after draining output; pending input is discarded
};

[[nodiscard]] constexpr const char* to_string(ApplyTiming timing) noexcept {
    switch (timing) {
        case ApplyTiming::Now:   return "now";
        case ApplyTiming::Drain: return "drain";
        case ApplyTiming::Flush: return "flush";
    }
    return "unknown";
}

/// Parse "now", "drain" or "flush".
/// @return false if @p text names no timing mode (@p out untouched)
[[nodiscard]] bool parse_apply_timing(std::string_view text, ApplyTiming& out) noexcept;

/// The tcsetattr(3) optional_actions constant for @p timing.
[[nodiscard]] constexpr int to_native(ApplyTiming timing) noexcept {
    switch (timing) {
        case ApplyTiming::Now:   return TCSANOW;
        case ApplyTiming::Drain: return TCSADRAIN;
        case ApplyTiming::Flush: return TCSAFLUSH;
    }
    return TCSANOW;
}

/// What AttributeSet::apply_to() pushes, and when.
struct ApplyOptions {
    ApplyTiming when = ApplyTiming::Now;
    bool apply_attributes = true;
    bool apply_window_size = true;
};

/// Terminal device collaborator.
///
/// Implementations perform one blocking system call per operation;
/// each call either fully succeeds or fails as the OS defines it.
/// Failures are reported as ErrorCode::DeviceError carrying the native
/// errno, or ErrorCode::NotSupported for an absent capability.
///
/// The device does not own attribute state. AttributeSet borrows it
/// for the duration of one fetch or apply call only.
class ITerminalDevice {
public:
    virtual ~ITerminalDevice() = default;

    // ═══════════════════════════════════════════════════════════════════════
    // Attribute Block
    // ═══════════════════════════════════════════════════════════════════════

    /// Read the live raw attribute block.
    virtual Result<RawAttributes> get_attributes() = 0;

    /// Replace the raw attribute block using the given timing mode.
    /// @note Drain and Flush block until pending output is transmitted
    virtual Result<void> set_attributes(const RawAttributes& raw, ApplyTiming timing) = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Window Size
    // ═══════════════════════════════════════════════════════════════════════

    /// Whether get_window_size()/set_window_size() are available.
    virtual bool supports_window_size() const = 0;

    /// Read the live raw window-size block.
    /// @return NotSupported when supports_window_size() is false
    virtual Result<RawWindowSize> get_window_size() = 0;

    /// Replace the raw window-size block.
    /// @return NotSupported when supports_window_size() is false
    virtual Result<void> set_window_size(const RawWindowSize& size) = 0;
};

} // namespace termattr
