// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 termattr Contributors
//
// Device Boundary - POSIX Terminal Device

#pragma once

#include "termattr/device.h"
#include "termattr/unique_fd.h"

#include <memory>
#include <string>

namespace termattr {

/// Terminal device backed by tcgetattr(3)/tcsetattr(3) and the
/// TIOCGWINSZ/TIOCSWINSZ ioctls on a file descriptor.
///
/// A device constructed from a descriptor borrows it; the caller keeps
/// it open for as long as the device is used. A device created through
/// open() owns its descriptor and closes it on destruction.
class PosixTerminalDevice : public ITerminalDevice {
public:
    explicit PosixTerminalDevice(int fd) noexcept : fd_(fd) {}

    /// Open @p path read-write without acquiring it as controlling terminal.
    /// @return DeviceError with errno if the open fails
    static Result<std::unique_ptr<PosixTerminalDevice>> open(const std::string& path);

    /// Underlying descriptor (borrowed or owned).
    int fd() const noexcept { return fd_; }

    // ═══════════════════════════════════════════════════════════════════════
    // ITerminalDevice
    // ═══════════════════════════════════════════════════════════════════════

    Result<RawAttributes> get_attributes() override;
    Result<void> set_attributes(const RawAttributes& raw, ApplyTiming timing) override;

    bool supports_window_size() const override { return kHaveWindowSize; }
    Result<RawWindowSize> get_window_size() override;
    Result<void> set_window_size(const RawWindowSize& size) override;

    // ═══════════════════════════════════════════════════════════════════════
    // Conversion
    // ═══════════════════════════════════════════════════════════════════════

    /// Raw block from a native termios structure.
    static RawAttributes from_termios(const struct termios& native) noexcept;

    /// Overlay a raw block onto @p base. Flags, control characters and
    /// speeds come from @p raw; every other native field (c_line on
    /// Linux) keeps its value from @p base.
    static Result<struct termios> to_termios(const RawAttributes& raw, const struct termios& base);

private:
    explicit PosixTerminalDevice(UniqueFd owned) noexcept
        : fd_(owned.get()), owned_(std::move(owned)) {}

    int fd_;
    UniqueFd owned_;
};

} // namespace termattr
