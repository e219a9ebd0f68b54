// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 termattr Contributors
//
// Device Boundary - POSIX Terminal Device Implementation

#include "termattr/posix_device.h"
#include "termattr/logging.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <termios.h>

namespace termattr {

namespace {

std::string errno_message(const char* call, int err) {
    return std::string(call) + " failed: " + std::strerror(err);
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

Result<std::unique_ptr<PosixTerminalDevice>> PosixTerminalDevice::open(const std::string& path) {
    UniqueFd fd(::open(path.c_str(), O_RDWR | O_NOCTTY));
    if (!fd.valid()) {
        int err = errno;
        return Err(Error::from_errno(err, path + ": " + errno_message("open", err)));
    }
    TERMATTR_LOG_DEBUG("DEVICE", "opened %s as fd %d", path.c_str(), fd.get());
    return std::unique_ptr<PosixTerminalDevice>(new PosixTerminalDevice(std::move(fd)));
}

// ═══════════════════════════════════════════════════════════════════════════
// Conversion
// ═══════════════════════════════════════════════════════════════════════════

RawAttributes PosixTerminalDevice::from_termios(const struct termios& native) noexcept {
    RawAttributes raw;
    raw.iflag = native.c_iflag;
    raw.oflag = native.c_oflag;
    raw.cflag = native.c_cflag;
    raw.lflag = native.c_lflag;
    raw.ispeed = cfgetispeed(&native);
    raw.ospeed = cfgetospeed(&native);
    std::copy_n(std::begin(native.c_cc), kControlCharCount, raw.cc.begin());
    return raw;
}

Result<struct termios> PosixTerminalDevice::to_termios(const RawAttributes& raw,
                                                       const struct termios& base) {
    struct termios native = base;
    native.c_iflag = raw.iflag;
    native.c_oflag = raw.oflag;
    native.c_cflag = raw.cflag;
    native.c_lflag = raw.lflag;
    std::copy(raw.cc.begin(), raw.cc.end(), std::begin(native.c_cc));

    if (cfsetispeed(&native, raw.ispeed) != 0) {
        int err = errno;
        return Err(Error::from_errno(err, errno_message("cfsetispeed", err)));
    }
    if (cfsetospeed(&native, raw.ospeed) != 0) {
        int err = errno;
        return Err(Error::from_errno(err, errno_message("cfsetospeed", err)));
    }
    return native;
}

// ═══════════════════════════════════════════════════════════════════════════
// Attribute Block
// ═══════════════════════════════════════════════════════════════════════════

Result<RawAttributes> PosixTerminalDevice::get_attributes() {
    struct termios native;
    if (tcgetattr(fd_, &native) != 0) {
        int err = errno;
        return Err(Error::from_errno(err, errno_message("tcgetattr", err)));
    }
    return from_termios(native);
}

Result<void> PosixTerminalDevice::set_attributes(const RawAttributes& raw, ApplyTiming timing) {
    // Start from the device's current block so unmodelled fields survive.
    struct termios current;
    if (tcgetattr(fd_, &current) != 0) {
        int err = errno;
        return Err(Error::from_errno(err, errno_message("tcgetattr", err)));
    }
    auto native = TERMATTR_TRY(to_termios(raw, current));
    if (tcsetattr(fd_, to_native(timing), &native) != 0) {
        int err = errno;
        return Err(Error::from_errno(err, errno_message("tcsetattr", err)));
    }
    return Ok();
}

// ═══════════════════════════════════════════════════════════════════════════
// Window Size
// ═══════════════════════════════════════════════════════════════════════════

Result<RawWindowSize> PosixTerminalDevice::get_window_size() {
#if defined(TIOCGWINSZ) && defined(TIOCSWINSZ)
    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    if (ioctl(fd_, TIOCGWINSZ, &ws) != 0) {
        int err = errno;
        return Err(Error::from_errno(err, errno_message("ioctl(TIOCGWINSZ)", err)));
    }
    return RawWindowSize{ws.ws_row, ws.ws_col, ws.ws_xpixel, ws.ws_ypixel};
#else
    return make_error(ErrorCode::NotSupported, "window size not supported on platform");
#endif
}

Result<void> PosixTerminalDevice::set_window_size(const RawWindowSize& size) {
#if defined(TIOCGWINSZ) && defined(TIOCSWINSZ)
    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_row = size.rows;
    ws.ws_col = size.cols;
    ws.ws_xpixel = size.xpixel;
    ws.ws_ypixel = size.ypixel;
    if (ioctl(fd_, TIOCSWINSZ, &ws) != 0) {
        int err = errno;
        return Err(Error::from_errno(err, errno_message("ioctl(TIOCSWINSZ)", err)));
    }
    return Ok();
#else
    (void)size;
    return make_error(ErrorCode::NotSupported, "window size not supported on platform");
#endif
}

} // namespace termattr
