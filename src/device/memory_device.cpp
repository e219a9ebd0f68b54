// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 termattr Contributors
//
// Device Boundary - In-Memory Terminal Device Implementation

#include "termattr/memory_device.h"
#include "termattr/control_char.h"

#include <cstring>

namespace termattr {

MemoryTerminalDevice::MemoryTerminalDevice(bool window_size_supported)
    : window_size_supported_(window_size_supported) {}

std::optional<Error> MemoryTerminalDevice::take_failure(const char* call) {
    if (pending_errno_ == 0) {
        return std::nullopt;
    }
    int err = pending_errno_;
    pending_errno_ = 0;
    return Error::from_errno(err, std::string(call) + " failed: " + std::strerror(err));
}

// ═══════════════════════════════════════════════════════════════════════════
// Attribute Block
// ═══════════════════════════════════════════════════════════════════════════

Result<RawAttributes> MemoryTerminalDevice::get_attributes() {
    if (auto failure = take_failure("get_attributes")) {
        return Err(std::move(*failure));
    }
    ++get_count_;
    return attributes_;
}

Result<void> MemoryTerminalDevice::set_attributes(const RawAttributes& raw, ApplyTiming timing) {
    if (auto failure = take_failure("set_attributes")) {
        return Err(std::move(*failure));
    }
    attributes_ = raw;
    last_timing_ = timing;
    ++set_attributes_count_;
    return Ok();
}

// ═══════════════════════════════════════════════════════════════════════════
// Window Size
// ═══════════════════════════════════════════════════════════════════════════

Result<RawWindowSize> MemoryTerminalDevice::get_window_size() {
    if (!window_size_supported_) {
        return make_error(ErrorCode::NotSupported, "window size not supported by device");
    }
    if (auto failure = take_failure("get_window_size")) {
        return Err(std::move(*failure));
    }
    return window_size_;
}

Result<void> MemoryTerminalDevice::set_window_size(const RawWindowSize& size) {
    if (!window_size_supported_) {
        return make_error(ErrorCode::NotSupported, "window size not supported by device");
    }
    if (auto failure = take_failure("set_window_size")) {
        return Err(std::move(*failure));
    }
    window_size_ = size;
    ++set_window_size_count_;
    return Ok();
}

// ═══════════════════════════════════════════════════════════════════════════
// Test API
// ═══════════════════════════════════════════════════════════════════════════

void MemoryTerminalDevice::load_cooked_defaults() {
    RawAttributes raw{};
    raw.iflag = ICRNL | IXON;
    raw.oflag = OPOST | ONLCR;
    raw.cflag = CS8 | CREAD;
    raw.lflag = ISIG | ICANON | ECHO | ECHOE | ECHOK | IEXTEN;
    raw.ispeed = B38400;
    raw.ospeed = B38400;
    raw.cc.fill(kDisabledChar);
    raw.cc[VINTR] = control_char('C');
    raw.cc[VQUIT] = control_char('\\');
    raw.cc[VERASE] = kDeleteChar;
    raw.cc[VKILL] = control_char('U');
    raw.cc[VEOF] = control_char('D');
    raw.cc[VSTART] = control_char('Q');
    raw.cc[VSTOP] = control_char('S');
    raw.cc[VSUSP] = control_char('Z');
    raw.cc[VMIN] = 1;
    raw.cc[VTIME] = 0;
    attributes_ = raw;

    window_size_ = RawWindowSize{24, 80, 0, 0};
}

} // namespace termattr
