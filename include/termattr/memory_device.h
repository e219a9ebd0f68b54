// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 termattr Contributors
//
// Device Boundary - In-Memory Terminal Device

#pragma once

#include "termattr/device.h"

#include <cstdint>
#include <optional>

namespace termattr {

/// In-memory terminal device for testing.
///
/// Holds one raw attribute block and, when window-size support is
/// enabled, one raw window-size block. Every call is non-blocking.
/// Tests can inspect the last apply timing, count calls and make the
/// next call fail with a chosen errno.
class MemoryTerminalDevice : public ITerminalDevice {
public:
    /// @param window_size_supported whether the window-size block exists
    explicit MemoryTerminalDevice(bool window_size_supported = kHaveWindowSize);

    // ═══════════════════════════════════════════════════════════════════════
    // ITerminalDevice
    // ═══════════════════════════════════════════════════════════════════════

    Result<RawAttributes> get_attributes() override;
    Result<void> set_attributes(const RawAttributes& raw, ApplyTiming timing) override;

    bool supports_window_size() const override { return window_size_supported_; }
    Result<RawWindowSize> get_window_size() override;
    Result<void> set_window_size(const RawWindowSize& size) override;

    // ═══════════════════════════════════════════════════════════════════════
    // Test API
    // ═══════════════════════════════════════════════════════════════════════

    /// Stored raw attribute block.
    const RawAttributes& attributes() const noexcept { return attributes_; }
    void set_stored_attributes(const RawAttributes& raw) noexcept { attributes_ = raw; }

    /// Stored raw window-size block.
    const RawWindowSize& window_size() const noexcept { return window_size_; }
    void set_stored_window_size(const RawWindowSize& size) noexcept { window_size_ = size; }

    /// Timing of the most recent successful set_attributes(), if any.
    std::optional<ApplyTiming> last_timing() const noexcept { return last_timing_; }

    uint32_t get_count() const noexcept { return get_count_; }
    uint32_t set_attributes_count() const noexcept { return set_attributes_count_; }
    uint32_t set_window_size_count() const noexcept { return set_window_size_count_; }

    /// Make the next device call fail with DeviceError carrying @p err.
    void fail_next_call(int err) noexcept { pending_errno_ = err; }

    /// Seed the stored block with a typical cooked-mode configuration.
    void load_cooked_defaults();

private:
    std::optional<Error> take_failure(const char* call);

    RawAttributes attributes_{};
    RawWindowSize window_size_{};
    bool window_size_supported_;
    std::optional<ApplyTiming> last_timing_;
    uint32_t get_count_ = 0;
    uint32_t set_attributes_count_ = 0;
    uint32_t set_window_size_count_ = 0;
    int pending_errno_ = 0;
};

} // namespace termattr
