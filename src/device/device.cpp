// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 termattr Contributors
//
// Device Boundary - Shared Helpers

#include "termattr/device.h"

namespace termattr {

bool parse_apply_timing(std::string_view text, ApplyTiming& out) noexcept {
    for (auto timing : {ApplyTiming::Now, ApplyTiming::Drain, ApplyTiming::Flush}) {
        if (text == to_string(timing)) {
            out = timing;
            return true;
        }
    }
    return false;
}

} // namespace termattr
