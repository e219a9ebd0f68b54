/**
 * @file control_char.cpp
 * @brief Control-character notation codec.
 */

#include "termattr/control_char.h"

#include <cctype>
#include <optional>

namespace termattr {

namespace {

constexpr cc_t kMetaBit = 0x80;

// Characters allowed after '^' besides letters and '?'
constexpr std::string_view kCaretPunctuation = "@[\\]^_";

/// Decode a form without the "M-" prefix.
std::optional<cc_t> parse_plain(std::string_view body) {
    if (body.size() == 1) {
        return static_cast<cc_t>(static_cast<unsigned char>(body[0]));
    }

    if (body.size() == 2 && body[0] == '^') {
        char c = body[1];
        if (c == '?') {
            return kDeleteChar;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) ||
            kCaretPunctuation.find(c) != std::string_view::npos) {
            return control_char(c);
        }
    }

    return std::nullopt;
}

/// Encode a seven-bit byte without the disabled special case.
std::string format_plain(cc_t byte) {
    if (byte == kDeleteChar) {
        return "^?";
    }
    if (byte < 0x20) {
        return std::string{'^', static_cast<char>(byte + 0x40)};
    }
    return std::string(1, static_cast<char>(byte));
}

} // anonymous namespace

Result<cc_t> parse_control_char(std::string_view text) {
    if (text == "undef" || text == "^-") {
        return kDisabledChar;
    }

    bool meta = false;
    std::string_view body = text;
    if (text.size() > 2 && text.starts_with("M-")) {
        meta = true;
        body = text.substr(2);
    }

    auto byte = parse_plain(body);
    if (!byte) {
        return make_error(ErrorCode::InvalidValue,
                          "invalid control character notation '" + std::string(text) + "'");
    }

    return meta ? static_cast<cc_t>(*byte | kMetaBit) : *byte;
}

std::string format_control_char(cc_t byte) {
    if (byte == kDisabledChar) {
        return "undef";
    }
    if (byte & kMetaBit) {
        return "M-" + format_plain(static_cast<cc_t>(byte & ~kMetaBit));
    }
    return format_plain(byte);
}

} // namespace termattr
