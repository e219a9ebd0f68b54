/**
 * @file config.cpp
 * @brief Tool configuration validation, argv parsing and setting tokens.
 *
 * @copyright GPL-2.0-or-later
 */

#include "termattr/config.h"
#include "termattr/catalog.h"

#include <charconv>
#include <optional>

namespace termattr {

namespace {

std::optional<std::int64_t> parse_integer(std::string_view text) {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

/// Convert the text after '=' into the value shape @p entry expects.
Result<Value> value_from_text(const CatalogEntry& entry, std::string_view text) {
    switch (entry.category) {
        case Category::BooleanFlag:
            if (text == "on" || text == "true" || text == "yes" || text == "1") {
                return Value{true};
            }
            if (text == "off" || text == "false" || text == "no" || text == "0") {
                return Value{false};
            }
            return make_error(ErrorCode::InvalidValue,
                              "unsupported value '" + std::string(text) + "' for attribute '" +
                              entry.name + "'");

        case Category::EnumeratedFlag:
            if (auto number = parse_integer(text)) {
                return Value{*number};
            }
            return Value{std::string(text)};

        case Category::ControlCharacter:
            return Value{std::string(text)};

        case Category::Speed:
        case Category::NonCanonicalCount:
        case Category::WindowDimension:
            if (auto number = parse_integer(text)) {
                return Value{*number};
            }
            return make_error(ErrorCode::InvalidType,
                              "value of attribute '" + entry.name + "' must be an integer, got '" +
                              std::string(text) + "'");
    }
    return make_error(ErrorCode::InvalidValue, "attribute '" + entry.name + "' has no category");
}

/// Split "--name=value" into name and value.
bool split_long_option(std::string_view arg, std::string_view& name, std::string_view& value) {
    auto eq = arg.find('=');
    if (eq == std::string_view::npos) {
        name = arg;
        return false;
    }
    name = arg.substr(0, eq);
    value = arg.substr(eq + 1);
    return true;
}

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// ToolConfigBuilder
// ─────────────────────────────────────────────────────────────────────────────

Result<ToolConfig> ToolConfigBuilder::build() {
    errors_.clear();

    if (device_given_ && config_.device_path.empty()) {
        errors_.push_back("Device path must not be empty");
    }

    if (!config_.save_path.empty() && config_.save_path == config_.load_path) {
        errors_.push_back("Snapshot save and load paths must differ");
    }

    if (!errors_.empty()) {
        std::string msg = "Configuration validation failed:";
        for (const auto& err : errors_) {
            msg += "\n  - " + err;
        }
        return Err(Error(ErrorCode::InvalidArgument, msg));
    }

    ToolConfig config = config_;
    if (show_all_) {
        config.output = OutputMode::All;
    } else if (!config.settings.empty() || !config.save_path.empty() || !config.load_path.empty()) {
        config.output = OutputMode::None;
    } else {
        config.output = OutputMode::All;
    }
    return Ok(std::move(config));
}

// ─────────────────────────────────────────────────────────────────────────────
// Command Line
// ─────────────────────────────────────────────────────────────────────────────

std::string usage_text(std::string_view program) {
    std::string text = "Usage: " + std::string(program) +
        " [-h] [-F DEVICE] [-a] [-g FILE] [-l FILE] [--help-settings]\n"
        "       [--when now|drain|flush] [--log-level LEVEL] [--no-winsize] [SETTING...]\n"
        "\n"
        "Print or change terminal attributes.\n"
        "\n"
        "  -F, --file DEVICE    operate on DEVICE instead of standard input\n"
        "  -a, --all            print every attribute after applying settings\n"
        "  -g, --save FILE      save a snapshot of the resulting attributes to FILE\n"
        "  -l, --load FILE      restore the snapshot in FILE before applying settings\n"
        "      --help-settings  list the attributes supported on this platform\n"
        "      --when MODE      apply now, after output drains, or after drain and flush\n"
        "      --log-level LVL  error, warn, info, debug or trace\n"
        "      --no-winsize     do not write the window size back to the device\n"
        "  -h, --help           show this help\n"
        "\n"
        "SETTING is NAME, -NAME, NAME=VALUE, a speed, or one of\n"
        "raw, evenp, -evenp, oddp, -oddp, nl, -nl, ek.\n";
    return text;
}

Result<ToolConfig> parse_command_line(int argc, const char* const* argv) {
    ToolConfigBuilder builder;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (options_done || arg.empty() || arg[0] != '-') {
            builder.with_setting(std::string(arg));
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        std::string_view name;
        std::string_view inline_value;
        bool has_inline = arg.starts_with("--") && split_long_option(arg, name, inline_value);
        if (!has_inline) {
            name = arg;
        }

        auto take_value = [&](std::string_view option) -> Result<std::string> {
            if (has_inline) {
                return std::string(inline_value);
            }
            if (i + 1 >= argc) {
                return make_error(ErrorCode::InvalidArgument,
                                  "option '" + std::string(option) + "' requires a value");
            }
            return std::string(argv[++i]);
        };

        if (name == "-h" || name == "--help") {
            builder.show_usage();
        } else if (name == "-a" || name == "--all") {
            builder.show_all();
        } else if (name == "--help-settings") {
            builder.show_help_settings();
        } else if (name == "--no-winsize") {
            builder.with_window_size(false);
        } else if (name == "-F" || name == "--file") {
            builder.with_device(TERMATTR_TRY(take_value(name)));
        } else if (name == "-g" || name == "--save") {
            builder.with_save(TERMATTR_TRY(take_value(name)));
        } else if (name == "-l" || name == "--load") {
            builder.with_load(TERMATTR_TRY(take_value(name)));
        } else if (name == "--when") {
            auto text = TERMATTR_TRY(take_value(name));
            ApplyTiming when = ApplyTiming::Now;
            if (!parse_apply_timing(text, when)) {
                return make_error(ErrorCode::InvalidArgument,
                                  "invalid --when mode '" + text + "' (expected now, drain or flush)");
            }
            builder.with_timing(when);
        } else if (name == "--log-level") {
            auto text = TERMATTR_TRY(take_value(name));
            LogLevel level = LogLevel::Warn;
            if (!parse_log_level(text, level)) {
                return make_error(ErrorCode::InvalidArgument, "invalid log level '" + text + "'");
            }
            builder.with_log_level(level);
        } else if (arg.starts_with("--")) {
            return make_error(ErrorCode::InvalidArgument, "unknown option '" + std::string(arg) + "'");
        } else {
            // "-echo" and friends
            builder.with_setting(std::string(arg));
        }
    }

    return builder.build();
}

// ─────────────────────────────────────────────────────────────────────────────
// Setting Tokens
// ─────────────────────────────────────────────────────────────────────────────

Result<void> apply_setting_token(AttributeSet& attrs, std::string_view token) {
    TERMATTR_CHECK(!token.empty(), ErrorCode::InvalidArgument, "empty setting");

    if (token == "raw")    return attrs.set_raw();
    if (token == "evenp")  return attrs.set_evenp(true);
    if (token == "-evenp") return attrs.set_evenp(false);
    if (token == "oddp")   return attrs.set_oddp(true);
    if (token == "-oddp")  return attrs.set_oddp(false);
    if (token == "nl")     return attrs.set_nl(true);
    if (token == "-nl")    return attrs.set_nl(false);
    if (token == "ek")     return attrs.set_ek();

    const Catalog& catalog = Catalog::instance();

    if (auto eq = token.find('='); eq != std::string_view::npos) {
        std::string_view name = token.substr(0, eq);
        const CatalogEntry* entry = TERMATTR_TRY(catalog.resolve(name));
        Value value = TERMATTR_TRY(value_from_text(*entry, token.substr(eq + 1)));
        return attrs.set(name, value);
    }

    if (token[0] == '-' && token.size() > 1) {
        std::string_view name = token.substr(1);
        const CatalogEntry* entry = TERMATTR_TRY(catalog.resolve(name));
        TERMATTR_CHECK(entry->category == Category::BooleanFlag, ErrorCode::InvalidArgument,
                       "'-" + entry->name + "' applies to boolean attributes only");
        return attrs.set(name, false);
    }

    if (auto rate = parse_integer(token)) {
        return attrs.set_many({{"ispeed", *rate}, {"ospeed", *rate}});
    }

    if (catalog.contains(token)) {
        const CatalogEntry* entry = TERMATTR_TRY(catalog.resolve(token));
        TERMATTR_CHECK(entry->category == Category::BooleanFlag, ErrorCode::InvalidArgument,
                       "attribute '" + entry->name + "' needs a value (" + entry->name + "=VALUE)");
        return attrs.set(token, true);
    }

    for (const auto& entry : catalog.entries()) {
        if (entry.category == Category::EnumeratedFlag && entry.find_member(token) != nullptr) {
            return attrs.set(entry.name, std::string(token));
        }
    }

    return make_error(ErrorCode::UnsupportedAttribute,
                      "attribute '" + std::string(token) + "' unsupported on platform");
}

} // namespace termattr
