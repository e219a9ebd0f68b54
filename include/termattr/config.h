/**
 * @file config.h
 * @brief Command-line tool configuration and its fluent builder.
 *
 * ToolConfig collects everything the termattr tool needs before it
 * touches a device. ToolConfigBuilder validates a configuration as a
 * whole; parse_command_line() drives the builder from argv.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "attribute_set.h"
#include "device.h"
#include "error.h"
#include "exceptions.h"
#include "logging.h"

#include <string>
#include <string_view>
#include <vector>

namespace termattr {

// ─────────────────────────────────────────────────────────────────────────────
// ToolConfig
// ─────────────────────────────────────────────────────────────────────────────

/// What the tool prints after applying settings.
enum class OutputMode {
    None,   ///< Print nothing (settings given)
    All     ///< Print every attribute
};

/**
 * @brief Validated tool configuration.
 *
 * An empty @c device_path means standard input.
 */
struct ToolConfig {
    std::string device_path;
    ApplyTiming when = ApplyTiming::Now;
    bool apply_attributes = true;
    bool apply_window_size = true;
    LogLevel log_level = LogLevel::Warn;
    std::string save_path;
    std::string load_path;
    OutputMode output = OutputMode::All;
    bool help_settings = false;
    bool usage = false;

    /// Setting tokens in command-line order.
    std::vector<std::string> settings;

    [[nodiscard]] ApplyOptions apply_options() const noexcept {
        return ApplyOptions{when, apply_attributes, apply_window_size};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ToolConfigBuilder
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Fluent builder for ToolConfig.
 *
 * Example:
 * @code
 *   auto config = ToolConfigBuilder()
 *       .with_device("/dev/ttyS0")
 *       .with_timing(ApplyTiming::Drain)
 *       .with_setting("-echo")
 *       .build();
 * @endcode
 */
class ToolConfigBuilder {
public:
    ToolConfigBuilder() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Device
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Operate on @p path instead of standard input.
     * @return Reference to this builder for chaining
     */
    ToolConfigBuilder& with_device(std::string path) {
        config_.device_path = std::move(path);
        device_given_ = true;
        return *this;
    }

    /**
     * @brief Select the tcsetattr(3) timing mode.
     * @return Reference to this builder for chaining
     */
    ToolConfigBuilder& with_timing(ApplyTiming when) noexcept {
        config_.when = when;
        return *this;
    }

    ToolConfigBuilder& with_window_size(bool enabled = true) noexcept {
        config_.apply_window_size = enabled;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Persistence
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Save a snapshot to @p path after applying settings.
     * @return Reference to this builder for chaining
     */
    ToolConfigBuilder& with_save(std::string path) {
        config_.save_path = std::move(path);
        return *this;
    }

    /**
     * @brief Restore the snapshot in @p path before applying settings.
     * @return Reference to this builder for chaining
     */
    ToolConfigBuilder& with_load(std::string path) {
        config_.load_path = std::move(path);
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Output
    // ─────────────────────────────────────────────────────────────────────────

    ToolConfigBuilder& with_log_level(LogLevel level) noexcept {
        config_.log_level = level;
        return *this;
    }

    ToolConfigBuilder& show_all(bool enabled = true) noexcept {
        show_all_ = enabled;
        return *this;
    }

    ToolConfigBuilder& show_help_settings(bool enabled = true) noexcept {
        config_.help_settings = enabled;
        return *this;
    }

    ToolConfigBuilder& show_usage(bool enabled = true) noexcept {
        config_.usage = enabled;
        return *this;
    }

    /**
     * @brief Append one setting token ("echo", "-icanon", "min=1", "raw").
     * @return Reference to this builder for chaining
     */
    ToolConfigBuilder& with_setting(std::string token) {
        config_.settings.push_back(std::move(token));
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Build
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Validate and build configuration.
     *
     * Every problem found is listed in one InvalidArgument error.
     * Output defaults to All when there is nothing else to do, and to
     * None when settings, a snapshot save or a snapshot load are given,
     * unless show_all() was requested.
     */
    [[nodiscard]] Result<ToolConfig> build();

    /**
     * @brief Build or throw on error.
     * @throws ResultException if validation fails
     */
    [[nodiscard]] ToolConfig build_or_throw() {
        return value_or_throw(build());
    }

    /// Validation errors from the last build() call.
    [[nodiscard]] const std::vector<std::string>& errors() const noexcept {
        return errors_;
    }

private:
    ToolConfig config_;
    bool device_given_ = false;
    bool show_all_ = false;
    std::vector<std::string> errors_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Command Line
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Parse tool arguments (argv[0] is skipped).
 *
 * @code
 *   termattr [-h] [-F DEVICE] [-a] [-g FILE] [-l FILE] [--help-settings]
 *            [--when now|drain|flush] [--log-level LEVEL] [SETTING...]
 * @endcode
 *
 * A token starting with '-' that is not a known option is a setting
 * ("-echo"). "--" ends option processing.
 *
 * @return InvalidArgument for unknown options, missing option values
 *         or a configuration build() rejects
 */
[[nodiscard]] Result<ToolConfig> parse_command_line(int argc, const char* const* argv);

/// Usage text for the tool.
[[nodiscard]] std::string usage_text(std::string_view program);

/**
 * @brief Apply one setting token to @p attrs.
 *
 * Accepted forms:
 * - composite modes: raw, evenp, -evenp, oddp, -oddp, nl, -nl, ek
 * - "name": boolean on, or an enumerated member such as "cs8"
 * - "-name": boolean off
 * - "name=value": integer text for speeds, counts and window sizes,
 *   member name or integer for enumerated groups, notation for
 *   control characters, on/off/true/false/yes/no/0/1 for booleans
 * - a bare integer: both line speeds
 */
[[nodiscard]] Result<void> apply_setting_token(AttributeSet& attrs, std::string_view token);

} // namespace termattr
