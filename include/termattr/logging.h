/**
 * @file logging.h
 * @brief Callback-based logging for the termattr library.
 *
 * - Hosts install a callback; without one, records go to stderr
 * - A process-wide minimum level filters records before formatting
 * - printf-style macros keep call sites short
 *
 * Usage:
 *   termattr::set_log_level(termattr::LogLevel::Debug);
 *   TERMATTR_LOG_DEBUG("DEVICE", "tcsetattr(fd=%d, when=%s)", fd, name);
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <string_view>

namespace termattr {

// ─────────────────────────────────────────────────────────────────────────────
// Log Level
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Log severity levels.
 *
 * Ordered from most to least severe for filtering.
 */
enum class LogLevel : int {
    Error = 0,   ///< Errors that affect operation
    Warn  = 1,   ///< Rejected input, recoverable conditions
    Info  = 2,   ///< Informational messages
    Debug = 3,   ///< Device traffic
    Trace = 4    ///< Every attribute mutation
};

/**
 * @brief Convert LogLevel to string.
 */
[[nodiscard]] const char* log_level_name(LogLevel level) noexcept;

/**
 * @brief Parse a level name ("error", "warn", "info", "debug", "trace").
 * @return true and sets @p out on success
 */
[[nodiscard]] bool parse_log_level(std::string_view text, LogLevel& out) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Callback Registration
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Log callback function type.
 *
 * @param level     Severity level of the message
 * @param subsystem Subsystem identifier (e.g., "CATALOG", "DEVICE")
 * @param message   The log message (null-terminated)
 * @param userdata  User-provided context from registration
 */
using LogCallback = void (*)(LogLevel level,
                             const char* subsystem,
                             const char* message,
                             void* userdata);

/**
 * @brief Install the log callback (nullptr restores the stderr handler).
 */
void set_log_callback(LogCallback callback, void* userdata) noexcept;

/**
 * @brief Set minimum log level (messages below this are filtered).
 *
 * Default: LogLevel::Warn
 */
void set_log_level(LogLevel level) noexcept;

/**
 * @brief Get current minimum log level.
 */
[[nodiscard]] LogLevel log_level() noexcept;

/**
 * @brief Check if a log level is enabled.
 */
[[nodiscard]] inline bool log_level_enabled(LogLevel level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(log_level());
}

// ─────────────────────────────────────────────────────────────────────────────
// Logging Functions
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Log a pre-formatted message (fast path).
 */
void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept;

/**
 * @brief Log with printf-style formatting.
 */
void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept
    __attribute__((format(printf, 3, 4)));

namespace detail {

/**
 * @brief Default log handler that writes "[LEVEL] subsystem: message" to stderr.
 */
void default_log_handler(LogLevel level,
                         const char* subsystem,
                         const char* message,
                         void* userdata) noexcept;

} // namespace detail

} // namespace termattr

// ─────────────────────────────────────────────────────────────────────────────
// Logging Macros
// ─────────────────────────────────────────────────────────────────────────────

#define TERMATTR_LOG_ENABLED(level) \
    ::termattr::log_level_enabled(::termattr::LogLevel::level)

#define TERMATTR_LOG_ERROR(subsys, ...) \
    ::termattr::log_printf(::termattr::LogLevel::Error, subsys, __VA_ARGS__)

#define TERMATTR_LOG_WARN(subsys, ...) \
    ::termattr::log_printf(::termattr::LogLevel::Warn, subsys, __VA_ARGS__)

#define TERMATTR_LOG_INFO(subsys, ...) \
    ::termattr::log_printf(::termattr::LogLevel::Info, subsys, __VA_ARGS__)

#define TERMATTR_LOG_DEBUG(subsys, ...) \
    ::termattr::log_printf(::termattr::LogLevel::Debug, subsys, __VA_ARGS__)

#define TERMATTR_LOG_TRACE(subsys, ...) \
    ::termattr::log_printf(::termattr::LogLevel::Trace, subsys, __VA_ARGS__)
