/**
 * @file error.h
 * @brief Error handling infrastructure using C++23 std::expected.
 *
 * Provides:
 * - Error class with code, message, source location and native errno
 * - Result<T> type alias for std::expected<T, Error>
 * - Ok(), Err(), make_error() helper functions
 * - TERMATTR_CHECK / TERMATTR_TRY early-return macros
 *
 * Every fallible operation of the attribute model reports its failure
 * through Result<T>. Nothing in the core retries; errors go straight
 * back to the caller.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <expected>
#include <source_location>
#include <string>
#include <utility>
#include <cstdint>

namespace termattr {

// ─────────────────────────────────────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Categorized error codes for Result<T> failures.
 *
 * Zero indicates success (not used in Error objects).
 */
enum class ErrorCode : int {
    // Success (not stored in Error)
    Ok = 0,

    // Attribute model errors (1-99)
    UnsupportedAttribute = 1,   ///< Name not in this platform's catalog
    InvalidType = 2,            ///< Value shape does not match the category
    InvalidValue = 3,           ///< Right shape, outside the domain

    // Persistence errors (100-199)
    MalformedSnapshot = 100,    ///< Raw block missing from snapshot data
    IncompleteSnapshot = 101,   ///< Snapshot lacks attributes required here
    ParseError = 102,           ///< Snapshot text is not well formed

    // Device and system errors (200-299)
    DeviceError = 200,          ///< System call failed, errno preserved
    NotSupported = 201,         ///< Capability absent on this platform
    FileError = 202,            ///< Snapshot file could not be read/written

    // Tool errors (300-399)
    InvalidArgument = 300,
};

/**
 * @brief Convert ErrorCode to string representation.
 */
[[nodiscard]] inline constexpr const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::UnsupportedAttribute: return "UnsupportedAttribute";
        case ErrorCode::InvalidType: return "InvalidType";
        case ErrorCode::InvalidValue: return "InvalidValue";
        case ErrorCode::MalformedSnapshot: return "MalformedSnapshot";
        case ErrorCode::IncompleteSnapshot: return "IncompleteSnapshot";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::DeviceError: return "DeviceError";
        case ErrorCode::NotSupported: return "NotSupported";
        case ErrorCode::FileError: return "FileError";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        default: return "Unknown";
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Error Class
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Structured error with code, message, and source location.
 *
 * Used as the error type in Result<T> (std::expected<T, Error>).
 * Device failures additionally carry the errno reported by the
 * failing system call so that it reaches the caller unchanged.
 *
 * Example:
 * @code
 *   Error err(ErrorCode::InvalidValue, "unsupported value 'cs99' for attribute 'csize'");
 *   std::cerr << err.format() << std::endl;
 *   // Output: InvalidValue at attribute_set.cpp:88 (...): unsupported value ...
 * @endcode
 */
class Error {
public:
    /**
     * @brief Construct an error with code and message.
     * @param code Error category
     * @param message Human-readable description
     * @param location Source location (auto-captured by default)
     */
    Error(ErrorCode code,
          std::string message,
          std::source_location location = std::source_location::current())
        : code_(code)
        , message_(std::move(message))
        , location_(location)
    {}

    /**
     * @brief Create error from a failed system call.
     * @param native_errno errno value observed right after the call
     */
    [[nodiscard]] static Error from_errno(
        int native_errno,
        std::string msg,
        std::source_location loc = std::source_location::current()
    ) {
        Error err{ErrorCode::DeviceError, std::move(msg), loc};
        err.native_errno_ = native_errno;
        return err;
    }

    // Accessors
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept { return location_; }

    /// errno of the failing system call, 0 when not a device error.
    [[nodiscard]] int native_errno() const noexcept { return native_errno_; }

    [[nodiscard]] const char* file() const noexcept {
        return location_.file_name();
    }

    [[nodiscard]] uint_least32_t line() const noexcept {
        return location_.line();
    }

    [[nodiscard]] const char* function() const noexcept {
        return location_.function_name();
    }

    /**
     * @brief Format error for display/logging.
     * @return Formatted string: "CODE at file:line (func): message"
     */
    [[nodiscard]] std::string format() const {
        return std::string(error_code_name(code_)) + " at " +
               location_.file_name() + ":" + std::to_string(location_.line()) +
               " (" + location_.function_name() + "): " + message_;
    }

    /**
     * @brief Check if this is a specific error code.
     */
    [[nodiscard]] bool is(ErrorCode code) const noexcept {
        return code_ == code;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::source_location location_;
    int native_errno_ = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Result Type (std::expected alias)
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Result type for fallible operations.
 *
 * Represents either a success value of type T, or an Error.
 *
 * @code
 *   auto echo = attrs.get("echo");
 *   if (echo) {
 *       use(*echo);
 *   } else if (echo.error().is(ErrorCode::UnsupportedAttribute)) {
 *       ...
 *   }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

// ─────────────────────────────────────────────────────────────────────────────
// Helper Functions
// ─────────────────────────────────────────────────────────────────────────────

template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T value) {
    return Result<T>{std::in_place, std::move(value)};
}

[[nodiscard]] inline constexpr Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline std::unexpected<Error> Err(Error error) {
    return std::unexpected(std::move(error));
}

/**
 * @brief Create error with code and message.
 *
 * @param code Error code
 * @param msg Error message
 * @param loc Source location (auto-captured)
 * @return std::unexpected<Error>
 */
[[nodiscard]] inline std::unexpected<Error> make_error(
    ErrorCode code,
    std::string msg,
    std::source_location loc = std::source_location::current()
) {
    return std::unexpected(Error{code, std::move(msg), loc});
}

// ─────────────────────────────────────────────────────────────────────────────
// Convenience Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Return error if condition is false.
 *
 * Usage:
 *   TERMATTR_CHECK(value >= 0, ErrorCode::InvalidValue, "negative count");
 */
#define TERMATTR_CHECK(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return ::termattr::make_error(code, msg); \
        } \
    } while (0)

/**
 * @brief Return early if result is an error.
 *
 * Usage:
 * @code
 *   Result<Value> foo() {
 *       auto entry = TERMATTR_TRY(catalog.resolve(name));
 *       ...
 *   }
 * @endcode
 *
 * Note: Uses GCC statement expression extension. For portable code,
 * use explicit if-checks instead.
 */
#define TERMATTR_TRY(expr) \
    ({ \
        auto&& _termattr_result = (expr); \
        if (!_termattr_result.has_value()) { \
            return ::termattr::Err(_termattr_result.error()); \
        } \
        std::move(_termattr_result).value(); \
    })

} // namespace termattr
