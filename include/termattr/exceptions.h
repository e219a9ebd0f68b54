/**
 * @file exceptions.h
 * @brief Exception hierarchy for unexpected failures.
 *
 * Expected failures of the attribute model travel through Result<T>.
 * These exceptions cover programming errors, broken internal invariants,
 * and hosts that prefer to unwrap a Result by throwing.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "error.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace termattr {

/**
 * @brief Base class for all termattr exceptions.
 *
 * Derives from std::runtime_error for compatibility with
 * standard exception handling.
 */
class TermAttrException : public std::runtime_error {
public:
    explicit TermAttrException(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Exception carrying a Result error.
 *
 * Thrown by value_or_throw() when a host wants exception semantics
 * instead of inspecting the Result.
 */
class ResultException : public TermAttrException {
public:
    explicit ResultException(Error error)
        : TermAttrException(std::string(error_code_name(error.code())) + ": " + error.message())
        , error_(std::move(error))
    {}

    [[nodiscard]] const Error& error() const noexcept { return error_; }
    [[nodiscard]] ErrorCode code() const noexcept { return error_.code(); }

private:
    Error error_;
};

/**
 * @brief Exception replacing abort() in library mode.
 *
 * @note Should only be caught at the outermost host boundary.
 */
class FatalException : public TermAttrException {
public:
    explicit FatalException(const std::string& msg)
        : TermAttrException("Fatal error: " + msg)
        , file_("")
        , line_(0)
    {}

    FatalException(const std::string& msg, const char* file, int line)
        : TermAttrException("Fatal error at " + std::string(file) + ":" +
                            std::to_string(line) + ": " + msg)
        , file_(file)
        , line_(line)
    {}

    [[nodiscard]] const char* file() const noexcept { return file_; }
    [[nodiscard]] int line() const noexcept { return line_; }

private:
    const char* file_;
    int line_;
};

/**
 * @brief Unwrap a Result, throwing ResultException on failure.
 */
template<typename T>
T value_or_throw(Result<T> result) {
    if (!result.has_value()) {
        throw ResultException(std::move(result).error());
    }
    if constexpr (!std::is_void_v<T>) {
        return std::move(result).value();
    }
}

} // namespace termattr

// ─────────────────────────────────────────────────────────────────────────────
// abort() Replacement Macro
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Replace abort() with exception in library mode.
 *
 * In standalone mode, calls real abort().
 * In library mode, throws FatalException.
 */
#ifdef TERMATTR_LIBRARY_MODE
    #define TERMATTR_ABORT(msg) \
        throw ::termattr::FatalException(msg, __FILE__, __LINE__)
#else
    #include <cstdlib>
    #include <iostream>
    #define TERMATTR_ABORT(msg) \
        do { \
            std::cerr << "Fatal: " << (msg) << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
            std::abort(); \
        } while(0)
#endif

/**
 * @brief Assert that throws in library mode instead of aborting.
 */
#ifdef TERMATTR_LIBRARY_MODE
    #define TERMATTR_ASSERT(cond, msg) \
        do { \
            if (!(cond)) { \
                throw ::termattr::FatalException( \
                    std::string("Assertion failed: ") + (msg), __FILE__, __LINE__); \
            } \
        } while(0)
#else
    #include <cassert>
    #define TERMATTR_ASSERT(cond, msg) assert((cond) && (msg))
#endif
