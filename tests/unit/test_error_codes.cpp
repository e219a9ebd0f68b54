/**
 * @file test_error_codes.cpp
 * @brief Tests for ErrorCode, Error and the Result<T> helpers.
 */

#include <gtest/gtest.h>
#include <termattr/error.h>

#include <cerrno>
#include <cstring>
#include <string>

using namespace termattr;

// ─────────────────────────────────────────────────────────────────────────────
// ErrorCode Names
// ─────────────────────────────────────────────────────────────────────────────

TEST(ErrorCodeTest, NamesAreStable) {
    EXPECT_STREQ(error_code_name(ErrorCode::Ok), "Ok");
    EXPECT_STREQ(error_code_name(ErrorCode::UnsupportedAttribute), "UnsupportedAttribute");
    EXPECT_STREQ(error_code_name(ErrorCode::InvalidType), "InvalidType");
    EXPECT_STREQ(error_code_name(ErrorCode::InvalidValue), "InvalidValue");
    EXPECT_STREQ(error_code_name(ErrorCode::MalformedSnapshot), "MalformedSnapshot");
    EXPECT_STREQ(error_code_name(ErrorCode::IncompleteSnapshot), "IncompleteSnapshot");
    EXPECT_STREQ(error_code_name(ErrorCode::ParseError), "ParseError");
    EXPECT_STREQ(error_code_name(ErrorCode::DeviceError), "DeviceError");
    EXPECT_STREQ(error_code_name(ErrorCode::NotSupported), "NotSupported");
    EXPECT_STREQ(error_code_name(ErrorCode::FileError), "FileError");
    EXPECT_STREQ(error_code_name(ErrorCode::InvalidArgument), "InvalidArgument");
}

TEST(ErrorCodeTest, UnknownCodeHasFallbackName) {
    EXPECT_STREQ(error_code_name(static_cast<ErrorCode>(9999)), "Unknown");
}

TEST(ErrorCodeTest, NameIsConstexpr) {
    static_assert(error_code_name(ErrorCode::InvalidValue)[0] == 'I');
    SUCCEED();
}

// ─────────────────────────────────────────────────────────────────────────────
// Error
// ─────────────────────────────────────────────────────────────────────────────

TEST(ErrorTest, StoresCodeAndMessage) {
    Error err(ErrorCode::InvalidValue, "unsupported value 'cs99' for attribute 'csize'");

    EXPECT_EQ(err.code(), ErrorCode::InvalidValue);
    EXPECT_EQ(err.message(), "unsupported value 'cs99' for attribute 'csize'");
    EXPECT_TRUE(err.is(ErrorCode::InvalidValue));
    EXPECT_FALSE(err.is(ErrorCode::InvalidType));
    EXPECT_EQ(err.native_errno(), 0);
}

TEST(ErrorTest, CapturesSourceLocation) {
    Error err(ErrorCode::ParseError, "bad");

    EXPECT_NE(std::string(err.file()).find("test_error_codes"), std::string::npos);
    EXPECT_GT(err.line(), 0u);
    EXPECT_NE(err.function(), nullptr);
}

TEST(ErrorTest, FromErrnoIsDeviceError) {
    Error err = Error::from_errno(ENOTTY, "tcgetattr failed");

    EXPECT_EQ(err.code(), ErrorCode::DeviceError);
    EXPECT_EQ(err.native_errno(), ENOTTY);
    EXPECT_EQ(err.message(), "tcgetattr failed");
}

TEST(ErrorTest, FormatContainsCodeLocationAndMessage) {
    Error err(ErrorCode::IncompleteSnapshot, "missing echo");
    std::string text = err.format();

    EXPECT_EQ(text.rfind("IncompleteSnapshot at ", 0), 0u);
    EXPECT_NE(text.find("test_error_codes"), std::string::npos);
    EXPECT_NE(text.find(": missing echo"), std::string::npos);
}

// ─────────────────────────────────────────────────────────────────────────────
// Result<T>
// ─────────────────────────────────────────────────────────────────────────────

TEST(ResultTest, OkCreatesSuccess) {
    auto result = Ok(42);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, OkVoidCreatesSuccess) {
    Result<void> result = Ok();
    EXPECT_TRUE(result.has_value());
}

TEST(ResultTest, ErrCreatesFailure) {
    Result<int> result = Err(Error(ErrorCode::InvalidArgument, "bad"));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(ResultTest, MakeErrorCreatesFailure) {
    Result<std::string> result = make_error(ErrorCode::FileError, "cannot open");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::FileError);
    EXPECT_EQ(result.error().message(), "cannot open");
}

TEST(ResultTest, FailureValueThrows) {
    Result<int> result = Err(Error(ErrorCode::InvalidValue, "error"));
    EXPECT_THROW((void)result.value(), std::bad_expected_access<Error>);
}

// ─────────────────────────────────────────────────────────────────────────────
// Early-return Macros
// ─────────────────────────────────────────────────────────────────────────────

namespace {

Result<int> checked_half(int value) {
    TERMATTR_CHECK(value % 2 == 0, ErrorCode::InvalidValue, "odd value");
    return value / 2;
}

Result<int> quarter(int value) {
    int half = TERMATTR_TRY(checked_half(value));
    return TERMATTR_TRY(checked_half(half));
}

} // namespace

TEST(ResultMacroTest, CheckPassesThrough) {
    auto result = checked_half(8);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 4);
}

TEST(ResultMacroTest, CheckReturnsError) {
    auto result = checked_half(7);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidValue);
    EXPECT_EQ(result.error().message(), "odd value");
}

TEST(ResultMacroTest, TryChainsSuccess) {
    auto result = quarter(12);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 3);
}

TEST(ResultMacroTest, TryPropagatesFirstFailure) {
    auto result = quarter(6);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidValue);
}
