// =============================================================================
// lrf - Error Handling Tests
// =============================================================================
// Unit tests for the exception hierarchy, exit codes and Result helpers.
// =============================================================================

#include "lrf/common/error.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace lrf {
namespace {

// =============================================================================
// Exit Codes
// =============================================================================

TEST(ErrorCodeTest, ExitCodesAreStable) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kFormatError), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kIntegrityError), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kDecompressionError), 5);
    EXPECT_EQ(toExitCode(ErrorCode::kInvalidArgument), 6);
}

TEST(ErrorCodeTest, KindNames) {
    EXPECT_EQ(formatErrorKindToString(FormatErrorKind::kBadMagic), "bad magic");
    EXPECT_EQ(formatErrorKindToString(FormatErrorKind::kIndexOverlap), "index overlap");
    EXPECT_EQ(errorCodeToString(ErrorCode::kIntegrityError), "integrity error");
}

// =============================================================================
// Exceptions
// =============================================================================

TEST(ExceptionTest, FormatErrorCarriesKind) {
    const FormatError error(FormatErrorKind::kUnsupportedVersion, "unsupported version 9");
    EXPECT_EQ(error.code(), ErrorCode::kFormatError);
    EXPECT_EQ(error.kind(), FormatErrorKind::kUnsupportedVersion);
    EXPECT_EQ(error.exitCode(), 3);
    EXPECT_NE(std::string(error.what()).find("unsupported version 9"), std::string::npos);
}

TEST(ExceptionTest, IntegrityErrorReportsValues) {
    const IntegrityError error(0x1111, 0x2222, ErrorContext("r.0.0.linear"));
    EXPECT_EQ(error.expected(), 0x1111u);
    EXPECT_EQ(error.actual(), 0x2222u);
    const std::string what = error.what();
    EXPECT_NE(what.find("0000000000001111"), std::string::npos);
    EXPECT_NE(what.find("r.0.0.linear"), std::string::npos);
}

TEST(ExceptionTest, ContextNamesSlotCoordinates) {
    ErrorContext context;
    context.withFile("region.linear").withSlot(33).withOffset(0x20);
    const std::string text = context.format();
    EXPECT_NE(text.find("region.linear"), std::string::npos);
    EXPECT_NE(text.find("x=1, z=1"), std::string::npos);
    EXPECT_NE(text.find("0x20"), std::string::npos);
}

TEST(ExceptionTest, IOErrorKeepsSystemError) {
    const auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
    const IOError error("open failed", ec);
    ASSERT_TRUE(error.systemError().has_value());
    EXPECT_EQ(*error.systemError(), ec);
    EXPECT_EQ(error.exitCode(), 2);
}

// =============================================================================
// Result Helpers
// =============================================================================

TEST(ResultTest, ThrowExceptionMapsCodes) {
    EXPECT_THROW(Error(ErrorCode::kDecompressionError, "bad frame").throwException(),
                 DecompressionError);
    EXPECT_THROW(Error(ErrorCode::kIntegrityError, "mismatch").throwException(), IntegrityError);
    EXPECT_THROW(Error(ErrorCode::kIOError, "disk").throwException(), IOError);
    EXPECT_THROW(Error(ErrorCode::kInvalidArgument, "level").throwException(), LRFException);
}

TEST(ResultTest, UnwrapOrThrow) {
    Result<int> ok = 42;
    EXPECT_EQ(unwrapOrThrow(std::move(ok)), 42);

    Result<int> failed = makeError<int>(ErrorCode::kUsageError, "no input");
    EXPECT_THROW((void)unwrapOrThrow(std::move(failed)), UsageError);
}

TEST(ResultTest, TryExecuteConvertsExceptions) {
    auto value = tryExecute([] { return 7; });
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 7);

    auto formatFailure = tryExecute(
        []() -> int { throw FormatError(FormatErrorKind::kBadFooter, "footer"); });
    ASSERT_FALSE(formatFailure.has_value());
    EXPECT_EQ(formatFailure.error().code(), ErrorCode::kFormatError);

    auto stdFailure = tryExecute([] { throw std::runtime_error("boom"); });
    ASSERT_FALSE(stdFailure.has_value());
    EXPECT_EQ(stdFailure.error().code(), ErrorCode::kIOError);
    EXPECT_EQ(stdFailure.error().message(), "boom");
}

}  // namespace
}  // namespace lrf
