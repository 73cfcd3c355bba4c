// =============================================================================
// lrf - Error Handling Framework
// =============================================================================
// Error taxonomy for the region file codec and the lrf command-line tool.
//
// This module provides:
// - ErrorCode enum doubling as CLI exit codes
// - LRFException hierarchy (FormatError, IntegrityError, DecompressionError,
//   IOError, UsageError)
// - FormatErrorKind for classifying structural failures of a region file
// - Result<T, E> type for functional error handling (using std::expected)
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write/rename failure)
// - 3: Format error (bad magic, unsupported version, malformed index)
// - 4: Integrity error (checksum mismatch)
// - 5: Decompression error (corrupt compressed stream)
// - 6: Invalid argument passed to the library
// =============================================================================

#ifndef LRF_COMMON_ERROR_H
#define LRF_COMMON_ERROR_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace lrf {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error on the command line.
    kUsageError = 1,

    /// @brief Underlying storage access failure.
    kIOError = 2,

    /// @brief Structural violation of the region file format.
    kFormatError = 3,

    /// @brief File or slot checksum mismatch.
    kIntegrityError = 4,

    /// @brief The compressed blob could not be decoded.
    kDecompressionError = 5,

    /// @brief Invalid argument value passed to a library call.
    kInvalidArgument = 6
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kIntegrityError:
            return "integrity error";
        case ErrorCode::kDecompressionError:
            return "decompression error";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

// =============================================================================
// Format Error Classification
// =============================================================================

/// @brief Sub-classification of FormatError.
enum class FormatErrorKind : std::uint8_t {
    /// @brief Leading (or trailing) signature does not match.
    kBadMagic = 0,

    /// @brief Version byte outside the implemented set.
    kUnsupportedVersion,

    /// @brief Header field holds an impossible value.
    kInvalidHeader,

    /// @brief Fewer bytes than the structure requires.
    kTruncated,

    /// @brief Bytes present after the footer signature.
    kTrailingData,

    /// @brief Footer signature missing or corrupt.
    kBadFooter,

    /// @brief Index entry range lies outside the decompressed payload.
    kIndexOutOfBounds,

    /// @brief Two index entries cover overlapping payload bytes.
    kIndexOverlap,

    /// @brief Payload length disagrees with the index (implicit-offset layout).
    kPayloadSizeMismatch,

    /// @brief Header chunk count disagrees with the index.
    kChunkCountMismatch,

    /// @brief A value cannot be represented in the target format version.
    kValueOutOfRange
};

/// @brief Convert FormatErrorKind to string representation.
[[nodiscard]] constexpr std::string_view formatErrorKindToString(FormatErrorKind kind) noexcept {
    switch (kind) {
        case FormatErrorKind::kBadMagic:
            return "bad magic";
        case FormatErrorKind::kUnsupportedVersion:
            return "unsupported version";
        case FormatErrorKind::kInvalidHeader:
            return "invalid header";
        case FormatErrorKind::kTruncated:
            return "truncated";
        case FormatErrorKind::kTrailingData:
            return "trailing data";
        case FormatErrorKind::kBadFooter:
            return "bad footer";
        case FormatErrorKind::kIndexOutOfBounds:
            return "index out of bounds";
        case FormatErrorKind::kIndexOverlap:
            return "index overlap";
        case FormatErrorKind::kPayloadSizeMismatch:
            return "payload size mismatch";
        case FormatErrorKind::kChunkCountMismatch:
            return "chunk count mismatch";
        case FormatErrorKind::kValueOutOfRange:
            return "value out of range";
    }
    return "unknown";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Slot index (x + z * 32) where the error occurred (if applicable).
    std::optional<std::uint32_t> slot;

    /// @brief Byte offset where the error occurred (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    ErrorContext& withSlot(std::uint32_t index) {
        slot = index;
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all lrf errors.
class LRFException : public std::exception {
public:
    LRFException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    LRFException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~LRFException() override = default;

    LRFException(const LRFException&) = default;
    LRFException(LRFException&&) noexcept = default;
    LRFException& operator=(const LRFException&) = default;
    LRFException& operator=(LRFException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for command-line usage errors (exit code 1).
class UsageError : public LRFException {
public:
    explicit UsageError(std::string message)
        : LRFException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : LRFException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for storage access failures (exit code 2).
/// @note Propagated unchanged from the filesystem layer.
class IOError : public LRFException {
public:
    explicit IOError(std::string message)
        : LRFException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : LRFException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    IOError(std::string message, std::error_code ec)
        : LRFException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    IOError(std::string message, std::error_code ec, ErrorContext context)
        : LRFException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                       std::move(context)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for structural format violations (exit code 3).
/// @note kind() distinguishes bad magic, unsupported version, out-of-bounds
///       index entries and the other FormatErrorKind values.
class FormatError : public LRFException {
public:
    FormatError(FormatErrorKind kind, std::string message)
        : LRFException(ErrorCode::kFormatError, std::move(message)), kind_(kind) {}

    FormatError(FormatErrorKind kind, std::string message, ErrorContext context)
        : LRFException(ErrorCode::kFormatError, std::move(message), std::move(context)),
          kind_(kind) {}

    [[nodiscard]] FormatErrorKind kind() const noexcept { return kind_; }

private:
    FormatErrorKind kind_;
};

/// @brief Exception for checksum mismatches (exit code 4).
class IntegrityError : public LRFException {
public:
    explicit IntegrityError(std::string message)
        : LRFException(ErrorCode::kIntegrityError, std::move(message)) {}

    IntegrityError(std::string message, ErrorContext context)
        : LRFException(ErrorCode::kIntegrityError, std::move(message), std::move(context)) {}

    /// @brief Construct with expected and actual checksum values.
    IntegrityError(std::uint64_t expected, std::uint64_t actual, ErrorContext context)
        : LRFException(ErrorCode::kIntegrityError,
                       formatChecksumMismatch(expected, actual),
                       std::move(context)),
          expected_(expected),
          actual_(actual) {}

    [[nodiscard]] std::optional<std::uint64_t> expected() const noexcept { return expected_; }

    [[nodiscard]] std::optional<std::uint64_t> actual() const noexcept { return actual_; }

private:
    static std::string formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual);

    std::optional<std::uint64_t> expected_;
    std::optional<std::uint64_t> actual_;
};

/// @brief Exception for corrupt compressed streams (exit code 5).
class DecompressionError : public LRFException {
public:
    explicit DecompressionError(std::string message)
        : LRFException(ErrorCode::kDecompressionError, std::move(message)) {}

    DecompressionError(std::string message, ErrorContext context)
        : LRFException(ErrorCode::kDecompressionError, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from an LRFException.
    explicit Error(const LRFException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

    /// @brief Throw the matching exception, attaching context.
    [[noreturn]] void throwException(ErrorContext context) const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const LRFException& ex) {
    return std::unexpected(Error{ex});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Return the value of a Result or throw the matching exception.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Execute a function and convert exceptions to Result.
/// @note Non-lrf exceptions are classified as I/O errors.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<std::conditional_t<
    std::is_void_v<decltype(func())>, std::monostate, decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const LRFException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace lrf

#endif  // LRF_COMMON_ERROR_H
