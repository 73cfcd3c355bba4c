// =============================================================================
// lrf - Error Handling Framework Implementation
// =============================================================================

#include "lrf/common/error.h"

#include <format>
#include <sstream>

namespace lrf {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (slot.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "slot: " << *slot << " (x=" << (*slot % 32) << ", z=" << (*slot / 32) << ")";
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: 0x" << std::hex << *byteOffset;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// LRFException Implementation
// =============================================================================

void LRFException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string IntegrityError::formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual) {
    return std::format("checksum mismatch: expected 0x{:016x}, got 0x{:016x}", expected, actual);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    throwException(ErrorContext{});
}

[[noreturn]] void Error::throwException(ErrorContext context) const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_, std::move(context));
        case ErrorCode::kIOError:
            throw IOError(message_, std::move(context));
        case ErrorCode::kFormatError:
            // The kind is not carried through Error; truncation is the
            // closest generic classification.
            throw FormatError(FormatErrorKind::kTruncated, message_, std::move(context));
        case ErrorCode::kIntegrityError:
            throw IntegrityError(message_, std::move(context));
        case ErrorCode::kDecompressionError:
            throw DecompressionError(message_, std::move(context));
        case ErrorCode::kSuccess:
        case ErrorCode::kInvalidArgument:
            break;
    }
    throw LRFException(code_, message_, std::move(context));
}

}  // namespace lrf
