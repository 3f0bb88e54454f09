// =============================================================================
// streamcache - Error Handling Framework Implementation
// =============================================================================
// Implementation of error context formatting and exception helpers.
// =============================================================================

#include "scache/common/error.h"

#include <format>
#include <sstream>

namespace scache {

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

    if (chunkIndex.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "chunk: " << *chunkIndex;
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: " << *byteOffset;
        hasContent = true;
    }

    // Add source location in debug builds
#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// ScacheException Implementation
// =============================================================================

void ScacheException::formatWhat() {
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

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFileNotFound:
        case ErrorCode::kFileOpenFailed:
            throw IOError(code_, message_);
        case ErrorCode::kEndOfStream:
            throw EndOfStreamError(message_);
        case ErrorCode::kOutOfRange:
            throw OutOfRangeError(message_);
        case ErrorCode::kInvalidState:
            throw InvalidStateError(message_);
        case ErrorCode::kSuccess:
            // Should not happen, but throw base exception
            throw ScacheException(ErrorCode::kSuccess, message_);
    }
    throw ScacheException(code_, message_);
}

}  // namespace scache
