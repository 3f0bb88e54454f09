// =============================================================================
// streamcache - Error Handling Framework
// =============================================================================
// Error handling for the streamcache library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - ScacheException hierarchy for stream failures
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context (file, chunk, offset) and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (open, read, write, seek failure)
// - 3: Reading past end of stream
// - 4: Out-of-range access
// - 5: Invalid stream state (closed, not writable)
// - 6: Input file not found
// - 7: File could not be opened or created
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef SCACHE_COMMON_ERROR_H
#define SCACHE_COMMON_ERROR_H

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

namespace scache {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    /// @note Invalid command-line arguments, invalid configuration values.
    kUsageError = 1,

    /// @brief I/O error reported by the underlying transport or file system.
    kIOError = 2,

    /// @brief Fewer bytes exist than a blocking read asked for.
    kEndOfStream = 3,

    /// @brief Access at an offset beyond the true stream size.
    kOutOfRange = 4,

    /// @brief Invalid state for operation (closed or read-only stream).
    kInvalidState = 5,

    /// @brief Input file does not exist.
    kFileNotFound = 6,

    /// @brief Failed to open or create a file.
    kFileOpenFailed = 7
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kEndOfStream:
            return "end of stream";
        case ErrorCode::kOutOfRange:
            return "out of range";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kFileNotFound:
            return "file not found";
        case ErrorCode::kFileOpenFailed:
            return "file open failed";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents an error.
[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Describes which file, chunk and byte offset a failure relates to.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Chunk index of a buffered stream (if applicable).
    std::optional<std::uint64_t> chunkIndex;

    /// @brief Byte offset in the stream where the error occurred (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the file path.
    /// @return Reference to this for method chaining.
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the chunk index.
    /// @return Reference to this for method chaining.
    ErrorContext& withChunk(std::uint64_t index) {
        chunkIndex = index;
        return *this;
    }

    /// @brief Set the byte offset.
    /// @return Reference to this for method chaining.
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

/// @brief Base exception class for all streamcache errors.
/// @note Provides error code, message, and optional context.
class ScacheException : public std::exception {
public:
    /// @brief Construct with error code and message.
    ScacheException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    ScacheException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~ScacheException() override = default;

    ScacheException(const ScacheException&) = default;
    ScacheException(ScacheException&&) noexcept = default;
    ScacheException& operator=(const ScacheException&) = default;
    ScacheException& operator=(ScacheException&&) noexcept = default;

    /// @brief Get the formatted error message including context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
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

/// @brief Exception for usage and argument errors (exit code 1).
/// @note Thrown for invalid configuration and command-line values.
class UsageError : public ScacheException {
public:
    explicit UsageError(std::string message)
        : ScacheException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : ScacheException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for failed open, read, write, seek, truncate and close calls.
class IOError : public ScacheException {
public:
    /// @brief Construct with message.
    explicit IOError(std::string message)
        : ScacheException(ErrorCode::kIOError, std::move(message)) {}

    /// @brief Construct with message and context.
    IOError(std::string message, ErrorContext context)
        : ScacheException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct with a more specific I/O code and message.
    IOError(ErrorCode code, std::string message) : ScacheException(code, std::move(message)) {}

    /// @brief Construct from system error code.
    /// @param message Descriptive error message.
    /// @param ec System error code.
    IOError(std::string message, std::error_code ec)
        : ScacheException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : IOError(ErrorCode::kIOError, std::move(message), ec, std::move(context)) {}

    /// @brief Construct with a more specific I/O code (e.g. kFileOpenFailed).
    IOError(ErrorCode code, std::string message, std::error_code ec, ErrorContext context)
        : ScacheException(code, formatWithSystemError(message, ec), std::move(context)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for reads that ask for more bytes than exist (exit code 3).
/// @note Recoverable: it only means less data exists than was requested.
class EndOfStreamError : public ScacheException {
public:
    explicit EndOfStreamError(std::string message = "Reading past end of stream.")
        : ScacheException(ErrorCode::kEndOfStream, std::move(message)) {}

    EndOfStreamError(std::string message, ErrorContext context)
        : ScacheException(ErrorCode::kEndOfStream, std::move(message), std::move(context)) {}
};

/// @brief Exception for access beyond the true stream size (exit code 4).
class OutOfRangeError : public ScacheException {
public:
    explicit OutOfRangeError(std::string message)
        : ScacheException(ErrorCode::kOutOfRange, std::move(message)) {}

    OutOfRangeError(std::string message, ErrorContext context)
        : ScacheException(ErrorCode::kOutOfRange, std::move(message), std::move(context)) {}
};

/// @brief Exception for operations on closed or read-only streams (exit code 5).
class InvalidStateError : public ScacheException {
public:
    explicit InvalidStateError(std::string message)
        : ScacheException(ErrorCode::kInvalidState, std::move(message)) {}

    InvalidStateError(std::string message, ErrorContext context)
        : ScacheException(ErrorCode::kInvalidState, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a ScacheException.
    explicit Error(const ScacheException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

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
[[nodiscard]] Result<T> makeError(const ScacheException& ex) {
    return std::unexpected(Error{ex});
}

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Create a success void result.
[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

/// @brief Create an error void result.
[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Unwrap a Result, throwing the matching exception on error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw the matching exception if a VoidResult holds an error.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
/// @return Result containing the return value or error.
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
    } catch (const ScacheException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace scache

#endif  // SCACHE_COMMON_ERROR_H
