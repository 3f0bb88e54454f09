// =============================================================================
// streamcache - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging (Quill is inherently thread-safe)
//
// The library logs through the SCACHE_LOG_* macros. They do nothing until
// init() has been called, so embedding applications that never configure
// logging pay only a pointer check.
//
// Usage:
//   scache::log::init({.logFile = "scache.log", .level = scache::log::Level::kDebug});
//   SCACHE_LOG_INFO("Staged {} bytes", count);
// =============================================================================

#ifndef SCACHE_COMMON_LOGGER_H
#define SCACHE_COMMON_LOGGER_H

#include <string>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace scache::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console (stderr) output. Forced on when no log file is set.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "scache";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Subsequent calls are ignored until shutdown().
void init(const Config& config);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush pending messages and stop the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert scache::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Map the CLI's -v count and -q flag to a level (-q wins).
[[nodiscard]] Level levelFromVerbosity(int verbosity, bool quiet) noexcept;

}  // namespace scache::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define SCACHE_LOG_IMPL_(macro, fmt, ...)                                      \
    do {                                                                       \
        if (quill::Logger* scacheLogger_ = scache::log::logger()) {            \
            macro(scacheLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);              \
        }                                                                      \
    } while (false)

/// @brief Log a trace message.
#define SCACHE_LOG_TRACE(fmt, ...) SCACHE_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define SCACHE_LOG_DEBUG(fmt, ...) SCACHE_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define SCACHE_LOG_INFO(fmt, ...) SCACHE_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define SCACHE_LOG_WARNING(fmt, ...) SCACHE_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define SCACHE_LOG_ERROR(fmt, ...) SCACHE_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define SCACHE_LOG_CRITICAL(fmt, ...) SCACHE_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // SCACHE_COMMON_LOGGER_H
