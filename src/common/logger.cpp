// =============================================================================
// streamcache - Logger Module Implementation
// =============================================================================
// Quill backend setup for the CLI. The library itself only reads the logger
// pointer through the SCACHE_LOG_* macros.
// =============================================================================

#include "scache/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace scache::log {

namespace {

/// @brief Set once init() has created the logger; null before and after shutdown().
std::atomic<quill::Logger*> gLogger{nullptr};

std::mutex gInitMutex;

std::vector<std::shared_ptr<quill::Sink>> createSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;

    // stdout carries command output, so the console sink goes to stderr.
    if (config.enableConsole || config.logFile.empty()) {
        quill::ConsoleSinkConfig consoleConfig;
        consoleConfig.set_stream("stderr");
        sinks.push_back(
            quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console", consoleConfig));
    }

    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }
    return sinks;
}

}  // namespace

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

Level levelFromVerbosity(int verbosity, bool quiet) noexcept {
    if (quiet) {
        return Level::kError;
    }
    if (verbosity >= 2) {
        return Level::kTrace;
    }
    return verbosity == 1 ? Level::kDebug : Level::kInfo;
}

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    quill::Logger* created =
        quill::Frontend::create_or_get_logger(config.loggerName, createSinks(config));
    created->set_log_level(toQuillLevel(config.level));

    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace scache::log
