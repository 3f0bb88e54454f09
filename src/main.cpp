// =============================================================================
// streamcache - Stream Cache Tool
// =============================================================================
// Main entry point for the scache command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: read (chunk cache), stage (disk staging)
// - Global options: verbose, quiet, log-file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

#include "scache/common/error.h"
#include "scache/common/logger.h"
#include "scache/common/types.h"

#include "commands/read_command.h"
#include "commands/stage_command.h"

namespace scache::commands {
int runRead(CLI::App* app);
int runStage(CLI::App* app);
}  // namespace scache::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "scache: random access over sequential or expensive byte streams\n"
    "'read' serves a byte range through a chunked LRU memory cache,\n"
    "'stage' copies a sequential input into a cache file as it is consumed.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Read Command Options
// =============================================================================

struct CliReadOptions {
    std::string input;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    std::size_t bufferSize = scache::kDefaultChunkBufferSize;
    std::size_t bufferCount = scache::kDefaultChunkBufferCount;
    bool hex = false;
};

CliReadOptions gReadOpts;

// =============================================================================
// Stage Command Options
// =============================================================================

struct CliStageOptions {
    std::string input;
    std::string cacheFile;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    bool hex = false;
};

CliStageOptions gStageOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupReadCommand(CLI::App& app) {
    auto* read = app.add_subcommand("read", "Read a byte range through the chunk cache");
    read->alias("r");

    read->add_option("-i,--input", gReadOpts.input, "Input file")
        ->required()
        ->check(CLI::ExistingFile);

    read->add_option("--offset", gReadOpts.offset, "First byte to read")->default_val(0);

    read->add_option("--length", gReadOpts.length, "Number of bytes (0 = to the end)")
        ->default_val(0);

    read->add_option("--buffer-size", gReadOpts.bufferSize,
                     "Chunk size in bytes (rounded up to a power of two)")
        ->default_val(scache::kDefaultChunkBufferSize)
        ->check(CLI::PositiveNumber);

    read->add_option("--buffer-count", gReadOpts.bufferCount, "Number of cached chunks")
        ->default_val(scache::kDefaultChunkBufferCount)
        ->check(CLI::PositiveNumber);

    read->add_flag("--hex", gReadOpts.hex, "Print a hex dump instead of raw bytes");
}

void setupStageCommand(CLI::App& app) {
    auto* stage = app.add_subcommand("stage", "Stage a sequential input and output a range");
    stage->alias("s");

    stage->add_option("-i,--input", gStageOpts.input, "Input file (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    stage->add_option("--cache-file", gStageOpts.cacheFile,
                      "Keep the staged copy at this path (default: temporary file)");

    stage->add_option("--offset", gStageOpts.offset, "First byte to output")->default_val(0);

    stage->add_option("--length", gStageOpts.length, "Number of bytes (0 = to the end)")
        ->default_val(0);

    stage->add_flag("--hex", gStageOpts.hex, "Print a hex dump instead of raw bytes");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Only log errors");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    setupReadCommand(app);
    setupStageCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        scache::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = scache::log::levelFromVerbosity(gOptions.verbosity, gOptions.quiet);
        scache::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("read")) {
            exitCode = scache::commands::runRead(app.get_subcommand("read"));
        } else if (app.got_subcommand("stage")) {
            exitCode = scache::commands::runStage(app.get_subcommand("stage"));
        }
    } catch (const scache::ScacheException& ex) {
        SCACHE_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        SCACHE_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    scache::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace scache::commands {

int runRead([[maybe_unused]] CLI::App* app) {
    ReadOptions opts;
    opts.inputPath = gReadOpts.input;
    opts.offset = gReadOpts.offset;
    opts.length = gReadOpts.length;
    opts.cache.bufferSize = gReadOpts.bufferSize;
    opts.cache.bufferCount = gReadOpts.bufferCount;
    opts.hexOutput = gReadOpts.hex;

    auto cmd = createReadCommand(std::move(opts));
    return cmd->execute();
}

int runStage([[maybe_unused]] CLI::App* app) {
    StageOptions opts;
    opts.input = gStageOpts.input;
    opts.cachePath = gStageOpts.cacheFile;
    opts.offset = gStageOpts.offset;
    opts.length = gStageOpts.length;
    opts.hexOutput = gStageOpts.hex;

    auto cmd = createStageCommand(std::move(opts));
    return cmd->execute();
}

}  // namespace scache::commands
