// =============================================================================
// streamcache - Read Command
// =============================================================================
// Command handler for random access reads through a BufferedStream.
//
// The requested byte range of a file is read through the chunk cache and
// written to stdout. Cache statistics are logged at debug level.
// =============================================================================

#ifndef SCACHE_COMMANDS_READ_COMMAND_H
#define SCACHE_COMMANDS_READ_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>

#include "scache/cache/buffered_stream.h"

namespace scache::commands {

// =============================================================================
// Read Options
// =============================================================================

/// @brief Configuration options for read command.
struct ReadOptions {
    /// @brief Input file path.
    std::filesystem::path inputPath;

    /// @brief First byte to read.
    std::uint64_t offset = 0;

    /// @brief Number of bytes to read (0 = up to the end).
    std::uint64_t length = 0;

    /// @brief Chunk cache geometry.
    cache::BufferedStreamConfig cache;

    /// @brief Emit a hex dump instead of raw bytes.
    bool hexOutput = false;
};

// =============================================================================
// ReadCommand Class
// =============================================================================

/// @brief Command handler for buffered random access reads.
class ReadCommand {
public:
    /// @brief Construct with options.
    /// @param options Command options.
    /// @param out Destination of the read bytes.
    explicit ReadCommand(ReadOptions options, std::ostream& out);

    ~ReadCommand();

    // Non-copyable, non-movable
    ReadCommand(const ReadCommand&) = delete;
    ReadCommand& operator=(const ReadCommand&) = delete;
    ReadCommand(ReadCommand&&) = delete;
    ReadCommand& operator=(ReadCommand&&) = delete;

    /// @brief Execute the read command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Get the options.
    [[nodiscard]] const ReadOptions& options() const noexcept { return options_; }

private:
    /// @brief Perform the read; throws on failure.
    void run();

    ReadOptions options_;
    std::ostream& out_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create a read command writing to stdout.
[[nodiscard]] std::unique_ptr<ReadCommand> createReadCommand(ReadOptions options);

}  // namespace scache::commands

#endif  // SCACHE_COMMANDS_READ_COMMAND_H
