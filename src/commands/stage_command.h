// =============================================================================
// streamcache - Stage Command
// =============================================================================
// Command handler for staging a sequential input through a CachedFileStream.
//
// The input (a file or stdin) is staged into a cache file as it is consumed,
// and the requested byte range is written to stdout. With an explicit cache
// file the staged copy is kept after the command finishes.
// =============================================================================

#ifndef SCACHE_COMMANDS_STAGE_COMMAND_H
#define SCACHE_COMMANDS_STAGE_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>

namespace scache::commands {

// =============================================================================
// Stage Options
// =============================================================================

/// @brief Configuration options for stage command.
struct StageOptions {
    /// @brief Input file path ("-" for stdin).
    std::string input;

    /// @brief Cache file to keep (empty = temporary file).
    std::filesystem::path cachePath;

    /// @brief First byte to output.
    std::uint64_t offset = 0;

    /// @brief Number of bytes to output (0 = up to the end).
    std::uint64_t length = 0;

    /// @brief Emit a hex dump instead of raw bytes.
    bool hexOutput = false;
};

// =============================================================================
// StageCommand Class
// =============================================================================

/// @brief Command handler for staging sequential input.
class StageCommand {
public:
    /// @brief Construct with options.
    /// @param options Command options.
    /// @param out Destination of the output bytes.
    explicit StageCommand(StageOptions options, std::ostream& out);

    ~StageCommand();

    // Non-copyable, non-movable
    StageCommand(const StageCommand&) = delete;
    StageCommand& operator=(const StageCommand&) = delete;
    StageCommand(StageCommand&&) = delete;
    StageCommand& operator=(StageCommand&&) = delete;

    /// @brief Execute the stage command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Get the options.
    [[nodiscard]] const StageOptions& options() const noexcept { return options_; }

private:
    /// @brief Perform the staging; throws on failure.
    void run();

    StageOptions options_;
    std::ostream& out_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create a stage command writing to stdout.
[[nodiscard]] std::unique_ptr<StageCommand> createStageCommand(StageOptions options);

}  // namespace scache::commands

#endif  // SCACHE_COMMANDS_STAGE_COMMAND_H
