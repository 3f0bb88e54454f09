// =============================================================================
// streamcache - Read Command Implementation
// =============================================================================

#include "read_command.h"

#include <iostream>
#include <utility>

#include "range_output.h"
#include "scache/common/error.h"
#include "scache/common/logger.h"
#include "scache/io/file_stream.h"

namespace scache::commands {

ReadCommand::ReadCommand(ReadOptions options, std::ostream& out)
    : options_(std::move(options)), out_(out) {}

ReadCommand::~ReadCommand() = default;

int ReadCommand::execute() {
    try {
        run();
        return 0;
    } catch (const ScacheException& e) {
        SCACHE_LOG_ERROR("Read command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        SCACHE_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void ReadCommand::run() {
    if (!std::filesystem::exists(options_.inputPath)) {
        throw ScacheException(ErrorCode::kFileNotFound,
                              "Input file not found: " + options_.inputPath.string());
    }

    auto stream = cache::createBufferedStream(io::openFile(options_.inputPath), options_.cache);
    SCACHE_LOG_DEBUG("Reading {}: size={}, offset={}, length={}", options_.inputPath.string(),
                     stream.size(), options_.offset, options_.length);

    if (options_.offset > stream.size()) {
        throw OutOfRangeError("Offset lies beyond the end of the input",
                              ErrorContext(options_.inputPath.string()).withOffset(options_.offset));
    }
    stream.seek(options_.offset);

    ByteOutput output(out_, options_.hexOutput, options_.offset);
    const std::uint64_t copied = copyRange(stream, options_.length, output);

    const auto stats = stream.stats();
    SCACHE_LOG_DEBUG("Read {} bytes; cache hits={}, misses={}, evictions={}, hit rate={:.2f}",
                     copied, stats.hits, stats.misses, stats.evictions, stats.hitRate());
}

std::unique_ptr<ReadCommand> createReadCommand(ReadOptions options) {
    return std::make_unique<ReadCommand>(std::move(options), std::cout);
}

}  // namespace scache::commands
