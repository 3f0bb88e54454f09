// =============================================================================
// streamcache - Stage Command Implementation
// =============================================================================

#include "stage_command.h"

#include <iostream>
#include <utility>

#include "range_output.h"
#include "scache/cache/cached_file_stream.h"
#include "scache/common/error.h"
#include "scache/common/logger.h"
#include "scache/io/fd_input_stream.h"
#include "scache/io/file_stream.h"

namespace scache::commands {

namespace {

[[nodiscard]] std::unique_ptr<io::InputStream> openInput(const std::string& input) {
    if (input == "-") {
        return io::openStdin();
    }
    if (!std::filesystem::exists(input)) {
        throw ScacheException(ErrorCode::kFileNotFound, "Input file not found: " + input);
    }
    return io::openFile(input);
}

}  // namespace

StageCommand::StageCommand(StageOptions options, std::ostream& out)
    : options_(std::move(options)), out_(out) {}

StageCommand::~StageCommand() = default;

int StageCommand::execute() {
    try {
        run();
        return 0;
    } catch (const ScacheException& e) {
        SCACHE_LOG_ERROR("Stage command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        SCACHE_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void StageCommand::run() {
    cache::CachedFileStreamConfig config;
    config.cachePath = options_.cachePath;

    auto stream = cache::createCachedFileStream(openInput(options_.input), config);
    SCACHE_LOG_DEBUG("Staging {} into {}", options_.input, stream.path().string());

    stream.seek(options_.offset);
    if (stream.tell() > stream.size()) {
        throw OutOfRangeError("Offset lies beyond the end of the input",
                              ErrorContext(options_.input).withOffset(options_.offset));
    }

    ByteOutput output(out_, options_.hexOutput, options_.offset);
    const std::uint64_t copied = copyRange(stream, options_.length, output);

    SCACHE_LOG_DEBUG("Wrote {} bytes; {} bytes staged in {}", copied, stream.stagedBytes(),
                     stream.path().string());
    stream.close();
}

std::unique_ptr<StageCommand> createStageCommand(StageOptions options) {
    return std::make_unique<StageCommand>(std::move(options), std::cout);
}

}  // namespace scache::commands
