// =============================================================================
// streamcache - Stream Operations Implementation
// =============================================================================

#include "scache/io/operations.h"

#include <algorithm>
#include <format>
#include <span>

#include "scache/common/error.h"
#include "scache/common/types.h"

namespace scache::io {

std::uint64_t pipe(InputStream& source, OutputStream& sink, std::uint64_t nbytes) {
    std::vector<std::uint8_t> buffer(kPipeBufferSize);
    std::uint64_t copied = 0;

    if (nbytes == 0) {
        while (!source.empty()) {
            const auto chunk = static_cast<std::size_t>(
                std::min<std::uint64_t>(source.leastSize(), buffer.size()));
            std::span<std::uint8_t> view(buffer.data(), chunk);
            source.read(view, IOMode::kAll);
            sink.write(view, IOMode::kAll);
            copied += chunk;
        }
        return copied;
    }

    while (copied < nbytes) {
        const auto chunk = static_cast<std::size_t>(
            std::min<std::uint64_t>(nbytes - copied, buffer.size()));
        std::span<std::uint8_t> view(buffer.data(), chunk);
        source.read(view, IOMode::kAll);
        sink.write(view, IOMode::kAll);
        copied += chunk;
    }
    return copied;
}

std::vector<std::uint8_t> readAll(InputStream& source, std::size_t maxBytes) {
    std::vector<std::uint8_t> result;
    while (!source.empty()) {
        const auto chunk = source.leastSize();
        if (chunk > maxBytes - result.size()) {
            throw UsageError(std::format("Stream exceeds the limit of {} bytes", maxBytes));
        }
        const std::size_t offset = result.size();
        result.resize(offset + static_cast<std::size_t>(chunk));
        source.read(std::span<std::uint8_t>(result).subspan(offset), IOMode::kAll);
    }
    return result;
}

void skip(InputStream& source, std::uint64_t count) {
    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(
        std::min<std::uint64_t>(count, kPipeBufferSize)));
    while (count > 0) {
        const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(count, buffer.size()));
        source.read(std::span<std::uint8_t>(buffer.data(), chunk), IOMode::kAll);
        count -= chunk;
    }
}

}  // namespace scache::io
