// =============================================================================
// streamcache - Buffered Random Access Stream Implementation
// =============================================================================
// Chunk table layout: one arena of bufferCount * bufferSize bytes, sliced into
// fixed slots. Each slot has a descriptor holding the chunk index it caches
// (kUnassignedChunk when free), the number of valid bytes, a dirty flag and
// the access stamp used for LRU replacement.
//
// The peek window is the cached remainder of the chunk holding the current
// position. It is kept as slot + bounds and dropped whenever that slot is
// reassigned.
// =============================================================================

#include "scache/cache/buffered_stream.h"

#include <algorithm>
#include <cstring>
#include <format>
#include <limits>
#include <optional>
#include <utility>

#include "scache/common/logger.h"

namespace scache::cache {

namespace {

/// @brief Descriptor of one chunk buffer slot.
struct ChunkBuffer {
    ChunkIndex chunk = kUnassignedChunk;
    std::size_t fill = 0;
    bool dirty = false;
    AccessStamp lastAccess = 0;
};

/// @brief Cached bytes [begin, end) of a slot, starting at the stream position.
struct PeekWindow {
    std::size_t slot = 0;
    std::size_t begin = 0;
    std::size_t end = 0;
};

/// @brief Part of a request that falls into a single chunk.
struct ChunkSpan {
    FileOffset offset;               ///< Absolute offset of the first byte
    ChunkIndex chunk;                ///< Chunk index
    std::size_t requestBegin;        ///< Range within the caller's buffer
    std::size_t requestEnd;
    std::optional<std::size_t> slot; ///< Resident slot, if any
    std::size_t intraBegin;          ///< Range within the chunk
    std::size_t intraEnd;
};

/// @brief Whether a chunk operation that needs I/O may proceed.
[[nodiscard]] bool mayBlock(io::IOMode mode, std::size_t progress) noexcept {
    if (mode == io::IOMode::kImmediate) return false;
    if (mode == io::IOMode::kOnce && progress > 0) return false;
    return true;
}

}  // namespace

// =============================================================================
// BufferedStreamConfig
// =============================================================================

VoidResult BufferedStreamConfig::validate() const {
    if (bufferSize == 0) {
        return makeVoidError(ErrorCode::kUsageError, "Buffer size must be > 0");
    }
    if (bufferCount == 0) {
        return makeVoidError(ErrorCode::kUsageError, "Buffer count must be > 0");
    }
    if (bufferSize > kMaxChunkBufferSize) {
        return makeVoidError(ErrorCode::kUsageError,
                             std::format("Buffer size ({}) exceeds the maximum of {} bytes",
                                         bufferSize, kMaxChunkBufferSize));
    }
    if (roundChunkSize(bufferSize) > std::numeric_limits<std::size_t>::max() / bufferCount) {
        return makeVoidError(ErrorCode::kUsageError,
                             std::format("Buffer arena of {} x {} bytes is too large",
                                         bufferCount, roundChunkSize(bufferSize)));
    }
    return makeVoidSuccess();
}

// =============================================================================
// BufferedStream::State
// =============================================================================

struct BufferedStream::State {
    State(std::unique_ptr<io::RandomAccessStream> wrapped, const BufferedStreamConfig& config)
        : stream(std::move(wrapped))
        , bufferSize(roundChunkSize(config.bufferSize))
        , bufferSizeBits(chunkSizeBits(bufferSize))
        , buffers(config.bufferCount)
        , arena(std::make_unique<std::uint8_t[]>(bufferSize * config.bufferCount))
        , size(stream->size()) {}

    ~State() {
        if (!stream->isOpen() || !stream->writable()) {
            return;
        }
        try {
            flushAll();
        } catch (const std::exception& e) {
            SCACHE_LOG_ERROR("Failed to flush buffered stream on destruction: {}", e.what());
        }
    }

    State(const State&) = delete;
    State& operator=(const State&) = delete;
    State(State&&) = delete;
    State& operator=(State&&) = delete;

    [[nodiscard]] std::uint8_t* memory(std::size_t slot) const noexcept {
        return arena.get() + slot * bufferSize;
    }

    [[nodiscard]] FileOffset offsetOf(ChunkIndex chunk) const noexcept {
        return chunkStart(chunk, bufferSizeBits);
    }

    [[nodiscard]] std::optional<std::size_t> findChunk(ChunkIndex chunk) const noexcept {
        for (std::size_t i = 0; i < buffers.size(); ++i) {
            if (buffers[i].chunk == chunk) {
                return i;
            }
        }
        return std::nullopt;
    }

    void touchBuffer(std::size_t slot) noexcept { buffers[slot].lastAccess = ++accessCounter; }

    /// Grow the known size to the size of the wrapped stream. Never shrinks,
    /// so pending writes beyond the end of the wrapped stream stay visible.
    void refreshSize() { size = std::max(size, stream->size()); }

    std::size_t bufferChunk(ChunkIndex chunk);
    void fillBuffer(std::size_t slot, std::size_t target);
    void flushBuffer(std::size_t slot);
    void flushAll();

    template <typename Callback>
    void iterateChunks(FileOffset offset, std::size_t length, Callback&& callback) {
        if (length == 0) {
            return;
        }
        const FileOffset end = offset + length;
        const ChunkIndex last = chunkOf(end - 1, bufferSizeBits);

        for (ChunkIndex chunk = chunkOf(offset, bufferSizeBits); chunk <= last; ++chunk) {
            const FileOffset base = offsetOf(chunk);
            const FileOffset begin = std::max(base, offset);
            const FileOffset stop = std::min<FileOffset>(base + bufferSize, end);

            const ChunkSpan span{
                .offset = begin,
                .chunk = chunk,
                .requestBegin = static_cast<std::size_t>(begin - offset),
                .requestEnd = static_cast<std::size_t>(stop - offset),
                .slot = findChunk(chunk),
                .intraBegin = static_cast<std::size_t>(begin - base),
                .intraEnd = static_cast<std::size_t>(stop - base),
            };
            if (!callback(span)) {
                break;
            }
        }
    }

    std::unique_ptr<io::RandomAccessStream> stream;
    std::size_t bufferSize;
    unsigned bufferSizeBits;
    std::vector<ChunkBuffer> buffers;
    std::unique_ptr<std::uint8_t[]> arena;
    AccessStamp accessCounter = 0;
    std::uint64_t ptr = 0;
    std::uint64_t size;
    std::optional<PeekWindow> peek;
    BufferedStreamStats stats;
};

std::size_t BufferedStream::State::bufferChunk(ChunkIndex chunk) {
    if (auto slot = findChunk(chunk)) {
        return *slot;
    }

    const FileOffset offset = offsetOf(chunk);
    if (offset >= size) {
        refreshSize();
    }
    if (offset >= size) {
        throw OutOfRangeError("Reading past end of stream.",
                              ErrorContext{}.withChunk(chunk).withOffset(offset));
    }

    const auto victim = std::min_element(
        buffers.begin(), buffers.end(),
        [](const ChunkBuffer& a, const ChunkBuffer& b) { return a.lastAccess < b.lastAccess; });
    const auto slot = static_cast<std::size_t>(victim - buffers.begin());

    flushBuffer(slot);

    if (peek && peek->slot == slot) {
        peek.reset();
    }

    ChunkBuffer& buffer = buffers[slot];
    if (buffer.chunk != kUnassignedChunk) {
        ++stats.evictions;
        SCACHE_LOG_TRACE("Evicting chunk {} from slot {} for chunk {}", buffer.chunk, slot, chunk);
    }
    ++stats.misses;

    buffer.chunk = chunk;
    buffer.fill = 0;
    try {
        fillBuffer(slot, static_cast<std::size_t>(
                             std::min<std::uint64_t>(size - offset, bufferSize)));
    } catch (...) {
        buffer.chunk = kUnassignedChunk;
        buffer.fill = 0;
        throw;
    }
    return slot;
}

void BufferedStream::State::fillBuffer(std::size_t slot, std::size_t target) {
    ChunkBuffer& buffer = buffers[slot];
    if (target <= buffer.fill) {
        return;
    }

    const FileOffset begin = offsetOf(buffer.chunk) + buffer.fill;
    const std::uint64_t streamSize = stream->size();
    const std::size_t available =
        streamSize > begin
            ? static_cast<std::size_t>(std::min<std::uint64_t>(streamSize - begin,
                                                               target - buffer.fill))
            : 0;

    if (available > 0) {
        stream->seek(begin);
        stream->read(std::span<std::uint8_t>(memory(slot) + buffer.fill, available),
                     io::IOMode::kAll);
    }

    // Bytes between the end of the wrapped stream and the known size belong to
    // a hole left by a pending write beyond the end; they read as zero.
    std::memset(memory(slot) + buffer.fill + available, 0, target - buffer.fill - available);

    buffer.fill = target;
    touchBuffer(slot);
}

void BufferedStream::State::flushBuffer(std::size_t slot) {
    ChunkBuffer& buffer = buffers[slot];
    if (buffer.fill == 0 || !buffer.dirty) {
        return;
    }

    const FileOffset offset = offsetOf(buffer.chunk);
    stream->seek(offset);
    stream->write(std::span<const std::uint8_t>(memory(slot), buffer.fill), io::IOMode::kAll);
    size = std::max<std::uint64_t>(size, offset + buffer.fill);

    buffer.dirty = false;
    ++stats.dirtyFlushes;
    touchBuffer(slot);
}

void BufferedStream::State::flushAll() {
    for (std::size_t i = 0; i < buffers.size(); ++i) {
        flushBuffer(i);
    }
    stream->flush();
}

// =============================================================================
// BufferedStream
// =============================================================================

BufferedStream::BufferedStream(std::unique_ptr<io::RandomAccessStream> stream,
                               BufferedStreamConfig config) {
    unwrapOrThrow(config.validate());
    if (!stream) {
        throw InvalidStateError("Cannot buffer a null stream");
    }
    state_ = std::make_shared<State>(std::move(stream), config);

    SCACHE_LOG_DEBUG("BufferedStream created: bufferSize={}, bufferCount={}, size={}",
                     state_->bufferSize, state_->buffers.size(), state_->size);
}

bool BufferedStream::empty() {
    return state_->ptr >= state_->size;
}

std::uint64_t BufferedStream::leastSize() {
    const State& st = *state_;
    return st.size > st.ptr ? st.size - st.ptr : 0;
}

std::span<const std::uint8_t> BufferedStream::peek() {
    const State& st = *state_;
    if (!st.peek) {
        return {};
    }
    return {st.memory(st.peek->slot) + st.peek->begin, st.peek->end - st.peek->begin};
}

std::size_t BufferedStream::read(std::span<std::uint8_t> dst, io::IOMode mode) {
    State& st = *state_;
    if (dst.empty()) {
        return 0;
    }

    // Fast path: served entirely from the peek window.
    if (st.peek && dst.size() <= st.peek->end - st.peek->begin) {
        std::memcpy(dst.data(), st.memory(st.peek->slot) + st.peek->begin, dst.size());
        st.peek->begin += dst.size();
        st.ptr += dst.size();
        return dst.size();
    }

    if (st.ptr + dst.size() > st.size) {
        st.refreshSize();
    }
    if (st.ptr > st.size) {
        throw OutOfRangeError("Reading beyond end of stream.", ErrorContext{}.withOffset(st.ptr));
    }

    const auto length =
        static_cast<std::size_t>(std::min<std::uint64_t>(dst.size(), st.size - st.ptr));
    std::size_t nread = 0;
    std::optional<PeekWindow> newPeek;

    st.iterateChunks(st.ptr, length, [&](const ChunkSpan& span) {
        std::size_t slot = 0;
        if (!span.slot) {
            if (!mayBlock(mode, nread)) return false;
            slot = st.bufferChunk(span.chunk);
        } else {
            slot = *span.slot;
            ++st.stats.hits;
            st.touchBuffer(slot);
        }

        if (st.buffers[slot].fill < span.intraEnd) {
            if (!mayBlock(mode, nread)) return false;
            st.fillBuffer(slot, span.intraEnd);
        }

        const std::size_t len = span.requestEnd - span.requestBegin;
        std::memcpy(dst.data() + span.requestBegin, st.memory(slot) + span.intraBegin, len);
        nread += len;

        // The rest of the last chunk serves the next read.
        newPeek = PeekWindow{slot, span.intraEnd, st.buffers[slot].fill};
        return true;
    });

    if (nread < dst.size()) {
        if (mode == io::IOMode::kAll || (mode == io::IOMode::kOnce && nread == 0)) {
            throw EndOfStreamError("Reading past end of stream.",
                                   ErrorContext{}.withOffset(st.ptr + nread));
        }
    }

    st.ptr += nread;
    st.peek = newPeek;
    return nread;
}

std::size_t BufferedStream::write(std::span<const std::uint8_t> bytes, io::IOMode mode) {
    State& st = *state_;
    if (!st.stream->writable()) {
        throw InvalidStateError("Writing to a read-only stream.", ErrorContext{}.withOffset(st.ptr));
    }
    if (bytes.empty()) {
        return 0;
    }

    std::size_t nwritten = 0;
    std::optional<PeekWindow> newPeek;

    st.iterateChunks(st.ptr, bytes.size(), [&](const ChunkSpan& span) {
        const auto src = bytes.subspan(span.requestBegin, span.requestEnd - span.requestBegin);

        if (!span.slot) {
            if (!mayBlock(mode, nwritten)) return false;
            st.stream->seek(span.offset);
            st.stream->write(src, io::IOMode::kAll);
            ++st.stats.writeThroughs;
            newPeek.reset();
        } else {
            const std::size_t slot = *span.slot;
            if (st.buffers[slot].fill < span.intraBegin) {
                if (!mayBlock(mode, nwritten)) return false;
                st.fillBuffer(slot, span.intraBegin);
            }

            ChunkBuffer& buffer = st.buffers[slot];
            std::memcpy(st.memory(slot) + span.intraBegin, src.data(), src.size());
            buffer.fill = std::max(buffer.fill, span.intraEnd);
            buffer.dirty = true;
            ++st.stats.hits;
            st.touchBuffer(slot);
            newPeek = PeekWindow{slot, span.intraEnd, buffer.fill};
        }

        nwritten += src.size();
        st.size = std::max<std::uint64_t>(st.size, span.offset + src.size());
        return true;
    });

    st.ptr += nwritten;
    st.peek = newPeek;
    return nwritten;
}

void BufferedStream::flush() {
    state_->flushAll();
}

void BufferedStream::finalize() {
    flush();
}

void BufferedStream::sync() {
    State& st = *state_;
    st.flushAll();
    for (ChunkBuffer& buffer : st.buffers) {
        buffer.chunk = kUnassignedChunk;
        buffer.fill = 0;
        buffer.dirty = false;
    }
    st.size = st.stream->size();
    st.peek.reset();
}

std::uint64_t BufferedStream::size() const {
    return state_->size;
}

bool BufferedStream::readable() const {
    return state_->stream->readable();
}

bool BufferedStream::writable() const {
    return state_->stream->writable();
}

void BufferedStream::seek(std::uint64_t offset) {
    State& st = *state_;
    if (offset == st.ptr) {
        return;
    }

    if (st.peek && offset > st.ptr && offset - st.ptr < st.peek->end - st.peek->begin) {
        st.peek->begin += static_cast<std::size_t>(offset - st.ptr);
        st.ptr = offset;
        return;
    }

    st.ptr = offset;
    st.peek.reset();

    if (auto slot = st.findChunk(chunkOf(offset, st.bufferSizeBits))) {
        const std::size_t intra = intraChunkOffset(offset, st.bufferSizeBits);
        if (intra < st.buffers[*slot].fill) {
            st.peek = PeekWindow{*slot, intra, st.buffers[*slot].fill};
            st.touchBuffer(*slot);
        }
    }
}

std::uint64_t BufferedStream::tell() {
    return state_->ptr;
}

void BufferedStream::truncate(std::uint64_t size) {
    sync();
    state_->stream->truncate(size);
    state_->size = size;
    state_->peek.reset();
}

void BufferedStream::close() {
    sync();
    state_->stream->close();
}

bool BufferedStream::isOpen() const {
    return state_->stream->isOpen();
}

io::RandomAccessStream& BufferedStream::underlying() const {
    return *state_->stream;
}

std::size_t BufferedStream::bufferSize() const noexcept {
    return state_->bufferSize;
}

std::size_t BufferedStream::bufferCount() const noexcept {
    return state_->buffers.size();
}

std::vector<ChunkIndex> BufferedStream::residentChunks() const {
    std::vector<ChunkIndex> chunks;
    for (const ChunkBuffer& buffer : state_->buffers) {
        if (buffer.chunk != kUnassignedChunk) {
            chunks.push_back(buffer.chunk);
        }
    }
    std::sort(chunks.begin(), chunks.end());
    return chunks;
}

bool BufferedStream::isChunkResident(ChunkIndex chunk) const noexcept {
    return state_->findChunk(chunk).has_value();
}

BufferedStreamStats BufferedStream::stats() const noexcept {
    return state_->stats;
}

// =============================================================================
// Factory Functions
// =============================================================================

BufferedStream createBufferedStream(std::unique_ptr<io::RandomAccessStream> stream,
                                    BufferedStreamConfig config) {
    return BufferedStream(std::move(stream), config);
}

}  // namespace scache::cache
