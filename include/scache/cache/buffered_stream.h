// =============================================================================
// streamcache - Buffered Random Access Stream
// =============================================================================
// Chunked LRU cache on top of a random access stream.
//
// The wrapped stream is logically split into chunks of equal, power-of-two
// size. A fixed number of chunks is held in memory; when a new chunk is
// needed, the least recently used one is flushed (if dirty) and reused.
//
// Writes to resident chunks are cached and written back on flush/eviction.
// Writes to chunks that are not resident go straight to the wrapped stream.
//
// Handles are cheap to copy: all copies share one engine state. The state is
// destroyed with the last handle, performing a best-effort flush.
//
// Usage:
// @code
// auto stream = scache::cache::createBufferedStream(scache::io::openFile(path),
//                                                   {.bufferSize = 4096});
// stream.seek(1'000'000);
// std::array<std::uint8_t, 16> header{};
// stream.read(header);
// @endcode
// =============================================================================

#ifndef SCACHE_CACHE_BUFFERED_STREAM_H
#define SCACHE_CACHE_BUFFERED_STREAM_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "scache/common/error.h"
#include "scache/common/types.h"
#include "scache/io/stream.h"

namespace scache::cache {

// =============================================================================
// Configuration
// =============================================================================

/// @brief Configuration for BufferedStream
struct BufferedStreamConfig {
    /// @brief Size of a single chunk buffer (rounded up to a power of two)
    std::size_t bufferSize = kDefaultChunkBufferSize;

    /// @brief Number of chunk buffers
    std::size_t bufferCount = kDefaultChunkBufferCount;

    /// @brief Validate configuration
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Statistics
// =============================================================================

/// @brief Access counters of a BufferedStream
struct BufferedStreamStats {
    /// @brief Chunk lookups that found the chunk resident
    std::uint64_t hits = 0;

    /// @brief Chunk lookups that had to load the chunk
    std::uint64_t misses = 0;

    /// @brief Loads that replaced a previously assigned chunk
    std::uint64_t evictions = 0;

    /// @brief Dirty chunks written back to the wrapped stream
    std::uint64_t dirtyFlushes = 0;

    /// @brief Write requests passed straight to the wrapped stream
    std::uint64_t writeThroughs = 0;

    /// @brief Fraction of chunk lookups that were hits
    [[nodiscard]] double hitRate() const noexcept {
        const std::uint64_t total = hits + misses;
        if (total == 0) return 0.0;
        return static_cast<double>(hits) / static_cast<double>(total);
    }
};

// =============================================================================
// BufferedStream
// =============================================================================

/// @brief Random access stream that caches chunks of a wrapped stream.
class BufferedStream final : public io::RandomAccessStream {
public:
    using Stream::read;
    using Stream::write;

    /// @brief Wrap a stream.
    /// @param stream Stream to wrap (ownership is taken).
    /// @param config Cache geometry.
    /// @throws UsageError if the configuration is invalid.
    /// @throws InvalidStateError if stream is null.
    explicit BufferedStream(std::unique_ptr<io::RandomAccessStream> stream,
                            BufferedStreamConfig config = {});

    ~BufferedStream() override = default;

    BufferedStream(const BufferedStream&) = default;
    BufferedStream& operator=(const BufferedStream&) = default;
    BufferedStream(BufferedStream&&) noexcept = default;
    BufferedStream& operator=(BufferedStream&&) noexcept = default;

    // -------------------------------------------------------------------------
    // InputStream
    // -------------------------------------------------------------------------

    /// @brief True if the position is at or beyond the known size.
    [[nodiscard]] bool empty() override;

    /// @brief Known size minus position (0 beyond the end).
    [[nodiscard]] std::uint64_t leastSize() override;

    /// @brief True if the peek window is non-empty.
    [[nodiscard]] bool dataAvailableForRead() override { return !peek().empty(); }

    /// @brief Cached bytes starting at the current position.
    [[nodiscard]] std::span<const std::uint8_t> peek() override;

    /// @brief Read bytes at the current position.
    /// @throws EndOfStreamError if mode is kAll and not enough data exists, or
    ///         mode is kOnce and the position is at the end of the stream.
    /// @throws OutOfRangeError if the position lies beyond the end.
    std::size_t read(std::span<std::uint8_t> dst, io::IOMode mode) override;

    // -------------------------------------------------------------------------
    // OutputStream
    // -------------------------------------------------------------------------

    /// @brief Write bytes at the current position.
    /// @throws InvalidStateError if the wrapped stream is not writable.
    std::size_t write(std::span<const std::uint8_t> bytes, io::IOMode mode) override;

    /// @brief Write back all dirty chunks, then flush the wrapped stream.
    void flush() override;

    /// @brief Same as flush().
    void finalize() override;

    // -------------------------------------------------------------------------
    // RandomAccessStream
    // -------------------------------------------------------------------------

    [[nodiscard]] std::uint64_t size() const override;
    [[nodiscard]] bool readable() const override;
    [[nodiscard]] bool writable() const override;

    /// @brief Move the position. Performs no I/O and never fails.
    void seek(std::uint64_t offset) override;
    [[nodiscard]] std::uint64_t tell() override;

    /// @brief Sync, then resize the wrapped stream.
    void truncate(std::uint64_t size) override;

    /// @brief Sync, then close the wrapped stream.
    void close() override;
    [[nodiscard]] bool isOpen() const override;

    // -------------------------------------------------------------------------
    // Cache control
    // -------------------------------------------------------------------------

    /// @brief Flush, drop all cached chunks and re-read the size.
    ///
    /// Makes changes done to the wrapped stream from the outside visible.
    void sync();

    /// @brief The wrapped stream.
    [[nodiscard]] io::RandomAccessStream& underlying() const;

    /// @brief Effective chunk size (power of two).
    [[nodiscard]] std::size_t bufferSize() const noexcept;

    /// @brief Number of chunk buffers.
    [[nodiscard]] std::size_t bufferCount() const noexcept;

    /// @brief Indices of the chunks currently held in memory.
    [[nodiscard]] std::vector<ChunkIndex> residentChunks() const;

    /// @brief Whether a chunk is currently held in memory.
    [[nodiscard]] bool isChunkResident(ChunkIndex chunk) const noexcept;

    /// @brief Access counters.
    [[nodiscard]] BufferedStreamStats stats() const noexcept;

private:
    struct State;

    std::shared_ptr<State> state_;
};

// =============================================================================
// Factory Functions
// =============================================================================

/// @brief Create a buffered stream wrapper.
/// @param stream Stream to wrap (ownership is taken).
/// @param config Cache geometry.
/// @throws UsageError if the configuration is invalid.
[[nodiscard]] BufferedStream createBufferedStream(std::unique_ptr<io::RandomAccessStream> stream,
                                                  BufferedStreamConfig config = {});

}  // namespace scache::cache

#endif  // SCACHE_CACHE_BUFFERED_STREAM_H
