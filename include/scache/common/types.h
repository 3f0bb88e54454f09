// =============================================================================
// streamcache - Common Type Definitions
// =============================================================================
// Core type definitions shared by the stream and cache modules.
//
// This module defines:
// - ChunkIndex, FileOffset, AccessStamp: Type aliases
// - Sentinel values and default cache geometry
// - Chunk arithmetic helpers (power-of-two rounding, offset mapping)
// =============================================================================

#ifndef SCACHE_COMMON_TYPES_H
#define SCACHE_COMMON_TYPES_H

#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace scache {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Index of a fixed-size chunk of a buffered stream.
/// @note Chunk i covers bytes [i << bufferSizeBits, (i + 1) << bufferSizeBits).
using ChunkIndex = std::uint64_t;

/// @brief Absolute byte offset within a stream.
using FileOffset = std::uint64_t;

/// @brief Monotonic access counter value used for LRU ordering.
using AccessStamp = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Chunk index of a buffer slot that holds no chunk.
inline constexpr ChunkIndex kUnassignedChunk = std::numeric_limits<ChunkIndex>::max();

/// @brief Default size of a single buffered chunk (16KB).
inline constexpr std::size_t kDefaultChunkBufferSize = 16'384;

/// @brief Default number of chunk buffers held by a buffered stream.
inline constexpr std::size_t kDefaultChunkBufferCount = 4;

/// @brief Upper bound for a single chunk buffer (1GB).
inline constexpr std::size_t kMaxChunkBufferSize = std::size_t{1} << 30;

/// @brief Buffer size used when piping data between streams (64KB).
inline constexpr std::size_t kPipeBufferSize = 64 * 1024;

// =============================================================================
// Chunk Arithmetic
// =============================================================================

/// @brief Round a requested buffer size up to the next power of two.
[[nodiscard]] constexpr std::size_t roundChunkSize(std::size_t requested) noexcept {
    return std::bit_ceil(requested == 0 ? std::size_t{1} : requested);
}

/// @brief log2 of a power-of-two chunk size.
[[nodiscard]] constexpr unsigned chunkSizeBits(std::size_t chunkSize) noexcept {
    return static_cast<unsigned>(std::countr_zero(chunkSize));
}

/// @brief Chunk containing a byte offset.
[[nodiscard]] constexpr ChunkIndex chunkOf(FileOffset offset, unsigned bits) noexcept {
    return offset >> bits;
}

/// @brief First byte offset of a chunk.
[[nodiscard]] constexpr FileOffset chunkStart(ChunkIndex chunk, unsigned bits) noexcept {
    return chunk << bits;
}

/// @brief Offset of a byte within its chunk.
[[nodiscard]] constexpr std::size_t intraChunkOffset(FileOffset offset, unsigned bits) noexcept {
    return static_cast<std::size_t>(offset & ((FileOffset{1} << bits) - 1));
}

}  // namespace scache

#endif  // SCACHE_COMMON_TYPES_H
