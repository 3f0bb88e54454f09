// =============================================================================
// streamcache - Stream Operations
// =============================================================================
// Higher level operations built on the stream contract.
// =============================================================================

#ifndef SCACHE_IO_OPERATIONS_H
#define SCACHE_IO_OPERATIONS_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "scache/io/stream.h"

namespace scache::io {

/// @brief Copy bytes from source to sink.
/// @param source Stream to read from.
/// @param sink Stream to write to.
/// @param nbytes Number of bytes to copy; 0 copies until source is empty.
/// @return Number of bytes copied.
/// @throws EndOfStreamError if nbytes > 0 and the source ends early.
std::uint64_t pipe(InputStream& source, OutputStream& sink, std::uint64_t nbytes = 0);

/// @brief Read the remainder of a stream into memory.
/// @param source Stream to drain.
/// @param maxBytes Upper bound for the result.
/// @throws UsageError if the stream holds more than maxBytes.
[[nodiscard]] std::vector<std::uint8_t> readAll(
    InputStream& source, std::size_t maxBytes = std::numeric_limits<std::size_t>::max());

/// @brief Discard count bytes.
/// @throws EndOfStreamError if the stream ends early.
void skip(InputStream& source, std::uint64_t count);

}  // namespace scache::io

#endif  // SCACHE_IO_OPERATIONS_H
