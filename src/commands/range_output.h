// =============================================================================
// streamcache - Range Output
// =============================================================================
// Shared output helpers for the read and stage commands: copying a byte range
// from a stream to stdout, either raw or as a hex dump.
// =============================================================================

#ifndef SCACHE_COMMANDS_RANGE_OUTPUT_H
#define SCACHE_COMMANDS_RANGE_OUTPUT_H

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <span>
#include <string>

#include "scache/io/stream.h"

namespace scache::commands {

/// @brief Writes bytes to an ostream, raw or as a hex dump.
///
/// Hex dump lines hold 16 bytes and start with the absolute stream offset:
/// @code
/// 00000010  10 11 12 13 14 15 16 17 18 19 1a 1b 1c 1d 1e 1f
/// @endcode
class ByteOutput {
public:
    /// @brief Construct.
    /// @param out Destination.
    /// @param hex Emit a hex dump instead of raw bytes.
    /// @param baseOffset Stream offset of the first byte (hex dump labels).
    ByteOutput(std::ostream& out, bool hex, std::uint64_t baseOffset);

    /// @brief Append bytes.
    void write(std::span<const std::uint8_t> bytes);

    /// @brief Terminate a partial hex line and flush the destination.
    void finish();

    /// @brief Number of bytes passed to write().
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return written_; }

private:
    std::ostream& out_;
    bool hex_;
    std::uint64_t baseOffset_;
    std::uint64_t written_ = 0;
    std::string line_;
};

/// @brief Copy bytes from the current stream position to an output.
/// @param stream Stream to read from.
/// @param length Number of bytes to copy; 0 copies until the stream is empty.
/// @param output Destination.
/// @return Number of bytes copied.
/// @throws EndOfStreamError if length > 0 and the stream ends early.
std::uint64_t copyRange(io::InputStream& stream, std::uint64_t length, ByteOutput& output);

}  // namespace scache::commands

#endif  // SCACHE_COMMANDS_RANGE_OUTPUT_H
