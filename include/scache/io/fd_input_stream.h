// =============================================================================
// streamcache - File Descriptor Input Stream
// =============================================================================
// Sequential, buffered input stream over a descriptor that may not support
// seeking (stdin, pipes, character devices).
//
// leastSize() reports the number of buffered bytes. When the buffer is empty
// it performs one blocking read to learn how much data is ready, so a result
// of 0 means end of input. This is the contract CachedFileStream relies on to
// pull from one-shot sources without over-reading.
// =============================================================================

#ifndef SCACHE_IO_FD_INPUT_STREAM_H
#define SCACHE_IO_FD_INPUT_STREAM_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "scache/common/types.h"
#include "scache/io/stream.h"

namespace scache::io {

/// @brief Buffered sequential reader over a file descriptor.
class FdInputStream final : public InputStream {
public:
    using InputStream::read;

    /// @brief Construct over a descriptor.
    /// @param fd Descriptor to read from.
    /// @param ownsFd Close the descriptor on destruction.
    /// @param name Name used in log and error messages.
    /// @param bufferSize Size of the internal read buffer.
    FdInputStream(int fd, bool ownsFd, std::string name,
                  std::size_t bufferSize = kPipeBufferSize);

    ~FdInputStream() override;

    // Non-copyable, non-movable
    FdInputStream(const FdInputStream&) = delete;
    FdInputStream& operator=(const FdInputStream&) = delete;
    FdInputStream(FdInputStream&&) = delete;
    FdInputStream& operator=(FdInputStream&&) = delete;

    [[nodiscard]] bool empty() override { return leastSize() == 0; }
    [[nodiscard]] std::uint64_t leastSize() override;
    [[nodiscard]] bool dataAvailableForRead() override { return begin_ < end_; }
    [[nodiscard]] std::span<const std::uint8_t> peek() override;
    std::size_t read(std::span<std::uint8_t> dst, IOMode mode) override;

    /// @brief Total number of bytes consumed by read().
    [[nodiscard]] std::uint64_t totalBytesRead() const noexcept { return totalBytesRead_; }

private:
    /// @brief Perform one blocking read into the empty buffer.
    /// @return Number of bytes now buffered (0 at end of input).
    std::size_t fill();

    int fd_;
    bool ownsFd_;
    std::string name_;
    std::vector<std::uint8_t> buffer_;
    std::size_t begin_ = 0;
    std::size_t end_ = 0;
    bool eof_ = false;
    std::uint64_t totalBytesRead_ = 0;
};

/// @brief Create a stream reading the process's standard input.
[[nodiscard]] std::unique_ptr<FdInputStream> openStdin();

}  // namespace scache::io

#endif  // SCACHE_IO_FD_INPUT_STREAM_H
