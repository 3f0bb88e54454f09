// =============================================================================
// streamcache - Stream Contract
// =============================================================================
// Byte-oriented stream interfaces consumed and exposed by the cache layer.
//
// This module provides:
// - IOMode: completion policy for a single read/write call
// - InputStream / OutputStream / Stream: sequential interfaces
// - RandomAccessStream: positioned stream with size, seek and truncate
//
// Streams are used from one caller at a time. Implementations report errors
// by throwing ScacheException subclasses (see scache/common/error.h).
// =============================================================================

#ifndef SCACHE_IO_STREAM_H
#define SCACHE_IO_STREAM_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace scache::io {

// =============================================================================
// Completion Mode
// =============================================================================

/// @brief Controls how much blocking I/O a single read/write may perform.
enum class IOMode : std::uint8_t {
    /// @brief Return as soon as no progress is possible without blocking.
    kImmediate = 0,

    /// @brief Perform at most one blocking operation, then return.
    kOnce = 1,

    /// @brief Block until the whole buffer is transferred or fail.
    kAll = 2
};

/// @brief Get human-readable name for an IOMode.
[[nodiscard]] constexpr std::string_view ioModeName(IOMode mode) noexcept {
    switch (mode) {
        case IOMode::kImmediate:
            return "immediate";
        case IOMode::kOnce:
            return "once";
        case IOMode::kAll:
            return "all";
    }
    return "unknown";
}

// =============================================================================
// InputStream
// =============================================================================

/// @brief Interface for readable streams.
class InputStream {
public:
    virtual ~InputStream() = default;

    /// @brief Check whether the end of the stream has been reached.
    [[nodiscard]] virtual bool empty() = 0;

    /// @brief Number of bytes known to remain before the end is reached.
    /// @note After leastSize() bytes have been read, the stream is either
    ///       empty() or reports a new non-zero leastSize().
    [[nodiscard]] virtual std::uint64_t leastSize() = 0;

    /// @brief Check whether data can be read without blocking.
    [[nodiscard]] virtual bool dataAvailableForRead() = 0;

    /// @brief Temporary view of internally buffered data.
    /// @note Invalidated by any subsequent call on the same stream.
    [[nodiscard]] virtual std::span<const std::uint8_t> peek() = 0;

    /// @brief Read bytes into dst.
    /// @param dst Destination buffer.
    /// @param mode Completion mode.
    /// @return Number of bytes read.
    /// @throws EndOfStreamError if mode is kAll and dst cannot be filled.
    virtual std::size_t read(std::span<std::uint8_t> dst, IOMode mode) = 0;

    /// @brief Read exactly dst.size() bytes.
    void read(std::span<std::uint8_t> dst) { read(dst, IOMode::kAll); }

protected:
    InputStream() = default;
    InputStream(const InputStream&) = default;
    InputStream& operator=(const InputStream&) = default;
    InputStream(InputStream&&) noexcept = default;
    InputStream& operator=(InputStream&&) noexcept = default;
};

// =============================================================================
// OutputStream
// =============================================================================

/// @brief Interface for writable streams.
class OutputStream {
public:
    virtual ~OutputStream() = default;

    /// @brief Write bytes.
    /// @param bytes Source bytes.
    /// @param mode Completion mode.
    /// @return Number of bytes written.
    virtual std::size_t write(std::span<const std::uint8_t> bytes, IOMode mode) = 0;

    /// @brief Write all bytes.
    void write(std::span<const std::uint8_t> bytes) { write(bytes, IOMode::kAll); }

    /// @brief Write all characters of a string.
    void write(std::string_view text) {
        write(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                            text.size()),
              IOMode::kAll);
    }

    /// @brief Push buffered data to the underlying device.
    virtual void flush() = 0;

    /// @brief Flush and finish the stream; no writes may follow.
    virtual void finalize() = 0;

protected:
    OutputStream() = default;
    OutputStream(const OutputStream&) = default;
    OutputStream& operator=(const OutputStream&) = default;
    OutputStream(OutputStream&&) noexcept = default;
    OutputStream& operator=(OutputStream&&) noexcept = default;
};

// =============================================================================
// Stream / RandomAccessStream
// =============================================================================

/// @brief Bidirectional stream.
class Stream : public InputStream, public OutputStream {
public:
    using InputStream::read;
    using OutputStream::write;
};

/// @brief Stream with a position, a size and random access.
class RandomAccessStream : public Stream {
public:
    /// @brief Current (best known) size of the stream in bytes.
    [[nodiscard]] virtual std::uint64_t size() const = 0;

    /// @brief Whether read operations are permitted.
    [[nodiscard]] virtual bool readable() const = 0;

    /// @brief Whether write operations are permitted.
    [[nodiscard]] virtual bool writable() const = 0;

    /// @brief Move the read/write position.
    virtual void seek(std::uint64_t offset) = 0;

    /// @brief Current read/write position.
    [[nodiscard]] virtual std::uint64_t tell() = 0;

    /// @brief Resize the stream.
    virtual void truncate(std::uint64_t size) = 0;

    /// @brief Release the underlying resource.
    virtual void close() = 0;

    /// @brief Whether the stream is still open.
    [[nodiscard]] virtual bool isOpen() const = 0;
};

}  // namespace scache::io

#endif  // SCACHE_IO_STREAM_H
