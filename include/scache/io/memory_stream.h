// =============================================================================
// streamcache - In-Memory Streams
// =============================================================================
// Random access stream over a caller-provided byte array.
//
// The array is borrowed: the caller keeps it alive for the lifetime of the
// stream. The logical size starts at initialSize and may grow through writes
// up to the array's capacity, which makes the stream usable as a stand-in for
// a file that is still being appended to.
//
// Usage:
//   std::vector<std::uint8_t> data(256);
//   auto stream = createMemoryStream(data, true, 128);
// =============================================================================

#ifndef SCACHE_IO_MEMORY_STREAM_H
#define SCACHE_IO_MEMORY_STREAM_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <span>

#include "scache/io/stream.h"

namespace scache::io {

/// @brief Random access stream over a borrowed byte array.
class MemoryStream final : public RandomAccessStream {
public:
    using Stream::read;
    using Stream::write;

    /// @brief Construct over an existing array.
    /// @param data Backing array (capacity of the stream).
    /// @param writable Whether writes are permitted.
    /// @param initialSize Initial logical size, clamped to data.size().
    explicit MemoryStream(std::span<std::uint8_t> data, bool writable = true,
                          std::size_t initialSize = std::numeric_limits<std::size_t>::max());

    /// @brief Limit the size of the slice returned by peek() (debugging aid).
    void setPeekWindow(std::size_t size) noexcept { peekWindow_ = size; }

    /// @brief Total capacity of the backing array.
    [[nodiscard]] std::size_t capacity() const noexcept { return data_.size(); }

    /// @brief The valid part of the backing array.
    [[nodiscard]] std::span<const std::uint8_t> data() const noexcept {
        return data_.first(size_);
    }

    [[nodiscard]] bool empty() override { return leastSize() == 0; }
    [[nodiscard]] std::uint64_t leastSize() override { return size_ > ptr_ ? size_ - ptr_ : 0; }
    [[nodiscard]] bool dataAvailableForRead() override { return leastSize() > 0; }
    [[nodiscard]] std::span<const std::uint8_t> peek() override;
    std::size_t read(std::span<std::uint8_t> dst, IOMode mode) override;

    std::size_t write(std::span<const std::uint8_t> bytes, IOMode mode) override;
    void flush() override {}
    void finalize() override {}

    [[nodiscard]] std::uint64_t size() const override { return size_; }
    [[nodiscard]] bool readable() const override { return true; }
    [[nodiscard]] bool writable() const override { return writable_; }
    void seek(std::uint64_t offset) override;
    [[nodiscard]] std::uint64_t tell() override { return ptr_; }
    void truncate(std::uint64_t size) override;
    void close() override { open_ = false; }
    [[nodiscard]] bool isOpen() const override { return open_; }

private:
    std::span<std::uint8_t> data_;
    std::size_t size_;
    std::size_t ptr_ = 0;
    std::size_t peekWindow_;
    bool writable_;
    bool open_ = true;
};

/// @brief Create a memory stream over an existing array.
/// @param data Backing array; must outlive the stream.
/// @param writable Whether writes are permitted.
/// @param initialSize Initial logical size (the stream may grow up to data.size()).
[[nodiscard]] std::unique_ptr<MemoryStream> createMemoryStream(
    std::span<std::uint8_t> data, bool writable = true,
    std::size_t initialSize = std::numeric_limits<std::size_t>::max());

}  // namespace scache::io

#endif  // SCACHE_IO_MEMORY_STREAM_H
