// =============================================================================
// streamcache - In-Memory Stream Implementation
// =============================================================================

#include "scache/io/memory_stream.h"

#include <algorithm>
#include <cstring>
#include <string>

#include "scache/common/error.h"

namespace scache::io {

MemoryStream::MemoryStream(std::span<std::uint8_t> data, bool writable, std::size_t initialSize)
    : data_(data)
    , size_(std::min(initialSize, data.size()))
    , peekWindow_(data.size())
    , writable_(writable) {}

std::span<const std::uint8_t> MemoryStream::peek() {
    if (ptr_ >= size_) {
        return {};
    }
    return std::span<const std::uint8_t>(data_).subspan(ptr_, std::min(size_ - ptr_, peekWindow_));
}

std::size_t MemoryStream::read(std::span<std::uint8_t> dst, IOMode mode) {
    if (!open_) {
        throw InvalidStateError("Reading from closed memory stream.");
    }
    const auto available = static_cast<std::size_t>(leastSize());
    if (mode == IOMode::kAll && dst.size() > available) {
        throw EndOfStreamError("Reading past end of memory stream.",
                               ErrorContext{}.withOffset(ptr_));
    }

    const std::size_t len = std::min(available, dst.size());
    if (len > 0) {
        std::memcpy(dst.data(), data_.data() + ptr_, len);
    }
    ptr_ += len;
    return len;
}

std::size_t MemoryStream::write(std::span<const std::uint8_t> bytes, IOMode /*mode*/) {
    if (!open_) {
        throw InvalidStateError("Writing to closed memory stream.");
    }
    if (!writable_) {
        throw InvalidStateError("Memory stream is not writable.");
    }
    if (bytes.size() > data_.size() - ptr_) {
        throw OutOfRangeError("Size limit of memory stream reached.",
                              ErrorContext{}.withOffset(ptr_ + bytes.size()));
    }

    if (!bytes.empty()) {
        std::memcpy(data_.data() + ptr_, bytes.data(), bytes.size());
    }
    ptr_ += bytes.size();
    size_ = std::max(size_, ptr_);
    return bytes.size();
}

void MemoryStream::seek(std::uint64_t offset) {
    if (offset > data_.size()) {
        throw OutOfRangeError("Seeking beyond capacity of memory stream.",
                              ErrorContext{}.withOffset(offset));
    }
    ptr_ = static_cast<std::size_t>(offset);
}

void MemoryStream::truncate(std::uint64_t size) {
    if (size > data_.size()) {
        throw OutOfRangeError("Size limit of memory stream reached.",
                              ErrorContext{}.withOffset(size));
    }
    size_ = static_cast<std::size_t>(size);
}

std::unique_ptr<MemoryStream> createMemoryStream(std::span<std::uint8_t> data, bool writable,
                                                 std::size_t initialSize) {
    return std::make_unique<MemoryStream>(data, writable, initialSize);
}

}  // namespace scache::io
