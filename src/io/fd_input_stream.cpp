// =============================================================================
// streamcache - File Descriptor Input Stream Implementation
// =============================================================================

#include "scache/io/fd_input_stream.h"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#include "scache/common/error.h"
#include "scache/common/logger.h"

namespace scache::io {

FdInputStream::FdInputStream(int fd, bool ownsFd, std::string name, std::size_t bufferSize)
    : fd_(fd), ownsFd_(ownsFd), name_(std::move(name)), buffer_(std::max<std::size_t>(bufferSize, 1)) {}

FdInputStream::~FdInputStream() {
    if (ownsFd_ && fd_ >= 0 && ::close(fd_) != 0) {
        SCACHE_LOG_ERROR("Failed to close {}: {}", name_,
                         std::error_code(errno, std::generic_category()).message());
    }
}

std::size_t FdInputStream::fill() {
    begin_ = 0;
    end_ = 0;
    if (eof_) {
        return 0;
    }

    ssize_t n = 0;
    do {
        n = ::read(fd_, buffer_.data(), buffer_.size());
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        throw IOError("Failed to read " + name_, std::error_code(errno, std::generic_category()),
                      ErrorContext(name_).withOffset(totalBytesRead_));
    }
    if (n == 0) {
        eof_ = true;
        SCACHE_LOG_DEBUG("End of input on {} after {} bytes", name_, totalBytesRead_);
    }
    end_ = static_cast<std::size_t>(n);
    return end_;
}

std::uint64_t FdInputStream::leastSize() {
    if (begin_ == end_) {
        fill();
    }
    return end_ - begin_;
}

std::span<const std::uint8_t> FdInputStream::peek() {
    return std::span<const std::uint8_t>(buffer_).subspan(begin_, end_ - begin_);
}

std::size_t FdInputStream::read(std::span<std::uint8_t> dst, IOMode mode) {
    std::size_t nread = 0;
    bool blocked = false;

    while (nread < dst.size()) {
        if (begin_ == end_) {
            if (mode == IOMode::kImmediate) {
                break;
            }
            if (mode == IOMode::kOnce && (blocked || nread > 0)) {
                break;
            }
            blocked = true;
            if (fill() == 0) {
                break;
            }
        }

        const std::size_t len = std::min(end_ - begin_, dst.size() - nread);
        std::memcpy(dst.data() + nread, buffer_.data() + begin_, len);
        begin_ += len;
        nread += len;
    }

    totalBytesRead_ += nread;

    if (mode == IOMode::kAll && nread < dst.size()) {
        throw EndOfStreamError("Reading past end of " + name_ + ".",
                               ErrorContext(name_).withOffset(totalBytesRead_));
    }
    return nread;
}

std::unique_ptr<FdInputStream> openStdin() {
    return std::make_unique<FdInputStream>(STDIN_FILENO, false, "stdin");
}

}  // namespace scache::io
