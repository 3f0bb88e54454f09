// =============================================================================
// streamcache - File Stream Implementation
// =============================================================================
// POSIX implementation using open/pread/pwrite. EINTR is retried; all other
// failures are reported as IOError with the errno value.
// =============================================================================

#include "scache/io/file_stream.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "scache/common/error.h"
#include "scache/common/logger.h"

namespace scache::io {

namespace {

[[nodiscard]] std::error_code lastError() noexcept {
    return {errno, std::generic_category()};
}

[[nodiscard]] int openFlags(FileMode mode) noexcept {
    switch (mode) {
        case FileMode::kRead:
            return O_RDONLY;
        case FileMode::kReadWrite:
            return O_RDWR;
        case FileMode::kCreateTrunc:
            return O_RDWR | O_CREAT | O_TRUNC;
        case FileMode::kAppend:
            return O_RDWR | O_CREAT;
    }
    return O_RDONLY;
}

}  // namespace

std::string_view fileModeName(FileMode mode) noexcept {
    switch (mode) {
        case FileMode::kRead:
            return "read";
        case FileMode::kReadWrite:
            return "readWrite";
        case FileMode::kCreateTrunc:
            return "createTrunc";
        case FileMode::kAppend:
            return "append";
    }
    return "unknown";
}

// =============================================================================
// FileStream Implementation
// =============================================================================

FileStream::FileStream(const std::filesystem::path& path, FileMode mode)
    : path_(path), mode_(mode) {
    do {
        fd_ = ::open(path.c_str(), openFlags(mode) | O_CLOEXEC, 0644);
    } while (fd_ < 0 && errno == EINTR);

    if (fd_ < 0) {
        throw IOError(ErrorCode::kFileOpenFailed, "Failed to open file", lastError(),
                      ErrorContext(path.string()));
    }

    if (mode == FileMode::kAppend) {
        ptr_ = size();
    }

    SCACHE_LOG_DEBUG("FileStream opened: path={}, mode={}", path_.string(), fileModeName(mode_));
}

FileStream::FileStream(int fd, std::filesystem::path path, FileMode mode) noexcept
    : fd_(fd), path_(std::move(path)), mode_(mode) {}

FileStream::~FileStream() {
    if (fd_ < 0) {
        return;
    }
    if (::close(fd_) != 0) {
        SCACHE_LOG_ERROR("Failed to close file {}: {}", path_.string(), lastError().message());
    }
}

FileStream::FileStream(FileStream&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , path_(std::move(other.path_))
    , mode_(other.mode_)
    , ptr_(std::exchange(other.ptr_, 0)) {}

FileStream& FileStream::operator=(FileStream&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0 && ::close(fd_) != 0) {
            SCACHE_LOG_ERROR("Failed to close file {}: {}", path_.string(), lastError().message());
        }
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
        mode_ = other.mode_;
        ptr_ = std::exchange(other.ptr_, 0);
    }
    return *this;
}

void FileStream::ensureOpen(std::string_view operation) const {
    if (fd_ < 0) {
        throw InvalidStateError(std::string(operation) + " on closed file",
                                ErrorContext(path_.string()));
    }
}

std::uint64_t FileStream::leastSize() {
    const std::uint64_t total = size();
    return total > ptr_ ? total - ptr_ : 0;
}

std::uint64_t FileStream::size() const {
    ensureOpen("Querying size");
    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        throw IOError("Failed to query file size", lastError(), ErrorContext(path_.string()));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

std::size_t FileStream::read(std::span<std::uint8_t> dst, IOMode mode) {
    ensureOpen("Reading");

    std::size_t total = 0;
    while (total < dst.size()) {
        const ssize_t n = ::pread(fd_, dst.data() + total, dst.size() - total,
                                  static_cast<off_t>(ptr_ + total));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw IOError("Failed to read file", lastError(),
                          ErrorContext(path_.string()).withOffset(ptr_ + total));
        }
        if (n == 0) {
            break;
        }
        total += static_cast<std::size_t>(n);
        if (mode != IOMode::kAll) {
            break;
        }
    }

    if (mode == IOMode::kAll && total < dst.size()) {
        throw EndOfStreamError("Reading past end of file.",
                               ErrorContext(path_.string()).withOffset(ptr_ + total));
    }

    ptr_ += total;
    return total;
}

std::size_t FileStream::write(std::span<const std::uint8_t> bytes, IOMode /*mode*/) {
    ensureOpen("Writing");
    if (!writable()) {
        throw InvalidStateError("File is opened read-only", ErrorContext(path_.string()));
    }

    std::size_t total = 0;
    while (total < bytes.size()) {
        const ssize_t n = ::pwrite(fd_, bytes.data() + total, bytes.size() - total,
                                   static_cast<off_t>(ptr_ + total));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw IOError("Failed to write file", lastError(),
                          ErrorContext(path_.string()).withOffset(ptr_ + total));
        }
        total += static_cast<std::size_t>(n);
    }

    ptr_ += total;
    return total;
}

void FileStream::flush() {
    // Writes go straight to the kernel; nothing is buffered here.
    ensureOpen("Flushing");
}

void FileStream::finalize() {
    ensureOpen("Finalizing");
    if (writable() && ::fsync(fd_) != 0) {
        throw IOError("Failed to sync file", lastError(), ErrorContext(path_.string()));
    }
}

void FileStream::seek(std::uint64_t offset) {
    ensureOpen("Seeking");
    ptr_ = offset;
}

void FileStream::truncate(std::uint64_t size) {
    ensureOpen("Truncating");
    int rc = 0;
    do {
        rc = ::ftruncate(fd_, static_cast<off_t>(size));
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
        throw IOError("Failed to truncate file", lastError(),
                      ErrorContext(path_.string()).withOffset(size));
    }
}

void FileStream::close() {
    if (fd_ < 0) {
        return;
    }
    const int fd = std::exchange(fd_, -1);
    if (::close(fd) != 0) {
        throw IOError("Failed to close file", lastError(), ErrorContext(path_.string()));
    }
    SCACHE_LOG_DEBUG("FileStream closed: path={}", path_.string());
}

// =============================================================================
// Factory Functions
// =============================================================================

std::unique_ptr<FileStream> openFile(const std::filesystem::path& path, FileMode mode) {
    return std::make_unique<FileStream>(path, mode);
}

std::unique_ptr<FileStream> createTempFile(const std::filesystem::path& directory) {
    std::error_code ec;
    std::filesystem::path dir = directory;
    if (dir.empty()) {
        dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            throw IOError("Failed to locate temporary directory", ec);
        }
    }

    std::string pattern = (dir / "scache-XXXXXX").string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    const int fd = ::mkostemp(name.data(), O_CLOEXEC);
    if (fd < 0) {
        throw IOError(ErrorCode::kFileOpenFailed, "Failed to create temporary file",
                      lastError(), ErrorContext(pattern));
    }

    std::filesystem::path path(name.data());
    SCACHE_LOG_DEBUG("Temporary file created: path={}", path.string());
    return std::make_unique<FileStream>(fd, std::move(path), FileMode::kCreateTrunc);
}

}  // namespace scache::io
