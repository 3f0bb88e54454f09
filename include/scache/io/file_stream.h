// =============================================================================
// streamcache - File Stream
// =============================================================================
// Random access stream over a POSIX file descriptor.
//
// This module provides:
// - FileMode: open modes (read, read/write, create+truncate, append)
// - FileStream: unbuffered positional reads/writes via pread/pwrite
// - openFile / createTempFile factory functions
//
// FileStream is the backing store of CachedFileStream. System call failures
// are reported as IOError carrying the errno value and the file path.
// =============================================================================

#ifndef SCACHE_IO_FILE_STREAM_H
#define SCACHE_IO_FILE_STREAM_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>

#include "scache/io/stream.h"

namespace scache::io {

// =============================================================================
// File Mode
// =============================================================================

/// @brief How a file is opened.
enum class FileMode : std::uint8_t {
    kRead = 0,         ///< Existing file, read only
    kReadWrite = 1,    ///< Existing file, read and write
    kCreateTrunc = 2,  ///< Create or truncate, read and write
    kAppend = 3        ///< Create if missing, writes start at the end
};

/// @brief Get human-readable name for a file mode.
[[nodiscard]] std::string_view fileModeName(FileMode mode) noexcept;

// =============================================================================
// FileStream
// =============================================================================

/// @brief Random access stream backed by a file descriptor.
class FileStream final : public RandomAccessStream {
public:
    using Stream::read;
    using Stream::write;

    /// @brief Open a file.
    /// @throws IOError if the file cannot be opened.
    FileStream(const std::filesystem::path& path, FileMode mode);

    /// @brief Adopt an already open descriptor.
    /// @param fd Open descriptor, owned by the stream from now on.
    /// @param path Path of the file (informational).
    /// @param mode Mode the descriptor was opened with.
    FileStream(int fd, std::filesystem::path path, FileMode mode) noexcept;

    /// @brief Closes the descriptor; close errors are logged.
    ~FileStream() override;

    // Non-copyable, movable
    FileStream(const FileStream&) = delete;
    FileStream& operator=(const FileStream&) = delete;
    FileStream(FileStream&& other) noexcept;
    FileStream& operator=(FileStream&& other) noexcept;

    /// @brief Path the file was opened with.
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// @brief Underlying descriptor (-1 once closed).
    [[nodiscard]] int fd() const noexcept { return fd_; }

    /// @brief Open mode.
    [[nodiscard]] FileMode mode() const noexcept { return mode_; }

    [[nodiscard]] bool empty() override { return leastSize() == 0; }
    [[nodiscard]] std::uint64_t leastSize() override;
    [[nodiscard]] bool dataAvailableForRead() override { return leastSize() > 0; }
    [[nodiscard]] std::span<const std::uint8_t> peek() override { return {}; }
    std::size_t read(std::span<std::uint8_t> dst, IOMode mode) override;

    std::size_t write(std::span<const std::uint8_t> bytes, IOMode mode) override;
    void flush() override;
    void finalize() override;

    [[nodiscard]] std::uint64_t size() const override;
    [[nodiscard]] bool readable() const override { return true; }
    [[nodiscard]] bool writable() const override { return mode_ != FileMode::kRead; }
    void seek(std::uint64_t offset) override;
    [[nodiscard]] std::uint64_t tell() override { return ptr_; }
    void truncate(std::uint64_t size) override;
    void close() override;
    [[nodiscard]] bool isOpen() const override { return fd_ >= 0; }

private:
    void ensureOpen(std::string_view operation) const;

    int fd_ = -1;
    std::filesystem::path path_;
    FileMode mode_ = FileMode::kRead;
    std::uint64_t ptr_ = 0;
};

// =============================================================================
// Factory Functions
// =============================================================================

/// @brief Open a file.
/// @throws IOError if the file cannot be opened.
[[nodiscard]] std::unique_ptr<FileStream> openFile(const std::filesystem::path& path,
                                                   FileMode mode = FileMode::kRead);

/// @brief Create a new, uniquely named file for read/write access.
/// @param directory Directory to create the file in (system temp dir if empty).
/// @throws IOError if the file cannot be created.
[[nodiscard]] std::unique_ptr<FileStream> createTempFile(
    const std::filesystem::path& directory = {});

}  // namespace scache::io

#endif  // SCACHE_IO_FILE_STREAM_H
