// =============================================================================
// streamcache - Disk-Backed Cached Stream
// =============================================================================
// Random access view of a sequential input stream.
//
// Bytes are pulled from the source on demand, strictly in order, and staged
// into a local file. Seeking backwards and re-reading is served from that
// file; the source is never read twice. The reported size may grow while the
// source is consumed if the source does not announce its full length through
// leastSize().
//
// Without an explicit cache path, a temporary file is used and removed on
// close. With an explicit path, the file is created (or truncated) and kept.
// =============================================================================

#ifndef SCACHE_CACHE_CACHED_FILE_STREAM_H
#define SCACHE_CACHE_CACHED_FILE_STREAM_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

#include "scache/common/error.h"
#include "scache/io/stream.h"

namespace scache::cache {

// =============================================================================
// Configuration
// =============================================================================

/// @brief Configuration for CachedFileStream
struct CachedFileStreamConfig {
    /// @brief File to stage into (empty = temporary file, removed on close)
    std::filesystem::path cachePath;

    /// @brief Directory for the temporary file (empty = system temp dir)
    std::filesystem::path tempDirectory;

    /// @brief Allow writes to the staged copy
    bool writable = false;

    /// @brief Validate configuration
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// CachedFileStream
// =============================================================================

/// @brief Random access stream staging a sequential source into a file.
///
/// Writes (when enabled) modify only the staged copy. Source bytes up to the
/// end of a write are staged before the write is applied, so later pulls
/// never overwrite written data. A write therefore advances the staged
/// prefix (stagedBytes()) and may block on the source.
class CachedFileStream final : public io::RandomAccessStream {
public:
    using Stream::read;
    using Stream::write;

    /// @brief Wrap a sequential source.
    /// @param source Stream to stage (ownership is taken).
    /// @param config Cache file settings.
    /// @throws UsageError if the configuration is invalid.
    /// @throws InvalidStateError if source is null.
    /// @throws IOError (kFileOpenFailed) if the cache file cannot be created.
    explicit CachedFileStream(std::unique_ptr<io::InputStream> source,
                              CachedFileStreamConfig config = {});

    ~CachedFileStream() override = default;

    CachedFileStream(const CachedFileStream&) = default;
    CachedFileStream& operator=(const CachedFileStream&) = default;
    CachedFileStream(CachedFileStream&&) noexcept = default;
    CachedFileStream& operator=(CachedFileStream&&) noexcept = default;

    [[nodiscard]] bool empty() override { return leastSize() == 0; }
    [[nodiscard]] std::uint64_t leastSize() override;
    [[nodiscard]] bool dataAvailableForRead() override;
    [[nodiscard]] std::span<const std::uint8_t> peek() override;
    std::size_t read(std::span<std::uint8_t> dst, io::IOMode mode) override;

    std::size_t write(std::span<const std::uint8_t> bytes, io::IOMode mode) override;
    void flush() override;
    void finalize() override;

    [[nodiscard]] std::uint64_t size() const override;
    [[nodiscard]] bool readable() const override { return true; }
    [[nodiscard]] bool writable() const override;
    void seek(std::uint64_t offset) override;
    [[nodiscard]] std::uint64_t tell() override;
    void truncate(std::uint64_t size) override;

    /// @brief Close the cache file and release the source.
    ///
    /// A temporary cache file is removed; failure to remove it is logged.
    /// Calling close() again has no effect.
    void close() override;
    [[nodiscard]] bool isOpen() const override;

    /// @brief Path of the cache file.
    [[nodiscard]] const std::filesystem::path& path() const noexcept;

    /// @brief Descriptor of the cache file (-1 once closed).
    [[nodiscard]] int fd() const noexcept;

    /// @brief Number of source bytes staged so far.
    [[nodiscard]] std::uint64_t stagedBytes() const noexcept;

private:
    struct State;

    std::shared_ptr<State> state_;
};

// =============================================================================
// Factory Functions
// =============================================================================

/// @brief Create a cached file stream over a sequential source.
[[nodiscard]] CachedFileStream createCachedFileStream(std::unique_ptr<io::InputStream> source,
                                                      CachedFileStreamConfig config = {});

}  // namespace scache::cache

#endif  // SCACHE_CACHE_CACHED_FILE_STREAM_H
