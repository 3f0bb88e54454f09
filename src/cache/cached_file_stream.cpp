// =============================================================================
// streamcache - Disk-Backed Cached Stream Implementation
// =============================================================================

#include "scache/cache/cached_file_stream.h"

#include <algorithm>
#include <string_view>
#include <system_error>
#include <utility>

#include "scache/common/logger.h"
#include "scache/io/file_stream.h"
#include "scache/io/operations.h"

namespace scache::cache {

// =============================================================================
// CachedFileStreamConfig
// =============================================================================

VoidResult CachedFileStreamConfig::validate() const {
    std::error_code ec;
    if (!cachePath.empty() && std::filesystem::is_directory(cachePath, ec)) {
        return makeVoidError(ErrorCode::kUsageError,
                             "Cache path is a directory: " + cachePath.string());
    }
    if (!tempDirectory.empty() && !std::filesystem::is_directory(tempDirectory, ec)) {
        return makeVoidError(ErrorCode::kUsageError,
                             "Temporary directory does not exist: " + tempDirectory.string());
    }
    return makeVoidSuccess();
}

// =============================================================================
// CachedFileStream::State
// =============================================================================

struct CachedFileStream::State {
    State(std::unique_ptr<io::InputStream> input, const CachedFileStreamConfig& config)
        : source(std::move(input)), canWrite(config.writable) {
        size = source->leastSize();
        if (config.cachePath.empty()) {
            cachedFile = io::createTempFile(config.tempDirectory);
            deleteOnClose = true;
        } else {
            cachedFile = io::openFile(config.cachePath, io::FileMode::kCreateTrunc);
        }
        path = cachedFile->path();
    }

    ~State() {
        try {
            close();
        } catch (const std::exception& e) {
            SCACHE_LOG_ERROR("Failed to close cached stream {}: {}", path.string(), e.what());
        }
    }

    State(const State&) = delete;
    State& operator=(const State&) = delete;
    State(State&&) = delete;
    State& operator=(State&&) = delete;

    io::FileStream& file(std::string_view operation) const {
        if (!cachedFile) {
            throw InvalidStateError(std::string(operation) + " on closed cached stream",
                                    ErrorContext(path.string()));
        }
        return *cachedFile;
    }

    /// Stage source bytes until readPtr reaches target or the source runs dry.
    void readUpTo(std::uint64_t target) {
        if (target <= readPtr) {
            return;
        }

        io::FileStream& staged = file("Staging");
        const std::uint64_t saved = staged.tell();
        staged.seek(readPtr);

        try {
            while (target > readPtr) {
                const std::uint64_t chunk = std::min(target - readPtr, source->leastSize());
                if (chunk == 0) {
                    break;
                }
                io::pipe(*source, staged, chunk);
                readPtr += chunk;
                size = readPtr + source->leastSize();
            }
        } catch (...) {
            staged.seek(saved);
            throw;
        }
        staged.seek(saved);

        SCACHE_LOG_TRACE("Staged {} bytes into {}", readPtr, path.string());
    }

    void removeTemporary() const {
        if (!deleteOnClose) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            SCACHE_LOG_ERROR("Failed to remove temporary cache file {}: {}", path.string(),
                             ec.message());
        }
    }

    void close() {
        if (!cachedFile) {
            return;
        }
        std::unique_ptr<io::FileStream> staged = std::move(cachedFile);
        source.reset();

        try {
            staged->close();
        } catch (...) {
            removeTemporary();
            throw;
        }
        removeTemporary();
        SCACHE_LOG_DEBUG("CachedFileStream closed: path={}, staged={}", path.string(), readPtr);
    }

    std::unique_ptr<io::InputStream> source;
    std::unique_ptr<io::FileStream> cachedFile;
    std::filesystem::path path;
    std::uint64_t readPtr = 0;
    std::uint64_t size = 0;
    bool canWrite = false;
    bool deleteOnClose = false;
};

// =============================================================================
// CachedFileStream
// =============================================================================

CachedFileStream::CachedFileStream(std::unique_ptr<io::InputStream> source,
                                   CachedFileStreamConfig config) {
    unwrapOrThrow(config.validate());
    if (!source) {
        throw InvalidStateError("Cannot cache a null stream");
    }
    state_ = std::make_shared<State>(std::move(source), config);

    SCACHE_LOG_DEBUG("CachedFileStream created: path={}, temporary={}, size={}",
                     state_->path.string(), state_->deleteOnClose, state_->size);
}

std::uint64_t CachedFileStream::leastSize() {
    const std::uint64_t pos = tell();
    const std::uint64_t total = size();
    return pos > total ? 0 : total - pos;
}

bool CachedFileStream::dataAvailableForRead() {
    State& st = *state_;
    io::FileStream& staged = st.file("Querying");
    if (staged.dataAvailableForRead()) {
        return true;
    }
    return staged.tell() == st.readPtr && st.source->dataAvailableForRead();
}

std::span<const std::uint8_t> CachedFileStream::peek() {
    State& st = *state_;
    io::FileStream& staged = st.file("Peeking");
    if (staged.tell() == st.readPtr) {
        return st.source->peek();
    }
    return staged.peek();
}

std::size_t CachedFileStream::read(std::span<std::uint8_t> dst, io::IOMode mode) {
    State& st = *state_;
    io::FileStream& staged = st.file("Reading");
    st.readUpTo(staged.tell() + dst.size());
    return staged.read(dst, mode);
}

std::size_t CachedFileStream::write(std::span<const std::uint8_t> bytes, io::IOMode mode) {
    State& st = *state_;
    io::FileStream& staged = st.file("Writing");
    if (!st.canWrite) {
        throw InvalidStateError("Cached stream is not writable", ErrorContext(st.path.string()));
    }
    st.readUpTo(staged.tell() + bytes.size());
    return staged.write(bytes, mode);
}

void CachedFileStream::flush() {
    state_->file("Flushing").flush();
}

void CachedFileStream::finalize() {
    flush();
}

std::uint64_t CachedFileStream::size() const {
    const State& st = *state_;
    return std::max(st.file("Querying size").size(), st.size);
}

bool CachedFileStream::writable() const {
    return state_->canWrite;
}

void CachedFileStream::seek(std::uint64_t offset) {
    State& st = *state_;
    io::FileStream& staged = st.file("Seeking");
    st.readUpTo(offset);
    staged.seek(offset);
}

std::uint64_t CachedFileStream::tell() {
    return state_->file("Querying position").tell();
}

void CachedFileStream::truncate(std::uint64_t size) {
    State& st = *state_;
    io::FileStream& staged = st.file("Truncating");
    if (!st.canWrite) {
        throw InvalidStateError("Cached stream is not writable", ErrorContext(st.path.string()));
    }
    staged.truncate(size);
}

void CachedFileStream::close() {
    state_->close();
}

bool CachedFileStream::isOpen() const {
    return state_->cachedFile && state_->cachedFile->isOpen();
}

const std::filesystem::path& CachedFileStream::path() const noexcept {
    return state_->path;
}

int CachedFileStream::fd() const noexcept {
    return state_->cachedFile ? state_->cachedFile->fd() : -1;
}

std::uint64_t CachedFileStream::stagedBytes() const noexcept {
    return state_->readPtr;
}

// =============================================================================
// Factory Functions
// =============================================================================

CachedFileStream createCachedFileStream(std::unique_ptr<io::InputStream> source,
                                        CachedFileStreamConfig config) {
    return CachedFileStream(std::move(source), std::move(config));
}

}  // namespace scache::cache
