// =============================================================================
// streamcache - Cached File Stream Tests
// =============================================================================
// Unit tests for progressive staging of sequential sources into a file.
// =============================================================================

#include "scache/cache/cached_file_stream.h"

#include <gtest/gtest.h>

#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <numeric>
#include <string>
#include <vector>

#include "scache/common/error.h"
#include "scache/io/fd_input_stream.h"
#include "scache/io/memory_stream.h"
#include "scache/io/operations.h"

namespace scache::cache {
namespace {

namespace fs = std::filesystem;

using io::IOMode;
using io::MemoryStream;

// =============================================================================
// Test Fixture
// =============================================================================

class CachedFileStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               (std::string("scache_cached_stream_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        source_.resize(10);
        std::iota(source_.begin(), source_.end(), std::uint8_t{1});
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    /// @brief Stream over the ten bytes 1..10, staged into the test directory.
    CachedFileStream makeStream(bool writable = false, fs::path cachePath = {}) {
        return createCachedFileStream(std::make_unique<MemoryStream>(source_, false),
                                      {.cachePath = std::move(cachePath),
                                       .tempDirectory = dir_,
                                       .writable = writable});
    }

    static std::vector<std::uint8_t> readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    template <std::size_t N>
    static std::array<std::uint8_t, N> readBytes(CachedFileStream& stream) {
        std::array<std::uint8_t, N> out{};
        stream.read(out);
        return out;
    }

    fs::path dir_;
    std::vector<std::uint8_t> source_;
};

/// @brief Anonymous pipe whose write end is filled up front and then closed.
std::unique_ptr<io::FdInputStream> makePipeSource(const std::vector<std::uint8_t>& content,
                                                  std::size_t bufferSize) {
    int fds[2] = {-1, -1};
    if (::pipe(fds) != 0) {
        throw IOError("pipe() failed");
    }
    std::size_t written = 0;
    while (written < content.size()) {
        const ssize_t n = ::write(fds[1], content.data() + written, content.size() - written);
        if (n <= 0) {
            throw IOError("write() to pipe failed");
        }
        written += static_cast<std::size_t>(n);
    }
    ::close(fds[1]);
    return std::make_unique<io::FdInputStream>(fds[0], true, "pipe", bufferSize);
}

// =============================================================================
// Configuration
// =============================================================================

TEST_F(CachedFileStreamTest, ConfigRejectsDirectoryAsCachePath) {
    CachedFileStreamConfig config{.cachePath = dir_};
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kUsageError);
}

TEST_F(CachedFileStreamTest, ConfigRejectsMissingTempDirectory) {
    CachedFileStreamConfig config{.tempDirectory = dir_ / "missing"};
    EXPECT_FALSE(config.validate().has_value());
    EXPECT_THROW((void)createCachedFileStream(std::make_unique<MemoryStream>(source_), config),
                 UsageError);
}

TEST_F(CachedFileStreamTest, NullSourceThrows) {
    EXPECT_THROW(CachedFileStream(nullptr), InvalidStateError);
}

// =============================================================================
// Staging
// =============================================================================

TEST_F(CachedFileStreamTest, StagesProgressivelyAndRemovesTemporary) {
    auto stream = makeStream();
    const fs::path path = stream.path();

    EXPECT_EQ(path.parent_path(), dir_);
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(fs::file_size(path), 0u);
    EXPECT_EQ(stream.size(), 10u);

    EXPECT_EQ(readBytes<2>(stream), (std::array<std::uint8_t, 2>{1, 2}));
    EXPECT_EQ(fs::file_size(path), 2u);
    EXPECT_EQ(stream.stagedBytes(), 2u);

    EXPECT_EQ(readBytes<8>(stream), (std::array<std::uint8_t, 8>{3, 4, 5, 6, 7, 8, 9, 10}));
    EXPECT_EQ(readFile(path), source_);
    EXPECT_TRUE(stream.empty());

    stream.close();
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(CachedFileStreamTest, ExplicitCachePathIsKept) {
    const fs::path cachePath = dir_ / "staged.bin";
    {
        auto stream = makeStream(false, cachePath);
        EXPECT_EQ(stream.path(), cachePath);
        (void)io::readAll(stream);
    }
    EXPECT_EQ(readFile(cachePath), source_);
}

TEST_F(CachedFileStreamTest, SeekStagesUpToTarget) {
    auto stream = makeStream();
    stream.seek(7);
    EXPECT_EQ(stream.stagedBytes(), 7u);
    EXPECT_EQ(stream.tell(), 7u);
    EXPECT_EQ(stream.leastSize(), 3u);
    EXPECT_EQ(readBytes<1>(stream)[0], 8);
}

TEST_F(CachedFileStreamTest, BackwardSeekIsServedFromFile) {
    auto stream = makeStream();
    (void)io::readAll(stream);
    EXPECT_EQ(stream.stagedBytes(), 10u);

    stream.seek(3);
    EXPECT_EQ(readBytes<4>(stream), (std::array<std::uint8_t, 4>{4, 5, 6, 7}));
    EXPECT_EQ(stream.stagedBytes(), 10u);
}

TEST_F(CachedFileStreamTest, ReadPastEndThrows) {
    auto stream = makeStream();
    stream.seek(8);
    std::array<std::uint8_t, 4> out{};
    EXPECT_THROW(stream.read(out), EndOfStreamError);

    stream.seek(8);
    EXPECT_EQ(stream.read(out, IOMode::kOnce), 2u);
}

TEST_F(CachedFileStreamTest, PipeSourceGrowsSizeWhileConsumed) {
    std::vector<std::uint8_t> content(100);
    std::iota(content.begin(), content.end(), std::uint8_t{0});

    auto stream = createCachedFileStream(makePipeSource(content, 16), {.tempDirectory = dir_});
    EXPECT_LE(stream.size(), 16u);

    stream.seek(50);
    std::array<std::uint8_t, 10> out{};
    stream.read(out);
    EXPECT_EQ(out[0], 50);
    EXPECT_EQ(out[9], 59);

    (void)io::readAll(stream);
    EXPECT_EQ(stream.size(), 100u);

    stream.seek(0);
    EXPECT_EQ(io::readAll(stream), content);
}

// =============================================================================
// Writing
// =============================================================================

TEST_F(CachedFileStreamTest, WritePreservesUnwrittenSourceBytes) {
    auto stream = makeStream(true);
    EXPECT_TRUE(stream.writable());

    stream.write(std::array<std::uint8_t, 3>{11, 12, 13});
    stream.seek(0);
    EXPECT_EQ(readBytes<6>(stream), (std::array<std::uint8_t, 6>{11, 12, 13, 4, 5, 6}));

    stream.write(std::array<std::uint8_t, 6>{14, 15, 16, 17, 18, 19});
    EXPECT_EQ(stream.size(), 12u);
    stream.seek(6);
    EXPECT_EQ(readBytes<6>(stream), (std::array<std::uint8_t, 6>{14, 15, 16, 17, 18, 19}));

    stream.seek(0);
    EXPECT_EQ(readBytes<6>(stream), (std::array<std::uint8_t, 6>{11, 12, 13, 4, 5, 6}));
}

TEST_F(CachedFileStreamTest, ReadOnlyRejectsWriteAndTruncate) {
    auto stream = makeStream();
    EXPECT_FALSE(stream.writable());
    EXPECT_THROW(stream.write(std::string_view("x")), InvalidStateError);
    EXPECT_THROW(stream.truncate(0), InvalidStateError);
}

TEST_F(CachedFileStreamTest, TruncateShrinksStagedCopy) {
    auto stream = makeStream(true);
    (void)io::readAll(stream);
    stream.truncate(4);
    EXPECT_EQ(fs::file_size(stream.path()), 4u);
}

// =============================================================================
// Close
// =============================================================================

TEST_F(CachedFileStreamTest, ClosedStreamRejectsOperations) {
    auto stream = makeStream();
    CachedFileStream copy = stream;

    stream.close();
    EXPECT_FALSE(copy.isOpen());
    EXPECT_EQ(copy.fd(), -1);
    EXPECT_NO_THROW(copy.close());

    std::array<std::uint8_t, 1> out{};
    EXPECT_THROW(stream.read(out), InvalidStateError);
    EXPECT_THROW(stream.seek(0), InvalidStateError);
    EXPECT_THROW((void)stream.tell(), InvalidStateError);
}

TEST_F(CachedFileStreamTest, CloseFailureIsReportedAndTemporaryRemoved) {
    auto stream = makeStream();
    EXPECT_EQ((readBytes<4>(stream)), (std::array<std::uint8_t, 4>{1, 2, 3, 4}));
    const fs::path path = stream.path();

    // Closing the descriptor underneath makes the stream's own close fail with EBADF.
    ASSERT_EQ(::close(stream.fd()), 0);
    try {
        stream.close();
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        ASSERT_TRUE(e.systemError().has_value());
        EXPECT_EQ(e.systemError()->value(), EBADF);
    }
    EXPECT_FALSE(fs::exists(path));
    EXPECT_FALSE(stream.isOpen());
    EXPECT_NO_THROW(stream.close());
}

TEST_F(CachedFileStreamTest, DestructionSwallowsCloseFailure) {
    fs::path path;
    EXPECT_NO_THROW([&] {
        auto stream = makeStream();
        EXPECT_EQ(stream.size(), 10u);
        path = stream.path();
        ASSERT_EQ(::close(stream.fd()), 0);
    }());
    EXPECT_FALSE(path.empty());
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(CachedFileStreamTest, LastHandleRemovesTemporary) {
    fs::path path;
    {
        auto stream = makeStream();
        path = stream.path();
        EXPECT_TRUE(fs::exists(path));
    }
    EXPECT_FALSE(fs::exists(path));
}

}  // namespace
}  // namespace scache::cache
