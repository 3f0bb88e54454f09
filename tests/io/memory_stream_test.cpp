// =============================================================================
// streamcache - Memory Stream Tests
// =============================================================================
// Unit tests for the in-memory random access stream.
// =============================================================================

#include "scache/io/memory_stream.h"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <numeric>
#include <vector>

#include "scache/common/error.h"

namespace scache::io {
namespace {

std::vector<std::uint8_t> makeSequence(std::size_t n) {
    std::vector<std::uint8_t> data(n);
    std::iota(data.begin(), data.end(), std::uint8_t{0});
    return data;
}

// =============================================================================
// Reading
// =============================================================================

TEST(MemoryStreamTest, InitialSizeIsClampedToCapacity) {
    auto buffer = makeSequence(16);
    MemoryStream full(buffer);
    EXPECT_EQ(full.size(), 16u);

    MemoryStream partial(buffer, true, 4);
    EXPECT_EQ(partial.size(), 4u);
    EXPECT_EQ(partial.capacity(), 16u);
}

TEST(MemoryStreamTest, ReadAdvancesPosition) {
    auto buffer = makeSequence(16);
    MemoryStream stream(buffer);

    std::array<std::uint8_t, 4> out{};
    stream.read(out);
    EXPECT_EQ(out, (std::array<std::uint8_t, 4>{0, 1, 2, 3}));
    EXPECT_EQ(stream.tell(), 4u);
    EXPECT_EQ(stream.leastSize(), 12u);
    EXPECT_FALSE(stream.empty());
}

TEST(MemoryStreamTest, ReadAllPastEndThrows) {
    auto buffer = makeSequence(8);
    MemoryStream stream(buffer, true, 3);

    std::array<std::uint8_t, 4> out{};
    EXPECT_THROW(stream.read(out), EndOfStreamError);
    EXPECT_EQ(stream.tell(), 0u);
}

TEST(MemoryStreamTest, ReadOnceReturnsShortCount) {
    auto buffer = makeSequence(8);
    MemoryStream stream(buffer, true, 3);

    std::array<std::uint8_t, 4> out{};
    EXPECT_EQ(stream.read(out, IOMode::kOnce), 3u);
    EXPECT_TRUE(stream.empty());
}

TEST(MemoryStreamTest, PeekHonorsWindow) {
    auto buffer = makeSequence(8);
    MemoryStream stream(buffer);
    stream.setPeekWindow(2);
    stream.seek(5);

    auto window = stream.peek();
    ASSERT_EQ(window.size(), 2u);
    EXPECT_EQ(window[0], 5);
    EXPECT_EQ(window[1], 6);
}

// =============================================================================
// Writing
// =============================================================================

TEST(MemoryStreamTest, WriteGrowsSizeUpToCapacity) {
    std::vector<std::uint8_t> buffer(8, 0);
    MemoryStream stream(buffer, true, 0);

    const std::array<std::uint8_t, 3> in{7, 8, 9};
    stream.write(in);
    EXPECT_EQ(stream.size(), 3u);
    EXPECT_EQ(buffer[2], 9);

    stream.seek(6);
    EXPECT_THROW(stream.write(in), OutOfRangeError);
}

TEST(MemoryStreamTest, ReadOnlyRejectsWrites) {
    auto buffer = makeSequence(8);
    MemoryStream stream(buffer, false);

    EXPECT_FALSE(stream.writable());
    EXPECT_THROW(stream.write(std::string_view("x")), InvalidStateError);
}

TEST(MemoryStreamTest, TruncateAndSeekRespectCapacity) {
    auto buffer = makeSequence(8);
    MemoryStream stream(buffer);

    stream.truncate(2);
    EXPECT_EQ(stream.size(), 2u);
    EXPECT_THROW(stream.truncate(9), OutOfRangeError);
    EXPECT_THROW(stream.seek(9), OutOfRangeError);
}

TEST(MemoryStreamTest, ClosedStreamRejectsIo) {
    auto buffer = makeSequence(8);
    auto stream = createMemoryStream(buffer);

    stream->close();
    EXPECT_FALSE(stream->isOpen());

    std::array<std::uint8_t, 1> out{};
    EXPECT_THROW(stream->read(out), InvalidStateError);
}

}  // namespace
}  // namespace scache::io
