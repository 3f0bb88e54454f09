// =============================================================================
// streamcache - Buffered Stream Property Tests
// =============================================================================
// Property-based tests for the chunked LRU buffered stream.
//
// Random operation sequences are applied both to a buffered stream and to a
// plain byte vector; after every step the two must agree, and after a flush
// the wrapped stream must hold the model's bytes.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <vector>

#include "counting_stream.h"
#include "scache/cache/buffered_stream.h"
#include "scache/io/memory_stream.h"

namespace scache::cache::test {

using scache::test::CountingStream;
using scache::test::IoCounters;

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

enum class OpKind : std::uint8_t { kRead, kWrite, kSeek };

struct Operation {
    OpKind kind = OpKind::kRead;
    std::size_t position = 0;  ///< Scaled to the current size when applied
    std::size_t length = 1;
    std::uint8_t value = 0;
};

[[nodiscard]] rc::Gen<Operation> operation() {
    return rc::gen::apply(
        [](int kind, std::size_t position, std::size_t length, std::uint8_t value) {
            return Operation{static_cast<OpKind>(kind), position, length, value};
        },
        rc::gen::inRange(0, 3),
        rc::gen::inRange<std::size_t>(0, 1000),
        rc::gen::inRange<std::size_t>(1, 40),
        rc::gen::arbitrary<std::uint8_t>());
}

[[nodiscard]] rc::Gen<std::vector<Operation>> operations() {
    return rc::gen::resize(64, rc::gen::container<std::vector<Operation>>(operation()));
}

[[nodiscard]] rc::Gen<std::vector<std::uint8_t>> content(std::size_t maxSize) {
    return rc::gen::mapcat(rc::gen::inRange<std::size_t>(0, maxSize + 1), [](std::size_t len) {
        return rc::gen::container<std::vector<std::uint8_t>>(len,
                                                             rc::gen::arbitrary<std::uint8_t>());
    });
}

}  // namespace gen

namespace {

constexpr std::size_t kChunk = 16;
constexpr std::size_t kCapacity = 4096;

/// @brief Backing array with the initial content followed by zeros.
std::vector<std::uint8_t> makeBacking(const std::vector<std::uint8_t>& initial) {
    std::vector<std::uint8_t> backing(kCapacity, 0);
    std::copy(initial.begin(), initial.end(), backing.begin());
    return backing;
}

void readOneByte(BufferedStream& stream, std::uint64_t offset) {
    std::array<std::uint8_t, 1> byte{};
    stream.seek(offset);
    stream.read(byte);
}

}  // namespace

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(BufferedStreamProperty, MatchesByteVectorModel, ()) {
    const auto initial = *gen::content(300);
    const auto ops = *gen::operations();
    const auto bufferCount = *rc::gen::inRange<std::size_t>(1, 5);

    auto backing = makeBacking(initial);
    auto memory = std::make_unique<io::MemoryStream>(backing, true, initial.size());
    io::MemoryStream* wrapped = memory.get();
    BufferedStream stream(std::move(memory), {.bufferSize = kChunk, .bufferCount = bufferCount});

    std::vector<std::uint8_t> model = initial;

    for (const auto& op : ops) {
        // Positions never exceed the current size, so every gap reads as zero.
        const std::size_t pos = op.position % (model.size() + 1);

        switch (op.kind) {
            case gen::OpKind::kRead: {
                const std::size_t len = std::min(op.length, model.size() - pos);
                if (len == 0) break;
                std::vector<std::uint8_t> out(len);
                stream.seek(pos);
                stream.read(out);
                RC_ASSERT(std::equal(out.begin(), out.end(), model.begin() + pos));
                break;
            }
            case gen::OpKind::kWrite: {
                const std::vector<std::uint8_t> data(op.length, op.value);
                stream.seek(pos);
                stream.write(data);
                if (pos + data.size() > model.size()) {
                    model.resize(pos + data.size(), 0);
                }
                std::copy(data.begin(), data.end(), model.begin() + pos);
                break;
            }
            case gen::OpKind::kSeek: {
                stream.seek(pos);
                const auto window = stream.peek();
                RC_ASSERT(window.size() <= model.size() - pos);
                RC_ASSERT(std::equal(window.begin(), window.end(), model.begin() + pos));
                break;
            }
        }

        RC_ASSERT(stream.size() == model.size());
        RC_ASSERT(stream.residentChunks().size() <= bufferCount);
    }

    stream.flush();
    RC_ASSERT(wrapped->size() == model.size());
    RC_ASSERT(std::equal(model.begin(), model.end(), backing.begin()));
}

RC_GTEST_PROP(BufferedStreamProperty, LeastRecentlyUsedChunkIsEvicted, ()) {
    const auto bufferCount = *rc::gen::inRange<std::size_t>(1, 8);

    std::vector<std::uint8_t> backing(kChunk * (bufferCount + 1), 7);
    BufferedStream stream(std::make_unique<io::MemoryStream>(backing),
                          {.bufferSize = kChunk, .bufferCount = bufferCount});

    for (std::size_t chunk = 0; chunk <= bufferCount; ++chunk) {
        readOneByte(stream, chunk * kChunk);
    }

    RC_ASSERT(!stream.isChunkResident(0));
    for (std::size_t chunk = 1; chunk <= bufferCount; ++chunk) {
        RC_ASSERT(stream.isChunkResident(chunk));
    }
    RC_ASSERT(stream.stats().evictions == 1u);
}

RC_GTEST_PROP(BufferedStreamProperty, DirtyChunkIsWrittenBeforeReuse, ()) {
    const auto bufferCount = *rc::gen::inRange<std::size_t>(1, 6);
    const auto intra = *rc::gen::inRange<std::size_t>(0, kChunk);
    const auto value = *rc::gen::arbitrary<std::uint8_t>();

    auto counters = std::make_shared<IoCounters>();
    std::vector<std::uint8_t> backing(kChunk * (bufferCount + 1), 0);
    BufferedStream stream(
        std::make_unique<CountingStream>(std::make_unique<io::MemoryStream>(backing), counters),
        {.bufferSize = kChunk, .bufferCount = bufferCount});

    readOneByte(stream, 0);
    stream.seek(intra);
    const std::array<std::uint8_t, 1> byte{value};
    stream.write(byte);

    for (std::size_t chunk = 1; chunk < bufferCount; ++chunk) {
        readOneByte(stream, chunk * kChunk);
    }
    RC_ASSERT(counters->writeLog.empty());

    readOneByte(stream, bufferCount * kChunk);

    RC_ASSERT(counters->writeLog.size() == 1u);
    const auto& record = counters->writeLog.front();
    RC_ASSERT(record.offset == 0u);
    RC_ASSERT(record.bytes.size() == kChunk);
    RC_ASSERT(record.bytes[intra] == value);
    RC_ASSERT(backing[intra] == value);
}

RC_GTEST_PROP(BufferedStreamProperty, SeekToCurrentPositionIsIdempotent, ()) {
    const auto initial = *gen::content(200);
    const auto ops = *gen::operations();

    auto backing = makeBacking(initial);
    auto counters = std::make_shared<IoCounters>();
    BufferedStream stream(
        std::make_unique<CountingStream>(
            std::make_unique<io::MemoryStream>(backing, true, initial.size()), counters),
        {.bufferSize = kChunk, .bufferCount = 3});

    std::size_t size = initial.size();
    for (const auto& op : ops) {
        const std::size_t pos = op.position % (size + 1);
        stream.seek(pos);
        if (op.kind == gen::OpKind::kRead) {
            std::vector<std::uint8_t> out(std::min(op.length, size - pos));
            stream.read(out);
        } else if (op.kind == gen::OpKind::kWrite) {
            stream.write(std::vector<std::uint8_t>(op.length, op.value));
            size = std::max(size, pos + op.length);
        }
    }

    const auto ioBefore = counters->total();
    const auto tellBefore = stream.tell();
    const auto peekBefore = stream.peek();

    stream.seek(stream.tell());

    RC_ASSERT(counters->total() == ioBefore);
    RC_ASSERT(stream.tell() == tellBefore);
    RC_ASSERT(stream.peek().data() == peekBefore.data());
    RC_ASSERT(stream.peek().size() == peekBefore.size());
}

}  // namespace scache::cache::test
