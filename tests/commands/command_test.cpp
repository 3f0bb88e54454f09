// =============================================================================
// streamcache - Command Tests
// =============================================================================
// End-to-end tests of the read and stage commands against files on disk.
// =============================================================================

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <sstream>
#include <string>
#include <vector>

#include "commands/range_output.h"
#include "commands/read_command.h"
#include "commands/stage_command.h"
#include "scache/common/error.h"
#include "scache/io/memory_stream.h"

namespace scache::commands {
namespace {

namespace fs = std::filesystem;

// =============================================================================
// Test Fixture
// =============================================================================

class CommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("scache_command_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        content_.resize(100);
        std::iota(content_.begin(), content_.end(), std::uint8_t{0});
        input_ = dir_ / "input.bin";
        std::ofstream out(input_, std::ios::binary);
        out.write(reinterpret_cast<const char*>(content_.data()),
                  static_cast<std::streamsize>(content_.size()));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string bytes(std::size_t begin, std::size_t end) const {
        return {content_.begin() + static_cast<std::ptrdiff_t>(begin),
                content_.begin() + static_cast<std::ptrdiff_t>(end)};
    }

    fs::path dir_;
    fs::path input_;
    std::vector<std::uint8_t> content_;
};

// =============================================================================
// ByteOutput
// =============================================================================

TEST(ByteOutputTest, HexDumpLinesCarryAbsoluteOffsets) {
    std::vector<std::uint8_t> data(40);
    std::iota(data.begin(), data.end(), std::uint8_t{0});
    io::MemoryStream stream(data);
    stream.seek(14);

    std::ostringstream out;
    ByteOutput output(out, true, 14);
    EXPECT_EQ(copyRange(stream, 4, output), 4u);
    EXPECT_EQ(out.str(), "0000000e  0e 0f 10 11\n");
}

TEST(ByteOutputTest, HexDumpWrapsAfterSixteenBytes) {
    std::vector<std::uint8_t> data(17, 0xab);
    io::MemoryStream stream(data);

    std::ostringstream out;
    ByteOutput output(out, true, 0);
    EXPECT_EQ(copyRange(stream, 0, output), 17u);

    std::string expected = "00000000 ";
    for (int i = 0; i < 16; ++i) expected += " ab";
    expected += "\n00000010  ab\n";
    EXPECT_EQ(out.str(), expected);
}

// =============================================================================
// ReadCommand
// =============================================================================

TEST_F(CommandTest, ReadWritesRequestedRange) {
    ReadOptions options;
    options.inputPath = input_;
    options.offset = 10;
    options.length = 30;
    options.cache = {.bufferSize = 16, .bufferCount = 2};

    std::ostringstream out;
    ReadCommand command(options, out);
    EXPECT_EQ(command.execute(), 0);
    EXPECT_EQ(out.str(), bytes(10, 40));
}

TEST_F(CommandTest, ReadWithoutLengthCopiesToEnd) {
    ReadOptions options;
    options.inputPath = input_;
    options.offset = 90;

    std::ostringstream out;
    ReadCommand command(options, out);
    EXPECT_EQ(command.execute(), 0);
    EXPECT_EQ(out.str(), bytes(90, 100));
}

TEST_F(CommandTest, ReadReportsErrorsAsExitCodes) {
    std::ostringstream out;

    ReadOptions missing;
    missing.inputPath = dir_ / "missing.bin";
    EXPECT_EQ(ReadCommand(missing, out).execute(), toExitCode(ErrorCode::kFileNotFound));

    ReadOptions beyond;
    beyond.inputPath = input_;
    beyond.offset = 101;
    EXPECT_EQ(ReadCommand(beyond, out).execute(), toExitCode(ErrorCode::kOutOfRange));

    ReadOptions tooLong;
    tooLong.inputPath = input_;
    tooLong.offset = 90;
    tooLong.length = 20;
    EXPECT_EQ(ReadCommand(tooLong, out).execute(), toExitCode(ErrorCode::kEndOfStream));

    ReadOptions badCache;
    badCache.inputPath = input_;
    badCache.cache.bufferCount = 0;
    EXPECT_EQ(ReadCommand(badCache, out).execute(), toExitCode(ErrorCode::kUsageError));
}

// =============================================================================
// StageCommand
// =============================================================================

TEST_F(CommandTest, StageKeepsExplicitCacheFile) {
    StageOptions options;
    options.input = input_.string();
    options.cachePath = dir_ / "staged.bin";
    options.offset = 20;
    options.length = 5;

    std::ostringstream out;
    StageCommand command(options, out);
    EXPECT_EQ(command.execute(), 0);
    EXPECT_EQ(out.str(), bytes(20, 25));

    // Only the bytes up to the end of the range were staged.
    ASSERT_TRUE(fs::exists(options.cachePath));
    EXPECT_EQ(fs::file_size(options.cachePath), 25u);
}

TEST_F(CommandTest, StageReportsErrorsAsExitCodes) {
    std::ostringstream out;

    StageOptions missing;
    missing.input = (dir_ / "missing.bin").string();
    EXPECT_EQ(StageCommand(missing, out).execute(), toExitCode(ErrorCode::kFileNotFound));

    StageOptions beyond;
    beyond.input = input_.string();
    beyond.offset = 150;
    EXPECT_EQ(StageCommand(beyond, out).execute(), toExitCode(ErrorCode::kOutOfRange));
}

}  // namespace
}  // namespace scache::commands
