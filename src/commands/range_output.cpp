// =============================================================================
// streamcache - Range Output Implementation
// =============================================================================

#include "range_output.h"

#include <algorithm>
#include <format>
#include <vector>

#include "scache/common/types.h"

namespace scache::commands {

namespace {

constexpr std::size_t kHexBytesPerLine = 16;

}  // namespace

ByteOutput::ByteOutput(std::ostream& out, bool hex, std::uint64_t baseOffset)
    : out_(out), hex_(hex), baseOffset_(baseOffset) {}

void ByteOutput::write(std::span<const std::uint8_t> bytes) {
    if (!hex_) {
        out_.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
        written_ += bytes.size();
        return;
    }

    for (const std::uint8_t byte : bytes) {
        if (written_ % kHexBytesPerLine == 0) {
            if (!line_.empty()) {
                out_ << line_ << '\n';
            }
            line_ = std::format("{:08x} ", baseOffset_ + written_);
        }
        line_ += std::format(" {:02x}", byte);
        ++written_;
    }
}

void ByteOutput::finish() {
    if (!line_.empty()) {
        out_ << line_ << '\n';
        line_.clear();
    }
    out_.flush();
}

std::uint64_t copyRange(io::InputStream& stream, std::uint64_t length, ByteOutput& output) {
    std::vector<std::uint8_t> buffer(kPipeBufferSize);
    std::uint64_t copied = 0;

    while (length == 0 ? !stream.empty() : copied < length) {
        const std::uint64_t wanted = length == 0 ? stream.leastSize() : length - copied;
        const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(wanted, buffer.size()));
        std::span<std::uint8_t> view(buffer.data(), chunk);
        stream.read(view, io::IOMode::kAll);
        output.write(view);
        copied += chunk;
    }

    output.finish();
    return copied;
}

}  // namespace scache::commands
