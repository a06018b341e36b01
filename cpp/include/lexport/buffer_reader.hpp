#pragma once

#include "lexport/constants.hpp"
#include "lexport/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lexport::stream {

// Accumulates bytes pulled from an irregularly chunked source so callers can
// ask for exact sizes. Each instance is owned by exactly one reader.
// Bytes only leave the buffer through Consume, Skip or Read, in source order.
class BufferReader : public ByteSource {
public:
    explicit BufferReader(ByteSource& source, std::size_t pull_size = constants::kPullSize);

    BufferReader(const BufferReader&) = delete;
    BufferReader& operator=(const BufferReader&) = delete;

    // Pulls until at least n bytes are buffered or the source is exhausted.
    bool Ensure(std::size_t n);

    // Requires a successful Ensure(n) beforehand.
    Bytes Consume(std::size_t n);
    void ConsumeInto(std::uint8_t* out, std::size_t n);

    // Discards up to n bytes, buffered ones first. Returns how many were
    // actually skipped, which is less than n only if the source ended.
    std::uint64_t Skip(std::uint64_t n);

    // Serves buffered bytes first, then reads straight from the source.
    std::size_t Read(std::uint8_t* out, std::size_t len) override;

    const std::uint8_t* Peek() const noexcept { return buffer_.data() + head_; }
    std::size_t Buffered() const noexcept { return buffer_.size() - head_; }
    bool SourceExhausted() const noexcept { return done_; }

private:
    bool Pull();
    void Compact();

    ByteSource& source_;
    std::size_t pull_size_;
    Bytes buffer_;
    std::size_t head_ = 0;
    Bytes scratch_;
    bool done_ = false;
};

}  // namespace lexport::stream
