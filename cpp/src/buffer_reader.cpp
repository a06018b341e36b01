#include "lexport/buffer_reader.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace lexport::stream {

BufferReader::BufferReader(ByteSource& source, std::size_t pull_size)
    : source_(source),
      pull_size_(pull_size > 0 ? pull_size : constants::kPullSize) {}

bool BufferReader::Pull() {
    if (done_) {
        return false;
    }
    if (scratch_.size() != pull_size_) {
        scratch_.resize(pull_size_);
    }
    std::size_t got = source_.Read(scratch_.data(), scratch_.size());
    if (got == 0) {
        done_ = true;
        return false;
    }
    Compact();
    buffer_.insert(buffer_.end(), scratch_.data(), scratch_.data() + got);
    return true;
}

void BufferReader::Compact() {
    if (head_ == 0) {
        return;
    }
    if (head_ == buffer_.size()) {
        buffer_.clear();
        head_ = 0;
        return;
    }
    if (head_ >= buffer_.size() / 2) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(head_));
        head_ = 0;
    }
}

bool BufferReader::Ensure(std::size_t n) {
    while (Buffered() < n) {
        if (!Pull()) {
            break;
        }
    }
    return Buffered() >= n;
}

Bytes BufferReader::Consume(std::size_t n) {
    Bytes out(n);
    ConsumeInto(out.data(), n);
    return out;
}

void BufferReader::ConsumeInto(std::uint8_t* out, std::size_t n) {
    if (n > Buffered()) {
        throw std::runtime_error("BufferReader::Consume past buffered data");
    }
    if (n > 0) {
        std::memcpy(out, buffer_.data() + head_, n);
    }
    head_ += n;
    Compact();
}

std::uint64_t BufferReader::Skip(std::uint64_t n) {
    std::uint64_t skipped = 0;
    std::size_t from_buffer = static_cast<std::size_t>(std::min<std::uint64_t>(n, Buffered()));
    head_ += from_buffer;
    skipped += from_buffer;
    Compact();
    if (skipped == n) {
        return skipped;
    }
    if (scratch_.size() != pull_size_) {
        scratch_.resize(pull_size_);
    }
    while (skipped < n && !done_) {
        std::size_t got = source_.Read(scratch_.data(), scratch_.size());
        if (got == 0) {
            done_ = true;
            break;
        }
        std::uint64_t wanted = n - skipped;
        if (got <= wanted) {
            skipped += got;
        } else {
            std::size_t used = static_cast<std::size_t>(wanted);
            Compact();
            buffer_.insert(buffer_.end(), scratch_.data() + used, scratch_.data() + got);
            skipped += used;
        }
    }
    return skipped;
}

std::size_t BufferReader::Read(std::uint8_t* out, std::size_t len) {
    if (len == 0) {
        return 0;
    }
    if (Buffered() > 0) {
        std::size_t take = std::min(len, Buffered());
        ConsumeInto(out, take);
        return take;
    }
    if (done_) {
        return 0;
    }
    std::size_t got = source_.Read(out, len);
    if (got == 0) {
        done_ = true;
    }
    return got;
}

}  // namespace lexport::stream
