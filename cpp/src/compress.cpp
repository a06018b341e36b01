#include "lexport/compress.hpp"

#include "lexport/constants.hpp"
#include "lexport/errors.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace lexport::compress {

namespace {

constexpr int kGzipWindowBits = 15 + 16;
constexpr std::size_t kBufferSize = 1 << 16;
constexpr std::size_t kMaxFeed = 1u << 30;

}  // namespace

struct DeflateSink::State {
    z_stream strm{};
    bool active = false;
};

struct InflateSource::State {
    z_stream strm{};
    bool active = false;
};

DeflateSink::DeflateSink(stream::ByteSink& downstream, int level)
    : downstream_(downstream),
      state_(std::make_unique<State>()),
      out_buf_(kBufferSize) {
    int resolved = level < 0 ? constants::GzipLevel() : std::min(level, 9);
    if (deflateInit2(&state_->strm, resolved, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("Failed to initialize gzip encoder");
    }
    state_->active = true;
}

DeflateSink::~DeflateSink() {
    End();
}

void DeflateSink::End() noexcept {
    if (state_ && state_->active) {
        deflateEnd(&state_->strm);
        state_->active = false;
    }
}

void DeflateSink::Run(int flush) {
    z_stream& strm = state_->strm;
    int ret = Z_OK;
    do {
        strm.next_out = out_buf_.data();
        strm.avail_out = static_cast<uInt>(out_buf_.size());
        ret = deflate(&strm, flush);
        if (ret == Z_STREAM_ERROR) {
            throw std::runtime_error("gzip compression failed");
        }
        std::size_t produced = out_buf_.size() - strm.avail_out;
        if (produced > 0) {
            downstream_.Write(out_buf_.data(), produced);
        }
    } while (strm.avail_out == 0 || (flush == Z_FINISH && ret != Z_STREAM_END));
}

void DeflateSink::Write(const std::uint8_t* data, std::size_t len) {
    if (finished_) {
        throw std::runtime_error("Write to finished gzip encoder");
    }
    std::size_t offset = 0;
    while (offset < len) {
        std::size_t feed = std::min(len - offset, kMaxFeed);
        state_->strm.next_in = const_cast<Bytef*>(data + offset);
        state_->strm.avail_in = static_cast<uInt>(feed);
        Run(Z_NO_FLUSH);
        offset += feed;
    }
}

void DeflateSink::Close() {
    if (finished_) {
        throw std::runtime_error("gzip encoder already finished");
    }
    state_->strm.next_in = nullptr;
    state_->strm.avail_in = 0;
    Run(Z_FINISH);
    End();
    finished_ = true;
    downstream_.Close();
}

void DeflateSink::Abort(const std::string& reason) noexcept {
    finished_ = true;
    End();
    downstream_.Abort(reason);
}

InflateSource::InflateSource(stream::ByteSource& upstream, bool tolerate_truncation)
    : upstream_(upstream),
      state_(std::make_unique<State>()),
      in_buf_(kBufferSize),
      tolerate_truncation_(tolerate_truncation) {
    if (inflateInit2(&state_->strm, kGzipWindowBits) != Z_OK) {
        throw std::runtime_error("Failed to initialize gzip decoder");
    }
    state_->active = true;
}

InflateSource::~InflateSource() {
    if (state_ && state_->active) {
        inflateEnd(&state_->strm);
    }
}

std::size_t InflateSource::Read(std::uint8_t* out, std::size_t len) {
    if (finished_ || len == 0) {
        return 0;
    }
    z_stream& strm = state_->strm;
    std::size_t want = std::min(len, static_cast<std::size_t>(std::numeric_limits<uInt>::max()));
    while (true) {
        if (strm.avail_in == 0 && !upstream_ended_) {
            std::size_t got = upstream_.Read(in_buf_.data(), in_buf_.size());
            if (got == 0) {
                if (!tolerate_truncation_) {
                    throw FormatError("Truncated compressed stream");
                }
                upstream_ended_ = true;
            } else {
                strm.next_in = in_buf_.data();
                strm.avail_in = static_cast<uInt>(got);
            }
        }
        strm.next_out = out;
        strm.avail_out = static_cast<uInt>(want);
        int ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
            throw FormatError("Corrupt compressed stream");
        }
        std::size_t produced = want - strm.avail_out;
        if (ret == Z_STREAM_END) {
            finished_ = true;
            inflateEnd(&strm);
            state_->active = false;
            return produced;
        }
        if (produced > 0) {
            return produced;
        }
        if (upstream_ended_) {
            // Cut short: nothing more can be decoded.
            finished_ = true;
            return 0;
        }
    }
}

Bytes GzipBuffer(const Bytes& data, int level) {
    stream::MemorySink sink;
    DeflateSink deflater(sink, level);
    deflater.Write(data);
    deflater.Close();
    return sink.Take();
}

Bytes GunzipBuffer(const Bytes& data) {
    stream::MemorySource source(data);
    InflateSource inflater(source);
    return stream::ReadAll(inflater);
}

}  // namespace lexport::compress
