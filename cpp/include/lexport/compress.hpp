#pragma once

#include "lexport/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lexport::compress {

using Bytes = std::vector<std::uint8_t>;

// gzip-framed DEFLATE in front of another sink.
class DeflateSink : public stream::ByteSink {
public:
    explicit DeflateSink(stream::ByteSink& downstream, int level = -1);
    ~DeflateSink() override;

    DeflateSink(const DeflateSink&) = delete;
    DeflateSink& operator=(const DeflateSink&) = delete;

    using stream::ByteSink::Write;

    void Write(const std::uint8_t* data, std::size_t len) override;
    void Close() override;
    void Abort(const std::string& reason) noexcept override;

private:
    struct State;

    void Run(int flush);
    void End() noexcept;

    stream::ByteSink& downstream_;
    std::unique_ptr<State> state_;
    Bytes out_buf_;
    bool finished_ = false;
};

// Inflates a gzip stream pulled from another source. Raises FormatError if
// the source ends before the gzip trailer, unless truncation is tolerated, in
// which case whatever could be decoded is returned and the stream ends.
class InflateSource : public stream::ByteSource {
public:
    explicit InflateSource(stream::ByteSource& upstream, bool tolerate_truncation = false);
    ~InflateSource() override;

    InflateSource(const InflateSource&) = delete;
    InflateSource& operator=(const InflateSource&) = delete;

    std::size_t Read(std::uint8_t* out, std::size_t len) override;

private:
    struct State;

    stream::ByteSource& upstream_;
    std::unique_ptr<State> state_;
    Bytes in_buf_;
    bool tolerate_truncation_;
    bool upstream_ended_ = false;
    bool finished_ = false;
};

Bytes GzipBuffer(const Bytes& data, int level = -1);
Bytes GunzipBuffer(const Bytes& data);

}  // namespace lexport::compress
