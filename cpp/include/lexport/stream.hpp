#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lexport::stream {

using Bytes = std::vector<std::uint8_t>;

constexpr std::size_t kFileChunkSize = 65536;

// Pull side of a pipeline. Read() may return fewer bytes than asked for and
// returns 0 only once the source is exhausted.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual std::size_t Read(std::uint8_t* out, std::size_t len) = 0;
};

// Push side of a pipeline. Writes reach the sink in the order they were
// issued. Abort() must not throw and discards anything not yet committed.
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual void Write(const std::uint8_t* data, std::size_t len) = 0;
    virtual void Close() = 0;
    virtual void Abort(const std::string& reason) noexcept = 0;

    void Write(const Bytes& data) { Write(data.data(), data.size()); }
};

class MemorySource : public ByteSource {
public:
    explicit MemorySource(Bytes data, std::size_t max_read = 0);
    explicit MemorySource(std::shared_ptr<const Bytes> data, std::size_t max_read = 0);

    std::size_t Read(std::uint8_t* out, std::size_t len) override;
    std::size_t Remaining() const noexcept { return data_->size() - offset_; }

private:
    std::shared_ptr<const Bytes> data_;
    std::size_t offset_ = 0;
    std::size_t max_read_ = 0;
};

class MemorySink : public ByteSink {
public:
    using ByteSink::Write;

    void Write(const std::uint8_t* data, std::size_t len) override;
    void Close() override;
    void Abort(const std::string& reason) noexcept override;

    const Bytes& data() const noexcept { return data_; }
    Bytes Take() { return std::move(data_); }
    bool closed() const noexcept { return closed_; }
    bool aborted() const noexcept { return aborted_; }
    const std::string& abort_reason() const noexcept { return abort_reason_; }

private:
    Bytes data_;
    bool closed_ = false;
    bool aborted_ = false;
    std::string abort_reason_;
};

class FileSource : public ByteSource {
public:
    explicit FileSource(const std::filesystem::path& path);

    std::size_t Read(std::uint8_t* out, std::size_t len) override;
    std::uint64_t TotalSize() const noexcept { return total_size_; }

private:
    std::filesystem::path path_;
    std::ifstream input_;
    std::uint64_t total_size_ = 0;
};

// Buffered file writer. Data goes to "<path>.part" and only becomes visible
// under the final name once Close() succeeds.
class FileSink : public ByteSink {
public:
    explicit FileSink(const std::filesystem::path& path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    using ByteSink::Write;
    void Write(const std::uint8_t* data, std::size_t len) override;
    void Close() override;
    void Abort(const std::string& reason) noexcept override;

    std::uint64_t BytesWritten() const noexcept { return bytes_written_; }
    const std::filesystem::path& path() const noexcept { return path_; }

private:
    void FlushBuffer();
    void Discard() noexcept;

    std::filesystem::path path_;
    std::filesystem::path part_path_;
    std::ofstream output_;
    std::array<std::uint8_t, kFileChunkSize> chunk_{};
    std::size_t buffer_pos_ = 0;
    std::uint64_t bytes_written_ = 0;
    bool finished_ = false;
};

// Drains a source into a sink without closing the sink.
std::uint64_t Pump(ByteSource& source, ByteSink& sink);
Bytes ReadAll(ByteSource& source);

}  // namespace lexport::stream
