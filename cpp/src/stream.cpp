#include "lexport/stream.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace lexport::stream {

MemorySource::MemorySource(Bytes data, std::size_t max_read)
    : data_(std::make_shared<const Bytes>(std::move(data))),
      max_read_(max_read) {}

MemorySource::MemorySource(std::shared_ptr<const Bytes> data, std::size_t max_read)
    : data_(std::move(data)),
      max_read_(max_read) {
    if (!data_) {
        data_ = std::make_shared<const Bytes>();
    }
}

std::size_t MemorySource::Read(std::uint8_t* out, std::size_t len) {
    std::size_t take = std::min(len, data_->size() - offset_);
    if (max_read_ > 0) {
        take = std::min(take, max_read_);
    }
    if (take == 0) {
        return 0;
    }
    std::memcpy(out, data_->data() + offset_, take);
    offset_ += take;
    return take;
}

void MemorySink::Write(const std::uint8_t* data, std::size_t len) {
    if (aborted_) {
        throw std::runtime_error("Write to aborted sink");
    }
    if (closed_) {
        throw std::runtime_error("Write to closed sink");
    }
    if (data == nullptr || len == 0) {
        return;
    }
    data_.insert(data_.end(), data, data + len);
}

void MemorySink::Close() {
    if (aborted_) {
        throw std::runtime_error("Close of aborted sink");
    }
    closed_ = true;
}

void MemorySink::Abort(const std::string& reason) noexcept {
    aborted_ = true;
    abort_reason_ = reason;
    data_.clear();
}

FileSource::FileSource(const std::filesystem::path& path)
    : path_(path), input_(path, std::ios::binary) {
    if (!input_) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (!ec) {
        total_size_ = static_cast<std::uint64_t>(size);
    }
}

std::size_t FileSource::Read(std::uint8_t* out, std::size_t len) {
    if (!input_ || len == 0) {
        return 0;
    }
    input_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(len));
    std::streamsize got = input_.gcount();
    if (input_.bad()) {
        throw std::runtime_error("Failed to read file: " + path_.string());
    }
    return static_cast<std::size_t>(got);
}

FileSink::FileSink(const std::filesystem::path& path)
    : path_(path), part_path_(path) {
    part_path_ += ".part";
    output_.open(part_path_, std::ios::binary | std::ios::trunc);
    if (!output_) {
        throw std::runtime_error("Failed to open file for writing: " + part_path_.string());
    }
}

FileSink::~FileSink() {
    if (!finished_) {
        Discard();
    }
}

void FileSink::Write(const std::uint8_t* data, std::size_t len) {
    if (finished_) {
        throw std::runtime_error("Write to finished file sink: " + path_.string());
    }
    std::size_t offset = 0;
    while (offset < len) {
        std::size_t available = chunk_.size() - buffer_pos_;
        std::size_t to_copy = std::min(available, len - offset);
        std::memcpy(chunk_.data() + buffer_pos_, data + offset, to_copy);
        buffer_pos_ += to_copy;
        offset += to_copy;
        if (buffer_pos_ == chunk_.size()) {
            FlushBuffer();
        }
    }
    bytes_written_ += len;
}

void FileSink::Close() {
    if (finished_) {
        throw std::runtime_error("File sink already finished: " + path_.string());
    }
    FlushBuffer();
    output_.flush();
    if (!output_) {
        Discard();
        throw std::runtime_error("Failed to write to file: " + path_.string());
    }
    output_.close();
    std::error_code ec;
    std::filesystem::rename(part_path_, path_, ec);
    if (ec) {
        Discard();
        throw std::runtime_error("Failed to finalize file: " + path_.string());
    }
    finished_ = true;
}

void FileSink::Abort(const std::string&) noexcept {
    if (finished_) {
        return;
    }
    Discard();
}

void FileSink::FlushBuffer() {
    if (buffer_pos_ > 0 && output_) {
        output_.write(reinterpret_cast<const char*>(chunk_.data()),
                      static_cast<std::streamsize>(buffer_pos_));
        if (!output_) {
            throw std::runtime_error("Failed to write to file: " + path_.string());
        }
        buffer_pos_ = 0;
    }
}

void FileSink::Discard() noexcept {
    finished_ = true;
    buffer_pos_ = 0;
    if (output_.is_open()) {
        output_.close();
    }
    std::error_code ec;
    std::filesystem::remove(part_path_, ec);
}

std::uint64_t Pump(ByteSource& source, ByteSink& sink) {
    std::array<std::uint8_t, kFileChunkSize> buffer{};
    std::uint64_t total = 0;
    while (true) {
        std::size_t got = source.Read(buffer.data(), buffer.size());
        if (got == 0) {
            break;
        }
        sink.Write(buffer.data(), got);
        total += got;
    }
    return total;
}

Bytes ReadAll(ByteSource& source) {
    Bytes out;
    std::array<std::uint8_t, kFileChunkSize> buffer{};
    while (true) {
        std::size_t got = source.Read(buffer.data(), buffer.size());
        if (got == 0) {
            break;
        }
        out.insert(out.end(), buffer.data(), buffer.data() + got);
    }
    return out;
}

}  // namespace lexport::stream
