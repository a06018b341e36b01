#include "lexport/tar.hpp"

#include "lexport/errors.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <limits>
#include <stdexcept>

namespace lexport::tar {

namespace {

constexpr std::size_t kBlock = constants::kTarBlockSize;

void WriteOctal(char* dest, std::size_t size, std::uint64_t value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%0*llo", static_cast<int>(size - 1),
                  static_cast<unsigned long long>(value));
    std::memcpy(dest, buffer, size - 1);
    dest[size - 1] = '\0';
}

void WriteField(char* dest, std::size_t size, const std::string& value) {
    std::memcpy(dest, value.data(), std::min(size, value.size()));
}

std::string FieldString(const char* data, std::size_t size) {
    const char* end = static_cast<const char*>(std::memchr(data, '\0', size));
    return std::string(data, end ? end : data + size);
}

std::uint64_t PaddingFor(std::uint64_t size) {
    return (kBlock - (size % kBlock)) % kBlock;
}

}  // namespace

NameSplit SplitPath(const std::string& path) {
    constexpr std::size_t kNameLen = sizeof(TarHeader::name);
    constexpr std::size_t kPrefixLen = sizeof(TarHeader::prefix);

    NameSplit split;
    if (path.size() <= kNameLen) {
        split.name = path;
        return split;
    }
    // A trailing '/' belongs to the name, so never split on it.
    std::size_t search_from = std::min(kPrefixLen - 1, path.size() - 2);
    std::size_t pos = path.rfind('/', search_from);
    if (pos != std::string::npos && pos > 0 && path.size() - pos - 1 <= kNameLen) {
        split.prefix = path.substr(0, pos);
        split.name = path.substr(pos + 1);
        return split;
    }
    split.lossless = false;
    split.name = path.substr(path.size() - kNameLen);
    split.prefix = path.substr(0, std::min(kPrefixLen, path.size() - kNameLen));
    return split;
}

std::uint32_t ComputeChecksum(const TarHeader& header) {
    TarHeader copy = header;
    std::memset(copy.chksum, ' ', sizeof(copy.chksum));
    std::uint32_t sum = 0;
    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(&copy);
    for (std::size_t i = 0; i < sizeof(TarHeader); ++i) {
        sum += bytes[i];
    }
    return sum;
}

std::optional<std::uint64_t> ParseOctal(const char* data, std::size_t size) {
    std::size_t i = 0;
    while (i < size && data[i] == ' ') {
        ++i;
    }
    std::uint64_t value = 0;
    bool any = false;
    for (; i < size; ++i) {
        char ch = data[i];
        if (ch < '0' || ch > '7') {
            break;
        }
        value = (value << 3) + static_cast<std::uint64_t>(ch - '0');
        any = true;
    }
    if (!any) {
        return std::nullopt;
    }
    return value;
}

std::string DecodePath(const TarHeader& header) {
    std::string name = FieldString(header.name, sizeof(header.name));
    std::string prefix = FieldString(header.prefix, sizeof(header.prefix));
    if (!prefix.empty()) {
        return prefix + "/" + name;
    }
    return name;
}

bool IsZeroBlock(const TarHeader& header) {
    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(&header);
    for (std::size_t i = 0; i < sizeof(TarHeader); ++i) {
        if (bytes[i] != 0) {
            return false;
        }
    }
    return true;
}

HeaderBuilder::HeaderBuilder()
    : mtime_(static_cast<std::uint64_t>(std::time(nullptr))) {}

HeaderBuilder& HeaderBuilder::Path(const std::string& path) {
    split_ = SplitPath(path);
    return *this;
}

HeaderBuilder& HeaderBuilder::Size(std::uint64_t size) {
    if (size > kMaxOctalSize) {
        throw FormatError("Entry too large for ustar header");
    }
    size_ = size;
    return *this;
}

HeaderBuilder& HeaderBuilder::Mode(std::uint32_t mode) {
    if (mode > kMaxOctalMode) {
        throw FormatError("Mode does not fit ustar header");
    }
    mode_ = mode;
    mode_set_ = true;
    return *this;
}

HeaderBuilder& HeaderBuilder::ModificationTime(std::uint64_t seconds) {
    if (seconds > kMaxOctalSize) {
        throw FormatError("Modification time does not fit ustar header");
    }
    mtime_ = seconds;
    return *this;
}

HeaderBuilder& HeaderBuilder::Directory(bool is_directory) {
    is_directory_ = is_directory;
    return *this;
}

TarHeader HeaderBuilder::Build() const {
    TarHeader header{};
    WriteField(header.name, sizeof(header.name), split_.name);
    WriteField(header.prefix, sizeof(header.prefix), split_.prefix);
    std::uint32_t mode = mode_set_ ? mode_ : (is_directory_ ? constants::kTarDirMode : constants::kTarFileMode);
    WriteOctal(header.mode, sizeof(header.mode), mode);
    WriteOctal(header.uid, sizeof(header.uid), 0);
    WriteOctal(header.gid, sizeof(header.gid), 0);
    WriteOctal(header.size, sizeof(header.size), is_directory_ ? 0 : size_);
    WriteOctal(header.mtime, sizeof(header.mtime), mtime_);
    header.typeflag = is_directory_ ? kTypeDirectory : kTypeFile;
    std::memcpy(header.magic, "ustar", 6);
    std::memcpy(header.version, "00", 2);

    std::uint32_t sum = ComputeChecksum(header);
    char digits[16];
    std::snprintf(digits, sizeof(digits), "%06o", sum);
    std::memcpy(header.chksum, digits, 6);
    header.chksum[6] = '\0';
    header.chksum[7] = ' ';
    return header;
}

Writer::Writer(stream::ByteSink& sink)
    : sink_(sink),
      mtime_(static_cast<std::uint64_t>(std::time(nullptr))) {}

void Writer::EnsureOpen() const {
    if (closed_) {
        throw std::runtime_error("Tar writer already closed");
    }
}

void Writer::Emit(const std::uint8_t* data, std::size_t len) {
    if (len == 0) {
        return;
    }
    sink_.Write(data, len);
    position_ += len;
}

void Writer::Pad() {
    std::size_t pad = static_cast<std::size_t>(PaddingFor(position_));
    if (pad) {
        std::array<std::uint8_t, kBlock> zeros{};
        Emit(zeros.data(), pad);
    }
}

void Writer::WriteHeader(const std::string& path, std::uint64_t size, bool is_directory) {
    EnsureOpen();
    if (path.empty()) {
        throw std::runtime_error("Tar entry path is empty");
    }
    TarHeader header = HeaderBuilder()
                           .Path(path)
                           .Size(size)
                           .ModificationTime(mtime_)
                           .Directory(is_directory)
                           .Build();
    Emit(reinterpret_cast<const std::uint8_t*>(&header), sizeof(header));
    entries_ += 1;
}

void Writer::WriteEntry(const std::string& path, const Bytes& data) {
    WriteEntry(path, data.data(), data.size());
}

void Writer::WriteEntry(const std::string& path, const std::uint8_t* data, std::size_t len) {
    WriteHeader(path, len, false);
    Emit(data, len);
    Pad();
}

void Writer::WriteEntry(const std::string& path, stream::ByteSource& source, std::uint64_t size) {
    WriteHeader(path, size, false);
    std::array<std::uint8_t, stream::kFileChunkSize> buffer{};
    std::uint64_t remaining = size;
    while (remaining > 0) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        std::size_t got = source.Read(buffer.data(), want);
        if (got == 0) {
            throw FormatError("Entry payload shorter than declared size: " + path);
        }
        Emit(buffer.data(), got);
        remaining -= got;
    }
    Pad();
}

void Writer::WriteDirectory(const std::string& path) {
    std::string name = path;
    if (!name.empty() && name.back() != '/') {
        name.push_back('/');
    }
    WriteHeader(name, 0, true);
}

void Writer::Close() {
    EnsureOpen();
    Pad();
    std::array<std::uint8_t, kBlock * 2> zeros{};
    Emit(zeros.data(), zeros.size());
    closed_ = true;
    sink_.Close();
}

void Writer::Abort(const std::string& reason) noexcept {
    closed_ = true;
    sink_.Abort(reason);
}

Reader::Reader(stream::ByteSource& source, ReaderOptions options)
    : reader_(source),
      options_(options),
      payload_(*this) {}

void Reader::Truncated(const char* what) {
    finished_ = true;
    remaining_ = 0;
    padding_ = 0;
    if (!options_.tolerate_truncation) {
        throw FormatError(what);
    }
}

void Reader::FinishEntry() {
    if (remaining_ > 0) {
        std::uint64_t wanted = remaining_;
        std::uint64_t skipped = reader_.Skip(wanted);
        remaining_ = 0;
        if (skipped < wanted) {
            Truncated("Unexpected end of archive in entry payload");
            return;
        }
    }
    if (padding_ > 0) {
        std::uint64_t wanted = padding_;
        std::uint64_t skipped = reader_.Skip(wanted);
        padding_ = 0;
        if (skipped < wanted) {
            Truncated("Unexpected end of archive in entry padding");
        }
    }
}

std::optional<Entry> Reader::Next() {
    if (finished_) {
        return std::nullopt;
    }
    FinishEntry();
    if (finished_) {
        return std::nullopt;
    }
    if (!reader_.Ensure(kBlock)) {
        Truncated(reader_.Buffered() == 0 ? "Unexpected end of archive (missing end marker)"
                                          : "Truncated tar header");
        return std::nullopt;
    }
    TarHeader header{};
    reader_.ConsumeInto(reinterpret_cast<std::uint8_t*>(&header), sizeof(header));
    if (IsZeroBlock(header)) {
        finished_ = true;
        return std::nullopt;
    }
    auto size = ParseOctal(header.size, sizeof(header.size));
    if (!size) {
        // Lenient: a non-numeric size reads as end of archive, not corruption.
        finished_ = true;
        return std::nullopt;
    }

    Entry entry;
    entry.path = DecodePath(header);
    entry.size = *size;
    entry.typeflag = header.typeflag;
    entry.mode = static_cast<std::uint32_t>(ParseOctal(header.mode, sizeof(header.mode)).value_or(0));
    entry.mtime = ParseOctal(header.mtime, sizeof(header.mtime)).value_or(0);
    auto stored = ParseOctal(header.chksum, sizeof(header.chksum));
    entry.checksum_ok = stored && *stored == ComputeChecksum(header);
    if (!entry.checksum_ok && options_.verify_checksums) {
        finished_ = true;
        throw FormatError("Tar header checksum mismatch: " + entry.path);
    }

    remaining_ = entry.size;
    padding_ = PaddingFor(entry.size);
    return entry;
}

std::size_t Reader::ReadPayloadSome(std::uint8_t* out, std::size_t len) {
    std::size_t take = static_cast<std::size_t>(std::min<std::uint64_t>(len, remaining_));
    if (take == 0) {
        return 0;
    }
    std::size_t got = reader_.Read(out, take);
    if (got == 0) {
        Truncated("Unexpected end of archive in entry payload");
        return 0;
    }
    remaining_ -= got;
    return got;
}

std::size_t Reader::PayloadSource::Read(std::uint8_t* out, std::size_t len) {
    return owner_.ReadPayloadSome(out, len);
}

Bytes Reader::ReadPayload() {
    if (remaining_ > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())) {
        throw std::runtime_error("Tar entry too large to hold in memory");
    }
    Bytes out(static_cast<std::size_t>(remaining_));
    std::size_t filled = 0;
    while (filled < out.size()) {
        std::size_t got = ReadPayloadSome(out.data() + filled, out.size() - filled);
        if (got == 0) {
            break;
        }
        filled += got;
    }
    out.resize(filled);
    return out;
}

std::uint64_t Reader::CopyPayload(stream::ByteSink& sink) {
    return stream::Pump(payload_, sink);
}

void Reader::SkipPayload() {
    FinishEntry();
}

}  // namespace lexport::tar
