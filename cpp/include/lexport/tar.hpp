#pragma once

#include "lexport/buffer_reader.hpp"
#include "lexport/constants.hpp"
#include "lexport/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lexport::tar {

using Bytes = std::vector<std::uint8_t>;

struct TarHeader {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char chksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char pad[12];
};

static_assert(sizeof(TarHeader) == constants::kTarBlockSize, "Tar header must be 512 bytes");

constexpr char kTypeFile = '0';
constexpr char kTypeDirectory = '5';
// Largest values the 12-byte size/mtime and 8-byte mode fields can hold.
constexpr std::uint64_t kMaxOctalSize = 077777777777ULL;
constexpr std::uint32_t kMaxOctalMode = 07777777u;

struct NameSplit {
    std::string name;
    std::string prefix;
    // False when the path had to be cut or split without a separator, in
    // which case prefix + "/" + name no longer equals the original path.
    bool lossless = true;
};

// Fits a path into the 100-byte name and 155-byte prefix fields. Splits at
// the last '/' at or before offset 154 when that leaves a name of at most 100
// bytes; otherwise the name takes the last 100 bytes of the path and the
// prefix the leading bytes (at most 155).
NameSplit SplitPath(const std::string& path);

// Sum of all 512 header bytes with the checksum field read as spaces.
std::uint32_t ComputeChecksum(const TarHeader& header);

// Octal ASCII field; leading spaces allowed, stops at the first non-octal
// byte. Returns nullopt when no digit is present.
std::optional<std::uint64_t> ParseOctal(const char* data, std::size_t size);

std::string DecodePath(const TarHeader& header);
bool IsZeroBlock(const TarHeader& header);

class HeaderBuilder {
public:
    HeaderBuilder();

    HeaderBuilder& Path(const std::string& path);
    HeaderBuilder& Size(std::uint64_t size);
    HeaderBuilder& Mode(std::uint32_t mode);
    HeaderBuilder& ModificationTime(std::uint64_t seconds);
    HeaderBuilder& Directory(bool is_directory);

    // Lays out every field, then blanks and fills the checksum last.
    TarHeader Build() const;

    const NameSplit& split() const noexcept { return split_; }

private:
    NameSplit split_;
    std::uint64_t size_ = 0;
    std::uint32_t mode_ = constants::kTarFileMode;
    bool mode_set_ = false;
    std::uint64_t mtime_ = 0;
    bool is_directory_ = false;
};

// Writes entries strictly in call order. Not safe for concurrent use: the
// position counter drives block padding.
class Writer {
public:
    explicit Writer(stream::ByteSink& sink);

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void WriteEntry(const std::string& path, const Bytes& data);
    void WriteEntry(const std::string& path, const std::uint8_t* data, std::size_t len);
    // Streams exactly `size` bytes from the source after the header.
    void WriteEntry(const std::string& path, stream::ByteSource& source, std::uint64_t size);
    void WriteDirectory(const std::string& path);

    // Appends two zero blocks and closes the sink.
    void Close();
    void Abort(const std::string& reason) noexcept;

    void set_modification_time(std::uint64_t seconds) noexcept { mtime_ = seconds; }
    std::uint64_t position() const noexcept { return position_; }
    std::size_t entries() const noexcept { return entries_; }

private:
    void WriteHeader(const std::string& path, std::uint64_t size, bool is_directory);
    void Emit(const std::uint8_t* data, std::size_t len);
    void Pad();
    void EnsureOpen() const;

    stream::ByteSink& sink_;
    std::uint64_t position_ = 0;
    std::uint64_t mtime_ = 0;
    std::size_t entries_ = 0;
    bool closed_ = false;
};

struct Entry {
    std::string path;
    std::uint64_t size = 0;
    char typeflag = kTypeFile;
    std::uint32_t mode = 0;
    std::uint64_t mtime = 0;
    bool checksum_ok = true;

    bool is_directory() const noexcept {
        return typeflag == kTypeDirectory || (!path.empty() && path.back() == '/');
    }
};

struct ReaderOptions {
    // End quietly instead of raising FormatError when the source stops early.
    // The import pipeline applies it to the gzip and cipher layers as well.
    bool tolerate_truncation = false;
    bool verify_checksums = false;
};

// Lazy, single-pass entry sequence. A header whose size field is not a
// number ends the archive like a zero block does.
class Reader {
public:
    explicit Reader(stream::ByteSource& source, ReaderOptions options = {});

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    // Skips whatever is left of the previous entry before reading a header.
    std::optional<Entry> Next();

    Bytes ReadPayload();
    std::uint64_t CopyPayload(stream::ByteSink& sink);
    void SkipPayload();
    stream::ByteSource& Payload() noexcept { return payload_; }

    std::uint64_t remaining() const noexcept { return remaining_; }

private:
    class PayloadSource : public stream::ByteSource {
    public:
        explicit PayloadSource(Reader& owner) : owner_(owner) {}
        std::size_t Read(std::uint8_t* out, std::size_t len) override;

    private:
        Reader& owner_;
    };

    std::size_t ReadPayloadSome(std::uint8_t* out, std::size_t len);
    void FinishEntry();
    void Truncated(const char* what);

    stream::BufferReader reader_;
    ReaderOptions options_;
    PayloadSource payload_;
    std::uint64_t remaining_ = 0;
    std::uint64_t padding_ = 0;
    bool finished_ = false;
};

}  // namespace lexport::tar
