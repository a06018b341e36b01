#pragma once

#include "lexport/log.hpp"
#include "lexport/stream.hpp"
#include "lexport/tar.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexport::pipeline {

using Bytes = std::vector<std::uint8_t>;

// Export order follows declaration order.
enum class Category {
    Custom,
    Storage,
    Records,
    Cache,
    Files
};

std::string_view CategoryPrefix(Category category);
std::string_view CategoryName(Category category);

// One archive member produced by a collaborator. The payload is either held
// in `bytes` or streamed from `stream`, which must yield exactly `size`
// bytes. Paths are relative to the collaborator's prefix.
struct ArchiveEntry {
    std::string path;
    std::uint64_t size = 0;
    Bytes bytes;
    std::unique_ptr<stream::ByteSource> stream;
    bool is_directory = false;

    static ArchiveEntry FromBytes(std::string path, Bytes bytes);
    static ArchiveEntry FromString(std::string path, const std::string& text);
    static ArchiveEntry FromStream(std::string path, std::unique_ptr<stream::ByteSource> source, std::uint64_t size);
    static ArchiveEntry Directory(std::string path);
};

// Pull-based entry sequence; nothing is produced until Next() is called.
class EntryProducer {
public:
    virtual ~EntryProducer() = default;
    virtual std::optional<ArchiveEntry> Next() = 0;
};

class VectorProducer : public EntryProducer {
public:
    explicit VectorProducer(std::vector<ArchiveEntry> entries);
    std::optional<ArchiveEntry> Next() override;

private:
    std::vector<ArchiveEntry> entries_;
    std::size_t index_ = 0;
};

// A storage backend taking part in export and import.
class Collaborator {
public:
    virtual ~Collaborator() = default;

    virtual Category category() const = 0;
    virtual std::unique_ptr<EntryProducer> ProduceEntries() = 0;
    // `payload` yields at most `size` bytes; whatever is left unread is
    // skipped by the caller.
    virtual void ConsumeEntry(const std::string& path, stream::ByteSource& payload, std::uint64_t size) = 0;
};

enum class ArchiveFormat {
    Encrypted,
    Gzip,
    Tar
};

ArchiveFormat SniffFormat(const std::uint8_t* data, std::size_t len);
ArchiveFormat SniffFormat(const Bytes& head);
std::string_view FormatName(ArchiveFormat format);

using CancelCheck = std::function<bool()>;

struct ExportOptions {
    // Non-empty enables encryption, which implies compression.
    std::string password;
    bool compress = true;
    int compression_level = -1;
    std::size_t cipher_chunk_size = 0;
    std::optional<std::uint64_t> modification_time;
    CancelCheck cancelled;
    Logger logger;
};

struct ExportReport {
    std::size_t entries = 0;
    std::uint64_t payload_bytes = 0;
    bool encrypted = false;
    bool compressed = false;
};

// Writes every collaborator's entries into `sink` as one container stream.
// On failure the sink is aborted and the error rethrown.
ExportReport ExportArchive(stream::ByteSink& sink,
                           const std::vector<Collaborator*>& collaborators,
                           const ExportOptions& options = {});

struct ImportOptions {
    std::string password;
    // Asked only when the input turns out to be encrypted and `password` is
    // empty.
    std::function<std::string()> password_provider;
    tar::ReaderOptions tar;
    CancelCheck cancelled;
    Logger logger;
};

struct ImportReport {
    ArchiveFormat format = ArchiveFormat::Tar;
    std::size_t dispatched = 0;
    std::size_t ignored = 0;
    std::size_t failed = 0;
};

// Detects the input format, peels encryption and compression, and hands each
// entry to the collaborator with the longest matching prefix.
ImportReport ImportArchive(stream::ByteSource& source,
                           const std::vector<Collaborator*>& collaborators,
                           const ImportOptions& options = {});

struct ListedEntry {
    std::string path;
    std::uint64_t size = 0;
    bool is_directory = false;
};

struct Listing {
    ArchiveFormat format = ArchiveFormat::Tar;
    std::vector<ListedEntry> entries;
};

Listing ListArchive(stream::ByteSource& source, const ImportOptions& options = {});

}  // namespace lexport::pipeline
