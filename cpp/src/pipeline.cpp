#include "lexport/pipeline.hpp"

#include "lexport/buffer_reader.hpp"
#include "lexport/chunked_cipher.hpp"
#include "lexport/compress.hpp"
#include "lexport/constants.hpp"
#include "lexport/errors.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <exception>
#include <utility>

namespace lexport::pipeline {

namespace {

constexpr Category kAllCategories[] = {
    Category::Custom,
    Category::Storage,
    Category::Records,
    Category::Cache,
    Category::Files,
};

void CheckCancelled(const CancelCheck& cancelled) {
    if (cancelled && cancelled()) {
        throw AbortError("Operation cancelled");
    }
}

// Checks the cancel callback before every slice handed downstream.
class CancellableSource : public stream::ByteSource {
public:
    CancellableSource(stream::ByteSource& inner, const CancelCheck& cancelled)
        : inner_(inner), cancelled_(cancelled) {}

    std::size_t Read(std::uint8_t* out, std::size_t len) override {
        CheckCancelled(cancelled_);
        return inner_.Read(out, len);
    }

private:
    stream::ByteSource& inner_;
    const CancelCheck& cancelled_;
};

// Longest category prefix wins, whether or not a collaborator is registered
// for it, so "data/idb/x" never lands in the storage dumps.
Collaborator* Route(const std::vector<Collaborator*>& collaborators,
                    const std::string& path,
                    std::string& relative) {
    std::optional<Category> best;
    std::size_t best_len = 0;
    for (Category category : kAllCategories) {
        std::string_view prefix = CategoryPrefix(category);
        if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        if (prefix.size() > best_len) {
            best = category;
            best_len = prefix.size();
        }
    }
    if (!best) {
        return nullptr;
    }
    for (Collaborator* collaborator : collaborators) {
        if (collaborator && collaborator->category() == *best) {
            relative = path.substr(best_len);
            return collaborator;
        }
    }
    return nullptr;
}

// Reads past the end marker so a cut-off compressed or encrypted trailer
// still surfaces as a FormatError.
void DrainTrailer(stream::ByteSource& source, const tar::ReaderOptions& options) {
    if (options.tolerate_truncation) {
        return;
    }
    std::array<std::uint8_t, constants::kTarBlockSize * 8> scratch{};
    while (source.Read(scratch.data(), scratch.size()) > 0) {
    }
}

std::string ResolvePassword(const ImportOptions& options) {
    std::string password = options.password;
    if (password.empty() && options.password_provider) {
        password = options.password_provider();
    }
    if (password.empty()) {
        throw Error("Password required");
    }
    return password;
}

// The decoding layers in front of the container reader, outermost first.
class ArchiveInput {
public:
    ArchiveInput(stream::ByteSource& source, const ImportOptions& options)
        : sniff_(source) {
        sniff_.Ensure(constants::kSniffLen);
        format_ = SniffFormat(sniff_.Peek(), std::min(sniff_.Buffered(), constants::kSniffLen));
        stream::ByteSource* top = &sniff_;
        if (format_ == ArchiveFormat::Encrypted) {
            cipher_ = std::make_unique<cipher::ChunkedCipherReader>(
                sniff_, ResolvePassword(options), 0, options.tar.tolerate_truncation);
            cipher_->Open();
            top = cipher_.get();
        }
        if (format_ != ArchiveFormat::Tar) {
            inflate_ = std::make_unique<compress::InflateSource>(*top, options.tar.tolerate_truncation);
            top = inflate_.get();
        }
        top_ = top;
    }

    ArchiveInput(const ArchiveInput&) = delete;
    ArchiveInput& operator=(const ArchiveInput&) = delete;

    ArchiveFormat format() const noexcept { return format_; }
    stream::ByteSource& stream() noexcept { return *top_; }

private:
    stream::BufferReader sniff_;
    std::unique_ptr<cipher::ChunkedCipherReader> cipher_;
    std::unique_ptr<compress::InflateSource> inflate_;
    stream::ByteSource* top_ = nullptr;
    ArchiveFormat format_ = ArchiveFormat::Tar;
};

}  // namespace

std::string_view CategoryPrefix(Category category) {
    switch (category) {
        case Category::Custom:
            return constants::kCustomPrefix;
        case Category::Storage:
            return constants::kStoragePrefix;
        case Category::Records:
            return constants::kRecordsPrefix;
        case Category::Cache:
            return constants::kCachePrefix;
        case Category::Files:
            return constants::kFilesPrefix;
    }
    return {};
}

std::string_view CategoryName(Category category) {
    switch (category) {
        case Category::Custom:
            return "custom";
        case Category::Storage:
            return "storage";
        case Category::Records:
            return "records";
        case Category::Cache:
            return "cache";
        case Category::Files:
            return "files";
    }
    return {};
}

ArchiveEntry ArchiveEntry::FromBytes(std::string path, Bytes bytes) {
    ArchiveEntry entry;
    entry.path = std::move(path);
    entry.size = bytes.size();
    entry.bytes = std::move(bytes);
    return entry;
}

ArchiveEntry ArchiveEntry::FromString(std::string path, const std::string& text) {
    return FromBytes(std::move(path), Bytes(text.begin(), text.end()));
}

ArchiveEntry ArchiveEntry::FromStream(std::string path,
                                      std::unique_ptr<stream::ByteSource> source,
                                      std::uint64_t size) {
    ArchiveEntry entry;
    entry.path = std::move(path);
    entry.size = size;
    entry.stream = std::move(source);
    return entry;
}

ArchiveEntry ArchiveEntry::Directory(std::string path) {
    ArchiveEntry entry;
    entry.path = std::move(path);
    entry.is_directory = true;
    return entry;
}

VectorProducer::VectorProducer(std::vector<ArchiveEntry> entries)
    : entries_(std::move(entries)) {}

std::optional<ArchiveEntry> VectorProducer::Next() {
    if (index_ >= entries_.size()) {
        return std::nullopt;
    }
    return std::move(entries_[index_++]);
}

ArchiveFormat SniffFormat(const std::uint8_t* data, std::size_t len) {
    const std::size_t sig_len = constants::kEncryptionSignature.size();
    if (len >= sig_len && std::memcmp(data, constants::kEncryptionSignature.data(), sig_len) == 0) {
        return ArchiveFormat::Encrypted;
    }
    if (len >= 2 && data[0] == constants::kGzipMagic0 && data[1] == constants::kGzipMagic1) {
        return ArchiveFormat::Gzip;
    }
    return ArchiveFormat::Tar;
}

ArchiveFormat SniffFormat(const Bytes& head) {
    return SniffFormat(head.data(), head.size());
}

std::string_view FormatName(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Encrypted:
            return "encrypted";
        case ArchiveFormat::Gzip:
            return "gzip";
        case ArchiveFormat::Tar:
            return "tar";
    }
    return {};
}

ExportReport ExportArchive(stream::ByteSink& sink,
                           const std::vector<Collaborator*>& collaborators,
                           const ExportOptions& options) {
    ExportReport report;
    report.encrypted = !options.password.empty();
    report.compressed = report.encrypted || options.compress;

    std::vector<Collaborator*> ordered;
    for (Collaborator* collaborator : collaborators) {
        if (collaborator) {
            ordered.push_back(collaborator);
        }
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const Collaborator* a, const Collaborator* b) {
        return static_cast<int>(a->category()) < static_cast<int>(b->category());
    });

    std::unique_ptr<cipher::ChunkedCipherWriter> cipher;
    std::unique_ptr<compress::DeflateSink> deflate;
    std::unique_ptr<tar::Writer> writer;
    try {
        stream::ByteSink* head = &sink;
        if (report.encrypted) {
            Log(options.logger, "Encrypting...");
            cipher = std::make_unique<cipher::ChunkedCipherWriter>(*head, options.password, options.cipher_chunk_size);
            head = cipher.get();
        }
        if (report.compressed) {
            deflate = std::make_unique<compress::DeflateSink>(*head, options.compression_level);
            head = deflate.get();
        }
        writer = std::make_unique<tar::Writer>(*head);
        if (options.modification_time) {
            writer->set_modification_time(*options.modification_time);
        }

        for (Collaborator* collaborator : ordered) {
            const Category category = collaborator->category();
            const std::string prefix(CategoryPrefix(category));
            std::unique_ptr<EntryProducer> producer = collaborator->ProduceEntries();
            if (!producer) {
                continue;
            }
            while (true) {
                CheckCancelled(options.cancelled);
                std::optional<ArchiveEntry> entry = producer->Next();
                if (!entry) {
                    break;
                }
                if (category == Category::Custom) {
                    Log(options.logger, "Archiving custom data: " + entry->path);
                }
                const std::string path = prefix + entry->path;
                if (entry->is_directory) {
                    writer->WriteDirectory(path);
                } else if (entry->stream) {
                    CancellableSource guarded(*entry->stream, options.cancelled);
                    writer->WriteEntry(path, guarded, entry->size);
                    report.payload_bytes += entry->size;
                } else {
                    if (entry->size != entry->bytes.size()) {
                        throw FormatError("Declared size does not match payload for " + path);
                    }
                    writer->WriteEntry(path, entry->bytes);
                    report.payload_bytes += entry->bytes.size();
                }
                ++report.entries;
            }
        }
        CheckCancelled(options.cancelled);
        writer->Close();
    } catch (const std::exception& exc) {
        Log(options.logger, LogLevel::Error, std::string("Export error: ") + exc.what());
        if (writer) {
            writer->Abort(exc.what());
        } else if (deflate) {
            deflate->Abort(exc.what());
        } else if (cipher) {
            cipher->Abort(exc.what());
        } else {
            sink.Abort(exc.what());
        }
        throw;
    }
    Log(options.logger, LogLevel::Ok, "Export complete!");
    return report;
}

ImportReport ImportArchive(stream::ByteSource& source,
                           const std::vector<Collaborator*>& collaborators,
                           const ImportOptions& options) {
    ImportReport report;
    try {
        Log(options.logger, "Analyzing file...");
        ArchiveInput input(source, options);
        report.format = input.format();
        CancellableSource guarded(input.stream(), options.cancelled);
        tar::Reader reader(guarded, options.tar);
        Log(options.logger, "Restoring data...");
        while (true) {
            CheckCancelled(options.cancelled);
            std::optional<tar::Entry> entry = reader.Next();
            if (!entry) {
                DrainTrailer(guarded, options.tar);
                break;
            }
            std::string relative;
            Collaborator* target = Route(collaborators, entry->path, relative);
            if (!target) {
                ++report.ignored;
                continue;
            }
            try {
                target->ConsumeEntry(relative, reader.Payload(), entry->size);
                ++report.dispatched;
            } catch (const Error&) {
                throw;
            } catch (const std::exception& exc) {
                ++report.failed;
                Log(options.logger, LogLevel::Error, "Skipping " + entry->path + ": " + exc.what());
            }
        }
    } catch (const std::exception& exc) {
        Log(options.logger, LogLevel::Error, std::string("Error: ") + exc.what());
        throw;
    }
    Log(options.logger, LogLevel::Ok, "Import complete!");
    return report;
}

Listing ListArchive(stream::ByteSource& source, const ImportOptions& options) {
    Listing listing;
    ArchiveInput input(source, options);
    listing.format = input.format();
    CancellableSource guarded(input.stream(), options.cancelled);
    tar::Reader reader(guarded, options.tar);
    while (true) {
        CheckCancelled(options.cancelled);
        std::optional<tar::Entry> entry = reader.Next();
        if (!entry) {
            DrainTrailer(guarded, options.tar);
            break;
        }
        ListedEntry listed;
        listed.path = entry->path;
        listed.size = entry->size;
        listed.is_directory = entry->is_directory();
        listing.entries.push_back(std::move(listed));
    }
    return listing;
}

}  // namespace lexport::pipeline
