#include "lexport/cache.hpp"
#include "lexport/collaborators.hpp"
#include "lexport/constants.hpp"
#include "lexport/errors.hpp"
#include "lexport/pipeline.hpp"
#include "lexport/records.hpp"
#include "lexport/stream.hpp"
#include "lexport/tar.hpp"
#include "test_util.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
namespace pipeline = lexport::pipeline;
namespace collaborators = lexport::collaborators;
namespace records = lexport::records;
namespace value = lexport::value;
using lexport::LogLevel;
using lexport::stream::MemorySink;
using lexport::stream::MemorySource;
using lexport::test::Bytes;
using lexport::test::Check;
using lexport::test::CheckThrows;
using lexport::test::Pattern;
using lexport::test::ToBytes;

namespace {

// Exports a fixed entry list and records whatever it is handed on import.
class RecordingCollaborator : public pipeline::Collaborator {
public:
    explicit RecordingCollaborator(pipeline::Category category) : category_(category) {}

    void Add(std::string path, Bytes data, bool streamed = false) {
        items_.push_back({std::move(path), std::move(data), streamed});
    }

    pipeline::Category category() const override { return category_; }

    std::unique_ptr<pipeline::EntryProducer> ProduceEntries() override {
        std::vector<pipeline::ArchiveEntry> entries;
        for (const auto& item : items_) {
            if (item.streamed) {
                entries.push_back(pipeline::ArchiveEntry::FromStream(
                    item.path, std::make_unique<MemorySource>(item.data, 4093), item.data.size()));
            } else {
                entries.push_back(pipeline::ArchiveEntry::FromBytes(item.path, item.data));
            }
        }
        return std::make_unique<pipeline::VectorProducer>(std::move(entries));
    }

    void ConsumeEntry(const std::string& path, lexport::stream::ByteSource& payload, std::uint64_t size) override {
        if (path == fail_on) {
            throw std::runtime_error("cannot store " + path);
        }
        received.emplace_back(path, lexport::stream::ReadAll(payload));
        declared_sizes.push_back(size);
    }

    std::string fail_on;
    std::vector<std::pair<std::string, Bytes>> received;
    std::vector<std::uint64_t> declared_sizes;

private:
    struct Item {
        std::string path;
        Bytes data;
        bool streamed;
    };

    pipeline::Category category_;
    std::vector<Item> items_;
};

class FailingProducer : public pipeline::EntryProducer {
public:
    std::optional<pipeline::ArchiveEntry> Next() override {
        if (calls_++ == 0) {
            return pipeline::ArchiveEntry::FromString("first.txt", "fine");
        }
        throw std::runtime_error("boom");
    }

private:
    int calls_ = 0;
};

class FailingCollaborator : public pipeline::Collaborator {
public:
    pipeline::Category category() const override { return pipeline::Category::Cache; }
    std::unique_ptr<pipeline::EntryProducer> ProduceEntries() override { return std::make_unique<FailingProducer>(); }
    void ConsumeEntry(const std::string&, lexport::stream::ByteSource&, std::uint64_t) override {}
};

struct LogCapture {
    std::vector<std::pair<LogLevel, std::string>> lines;

    lexport::Logger Bind() {
        return [this](LogLevel level, const std::string& message) { lines.emplace_back(level, message); };
    }

    bool Contains(LogLevel level, const std::string& message) const {
        return std::find(lines.begin(), lines.end(), std::make_pair(level, message)) != lines.end();
    }
};

Bytes Export(const std::vector<pipeline::Collaborator*>& collabs, const pipeline::ExportOptions& options) {
    MemorySink sink;
    pipeline::ExportArchive(sink, collabs, options);
    return sink.Take();
}

fs::path TempDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("lexport_test_" + std::to_string(::getpid()) + "_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

Bytes ReadFile(const fs::path& path) {
    lexport::stream::FileSource source(path);
    return lexport::stream::ReadAll(source);
}

void WriteFile(const fs::path& path, const Bytes& data) {
    fs::create_directories(path.parent_path());
    lexport::stream::FileSink sink(path);
    sink.Write(data);
    sink.Close();
}

void TestPlainScenario() {
    lexport::test::Section("Export then import without a password:");
    Bytes big = Pattern(5000000, 77);
    RecordingCollaborator source(pipeline::Category::Custom);
    source.Add("a.txt", ToBytes("hi"));
    source.Add("dir/b.bin", big, true);

    LogCapture log;
    pipeline::ExportOptions options;
    options.logger = log.Bind();
    Bytes archive = Export({&source}, options);
    Check(pipeline::SniffFormat(archive) == pipeline::ArchiveFormat::Gzip, "compressed by default");
    Check(log.Contains(LogLevel::Info, "Archiving custom data: a.txt"), "custom item logged");
    Check(log.Contains(LogLevel::Ok, "Export complete!"), "completion logged");

    RecordingCollaborator target(pipeline::Category::Custom);
    MemorySource input(archive, 10007);
    auto report = pipeline::ImportArchive(input, {&target});
    Check(report.format == pipeline::ArchiveFormat::Gzip, "detected gzip");
    Check(report.dispatched == 2 && target.received.size() == 2, "two entries dispatched");
    if (target.received.size() == 2) {
        Check(target.received[0].first == "a.txt" && target.received[0].second == ToBytes("hi"), "a.txt intact");
        Check(target.received[1].first == "dir/b.bin" && target.received[1].second == big, "b.bin intact");
        Check(target.declared_sizes[0] == 2 && target.declared_sizes[1] == 5000000, "declared sizes");
    }
}

void TestEncryptedScenario() {
    lexport::test::Section("Encrypted export:");
    RecordingCollaborator source(pipeline::Category::Custom);
    source.Add("a.txt", ToBytes("hi"));
    source.Add("dir/b.bin", Pattern(300000, 78), true);

    LogCapture log;
    pipeline::ExportOptions options;
    options.password = "p";
    options.compress = false;
    options.logger = log.Bind();
    MemorySink sink;
    auto export_report = pipeline::ExportArchive(sink, {&source}, options);
    Bytes archive = sink.Take();
    Check(export_report.encrypted && export_report.compressed, "password forces compression");
    Check(export_report.entries == 2 && export_report.payload_bytes == 300002, "export report");
    Check(pipeline::SniffFormat(archive) == pipeline::ArchiveFormat::Encrypted, "signature detected");
    Check(log.Contains(LogLevel::Info, "Encrypting..."), "encryption logged");

    RecordingCollaborator wrong_target(pipeline::Category::Custom);
    LogCapture import_log;
    pipeline::ImportOptions wrong;
    wrong.password = "wrong";
    wrong.logger = import_log.Bind();
    MemorySource wrong_input(archive);
    CheckThrows<lexport::AuthenticationError>(
        [&] { pipeline::ImportArchive(wrong_input, {&wrong_target}, wrong); }, "wrong password rejected",
        "Incorrect password");
    Check(wrong_target.received.empty(), "nothing dispatched before verification");
    Check(import_log.Contains(LogLevel::Error, "Error: Incorrect password"), "single failure logged");

    RecordingCollaborator target(pipeline::Category::Custom);
    int asked = 0;
    pipeline::ImportOptions prompted;
    prompted.password_provider = [&] {
        ++asked;
        return std::string("p");
    };
    MemorySource input(archive, 999);
    auto report = pipeline::ImportArchive(input, {&target}, prompted);
    Check(asked == 1, "password asked once");
    Check(report.format == pipeline::ArchiveFormat::Encrypted && report.dispatched == 2, "decrypted import");

    MemorySource no_password_input(archive);
    CheckThrows<lexport::Error>(
        [&] { pipeline::ImportArchive(no_password_input, {&target}); }, "missing password", "Password required");
}

void TestUncompressed() {
    lexport::test::Section("Uncompressed container:");
    RecordingCollaborator source(pipeline::Category::Custom);
    source.Add("x.txt", ToBytes("plain"));
    source.Add("y.bin", Pattern(1500, 2));

    pipeline::ExportOptions plain_options;
    plain_options.compress = false;
    Bytes plain = Export({&source}, plain_options);
    Bytes compressed = Export({&source}, {});
    Check(pipeline::SniffFormat(plain) == pipeline::ArchiveFormat::Tar, "plain tar sniffed");

    RecordingCollaborator from_plain(pipeline::Category::Custom);
    RecordingCollaborator from_gzip(pipeline::Category::Custom);
    MemorySource plain_input(plain);
    MemorySource gzip_input(compressed);
    auto plain_report = pipeline::ImportArchive(plain_input, {&from_plain});
    pipeline::ImportArchive(gzip_input, {&from_gzip});
    Check(plain_report.format == pipeline::ArchiveFormat::Tar, "plain import format");
    Check(from_plain.received == from_gzip.received && from_plain.received.size() == 2,
          "plain and compressed imports agree");
}

void TestRouting() {
    lexport::test::Section("Category order and routing:");
    RecordingCollaborator custom(pipeline::Category::Custom);
    custom.Add("note", ToBytes("n"));
    RecordingCollaborator records(pipeline::Category::Records);
    records.Add("db/store/1", ToBytes("{}"));
    RecordingCollaborator files(pipeline::Category::Files);
    files.Add("root.txt", ToBytes("r"));
    collaborators::KeyValueCollaborator storage;
    storage.SetDump("ls.json", {{"k", "v"}});

    pipeline::ExportOptions options;
    options.compress = false;
    Bytes archive = Export({&files, &records, &storage, &custom}, options);

    MemorySource list_input(archive);
    auto listing = pipeline::ListArchive(list_input);
    std::vector<std::string> paths;
    for (const auto& entry : listing.entries) {
        paths.push_back(entry.path);
    }
    Check(paths == std::vector<std::string>{"data/custom/note", "data/ls.json", "data/idb/db/store/1", "opfs/root.txt"},
          "entries in category order");

    RecordingCollaborator custom_in(pipeline::Category::Custom);
    collaborators::KeyValueCollaborator storage_in;
    MemorySource input(archive);
    auto report = pipeline::ImportArchive(input, {&storage_in, &custom_in});
    Check(report.dispatched == 2 && report.ignored == 2, "unowned prefixes ignored");
    Check(custom_in.received.size() == 1 && custom_in.received[0].first == "note", "relative path handed over");
    const auto* dump = storage_in.FindDump("ls.json");
    Check(dump && dump->size() == 1 && (*dump)[0].second == "v", "storage dump restored");
    Check(storage_in.FindDump("idb/db/store/1") == nullptr, "record never reaches storage");
}

void TestPerItemFailures() {
    lexport::test::Section("Per-item failures:");
    lexport::stream::MemorySink sink;
    lexport::tar::Writer writer(sink);
    writer.WriteEntry("data/custom/good", ToBytes("1"));
    writer.WriteEntry("data/custom/bad", ToBytes("2"));
    writer.WriteEntry("data/ls.json", ToBytes("{not json"));
    writer.WriteEntry("data/ss.json", ToBytes("{\"a\":\"b\"}"));
    writer.WriteEntry("data/custom/after", ToBytes("3"));
    writer.Close();

    RecordingCollaborator custom(pipeline::Category::Custom);
    custom.fail_on = "bad";
    collaborators::KeyValueCollaborator storage;
    LogCapture log;
    pipeline::ImportOptions options;
    options.logger = log.Bind();
    MemorySource input(sink.data());
    auto report = pipeline::ImportArchive(input, {&custom, &storage}, options);
    Check(report.failed == 2 && report.dispatched == 3, "two failures, three successes");
    Check(custom.received.size() == 2 && custom.received[1].first == "after", "later entries still dispatched");
    Check(log.Contains(LogLevel::Error, "Skipping data/custom/bad: cannot store bad"), "failure logged");
    Check(storage.FindDump("ss.json") != nullptr && storage.FindDump("ls.json") == nullptr, "valid dump kept");
    Check(log.Contains(LogLevel::Ok, "Import complete!"), "import completes");
}

void TestExportFailure() {
    lexport::test::Section("Export failure tears down the chain:");
    FailingCollaborator failing;
    LogCapture log;
    pipeline::ExportOptions options;
    options.password = "p";
    options.logger = log.Bind();
    MemorySink sink;
    CheckThrows<std::runtime_error>([&] { pipeline::ExportArchive(sink, {&failing}, options); }, "error rethrown",
                                    "boom");
    Check(sink.aborted() && sink.abort_reason() == "boom", "sink aborted");
    Check(log.Contains(LogLevel::Error, "Export error: boom"), "export error logged");
    Check(!log.Contains(LogLevel::Ok, "Export complete!"), "no completion");
}

void TestCancellation() {
    lexport::test::Section("Cancellation:");
    RecordingCollaborator source(pipeline::Category::Custom);
    source.Add("big.bin", Pattern(200000, 4), true);
    source.Add("small.txt", ToBytes("s"));

    int checks = 0;
    pipeline::ExportOptions options;
    options.cancelled = [&] { return ++checks > 3; };
    MemorySink sink;
    CheckThrows<lexport::AbortError>([&] { pipeline::ExportArchive(sink, {&source}, options); }, "export cancelled");
    Check(sink.aborted(), "sink aborted on cancel");

    Bytes archive = Export({&source}, {});
    RecordingCollaborator target(pipeline::Category::Custom);
    bool stop = false;
    pipeline::ImportOptions import_options;
    import_options.cancelled = [&] { return stop; };
    MemorySource input(archive, 1000);
    int seen = 0;
    import_options.logger = [&](LogLevel, const std::string& message) {
        if (message == "Restoring data...") {
            ++seen;
            stop = true;
        }
    };
    CheckThrows<lexport::AbortError>([&] { pipeline::ImportArchive(input, {&target}, import_options); },
                                     "import cancelled");
    Check(seen == 1 && target.received.empty(), "cancelled before the first entry");
}

void TestTruncatedArchives() {
    lexport::test::Section("Truncated archives:");
    RecordingCollaborator source(pipeline::Category::Custom);
    source.Add("a.txt", ToBytes("hi"));
    source.Add("noise.bin", Pattern(20000, 9));

    pipeline::ExportOptions encrypted_options;
    encrypted_options.password = "p";
    encrypted_options.cipher_chunk_size = 4096;
    Bytes encrypted = Export({&source}, encrypted_options);
    Bytes compressed = Export({&source}, {});

    pipeline::ImportOptions options;
    options.password = "p";
    auto all_format_errors = [&](const Bytes& archive, std::size_t limit, std::size_t step) {
        bool ok = true;
        for (std::size_t cut = 0; cut < limit; cut += step) {
            Bytes truncated(archive.begin(), archive.begin() + static_cast<std::ptrdiff_t>(cut));
            MemorySource input(truncated);
            try {
                pipeline::ListArchive(input, options);
                ok = false;
                std::cout << "    no error at offset " << cut << std::endl;
            } catch (const lexport::FormatError&) {
            }
        }
        return ok;
    };
    // The last cipher chunk is at least a header and a tag.
    Check(all_format_errors(encrypted, encrypted.size() - 32, 61), "encrypted archive cut anywhere");
    Check(all_format_errors(compressed, compressed.size(), 37), "compressed archive cut anywhere");
    Check(all_format_errors(compressed, compressed.size(), compressed.size() - 1), "compressed archive minus one byte");

    MemorySource whole(encrypted);
    Check(pipeline::ListArchive(whole, options).entries.size() == 2, "untouched archive lists");
}

void TestToleratedTruncation() {
    lexport::test::Section("Truncation tolerance:");
    RecordingCollaborator source(pipeline::Category::Custom);
    source.Add("a.bin", Pattern(200000, 21));
    source.Add("b.bin", Pattern(200000, 22));

    pipeline::ExportOptions encrypted_options;
    encrypted_options.password = "p";
    encrypted_options.cipher_chunk_size = 4096;
    Bytes encrypted = Export({&source}, encrypted_options);
    Bytes compressed = Export({&source}, {});

    pipeline::ImportOptions options;
    options.password = "p";
    options.tar.tolerate_truncation = true;
    auto cut = [](const Bytes& archive, std::size_t len) {
        return Bytes(archive.begin(), archive.begin() + static_cast<std::ptrdiff_t>(len));
    };

    Bytes gzip_cut = cut(compressed, compressed.size() * 3 / 10);
    MemorySource gzip_input(gzip_cut);
    auto gzip_listing = pipeline::ListArchive(gzip_input, options);
    Check(gzip_listing.format == pipeline::ArchiveFormat::Gzip && gzip_listing.entries.size() == 1
              && gzip_listing.entries[0].path == "data/custom/a.bin",
          "gzip cut lists the first entry");

    Bytes encrypted_cut = cut(encrypted, encrypted.size() * 3 / 10);
    MemorySource encrypted_input(encrypted_cut);
    auto encrypted_listing = pipeline::ListArchive(encrypted_input, options);
    Check(encrypted_listing.entries.size() == 1, "encrypted cut lists the first entry");

    RecordingCollaborator custom_in(pipeline::Category::Custom);
    MemorySource import_input(encrypted_cut);
    auto report = pipeline::ImportArchive(import_input, {&custom_in}, options);
    const Bytes full = Pattern(200000, 21);
    bool prefix_ok = custom_in.received.size() == 1 && custom_in.received[0].second.size() < full.size()
                     && std::equal(custom_in.received[0].second.begin(), custom_in.received[0].second.end(),
                                   full.begin());
    Check(report.dispatched == 1 && report.failed == 0, "encrypted cut imports the first entry");
    Check(prefix_ok, "partial payload is a prefix of the original bytes");

    Bytes mid_chunk = cut(encrypted, encrypted.size() / 2 + 7);
    MemorySource strict_input(mid_chunk);
    pipeline::ImportOptions strict = options;
    strict.tar.tolerate_truncation = false;
    CheckThrows<lexport::FormatError>([&] { pipeline::ListArchive(strict_input, strict); },
                                      "without tolerance the same cut fails");

    Bytes in_verification = cut(encrypted, lexport::constants::kStreamPreambleLen + 10);
    MemorySource verification_input(in_verification);
    CheckThrows<lexport::FormatError>([&] { pipeline::ListArchive(verification_input, options); },
                                      "verification chunk must be complete", "Corrupt chunk");
}

void TestRecordsAndCache() {
    lexport::test::Section("Records and cache through an archive:");
    records::ObjectStore photos;
    photos.name = "photos";
    photos.key_path = "id";
    photos.indexes.push_back({"by_album", value::Value("album"), false, false});
    for (int i = 0; i < 60; ++i) {
        value::Object row{{"id", i}, {"album", i % 2 == 0 ? "even" : "odd"}};
        if (i == 7) {
            row.emplace_back("image", value::MakeBlob("image/png", Pattern(20000, 31)));
        }
        photos.records.push_back({value::Value(i), value::Value(std::move(row))});
    }
    records::Database gallery;
    gallery.name = "gallery";
    gallery.version = 2;
    gallery.stores.push_back(photos);

    value::ExternalizeOptions externalize;
    externalize.inline_limit = 4096;
    records::RecordsCollaborator records_out({gallery}, externalize);
    lexport::cache::CacheCollaborator cache_out;
    lexport::cache::CachedResponse response;
    response.url = "https://example.test/app.js";
    response.headers = {{"content-type", "text/javascript"}};
    response.mime_type = "text/javascript";
    response.body = ToBytes("console.log(1)");
    cache_out.AddResponse("static", response);

    pipeline::ExportOptions options;
    options.password = "p";
    Bytes archive = Export({&records_out, &cache_out}, options);
    Check(records_out.stats().stored == 1, "large blob written as a side entry");

    records::RecordsCollaborator records_in;
    lexport::cache::CacheCollaborator cache_in;
    pipeline::ImportOptions import_options;
    import_options.password = "p";
    MemorySource input(archive, 4099);
    auto report = pipeline::ImportArchive(input, {&records_in, &cache_in}, import_options);
    // schema, two batches, one side blob, one cached response
    Check(report.dispatched == 5 && report.failed == 0, "every entry dispatched");

    const records::Database* restored = records_in.FindDatabase("gallery");
    const records::ObjectStore* store = restored ? restored->FindStore("photos") : nullptr;
    Check(restored && restored->version == 2, "database version restored");
    Check(store && store->records.size() == 60 && store->records[59].key == value::Value(59), "all records in order");
    Check(store && store->indexes.size() == 1 && store->indexes[0].key_path == value::Value("album"), "index restored");
    bool image_ok = false;
    if (store && store->records.size() == 60) {
        const auto& row = store->records[7].value.as<value::Object>();
        if (row.size() == 3 && row[2].second.is<value::Blob>()) {
            image_ok = value::ReadBlob(row[2].second.as<value::Blob>(), std::chrono::seconds(5)) == Pattern(20000, 31);
        }
    }
    Check(image_ok, "blob readable after import");

    const lexport::cache::Cache* cache = cache_in.FindCache("static");
    const lexport::cache::CachedResponse* script = cache ? cache->Find(response.url) : nullptr;
    Check(script && script->body == response.body && script->headers == response.headers, "cached response restored");
}

void TestFileTree() {
    lexport::test::Section("File tree collaborator:");
    fs::path src = TempDir("src");
    fs::path dst = TempDir("dst");
    WriteFile(src / "a.txt", ToBytes("hello"));
    WriteFile(src / "sub" / "b.bin", Pattern(100000, 15));
    fs::create_directories(src / "empty");

    collaborators::FileTreeCollaborator exporter(src, {});
    collaborators::CustomItemsCollaborator custom({{"inline", ToBytes("abc"), {}}, {"from-file", {}, src / "a.txt"}});
    Bytes archive = Export({&exporter, &custom}, {});

    std::vector<std::pair<std::string, Bytes>> items;
    collaborators::FileTreeCollaborator importer({}, dst);
    collaborators::CustomItemsCollaborator custom_in({}, [&](const std::string& name, Bytes data) {
        items.emplace_back(name, std::move(data));
    });
    MemorySource input(archive);
    auto report = pipeline::ImportArchive(input, {&importer, &custom_in});
    Check(report.failed == 0 && report.dispatched == 5, "files, empty directory and two items");
    Check(importer.restored() == 2, "two files restored");
    Check(ReadFile(dst / "a.txt") == ToBytes("hello"), "a.txt restored");
    Check(ReadFile(dst / "sub" / "b.bin") == Pattern(100000, 15), "sub/b.bin restored");
    Check(fs::is_directory(dst / "empty"), "empty directory restored");
    Check(!fs::exists(dst / "a.txt.part"), "no partial files left");
    Check(items.size() == 2 && items[0].first == "inline" && items[1].second == ToBytes("hello"), "custom items");

    lexport::stream::MemorySink sink;
    lexport::tar::Writer writer(sink);
    writer.WriteEntry("opfs/../evil.txt", ToBytes("x"));
    writer.WriteEntry("opfs/ok.txt", ToBytes("y"));
    writer.Close();
    fs::path guarded = TempDir("guarded");
    collaborators::FileTreeCollaborator guarded_importer({}, guarded / "root");
    MemorySource unsafe_input(sink.data());
    auto unsafe_report = pipeline::ImportArchive(unsafe_input, {&guarded_importer});
    Check(unsafe_report.failed == 1 && unsafe_report.dispatched == 1, "unsafe path skipped");
    Check(!fs::exists(guarded / "evil.txt") && fs::exists(guarded / "root" / "ok.txt"), "nothing escapes the root");

    Check(collaborators::IsSafePath("/tmp/x", "a/b") && !collaborators::IsSafePath("/tmp/x", "/etc/passwd"),
          "absolute paths rejected");

    fs::remove_all(src);
    fs::remove_all(dst);
    fs::remove_all(guarded);
}

}  // namespace

int main() {
    lexport::test::UseFastKdf();
    TestPlainScenario();
    TestEncryptedScenario();
    TestUncompressed();
    TestRouting();
    TestPerItemFailures();
    TestExportFailure();
    TestCancellation();
    TestTruncatedArchives();
    TestToleratedTruncation();
    TestRecordsAndCache();
    TestFileTree();
    return lexport::test::Finish("pipeline");
}
