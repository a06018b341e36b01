#include "lexport/errors.hpp"
#include "lexport/stream.hpp"
#include "lexport/tar.hpp"
#include "test_util.hpp"

#include <cstddef>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

using lexport::stream::MemorySink;
using lexport::stream::MemorySource;
using lexport::test::Bytes;
using lexport::test::Check;
using lexport::test::CheckThrows;
using lexport::test::Pattern;
namespace tar = lexport::tar;

namespace {

struct Decoded {
    tar::Entry entry;
    Bytes payload;
};

std::vector<Decoded> DecodeAll(const Bytes& archive, tar::ReaderOptions options = {}, std::size_t max_read = 0) {
    MemorySource source(archive, max_read);
    tar::Reader reader(source, options);
    std::vector<Decoded> out;
    while (auto entry = reader.Next()) {
        Decoded decoded;
        decoded.entry = *entry;
        decoded.payload = reader.ReadPayload();
        out.push_back(std::move(decoded));
    }
    return out;
}

void TestSizesRoundTrip() {
    lexport::test::Section("Round trip across block boundaries:");
    const std::vector<std::size_t> sizes = {0, 1, 511, 512, 513, 1048577};
    std::vector<std::pair<std::string, Bytes>> entries;
    for (std::size_t i = 0; i < sizes.size(); ++i) {
        entries.emplace_back("dir/file_" + std::to_string(sizes[i]) + ".bin",
                             Pattern(sizes[i], static_cast<std::uint32_t>(i + 1)));
    }

    MemorySink sink;
    tar::Writer writer(sink);
    for (const auto& entry : entries) {
        writer.WriteEntry(entry.first, entry.second);
        Check(writer.position() % lexport::constants::kTarBlockSize == 0,
              "position block aligned after " + entry.first);
    }
    writer.Close();
    Check(sink.closed(), "sink closed");
    Check(sink.data().size() % lexport::constants::kTarBlockSize == 0, "archive size block aligned");

    auto decoded = DecodeAll(sink.data(), {}, 777);
    Check(decoded.size() == entries.size(), "entry count");
    bool all_match = decoded.size() == entries.size();
    for (std::size_t i = 0; all_match && i < entries.size(); ++i) {
        all_match = decoded[i].entry.path == entries[i].first
            && decoded[i].entry.size == entries[i].second.size()
            && decoded[i].payload == entries[i].second
            && decoded[i].entry.checksum_ok;
    }
    Check(all_match, "paths, sizes, payloads and checksums match");
}

void TestStreamedEntry() {
    lexport::test::Section("Streamed entry:");
    Bytes payload = Pattern(70000, 11);
    MemorySink sink;
    tar::Writer writer(sink);
    MemorySource source(payload, 1234);
    writer.WriteEntry("streamed.bin", source, payload.size());
    writer.Close();

    auto decoded = DecodeAll(sink.data());
    Check(decoded.size() == 1 && decoded[0].payload == payload, "streamed payload round trips");

    MemorySink short_sink;
    tar::Writer short_writer(short_sink);
    MemorySource short_source(Pattern(10));
    CheckThrows<lexport::FormatError>(
        [&] { short_writer.WriteEntry("short.bin", short_source, 20); }, "short source rejected");
}

void TestLongNames() {
    lexport::test::Section("Long names:");
    const std::string deep = std::string(60, 'a') + "/" + std::string(60, 'b') + "/" + std::string(77, 'c');
    const std::string just_over = "x/" + std::string(99, 'y');
    const std::string exact_100 = std::string(100, 'n');
    const std::string deep_dir = std::string(90, 'd') + "/" + std::string(50, 'e') + "/";

    auto split = tar::SplitPath(deep);
    Check(split.lossless, "separator split is lossless");
    Check(split.prefix.size() <= 155 && split.name.size() <= 100, "fields within limits");
    Check(split.prefix + "/" + split.name == deep, "split rejoins");

    auto flat = tar::SplitPath(std::string(150, 'z'));
    Check(!flat.lossless, "unsplittable name flagged lossy");
    Check(flat.name.size() == 100 && flat.prefix.size() == 50, "tail kept in name field");

    MemorySink sink;
    tar::Writer writer(sink);
    writer.WriteEntry(deep, Bytes{1, 2, 3});
    writer.WriteEntry(just_over, Bytes{});
    writer.WriteEntry(exact_100, Bytes{4});
    writer.WriteDirectory(deep_dir);
    writer.Close();

    auto decoded = DecodeAll(sink.data());
    Check(decoded.size() == 4, "four entries");
    if (decoded.size() == 4) {
        Check(decoded[0].entry.path == deep, "deep path reconstructed");
        Check(decoded[1].entry.path == just_over, "101-byte path reconstructed");
        Check(decoded[2].entry.path == exact_100, "100-byte path kept in name");
        Check(decoded[3].entry.path == deep_dir && decoded[3].entry.is_directory(), "long directory reconstructed");
    }
}

void TestHeaderFields() {
    lexport::test::Section("Header fields:");
    MemorySink sink;
    tar::Writer writer(sink);
    writer.set_modification_time(1700000000);
    writer.WriteEntry("a.txt", lexport::test::ToBytes("hi"));
    writer.WriteDirectory("folder");
    writer.Close();

    const Bytes& data = sink.data();
    Check(data.size() == 512 * 2 + 512 + 1024, "header, padded payload, dir header, end marker");
    tar::TarHeader header{};
    std::memcpy(&header, data.data(), sizeof(header));
    Check(std::memcmp(header.magic, "ustar", 6) == 0, "ustar magic");
    Check(std::memcmp(header.version, "00", 2) == 0, "version 00");
    Check(header.chksum[6] == '\0' && header.chksum[7] == ' ', "checksum terminator");
    auto stored = tar::ParseOctal(header.chksum, sizeof(header.chksum));
    Check(stored && *stored == tar::ComputeChecksum(header), "stored checksum matches recomputed");

    auto decoded = DecodeAll(data);
    Check(decoded.size() == 2, "two entries");
    if (decoded.size() == 2) {
        Check(decoded[0].entry.mode == 0664, "file mode 0664");
        Check(decoded[0].entry.mtime == 1700000000, "mtime preserved");
        Check(decoded[1].entry.path == "folder/", "directory gets trailing slash");
        Check(decoded[1].entry.typeflag == tar::kTypeDirectory, "directory typeflag");
        Check(decoded[1].entry.mode == 0775, "directory mode 0775");
    }
    CheckThrows<lexport::FormatError>(
        [] { tar::HeaderBuilder().Size(tar::kMaxOctalSize + 1); }, "oversize entry rejected");
    CheckThrows<lexport::FormatError>(
        [] { tar::HeaderBuilder().ModificationTime(1ULL << 40); }, "mtime beyond 11 octal digits rejected");
    CheckThrows<lexport::FormatError>(
        [] { tar::HeaderBuilder().Mode(tar::kMaxOctalMode + 1); }, "mode beyond 7 octal digits rejected");

    auto edge = tar::HeaderBuilder().Path("edge").ModificationTime(tar::kMaxOctalSize).Build();
    auto edge_mtime = tar::ParseOctal(edge.mtime, sizeof(edge.mtime));
    Check(edge_mtime && *edge_mtime == tar::kMaxOctalSize, "largest mtime survives");

    MemorySink late_sink;
    tar::Writer late_writer(late_sink);
    late_writer.set_modification_time(1ULL << 40);
    CheckThrows<lexport::FormatError>([&] { late_writer.WriteEntry("x", Bytes{1}); },
                                      "writer refuses an unrepresentable mtime");
}

void TestSkipAndCopy() {
    lexport::test::Section("Skipping and partial reads:");
    Bytes first = Pattern(3000, 5);
    Bytes second = Pattern(100, 6);
    MemorySink sink;
    tar::Writer writer(sink);
    writer.WriteEntry("first", first);
    writer.WriteEntry("second", second);
    writer.Close();

    MemorySource source(sink.data(), 100);
    tar::Reader reader(source);
    auto entry = reader.Next();
    Check(entry && entry->path == "first", "first header");
    std::uint8_t partial[10];
    Check(reader.Payload().Read(partial, sizeof(partial)) > 0, "partial payload read");
    entry = reader.Next();
    Check(entry && entry->path == "second", "next skips leftover payload");
    MemorySink copy;
    Check(reader.CopyPayload(copy) == second.size() && copy.data() == second, "copy payload");
    Check(!reader.Next(), "end of archive");
    Check(!reader.Next(), "end is sticky");
}

void TestChecksumVerification() {
    lexport::test::Section("Checksum verification:");
    MemorySink sink;
    tar::Writer writer(sink);
    writer.WriteEntry("file", Bytes{9});
    writer.Close();
    Bytes data = sink.data();
    data[0] = 'g';

    auto lenient = DecodeAll(data);
    Check(lenient.size() == 1 && !lenient[0].entry.checksum_ok, "lenient reader flags mismatch");

    tar::ReaderOptions strict;
    strict.verify_checksums = true;
    CheckThrows<lexport::FormatError>([&] { DecodeAll(data, strict); }, "strict reader rejects mismatch");
}

void TestTruncation() {
    lexport::test::Section("Truncation at every offset:");
    MemorySink sink;
    tar::Writer writer(sink);
    writer.WriteEntry("one", Pattern(700, 1));
    writer.WriteEntry("two", Pattern(5, 2));
    writer.Close();
    const Bytes& full = sink.data();
    const std::size_t end_of_entries = full.size() - 1024;

    bool all_ok = true;
    for (std::size_t cut = 0; cut < full.size(); ++cut) {
        Bytes truncated(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(cut));
        bool format_error = false;
        try {
            DecodeAll(truncated);
        } catch (const lexport::FormatError&) {
            format_error = true;
        }
        // A cut inside the second zero block still leaves a valid end marker.
        bool lenient_end = cut >= end_of_entries + 512;
        if (format_error == lenient_end) {
            all_ok = false;
            std::cout << "    unexpected result at offset " << cut << std::endl;
        }
    }
    Check(all_ok, "FormatError before the first end block, clean end after it");

    Bytes cut_payload(full.begin(), full.begin() + 600);
    tar::ReaderOptions tolerant;
    tolerant.tolerate_truncation = true;
    auto decoded = DecodeAll(cut_payload, tolerant);
    Check(decoded.size() == 1 && decoded[0].payload.size() == 88, "tolerant reader returns what arrived");
}

void TestNonNumericSize() {
    lexport::test::Section("Non-numeric size ends the archive:");
    MemorySink sink;
    tar::Writer writer(sink);
    writer.WriteEntry("kept", Bytes{1});
    writer.WriteEntry("odd", Bytes{2});
    writer.Close();
    Bytes data = sink.data();
    std::memset(data.data() + 1024 + offsetof(tar::TarHeader, size), 'x', 11);
    auto decoded = DecodeAll(data);
    Check(decoded.size() == 1 && decoded[0].entry.path == "kept", "reader stops quietly");
}

}  // namespace

int main() {
    TestSizesRoundTrip();
    TestStreamedEntry();
    TestLongNames();
    TestHeaderFields();
    TestSkipAndCopy();
    TestChecksumVerification();
    TestTruncation();
    TestNonNumericSize();
    return lexport::test::Finish("tar");
}
