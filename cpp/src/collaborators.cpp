#include "lexport/collaborators.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <system_error>

namespace lexport::collaborators {

namespace fs = std::filesystem;

namespace {

// Walks the tree lazily; a file is opened only when its entry is requested.
class FileTreeProducer : public pipeline::EntryProducer {
public:
    FileTreeProducer(fs::path root, const Logger& logger)
        : root_(std::move(root)), logger_(logger) {
        std::error_code ec;
        it_ = fs::recursive_directory_iterator(root_, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            throw std::runtime_error("Failed to read directory: " + root_.string());
        }
    }

    std::optional<pipeline::ArchiveEntry> Next() override {
        const fs::recursive_directory_iterator end;
        while (it_ != end) {
            fs::directory_entry entry = *it_;
            std::error_code ec;
            it_.increment(ec);
            if (ec) {
                throw std::runtime_error("Failed to read directory: " + ec.message());
            }
            if (entry.is_symlink(ec)) {
                continue;
            }
            std::string rel = entry.path().lexically_relative(root_).generic_string();
            if (rel.empty()) {
                continue;
            }
            if (entry.is_directory(ec)) {
                if (fs::is_empty(entry.path(), ec) && !ec) {
                    return pipeline::ArchiveEntry::Directory(rel + "/");
                }
                continue;
            }
            if (!entry.is_regular_file(ec)) {
                continue;
            }
            try {
                auto source = std::make_unique<stream::FileSource>(entry.path());
                std::uint64_t size = source->TotalSize();
                return pipeline::ArchiveEntry::FromStream(rel, std::move(source), size);
            } catch (const std::runtime_error& exc) {
                Log(logger_, LogLevel::Error, "Skipping " + rel + ": " + exc.what());
            }
        }
        return std::nullopt;
    }

private:
    fs::path root_;
    const Logger& logger_;
    fs::recursive_directory_iterator it_;
};

class CustomItemsProducer : public pipeline::EntryProducer {
public:
    CustomItemsProducer(const std::vector<CustomItem>& items, const Logger& logger)
        : items_(items), logger_(logger) {}

    std::optional<pipeline::ArchiveEntry> Next() override {
        while (index_ < items_.size()) {
            const CustomItem& item = items_[index_++];
            if (item.name.empty() || item.name.back() == '/') {
                Log(logger_, LogLevel::Error, "Skipping custom item with invalid name '" + item.name + "'");
                continue;
            }
            if (item.file.empty()) {
                return pipeline::ArchiveEntry::FromBytes(item.name, item.data);
            }
            try {
                auto source = std::make_unique<stream::FileSource>(item.file);
                std::uint64_t size = source->TotalSize();
                return pipeline::ArchiveEntry::FromStream(item.name, std::move(source), size);
            } catch (const std::runtime_error& exc) {
                Log(logger_, LogLevel::Error, "Skipping " + item.name + ": " + exc.what());
            }
        }
        return std::nullopt;
    }

private:
    const std::vector<CustomItem>& items_;
    const Logger& logger_;
    std::size_t index_ = 0;
};

}  // namespace

bool IsSafePath(const fs::path& dest_dir, const std::string& name) {
    fs::path rel(name);
    if (rel.is_absolute() || rel.has_root_name() || rel.has_root_directory()) {
        return false;
    }
    for (const auto& part : rel) {
        if (part == "..") {
            return false;
        }
    }
    auto base = dest_dir.lexically_normal();
    auto full = (dest_dir / rel).lexically_normal();
    auto mismatch = std::mismatch(base.begin(), base.end(), full.begin(), full.end());
    return mismatch.first == base.end() || (mismatch.first->empty() && std::next(mismatch.first) == base.end());
}

std::string EscapePathComponent(std::string_view name) {
    static const char kDigits[] = "0123456789ABCDEF";
    static const std::string_view kUnreserved = "-_.!~*'()";
    std::string out;
    out.reserve(name.size());
    for (char ch : name) {
        unsigned char byte = static_cast<unsigned char>(ch);
        if (std::isalnum(byte) && byte < 0x80) {
            out.push_back(ch);
        } else if (kUnreserved.find(ch) != std::string_view::npos) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(kDigits[byte >> 4]);
            out.push_back(kDigits[byte & 0x0F]);
        }
    }
    return out;
}

std::string UnescapePathComponent(std::string_view segment) {
    auto hex_value = [](char ch) -> int {
        if (ch >= '0' && ch <= '9') {
            return ch - '0';
        }
        if (ch >= 'A' && ch <= 'F') {
            return ch - 'A' + 10;
        }
        if (ch >= 'a' && ch <= 'f') {
            return ch - 'a' + 10;
        }
        return -1;
    };
    std::string out;
    out.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] != '%') {
            out.push_back(segment[i]);
            continue;
        }
        if (i + 2 >= segment.size()) {
            throw std::runtime_error("Malformed escape in path segment");
        }
        int hi = hex_value(segment[i + 1]);
        int lo = hex_value(segment[i + 2]);
        if (hi < 0 || lo < 0) {
            throw std::runtime_error("Malformed escape in path segment");
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

FileTreeCollaborator::FileTreeCollaborator(fs::path export_root, fs::path import_root, Logger logger)
    : export_root_(std::move(export_root)),
      import_root_(std::move(import_root)),
      logger_(std::move(logger)) {}

std::unique_ptr<pipeline::EntryProducer> FileTreeCollaborator::ProduceEntries() {
    std::error_code ec;
    if (export_root_.empty() || !fs::is_directory(export_root_, ec)) {
        return std::make_unique<pipeline::VectorProducer>(std::vector<pipeline::ArchiveEntry>{});
    }
    return std::make_unique<FileTreeProducer>(export_root_, logger_);
}

void FileTreeCollaborator::ConsumeEntry(const std::string& path, stream::ByteSource& payload, std::uint64_t) {
    if (import_root_.empty()) {
        return;
    }
    std::string name = path;
    const bool is_directory = !name.empty() && name.back() == '/';
    while (!name.empty() && name.back() == '/') {
        name.pop_back();
    }
    if (name.empty() || !IsSafePath(import_root_, name)) {
        throw std::runtime_error("Unsafe archive path");
    }
    fs::path out_path = import_root_ / fs::path(name);
    std::error_code ec;
    if (is_directory) {
        fs::create_directories(out_path, ec);
        if (ec) {
            throw std::runtime_error("Failed to create directory: " + out_path.string());
        }
        return;
    }
    Log(logger_, "Restoring: " + name);
    fs::create_directories(out_path.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Failed to create directory: " + out_path.parent_path().string());
    }
    stream::FileSink sink(out_path);
    stream::Pump(payload, sink);
    sink.Close();
    ++restored_;
}

CustomItemsCollaborator::CustomItemsCollaborator(std::vector<CustomItem> items, ItemHandler on_item, Logger logger)
    : items_(std::move(items)),
      on_item_(std::move(on_item)),
      logger_(std::move(logger)) {}

std::unique_ptr<pipeline::EntryProducer> CustomItemsCollaborator::ProduceEntries() {
    return std::make_unique<CustomItemsProducer>(items_, logger_);
}

void CustomItemsCollaborator::ConsumeEntry(const std::string& path, stream::ByteSource& payload, std::uint64_t) {
    if (!on_item_ || path.back() == '/') {
        return;
    }
    on_item_(path, stream::ReadAll(payload));
}

void KeyValueCollaborator::SetDump(const std::string& name, json::Fields fields) {
    for (auto& dump : dumps_) {
        if (dump.first == name) {
            dump.second = std::move(fields);
            return;
        }
    }
    dumps_.emplace_back(name, std::move(fields));
}

const json::Fields* KeyValueCollaborator::FindDump(const std::string& name) const {
    for (const auto& dump : dumps_) {
        if (dump.first == name) {
            return &dump.second;
        }
    }
    return nullptr;
}

std::unique_ptr<pipeline::EntryProducer> KeyValueCollaborator::ProduceEntries() {
    std::vector<pipeline::ArchiveEntry> entries;
    entries.reserve(dumps_.size());
    for (const auto& dump : dumps_) {
        entries.push_back(pipeline::ArchiveEntry::FromString(dump.first, json::EncodeObject(dump.second)));
    }
    return std::make_unique<pipeline::VectorProducer>(std::move(entries));
}

void KeyValueCollaborator::ConsumeEntry(const std::string& path, stream::ByteSource& payload, std::uint64_t) {
    if (path.find('/') != std::string::npos) {
        throw std::runtime_error("Not a storage dump");
    }
    Bytes raw = stream::ReadAll(payload);
    std::string text(raw.begin(), raw.end());
    SetDump(path, json::DecodeObject(text));
}

}  // namespace lexport::collaborators
