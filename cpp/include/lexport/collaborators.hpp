#pragma once

#include "lexport/json.hpp"
#include "lexport/log.hpp"
#include "lexport/pipeline.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lexport::collaborators {

using Bytes = std::vector<std::uint8_t>;

// Rejects absolute names and any ".." component, then checks that the joined
// path stays under `dest_dir`.
bool IsSafePath(const std::filesystem::path& dest_dir, const std::string& name);

// Percent-encodes everything except ASCII letters, digits and "-_.!~*'()",
// so arbitrary database, store and cache names fit in one path segment.
std::string EscapePathComponent(std::string_view name);
// Throws std::runtime_error on a malformed escape.
std::string UnescapePathComponent(std::string_view segment);

// Mirrors a directory tree under "opfs/". Files are streamed, empty
// directories are kept as directory entries, symlinks are skipped.
class FileTreeCollaborator : public pipeline::Collaborator {
public:
    // Either root may be empty to disable that direction.
    FileTreeCollaborator(std::filesystem::path export_root,
                         std::filesystem::path import_root,
                         Logger logger = {});

    pipeline::Category category() const override { return pipeline::Category::Files; }
    std::unique_ptr<pipeline::EntryProducer> ProduceEntries() override;
    void ConsumeEntry(const std::string& path, stream::ByteSource& payload, std::uint64_t size) override;

    std::size_t restored() const noexcept { return restored_; }

private:
    std::filesystem::path export_root_;
    std::filesystem::path import_root_;
    Logger logger_;
    std::size_t restored_ = 0;
};

struct CustomItem {
    std::string name;
    Bytes data;
    // When set, the item is streamed from this file instead of `data`.
    std::filesystem::path file;
};

class CustomItemsCollaborator : public pipeline::Collaborator {
public:
    using ItemHandler = std::function<void(const std::string& name, Bytes data)>;

    explicit CustomItemsCollaborator(std::vector<CustomItem> items = {},
                                     ItemHandler on_item = {},
                                     Logger logger = {});

    void AddItem(CustomItem item) { items_.push_back(std::move(item)); }

    pipeline::Category category() const override { return pipeline::Category::Custom; }
    std::unique_ptr<pipeline::EntryProducer> ProduceEntries() override;
    void ConsumeEntry(const std::string& path, stream::ByteSource& payload, std::uint64_t size) override;

private:
    std::vector<CustomItem> items_;
    ItemHandler on_item_;
    Logger logger_;
};

// Named flat string maps ("ls.json", "ss.json", "cookies.json") stored as
// JSON objects directly under "data/".
class KeyValueCollaborator : public pipeline::Collaborator {
public:
    using Dump = std::pair<std::string, json::Fields>;

    KeyValueCollaborator() = default;

    void SetDump(const std::string& name, json::Fields fields);
    const json::Fields* FindDump(const std::string& name) const;
    const std::vector<Dump>& dumps() const noexcept { return dumps_; }

    pipeline::Category category() const override { return pipeline::Category::Storage; }
    std::unique_ptr<pipeline::EntryProducer> ProduceEntries() override;
    void ConsumeEntry(const std::string& path, stream::ByteSource& payload, std::uint64_t size) override;

private:
    std::vector<Dump> dumps_;
};

}  // namespace lexport::collaborators
