#include "lexport/records.hpp"

#include "lexport/collaborators.hpp"
#include "lexport/errors.hpp"
#include "lexport/serialize.hpp"

#include <algorithm>
#include <deque>
#include <optional>
#include <stdexcept>
#include <utility>

namespace lexport::records {

namespace {

using serialize::Document;

std::vector<std::string> SplitSegments(const std::string& path) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            parts.push_back(path.substr(start));
            return parts;
        }
        parts.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
}

bool EndsWith(const std::string& text, std::string_view suffix) {
    return text.size() > suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Document SchemaDocument(const Database& database) {
    Document stores = Document::array();
    for (const auto& store : database.stores) {
        Document indexes = Document::array();
        for (const auto& index : store.indexes) {
            Document entry = Document::object();
            entry["name"] = index.name;
            entry["keyPath"] = serialize::ToDocument(index.key_path);
            entry["unique"] = index.unique;
            entry["multiEntry"] = index.multi_entry;
            indexes.push_back(std::move(entry));
        }
        Document entry = Document::object();
        entry["name"] = store.name;
        entry["keyPath"] = serialize::ToDocument(store.key_path);
        entry["autoIncrement"] = store.auto_increment;
        entry["indexes"] = std::move(indexes);
        stores.push_back(std::move(entry));
    }
    Document schema = Document::object();
    schema["name"] = database.name;
    schema["version"] = database.version;
    schema["stores"] = std::move(stores);
    return schema;
}

[[noreturn]] void BadField(const char* key) {
    throw std::runtime_error(std::string("Malformed schema: bad '") + key + "'");
}

const Document& Field(const Document& object, const char* key) {
    auto it = object.find(std::string(key));
    if (it == object.end()) {
        BadField(key);
    }
    return *it;
}

std::string StringField(const Document& object, const char* key) {
    const Document& field = Field(object, key);
    if (!field.is_string()) {
        BadField(key);
    }
    return field.get<std::string>();
}

bool OptionalFlag(const Document& object, const char* key) {
    auto it = object.find(std::string(key));
    if (it == object.end() || it->is_null()) {
        return false;
    }
    if (!it->is_boolean()) {
        BadField(key);
    }
    return it->get<bool>();
}

value::Value OptionalKeyPath(const Document& object) {
    auto it = object.find(std::string("keyPath"));
    if (it == object.end()) {
        return value::Value();
    }
    return serialize::FromDocument(*it);
}

Database DatabaseFromSchema(const Document& schema) {
    if (!schema.is_object()) {
        throw std::runtime_error("Malformed schema: not an object");
    }
    Database database;
    database.name = StringField(schema, "name");
    const Document& version = Field(schema, "version");
    if (!version.is_number_integer()) {
        BadField("version");
    }
    database.version = version.get<std::int64_t>();
    const Document& stores = Field(schema, "stores");
    if (!stores.is_array()) {
        BadField("stores");
    }
    for (const auto& store_doc : stores) {
        if (!store_doc.is_object()) {
            throw std::runtime_error("Malformed schema: store is not an object");
        }
        ObjectStore store;
        store.name = StringField(store_doc, "name");
        store.key_path = OptionalKeyPath(store_doc);
        store.auto_increment = OptionalFlag(store_doc, "autoIncrement");
        auto indexes = store_doc.find(std::string("indexes"));
        if (indexes != store_doc.end() && indexes->is_array()) {
            for (const auto& index_doc : *indexes) {
                if (!index_doc.is_object()) {
                    throw std::runtime_error("Malformed schema: index is not an object");
                }
                IndexSchema index;
                index.name = StringField(index_doc, "name");
                index.key_path = OptionalKeyPath(index_doc);
                index.unique = OptionalFlag(index_doc, "unique");
                index.multi_entry = OptionalFlag(index_doc, "multiEntry");
                store.indexes.push_back(std::move(index));
            }
        }
        database.stores.push_back(std::move(store));
    }
    return database;
}

// Emits one database at a time: the schema first, then each non-empty store
// in batches, every batch preceded by the blobs it refers to.
class RecordsProducer : public pipeline::EntryProducer {
public:
    RecordsProducer(const std::vector<Database>& databases,
                    const value::ExternalizeOptions& externalize,
                    std::size_t batch_size,
                    const Logger& logger,
                    value::ExternalizeStats& stats,
                    std::size_t& dropped)
        : databases_(databases),
          externalize_(externalize),
          batch_size_(batch_size),
          logger_(logger),
          stats_(stats),
          dropped_(dropped) {}

    std::optional<pipeline::ArchiveEntry> Next() override {
        while (pending_.empty()) {
            if (!Advance()) {
                return std::nullopt;
            }
        }
        pipeline::ArchiveEntry entry = std::move(pending_.front());
        pending_.pop_front();
        return entry;
    }

private:
    bool Advance() {
        if (db_index_ >= databases_.size()) {
            return false;
        }
        const Database& database = databases_[db_index_];
        if (!schema_done_) {
            Log(logger_, "Exporting records: " + database.name);
            std::string path = collaborators::EscapePathComponent(database.name) + "/"
                             + std::string(constants::kSchemaEntry);
            pending_.push_back(pipeline::ArchiveEntry::FromBytes(path, serialize::EncodeCbor(SchemaDocument(database))));
            schema_done_ = true;
            store_index_ = 0;
            record_index_ = 0;
            batch_index_ = 0;
            return true;
        }
        while (store_index_ < database.stores.size()
               && record_index_ >= database.stores[store_index_].records.size()) {
            ++store_index_;
            record_index_ = 0;
            batch_index_ = 0;
        }
        if (store_index_ >= database.stores.size()) {
            ++db_index_;
            schema_done_ = false;
            return true;
        }
        QueueBatch(database, database.stores[store_index_]);
        return true;
    }

    void QueueBatch(const Database& database, const ObjectStore& store) {
        const std::string store_dir = collaborators::EscapePathComponent(database.name) + "/"
                                    + collaborators::EscapePathComponent(store.name) + "/";
        value::MemoryBlobStore side;
        value::ExternalizeOptions options = externalize_;
        options.store = &side;

        Document batch = Document::array();
        const std::size_t end = std::min(record_index_ + batch_size_, store.records.size());
        for (; record_index_ < end; ++record_index_) {
            const Record& record = store.records[record_index_];
            try {
                value::Value stored = value::Externalize(record.value, options, &stats_);
                if (stored.is_absent() && record.value.is<value::Blob>()) {
                    ++dropped_;
                    Log(logger_, LogLevel::Error,
                        "Skipping record in " + database.name + "/" + store.name + ": blob read timed out");
                    continue;
                }
                Document item = Document::object();
                item["k"] = serialize::ToDocument(value::Externalize(record.key));
                item["v"] = serialize::ToDocument(stored);
                batch.push_back(std::move(item));
            } catch (const Error&) {
                throw;
            } catch (const std::runtime_error& exc) {
                ++dropped_;
                Log(logger_, LogLevel::Error,
                    "Skipping record in " + database.name + "/" + store.name + ": " + exc.what());
            }
        }

        const std::string blob_dir = store_dir + std::string(constants::kBlobDir) + "/";
        for (const auto& blob : side.blobs()) {
            pending_.push_back(pipeline::ArchiveEntry::FromBytes(blob_dir + blob.first, *blob.second));
        }
        std::string batch_path = store_dir + std::to_string(batch_index_++) + std::string(constants::kCborSuffix);
        pending_.push_back(pipeline::ArchiveEntry::FromBytes(batch_path, serialize::EncodeCbor(batch)));
    }

    const std::vector<Database>& databases_;
    const value::ExternalizeOptions& externalize_;
    std::size_t batch_size_;
    const Logger& logger_;
    value::ExternalizeStats& stats_;
    std::size_t& dropped_;
    std::deque<pipeline::ArchiveEntry> pending_;
    std::size_t db_index_ = 0;
    std::size_t store_index_ = 0;
    std::size_t record_index_ = 0;
    std::size_t batch_index_ = 0;
    bool schema_done_ = false;
};

}  // namespace

ObjectStore* Database::FindStore(const std::string& store_name) {
    for (auto& store : stores) {
        if (store.name == store_name) {
            return &store;
        }
    }
    return nullptr;
}

const ObjectStore* Database::FindStore(const std::string& store_name) const {
    for (const auto& store : stores) {
        if (store.name == store_name) {
            return &store;
        }
    }
    return nullptr;
}

RecordsCollaborator::RecordsCollaborator(std::vector<Database> databases,
                                         value::ExternalizeOptions externalize,
                                         Logger logger)
    : databases_(std::move(databases)),
      externalize_(externalize),
      logger_(std::move(logger)) {}

void RecordsCollaborator::AddDatabase(Database database) {
    databases_.push_back(std::move(database));
}

const Database* RecordsCollaborator::FindDatabase(const std::string& name) const {
    for (const auto& database : databases_) {
        if (database.name == name) {
            return &database;
        }
    }
    return nullptr;
}

Database* RecordsCollaborator::MutableDatabase(const std::string& name) {
    for (auto& database : databases_) {
        if (database.name == name) {
            return &database;
        }
    }
    return nullptr;
}

std::unique_ptr<pipeline::EntryProducer> RecordsCollaborator::ProduceEntries() {
    stats_ = {};
    dropped_ = 0;
    return std::make_unique<RecordsProducer>(databases_, externalize_, batch_size_, logger_, stats_, dropped_);
}

void RecordsCollaborator::ConsumeEntry(const std::string& path, stream::ByteSource& payload, std::uint64_t) {
    if (path.empty() || path.back() == '/') {
        return;
    }
    std::vector<std::string> parts = SplitSegments(path);
    if (parts.size() == 2 && parts[1] == constants::kSchemaEntry) {
        RestoreSchema(path, stream::ReadAll(payload));
        return;
    }
    if (parts.size() == 4 && parts[2] == constants::kBlobDir) {
        Bytes data = stream::ReadAll(payload);
        if (incoming_.Put({}, data) != parts[3]) {
            throw std::runtime_error("Blob content does not match its id: " + parts[3]);
        }
        return;
    }
    if (parts.size() == 3 && EndsWith(parts[2], constants::kCborSuffix)) {
        RestoreBatch(collaborators::UnescapePathComponent(parts[0]),
                     collaborators::UnescapePathComponent(parts[1]),
                     stream::ReadAll(payload));
        return;
    }
    throw std::runtime_error("Unrecognized record entry");
}

void RecordsCollaborator::RestoreSchema(const std::string& path, const Bytes& data) {
    Database restored = DatabaseFromSchema(serialize::DecodeCbor(data));
    if (collaborators::EscapePathComponent(restored.name) + "/" + std::string(constants::kSchemaEntry) != path) {
        throw std::runtime_error("Schema name does not match its location");
    }
    Log(logger_, "Restoring records: " + restored.name);
    // A restored schema replaces any database of the same name.
    databases_.erase(std::remove_if(databases_.begin(), databases_.end(),
                                    [&](const Database& database) { return database.name == restored.name; }),
                     databases_.end());
    databases_.push_back(std::move(restored));
}

void RecordsCollaborator::RestoreBatch(const std::string& db_name, const std::string& store_name, const Bytes& data) {
    Database* database = MutableDatabase(db_name);
    if (!database) {
        throw std::runtime_error("Unknown database: " + db_name);
    }
    ObjectStore* store = database->FindStore(store_name);
    if (!store) {
        throw std::runtime_error("Unknown object store: " + db_name + "/" + store_name);
    }
    Document batch = serialize::DecodeCbor(data);
    if (!batch.is_array()) {
        throw std::runtime_error("Malformed record batch");
    }
    std::vector<Record> restored;
    restored.reserve(batch.size());
    for (const auto& item : batch) {
        auto key = item.find(std::string("k"));
        auto val = item.find(std::string("v"));
        if (key == item.end() || val == item.end()) {
            throw std::runtime_error("Malformed record batch");
        }
        Record record;
        record.key = serialize::FromDocument(*key);
        try {
            record.value = value::Internalize(serialize::FromDocument(*val), &incoming_);
        } catch (const FormatError& exc) {
            throw std::runtime_error(std::string("Record cannot be restored: ") + exc.what());
        }
        restored.push_back(std::move(record));
    }
    for (auto& record : restored) {
        store->records.push_back(std::move(record));
    }
}

}  // namespace lexport::records
