#pragma once

#include "lexport/constants.hpp"
#include "lexport/log.hpp"
#include "lexport/pipeline.hpp"
#include "lexport/value.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lexport::records {

using Bytes = std::vector<std::uint8_t>;

struct IndexSchema {
    std::string name;
    // Absent, a string, or an array of strings.
    value::Value key_path;
    bool unique = false;
    bool multi_entry = false;
};

struct Record {
    value::Value key;
    value::Value value;
};

struct ObjectStore {
    std::string name;
    value::Value key_path;
    bool auto_increment = false;
    std::vector<IndexSchema> indexes;
    std::vector<Record> records;
};

struct Database {
    std::string name;
    std::int64_t version = 1;
    std::vector<ObjectStore> stores;

    ObjectStore* FindStore(const std::string& store_name);
    const ObjectStore* FindStore(const std::string& store_name) const;
};

// Structured record databases under "data/idb/". Each database becomes
//   <db>/schema.cbor                 name, version, stores and indexes
//   <db>/<store>/blobs/<id>          blobs moved out of the next batch
//   <db>/<store>/<n>.cbor            up to `batch_size` {k, v} records
// with names percent-encoded. Blob values are externalized before encoding;
// a record whose top-level blob times out is dropped.
class RecordsCollaborator : public pipeline::Collaborator {
public:
    explicit RecordsCollaborator(std::vector<Database> databases = {},
                                 value::ExternalizeOptions externalize = {},
                                 Logger logger = {});

    void AddDatabase(Database database);
    const Database* FindDatabase(const std::string& name) const;
    const std::vector<Database>& databases() const noexcept { return databases_; }

    void set_batch_size(std::size_t batch_size) { batch_size_ = batch_size > 0 ? batch_size : 1; }
    const value::ExternalizeStats& stats() const noexcept { return stats_; }
    std::size_t dropped() const noexcept { return dropped_; }

    pipeline::Category category() const override { return pipeline::Category::Records; }
    std::unique_ptr<pipeline::EntryProducer> ProduceEntries() override;
    void ConsumeEntry(const std::string& path, stream::ByteSource& payload, std::uint64_t size) override;

private:
    Database* MutableDatabase(const std::string& name);
    void RestoreSchema(const std::string& path, const Bytes& data);
    void RestoreBatch(const std::string& db_name, const std::string& store_name, const Bytes& data);

    std::vector<Database> databases_;
    value::ExternalizeOptions externalize_;
    Logger logger_;
    std::size_t batch_size_ = constants::kRecordBatchSize;
    value::ExternalizeStats stats_;
    std::size_t dropped_ = 0;
    // Side blobs seen so far on import, keyed by content id.
    value::MemoryBlobStore incoming_;
};

}  // namespace lexport::records
