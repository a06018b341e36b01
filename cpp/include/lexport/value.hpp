#pragma once

#include "lexport/constants.hpp"
#include "lexport/stream.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lexport::value {

using Bytes = std::vector<std::uint8_t>;

struct Value;
using Array = std::vector<Value>;
using Member = std::pair<std::string, Value>;
using Object = std::vector<Member>;

// Window into shared storage, e.g. a typed array over a larger buffer.
struct BufferView {
    std::shared_ptr<const Bytes> storage;
    std::size_t offset = 0;
    std::size_t length = 0;
};

using BlobOpener = std::function<std::unique_ptr<stream::ByteSource>()>;

// Binary large object. The payload is only reachable through its opener,
// which may be slow.
struct Blob {
    std::string mime_type;
    std::uint64_t size = 0;
    BlobOpener open;
};

// Serializable stand-in for a Blob: owned bytes, or an id in a BlobStore.
struct BlobRef {
    std::string mime_type;
    Bytes bytes;
    std::string external_ref;
    std::uint64_t size = 0;

    bool is_external() const noexcept { return !external_ref.empty(); }
};

struct Value {
    using Storage = std::variant<std::monostate,
                                 bool,
                                 std::int64_t,
                                 double,
                                 std::string,
                                 Bytes,
                                 BufferView,
                                 Blob,
                                 BlobRef,
                                 Array,
                                 Object>;

    Storage data;

    Value() = default;
    Value(bool v) : data(v) {}
    Value(int v) : data(static_cast<std::int64_t>(v)) {}
    Value(std::int64_t v) : data(v) {}
    Value(double v) : data(v) {}
    Value(const char* v) : data(std::string(v)) {}
    Value(std::string v) : data(std::move(v)) {}
    Value(Bytes v) : data(std::move(v)) {}
    Value(BufferView v) : data(std::move(v)) {}
    Value(Blob v) : data(std::move(v)) {}
    Value(BlobRef v) : data(std::move(v)) {}
    Value(Array v) : data(std::move(v)) {}
    Value(Object v) : data(std::move(v)) {}

    bool is_absent() const noexcept { return std::holds_alternative<std::monostate>(data); }

    template <typename T>
    bool is() const noexcept {
        return std::holds_alternative<T>(data);
    }

    template <typename T>
    const T& as() const {
        return std::get<T>(data);
    }
};

bool operator==(const BufferView& a, const BufferView& b);
bool operator==(const Blob& a, const Blob& b);
bool operator==(const BlobRef& a, const BlobRef& b);
bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);

class BlobStore {
public:
    virtual ~BlobStore() = default;
    virtual std::string Put(const std::string& mime_type, const Bytes& bytes) = 0;
    virtual std::shared_ptr<const Bytes> Get(const std::string& id) const = 0;
};

// Content addressed: storing the same bytes twice yields the same id.
class MemoryBlobStore : public BlobStore {
public:
    std::string Put(const std::string& mime_type, const Bytes& bytes) override;
    std::shared_ptr<const Bytes> Get(const std::string& id) const override;

    std::size_t size() const noexcept { return blobs_.size(); }
    const std::map<std::string, std::shared_ptr<const Bytes>>& blobs() const noexcept { return blobs_; }
    void Clear() { blobs_.clear(); }

private:
    std::map<std::string, std::shared_ptr<const Bytes>> blobs_;
};

struct ExternalizeOptions {
    std::chrono::milliseconds blob_timeout{constants::kBlobReadTimeoutMs};
    BlobStore* store = nullptr;
    // Blobs larger than this go to the store when one is given.
    std::uint64_t inline_limit = std::numeric_limits<std::uint64_t>::max();
};

struct ExternalizeStats {
    std::size_t blobs = 0;
    std::size_t timed_out = 0;
    std::size_t stored = 0;
};

// Reads a blob under a time budget; throws ResourceTimeoutError when the
// deadline passes between reads.
Bytes ReadBlob(const Blob& blob, std::chrono::milliseconds budget);

// Replaces blobs with BlobRefs and copies buffer views into owned bytes.
// A blob that cannot be read in time becomes an absent value.
Value Externalize(const Value& value, const ExternalizeOptions& options = {}, ExternalizeStats* stats = nullptr);

// Rebuilds blobs from BlobRefs. External refs need the store they went to.
Value Internalize(const Value& value, const BlobStore* store = nullptr);

Blob MakeBlob(std::string mime_type, Bytes bytes);

}  // namespace lexport::value
