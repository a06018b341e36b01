#include "lexport/value.hpp"

#include "lexport/crypto.hpp"
#include "lexport/errors.hpp"
#include "lexport/format.hpp"

#include <algorithm>
#include <stdexcept>

namespace lexport::value {

namespace {

Bytes ViewBytes(const BufferView& view) {
    if (!view.storage) {
        if (view.length != 0) {
            throw std::runtime_error("Buffer view has no storage");
        }
        return {};
    }
    if (view.offset > view.storage->size() || view.length > view.storage->size() - view.offset) {
        throw std::runtime_error("Buffer view out of range");
    }
    auto first = view.storage->begin() + static_cast<std::ptrdiff_t>(view.offset);
    return Bytes(first, first + static_cast<std::ptrdiff_t>(view.length));
}

class Externalizer {
public:
    Externalizer(const ExternalizeOptions& options, ExternalizeStats* stats)
        : options_(options), stats_(stats) {}

    Value Visit(const Value& value) {
        return std::visit([this](const auto& v) { return Convert(v); }, value.data);
    }

private:
    template <typename T>
    Value Convert(const T& v) {
        return Value(v);
    }

    Value Convert(const std::monostate&) { return Value(); }

    Value Convert(const BufferView& view) { return Value(ViewBytes(view)); }

    Value Convert(const Blob& blob) {
        if (stats_) {
            ++stats_->blobs;
        }
        Bytes bytes;
        try {
            bytes = ReadBlob(blob, options_.blob_timeout);
        } catch (const ResourceTimeoutError&) {
            if (stats_) {
                ++stats_->timed_out;
            }
            return Value();
        }
        BlobRef ref;
        ref.mime_type = blob.mime_type;
        ref.size = bytes.size();
        if (options_.store && bytes.size() > options_.inline_limit) {
            ref.external_ref = options_.store->Put(blob.mime_type, bytes);
            if (stats_) {
                ++stats_->stored;
            }
        } else {
            ref.bytes = std::move(bytes);
        }
        return Value(std::move(ref));
    }

    Value Convert(const Array& items) {
        Array out;
        out.reserve(items.size());
        for (const auto& item : items) {
            out.push_back(Visit(item));
        }
        return Value(std::move(out));
    }

    Value Convert(const Object& members) {
        Object out;
        out.reserve(members.size());
        for (const auto& member : members) {
            out.emplace_back(member.first, Visit(member.second));
        }
        return Value(std::move(out));
    }

    const ExternalizeOptions& options_;
    ExternalizeStats* stats_;
};

class Internalizer {
public:
    explicit Internalizer(const BlobStore* store) : store_(store) {}

    Value Visit(const Value& value) {
        return std::visit([this](const auto& v) { return Convert(v); }, value.data);
    }

private:
    template <typename T>
    Value Convert(const T& v) {
        return Value(v);
    }

    Value Convert(const std::monostate&) { return Value(); }

    Value Convert(const BlobRef& ref) {
        std::shared_ptr<const Bytes> bytes;
        if (ref.is_external()) {
            if (!store_) {
                throw FormatError("External blob reference without a blob store");
            }
            bytes = store_->Get(ref.external_ref);
            if (!bytes) {
                throw FormatError("Unknown blob reference: " + ref.external_ref);
            }
        } else {
            bytes = std::make_shared<const Bytes>(ref.bytes);
        }
        Blob blob;
        blob.mime_type = ref.mime_type;
        blob.size = bytes->size();
        blob.open = [bytes]() -> std::unique_ptr<stream::ByteSource> {
            return std::make_unique<stream::MemorySource>(bytes);
        };
        return Value(std::move(blob));
    }

    Value Convert(const Array& items) {
        Array out;
        out.reserve(items.size());
        for (const auto& item : items) {
            out.push_back(Visit(item));
        }
        return Value(std::move(out));
    }

    Value Convert(const Object& members) {
        Object out;
        out.reserve(members.size());
        for (const auto& member : members) {
            out.emplace_back(member.first, Visit(member.second));
        }
        return Value(std::move(out));
    }

    const BlobStore* store_;
};

}  // namespace

bool operator==(const BufferView& a, const BufferView& b) {
    return ViewBytes(a) == ViewBytes(b);
}

// Blob payloads are not read for comparison.
bool operator==(const Blob& a, const Blob& b) {
    return a.mime_type == b.mime_type && a.size == b.size;
}

bool operator==(const BlobRef& a, const BlobRef& b) {
    return a.mime_type == b.mime_type && a.size == b.size && a.bytes == b.bytes
        && a.external_ref == b.external_ref;
}

bool operator==(const Value& a, const Value& b) {
    return a.data == b.data;
}

bool operator!=(const Value& a, const Value& b) {
    return !(a == b);
}

std::string MemoryBlobStore::Put(const std::string&, const Bytes& bytes) {
    std::string id = "sha256-" + format::HexEncode(crypto::Sha256(bytes.data(), bytes.size()));
    if (blobs_.find(id) == blobs_.end()) {
        blobs_.emplace(id, std::make_shared<const Bytes>(bytes));
    }
    return id;
}

std::shared_ptr<const Bytes> MemoryBlobStore::Get(const std::string& id) const {
    auto it = blobs_.find(id);
    if (it == blobs_.end()) {
        return nullptr;
    }
    return it->second;
}

Bytes ReadBlob(const Blob& blob, std::chrono::milliseconds budget) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + budget;
    Bytes out;
    if (!blob.open) {
        return out;
    }
    std::unique_ptr<stream::ByteSource> source = blob.open();
    if (!source) {
        throw std::runtime_error("Blob could not be opened");
    }
    out.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(blob.size, constants::kCipherChunkSize)));
    Bytes chunk(constants::kPullSize);
    while (true) {
        if (Clock::now() > deadline) {
            throw ResourceTimeoutError("Blob read timed out");
        }
        std::size_t got = source->Read(chunk.data(), chunk.size());
        if (got == 0) {
            break;
        }
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(got));
    }
    if (Clock::now() > deadline) {
        throw ResourceTimeoutError("Blob read timed out");
    }
    return out;
}

Value Externalize(const Value& value, const ExternalizeOptions& options, ExternalizeStats* stats) {
    Externalizer walker(options, stats);
    return walker.Visit(value);
}

Value Internalize(const Value& value, const BlobStore* store) {
    Internalizer walker(store);
    return walker.Visit(value);
}

Blob MakeBlob(std::string mime_type, Bytes bytes) {
    auto shared = std::make_shared<const Bytes>(std::move(bytes));
    Blob blob;
    blob.mime_type = std::move(mime_type);
    blob.size = shared->size();
    blob.open = [shared]() -> std::unique_ptr<stream::ByteSource> {
        return std::make_unique<stream::MemorySource>(shared);
    };
    return blob;
}

}  // namespace lexport::value
