#include "lexport/cache.hpp"

#include "lexport/collaborators.hpp"
#include "lexport/constants.hpp"
#include "lexport/crypto.hpp"
#include "lexport/format.hpp"
#include "lexport/serialize.hpp"

#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>

namespace lexport::cache {

namespace {

using serialize::Document;

Bytes EncodeResponse(const CachedResponse& response) {
    Document headers = Document::object();
    for (const auto& header : response.headers) {
        headers[header.first] = header.second;
    }
    Document meta = Document::object();
    meta["url"] = response.url;
    meta["status"] = response.status;
    meta["headers"] = std::move(headers);
    meta["type"] = response.mime_type;
    Document doc = Document::object();
    doc["meta"] = std::move(meta);
    doc["data"] = Document::binary(response.body);
    return serialize::EncodeCbor(doc);
}

CachedResponse DecodeResponse(const Bytes& data) {
    Document doc = serialize::DecodeCbor(data);
    auto meta = doc.find(std::string("meta"));
    auto body = doc.find(std::string("data"));
    if (meta == doc.end() || !meta->is_object() || body == doc.end() || !body->is_binary()) {
        throw std::runtime_error("Malformed cache entry");
    }
    auto url = meta->find(std::string("url"));
    auto status = meta->find(std::string("status"));
    if (url == meta->end() || !url->is_string() || status == meta->end() || !status->is_number_integer()) {
        throw std::runtime_error("Malformed cache entry metadata");
    }
    std::int64_t code = status->get<std::int64_t>();
    if (code < 0 || code > std::numeric_limits<int>::max()) {
        throw std::runtime_error("Malformed cache entry metadata");
    }

    CachedResponse response;
    response.url = url->get<std::string>();
    response.status = static_cast<int>(code);
    auto type = meta->find(std::string("type"));
    if (type != meta->end() && type->is_string()) {
        response.mime_type = type->get<std::string>();
    }
    auto headers = meta->find(std::string("headers"));
    if (headers != meta->end() && headers->is_object()) {
        for (const auto& header : headers->items()) {
            if (header.value().is_string()) {
                response.headers.emplace_back(header.key(), header.value().get<std::string>());
            }
        }
    }
    const auto& bin = body->get_binary();
    response.body.assign(bin.begin(), bin.end());
    return response;
}

class CacheProducer : public pipeline::EntryProducer {
public:
    CacheProducer(const std::vector<Cache>& caches, const Logger& logger) : caches_(caches), logger_(logger) {}

    std::optional<pipeline::ArchiveEntry> Next() override {
        while (cache_index_ < caches_.size()) {
            const Cache& cache = caches_[cache_index_];
            if (response_index_ == 0) {
                Log(logger_, "Archiving cache: " + cache.name);
            }
            if (response_index_ >= cache.responses.size()) {
                ++cache_index_;
                response_index_ = 0;
                continue;
            }
            const CachedResponse& response = cache.responses[response_index_++];
            std::string path = collaborators::EscapePathComponent(cache.name) + "/" + EntryName(response.url)
                             + std::string(constants::kCborSuffix);
            return pipeline::ArchiveEntry::FromBytes(std::move(path), EncodeResponse(response));
        }
        return std::nullopt;
    }

private:
    const std::vector<Cache>& caches_;
    const Logger& logger_;
    std::size_t cache_index_ = 0;
    std::size_t response_index_ = 0;
};

}  // namespace

const CachedResponse* Cache::Find(const std::string& url) const {
    for (const auto& response : responses) {
        if (response.url == url) {
            return &response;
        }
    }
    return nullptr;
}

std::string EntryName(const std::string& url) {
    return format::HexEncode(crypto::Sha256(reinterpret_cast<const std::uint8_t*>(url.data()), url.size()));
}

CacheCollaborator::CacheCollaborator(std::vector<Cache> caches, Logger logger)
    : caches_(std::move(caches)),
      logger_(std::move(logger)) {}

void CacheCollaborator::AddResponse(const std::string& cache_name, CachedResponse response) {
    Cache* target = nullptr;
    for (auto& cache : caches_) {
        if (cache.name == cache_name) {
            target = &cache;
            break;
        }
    }
    if (!target) {
        caches_.push_back(Cache{cache_name, {}});
        target = &caches_.back();
    }
    for (auto& existing : target->responses) {
        if (existing.url == response.url) {
            existing = std::move(response);
            return;
        }
    }
    target->responses.push_back(std::move(response));
}

const Cache* CacheCollaborator::FindCache(const std::string& name) const {
    for (const auto& cache : caches_) {
        if (cache.name == name) {
            return &cache;
        }
    }
    return nullptr;
}

std::unique_ptr<pipeline::EntryProducer> CacheCollaborator::ProduceEntries() {
    return std::make_unique<CacheProducer>(caches_, logger_);
}

void CacheCollaborator::ConsumeEntry(const std::string& path, stream::ByteSource& payload, std::uint64_t) {
    if (path.empty() || path.back() == '/') {
        return;
    }
    std::size_t slash = path.find('/');
    if (slash == std::string::npos || slash == 0 || path.find('/', slash + 1) != std::string::npos) {
        throw std::runtime_error("Not a cache entry");
    }
    std::string cache_name = collaborators::UnescapePathComponent(std::string_view(path).substr(0, slash));
    CachedResponse response = DecodeResponse(stream::ReadAll(payload));
    Log(logger_, "Restoring cache entry: " + response.url);
    AddResponse(cache_name, std::move(response));
}

}  // namespace lexport::cache
