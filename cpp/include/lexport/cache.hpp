#pragma once

#include "lexport/json.hpp"
#include "lexport/log.hpp"
#include "lexport/pipeline.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lexport::cache {

using Bytes = std::vector<std::uint8_t>;

struct CachedResponse {
    std::string url;
    int status = 200;
    json::Fields headers;
    std::string mime_type;
    Bytes body;
};

struct Cache {
    std::string name;
    std::vector<CachedResponse> responses;

    const CachedResponse* Find(const std::string& url) const;
};

// Cached network responses under "data/cache/". Each response is one
// "<cache>/<sha256(url)>.cbor" entry holding
//   {"meta": {"url", "status", "headers", "type"}, "data": <body bytes>}
class CacheCollaborator : public pipeline::Collaborator {
public:
    explicit CacheCollaborator(std::vector<Cache> caches = {}, Logger logger = {});

    // Replaces an earlier response for the same URL.
    void AddResponse(const std::string& cache_name, CachedResponse response);
    const Cache* FindCache(const std::string& name) const;
    const std::vector<Cache>& caches() const noexcept { return caches_; }

    pipeline::Category category() const override { return pipeline::Category::Cache; }
    std::unique_ptr<pipeline::EntryProducer> ProduceEntries() override;
    void ConsumeEntry(const std::string& path, stream::ByteSource& payload, std::uint64_t size) override;

private:
    std::vector<Cache> caches_;
    Logger logger_;
};

std::string EntryName(const std::string& url);

}  // namespace lexport::cache
