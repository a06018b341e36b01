#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "lexport/env.hpp"

namespace lexport::constants {

inline constexpr std::string_view kEncryptionSignature = "LE_ENC";
inline constexpr std::size_t kSaltLen = 16;
inline constexpr std::size_t kNonceLen = 12;
inline constexpr std::size_t kLengthFieldLen = 4;
inline constexpr std::size_t kChunkHeaderLen = kNonceLen + kLengthFieldLen;
inline constexpr std::size_t kTagLen = 16;
inline constexpr std::size_t kKeyLen = 32;
inline constexpr std::size_t kStreamPreambleLen = kEncryptionSignature.size() + kSaltLen;
inline constexpr std::size_t kKdfIterations = 600000;
inline constexpr std::size_t kCipherChunkSize = 4u * 1024u * 1024u;

inline constexpr std::size_t kTarBlockSize = 512;
inline constexpr std::uint32_t kTarFileMode = 0664;
inline constexpr std::uint32_t kTarDirMode = 0775;

inline constexpr std::uint8_t kGzipMagic0 = 0x1f;
inline constexpr std::uint8_t kGzipMagic1 = 0x8b;
inline constexpr int kDefaultGzipLevel = 6;
inline constexpr std::size_t kSniffLen = 8;

inline constexpr std::size_t kPullSize = 64u * 1024u;
inline constexpr std::uint32_t kBlobReadTimeoutMs = 2000;

inline constexpr std::string_view kCustomPrefix = "data/custom/";
inline constexpr std::string_view kStoragePrefix = "data/";
inline constexpr std::string_view kRecordsPrefix = "data/idb/";
inline constexpr std::string_view kCachePrefix = "data/cache/";
inline constexpr std::string_view kFilesPrefix = "opfs/";

inline constexpr std::string_view kLocalStorageDump = "ls.json";
inline constexpr std::string_view kSessionStorageDump = "ss.json";
inline constexpr std::string_view kCookieDump = "cookies.json";

inline constexpr std::size_t kRecordBatchSize = 50;
inline constexpr std::string_view kSchemaEntry = "schema.cbor";
inline constexpr std::string_view kCborSuffix = ".cbor";
inline constexpr std::string_view kBlobDir = "blobs";
inline constexpr std::string_view kBlobMarkerKey = "__le_blob";

inline std::size_t KdfIterations() {
    std::uint64_t parsed = lexport::env::GetUint("LEXPORT_TEST_KDF_ITERS", 0);
    if (parsed == 0) {
        return kKdfIterations;
    }
    if (parsed > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        return static_cast<std::size_t>(std::numeric_limits<int>::max());
    }
    return static_cast<std::size_t>(parsed);
}

inline int GzipLevel() {
    std::uint64_t parsed = lexport::env::GetUint("LEXPORT_GZIP_LEVEL", kDefaultGzipLevel);
    if (parsed > 9) {
        return 9;
    }
    return static_cast<int>(parsed);
}

}  // namespace lexport::constants
