#pragma once

#include "lexport/value.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <vector>

namespace lexport::serialize {

using Bytes = std::vector<std::uint8_t>;
// Objects keep their insertion order.
using Document = nlohmann::ordered_json;

// Maps an externalized value onto a document. Raw bytes become CBOR byte
// strings and blob references become marker objects:
//   {"__le_blob": true, "type": <mime>, "data": <bytes>}
//   {"__le_blob": true, "type": <mime>, "externalRef": <id>, "size": <n>}
// Live blobs and buffer views must go through value::Externalize first.
Document ToDocument(const value::Value& value);
value::Value FromDocument(const Document& doc);

Bytes EncodeCbor(const Document& doc);
// Throws std::runtime_error on malformed input.
Document DecodeCbor(const Bytes& data);

Bytes EncodeValue(const value::Value& value);
value::Value DecodeValue(const Bytes& data);

}  // namespace lexport::serialize
