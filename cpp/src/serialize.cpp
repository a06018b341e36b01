#include "lexport/serialize.hpp"

#include "lexport/constants.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace lexport::serialize {

namespace {

std::string MarkerKey() {
    return std::string(constants::kBlobMarkerKey);
}

class DocumentBuilder {
public:
    Document Visit(const value::Value& value) {
        return std::visit([this](const auto& v) { return Convert(v); }, value.data);
    }

private:
    Document Convert(const std::monostate&) { return nullptr; }
    Document Convert(bool v) { return v; }
    Document Convert(std::int64_t v) { return v; }
    Document Convert(double v) { return v; }
    Document Convert(const std::string& v) { return v; }
    Document Convert(const Bytes& v) { return Document::binary(v); }

    Document Convert(const value::BufferView&) {
        throw std::runtime_error("Buffer view must be externalized before encoding");
    }

    Document Convert(const value::Blob&) {
        throw std::runtime_error("Blob must be externalized before encoding");
    }

    Document Convert(const value::BlobRef& ref) {
        Document out = Document::object();
        out[MarkerKey()] = true;
        out["type"] = ref.mime_type;
        if (ref.is_external()) {
            out["externalRef"] = ref.external_ref;
            out["size"] = ref.size;
        } else {
            out["data"] = Document::binary(ref.bytes);
        }
        return out;
    }

    Document Convert(const value::Array& items) {
        Document out = Document::array();
        for (const auto& item : items) {
            out.push_back(Visit(item));
        }
        return out;
    }

    Document Convert(const value::Object& members) {
        Document out = Document::object();
        for (const auto& member : members) {
            out[member.first] = Visit(member.second);
        }
        return out;
    }
};

bool IsBlobMarker(const Document& doc) {
    auto marker = doc.find(MarkerKey());
    return marker != doc.end() && marker->is_boolean() && marker->get<bool>();
}

value::BlobRef BlobRefFromDocument(const Document& doc) {
    value::BlobRef ref;
    auto type = doc.find(std::string("type"));
    if (type == doc.end() || !type->is_string()) {
        throw std::runtime_error("Blob marker without a type");
    }
    ref.mime_type = type->get<std::string>();
    auto data = doc.find(std::string("data"));
    if (data != doc.end()) {
        if (!data->is_binary()) {
            throw std::runtime_error("Blob marker data is not a byte string");
        }
        const auto& bin = data->get_binary();
        ref.bytes.assign(bin.begin(), bin.end());
        ref.size = ref.bytes.size();
        return ref;
    }
    auto external = doc.find(std::string("externalRef"));
    auto size = doc.find(std::string("size"));
    if (external == doc.end() || !external->is_string() || size == doc.end() || !size->is_number_unsigned()) {
        throw std::runtime_error("Blob marker without data or reference");
    }
    ref.external_ref = external->get<std::string>();
    if (ref.external_ref.empty()) {
        throw std::runtime_error("Blob marker with an empty reference");
    }
    ref.size = size->get<std::uint64_t>();
    return ref;
}

}  // namespace

Document ToDocument(const value::Value& value) {
    DocumentBuilder builder;
    return builder.Visit(value);
}

value::Value FromDocument(const Document& doc) {
    switch (doc.type()) {
        case Document::value_t::null:
            return value::Value();
        case Document::value_t::boolean:
            return value::Value(doc.get<bool>());
        case Document::value_t::number_integer:
            return value::Value(doc.get<std::int64_t>());
        case Document::value_t::number_unsigned: {
            std::uint64_t raw = doc.get<std::uint64_t>();
            if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw std::runtime_error("Integer out of range");
            }
            return value::Value(static_cast<std::int64_t>(raw));
        }
        case Document::value_t::number_float:
            return value::Value(doc.get<double>());
        case Document::value_t::string:
            return value::Value(doc.get<std::string>());
        case Document::value_t::binary: {
            const auto& bin = doc.get_binary();
            return value::Value(Bytes(bin.begin(), bin.end()));
        }
        case Document::value_t::array: {
            value::Array items;
            items.reserve(doc.size());
            for (const auto& item : doc) {
                items.push_back(FromDocument(item));
            }
            return value::Value(std::move(items));
        }
        case Document::value_t::object: {
            if (IsBlobMarker(doc)) {
                return value::Value(BlobRefFromDocument(doc));
            }
            value::Object members;
            members.reserve(doc.size());
            for (const auto& item : doc.items()) {
                members.emplace_back(item.key(), FromDocument(item.value()));
            }
            return value::Value(std::move(members));
        }
        case Document::value_t::discarded:
            break;
    }
    throw std::runtime_error("Unsupported document node");
}

Bytes EncodeCbor(const Document& doc) {
    return Document::to_cbor(doc);
}

Document DecodeCbor(const Bytes& data) {
    try {
        return Document::from_cbor(data);
    } catch (const Document::parse_error& exc) {
        throw std::runtime_error(std::string("Malformed CBOR: ") + exc.what());
    }
}

Bytes EncodeValue(const value::Value& value) {
    return EncodeCbor(ToDocument(value));
}

value::Value DecodeValue(const Bytes& data) {
    return FromDocument(DecodeCbor(data));
}

}  // namespace lexport::serialize
