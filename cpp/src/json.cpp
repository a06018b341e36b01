#include "lexport/json.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace lexport::json {

namespace {

using Document = nlohmann::ordered_json;

}  // namespace

std::string EncodeObject(const Fields& fields) {
    Document doc = Document::object();
    for (const auto& field : fields) {
        doc[field.first] = field.second;
    }
    try {
        return doc.dump();
    } catch (const Document::type_error& exc) {
        throw std::runtime_error(std::string("Storage dump is not valid UTF-8: ") + exc.what());
    }
}

Fields DecodeObject(std::string_view text) {
    Document doc;
    try {
        doc = Document::parse(text.begin(), text.end());
    } catch (const Document::parse_error& exc) {
        throw std::runtime_error(std::string("Malformed JSON: ") + exc.what());
    }
    if (!doc.is_object()) {
        throw std::runtime_error("Malformed JSON: expected an object");
    }
    Fields fields;
    fields.reserve(doc.size());
    for (const auto& item : doc.items()) {
        if (!item.value().is_string()) {
            throw std::runtime_error("Malformed JSON: value of '" + item.key() + "' is not a string");
        }
        fields.emplace_back(item.key(), item.value().get<std::string>());
    }
    return fields;
}

const std::string* Find(const Fields& fields, std::string_view key) {
    for (const auto& field : fields) {
        if (field.first == key) {
            return &field.second;
        }
    }
    return nullptr;
}

}  // namespace lexport::json
