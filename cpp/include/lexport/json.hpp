#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lexport::json {

// Flat string-to-string object, in insertion order.
using Fields = std::vector<std::pair<std::string, std::string>>;

std::string EncodeObject(const Fields& fields);

// Throws std::runtime_error on anything other than a flat object of strings.
// A repeated key keeps its first position and its last value.
Fields DecodeObject(std::string_view text);

const std::string* Find(const Fields& fields, std::string_view key);

}  // namespace lexport::json
