#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lexport::format {

using Bytes = std::vector<std::uint8_t>;

void WriteU32Le(std::uint8_t* out, std::uint32_t value);
std::uint32_t ReadU32Le(const std::uint8_t* ptr);
void AppendU32Le(Bytes& out, std::uint32_t value);

// Lowercase hex, two digits per byte.
std::string HexEncode(const Bytes& data);

}  // namespace lexport::format
