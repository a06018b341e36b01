#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace lexport::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);
std::uint64_t GetUint(std::string_view name, std::uint64_t fallback);

}  // namespace lexport::env
