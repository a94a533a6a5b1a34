#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace stegbridge::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);
// Empty when unset; throws std::runtime_error when set but not a number.
std::optional<std::uint64_t> GetUnsigned(std::string_view name);

}  // namespace stegbridge::env
