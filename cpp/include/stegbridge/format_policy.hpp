#pragma once

#include <string>

namespace stegbridge::format_policy {

// Lowercased text after the last dot, or empty when the name has no dot.
std::string ExtensionOf(const std::string& filename);

// Name-based whitelist check (png, jpg, jpeg, gif, bmp); contents are not inspected.
bool IsAllowed(const std::string& filename);

}  // namespace stegbridge::format_policy
