#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace stegbridge::base64 {

std::string Encode(const std::vector<std::uint8_t>& data);

// Strict RFC 4648 decode. ASCII whitespace is skipped; any other character outside
// the alphabet, misplaced padding or a truncated final quantum fails. On failure
// the result is empty, *ok is false and *reason (when given) names the problem.
std::vector<std::uint8_t> Decode(const std::string& input, bool* ok = nullptr, std::string* reason = nullptr);

}  // namespace stegbridge::base64
