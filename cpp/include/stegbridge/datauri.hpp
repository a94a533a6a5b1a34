#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "stegbridge/result.hpp"

namespace stegbridge::datauri {

using Bytes = std::vector<std::uint8_t>;

// Plain base64, no prefix and no line wrapping.
std::string ToBase64(const Bytes& data);

// "data:<mime>;base64,<payload>"
std::string ToDataUri(const Bytes& data, const std::string& mime_type);
std::string WithPrefix(const std::string& base64_text, const std::string& mime_type);

// Text after the first comma when there is one, otherwise the whole text.
// The prefix is discarded without being validated.
std::string PayloadOf(const std::string& framed);

// Decodes PayloadOf(framed). Malformed base64 yields ErrorKind::DecodeError.
Result<Bytes> FromFramed(const std::string& framed);

}  // namespace stegbridge::datauri
