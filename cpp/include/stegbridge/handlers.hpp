#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "stegbridge/result.hpp"

namespace stegbridge::handlers {

using Bytes = std::vector<std::uint8_t>;

struct FilePart {
    std::string filename;
    Bytes data;
};

struct EncodedPayload {
    std::string image;
    std::string format;
    std::string size;
};

struct DownloadRequest {
    std::string image;
    std::optional<std::string> format;
};

struct DownloadResult {
    Bytes data;
    std::string format;
    std::string mime_type;
    std::string filename;
};

// Validate, decode and re-encode one uploaded image. `file` is empty when the request
// carried no file field.
Result<EncodedPayload> ProcessImage(const std::optional<FilePart>& file);

// Reverse the base64 framing of a payload. `request` is empty when the body was missing
// or had no image field. The declared format is trusted as supplied; the decoded bytes
// are not checked against it.
Result<DownloadResult> DownloadImage(const std::optional<DownloadRequest>& request);

}  // namespace stegbridge::handlers
