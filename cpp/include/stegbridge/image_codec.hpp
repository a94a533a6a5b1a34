#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "stegbridge/result.hpp"

namespace stegbridge::image_codec {

using Bytes = std::vector<std::uint8_t>;

// Decoded pixels plus the container format they were read from.
// channels: 1 = grey, 2 = grey+alpha, 3 = RGB, 4 = RGBA
struct Image {
    int width = 0;
    int height = 0;
    int channels = 0;
    Bytes pixels;
    std::string format;
};

// "png", "jpeg", "gif", "bmp" from the magic number, or empty.
std::string DetectFormat(const Bytes& blob);

// Lowercases and folds "jpg" into "jpeg".
std::string NormalizeFormat(const std::string& tag);

bool CanEncode(const std::string& tag);

std::string MimeTypeFor(const std::string& tag);

Result<Image> Decode(const Bytes& blob);

// An empty format means "the format the image was decoded from", falling back to png.
Result<Bytes> Encode(const Image& image, const std::string& format = {});

}  // namespace stegbridge::image_codec
