#pragma once

#include <cstdint>
#include <vector>

namespace stegbridge::gif_writer {

using Bytes = std::vector<std::uint8_t>;

// Single-frame GIF89a with a 256-entry global color table. Images with at most 256
// distinct colors keep them exactly; others are mapped onto a 6x6x6 color cube.
// Pixels with alpha below 128 become transparent.
// Throws std::runtime_error on invalid dimensions or buffer size.
Bytes Write(int width, int height, int channels, const Bytes& pixels);

}  // namespace stegbridge::gif_writer
