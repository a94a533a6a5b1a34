#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace stegbridge::constants {

inline constexpr std::size_t kMaxContentLength = 16u * 1024u * 1024u;

// Decoded images above this many pixels are refused before any pixel buffer is allocated.
inline constexpr std::uint64_t kMaxImagePixels = 2u * 89478485u;

inline constexpr std::array<std::string_view, 5> kAllowedExtensions = {
    "png", "jpg", "jpeg", "gif", "bmp"
};

inline constexpr std::string_view kUploadField = "image";
inline constexpr std::string_view kDefaultFormat = "png";
inline constexpr std::string_view kDownloadBasename = "steganography_result";

// Pillow's default JPEG quality, so a JPEG round trip matches the original service.
inline constexpr int kJpegQuality = 75;
inline constexpr int kPngCompressionLevel = 6;

inline constexpr std::string_view kDefaultHost = "0.0.0.0";
inline constexpr std::uint16_t kDefaultPort = 5000;
inline constexpr std::string_view kDefaultIndexPath = "templates/index.html";
inline constexpr std::string_view kDefaultStaticDir = "static";

inline constexpr std::string_view kServerName = "stegbridge";
inline constexpr std::string_view kVersion = "1.0.0";

}  // namespace stegbridge::constants
