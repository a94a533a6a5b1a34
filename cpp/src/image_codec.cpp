#include "stegbridge/image_codec.hpp"

#include "stegbridge/constants.hpp"
#include "stegbridge/gif_writer.hpp"

#include <zlib.h>

#include <cstdlib>

// Route stb_image_write's PNG deflate through zlib.
static unsigned char* StegbridgeZlibCompress(unsigned char* data, int data_len, int* out_len, int quality);
#define STBIW_ZLIB_COMPRESS StegbridgeZlibCompress

#define STB_IMAGE_IMPLEMENTATION
#define STBI_FAILURE_USERMSG
#define STBI_NO_STDIO
#define STBI_ONLY_PNG
#define STBI_ONLY_JPEG
#define STBI_ONLY_GIF
#define STBI_ONLY_BMP
#include "stb_image.h"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STBI_WRITE_NO_STDIO
#include "stb_image_write.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <cstring>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

static unsigned char* StegbridgeZlibCompress(unsigned char* data, int data_len, int* out_len, int quality) {
    (void)quality;
    uLongf bound = compressBound(static_cast<uLong>(data_len));
    auto* out = static_cast<unsigned char*>(std::malloc(bound));
    if (!out) {
        return nullptr;
    }
    int rc = compress2(out, &bound, data, static_cast<uLong>(data_len),
                       stegbridge::constants::kPngCompressionLevel);
    if (rc != Z_OK || bound > static_cast<uLongf>(INT_MAX)) {
        std::free(out);
        return nullptr;
    }
    *out_len = static_cast<int>(bound);
    return out;
}

namespace stegbridge::image_codec {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

bool StartsWith(const Bytes& blob, const char* magic, std::size_t len) {
    return blob.size() >= len && std::memcmp(blob.data(), magic, len) == 0;
}

void AppendToBytes(void* context, void* data, int size) {
    auto* out = static_cast<Bytes*>(context);
    const auto* begin = static_cast<const std::uint8_t*>(data);
    out->insert(out->end(), begin, begin + size);
}

// JPEG has no alpha; keep only the color planes.
Bytes DropAlpha(const Image& image, int* channels) {
    const std::size_t count = static_cast<std::size_t>(image.width) * static_cast<std::size_t>(image.height);
    const int color = image.channels - 1;
    Bytes out(count * static_cast<std::size_t>(color));
    for (std::size_t i = 0; i < count; ++i) {
        for (int c = 0; c < color; ++c) {
            out[i * color + c] = image.pixels[i * image.channels + c];
        }
    }
    *channels = color;
    return out;
}

Bytes WriteImage(const Image& image, const std::string& fmt) {
    const int width = image.width;
    const int height = image.height;
    int channels = image.channels;

    Bytes out;
    int ok = 0;
    if (fmt == "png") {
        ok = stbi_write_png_to_func(AppendToBytes, &out, width, height, channels,
                                    image.pixels.data(), width * channels);
    } else if (fmt == "jpeg") {
        if (channels == 2 || channels == 4) {
            Bytes color = DropAlpha(image, &channels);
            ok = stbi_write_jpg_to_func(AppendToBytes, &out, width, height, channels,
                                        color.data(), constants::kJpegQuality);
        } else {
            ok = stbi_write_jpg_to_func(AppendToBytes, &out, width, height, channels,
                                        image.pixels.data(), constants::kJpegQuality);
        }
    } else if (fmt == "bmp") {
        ok = stbi_write_bmp_to_func(AppendToBytes, &out, width, height, channels,
                                    image.pixels.data());
    } else if (fmt == "gif") {
        return gif_writer::Write(width, height, channels, image.pixels);
    } else {
        throw std::runtime_error("Unsupported image format: " + fmt);
    }

    if (ok == 0 || out.empty()) {
        throw std::runtime_error("Failed to write " + fmt + " image");
    }
    return out;
}

}  // namespace

std::string DetectFormat(const Bytes& blob) {
    if (StartsWith(blob, "\x89PNG\r\n\x1a\n", 8)) {
        return "png";
    }
    if (StartsWith(blob, "\xFF\xD8\xFF", 3)) {
        return "jpeg";
    }
    if (StartsWith(blob, "GIF87a", 6) || StartsWith(blob, "GIF89a", 6)) {
        return "gif";
    }
    if (StartsWith(blob, "BM", 2)) {
        return "bmp";
    }
    return {};
}

std::string NormalizeFormat(const std::string& tag) {
    std::string fmt = ToLower(tag);
    if (fmt == "jpg") {
        return "jpeg";
    }
    return fmt;
}

bool CanEncode(const std::string& tag) {
    const std::string fmt = NormalizeFormat(tag);
    return fmt == "png" || fmt == "jpeg" || fmt == "gif" || fmt == "bmp";
}

std::string MimeTypeFor(const std::string& tag) {
    return "image/" + tag;
}

Result<Image> Decode(const Bytes& blob) {
    if (blob.empty()) {
        return MakeError(ErrorKind::DecodeError, "cannot identify image file: empty input");
    }
    if (blob.size() > static_cast<std::size_t>(INT_MAX)) {
        return MakeError(ErrorKind::DecodeError, "image data too large");
    }
    std::string format = DetectFormat(blob);
    if (format.empty()) {
        return MakeError(ErrorKind::DecodeError, "cannot identify image file");
    }

    int width = 0;
    int height = 0;
    int channels_in_file = 0;
    if (!stbi_info_from_memory(blob.data(), static_cast<int>(blob.size()),
                               &width, &height, &channels_in_file)) {
        const char* reason = stbi_failure_reason();
        return MakeError(ErrorKind::DecodeError,
                         std::string("Failed to decode image: ") + (reason ? reason : "unknown error"));
    }
    if (static_cast<std::uint64_t>(width) * static_cast<std::uint64_t>(height) > constants::kMaxImagePixels) {
        return MakeError(ErrorKind::DecodeError,
                         "image too large: " + std::to_string(width) + "x" + std::to_string(height));
    }
    const int target_channels = std::clamp(channels_in_file, 1, 4);

    int loaded_channels = 0;
    unsigned char* data = stbi_load_from_memory(blob.data(), static_cast<int>(blob.size()),
                                                &width, &height, &loaded_channels,
                                                target_channels);
    if (!data) {
        const char* reason = stbi_failure_reason();
        return MakeError(ErrorKind::DecodeError,
                         std::string("Failed to decode image: ") + (reason ? reason : "unknown error"));
    }
    std::size_t total = static_cast<std::size_t>(width) * static_cast<std::size_t>(height)
                        * static_cast<std::size_t>(target_channels);
    Image image;
    try {
        image.pixels.assign(data, data + total);
    } catch (const std::bad_alloc&) {
        stbi_image_free(data);
        return MakeError(ErrorKind::DecodeError, "out of memory while decoding image");
    }
    stbi_image_free(data);

    image.width = width;
    image.height = height;
    image.channels = target_channels;
    image.format = std::move(format);
    return image;
}

Result<Bytes> Encode(const Image& image, const std::string& format) {
    std::string fmt = NormalizeFormat(format.empty() ? image.format : format);
    if (fmt.empty()) {
        fmt = std::string(constants::kDefaultFormat);
    }
    if (!CanEncode(fmt)) {
        return MakeError(ErrorKind::EncodeError, "Unsupported image format: " + fmt);
    }
    if (image.width <= 0 || image.height <= 0 || image.channels < 1 || image.channels > 4) {
        return MakeError(ErrorKind::EncodeError, "Invalid image dimensions");
    }
    const std::size_t expected = static_cast<std::size_t>(image.width) * static_cast<std::size_t>(image.height)
                                 * static_cast<std::size_t>(image.channels);
    if (image.pixels.size() != expected) {
        return MakeError(ErrorKind::EncodeError, "Pixel buffer does not match image dimensions");
    }
    try {
        return WriteImage(image, fmt);
    } catch (const std::exception& exc) {
        return MakeError(ErrorKind::EncodeError, exc.what());
    }
}

}  // namespace stegbridge::image_codec
