#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "stegbridge/image_codec.hpp"

namespace {

using stegbridge::image_codec::Bytes;
using stegbridge::image_codec::Image;

int g_failures = 0;

void Expect(bool condition, const std::string& label) {
    std::cout << "  " << label << ": " << (condition ? "ok" : "FAIL") << std::endl;
    if (!condition) {
        ++g_failures;
    }
}

Image Pattern(int width, int height, int channels) {
    Image image;
    image.width = width;
    image.height = height;
    image.channels = channels;
    image.pixels.resize(static_cast<std::size_t>(width * height * channels));
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            std::uint8_t* px = &image.pixels[static_cast<std::size_t>((y * width + x) * channels)];
            for (int c = 0; c < channels; ++c) {
                px[c] = static_cast<std::uint8_t>((x * 37 + y * 11 + c * 71) & 0xFF);
            }
            if (channels == 4) {
                px[3] = static_cast<std::uint8_t>((x + y) % 2 == 0 ? 255 : 0);
            }
        }
    }
    return image;
}

// Palette image with `colors` distinct entries scattered by a fixed LCG.
Image Scattered(int width, int height, int colors) {
    Image image;
    image.width = width;
    image.height = height;
    image.channels = 3;
    image.pixels.resize(static_cast<std::size_t>(width * height * 3));
    std::uint32_t state = 12345;
    for (int i = 0; i < width * height; ++i) {
        state = state * 1103515245u + 12345u;
        int color = static_cast<int>((state >> 16) % static_cast<std::uint32_t>(colors));
        image.pixels[static_cast<std::size_t>(i * 3)] = static_cast<std::uint8_t>(color);
        image.pixels[static_cast<std::size_t>(i * 3 + 1)] = static_cast<std::uint8_t>(255 - color);
        image.pixels[static_cast<std::size_t>(i * 3 + 2)] = static_cast<std::uint8_t>(color * 7);
    }
    return image;
}

bool StartsWith(const Bytes& data, const char* magic, std::size_t len) {
    return data.size() >= len && std::memcmp(data.data(), magic, len) == 0;
}

void PutLe(Bytes& out, std::uint32_t value, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

// 2x2 24-bit bottom-up BMP: red, green / blue, white.
Bytes HandMadeBmp() {
    const std::uint8_t rows[2][8] = {
        {0xFF, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0, 0},  // bottom row: blue, white (BGR)
        {0x00, 0x00, 0xFF, 0x00, 0xFF, 0x00, 0, 0},  // top row: red, green (BGR)
    };
    Bytes out = {'B', 'M'};
    PutLe(out, 14 + 40 + 16, 4);
    PutLe(out, 0, 4);
    PutLe(out, 14 + 40, 4);
    PutLe(out, 40, 4);
    PutLe(out, 2, 4);
    PutLe(out, 2, 4);
    PutLe(out, 1, 2);
    PutLe(out, 24, 2);
    PutLe(out, 0, 4);
    PutLe(out, 16, 4);
    PutLe(out, 2835, 4);
    PutLe(out, 2835, 4);
    PutLe(out, 0, 4);
    PutLe(out, 0, 4);
    for (const auto& row : rows) {
        out.insert(out.end(), row, row + 8);
    }
    return out;
}

// GIF logical screen that claims side x side pixels but carries no image data.
Bytes OversizedGifHeader(std::uint32_t side) {
    Bytes out = {'G', 'I', 'F', '8', '9', 'a'};
    PutLe(out, side, 2);
    PutLe(out, side, 2);
    out.push_back(0x00);
    out.push_back(0x00);
    out.push_back(0x00);
    out.push_back(0x3B);
    return out;
}

// Pixels expanded to RGBA so images decoded with different channel counts compare.
Bytes ToRgba(const Image& image) {
    const std::size_t count = static_cast<std::size_t>(image.width * image.height);
    Bytes out(count * 4);
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint8_t* px = &image.pixels[i * static_cast<std::size_t>(image.channels)];
        const bool grey = image.channels < 3;
        out[i * 4] = px[0];
        out[i * 4 + 1] = grey ? px[0] : px[1];
        out[i * 4 + 2] = grey ? px[0] : px[2];
        out[i * 4 + 3] = image.channels == 2 ? px[1] : image.channels == 4 ? px[3] : 255;
    }
    return out;
}

bool SamePixels(const Image& a, const Image& b) {
    return a.width == b.width && a.height == b.height && ToRgba(a) == ToRgba(b);
}

bool RoundTripsExactly(const Image& source, const std::string& format) {
    auto encoded = stegbridge::image_codec::Encode(source, format);
    if (!encoded) {
        std::cout << "    encode failed: " << encoded.error().message << std::endl;
        return false;
    }
    auto decoded = stegbridge::image_codec::Decode(encoded.value());
    if (!decoded) {
        std::cout << "    decode failed: " << decoded.error().message << std::endl;
        return false;
    }
    auto again = stegbridge::image_codec::Encode(decoded.value());
    if (!again) {
        return false;
    }
    auto redecoded = stegbridge::image_codec::Decode(again.value());
    return redecoded && SamePixels(redecoded.value(), decoded.value()) && SamePixels(decoded.value(), source)
           && redecoded.value().format == decoded.value().format;
}

bool IsDecodeError(const Bytes& blob) {
    auto result = stegbridge::image_codec::Decode(blob);
    return !result && result.error().kind == stegbridge::ErrorKind::DecodeError;
}

}  // namespace

int main() {
    using namespace stegbridge::image_codec;

    std::cout << "Format detection:" << std::endl;
    Expect(DetectFormat(Bytes{0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'}) == "png", "png signature");
    Expect(DetectFormat(Bytes{0xFF, 0xD8, 0xFF, 0xE0}) == "jpeg", "jpeg signature");
    Expect(DetectFormat(Bytes{'G', 'I', 'F', '8', '7', 'a'}) == "gif", "gif87a signature");
    Expect(DetectFormat(Bytes{'B', 'M', 0, 0}) == "bmp", "bmp signature");
    Expect(DetectFormat(Bytes{'I', 'I', '*', 0}).empty(), "tiff is not recognised");
    Expect(NormalizeFormat("JPG") == "jpeg" && NormalizeFormat("Png") == "png", "format aliases");

    std::cout << "\nLossless formats are pixel-identical after a second pass:" << std::endl;
    Expect(RoundTripsExactly(Pattern(10, 10, 3), "png"), "png rgb");
    Expect(RoundTripsExactly(Pattern(10, 10, 4), "png"), "png rgba");
    Expect(RoundTripsExactly(Pattern(7, 5, 1), "png"), "png grey");
    Expect(RoundTripsExactly(Pattern(9, 3, 3), "bmp"), "bmp rgb");
    Expect(RoundTripsExactly(Scattered(16, 16, 200), "gif"), "gif with 200 colors");
    Expect(RoundTripsExactly(Scattered(160, 120, 256), "gif"), "gif large enough to reset the LZW table");

    std::cout << "\nDetected format is the default target:" << std::endl;
    auto bmp = Decode(HandMadeBmp());
    Expect(bmp.ok(), "hand-made bmp decodes");
    if (bmp) {
        Expect(bmp.value().format == "bmp" && bmp.value().width == 2 && bmp.value().height == 2, "bmp 2x2");
        const Bytes& px = bmp.value().pixels;
        Expect(bmp.value().channels == 3 && px[0] == 0xFF && px[1] == 0 && px[2] == 0, "top-left is red");
        Expect(px[9] == 0xFF && px[10] == 0xFF && px[11] == 0xFF, "bottom-right is white");
        auto back = Encode(bmp.value());
        Expect(back.ok() && StartsWith(back.value(), "BM", 2), "re-encoded as bmp");
    }
    Image untagged = Pattern(4, 4, 3);
    auto fallback = Encode(untagged);
    Expect(fallback.ok() && StartsWith(fallback.value(), "\x89PNG", 4), "no detected format falls back to png");
    auto jpg = Encode(untagged, "jpg");
    Expect(jpg.ok() && StartsWith(jpg.value(), "\xFF\xD8\xFF", 3), "jpg alias writes jpeg");

    std::cout << "\nLossy formats stay decodable:" << std::endl;
    auto jpeg = Encode(Pattern(10, 10, 4), "jpeg");
    Expect(jpeg.ok(), "rgba to jpeg drops alpha");
    if (jpeg) {
        auto decoded = Decode(jpeg.value());
        Expect(decoded && decoded.value().format == "jpeg" && decoded.value().width == 10
                   && decoded.value().height == 10 && decoded.value().channels == 3,
               "jpeg decodes to 10x10 rgb");
    }

    std::cout << "\nGIF specifics:" << std::endl;
    auto many = Encode(Pattern(64, 64, 3), "gif");
    auto many_back = many ? Decode(many.value()) : Decode(Bytes{});
    Expect(many_back && many_back.value().width == 64 && many_back.value().height == 64,
           "more than 256 colors is quantized but decodable");
    auto clear = Encode(Pattern(6, 6, 4), "gif");
    auto clear_back = clear ? Decode(clear.value()) : Decode(Bytes{});
    Expect(clear_back && clear_back.value().channels == 4 && clear_back.value().pixels[3] == 255
               && clear_back.value().pixels[7] == 0,
           "transparent pixels survive");

    std::cout << "\nFailures:" << std::endl;
    Expect(IsDecodeError(Bytes{}), "empty input");
    Expect(IsDecodeError(Bytes{'h', 'e', 'l', 'l', 'o'}), "text is not an image");
    auto png = Encode(Pattern(10, 10, 3), "png");
    if (png) {
        Bytes truncated(png.value().begin(), png.value().begin() + 30);
        Expect(IsDecodeError(truncated), "truncated png");
    }
    auto huge = Decode(OversizedGifHeader(30000));
    Expect(!huge && huge.error().kind == stegbridge::ErrorKind::DecodeError
               && huge.error().message.find("too large") != std::string::npos,
           "30000x30000 gif header is refused before allocation");
    Expect(IsDecodeError(Bytes{0, 0, 2, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1, 0, 1, 0, 24, 0, 0, 0, 255}),
           "tga is outside the whitelist");
    auto unsupported = Encode(Pattern(2, 2, 3), "tiff");
    Expect(!unsupported && unsupported.error().kind == stegbridge::ErrorKind::EncodeError, "tiff target");
    Image broken = Pattern(2, 2, 3);
    broken.pixels.pop_back();
    Expect(!Encode(broken, "png"), "pixel buffer size mismatch");

    std::cout << "\n" << (g_failures == 0 ? "All checks passed" : "Failures: " + std::to_string(g_failures))
              << std::endl;
    return g_failures == 0 ? 0 : 1;
}
