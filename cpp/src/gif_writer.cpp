#include "stegbridge/gif_writer.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace stegbridge::gif_writer {

namespace {

constexpr int kMinCodeSize = 8;
constexpr int kPaletteSize = 256;
constexpr std::uint32_t kMaxLzwCode = 4095;
constexpr std::size_t kMaxSubBlock = 255;
constexpr std::uint8_t kAlphaThreshold = 128;
constexpr int kCubeLevels = 6;

struct Rgba {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;
};

struct Indexed {
    std::array<std::uint8_t, kPaletteSize * 3> palette{};
    std::vector<std::uint8_t> indices;
    bool has_transparency = false;
    std::uint8_t transparent_index = 0;
};

void PutU16(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
}

Rgba PixelAt(const Bytes& pixels, std::size_t i, int channels) {
    const std::uint8_t* p = pixels.data() + i * static_cast<std::size_t>(channels);
    Rgba px;
    switch (channels) {
        case 1:
            px.r = px.g = px.b = p[0];
            break;
        case 2:
            px.r = px.g = px.b = p[0];
            px.a = p[1];
            break;
        case 3:
            px.r = p[0];
            px.g = p[1];
            px.b = p[2];
            break;
        default:
            px.r = p[0];
            px.g = p[1];
            px.b = p[2];
            px.a = p[3];
            break;
    }
    return px;
}

std::uint32_t RgbKey(const Rgba& px) {
    return (static_cast<std::uint32_t>(px.r) << 16) | (static_cast<std::uint32_t>(px.g) << 8) | px.b;
}

std::uint8_t CubeLevel(std::uint8_t value) {
    return static_cast<std::uint8_t>((static_cast<int>(value) * (kCubeLevels - 1) + 127) / 255);
}

Indexed BuildIndexed(int width, int height, int channels, const Bytes& pixels) {
    const std::size_t count = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    std::vector<Rgba> rgba(count);
    std::unordered_map<std::uint32_t, std::uint8_t> exact;
    bool transparent = false;
    bool overflow = false;
    for (std::size_t i = 0; i < count; ++i) {
        rgba[i] = PixelAt(pixels, i, channels);
        if (rgba[i].a < kAlphaThreshold) {
            transparent = true;
            continue;
        }
        if (!overflow && exact.find(RgbKey(rgba[i])) == exact.end()) {
            if (exact.size() >= static_cast<std::size_t>(kPaletteSize)) {
                overflow = true;
            } else {
                exact.emplace(RgbKey(rgba[i]), static_cast<std::uint8_t>(exact.size()));
            }
        }
    }
    // One slot is reserved for the transparent index.
    if (transparent && exact.size() >= static_cast<std::size_t>(kPaletteSize)) {
        overflow = true;
    }

    Indexed out;
    out.indices.resize(count);
    out.has_transparency = transparent;
    if (!overflow) {
        for (const auto& entry : exact) {
            std::size_t slot = static_cast<std::size_t>(entry.second) * 3;
            out.palette[slot] = static_cast<std::uint8_t>((entry.first >> 16) & 0xFF);
            out.palette[slot + 1] = static_cast<std::uint8_t>((entry.first >> 8) & 0xFF);
            out.palette[slot + 2] = static_cast<std::uint8_t>(entry.first & 0xFF);
        }
        out.transparent_index = static_cast<std::uint8_t>(exact.size());
        for (std::size_t i = 0; i < count; ++i) {
            out.indices[i] = rgba[i].a < kAlphaThreshold ? out.transparent_index : exact[RgbKey(rgba[i])];
        }
        return out;
    }

    for (int r = 0; r < kCubeLevels; ++r) {
        for (int g = 0; g < kCubeLevels; ++g) {
            for (int b = 0; b < kCubeLevels; ++b) {
                std::size_t slot = static_cast<std::size_t>((r * kCubeLevels + g) * kCubeLevels + b) * 3;
                out.palette[slot] = static_cast<std::uint8_t>(r * 255 / (kCubeLevels - 1));
                out.palette[slot + 1] = static_cast<std::uint8_t>(g * 255 / (kCubeLevels - 1));
                out.palette[slot + 2] = static_cast<std::uint8_t>(b * 255 / (kCubeLevels - 1));
            }
        }
    }
    out.transparent_index = static_cast<std::uint8_t>(kCubeLevels * kCubeLevels * kCubeLevels);
    for (std::size_t i = 0; i < count; ++i) {
        if (rgba[i].a < kAlphaThreshold) {
            out.indices[i] = out.transparent_index;
            continue;
        }
        out.indices[i] = static_cast<std::uint8_t>(
            (CubeLevel(rgba[i].r) * kCubeLevels + CubeLevel(rgba[i].g)) * kCubeLevels + CubeLevel(rgba[i].b));
    }
    return out;
}

// LSB-first bit packer for LZW codes.
class BitWriter {
public:
    void Put(std::uint32_t code, int bits) {
        accumulator_ |= code << used_;
        used_ += bits;
        while (used_ >= 8) {
            bytes_.push_back(static_cast<std::uint8_t>(accumulator_ & 0xFF));
            accumulator_ >>= 8;
            used_ -= 8;
        }
    }

    Bytes Finish() {
        if (used_ > 0) {
            bytes_.push_back(static_cast<std::uint8_t>(accumulator_ & 0xFF));
            accumulator_ = 0;
            used_ = 0;
        }
        return std::move(bytes_);
    }

private:
    Bytes bytes_;
    std::uint32_t accumulator_ = 0;
    int used_ = 0;
};

Bytes CompressLzw(const std::vector<std::uint8_t>& indices) {
    const std::uint32_t clear_code = 1u << kMinCodeSize;
    const std::uint32_t eoi_code = clear_code + 1;

    BitWriter writer;
    std::unordered_map<std::uint32_t, std::uint32_t> table;
    int code_size = kMinCodeSize + 1;
    std::uint32_t max_code = eoi_code;

    writer.Put(clear_code, code_size);
    if (indices.empty()) {
        writer.Put(eoi_code, code_size);
        return writer.Finish();
    }

    std::uint32_t current = indices[0];
    for (std::size_t i = 1; i < indices.size(); ++i) {
        const std::uint32_t next = indices[i];
        const std::uint32_t key = (current << 8) | next;
        auto it = table.find(key);
        if (it != table.end()) {
            current = it->second;
            continue;
        }
        writer.Put(current, code_size);
        table.emplace(key, ++max_code);
        if (max_code >= (1u << code_size)) {
            ++code_size;
        }
        if (max_code == kMaxLzwCode) {
            writer.Put(clear_code, code_size);
            table.clear();
            code_size = kMinCodeSize + 1;
            max_code = eoi_code;
        }
        current = next;
    }
    writer.Put(current, code_size);
    // The decoder adds one more table entry when it reads the final code, which can
    // widen its code size before it reaches the end-of-information code.
    const std::uint32_t decoder_next = max_code + 1;
    if (decoder_next <= kMaxLzwCode && (decoder_next & ((1u << code_size) - 1)) == 0) {
        ++code_size;
    }
    writer.Put(eoi_code, code_size);
    return writer.Finish();
}

}  // namespace

Bytes Write(int width, int height, int channels, const Bytes& pixels) {
    if (width <= 0 || height <= 0 || width > 0xFFFF || height > 0xFFFF) {
        throw std::runtime_error("GIF dimensions out of range: " + std::to_string(width) + "x"
                                 + std::to_string(height));
    }
    if (channels < 1 || channels > 4) {
        throw std::runtime_error("Unsupported channel count for GIF: " + std::to_string(channels));
    }
    const std::size_t expected = static_cast<std::size_t>(width) * static_cast<std::size_t>(height)
                                 * static_cast<std::size_t>(channels);
    if (pixels.size() != expected) {
        throw std::runtime_error("Pixel buffer does not match image dimensions");
    }

    Indexed indexed = BuildIndexed(width, height, channels, pixels);

    Bytes out;
    out.reserve(32 + indexed.palette.size() + indexed.indices.size());
    const char kHeader[] = "GIF89a";
    out.insert(out.end(), kHeader, kHeader + 6);

    // Logical screen descriptor: global table present, 8-bit color resolution, 256 entries.
    PutU16(out, static_cast<std::uint32_t>(width));
    PutU16(out, static_cast<std::uint32_t>(height));
    out.push_back(0xF7);
    out.push_back(0x00);
    out.push_back(0x00);
    out.insert(out.end(), indexed.palette.begin(), indexed.palette.end());

    if (indexed.has_transparency) {
        out.push_back(0x21);
        out.push_back(0xF9);
        out.push_back(0x04);
        out.push_back(0x01);
        PutU16(out, 0);
        out.push_back(indexed.transparent_index);
        out.push_back(0x00);
    }

    out.push_back(0x2C);
    PutU16(out, 0);
    PutU16(out, 0);
    PutU16(out, static_cast<std::uint32_t>(width));
    PutU16(out, static_cast<std::uint32_t>(height));
    out.push_back(0x00);

    out.push_back(static_cast<std::uint8_t>(kMinCodeSize));
    Bytes lzw = CompressLzw(indexed.indices);
    for (std::size_t offset = 0; offset < lzw.size(); offset += kMaxSubBlock) {
        std::size_t len = std::min(kMaxSubBlock, lzw.size() - offset);
        out.push_back(static_cast<std::uint8_t>(len));
        out.insert(out.end(), lzw.begin() + static_cast<std::ptrdiff_t>(offset),
                   lzw.begin() + static_cast<std::ptrdiff_t>(offset + len));
    }
    out.push_back(0x00);
    out.push_back(0x3B);
    return out;
}

}  // namespace stegbridge::gif_writer
