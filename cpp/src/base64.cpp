#include "stegbridge/base64.hpp"

#include <array>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace stegbridge::base64 {

namespace {

constexpr char kEncTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::uint8_t kInvalid = 0xFF;

std::array<std::uint8_t, 256> BuildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    table.fill(kInvalid);
    for (std::size_t i = 0; i < 64; ++i) {
        table[static_cast<std::uint8_t>(kEncTable[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

const std::array<std::uint8_t, 256> kDecTable = BuildDecodeTable();

std::string DescribeChar(unsigned char c) {
    if (std::isprint(c)) {
        return std::string("'") + static_cast<char>(c) + "'";
    }
    static const char kHex[] = "0123456789abcdef";
    return std::string("0x") + kHex[c >> 4] + kHex[c & 0x0F];
}

std::vector<std::uint8_t> Fail(bool* ok, std::string* reason, std::string message) {
    if (ok) {
        *ok = false;
    }
    if (reason) {
        *reason = std::move(message);
    }
    return {};
}

}  // namespace

std::string Encode(const std::vector<std::uint8_t>& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    std::size_t i = 0;
    while (i + 2 < data.size()) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                               | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                               | static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kEncTable[(triple >> 18) & 0x3F]);
        out.push_back(kEncTable[(triple >> 12) & 0x3F]);
        out.push_back(kEncTable[(triple >> 6) & 0x3F]);
        out.push_back(kEncTable[triple & 0x3F]);
        i += 3;
    }
    if (i < data.size()) {
        std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(kEncTable[(triple >> 18) & 0x3F]);
        if (i + 1 < data.size()) {
            triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
            out.push_back(kEncTable[(triple >> 12) & 0x3F]);
            out.push_back(kEncTable[(triple >> 6) & 0x3F]);
            out.push_back('=');
        } else {
            out.push_back(kEncTable[(triple >> 12) & 0x3F]);
            out.push_back('=');
            out.push_back('=');
        }
    }
    return out;
}

std::vector<std::uint8_t> Decode(const std::string& input, bool* ok, std::string* reason) {
    std::string symbols;
    symbols.reserve(input.size());
    for (unsigned char c : input) {
        if (std::isspace(c)) {
            continue;
        }
        if (c != '=' && kDecTable[c] == kInvalid) {
            return Fail(ok, reason, "Invalid character " + DescribeChar(c) + " in base64 data");
        }
        symbols.push_back(static_cast<char>(c));
    }
    if (symbols.size() % 4 != 0) {
        return Fail(ok, reason, "Incorrect padding");
    }

    std::vector<std::uint8_t> out;
    out.reserve((symbols.size() / 4) * 3);
    for (std::size_t i = 0; i < symbols.size(); i += 4) {
        const bool last = i + 4 == symbols.size();
        std::size_t pad = 0;
        if (symbols[i + 3] == '=') {
            pad = symbols[i + 2] == '=' ? 2 : 1;
        }
        if (pad > 0 && !last) {
            return Fail(ok, reason, "Padding before end of base64 data");
        }
        for (std::size_t j = 0; j < 4 - pad; ++j) {
            if (symbols[i + j] == '=') {
                return Fail(ok, reason, "Incorrect padding");
            }
        }
        std::uint32_t quad = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            std::uint8_t v = symbols[i + j] == '=' ? 0 : kDecTable[static_cast<unsigned char>(symbols[i + j])];
            quad = (quad << 6) | v;
        }
        out.push_back(static_cast<std::uint8_t>((quad >> 16) & 0xFF));
        if (pad < 2) {
            out.push_back(static_cast<std::uint8_t>((quad >> 8) & 0xFF));
        }
        if (pad < 1) {
            out.push_back(static_cast<std::uint8_t>(quad & 0xFF));
        }
    }
    if (ok) {
        *ok = true;
    }
    return out;
}

}  // namespace stegbridge::base64
