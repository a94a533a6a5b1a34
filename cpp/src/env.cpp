#include "stegbridge/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace stegbridge::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Get(name);
    if (value.empty()) {
        return default_value;
    }
    value = ToLower(value);
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::optional<std::uint64_t> GetUnsigned(std::string_view name) {
    std::string raw = Get(name);
    if (raw.empty()) {
        return std::nullopt;
    }
    if (!std::all_of(raw.begin(), raw.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        throw std::runtime_error("Invalid numeric value for " + std::string(name) + ": " + raw);
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(raw));
    } catch (const std::exception&) {
        throw std::runtime_error("Numeric value out of range for " + std::string(name) + ": " + raw);
    }
}

}  // namespace stegbridge::env
