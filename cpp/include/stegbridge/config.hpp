#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace stegbridge {

// Built once at startup and passed by const reference; never mutated afterwards.
struct ServiceConfig {
    std::string host;
    std::uint16_t port = 0;
    std::size_t max_content_length = 0;
    std::string index_path;
    std::string static_dir;
    bool debug = false;
    bool colors = true;
};

ServiceConfig DefaultConfig();

// Defaults overlaid with STEGBRIDGE_* environment variables.
ServiceConfig LoadConfigFromEnv();

}  // namespace stegbridge
