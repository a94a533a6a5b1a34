#include "stegbridge/config.hpp"

#include "stegbridge/constants.hpp"
#include "stegbridge/env.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace stegbridge {

ServiceConfig DefaultConfig() {
    ServiceConfig config;
    config.host = std::string(constants::kDefaultHost);
    config.port = constants::kDefaultPort;
    config.max_content_length = constants::kMaxContentLength;
    config.index_path = std::string(constants::kDefaultIndexPath);
    config.static_dir = std::string(constants::kDefaultStaticDir);
    return config;
}

ServiceConfig LoadConfigFromEnv() {
    ServiceConfig config = DefaultConfig();

    std::string host = env::Get("STEGBRIDGE_HOST");
    if (!host.empty()) {
        config.host = host;
    }
    if (auto port = env::GetUnsigned("STEGBRIDGE_PORT")) {
        if (*port == 0 || *port > std::numeric_limits<std::uint16_t>::max()) {
            throw std::runtime_error("STEGBRIDGE_PORT out of range: " + std::to_string(*port));
        }
        config.port = static_cast<std::uint16_t>(*port);
    }
    if (auto limit = env::GetUnsigned("STEGBRIDGE_MAX_BODY")) {
        if (*limit == 0) {
            throw std::runtime_error("STEGBRIDGE_MAX_BODY must be positive");
        }
        config.max_content_length = static_cast<std::size_t>(*limit);
    }
    std::string index = env::Get("STEGBRIDGE_INDEX");
    if (!index.empty()) {
        config.index_path = index;
    }
    std::string static_dir = env::Get("STEGBRIDGE_STATIC_DIR");
    if (!static_dir.empty()) {
        config.static_dir = static_dir;
    }
    config.debug = env::IsEnabled("STEGBRIDGE_DEBUG", false);
    // https://no-color.org: any non-empty value disables color.
    if (!env::Get("NO_COLOR").empty()) {
        config.colors = false;
    }
    return config;
}

}  // namespace stegbridge
