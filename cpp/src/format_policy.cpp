#include "stegbridge/format_policy.hpp"

#include "stegbridge/constants.hpp"

#include <algorithm>
#include <cctype>

namespace stegbridge::format_policy {

std::string ExtensionOf(const std::string& filename) {
    std::size_t dot = filename.rfind('.');
    if (dot == std::string::npos) {
        return {};
    }
    std::string ext = filename.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return ext;
}

bool IsAllowed(const std::string& filename) {
    if (filename.find('.') == std::string::npos) {
        return false;
    }
    const std::string ext = ExtensionOf(filename);
    return std::find(constants::kAllowedExtensions.begin(), constants::kAllowedExtensions.end(), ext)
           != constants::kAllowedExtensions.end();
}

}  // namespace stegbridge::format_policy
