#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stegbridge::multipart {

struct FormPart {
    std::string name;
    // Present only for file fields; may be an empty string when the browser sent
    // a file input with nothing selected.
    std::optional<std::string> filename;
    std::string content_type;
    std::string data;
};

// Extracts the boundary parameter from a multipart/form-data Content-Type.
// Throws std::runtime_error when the type is not multipart/form-data or has no boundary.
std::string BoundaryFrom(std::string_view content_type);

// Throws std::runtime_error on a malformed body.
std::vector<FormPart> Parse(std::string_view body, std::string_view content_type);

// First part named `field` that carries a filename, or nullptr.
const FormPart* FindFile(const std::vector<FormPart>& parts, std::string_view field);

}  // namespace stegbridge::multipart
