#include "stegbridge/multipart.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace stegbridge::multipart {

namespace {

std::string ToLower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return out;
}

std::string_view Trim(std::string_view value) {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) {
        value.remove_suffix(1);
    }
    return value;
}

std::string Unquote(std::string_view value) {
    value = Trim(value);
    if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
        return std::string(value);
    }
    std::string out;
    out.reserve(value.size() - 2);
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
        if (value[i] == '\\' && i + 2 < value.size()) {
            ++i;
        }
        out.push_back(value[i]);
    }
    return out;
}

struct HeaderParams {
    std::string value;
    std::vector<std::pair<std::string, std::string>> params;
};

// Splits `form-data; name="a"; filename="b;c"` on semicolons outside quotes.
HeaderParams ParseParams(std::string_view header) {
    HeaderParams out;
    std::vector<std::string_view> pieces;
    bool in_quotes = false;
    std::size_t start = 0;
    for (std::size_t i = 0; i < header.size(); ++i) {
        char ch = header[i];
        if (ch == '\\' && in_quotes) {
            ++i;
            continue;
        }
        if (ch == '"') {
            in_quotes = !in_quotes;
        } else if (ch == ';' && !in_quotes) {
            pieces.push_back(header.substr(start, i - start));
            start = i + 1;
        }
    }
    pieces.push_back(header.substr(start));

    out.value = ToLower(Trim(pieces.front()));
    for (std::size_t i = 1; i < pieces.size(); ++i) {
        std::string_view piece = Trim(pieces[i]);
        std::size_t eq = piece.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        out.params.emplace_back(ToLower(Trim(piece.substr(0, eq))), Unquote(piece.substr(eq + 1)));
    }
    return out;
}

std::optional<std::string> FindParam(const HeaderParams& header, std::string_view key) {
    for (const auto& param : header.params) {
        if (param.first == key) {
            return param.second;
        }
    }
    return std::nullopt;
}

// Position just past the line ending that starts at `pos`, accepting CRLF or LF.
std::size_t SkipLineEnd(std::string_view body, std::size_t pos) {
    if (body.compare(pos, 2, "\r\n") == 0) {
        return pos + 2;
    }
    if (pos < body.size() && body[pos] == '\n') {
        return pos + 1;
    }
    throw std::runtime_error("Malformed multipart body: expected line break after boundary");
}

FormPart ParseHeaders(std::string_view block) {
    FormPart part;
    bool has_disposition = false;
    std::size_t pos = 0;
    while (pos < block.size()) {
        std::size_t eol = block.find('\n', pos);
        std::string_view line = block.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        pos = eol == std::string_view::npos ? block.size() : eol + 1;
        line = Trim(line);
        if (line.empty()) {
            continue;
        }
        std::size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            throw std::runtime_error("Malformed multipart header line");
        }
        std::string name = ToLower(Trim(line.substr(0, colon)));
        std::string_view value = Trim(line.substr(colon + 1));
        if (name == "content-disposition") {
            HeaderParams disposition = ParseParams(value);
            if (disposition.value != "form-data") {
                throw std::runtime_error("Unsupported content disposition: " + disposition.value);
            }
            part.name = FindParam(disposition, "name").value_or(std::string());
            part.filename = FindParam(disposition, "filename");
            has_disposition = true;
        } else if (name == "content-type") {
            part.content_type = std::string(value);
        }
    }
    if (!has_disposition) {
        throw std::runtime_error("Multipart part without Content-Disposition");
    }
    return part;
}

}  // namespace

std::string BoundaryFrom(std::string_view content_type) {
    HeaderParams header = ParseParams(content_type);
    if (header.value != "multipart/form-data") {
        throw std::runtime_error("Expected multipart/form-data, got: "
                                 + (header.value.empty() ? std::string("<none>") : header.value));
    }
    auto boundary = FindParam(header, "boundary");
    if (!boundary || boundary->empty()) {
        throw std::runtime_error("Missing multipart boundary");
    }
    return *boundary;
}

std::vector<FormPart> Parse(std::string_view body, std::string_view content_type) {
    const std::string delimiter = "--" + BoundaryFrom(content_type);

    std::vector<FormPart> parts;
    std::size_t pos = body.find(delimiter);
    if (pos == std::string_view::npos) {
        throw std::runtime_error("Malformed multipart body: boundary not found");
    }
    pos += delimiter.size();

    while (true) {
        if (body.compare(pos, 2, "--") == 0) {
            return parts;
        }
        pos = SkipLineEnd(body, pos);

        std::size_t headers_end = body.find("\r\n\r\n", pos);
        std::size_t data_start = headers_end == std::string_view::npos ? std::string_view::npos : headers_end + 4;
        if (headers_end == std::string_view::npos) {
            headers_end = body.find("\n\n", pos);
            data_start = headers_end == std::string_view::npos ? std::string_view::npos : headers_end + 2;
        }
        if (headers_end == std::string_view::npos) {
            throw std::runtime_error("Malformed multipart body: unterminated part headers");
        }
        FormPart part = ParseHeaders(body.substr(pos, headers_end - pos));

        // The line break before a boundary belongs to the boundary, not to the data.
        std::size_t data_end = body.find("\r\n" + delimiter, data_start);
        std::size_t next = data_end == std::string_view::npos ? data_end : data_end + 2;
        if (data_end == std::string_view::npos) {
            data_end = body.find("\n" + delimiter, data_start);
            next = data_end == std::string_view::npos ? data_end : data_end + 1;
        }
        if (data_end == std::string_view::npos) {
            throw std::runtime_error("Malformed multipart body: missing closing boundary");
        }
        part.data.assign(body.substr(data_start, data_end - data_start));
        parts.push_back(std::move(part));
        pos = next + delimiter.size();
    }
}

const FormPart* FindFile(const std::vector<FormPart>& parts, std::string_view field) {
    for (const auto& part : parts) {
        if (part.name == field && part.filename.has_value()) {
            return &part;
        }
    }
    return nullptr;
}

}  // namespace stegbridge::multipart
