#include "stegbridge/handlers.hpp"

#include "stegbridge/constants.hpp"
#include "stegbridge/datauri.hpp"
#include "stegbridge/format_policy.hpp"
#include "stegbridge/image_codec.hpp"
#include "stegbridge/log.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace stegbridge::handlers {

namespace {

constexpr const char* kProcessingPrefix = "Error processing image: ";
constexpr const char* kDownloadPrefix = "Error downloading image: ";

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

Error Processing(const char* prefix, const std::string& cause) {
    std::string message = std::string(prefix) + cause;
    log::Error(message);
    return MakeError(ErrorKind::ProcessingError, message);
}

// The tag ends up in Content-Type and as the bare Content-Disposition filename. Controls and
// whitespace would split the header; '"' and ';' would start a new parameter.
bool IsHeaderSafe(const std::string& tag) {
    return std::none_of(tag.begin(), tag.end(), [](unsigned char ch) {
        return ch <= 0x20 || ch == 0x7F || ch == '"' || ch == ';';
    });
}

}  // namespace

Result<EncodedPayload> ProcessImage(const std::optional<FilePart>& file) {
    if (!file) {
        return MakeError(ErrorKind::NoFilePart, "No file part");
    }
    if (file->filename.empty()) {
        return MakeError(ErrorKind::NoFileSelected, "No selected file");
    }
    if (!format_policy::IsAllowed(file->filename)) {
        log::Debug("Rejected upload with disallowed name: " + file->filename);
        return MakeError(ErrorKind::FileTypeNotAllowed, "File type not allowed");
    }

    auto decoded = image_codec::Decode(file->data);
    if (!decoded) {
        return Processing(kProcessingPrefix, decoded.error().message);
    }
    const image_codec::Image& image = decoded.value();
    log::Debug("Decoded " + file->filename + " as " + image.format + " " + std::to_string(image.width) + "x"
               + std::to_string(image.height) + " (" + std::to_string(image.channels) + " channels)");

    auto encoded = image_codec::Encode(image);
    if (!encoded) {
        return Processing(kProcessingPrefix, encoded.error().message);
    }

    EncodedPayload payload;
    payload.image = datauri::ToBase64(encoded.value());
    payload.format = ToLower(image.format.empty() ? std::string(constants::kDefaultFormat) : image.format);
    payload.size = std::to_string(image.width) + "x" + std::to_string(image.height);
    return payload;
}

Result<DownloadResult> DownloadImage(const std::optional<DownloadRequest>& request) {
    if (!request) {
        return MakeError(ErrorKind::NoImageData, "No image data received");
    }

    auto decoded = datauri::FromFramed(request->image);
    if (!decoded) {
        return Processing(kDownloadPrefix, decoded.error().message);
    }

    std::string format = request->format.value_or(std::string());
    if (format.empty()) {
        format = std::string(constants::kDefaultFormat);
    }
    if (!IsHeaderSafe(format)) {
        return Processing(kDownloadPrefix, "invalid format tag");
    }

    DownloadResult result;
    result.data = std::move(decoded.value());
    result.mime_type = image_codec::MimeTypeFor(format);
    result.filename = std::string(constants::kDownloadBasename) + "." + format;
    result.format = std::move(format);
    return result;
}

}  // namespace stegbridge::handlers
