#include "stegbridge/router.hpp"

#include "stegbridge/constants.hpp"
#include "stegbridge/handlers.hpp"
#include "stegbridge/log.hpp"
#include "stegbridge/multipart.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace stegbridge {

namespace {

constexpr const char* kFallbackIndex =
    "<!DOCTYPE html>\n"
    "<html><head><meta charset=\"utf-8\"><title>Steganography Tool</title></head>\n"
    "<body><h1>Steganography Tool</h1>\n"
    "<p>POST an image to <code>/process_image</code> or a base64 payload to "
    "<code>/download_image</code>.</p></body></html>\n";

std::string ToStd(boost::beast::string_view value) {
    return std::string(value.data(), value.size());
}

std::string PathOf(const Request& req) {
    std::string target = ToStd(req.target());
    std::size_t query = target.find_first_of("?#");
    if (query != std::string::npos) {
        target.resize(query);
    }
    return target;
}

std::optional<std::string> ReadTextFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

std::string StaticContentType(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (ext == ".js") return "application/javascript";
    if (ext == ".css") return "text/css";
    if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
    if (ext == ".json") return "application/json";
    if (ext == ".svg") return "image/svg+xml";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    if (ext == ".ico") return "image/x-icon";
    return "application/octet-stream";
}

Response MakeBody(http::status status, std::string content_type, std::string body, unsigned version,
                  bool keep_alive) {
    Response res{status, version};
    res.set(http::field::server, std::string(constants::kServerName));
    res.set(http::field::content_type, std::move(content_type));
    res.keep_alive(keep_alive);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

Response FromError(const Error& error, const Request& req) {
    return MakeErrorResponse(static_cast<http::status>(HttpStatusFor(error.kind)), error.message,
                             req.version(), req.keep_alive());
}

}  // namespace

Response MakeJsonResponse(http::status status, const nlohmann::json& body, unsigned version, bool keep_alive) {
    return MakeBody(status, "application/json", body.dump(), version, keep_alive);
}

Response MakeErrorResponse(http::status status, const std::string& message, unsigned version, bool keep_alive) {
    return MakeJsonResponse(status, nlohmann::json{{"error", message}}, version, keep_alive);
}

Router::Router(ServiceConfig config)
    : config_(std::move(config)),
      routes_{
          {http::verb::get, "/", false, &Router::HandleIndex},
          {http::verb::get, "/static/", true, &Router::HandleStatic},
          {http::verb::post, "/process_image", false, &Router::HandleProcessImage},
          {http::verb::post, "/download_image", false, &Router::HandleDownloadImage},
      } {}

Response Router::Handle(const Request& req) const {
    try {
        return Dispatch(req);
    } catch (const std::exception& exc) {
        log::Error("Unhandled error for " + ToStd(req.method_string()) + " " + ToStd(req.target()) + ": "
                   + exc.what());
        return MakeErrorResponse(http::status::internal_server_error, "Internal server error",
                                 req.version(), false);
    }
}

Response Router::Dispatch(const Request& req) const {
    const std::string path = PathOf(req);
    bool path_known = false;
    for (const auto& route : routes_) {
        bool matches = route.prefix ? path.compare(0, route.path.size(), route.path) == 0 : path == route.path;
        if (!matches) {
            continue;
        }
        path_known = true;
        if (req.method() == route.method) {
            return (this->*route.handler)(req);
        }
    }
    if (path_known) {
        return MakeErrorResponse(http::status::method_not_allowed, "Method not allowed",
                                 req.version(), req.keep_alive());
    }
    return NotFound(req);
}

std::string Router::IndexPage() const {
    if (auto page = ReadTextFile(config_.index_path)) {
        return *page;
    }
    log::Debug("Index page not found at " + config_.index_path + ", serving built-in page");
    return kFallbackIndex;
}

Response Router::HandleIndex(const Request& req) const {
    return MakeBody(http::status::ok, "text/html; charset=utf-8", IndexPage(), req.version(), req.keep_alive());
}

Response Router::HandleStatic(const Request& req) const {
    const std::string path = PathOf(req);
    std::filesystem::path relative(path.substr(std::string_view("/static/").size()));
    relative = relative.lexically_normal();
    if (relative.empty() || relative.is_absolute()
        || std::any_of(relative.begin(), relative.end(), [](const std::filesystem::path& part) {
               return part == "..";
           })) {
        return NotFound(req);
    }
    const std::filesystem::path full = std::filesystem::path(config_.static_dir) / relative;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(full, ec)) {
        return NotFound(req);
    }
    auto content = ReadTextFile(full);
    if (!content) {
        return NotFound(req);
    }
    return MakeBody(http::status::ok, StaticContentType(full), std::move(*content), req.version(),
                    req.keep_alive());
}

Response Router::HandleProcessImage(const Request& req) const {
    std::optional<handlers::FilePart> file;
    try {
        auto parts = multipart::Parse(req.body(), ToStd(req[http::field::content_type]));
        if (const auto* part = multipart::FindFile(parts, constants::kUploadField)) {
            handlers::FilePart upload;
            upload.filename = *part->filename;
            upload.data.assign(part->data.begin(), part->data.end());
            file = std::move(upload);
        }
    } catch (const std::runtime_error& exc) {
        // Without a readable form there is no file part; the handler reports that.
        log::Debug(std::string("Unreadable upload form: ") + exc.what());
    }

    auto result = handlers::ProcessImage(file);
    if (!result) {
        return FromError(result.error(), req);
    }
    const auto& payload = result.value();
    nlohmann::json body = {
        {"success", true},
        {"image", payload.image},
        {"format", payload.format},
        {"size", payload.size},
    };
    return MakeJsonResponse(http::status::ok, body, req.version(), req.keep_alive());
}

Response Router::HandleDownloadImage(const Request& req) const {
    std::optional<handlers::DownloadRequest> request;
    nlohmann::json body = nlohmann::json::parse(req.body(), nullptr, false);
    if (!body.is_discarded() && body.is_object()) {
        auto image = body.find("image");
        if (image != body.end()) {
            if (!image->is_string()) {
                std::string message = "Error downloading image: image field must be a string";
                log::Error(message);
                return FromError(MakeError(ErrorKind::ProcessingError, message), req);
            }
            handlers::DownloadRequest parsed;
            parsed.image = image->get<std::string>();
            auto format = body.find("format");
            if (format != body.end() && !format->is_null()) {
                parsed.format = format->is_string() ? format->get<std::string>() : format->dump();
            }
            request = std::move(parsed);
        }
    }

    auto result = handlers::DownloadImage(request);
    if (!result) {
        return FromError(result.error(), req);
    }
    const auto& download = result.value();
    Response res{http::status::ok, req.version()};
    res.set(http::field::server, std::string(constants::kServerName));
    res.set(http::field::content_type, download.mime_type);
    res.set(http::field::content_disposition, "attachment; filename=" + download.filename);
    res.keep_alive(req.keep_alive());
    res.body().assign(download.data.begin(), download.data.end());
    res.prepare_payload();
    return res;
}

Response Router::NotFound(const Request& req) const {
    return MakeBody(http::status::not_found, "text/html; charset=utf-8", IndexPage(), req.version(),
                    req.keep_alive());
}

}  // namespace stegbridge
