#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "stegbridge/config.hpp"

namespace stegbridge {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

Response MakeJsonResponse(http::status status, const nlohmann::json& body, unsigned version, bool keep_alive);
Response MakeErrorResponse(http::status status, const std::string& message, unsigned version, bool keep_alive);

// Explicit (method, path) dispatch table. Holds only the immutable configuration, so
// one instance can serve any number of connections concurrently.
class Router {
public:
    explicit Router(ServiceConfig config);

    Response Handle(const Request& req) const;

    const ServiceConfig& config() const { return config_; }

private:
    using Handler = Response (Router::*)(const Request&) const;

    struct Route {
        http::verb method;
        std::string_view path;
        bool prefix;
        Handler handler;
    };

    Response Dispatch(const Request& req) const;
    Response HandleIndex(const Request& req) const;
    Response HandleStatic(const Request& req) const;
    Response HandleProcessImage(const Request& req) const;
    Response HandleDownloadImage(const Request& req) const;
    Response NotFound(const Request& req) const;

    std::string IndexPage() const;

    ServiceConfig config_;
    std::vector<Route> routes_;
};

}  // namespace stegbridge
