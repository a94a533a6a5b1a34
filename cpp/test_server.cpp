#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <limits>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "stegbridge/config.hpp"
#include "stegbridge/constants.hpp"
#include "stegbridge/log.hpp"
#include "stegbridge/router.hpp"
#include "stegbridge/server.hpp"

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

int g_failures = 0;

void Expect(bool condition, const std::string& label) {
    std::cout << "  " << label << ": " << (condition ? "ok" : "FAIL") << std::endl;
    if (!condition) {
        ++g_failures;
    }
}

// One client socket wired to ServeConnection running on its own thread.
class LoopbackConnection {
public:
    explicit LoopbackConnection(const stegbridge::Router& router) : client_(ioc_) {
        tcp::acceptor acceptor{ioc_, {net::ip::make_address("127.0.0.1"), 0}};
        client_.connect(acceptor.local_endpoint());
        tcp::socket served{ioc_};
        acceptor.accept(served);
        server_ = std::thread(&stegbridge::ServeConnection, std::move(served), std::cref(router));
    }

    ~LoopbackConnection() {
        beast::error_code ec;
        client_.shutdown(tcp::socket::shutdown_both, ec);
        client_.close(ec);
        if (server_.joinable()) {
            server_.join();
        }
    }

    LoopbackConnection(const LoopbackConnection&) = delete;
    LoopbackConnection& operator=(const LoopbackConnection&) = delete;

    void Send(const std::string& data) { net::write(client_, net::buffer(data)); }

    template <class Body>
    http::response<Body> Receive() {
        http::response_parser<Body> parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        http::read(client_, buffer_, parser);
        return parser.release();
    }

private:
    net::io_context ioc_;
    tcp::socket client_;
    beast::flat_buffer buffer_;
    std::thread server_;
};

std::string PostHead(const std::string& target, std::size_t content_length, const std::string& extra = {}) {
    return "POST " + target + " HTTP/1.1\r\n"
           "Host: localhost\r\n"
           "Content-Type: application/json\r\n"
           + extra + "Content-Length: " + std::to_string(content_length) + "\r\n\r\n";
}

// A download request padded with base64 'A's to exactly `size` bytes.
std::string DownloadBodyOfSize(std::size_t size) {
    const std::string open = "{\"image\":\"";
    const std::string close = "\"}";
    return open + std::string(size - open.size() - close.size(), 'A') + close;
}

std::string ErrorOf(const http::response<http::string_body>& res) {
    auto body = nlohmann::json::parse(res.body(), nullptr, false);
    if (!body.is_object()) {
        return {};
    }
    return body.value("error", std::string());
}

}  // namespace

int main() {
    stegbridge::log::SetLevel(stegbridge::log::Level::Error);

    stegbridge::ServiceConfig config = stegbridge::DefaultConfig();
    config.index_path = "does/not/exist/index.html";
    config.static_dir = "does/not/exist";
    const stegbridge::Router router(config);
    const std::size_t limit = stegbridge::constants::kMaxContentLength;

    try {
        std::cout << "Declared body one byte over the ceiling:" << std::endl;
        {
            LoopbackConnection conn(router);
            conn.Send(PostHead("/download_image", limit + 1));
            auto res = conn.Receive<http::string_body>();
            Expect(res.result() == http::status::payload_too_large, "status 413");
            Expect(ErrorOf(res) == "Request entity too large", "json error message");
            Expect(!res.keep_alive(), "connection is closed");
        }

        std::cout << "\nBody of exactly 16 MiB:" << std::endl;
        {
            const std::string body = DownloadBodyOfSize(limit);
            Expect(body.size() == limit, "request body is 16 MiB");
            LoopbackConnection conn(router);
            conn.Send(PostHead("/download_image", body.size()) + body);
            auto res = conn.Receive<http::string_body>();
            Expect(res.result() == http::status::ok, "status 200");
            auto content_type = res[http::field::content_type];
            Expect(std::string(content_type.data(), content_type.size()) == "image/png", "served as png");
            Expect(res.body().size() == (limit - 12) / 4 * 3, "decoded payload returned");
        }

        std::cout << "\nExpect: 100-Continue in mixed case:" << std::endl;
        {
            const std::string body = "{\"image\":\"Zm9v\"}";
            LoopbackConnection conn(router);
            conn.Send(PostHead("/download_image", body.size(), "Expect: 100-Continue\r\n"));
            auto interim = conn.Receive<http::empty_body>();
            Expect(interim.result() == http::status::continue_, "interim 100 before the body");
            conn.Send(body);
            auto res = conn.Receive<http::string_body>();
            Expect(res.result() == http::status::ok && res.body() == "foo", "final response after the body");
        }
    } catch (const std::exception& e) {
        std::cout << "  unexpected exception: " << e.what() << std::endl;
        ++g_failures;
    }

    std::cout << "\n" << (g_failures == 0 ? "All checks passed" : "Failures: " + std::to_string(g_failures))
              << std::endl;
    return g_failures == 0 ? 0 : 1;
}
