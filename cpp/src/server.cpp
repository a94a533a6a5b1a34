#include "stegbridge/server.hpp"

#include "stegbridge/log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <functional>
#include <string>
#include <thread>
#include <utility>

namespace stegbridge {

namespace {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

std::string Describe(const tcp::socket& socket) {
    beast::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "<unknown>";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

void LogRequest(const std::string& peer, const Request& req, const Response& res) {
    log::Info(peer + " \"" + std::string(req.method_string().data(), req.method_string().size()) + " "
              + std::string(req.target().data(), req.target().size()) + "\" "
              + std::to_string(res.result_int()) + " " + std::to_string(res.body().size()));
}

}  // namespace

void ServeConnection(tcp::socket socket, const Router& router) {
    const std::string peer = Describe(socket);
    beast::error_code ec;
    beast::flat_buffer buffer;

    for (;;) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(router.config().max_content_length);

        http::read_header(socket, buffer, parser, ec);
        if (ec == http::error::end_of_stream) {
            break;
        }
        if (ec == http::error::body_limit) {
            // Content-Length alone already exceeds the ceiling; refuse before reading the body.
            log::Warn(peer + " request body exceeds " + std::to_string(router.config().max_content_length)
                      + " bytes");
            auto res = MakeErrorResponse(http::status::payload_too_large, "Request entity too large",
                                         parser.get().version(), false);
            http::write(socket, res, ec);
            break;
        }
        if (ec) {
            log::Debug(peer + " read error: " + ec.message());
            break;
        }

        if (beast::iequals(parser.get()[http::field::expect], "100-continue")) {
            http::response<http::empty_body> cont{http::status::continue_, parser.get().version()};
            http::write(socket, cont, ec);
            if (ec) {
                break;
            }
        }

        http::read(socket, buffer, parser, ec);
        if (ec == http::error::body_limit) {
            log::Warn(peer + " chunked request body exceeds " + std::to_string(router.config().max_content_length)
                      + " bytes");
            auto res = MakeErrorResponse(http::status::payload_too_large, "Request entity too large",
                                         parser.get().version(), false);
            http::write(socket, res, ec);
            break;
        }
        if (ec) {
            log::Debug(peer + " read error: " + ec.message());
            break;
        }

        Request req = parser.release();
        Response res = router.Handle(req);
        LogRequest(peer, req, res);

        const bool close = res.need_eof();
        http::write(socket, res, ec);
        if (ec) {
            log::Debug(peer + " write error: " + ec.message());
            break;
        }
        if (close) {
            break;
        }
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
}

Server::Server(ServiceConfig config) : router_(std::move(config)) {}

void Server::Run() {
    const ServiceConfig& config = router_.config();
    net::io_context ioc{1};
    const auto address = net::ip::make_address(config.host);
    tcp::acceptor acceptor{ioc, {address, config.port}};
    log::Info("Serving on http://" + config.host + ":" + std::to_string(config.port)
              + " (max body " + std::to_string(config.max_content_length) + " bytes)");

    for (;;) {
        tcp::socket socket{ioc};
        beast::error_code ec;
        acceptor.accept(socket, ec);
        if (ec) {
            log::Warn("accept failed: " + ec.message());
            continue;
        }
        std::thread(&ServeConnection, std::move(socket), std::cref(router_)).detach();
    }
}

}  // namespace stegbridge
