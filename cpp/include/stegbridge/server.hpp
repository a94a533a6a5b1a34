#pragma once

#include "stegbridge/config.hpp"
#include "stegbridge/router.hpp"

#include <boost/asio/ip/tcp.hpp>

namespace stegbridge {

// Serves HTTP/1.1 requests on one connection until the peer closes it or a response
// requires closing. Bodies over the configured ceiling get a 413 and end the connection.
void ServeConnection(boost::asio::ip::tcp::socket socket, const Router& router);

// Blocking HTTP/1.1 listener. Each accepted connection is served on its own thread;
// requests share nothing but the immutable Router.
class Server {
public:
    explicit Server(ServiceConfig config);

    // Binds and serves until the process exits. Throws boost::system::system_error
    // when the address cannot be bound.
    void Run();

private:
    Router router_;
};

}  // namespace stegbridge
