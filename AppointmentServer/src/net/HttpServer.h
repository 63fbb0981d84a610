#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <string>
#include "Router.h"

struct ServerOptions {
    bool metrics_enabled = true;
    bool access_log = true;
    // HS256 key for bearer tokens; requests without a valid token reach only open routes
    std::string jwt_secret;
};

class HttpServer {
public:
    // port 0 binds an ephemeral port; see local_port().
    HttpServer(boost::asio::io_context& ioc, unsigned short port, Router& router, ServerOptions options);
    void run();
    unsigned short local_port() const;
private:
    void do_accept();
    boost::asio::ip::tcp::acceptor acceptor_;
    Router& router_;
    std::shared_ptr<const ServerOptions> options_;
};
