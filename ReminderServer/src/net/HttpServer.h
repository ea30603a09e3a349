#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include "Router.h"

class HttpServer {
public:
    // port 0 binds an ephemeral port, see port()
    HttpServer(boost::asio::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log);
    void run();
    // stop accepting; open sessions finish their current exchange
    void stop();
    unsigned short port() const;
private:
    void do_accept();
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Router& router_;
    bool metrics_enabled_;
    bool access_log_;
};
