#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "../observability/Metrics.h"
#include "../observability/Logging.h"
#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

namespace {

// per-id paths share one label
std::string metrics_path(const std::string& path) {
    const std::string events = "/events/";
    if (path.size() > events.size() && path.compare(0, events.size(), events) == 0) return "/events/:id";
    return path;
}

}

struct Session : std::enable_shared_from_this<Session> {
    net::ip::tcp::socket socket;
    beast::flat_buffer buffer;
    net::steady_timer read_timer;
    Router& router;
    unsigned http_version = 11;
    Request req;
    bool draining_ = false;
    std::array<char, 4096> drain_buf_{};
    int drain_seconds_ = 5;
    std::chrono::steady_clock::time_point start_ts;
    bool metrics_enabled;
    bool access_log;

    Session(net::ip::tcp::socket&& s, Router& r, bool me, bool al)
        : socket(std::move(s)), buffer(), read_timer(socket.get_executor()), router(r), metrics_enabled(me), access_log(al) {}

    void run() { do_read(); }

    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;
        auto parser = std::make_shared<http::request_parser<http::string_body>>();
        parser->header_limit(8 * 1024);
        parser->body_limit(64 * 1024);

        read_timer.expires_after(std::chrono::seconds(5));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });

        http::async_read_header(socket, buffer, *parser, [self, parser](beast::error_code ec, std::size_t) {
            boost::system::error_code ignored_cancel; self->read_timer.cancel(ignored_cancel);
            if (ec) {
                if (ec == http::error::end_of_stream) { self->close_socket(); return; }
                if (ec == http::error::header_limit) {
                    self->reply_json_error(http::status::request_header_fields_too_large, "{\"error\":\"header_too_large\"}", "(header)");
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version ||
                    ec == http::error::bad_field) {
                    self->reply_json_error(http::status::bad_request, "{\"error\":\"bad_request\"}", "(parse)");
                    return;
                }
                self->close_socket();
                return;
            }
            self->http_version = parser->get().version();

            auto len = parser->content_length();
            if (len && *len > 64 * 1024) {
                observability::log_info("http.oversized_body", {{"len", int64_t(*len)}});
                self->reply_json_error(http::status::payload_too_large, "{\"error\":\"body_too_large\"}", "(body)");
                return;
            }
            self->read_timer.expires_after(std::chrono::seconds(10));
            self->read_timer.async_wait([self](const boost::system::error_code& ec2) {
                if (!ec2) self->close_socket();
            });

            http::async_read(self->socket, self->buffer, *parser, [self, parser](beast::error_code ec2, std::size_t) {
                boost::system::error_code ignored_cancel2; self->read_timer.cancel(ignored_cancel2);
                if (ec2) {
                    if (ec2 == http::error::body_limit) {
                        self->reply_json_error(http::status::payload_too_large, "{\"error\":\"body_too_large\"}", "(body)");
                        return;
                    }
                    self->close_socket();
                    return;
                }
                self->req = parser->release();
                self->start_ts = std::chrono::steady_clock::now();
                self->handle_request();
            });
        });
    }

    void handle_request() {
        const std::string path = request_path(req);
        Response res;
        try {
            res = router.route(req);
        } catch (const std::exception& e) {
            observability::log_error("http.handler_error", {{"path", path}, {"err", std::string(e.what())}});
            res = make_json_response(http::status::internal_server_error, req, "{\"error\":\"internal\"}");
        }
        send_response(std::make_shared<Response>(std::move(res)), path);
    }

    void send_response(std::shared_ptr<Response> res, const std::string& path) {
        auto self = shared_from_this();
        if (res->find(http::field::connection) == res->end()) res->keep_alive(req.keep_alive());

        const std::string method(req.method_string());
        const int code = res->result_int();
        const double latency_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        if (metrics_enabled) {
            auto& m = observability::Metrics::instance();
            m.inc(metrics_path(path), method, code);
            m.observe_latency(metrics_path(path), method, latency_ms);
        }
        if (access_log) {
            observability::log_info("http.access", {{"method", method}, {"path", path}, {"code", int64_t(code)}, {"latency_ms", latency_ms}});
        }

        http::async_write(socket, *res, [self, res, path](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("http.write_error", {{"path", path}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            if (res->keep_alive()) self->do_read();
            else self->graceful_close_after_write();
        });
    }

    void close_socket(bool hard_shutdown = true) {
        boost::system::error_code ignored;
        read_timer.cancel(ignored);
        socket.cancel(ignored);
        if (hard_shutdown) socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    void start_drain_timer() {
        auto self = shared_from_this();
        boost::system::error_code ignored;
        read_timer.cancel(ignored);
        read_timer.expires_after(std::chrono::seconds(drain_seconds_));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (ec) return;
            self->close_socket(false);
        });
    }

    // read and discard until the peer closes, so the reply is not reset by unread input
    void do_drain_read() {
        auto self = shared_from_this();
        socket.async_read_some(net::buffer(drain_buf_), [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec == net::error::operation_aborted) return;
                boost::system::error_code ignored;
                self->read_timer.cancel(ignored);
                self->close_socket(false);
                return;
            }
            self->do_drain_read();
        });
    }

    void graceful_close_after_write() {
        if (draining_) return;
        draining_ = true;
        boost::system::error_code ignored;
        socket.shutdown(net::ip::tcp::socket::shutdown_send, ignored);
        start_drain_timer();
        do_drain_read();
    }

    void reply_json_error(http::status st, const std::string& body, const std::string& path) {
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, "application/json");
        res->set(http::field::connection, "close");
        res->keep_alive(false);
        res->body() = body;
        res->prepare_payload();
        auto self = shared_from_this();
        http::async_write(socket, *res, [self, res, path](boost::system::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("http.write_error", {{"path", path}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            self->graceful_close_after_write();
        });
    }
};

HttpServer::HttpServer(net::io_context& ioc, unsigned short port, Router& router, bool metrics_enabled, bool access_log)
    : ioc_(ioc), acceptor_(ioc, net::ip::tcp::endpoint(net::ip::address_v4::any(), port)), router_(router),
      metrics_enabled_(metrics_enabled), access_log_(access_log) {}

void HttpServer::run() { do_accept(); }

void HttpServer::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
}

unsigned short HttpServer::port() const {
    boost::system::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (!ec) {
            auto s = std::make_shared<Session>(std::move(socket), router_, metrics_enabled_, access_log_);
            s->run();
        } else observability::log_warn("http.accept_error", {{"err", int64_t(ec.value())}});
        do_accept();
    });
}
