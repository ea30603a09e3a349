#include "WebhookSink.h"
#include "../observability/Logging.h"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <stdexcept>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

namespace notify {

WebhookSink::WebhookSink(const std::string& url) {
    const std::string scheme = "http://";
    if (url.rfind(scheme, 0) != 0) throw std::invalid_argument("webhook url must start with http://: " + url);
    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    std::string hostport = slash == std::string::npos ? rest : rest.substr(0, slash);
    target_ = slash == std::string::npos ? std::string("/") : rest.substr(slash);
    size_t colon = hostport.rfind(':');
    if (colon == std::string::npos) {
        host_ = hostport;
        port_ = "80";
    } else {
        host_ = hostport.substr(0, colon);
        port_ = hostport.substr(colon + 1);
    }
    if (host_.empty() || port_.empty()) throw std::invalid_argument("webhook url has no host: " + url);
}

void WebhookSink::deliver(const Notification& n, std::chrono::milliseconds timeout) {
    asio::io_context ioc;
    asio::ip::tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    http::request<http::string_body> req{http::verb::post, target_, 11};
    req.set(http::field::host, host_);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::user_agent, "reminder-server");
    req.body() = to_json(n);
    req.prepare_payload();

    beast::flat_buffer buf;
    http::response<http::string_body> res;
    beast::error_code result_ec;
    std::string failed_step;
    bool done = false;

    auto finish = [&](const char* step, beast::error_code ec) {
        result_ec = ec;
        if (ec) failed_step = step;
        done = true;
    };

    // one deadline for the whole exchange, resolve included
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    resolver.async_resolve(host_, port_, [&](beast::error_code ec, asio::ip::tcp::resolver::results_type results) {
        if (ec) return finish("resolve", ec);
        stream.expires_at(deadline);
        stream.async_connect(results, [&](beast::error_code ec2, const asio::ip::tcp::endpoint&) {
            if (ec2) return finish("connect", ec2);
            http::async_write(stream, req, [&](beast::error_code ec3, std::size_t) {
                if (ec3) return finish("write", ec3);
                http::async_read(stream, buf, res, [&](beast::error_code ec4, std::size_t) {
                    finish("read", ec4);
                });
            });
        });
    });

    ioc.run_until(deadline);
    if (!done) {
        resolver.cancel();
        beast::error_code ignored;
        stream.socket().close(ignored);
        throw DeliveryError("webhook timed out");
    }
    if (result_ec) {
        if (result_ec == beast::error::timeout) throw DeliveryError("webhook " + failed_step + " timed out");
        throw DeliveryError("webhook " + failed_step + " failed: " + result_ec.message());
    }

    beast::error_code shut_ec;
    stream.socket().shutdown(asio::ip::tcp::socket::shutdown_both, shut_ec);

    int code = res.result_int();
    if (code < 200 || code >= 300) throw DeliveryError("webhook answered " + std::to_string(code));
    observability::log_debug("notification.webhook_ok", {{"event_id", int64_t(n.event_id)}, {"code", int64_t(code)}});
}

}
