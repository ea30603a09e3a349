#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include "notify/WebhookSink.h"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

namespace {

// Accepts one connection and answers it with `status`; with answer=false it reads and then stalls.
struct OneShotServer {
    asio::io_context ioc;
    asio::ip::tcp::acceptor acceptor{ioc, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)};
    std::string seen_target;
    std::string seen_body;
    std::thread th;

    unsigned short port() const { return acceptor.local_endpoint().port(); }

    void serve(http::status status, bool answer) {
        th = std::thread([this, status, answer]{
            beast::error_code ec;
            asio::ip::tcp::socket sock(ioc);
            acceptor.accept(sock, ec);
            if (ec) return;
            beast::flat_buffer buf;
            http::request<http::string_body> req;
            http::read(sock, buf, req, ec);
            if (ec) return;
            seen_target = std::string(req.target());
            seen_body = req.body();
            if (!answer) {
                // hold the connection until the client gives up
                char c;
                sock.read_some(asio::buffer(&c, 1), ec);
                return;
            }
            http::response<http::string_body> res{status, 11};
            res.prepare_payload();
            http::write(sock, res, ec);
            sock.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        });
    }
    ~OneShotServer() { if (th.joinable()) th.join(); }
};

notify::Notification sample() {
    notify::Notification n;
    n.event_id = 7;
    n.owner_context = "chat:11";
    n.payload = "water the plants";
    n.scheduled_utc = 1898942400;
    n.occurrence = 3;
    return n;
}

}

int main() {
    const auto timeout = std::chrono::milliseconds(300);

    {
        notify::WebhookSink sink("http://localhost:9000/hooks/reminders");
        if (sink.host() != "localhost" || sink.port() != "9000" || sink.target() != "/hooks/reminders") {
            std::cerr << "url parsing\n"; return 1;
        }
        notify::WebhookSink bare("http://example.org");
        if (bare.port() != "80" || bare.target() != "/") { std::cerr << "default port/target\n"; return 1; }
        for (const char* bad : {"https://example.org/", "ftp://x", "http://:8080/x", "example.org"}) {
            bool threw = false;
            try { notify::WebhookSink s(bad); } catch (const std::invalid_argument&) { threw = true; }
            if (!threw) { std::cerr << "accepted url " << bad << "\n"; return 1; }
        }
    }

    {
        OneShotServer srv;
        srv.serve(http::status::no_content, true);
        notify::WebhookSink sink("http://127.0.0.1:" + std::to_string(srv.port()) + "/hook");
        try {
            sink.deliver(sample(), timeout);
        } catch (const notify::DeliveryError& e) {
            std::cerr << "2xx delivery failed: " << e.what() << "\n"; return 1;
        }
        srv.th.join();
        if (srv.seen_target != "/hook") { std::cerr << "target " << srv.seen_target << "\n"; return 1; }
        if (srv.seen_body.find("\"event_id\":7") == std::string::npos ||
            srv.seen_body.find("\"scheduled_utc\":\"2030-03-05T12:00:00Z\"") == std::string::npos ||
            srv.seen_body.find("\"occurrence\":3") == std::string::npos ||
            srv.seen_body.find("\"lead_sec\":0") == std::string::npos) {
            std::cerr << "body " << srv.seen_body << "\n"; return 1;
        }
    }

    {
        OneShotServer srv;
        srv.serve(http::status::service_unavailable, true);
        notify::WebhookSink sink("http://127.0.0.1:" + std::to_string(srv.port()) + "/hook");
        bool threw = false;
        try { sink.deliver(sample(), timeout); } catch (const notify::DeliveryError&) { threw = true; }
        if (!threw) { std::cerr << "503 treated as delivered\n"; return 1; }
    }

    {
        OneShotServer srv;
        srv.serve(http::status::ok, false);
        notify::WebhookSink sink("http://127.0.0.1:" + std::to_string(srv.port()) + "/hook");
        auto t0 = std::chrono::steady_clock::now();
        bool threw = false;
        try { sink.deliver(sample(), timeout); } catch (const notify::DeliveryError&) { threw = true; }
        auto took = std::chrono::steady_clock::now() - t0;
        if (!threw) { std::cerr << "stalled endpoint treated as delivered\n"; return 1; }
        // connect, write and read share one deadline
        if (took > std::chrono::milliseconds(1000)) {
            std::cerr << "exchange outlived its timeout: " << std::chrono::duration_cast<std::chrono::milliseconds>(took).count() << "ms\n"; return 1;
        }
    }

    {
        unsigned short closed_port;
        {
            asio::io_context ioc;
            asio::ip::tcp::acceptor a(ioc, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
            closed_port = a.local_endpoint().port();
        }
        notify::WebhookSink sink("http://127.0.0.1:" + std::to_string(closed_port) + "/");
        bool threw = false;
        try { sink.deliver(sample(), timeout); } catch (const notify::DeliveryError&) { threw = true; }
        if (!threw) { std::cerr << "refused connection treated as delivered\n"; return 1; }
    }

    std::cout << "webhook_sink_unit ok\n";
    return 0;
}
