#include "Router.h"
#include <boost/beast/http.hpp>

namespace {

std::string url_decode(const std::string& s) {
    std::string out; out.reserve(s.size());
    auto hex = [](char h)->int {
        if (h >= '0' && h <= '9') return h - '0';
        if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
        if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
        return -1;
    };
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%' && i + 2 < s.size() && hex(s[i+1]) >= 0 && hex(s[i+2]) >= 0) {
            out.push_back(char((hex(s[i+1]) << 4) | hex(s[i+2])));
            i += 2;
        } else if (c == '+') out.push_back(' ');
        else out.push_back(c);
    }
    return out;
}

}

Response make_json_response(boost::beast::http::status st, const Request& req, std::string body) {
    Response res{st, req.version()};
    res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

std::string request_path(const Request& req) {
    std::string target(req.target());
    auto q = target.find('?');
    if (q != std::string::npos) target.erase(q);
    return target;
}

std::string query_param(const Request& req, const std::string& key) {
    std::string target(req.target());
    auto q = target.find('?');
    if (q == std::string::npos) return std::string();
    std::string query = target.substr(q + 1);
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        size_t eq = pair.find('=');
        std::string k = url_decode(pair.substr(0, eq));
        if (k == key) return eq == std::string::npos ? std::string() : url_decode(pair.substr(eq + 1));
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return std::string();
}

void Router::add_route(std::string method, std::string path, Handler h) {
    Key k{std::move(method), std::move(path)};
    routes_.emplace(std::move(k), std::move(h));
}

void Router::add_prefix_route(std::string method, std::string prefix, Handler h) {
    prefixes_.push_back(Prefix{std::move(method), std::move(prefix), std::move(h)});
}

const Router::Prefix* Router::match_prefix(const std::string& method, const std::string& path) const {
    const Prefix* best = nullptr;
    for (const auto& p : prefixes_) {
        if (!method.empty() && p.method != method) continue;
        if (path.size() <= p.prefix.size() || path.compare(0, p.prefix.size(), p.prefix) != 0) continue;
        if (!best || p.prefix.size() > best->prefix.size()) best = &p;
    }
    return best;
}

Response Router::route(const Request& req) const {
    Key k{std::string(req.method_string()), request_path(req)};
    auto it = routes_.find(k);
    if (it != routes_.end()) return it->second(req);
    if (const Prefix* p = match_prefix(k.method, k.path)) return p->handler(req);

    bool path_exists = false;
    for (const auto& r : routes_) {
        if (r.first.path == k.path) { path_exists = true; break; }
    }
    if (!path_exists) path_exists = match_prefix(std::string(), k.path) != nullptr;
    if (path_exists) {
        return make_json_response(boost::beast::http::status::method_not_allowed, req, "{\"error\":\"method_not_allowed\"}");
    }
    return make_json_response(boost::beast::http::status::not_found, req, "{\"error\":\"not_found\"}");
}
