#pragma once

#include "Request.h"
#include "Response.h"
#include <string>
#include <functional>
#include <unordered_map>
#include <vector>

Response make_json_response(boost::beast::http::status st, const Request& req, std::string body);

// Path part of a request target (query string removed).
std::string request_path(const Request& req);
// Value of `key` in the query string, url-decoded; empty when absent.
std::string query_param(const Request& req, const std::string& key);

class Router {
public:
    using Handler = std::function<Response(const Request&)>;
    void add_route(std::string method, std::string path, Handler h);
    // matches any path starting with `prefix`; exact routes win, then the longest prefix
    void add_prefix_route(std::string method, std::string prefix, Handler h);
    Response route(const Request& req) const;
private:
    struct Key { std::string method; std::string path; };
    struct KeyHash {
        size_t operator()(Key const& k) const noexcept { return std::hash<std::string>()(k.method + "#" + k.path); }
    };
    struct KeyEq { bool operator()(Key const& a, Key const& b) const noexcept { return a.method==b.method && a.path==b.path; } };
    struct Prefix { std::string method; std::string prefix; Handler handler; };

    const Prefix* match_prefix(const std::string& method, const std::string& path) const;

    std::unordered_map<Key, Handler, KeyHash, KeyEq> routes_;
    std::vector<Prefix> prefixes_;
};
