#include "Router.h"

namespace {

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    size_t i = 0;
    while (i <= path.size()) {
        size_t j = path.find('/', i);
        if (j == std::string::npos) j = path.size();
        if (j > i) parts.push_back(path.substr(i, j - i));
        i = j + 1;
    }
    return parts;
}

std::string strip_query(std::string target) {
    auto qpos = target.find('?');
    if (qpos != std::string::npos) target.erase(qpos);
    return target;
}

}

bool match_path(const std::string& pattern, const std::string& path, RouteParams& params) {
    auto want = split_path(pattern);
    auto got = split_path(path);
    if (want.size() != got.size()) return false;
    RouteParams found;
    for (size_t i = 0; i < want.size(); ++i) {
        const auto& w = want[i];
        if (w.size() > 2 && w.front() == '{' && w.back() == '}') {
            found[w.substr(1, w.size() - 2)] = got[i];
        } else if (w != got[i]) {
            return false;
        }
    }
    params = std::move(found);
    return true;
}

Response json_response(boost::beast::http::status st, const Request& req, std::string body) {
    Response res{st, req.version()};
    res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

void Router::add_route(std::string method, std::string pattern, Handler h) {
    routes_.push_back(Route{std::move(method), std::move(pattern), std::move(h)});
}

bool Router::has_path(const std::string& path) const {
    RouteParams ignored;
    for (const auto& r : routes_) {
        if (match_path(r.pattern, path, ignored)) return true;
    }
    return false;
}

Response Router::route(const Request& req) const {
    const std::string path = strip_query(std::string(req.target()));
    const std::string method = std::string(req.method_string());
    bool path_exists = false;
    for (const auto& r : routes_) {
        RouteParams params;
        if (!match_path(r.pattern, path, params)) continue;
        if (r.method == method) return r.handler(req, params);
        path_exists = true;
    }
    if (path_exists) {
        return json_response(boost::beast::http::status::method_not_allowed, req, "{\"error\":\"method_not_allowed\",\"message\":\"method not allowed\"}");
    }
    return json_response(boost::beast::http::status::not_found, req, "{\"error\":\"not_found\",\"message\":\"no such route\"}");
}
