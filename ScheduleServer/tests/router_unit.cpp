#include <iostream>
#include <string>
#include "net/Router.h"
#include "net/Request.h"
#include "net/Response.h"
#include <boost/beast/http.hpp>

using namespace boost::beast::http;

static Request make_request(verb m, const std::string& target) {
    Request req{m, target, 11};
    req.set(field::host, "localhost");
    req.prepare_payload();
    return req;
}

static Response text(const Request& req, const std::string& body) {
    Response res{status::ok, req.version()};
    res.set(field::content_type, "text/plain");
    res.body() = body;
    res.prepare_payload();
    return res;
}

int main() {
    {
        RouteParams p;
        if (!match_path("/entries/{id}", "/entries/abc", p) || p["id"] != "abc") { std::cerr << "param not captured\n"; return 1; }
        if (match_path("/entries/{id}", "/entries", p)) { std::cerr << "missing segment matched\n"; return 1; }
        if (match_path("/entries/{id}", "/entries/a/b", p)) { std::cerr << "extra segment matched\n"; return 1; }
        if (!match_path("/conflicts/{id}/resolve", "/conflicts/c1/resolve", p) || p.size() != 1 || p["id"] != "c1") {
            std::cerr << "inner param wrong\n"; return 1;
        }
        if (match_path("/conflicts/{id}/resolve", "/conflicts/c1/reopen", p)) { std::cerr << "literal segment ignored\n"; return 1; }
    }

    Router r;
    {
        auto res = r.route(make_request(verb::get, "/nope"));
        if (res.result() != status::not_found) { std::cerr << "expected 404 for /nope, got " << res.result_int() << "\n"; return 1; }
        if (res.body().find("\"error\":\"not_found\"") == std::string::npos) { std::cerr << "404 body: " << res.body() << "\n"; return 1; }
    }

    r.add_route("GET", "/health", [](const Request& req, const RouteParams&) { return text(req, "ok"); });
    r.add_route("GET", "/things/{id}", [](const Request& req, const RouteParams& p) { return text(req, "get " + p.at("id")); });
    r.add_route("DELETE", "/things/{id}", [](const Request& req, const RouteParams& p) { return text(req, "delete " + p.at("id")); });

    {
        auto res = r.route(make_request(verb::post, "/health"));
        if (res.result() != status::method_not_allowed) { std::cerr << "expected 405 for POST /health, got " << res.result_int() << "\n"; return 1; }
        if (res[field::content_type].find("application/json") == std::string::npos) { std::cerr << "405 not json\n"; return 1; }
    }
    {
        auto res = r.route(make_request(verb::get, "/health?verbose=1"));
        if (res.result() != status::ok || res.body() != "ok") { std::cerr << "query string not stripped\n"; return 1; }
    }
    {
        auto res = r.route(make_request(verb::get, "/things/42"));
        if (res.body() != "get 42") { std::cerr << "GET param route: " << res.body() << "\n"; return 1; }
        res = r.route(make_request(verb::delete_, "/things/42"));
        if (res.body() != "delete 42") { std::cerr << "DELETE param route: " << res.body() << "\n"; return 1; }
        res = r.route(make_request(verb::put, "/things/42"));
        if (res.result() != status::method_not_allowed) { std::cerr << "PUT on param route: " << res.result_int() << "\n"; return 1; }
        res = r.route(make_request(verb::get, "/things/42/parts"));
        if (res.result() != status::not_found) { std::cerr << "deeper path matched: " << res.result_int() << "\n"; return 1; }
    }
    if (!r.has_path("/things/x") || r.has_path("/other")) { std::cerr << "has_path wrong\n"; return 1; }

    {
        auto req = make_request(verb::get, "/x");
        req.keep_alive(false);
        auto res = json_response(status::created, req, "{}");
        if (res.result() != status::created || res.keep_alive() || res[field::content_length] != "2") {
            std::cerr << "json_response wrong\n"; return 1;
        }
    }

    std::cout << "router_unit ok\n";
    return 0;
}
