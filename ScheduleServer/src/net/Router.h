#pragma once

#include "Request.h"
#include "Response.h"
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

// path template parameters, e.g. {id}
using RouteParams = std::map<std::string, std::string>;

// Matches "/entries/{id}" against "/entries/abc"; fills `params` on success.
bool match_path(const std::string& pattern, const std::string& path, RouteParams& params);

Response json_response(boost::beast::http::status st, const Request& req, std::string body);

class Router {
public:
    using Handler = std::function<Response(const Request&, const RouteParams&)>;
    void add_route(std::string method, std::string pattern, Handler h);
    bool has_path(const std::string& path) const;
    // 404 for an unknown path, 405 when only the method is wrong
    Response route(const Request& req) const;
private:
    struct Route { std::string method; std::string pattern; Handler handler; };
    std::vector<Route> routes_;
};
