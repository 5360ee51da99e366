#include "ScheduleApi.h"
#include "EntryJson.h"
#include "MiniJson.h"
#include "Router.h"
#include "../recurrence/IsoTime.h"

namespace http = boost::beast::http;
using scheduling::EditScope;
using scheduling::EntryRef;
using scheduling::ErrorCode;
using scheduling::SchedulingError;

namespace {

struct BadRequest {
    std::string message;
};

Response error_response(http::status st, const Request& req, const std::string& code, const std::string& message) {
    return json_response(st, req, "{\"error\":" + json_quote(code) + ",\"message\":" + json_quote(message) + "}");
}

JsonValue parse_body(const Request& req) {
    if (req.body().empty()) return JsonValue::make_object({});
    try {
        return json_parse(req.body());
    } catch (const JsonError& e) {
        throw SchedulingError(ErrorCode::InvalidEntry, std::string("malformed json: ") + e.what());
    }
}

std::time_t query_time(const std::map<std::string, std::string>& q, const std::string& key) {
    auto it = q.find(key);
    if (it == q.end() || it->second.empty()) throw BadRequest{key + " is required"};
    auto t = recurrence::parse_iso_z(it->second);
    if (!t) throw BadRequest{key + " must be YYYY-MM-DDTHH:MM:SSZ"};
    return *t;
}

std::optional<EditScope> query_scope(const std::map<std::string, std::string>& q) {
    auto it = q.find("scope");
    if (it == q.end() || it->second.empty()) return std::nullopt;
    auto scope = scheduling::parse_scope(it->second);
    if (!scope) throw SchedulingError(ErrorCode::InvalidScope, "unknown scope " + it->second);
    return scope;
}

EntryRef query_ref(const std::map<std::string, std::string>& q, const std::string& id) {
    EntryRef ref{id, std::nullopt};
    auto it = q.find("occurrence");
    if (it != q.end() && !it->second.empty()) {
        ref.occurrence_date = recurrence::parse_iso_date(it->second);
        if (!ref.occurrence_date) throw BadRequest{"occurrence must be YYYY-MM-DD"};
    }
    return ref;
}

std::string mutation_json(const scheduling::MutationResult& r) {
    return "{\"entry\":" + entry_to_json(r.entry) + ",\"conflicts\":" + conflicts_to_json(r.conflicts) + "}";
}

}

std::string url_decode(std::string_view s) {
    std::string out; out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%') {
            if (i + 2 >= s.size()) return out;
            auto hex = [&](char h)->int {
                if (h >= '0' && h <= '9') return h - '0';
                if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
                if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
                return -1;
            };
            int hi = hex(s[i+1]); int lo = hex(s[i+2]); if (hi < 0 || lo < 0) return out;
            out.push_back(char((hi << 4) | lo)); i += 2;
        } else if (c == '+') out.push_back(' ');
        else out.push_back(c);
    }
    return out;
}

std::map<std::string, std::string> parse_query(std::string_view target) {
    std::map<std::string, std::string> out;
    auto qpos = target.find('?');
    if (qpos == std::string_view::npos) return out;
    std::string_view q = target.substr(qpos + 1);
    while (!q.empty()) {
        auto amp = q.find('&');
        std::string_view part = q.substr(0, amp);
        auto eq = part.find('=');
        if (eq == std::string_view::npos) out[url_decode(part)] = std::string();
        else out[url_decode(part.substr(0, eq))] = url_decode(part.substr(eq + 1));
        if (amp == std::string_view::npos) break;
        q.remove_prefix(amp + 1);
    }
    return out;
}

http::status status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidPattern: return http::status::unprocessable_entity;
        case ErrorCode::InvalidScope: return http::status::bad_request;
        case ErrorCode::InvalidEntry: return http::status::bad_request;
        case ErrorCode::NotFound: return http::status::not_found;
        case ErrorCode::RangeTooLarge: return http::status::payload_too_large;
        case ErrorCode::TransactionFailed: return http::status::internal_server_error;
    }
    return http::status::internal_server_error;
}

bool ScheduleApi::handles(const std::string& path) {
    RouteParams ignored;
    return path == "/entries" || path == "/conflicts"
        || match_path("/entries/{id}", path, ignored)
        || match_path("/conflicts/{id}/resolve", path, ignored);
}

Response ScheduleApi::handle(scheduling::SchedulingService& svc, const Request& req) const {
    std::string path = std::string(req.target());
    auto qpos = path.find('?');
    if (qpos != std::string::npos) path.erase(qpos);
    const auto method = req.method();

    auto it = req.find("X-Tenant-Id");
    if (it == req.end() || it->value().empty()) {
        return error_response(http::status::bad_request, req, "bad_request", "X-Tenant-Id header is required");
    }
    const std::string tenant = std::string(it->value());

    try {
        RouteParams params;
        if (path == "/entries") {
            if (method == http::verb::get) return get_entries(svc, req, tenant);
            if (method == http::verb::post) return create_entry(svc, req, tenant);
        } else if (path == "/entries/earliest") {
            if (method == http::verb::get) return earliest_entry(svc, req, tenant);
        } else if (match_path("/entries/{id}", path, params)) {
            if (method == http::verb::put) return update_entry(svc, req, tenant, params["id"]);
            if (method == http::verb::delete_) return delete_entry(svc, req, tenant, params["id"]);
        } else if (path == "/conflicts") {
            if (method == http::verb::get) return list_conflicts(svc, req, tenant);
        } else if (match_path("/conflicts/{id}/resolve", path, params)) {
            if (method == http::verb::post) return resolve_conflict(svc, req, tenant, params["id"]);
        } else {
            return error_response(http::status::not_found, req, "not_found", "no such route");
        }
        return error_response(http::status::method_not_allowed, req, "method_not_allowed", "method not allowed");
    } catch (const BadRequest& e) {
        return error_response(http::status::bad_request, req, "bad_request", e.message);
    } catch (const SchedulingError& e) {
        return error_response(status_for(e.code()), req, scheduling::error_code_name(e.code()), e.what());
    }
}

Response ScheduleApi::get_entries(scheduling::SchedulingService& svc, const Request& req, const std::string& tenant) const {
    auto q = parse_query(std::string(req.target()));
    auto views = svc.get_entries(tenant, query_time(q, "from"), query_time(q, "to"));
    std::string body = "{\"entries\":[";
    for (size_t i = 0; i < views.size(); ++i) {
        if (i) body += ",";
        body += view_to_json(views[i]);
    }
    body += "]}";
    return json_response(http::status::ok, req, std::move(body));
}

Response ScheduleApi::earliest_entry(scheduling::SchedulingService& svc, const Request& req, const std::string& tenant) const {
    auto entry = svc.earliest_entry(tenant);
    if (!entry) return error_response(http::status::not_found, req, "not_found", "tenant has no entries");
    return json_response(http::status::ok, req, "{\"entry\":" + entry_to_json(*entry) + "}");
}

Response ScheduleApi::create_entry(scheduling::SchedulingService& svc, const Request& req, const std::string& tenant) const {
    auto draft = draft_from_json(parse_body(req));
    auto result = svc.create_entry(tenant, std::move(draft));
    return json_response(http::status::created, req, mutation_json(result));
}

Response ScheduleApi::update_entry(scheduling::SchedulingService& svc, const Request& req, const std::string& tenant, const std::string& id) const {
    auto q = parse_query(std::string(req.target()));
    auto ref = query_ref(q, id);
    auto scope = query_scope(q);
    auto changes = changes_from_json(parse_body(req));
    auto result = svc.update_entry(tenant, ref, changes, scope);
    return json_response(http::status::ok, req, mutation_json(result));
}

Response ScheduleApi::delete_entry(scheduling::SchedulingService& svc, const Request& req, const std::string& tenant, const std::string& id) const {
    auto q = parse_query(std::string(req.target()));
    svc.delete_entry(tenant, query_ref(q, id), query_scope(q));
    Response res{http::status::no_content, req.version()};
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

Response ScheduleApi::list_conflicts(scheduling::SchedulingService& svc, const Request& req, const std::string& tenant) const {
    auto q = parse_query(std::string(req.target()));
    auto it = q.find("include_resolved");
    const bool include_resolved = it != q.end() && (it->second == "1" || it->second == "true");
    auto conflicts = svc.list_conflicts(tenant, include_resolved);
    return json_response(http::status::ok, req, "{\"conflicts\":" + conflicts_to_json(conflicts) + "}");
}

Response ScheduleApi::resolve_conflict(scheduling::SchedulingService& svc, const Request& req, const std::string& tenant, const std::string& id) const {
    auto body = parse_body(req);
    std::string notes;
    try {
        if (const auto* v = body.find("resolution_notes"); v && !v->is_null()) notes = v->as_string("resolution_notes");
    } catch (const JsonError& e) {
        throw BadRequest{e.what()};
    }
    auto conflict = svc.resolve_conflict(tenant, id, notes);
    return json_response(http::status::ok, req, conflict_to_json(conflict));
}
