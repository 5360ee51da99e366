#include <iostream>
#include <string>
#include "net/MiniJson.h"
#include "net/ScheduleApi.h"
#include "scheduling/InMemoryStore.h"

namespace http = boost::beast::http;

static Request make_req(http::verb method, const std::string& target, const std::string& body = "", const std::string& tenant = "acme") {
    Request req{method, target, 11};
    if (!tenant.empty()) req.set("X-Tenant-Id", tenant);
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
        req.prepare_payload();
    }
    return req;
}

static const char* kStandup = R"({
  "title": "standup",
  "scheduled_start": "2024-01-01T09:00:00Z",
  "scheduled_end": "2024-01-01T10:00:00Z",
  "assigned_user_ids": ["u1"],
  "work_item": {"type": "ticket", "id": "T-17"},
  "recurrence": {"frequency": "weekly", "interval": 1, "weekdays": ["mon"], "occurrence_count": 5}
})";

int main() {
    scheduling::InMemoryStore store;
    scheduling::StaticAssigneeDirectory directory;
    scheduling::TenantTimeZones zones(recurrence::TimeZone::utc());
    scheduling::SchedulingService svc(store, directory, zones, nullptr);
    ScheduleApi api;

    if (!ScheduleApi::handles("/entries") || !ScheduleApi::handles("/entries/abc")
        || !ScheduleApi::handles("/conflicts/abc/resolve") || ScheduleApi::handles("/health")) {
        std::cerr << "handles() wrong\n"; return 1;
    }
    auto q = parse_query("/entries?from=2024-01-01T00%3A00%3A00Z&to=x+y&flag");
    if (q["from"] != "2024-01-01T00:00:00Z" || q["to"] != "x y" || q.count("flag") != 1) {
        std::cerr << "parse_query wrong\n"; return 1;
    }

    auto created = api.handle(svc, make_req(http::verb::post, "/entries", kStandup));
    if (created.result() != http::status::created) { std::cerr << "create: " << created.body() << "\n"; return 1; }
    const auto created_js = json_parse(created.body());
    const std::string id = created_js.find("entry")->find("entry_id")->as_string("entry_id");
    if (created_js.find("entry")->find("recurrence")->find("start_date")->as_string("start_date") != "2024-01-01") {
        std::cerr << "start_date not derived\n"; return 1;
    }
    if (created.find(http::field::content_type) == created.end()) { std::cerr << "content type missing\n"; return 1; }

    {
        auto res = api.handle(svc, make_req(http::verb::get, "/entries?from=2024-01-01T00:00:00Z&to=2024-02-01T00:00:00Z"));
        if (res.result() != http::status::ok) { std::cerr << "list: " << res.body() << "\n"; return 1; }
        const auto doc = json_parse(res.body());
        const auto& items = doc.find("entries")->as_array("entries");
        if (items.size() != 5 || !items[0].find("is_virtual")->as_bool("is_virtual")
            || items[2].find("ref")->find("occurrence_date")->as_string("occurrence_date") != "2024-01-15") {
            std::cerr << "unexpected listing " << res.body() << "\n"; return 1;
        }
    }
    {
        auto res = api.handle(svc, make_req(http::verb::get, "/entries?from=2024-01-01T00:00:00Z&to=2024-02-01T00:00:00Z", "", "other"));
        if (json_parse(res.body()).find("entries")->as_array("entries").size() != 0) { std::cerr << "tenant leak\n"; return 1; }
    }

    // single-occurrence move
    {
        auto res = api.handle(svc, make_req(http::verb::put, "/entries/" + id + "?scope=single&occurrence=2024-01-15",
            R"({"scheduled_start":"2024-01-15T12:00:00Z","scheduled_end":"2024-01-15T13:00:00Z"})"));
        if (res.result() != http::status::ok) { std::cerr << "single edit: " << res.body() << "\n"; return 1; }
        const auto doc = json_parse(res.body());
        if (doc.find("entry")->find("original_entry_id")->as_string("original_entry_id") != id) { std::cerr << "not detached\n"; return 1; }
    }

    // a standalone booking that collides with the 01-08 occurrence
    std::string conflict_id;
    {
        auto res = api.handle(svc, make_req(http::verb::post, "/entries",
            R"({"scheduled_start":"2024-01-08T09:30:00Z","scheduled_end":"2024-01-08T10:30:00Z","assigned_user_ids":["u1"]})"));
        if (res.result() != http::status::created) { std::cerr << "standalone: " << res.body() << "\n"; return 1; }
        const auto doc = json_parse(res.body());
        const auto& cs = doc.find("conflicts")->as_array("conflicts");
        if (cs.size() != 1) { std::cerr << "expected a conflict: " << res.body() << "\n"; return 1; }
        conflict_id = cs[0].find("conflict_id")->as_string("conflict_id");
    }
    {
        auto res = api.handle(svc, make_req(http::verb::get, "/conflicts"));
        if (json_parse(res.body()).find("conflicts")->as_array("conflicts").size() != 1) { std::cerr << "open conflicts\n"; return 1; }
        res = api.handle(svc, make_req(http::verb::post, "/conflicts/" + conflict_id + "/resolve", R"({"resolution_notes":"ok"})"));
        if (res.result() != http::status::ok || !json_parse(res.body()).find("resolved")->as_bool("resolved")) {
            std::cerr << "resolve: " << res.body() << "\n"; return 1;
        }
        res = api.handle(svc, make_req(http::verb::get, "/conflicts"));
        if (!json_parse(res.body()).find("conflicts")->as_array("conflicts").empty()) { std::cerr << "resolved still open\n"; return 1; }
        res = api.handle(svc, make_req(http::verb::get, "/conflicts?include_resolved=true"));
        if (json_parse(res.body()).find("conflicts")->as_array("conflicts").size() != 1) { std::cerr << "include_resolved\n"; return 1; }
    }

    struct Case {
        const char* name;
        Request req;
        http::status expected;
        const char* code;
    };
    const Case cases[] = {
        {"missing tenant", make_req(http::verb::get, "/entries?from=2024-01-01T00:00:00Z&to=2024-02-01T00:00:00Z", "", ""),
            http::status::bad_request, "bad_request"},
        {"missing window", make_req(http::verb::get, "/entries?from=2024-01-01T00:00:00Z"), http::status::bad_request, "bad_request"},
        {"window too wide", make_req(http::verb::get, "/entries?from=2024-01-01T00:00:00Z&to=2027-01-01T00:00:00Z"),
            http::status::payload_too_large, "range_too_large"},
        {"bad pattern", make_req(http::verb::post, "/entries",
            R"({"scheduled_start":"2024-01-01T09:00:00Z","scheduled_end":"2024-01-01T10:00:00Z","assigned_user_ids":["u1"],)"
            R"("recurrence":{"frequency":"weekly","interval":0}})"),
            http::status::unprocessable_entity, "invalid_pattern"},
        {"malformed body", make_req(http::verb::post, "/entries", "{not json"), http::status::bad_request, "invalid_entry"},
        {"series edit without scope", make_req(http::verb::put, "/entries/" + id, R"({"title":"x"})"),
            http::status::bad_request, "invalid_scope"},
        {"unknown scope", make_req(http::verb::put, "/entries/" + id + "?scope=sometimes", R"({"title":"x"})"),
            http::status::bad_request, "invalid_scope"},
        {"unknown entry", make_req(http::verb::delete_, "/entries/00000000-0000-4000-8000-000000000000?scope=all"),
            http::status::not_found, "not_found"},
        {"bad occurrence", make_req(http::verb::delete_, "/entries/" + id + "?scope=single&occurrence=15.01.2024"),
            http::status::bad_request, "bad_request"},
        {"wrong method", make_req(http::verb::patch, "/entries"), http::status::method_not_allowed, "method_not_allowed"},
        {"earliest of an empty tenant", make_req(http::verb::get, "/entries/earliest", "", "nobody"), http::status::not_found, "not_found"},
    };
    for (const auto& c : cases) {
        auto res = api.handle(svc, c.req);
        if (res.result() != c.expected) {
            std::cerr << c.name << ": status " << res.result_int() << " body " << res.body() << "\n"; return 1;
        }
        if (json_parse(res.body()).find("error")->as_string("error") != c.code) {
            std::cerr << c.name << ": error code " << res.body() << "\n"; return 1;
        }
    }

    {
        auto res = api.handle(svc, make_req(http::verb::get, "/entries/earliest"));
        if (res.result() != http::status::ok) { std::cerr << "earliest: " << res.body() << "\n"; return 1; }
        const auto doc = json_parse(res.body());
        if (doc.find("entry")->find("entry_id")->as_string("entry_id") != id) { std::cerr << "earliest is not the series: " << res.body() << "\n"; return 1; }
    }

    // delete the rest of the series from 01-22
    {
        auto res = api.handle(svc, make_req(http::verb::delete_, "/entries/" + id + "?scope=future&occurrence=2024-01-22"));
        if (res.result() != http::status::no_content || !res.body().empty()) { std::cerr << "future delete: " << res.result_int() << "\n"; return 1; }
        res = api.handle(svc, make_req(http::verb::get, "/entries?from=2024-01-01T00:00:00Z&to=2024-03-01T00:00:00Z"));
        // 01-01, 01-08 virtual, the standalone, the moved 01-15
        if (json_parse(res.body()).find("entries")->as_array("entries").size() != 4) {
            std::cerr << "after future delete: " << res.body() << "\n"; return 1;
        }
    }

    std::cout << "schedule_api_unit ok\n";
    return 0;
}
