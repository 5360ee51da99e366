#pragma once

#include "Request.h"
#include "Response.h"
#include "../scheduling/SchedulingService.h"
#include <map>
#include <string>
#include <string_view>

std::string url_decode(std::string_view s);
std::map<std::string, std::string> parse_query(std::string_view target);

boost::beast::http::status status_for(scheduling::ErrorCode code);

// HTTP surface of the scheduling service: /entries and /conflicts.
class ScheduleApi {
public:
    static bool handles(const std::string& path);

    // Runs on a worker thread with a service bound to that worker's store.
    Response handle(scheduling::SchedulingService& svc, const Request& req) const;

private:
    Response get_entries(scheduling::SchedulingService& svc, const Request& req, const std::string& tenant) const;
    Response earliest_entry(scheduling::SchedulingService& svc, const Request& req, const std::string& tenant) const;
    Response create_entry(scheduling::SchedulingService& svc, const Request& req, const std::string& tenant) const;
    Response update_entry(scheduling::SchedulingService& svc, const Request& req, const std::string& tenant, const std::string& id) const;
    Response delete_entry(scheduling::SchedulingService& svc, const Request& req, const std::string& tenant, const std::string& id) const;
    Response list_conflicts(scheduling::SchedulingService& svc, const Request& req, const std::string& tenant) const;
    Response resolve_conflict(scheduling::SchedulingService& svc, const Request& req, const std::string& tenant, const std::string& id) const;
};
