#include <boost/asio.hpp>
#include <algorithm>
#include <iostream>
#include <string>
#include <memory>
#include <optional>
#include <cstdlib>
#include <thread>
#include "net/Router.h"
#include "net/HttpServer.h"
#include "net/ServiceBackend.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include "config/Config.h"
#include "db/DbPool.h"
#include "recurrence/HolidayCalendar.h"
#include "recurrence/TimeZone.h"

using config::Config;
using observability::log_info;
using observability::log_warn;
using observability::log_error;
using observability::set_log_level;

static std::optional<recurrence::TimeZone> zone_or_log(const std::string& spec, const std::string& what) {
    auto tz = recurrence::TimeZone::from_posix(spec);
    if (!tz) log_error("invalid_time_zone", {{"for", what}, {"tz", spec}});
    return tz;
}

int main(int argc, char** argv) {
    auto cfg = Config::from_env(argc, argv);
    unsigned short port = cfg.port;
    set_log_level(config::log_level_number(cfg.log_level));

    try {
        boost::asio::io_context io;

        auto default_zone = zone_or_log(cfg.default_time_zone, "default");
        if (!default_zone) return 2;
        scheduling::TenantTimeZones zones(*default_zone);
        for (const auto& [tenant, spec] : cfg.tenant_time_zones) {
            auto tz = zone_or_log(spec, tenant);
            if (!tz) return 2;
            zones.set(tenant, *tz);
        }

        auto holidays = std::make_shared<recurrence::CompositeHolidayCalendar>();
        if (cfg.holidays == Config::HolidaySource::US_FEDERAL) {
            holidays->add(std::make_shared<recurrence::UsFederalHolidayCalendar>());
        }
        if (!cfg.holiday_file.empty()) {
            std::string err;
            auto fixed = recurrence::FixedHolidayCalendar::load_file(cfg.holiday_file, &err);
            if (!fixed) {
                log_error("holiday_file_invalid", {{"path", cfg.holiday_file}, {"err", err}});
                return 2;
            }
            log_info("holiday_file_loaded", {{"path", cfg.holiday_file}, {"dates", int64_t(fixed->size())}});
            holidays->add(std::make_shared<recurrence::FixedHolidayCalendar>(std::move(*fixed)));
        }

        std::shared_ptr<const recurrence::HolidayCalendar> calendar;
        if (!holidays->empty()) calendar = holidays;
        auto env = std::make_shared<ServiceEnv>(ServiceEnv{
            std::move(zones),
            calendar,
            scheduling::ServiceLimits{static_cast<size_t>(cfg.max_occurrences), cfg.max_window_days}});

        Router router;

        router.add_route("GET", "/health", [](const Request& req, const RouteParams&) {
            return json_response(boost::beast::http::status::ok, req, "{\"status\":\"ok\"}");
        });
        if (cfg.metrics_enabled) {
            router.add_route("GET", "/metrics", [](const Request& req, const RouteParams&) {
                Response res{boost::beast::http::status::ok, req.version()};
                res.set(boost::beast::http::field::content_type, "text/plain; version=0.0.4");
                res.keep_alive(req.keep_alive());
                res.body() = observability::Metrics::instance().scrape();
                res.prepare_payload();
                return res;
            });
        }

        unsigned cpu_workers = cfg.cpu_workers > 0 ? unsigned(cfg.cpu_workers) : std::max(1u, std::thread::hardware_concurrency());
        auto cpu_pool = std::make_shared<boost::asio::thread_pool>(cpu_workers);

        std::shared_ptr<db::DbPool> dbpool;
        std::shared_ptr<ServiceBackend> backend;
        if (!cfg.database_url.empty()) {
            dbpool = std::make_shared<db::DbPool>(io, cfg.database_url, cfg.db_workers);
            backend = std::make_shared<PgServiceBackend>(dbpool, env);
        } else {
            log_warn("db_not_configured", {{"backend", std::string("memory")}});
            backend = std::make_shared<MemoryServiceBackend>(cpu_pool, env);
        }

        HttpServer server(io, port, router, cfg.metrics_enabled, cfg.access_log, backend, dbpool);
        log_info("server_start", {{"port", int64_t(port)}, {"backend", std::string(backend->name())},
                                  {"default_time_zone", cfg.default_time_zone}});
        server.run();
        io.run();
        cpu_pool->join();
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
