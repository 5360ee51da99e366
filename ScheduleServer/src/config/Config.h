#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace config {

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    enum class HolidaySource { NONE, US_FEDERAL };
    uint16_t port = 8080;
    LogLevel log_level = LogLevel::INFO;
    bool metrics_enabled = true;
    bool access_log = true;
    std::string database_url;
    int db_workers = 16;
    int cpu_workers = 0; // 0 = hardware concurrency
    // Boost posix_time_zone rules (UTC offset signed as in ISO 8601),
    // e.g. "CET+01CEST,M3.5.0/02:00,M10.5.0/03:00"
    std::string default_time_zone = "UTC0";
    std::map<std::string, std::string> tenant_time_zones;
    HolidaySource holidays = HolidaySource::NONE;
    std::string holiday_file;
    int max_occurrences = 5000;
    int max_window_days = 731;

    const std::string& time_zone_for(const std::string& tenant) const;

    static Config from_env(int argc, char** argv);
};

int log_level_number(Config::LogLevel level);

// "t1=EST-05EDT,M3.2.0,M11.1.0;t2=UTC0"
std::map<std::string, std::string> parse_tenant_time_zones(const std::string& s);

}
