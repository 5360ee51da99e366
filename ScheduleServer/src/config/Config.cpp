#include "Config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

static Config::LogLevel parse_level(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "DEBUG") return Config::LogLevel::DEBUG;
    if (u == "WARN") return Config::LogLevel::WARN;
    if (u == "ERROR") return Config::LogLevel::ERROR;
    return Config::LogLevel::INFO;
}

static Config::HolidaySource parse_holidays(const std::string& s) {
    std::string l = s;
    std::transform(l.begin(), l.end(), l.begin(), ::tolower);
    if (l == "us_federal" || l == "us") return Config::HolidaySource::US_FEDERAL;
    return Config::HolidaySource::NONE;
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

int log_level_number(Config::LogLevel level) {
    switch (level) {
        case Config::LogLevel::DEBUG: return 1;
        case Config::LogLevel::INFO: return 2;
        case Config::LogLevel::WARN: return 3;
        case Config::LogLevel::ERROR: return 4;
    }
    return 2;
}

std::map<std::string, std::string> parse_tenant_time_zones(const std::string& s) {
    std::map<std::string, std::string> out;
    size_t pos = 0;
    while (pos <= s.size()) {
        size_t semi = s.find(';', pos);
        std::string item = s.substr(pos, semi == std::string::npos ? std::string::npos : semi - pos);
        auto eq = item.find('=');
        if (eq != std::string::npos) {
            std::string tenant = trim(item.substr(0, eq));
            std::string tz = trim(item.substr(eq + 1));
            if (!tenant.empty() && !tz.empty()) out[tenant] = tz;
        }
        if (semi == std::string::npos) break;
        pos = semi + 1;
    }
    return out;
}

const std::string& Config::time_zone_for(const std::string& tenant) const {
    auto it = tenant_time_zones.find(tenant);
    if (it != tenant_time_zones.end()) return it->second;
    return default_time_zone;
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    auto lp = getenv_or("PORT", "8080");
    try { c.port = static_cast<uint16_t>(std::stoi(lp)); } catch(...) {}
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i+1 < argc) {
            try { c.port = static_cast<uint16_t>(std::stoi(argv[i+1])); } catch(...) {}
        }
    }
    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_or("METRICS_ENABLED", "1") != "0";
    c.access_log = getenv_or("ACCESS_LOG", "1") != "0";
    c.database_url = getenv_or("DATABASE_URL", "");

    try {
        auto w = getenv_or("DB_WORKERS", "");
        if (!w.empty()) c.db_workers = std::stoi(w);
        else c.db_workers = std::stoi(getenv_or("DB_POOL_SIZE", "16"));
    } catch(...) {}
    c.db_workers = std::clamp(c.db_workers, 1, 256);
    try { c.cpu_workers = std::stoi(getenv_or("CPU_WORKERS", "0")); } catch(...) {}
    c.cpu_workers = std::clamp(c.cpu_workers, 0, 256);

    auto tz = trim(getenv_or("DEFAULT_TIME_ZONE", "UTC0"));
    if (!tz.empty()) c.default_time_zone = tz;
    c.tenant_time_zones = parse_tenant_time_zones(getenv_or("TENANT_TIME_ZONES", ""));
    c.holidays = parse_holidays(getenv_or("HOLIDAYS", "none"));
    c.holiday_file = getenv_or("HOLIDAY_FILE", "");

    try { c.max_occurrences = std::stoi(getenv_or("MAX_OCCURRENCES", "5000")); } catch(...) {}
    if (c.max_occurrences < 1) c.max_occurrences = 5000;
    try { c.max_window_days = std::stoi(getenv_or("MAX_WINDOW_DAYS", "731")); } catch(...) {}
    if (c.max_window_days < 1) c.max_window_days = 731;
    return c;
}

}
