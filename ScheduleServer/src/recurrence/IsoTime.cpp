#include "IsoTime.h"

namespace recurrence {

static bool all_digits(const std::string& s, size_t pos, size_t len) {
    for (size_t i = pos; i < pos + len; ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
    }
    return true;
}

static bool split_iso_utc(const std::string& s_in, std::tm& out_tm) {
    std::string s = s_in;
    if (s.size() >= 19 && s[10] == ' ') s[10] = 'T';

    auto dot = s.find('.', 19);
    if (dot != std::string::npos) {
        auto z = s.find('Z', dot);
        if (z == std::string::npos) return false;
        s.erase(dot, z - dot);
    }
    if (s.size() == 25 && s.compare(19, 6, "+00:00") == 0) {
        s.erase(19);
        s.push_back('Z');
    }

    if (s.size() != 20) return false;
    if (s[4] != '-' || s[7] != '-' || s[10] != 'T' || s[13] != ':' || s[16] != ':' || s[19] != 'Z') return false;
    if (!all_digits(s, 0, 4) || !all_digits(s, 5, 2) || !all_digits(s, 8, 2)
        || !all_digits(s, 11, 2) || !all_digits(s, 14, 2) || !all_digits(s, 17, 2)) return false;

    out_tm = {};
    out_tm.tm_year = std::stoi(s.substr(0, 4)) - 1900;
    out_tm.tm_mon  = std::stoi(s.substr(5, 2)) - 1;
    out_tm.tm_mday = std::stoi(s.substr(8, 2));
    out_tm.tm_hour = std::stoi(s.substr(11, 2));
    out_tm.tm_min  = std::stoi(s.substr(14, 2));
    out_tm.tm_sec  = std::stoi(s.substr(17, 2));
    if (out_tm.tm_mon < 0 || out_tm.tm_mon > 11) return false;
    if (out_tm.tm_mday < 1 || out_tm.tm_mday > 31) return false;
    if (out_tm.tm_hour > 23 || out_tm.tm_min > 59 || out_tm.tm_sec > 60) return false;
    return true;
}

std::optional<std::time_t> parse_iso_z(const std::string& s) {
    std::tm tm{};
    if (!split_iso_utc(s, tm)) return std::nullopt;
#if defined(_WIN32)
    std::time_t t = _mkgmtime(&tm);
#else
    std::time_t t = timegm(&tm);
#endif
    return t;
}

std::string format_iso_z(std::time_t t) {
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

}
