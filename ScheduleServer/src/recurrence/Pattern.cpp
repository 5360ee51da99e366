#include "Pattern.h"
#include <cstdio>

namespace recurrence {

namespace {

struct FrequencyEq {
    bool operator()(const Daily& a, const Daily& b) const { return a.workdays_only == b.workdays_only; }
    bool operator()(const Weekly& a, const Weekly& b) const { return a.weekdays == b.weekdays; }
    bool operator()(const Monthly& a, const Monthly& b) const { return a.day_of_month == b.day_of_month; }
    bool operator()(const Yearly& a, const Yearly& b) const { return a.day_of_month == b.day_of_month; }
    template <typename A, typename B>
    bool operator()(const A&, const B&) const { return false; }
};

bool is_weekend(const Date& d) {
    return weekday_index(d) >= 5;
}

}

bool operator==(const Pattern& a, const Pattern& b) {
    return std::visit(FrequencyEq{}, a.frequency, b.frequency)
        && a.interval == b.interval
        && a.start_date == b.start_date
        && a.end_date == b.end_date
        && a.occurrence_count == b.occurrence_count
        && a.exceptions == b.exceptions;
}

std::string frequency_name(const Frequency& f) {
    switch (f.index()) {
        case 0: return "daily";
        case 1: return "weekly";
        case 2: return "monthly";
        default: return "yearly";
    }
}

std::optional<Frequency> frequency_from_name(const std::string& name) {
    if (name == "daily") return Frequency{Daily{}};
    if (name == "weekly") return Frequency{Weekly{}};
    if (name == "monthly") return Frequency{Monthly{}};
    if (name == "yearly") return Frequency{Yearly{}};
    return std::nullopt;
}

bool workdays_only(const Pattern& p) {
    const auto* daily = std::get_if<Daily>(&p.frequency);
    return daily && daily->workdays_only;
}

std::optional<std::string> validate_pattern(const Pattern& p) {
    if (p.interval < 1) return std::string("interval must be at least 1");
    if (p.start_date.is_special()) return std::string("start_date is required");
    if (p.end_date.has_value() && p.occurrence_count.has_value()) {
        return std::string("end_date and occurrence_count are mutually exclusive");
    }
    if (p.occurrence_count.has_value() && *p.occurrence_count < 1) {
        return std::string("occurrence_count must be at least 1");
    }
    if (p.end_date.has_value()) {
        if (p.end_date->is_special()) return std::string("end_date is invalid");
        if (*p.end_date <= p.start_date) return std::string("end_date must be after start_date");
    }
    if (const auto* weekly = std::get_if<Weekly>(&p.frequency)) {
        for (int wd : weekly->weekdays) {
            if (wd < 0 || wd > 6) return std::string("weekday out of range");
        }
    }
    if (const auto* monthly = std::get_if<Monthly>(&p.frequency)) {
        if (monthly->day_of_month < 0 || monthly->day_of_month > 31) return std::string("day_of_month out of range");
    }
    if (const auto* yearly = std::get_if<Yearly>(&p.frequency)) {
        if (yearly->day_of_month < 0 || yearly->day_of_month > 31) return std::string("day_of_month out of range");
    }
    if (workdays_only(p) && p.interval % 7 == 0 && is_weekend(p.start_date)) {
        return std::string("pattern never falls on a workday");
    }
    return std::nullopt;
}

int weekday_index(const Date& d) {
    // boost: Sunday = 0
    return (static_cast<int>(d.day_of_week().as_number()) + 6) % 7;
}

std::optional<Date> parse_iso_date(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (s[i] < '0' || s[i] > '9') return std::nullopt;
    }
    try {
        int y = std::stoi(s.substr(0, 4));
        int m = std::stoi(s.substr(5, 2));
        int d = std::stoi(s.substr(8, 2));
        return Date(y, m, d);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string format_iso_date(const Date& d) {
    if (d.is_special()) return std::string();
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", static_cast<int>(d.year()), static_cast<int>(d.month()), static_cast<int>(d.day()));
    return std::string(buf);
}

}
