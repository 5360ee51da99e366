#pragma once

#include <boost/date_time/gregorian/gregorian.hpp>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace recurrence {

using Date = boost::gregorian::date;

struct Daily {
    // skip Saturday/Sunday and holiday-calendar dates
    bool workdays_only = false;
};

struct Weekly {
    // 0 = Monday .. 6 = Sunday; empty means the weekday of start_date
    std::vector<int> weekdays;
};

struct Monthly {
    int day_of_month = 0; // 0 = day of start_date
};

struct Yearly {
    int day_of_month = 0;
};

using Frequency = std::variant<Daily, Weekly, Monthly, Yearly>;

struct Pattern {
    Frequency frequency = Daily{};
    int interval = 1;
    // local date of the series anchor; occurrence index 0
    Date start_date;
    std::optional<Date> end_date;       // inclusive
    std::optional<int> occurrence_count;
    std::set<Date> exceptions;          // cancelled occurrence dates
};

bool operator==(const Pattern& a, const Pattern& b);
inline bool operator!=(const Pattern& a, const Pattern& b) { return !(a == b); }

std::string frequency_name(const Frequency& f);
// "daily", "weekly", "monthly", "yearly"
std::optional<Frequency> frequency_from_name(const std::string& name);
bool workdays_only(const Pattern& p);

// nullopt when the pattern is acceptable, otherwise a description of the problem
std::optional<std::string> validate_pattern(const Pattern& p);

int weekday_index(const Date& d); // Monday = 0

std::optional<Date> parse_iso_date(const std::string& s);
std::string format_iso_date(const Date& d);

}
