#include "HolidayCalendar.h"
#include <fstream>

namespace recurrence {

namespace greg = boost::gregorian;

std::optional<FixedHolidayCalendar> FixedHolidayCalendar::load_file(const std::string& path, std::string* error) {
    std::ifstream in(path);
    if (!in) {
        if (error) *error = "cannot open " + path;
        return std::nullopt;
    }
    FixedHolidayCalendar cal;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) line.pop_back();
        size_t b = line.find_first_not_of(" \t");
        if (b == std::string::npos || line[b] == '#') continue;
        auto d = parse_iso_date(line.substr(b));
        if (!d) {
            if (error) *error = path + ":" + std::to_string(lineno) + ": bad date";
            return std::nullopt;
        }
        cal.add(*d);
    }
    return cal;
}

bool UsFederalHolidayCalendar::is_holiday(const Date& d) const {
    const auto month = d.month().as_number();
    const auto day = d.day().as_number();
    if (month == 1 && day == 1) return true;
    if (month == 7 && day == 4) return true;
    if (month == 12 && day == 25) return true;

    const auto year = d.year();
    switch (month) {
        case 5: {
            greg::last_day_of_the_week_in_month memorial(greg::Monday, greg::May);
            return d == memorial.get_date(year);
        }
        case 9: {
            greg::first_day_of_the_week_in_month labor(greg::Monday, greg::Sep);
            return d == labor.get_date(year);
        }
        case 11: {
            greg::nth_day_of_the_week_in_month thanksgiving(greg::nth_day_of_the_week_in_month::fourth, greg::Thursday, greg::Nov);
            return d == thanksgiving.get_date(year);
        }
        default:
            return false;
    }
}

bool CompositeHolidayCalendar::is_holiday(const Date& d) const {
    for (const auto& p : parts_) {
        if (p && p->is_holiday(d)) return true;
    }
    return false;
}

}
