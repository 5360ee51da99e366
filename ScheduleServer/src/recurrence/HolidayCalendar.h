#pragma once

#include "Pattern.h"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace recurrence {

class HolidayCalendar {
public:
    virtual ~HolidayCalendar() = default;
    virtual bool is_holiday(const Date& d) const = 0;
};

class NoHolidays : public HolidayCalendar {
public:
    bool is_holiday(const Date&) const override { return false; }
};

class FixedHolidayCalendar : public HolidayCalendar {
public:
    FixedHolidayCalendar() = default;
    explicit FixedHolidayCalendar(std::set<Date> dates) : dates_(std::move(dates)) {}

    // One YYYY-MM-DD per line; blank lines and lines starting with '#' are ignored.
    // Returns nullopt when the file cannot be read or a line does not parse.
    static std::optional<FixedHolidayCalendar> load_file(const std::string& path, std::string* error = nullptr);

    void add(const Date& d) { dates_.insert(d); }
    size_t size() const { return dates_.size(); }
    bool is_holiday(const Date& d) const override { return dates_.count(d) > 0; }
private:
    std::set<Date> dates_;
};

// New Year's Day, Memorial Day, Independence Day, Labor Day, Thanksgiving, Christmas
class UsFederalHolidayCalendar : public HolidayCalendar {
public:
    bool is_holiday(const Date& d) const override;
};

class CompositeHolidayCalendar : public HolidayCalendar {
public:
    void add(std::shared_ptr<const HolidayCalendar> cal) { parts_.push_back(std::move(cal)); }
    bool empty() const { return parts_.empty(); }
    bool is_holiday(const Date& d) const override;
private:
    std::vector<std::shared_ptr<const HolidayCalendar>> parts_;
};

}
