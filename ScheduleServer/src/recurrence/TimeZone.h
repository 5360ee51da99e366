#pragma once

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <ctime>
#include <optional>
#include <string>

namespace recurrence {

// Tenant wall-clock zone. All recurrence date arithmetic happens in local dates;
// instants are UTC time_t.
class TimeZone {
public:
    static TimeZone utc();
    // POSIX-style rule with the offset signed east-positive, as Boost.DateTime reads it:
    // "EST-05EDT,M3.2.0,M11.1.0" is New York. Returns nullopt when malformed.
    static std::optional<TimeZone> from_posix(const std::string& spec);

    const std::string& name() const { return name_; }

    boost::gregorian::date local_date(std::time_t t) const;
    boost::posix_time::time_duration local_time_of_day(std::time_t t) const;

    // Local wall-clock time to UTC. A time inside a DST gap is moved forward by
    // the DST offset; an ambiguous time resolves to the DST (earlier) instant.
    std::time_t to_utc(const boost::gregorian::date& d, const boost::posix_time::time_duration& tod) const;

private:
    TimeZone(boost::local_time::time_zone_ptr tz, std::string name);
    boost::posix_time::ptime to_local(std::time_t t) const;

    boost::local_time::time_zone_ptr tz_;
    std::string name_;
};

}
