#include "TimeZone.h"
#include <stdexcept>
#include <utility>

namespace recurrence {

namespace bpt = boost::posix_time;
namespace blt = boost::local_time;

TimeZone::TimeZone(blt::time_zone_ptr tz, std::string name) : tz_(std::move(tz)), name_(std::move(name)) {}

TimeZone TimeZone::utc() {
    return TimeZone(blt::time_zone_ptr(new blt::posix_time_zone("UTC0")), "UTC0");
}

std::optional<TimeZone> TimeZone::from_posix(const std::string& spec) {
    if (spec.empty()) return std::nullopt;
    try {
        blt::time_zone_ptr tz(new blt::posix_time_zone(spec));
        return TimeZone(tz, spec);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bpt::ptime TimeZone::to_local(std::time_t t) const {
    blt::local_date_time ldt(bpt::from_time_t(t), tz_);
    return ldt.local_time();
}

boost::gregorian::date TimeZone::local_date(std::time_t t) const {
    return to_local(t).date();
}

bpt::time_duration TimeZone::local_time_of_day(std::time_t t) const {
    return to_local(t).time_of_day();
}

std::time_t TimeZone::to_utc(const boost::gregorian::date& d, const bpt::time_duration& tod) const {
    bpt::ptime local(d, tod);
    bpt::ptime utc = local - tz_->base_utc_offset();
    if (tz_->has_dst()) {
        switch (blt::local_date_time::check_dst(d, tod, tz_)) {
            case boost::date_time::is_in_dst:
            case boost::date_time::ambiguous:
                utc -= tz_->dst_offset();
                break;
            case boost::date_time::invalid_time_label:
                // nonexistent wall time: local + dst_offset, which is in DST, lands on the same instant
            case boost::date_time::is_not_in_dst:
                break;
        }
    }
    return bpt::to_time_t(utc);
}

}
