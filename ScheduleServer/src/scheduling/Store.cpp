#include "Store.h"
#include <boost/date_time/posix_time/posix_time.hpp>

namespace scheduling {

bool master_may_reach(const ScheduleEntry& master, std::time_t from, std::time_t to) {
    if (!master.recurrence) return false;
    if (master.scheduled_start >= to) return false;
    const auto& p = *master.recurrence;
    if (!p.end_date) return true;
    // two days of slack cover any zone offset between the local end_date and UTC
    const std::time_t duration = master.scheduled_end - master.scheduled_start;
    auto last_day = boost::posix_time::from_time_t(from - duration).date() - boost::gregorian::days(2);
    return *p.end_date >= last_day;
}

}
