#pragma once

#include "Entry.h"
#include <ctime>
#include <string>
#include <vector>

namespace scheduling {

// One concrete time slot: a persisted row or a virtual occurrence.
struct Booking {
    EntryRef ref;
    std::time_t start = 0;
    std::time_t end = 0;
    std::vector<std::string> assignees;
};

Booking booking_of(const EntryView& view);

// Conflicts between the candidate and each other booking. The candidate itself is skipped
// when it appears among `others`.
std::vector<ScheduleConflict> detect(const Booking& candidate, const std::vector<Booking>& others);

// Every conflicting pair in the set, exactly once per unordered pair, ordered by pair.
std::vector<ScheduleConflict> detect_all(std::vector<Booking> bookings);

}
