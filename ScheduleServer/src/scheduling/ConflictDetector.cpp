#include "ConflictDetector.h"
#include <algorithm>
#include <map>

namespace scheduling {

namespace {

bool share_assignee(const Booking& a, const Booking& b) {
    for (const auto& x : a.assignees) {
        if (std::find(b.assignees.begin(), b.assignees.end(), x) != b.assignees.end()) return true;
    }
    return false;
}

// half-open: back-to-back bookings do not overlap
bool overlap(const Booking& a, const Booking& b) {
    return a.start < b.end && b.start < a.end;
}

ScheduleConflict make_conflict(const EntryRef& a, const EntryRef& b) {
    ScheduleConflict c;
    if (b < a) {
        c.entry_1 = b;
        c.entry_2 = a;
    } else {
        c.entry_1 = a;
        c.entry_2 = b;
    }
    return c;
}

}

Booking booking_of(const EntryView& view) {
    return Booking{view.ref, view.entry.scheduled_start, view.entry.scheduled_end, view.entry.assigned_user_ids};
}

std::vector<ScheduleConflict> detect(const Booking& candidate, const std::vector<Booking>& others) {
    std::map<std::string, ScheduleConflict> found;
    for (const auto& o : others) {
        if (o.ref == candidate.ref) continue;
        if (!overlap(candidate, o) || !share_assignee(candidate, o)) continue;
        found.emplace(conflict_pair_key(candidate.ref, o.ref), make_conflict(candidate.ref, o.ref));
    }
    std::vector<ScheduleConflict> out;
    out.reserve(found.size());
    for (auto& kv : found) out.push_back(std::move(kv.second));
    return out;
}

std::vector<ScheduleConflict> detect_all(std::vector<Booking> bookings) {
    std::sort(bookings.begin(), bookings.end(), [](const Booking& a, const Booking& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.ref < b.ref;
    });
    bookings.erase(std::unique(bookings.begin(), bookings.end(), [](const Booking& a, const Booking& b) {
        return a.ref == b.ref;
    }), bookings.end());

    std::map<std::string, ScheduleConflict> found;
    std::vector<const Booking*> active;
    for (const auto& b : bookings) {
        active.erase(std::remove_if(active.begin(), active.end(), [&](const Booking* a) {
            return a->end <= b.start;
        }), active.end());
        for (const Booking* a : active) {
            if (a->ref == b.ref) continue;
            if (overlap(*a, b) && share_assignee(*a, b)) {
                found.emplace(conflict_pair_key(a->ref, b.ref), make_conflict(a->ref, b.ref));
            }
        }
        active.push_back(&b);
    }
    std::vector<ScheduleConflict> out;
    out.reserve(found.size());
    for (auto& kv : found) out.push_back(std::move(kv.second));
    return out;
}

}
