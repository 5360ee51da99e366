#pragma once

#include <ctime>
#include <stdexcept>
#include <string>
#include <vector>
#include "recurrence/IsoTime.h"
#include "recurrence/Pattern.h"
#include "scheduling/Entry.h"

// "2024-01-15T09:00:00Z" -> time_t; aborts the test on a typo
static inline std::time_t ts(const std::string& iso) {
    auto t = recurrence::parse_iso_z(iso);
    if (!t) throw std::runtime_error("bad test timestamp " + iso);
    return *t;
}

static inline recurrence::Date day(const std::string& iso) {
    auto d = recurrence::parse_iso_date(iso);
    if (!d) throw std::runtime_error("bad test date " + iso);
    return *d;
}

static inline std::string dates_of(const std::vector<recurrence::Date>& ds) {
    std::string out;
    for (const auto& d : ds) {
        if (!out.empty()) out += ",";
        out += recurrence::format_iso_date(d);
    }
    return out;
}

// Weekly Monday 09:00-10:00 UTC starting 2024-01-01, five occurrences.
static inline scheduling::ScheduleEntry weekly_standup(const std::string& user = "u1") {
    scheduling::ScheduleEntry e;
    e.title = "standup";
    e.scheduled_start = ts("2024-01-01T09:00:00Z");
    e.scheduled_end = ts("2024-01-01T10:00:00Z");
    e.assigned_user_ids = {user};
    recurrence::Pattern p;
    p.frequency = recurrence::Weekly{};
    p.interval = 1;
    p.occurrence_count = 5;
    e.recurrence = p;
    return e;
}
