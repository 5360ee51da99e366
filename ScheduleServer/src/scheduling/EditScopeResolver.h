#pragma once

#include "Entry.h"
#include "Errors.h"
#include "Store.h"
#include "../recurrence/Expander.h"
#include <optional>

namespace scheduling {

// Fills in or checks the pattern's start_date against the entry's local start date and
// validates the pattern. Throws SchedulingError(InvalidPattern).
void anchor_pattern(ScheduleEntry& e, const recurrence::TimeZone& tz);

// Normalizes assignees and checks entry invariants. Throws SchedulingError(InvalidEntry).
void check_entry(ScheduleEntry& e);

recurrence::SeriesAnchor series_anchor(const ScheduleEntry& master);

// Applies single / future / all semantics for one reference inside a transaction.
// Without a scope only standalone entries and detached exceptions may be edited.
class EditScopeResolver {
public:
    EditScopeResolver(StoreTransaction& tx, const recurrence::TimeZone& tz, const recurrence::HolidayCalendar* holidays)
        : tx_(tx), tz_(tz), holidays_(holidays) {}

    // Returns the row that now carries the edit: the updated entry, the new detached
    // exception, or the master created by a future split.
    ScheduleEntry update(const EntryRef& ref, const EntryChanges& changes, std::optional<EditScope> scope);
    void remove(const EntryRef& ref, std::optional<EditScope> scope);

private:
    struct Target {
        ScheduleEntry row;
        std::optional<ScheduleEntry> series;
        std::optional<Date> date;
    };

    Target resolve(const EntryRef& ref);
    bool is_occurrence(const ScheduleEntry& master, const Date& d) const;
    std::optional<Date> first_occurrence(const ScheduleEntry& master) const;
    ScheduleEntry& require_series(Target& t) const;

    ScheduleEntry update_in_place(Target& t, const EntryChanges& changes);
    ScheduleEntry update_single(Target& t, const EntryChanges& changes);
    ScheduleEntry update_future(Target& t, const EntryChanges& changes);
    ScheduleEntry update_all(Target& t, const EntryChanges& changes);

    void remove_detached(Target& t);
    void remove_future(Target& t);
    void remove_series(const ScheduleEntry& master, bool with_splits);

    void move_exceptions(const std::string& series_id, const Date& from, const std::optional<std::string>& new_series, long shift_days);

    StoreTransaction& tx_;
    const recurrence::TimeZone& tz_;
    const recurrence::HolidayCalendar* holidays_;
};

}
