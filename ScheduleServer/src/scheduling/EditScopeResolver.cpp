#include "EditScopeResolver.h"
#include "Ids.h"

namespace scheduling {

using recurrence::Pattern;

namespace {

constexpr size_t kFirstOccurrenceProbe = 64;

EntryChanges without_times(EntryChanges changes) {
    changes.scheduled_start.reset();
    changes.scheduled_end.reset();
    return changes;
}

// Moves the series by whole days: start date, weekday set and cancelled dates follow.
void shift_pattern(Pattern& p, long days) {
    if (days == 0) return;
    p.start_date = p.start_date + boost::gregorian::days(days);
    if (auto* w = std::get_if<recurrence::Weekly>(&p.frequency)) {
        for (int& wd : w->weekdays) wd = static_cast<int>(((wd + days) % 7 + 7) % 7);
    } else if (auto* m = std::get_if<recurrence::Monthly>(&p.frequency)) {
        m->day_of_month = 0;
    } else if (auto* y = std::get_if<recurrence::Yearly>(&p.frequency)) {
        y->day_of_month = 0;
    }
    std::set<Date> moved;
    for (const Date& d : p.exceptions) moved.insert(d + boost::gregorian::days(days));
    p.exceptions = std::move(moved);
}

}

recurrence::SeriesAnchor series_anchor(const ScheduleEntry& master) {
    return recurrence::SeriesAnchor{master.scheduled_start, master.scheduled_end};
}

void anchor_pattern(ScheduleEntry& e, const recurrence::TimeZone& tz) {
    if (!e.recurrence) return;
    Pattern& p = *e.recurrence;
    const Date local = tz.local_date(e.scheduled_start);
    if (p.start_date.is_special()) {
        p.start_date = local;
    } else if (p.start_date != local) {
        throw SchedulingError(ErrorCode::InvalidPattern, "start_date must be the local date of scheduled_start");
    }
    if (auto err = recurrence::validate_pattern(p)) throw SchedulingError(ErrorCode::InvalidPattern, *err);
}

void check_entry(ScheduleEntry& e) {
    e.assigned_user_ids = normalize_assignees(e.assigned_user_ids);
    if (auto err = validate_entry(e)) throw SchedulingError(ErrorCode::InvalidEntry, *err);
}

bool EditScopeResolver::is_occurrence(const ScheduleEntry& master, const Date& d) const {
    const Pattern& p = *master.recurrence;
    return recurrence::is_candidate(p, d) && !recurrence::is_skipped(p, d, holidays_);
}

std::optional<Date> EditScopeResolver::first_occurrence(const ScheduleEntry& master) const {
    const Pattern& p = *master.recurrence;
    for (const Date& d : recurrence::candidates_between(p, p.start_date, Date(9999, 12, 31), kFirstOccurrenceProbe)) {
        if (!recurrence::is_skipped(p, d, holidays_)) return d;
    }
    return std::nullopt;
}

EditScopeResolver::Target EditScopeResolver::resolve(const EntryRef& ref) {
    auto row = tx_.find(ref.entry_id);
    if (!row) throw SchedulingError(ErrorCode::NotFound, "entry not found: " + ref.entry_id);
    Target t;
    t.row = *row;
    if (row->is_master()) {
        t.series = *row;
        if (ref.occurrence_date) {
            if (!is_occurrence(*row, *ref.occurrence_date)) {
                // an already detached occurrence is addressed through its own row
                for (auto& ex : tx_.exceptions_of(row->entry_id)) {
                    if (ex.occurrence_date == ref.occurrence_date) {
                        t.row = std::move(ex);
                        t.date = ref.occurrence_date;
                        return t;
                    }
                }
                throw SchedulingError(ErrorCode::NotFound, "no occurrence on " + recurrence::format_iso_date(*ref.occurrence_date));
            }
            t.date = ref.occurrence_date;
        } else {
            t.date = first_occurrence(*row);
            if (!t.date) throw SchedulingError(ErrorCode::NotFound, "series has no remaining occurrences");
        }
    } else if (row->is_exception()) {
        if (ref.occurrence_date && ref.occurrence_date != row->occurrence_date) {
            throw SchedulingError(ErrorCode::NotFound, "occurrence does not match the detached entry");
        }
        t.date = row->occurrence_date;
        auto master = tx_.find(*row->original_entry_id);
        if (master && master->is_master()) t.series = std::move(*master);
    } else if (ref.occurrence_date) {
        throw SchedulingError(ErrorCode::NotFound, "entry is not recurring: " + ref.entry_id);
    }
    return t;
}

ScheduleEntry& EditScopeResolver::require_series(Target& t) const {
    if (!t.series || !t.date) throw SchedulingError(ErrorCode::InvalidScope, "entry is not part of a recurring series");
    return *t.series;
}

ScheduleEntry EditScopeResolver::update(const EntryRef& ref, const EntryChanges& changes, std::optional<EditScope> scope) {
    Target t = resolve(ref);
    if (!scope) return update_in_place(t, changes);
    switch (*scope) {
        case EditScope::Single: return update_single(t, changes);
        case EditScope::Future: return update_future(t, changes);
        case EditScope::All: return update_all(t, changes);
    }
    throw SchedulingError(ErrorCode::InvalidScope, "unknown scope");
}

ScheduleEntry EditScopeResolver::update_in_place(Target& t, const EntryChanges& changes) {
    if (t.row.is_master()) throw SchedulingError(ErrorCode::InvalidScope, "editing a recurring series requires a scope");
    ScheduleEntry e = t.row;
    apply_fields(e, changes);
    if (changes.recurrence && changes.recurrence->has_value()) {
        if (e.is_exception()) throw SchedulingError(ErrorCode::InvalidPattern, "a detached exception cannot carry a recurrence pattern");
        e.recurrence = **changes.recurrence;
    }
    check_entry(e);
    anchor_pattern(e, tz_);
    tx_.update(e);
    return e;
}

ScheduleEntry EditScopeResolver::update_single(Target& t, const EntryChanges& changes) {
    if (t.row.is_standalone()) throw SchedulingError(ErrorCode::InvalidScope, "entry is not part of a recurring series");
    if (changes.recurrence && changes.recurrence->has_value()) {
        throw SchedulingError(ErrorCode::InvalidPattern, "a single occurrence cannot carry a recurrence pattern");
    }
    if (t.row.is_exception()) {
        ScheduleEntry e = t.row;
        apply_fields(e, changes);
        check_entry(e);
        tx_.update(e);
        return e;
    }

    ScheduleEntry& master = require_series(t);
    const Date d = *t.date;
    auto occ = recurrence::occurrence_on(series_anchor(master), d, tz_);
    ScheduleEntry ex = master;
    ex.entry_id = new_id();
    ex.recurrence.reset();
    ex.split_from_entry_id.reset();
    ex.original_entry_id = master.entry_id;
    ex.occurrence_date = d;
    ex.scheduled_start = occ.start;
    ex.scheduled_end = occ.end;
    apply_fields(ex, changes);
    check_entry(ex);

    master.recurrence->exceptions.insert(d);
    tx_.update(master);
    tx_.insert(ex);
    return ex;
}

ScheduleEntry EditScopeResolver::update_future(Target& t, const EntryChanges& changes) {
    ScheduleEntry& master = require_series(t);
    const Date d = *t.date;
    const Pattern& p = *master.recurrence;
    if (recurrence::count_candidates_before(p, d) == 0) return update_all(t, changes);

    Pattern head = p;
    Pattern tail = recurrence::tail_pattern(p, d);
    recurrence::truncate_before(head, d);

    auto occ = recurrence::occurrence_on(series_anchor(master), d, tz_);
    ScheduleEntry next = master;
    next.entry_id = new_id();
    next.split_from_entry_id = master.entry_id;
    next.scheduled_start = occ.start;
    next.scheduled_end = occ.end;
    apply_fields(next, changes);

    const long shift = (tz_.local_date(next.scheduled_start) - d).days();
    if (changes.recurrence) {
        if (changes.recurrence->has_value()) {
            Pattern np = **changes.recurrence;
            for (const Date& x : tail.exceptions) np.exceptions.insert(x + boost::gregorian::days(shift));
            next.recurrence = np;
        } else {
            next.recurrence.reset();
        }
    } else {
        shift_pattern(tail, shift);
        next.recurrence = tail;
    }
    check_entry(next);
    anchor_pattern(next, tz_);

    master.recurrence = head;
    tx_.insert(next);
    tx_.update(master);
    std::optional<std::string> new_series;
    if (next.is_master()) new_series = next.entry_id;
    move_exceptions(master.entry_id, d, new_series, shift);
    if (next.is_master()) {
        for (auto child : tx_.masters_split_from(master.entry_id)) {
            if (child.entry_id == next.entry_id) continue;
            child.split_from_entry_id = next.entry_id;
            tx_.update(child);
        }
    }
    return next;
}

ScheduleEntry EditScopeResolver::update_all(Target& t, const EntryChanges& changes) {
    ScheduleEntry& master = require_series(t);
    const Date d = *t.date;
    const Date old_start = master.recurrence->start_date;

    if (changes.changes_times()) {
        auto occ = recurrence::occurrence_on(series_anchor(master), d, tz_);
        const std::time_t delta_start = changes.scheduled_start ? *changes.scheduled_start - occ.start : 0;
        const std::time_t delta_end = changes.scheduled_end ? *changes.scheduled_end - occ.end : delta_start;
        master.scheduled_start += delta_start;
        master.scheduled_end += delta_end;
    }
    apply_fields(master, without_times(changes));
    const long shift = (tz_.local_date(master.scheduled_start) - old_start).days();

    if (changes.recurrence && !changes.recurrence->has_value()) {
        master.recurrence.reset();
        check_entry(master);
        tx_.update(master);
        move_exceptions(master.entry_id, old_start, std::nullopt, 0);
        return master;
    }

    if (changes.recurrence) {
        Pattern np = **changes.recurrence;
        for (const Date& x : master.recurrence->exceptions) np.exceptions.insert(x + boost::gregorian::days(shift));
        master.recurrence = np;
    } else {
        shift_pattern(*master.recurrence, shift);
    }
    check_entry(master);
    anchor_pattern(master, tz_);
    tx_.update(master);
    if (shift != 0) move_exceptions(master.entry_id, old_start, master.entry_id, shift);
    return master;
}

void EditScopeResolver::move_exceptions(const std::string& series_id, const Date& from, const std::optional<std::string>& new_series, long shift_days) {
    for (auto ex : tx_.exceptions_of(series_id)) {
        if (!ex.occurrence_date || *ex.occurrence_date < from) continue;
        if (new_series) {
            ex.original_entry_id = *new_series;
            ex.occurrence_date = *ex.occurrence_date + boost::gregorian::days(shift_days);
        } else {
            ex.original_entry_id.reset();
            ex.occurrence_date.reset();
        }
        tx_.update(ex);
    }
}

void EditScopeResolver::remove(const EntryRef& ref, std::optional<EditScope> scope) {
    Target t = resolve(ref);
    if (!scope) {
        if (t.row.is_master()) throw SchedulingError(ErrorCode::InvalidScope, "deleting a recurring series requires a scope");
        if (t.row.is_exception()) remove_detached(t);
        else tx_.remove(t.row.entry_id);
        return;
    }
    switch (*scope) {
        case EditScope::Single:
            if (t.row.is_standalone()) throw SchedulingError(ErrorCode::InvalidScope, "entry is not part of a recurring series");
            if (t.row.is_exception()) {
                remove_detached(t);
            } else {
                ScheduleEntry& master = require_series(t);
                master.recurrence->exceptions.insert(*t.date);
                tx_.update(master);
            }
            return;
        case EditScope::Future:
            remove_future(t);
            return;
        case EditScope::All:
            remove_series(require_series(t), false);
            return;
    }
}

void EditScopeResolver::remove_detached(Target& t) {
    if (t.series && t.date && !t.series->recurrence->exceptions.count(*t.date)) {
        t.series->recurrence->exceptions.insert(*t.date);
        tx_.update(*t.series);
    }
    tx_.remove(t.row.entry_id);
}

void EditScopeResolver::remove_future(Target& t) {
    ScheduleEntry& master = require_series(t);
    const Date d = *t.date;
    if (!recurrence::truncate_before(*master.recurrence, d)) {
        remove_series(master, true);
        return;
    }
    for (const auto& ex : tx_.exceptions_of(master.entry_id)) {
        if (ex.occurrence_date && *ex.occurrence_date >= d) tx_.remove(ex.entry_id);
    }
    for (const auto& child : tx_.masters_split_from(master.entry_id)) {
        if (child.recurrence && child.recurrence->start_date >= d) remove_series(child, true);
    }
    tx_.update(master);
}

void EditScopeResolver::remove_series(const ScheduleEntry& master, bool with_splits) {
    if (with_splits) {
        for (const auto& child : tx_.masters_split_from(master.entry_id)) remove_series(child, true);
    }
    for (const auto& ex : tx_.exceptions_of(master.entry_id)) tx_.remove(ex.entry_id);
    tx_.remove(master.entry_id);
}

}
