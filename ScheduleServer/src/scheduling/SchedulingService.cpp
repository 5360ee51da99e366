#include "SchedulingService.h"
#include "ConflictDetector.h"
#include "EditScopeResolver.h"
#include "Ids.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"
#include "../recurrence/Expander.h"
#include "../recurrence/IsoTime.h"
#include <algorithm>
#include <set>
#include <unordered_map>

namespace scheduling {

using observability::log_error;
using observability::log_info;
using observability::log_warn;

namespace {

constexpr std::time_t kSecondsPerDay = 86400;
// 1900-01-01T00:00:00Z and 9999-01-01T00:00:00Z
constexpr std::time_t kEarliest = -2208988800LL;
constexpr std::time_t kLatest = 253370764800LL;
constexpr std::time_t kOwnScanDays = 31;
constexpr std::time_t kBatchSeconds = 31 * kSecondsPerDay;
constexpr std::time_t kMinScanSeconds = 3600;

bool in_supported_range(std::time_t t) {
    return t >= kEarliest && t < kLatest;
}

// Runs one operation, counting and logging failures. Anything that is not already a
// SchedulingError is reported as TransactionFailed; the store transaction has rolled back
// by the time the exception leaves `fn`.
template <typename Fn>
auto guarded(const char* op, const std::string& tenant_id, Fn fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const SchedulingError& e) {
        observability::Metrics::instance().inc_scheduling_error(error_code_name(e.code()));
        log_warn("scheduling.rejected", {{"op", std::string(op)}, {"tenant", tenant_id},
            {"code", std::string(error_code_name(e.code()))}, {"error", std::string(e.what())}});
        throw;
    } catch (const std::exception& e) {
        observability::Metrics::instance().inc_scheduling_error(error_code_name(ErrorCode::TransactionFailed));
        log_error("scheduling.transaction_failed", {{"op", std::string(op)}, {"tenant", tenant_id}, {"error", std::string(e.what())}});
        throw SchedulingError(ErrorCode::TransactionFailed, std::string(op) + " failed: " + e.what());
    }
}

bool view_less(const EntryView& a, const EntryView& b) {
    if (a.entry.scheduled_start != b.entry.scheduled_start) return a.entry.scheduled_start < b.entry.scheduled_start;
    if (a.ref.entry_id != b.ref.entry_id) return a.ref.entry_id < b.ref.entry_id;
    return a.ref.occurrence_date < b.ref.occurrence_date;
}

}

const recurrence::TimeZone& TenantTimeZones::for_tenant(const std::string& tenant_id) const {
    auto it = zones_.find(tenant_id);
    if (it != zones_.end()) return it->second;
    return default_;
}

SchedulingService::SchedulingService(ScheduleStore& store,
                                     const AssigneeDirectory& directory,
                                     const TenantTimeZones& zones,
                                     const recurrence::HolidayCalendar* holidays,
                                     ServiceLimits limits)
    : store_(store), directory_(directory), zones_(zones), holidays_(holidays), limits_(limits) {}

void SchedulingService::check_window(std::time_t from, std::time_t to) const {
    if (!in_supported_range(from) || !in_supported_range(to)) {
        throw SchedulingError(ErrorCode::InvalidEntry, "window outside the supported calendar range");
    }
    if (to <= from) throw SchedulingError(ErrorCode::InvalidEntry, "window end must be after window start");
    if (to - from > static_cast<std::time_t>(limits_.max_window_days) * kSecondsPerDay) {
        throw SchedulingError(ErrorCode::RangeTooLarge, "window exceeds " + std::to_string(limits_.max_window_days) + " days");
    }
}

void SchedulingService::check_assignees(const std::string& tenant_id, const std::vector<std::string>& ids) const {
    auto missing = directory_.unknown(tenant_id, ids);
    if (!missing.empty()) throw SchedulingError(ErrorCode::InvalidEntry, "unknown assignee: " + missing.front());
}

std::vector<EntryView> SchedulingService::collect(StoreTransaction& tx, const recurrence::TimeZone& tz, std::time_t from, std::time_t to) {
    const auto rows = tx.fetch_range(from, to);

    std::unordered_map<std::string, recurrence::OverrideMap> overrides;
    for (const auto& r : rows) {
        if (r.is_exception() && r.occurrence_date) overrides[*r.original_entry_id][*r.occurrence_date] = r.entry_id;
    }

    std::vector<EntryView> out;
    std::set<EntryRef> seen;
    size_t expanded = 0;
    recurrence::ExpansionContext ctx{tz, holidays_, limits_.max_occurrences};
    for (const auto& r : rows) {
        if (!r.is_master()) {
            if (r.scheduled_end <= from || r.scheduled_start >= to) continue;
            EntryRef ref{r.entry_id, std::nullopt};
            if (!seen.insert(ref).second) continue;
            out.push_back(EntryView{ref, r, false, {}});
            continue;
        }
        static const recurrence::OverrideMap kNone;
        auto ov = overrides.find(r.entry_id);
        std::vector<recurrence::Occurrence> occs;
        try {
            occs = recurrence::expand(*r.recurrence, series_anchor(r), from, to, ov == overrides.end() ? kNone : ov->second, ctx);
        } catch (const recurrence::ExpansionLimitExceeded& e) {
            throw SchedulingError(ErrorCode::RangeTooLarge, e.what());
        }
        for (auto& occ : occs) {
            // detached rows are listed on their own
            if (occ.override_entry_id) continue;
            EntryRef ref{r.entry_id, occ.anchor_date};
            if (!seen.insert(ref).second) continue;
            ScheduleEntry e = r;
            e.scheduled_start = occ.start;
            e.scheduled_end = occ.end;
            e.occurrence_date = occ.anchor_date;
            out.push_back(EntryView{ref, std::move(e), true, {}});
            if (++expanded > limits_.max_occurrences) {
                throw SchedulingError(ErrorCode::RangeTooLarge, "expansion exceeds " + std::to_string(limits_.max_occurrences) + " occurrences");
            }
        }
    }
    observability::Metrics::instance().add_occurrences_expanded(expanded);
    std::sort(out.begin(), out.end(), view_less);
    return out;
}

std::vector<EntryView> SchedulingService::get_entries(const std::string& tenant_id, std::time_t from, std::time_t to) {
    return guarded("get_entries", tenant_id, [&] {
        check_window(from, to);
        const auto& tz = zones_.for_tenant(tenant_id);
        auto tx = store_.begin(tenant_id);
        auto views = collect(*tx, tz, from, to);

        std::vector<Booking> bookings;
        bookings.reserve(views.size());
        for (const auto& v : views) bookings.push_back(booking_of(v));
        auto conflicts = detect_all(std::move(bookings));
        observability::Metrics::instance().add_conflicts_detected(conflicts.size());

        if (!conflicts.empty()) {
            std::unordered_map<std::string, ScheduleConflict> recorded;
            for (auto& c : tx->list_conflicts(true)) {
                std::string key = conflict_pair_key(c.entry_1, c.entry_2);
                recorded.emplace(std::move(key), std::move(c));
            }
            std::unordered_map<std::string, size_t> index;
            for (size_t i = 0; i < views.size(); ++i) index.emplace(to_string(views[i].ref), i);
            for (auto& c : conflicts) {
                auto rec = recorded.find(conflict_pair_key(c.entry_1, c.entry_2));
                if (rec != recorded.end()) {
                    c.conflict_id = rec->second.conflict_id;
                    c.resolved = rec->second.resolved;
                    c.resolution_notes = rec->second.resolution_notes;
                }
                for (const EntryRef* side : {&c.entry_1, &c.entry_2}) {
                    auto it = index.find(to_string(*side));
                    if (it != index.end()) views[it->second].conflicts.push_back(c);
                }
            }
        }
        observability::log_debug("scheduling.get_entries", {{"tenant", tenant_id}, {"items", int64_t(views.size())},
            {"conflicts", int64_t(conflicts.size())}});
        return views;
    });
}

// Own occurrences outside detached rows, walked in month-sized windows that shrink when
// one would exceed the expansion cap.
std::vector<Booking> SchedulingService::own_bookings(StoreTransaction& tx, const recurrence::TimeZone& tz, const ScheduleEntry& e, std::time_t focus) {
    std::vector<Booking> out;
    if (!e.is_master()) {
        out.push_back(booking_of(EntryView{EntryRef{e.entry_id, std::nullopt}, e, false, {}}));
        return out;
    }
    const auto& p = *e.recurrence;
    const bool bounded = p.end_date || p.occurrence_count;
    std::time_t cursor = bounded ? e.scheduled_start : std::max(focus, e.scheduled_start);
    const std::time_t horizon = bounded ? kLatest
        : std::min(kLatest, cursor + static_cast<std::time_t>(limits_.max_window_days) * kSecondsPerDay);

    recurrence::OverrideMap overrides;
    for (const auto& ex : tx.exceptions_of(e.entry_id)) {
        if (ex.occurrence_date) overrides[*ex.occurrence_date] = ex.entry_id;
    }
    auto exhausted = [&](const recurrence::Date& d) {
        if (p.end_date && d > *p.end_date) return true;
        return p.occurrence_count && recurrence::count_candidates_before(p, d) >= *p.occurrence_count;
    };
    recurrence::ExpansionContext ctx{tz, holidays_, limits_.max_occurrences};
    std::time_t step = kOwnScanDays * kSecondsPerDay;
    while (cursor < horizon && !exhausted(tz.local_date(cursor))) {
        const std::time_t next = std::min(horizon, cursor + step);
        std::vector<recurrence::Occurrence> occs;
        try {
            occs = recurrence::expand(p, series_anchor(e), cursor, next, overrides, ctx);
        } catch (const recurrence::ExpansionLimitExceeded& err) {
            if (step > kSecondsPerDay) {
                step /= 2;
                continue;
            }
            log_warn("scheduling.conflict_scan_truncated", {{"entry_id", e.entry_id}, {"error", std::string(err.what())}});
            return out;
        }
        for (const auto& occ : occs) {
            // the previous window already saw occurrences that started before this one
            if (occ.override_entry_id || occ.start < cursor) continue;
            ScheduleEntry slot = e;
            slot.scheduled_start = occ.start;
            slot.scheduled_end = occ.end;
            slot.occurrence_date = occ.anchor_date;
            out.push_back(booking_of(EntryView{EntryRef{e.entry_id, occ.anchor_date}, std::move(slot), true, {}}));
            if (out.size() >= limits_.max_occurrences) {
                log_warn("scheduling.conflict_scan_truncated", {{"entry_id", e.entry_id},
                    {"checked_until", recurrence::format_iso_z(occ.start)}});
                return out;
            }
        }
        cursor = next;
    }
    return out;
}

// Bookings of every other entry intersecting [from, to). A window holding more occurrences
// than the expansion cap is halved until it fits.
void SchedulingService::scan_others(StoreTransaction& tx, const recurrence::TimeZone& tz, const std::string& entry_id,
                                    std::time_t from, std::time_t to, std::vector<Booking>& out) {
    std::vector<EntryView> views;
    try {
        views = collect(tx, tz, from, to);
    } catch (const SchedulingError& err) {
        if (err.code() != ErrorCode::RangeTooLarge) throw;
        if (to - from <= kMinScanSeconds) {
            log_warn("scheduling.conflict_scan_skipped", {{"entry_id", entry_id},
                {"from", recurrence::format_iso_z(from)}, {"error", std::string(err.what())}});
            return;
        }
        const std::time_t mid = from + (to - from) / 2;
        scan_others(tx, tz, entry_id, from, mid, out);
        scan_others(tx, tz, entry_id, mid, to, out);
        return;
    }
    for (const auto& v : views) {
        if (v.ref.entry_id != entry_id) out.push_back(booking_of(v));
    }
}

std::vector<ScheduleConflict> SchedulingService::record_for(StoreTransaction& tx, const recurrence::TimeZone& tz, const ScheduleEntry& e, std::time_t focus) {
    const auto mine = own_bookings(tx, tz, e, focus);

    std::vector<ScheduleConflict> found;
    std::set<std::string> keys;
    // own bookings in batches spanning at most a month each
    size_t i = 0;
    while (i < mine.size()) {
        const std::time_t from = mine[i].start;
        std::time_t to = mine[i].end;
        size_t j = i + 1;
        while (j < mine.size() && mine[j].end - from <= kBatchSeconds) {
            to = std::max(to, mine[j].end);
            ++j;
        }
        std::vector<Booking> others;
        if (to > from) scan_others(tx, tz, e.entry_id, from, to, others);
        for (size_t k = i; k < j; ++k) {
            for (auto& c : detect(mine[k], others)) {
                if (keys.insert(conflict_pair_key(c.entry_1, c.entry_2)).second) found.push_back(std::move(c));
            }
        }
        i = j;
    }
    observability::Metrics::instance().add_conflicts_detected(found.size());
    if (found.empty()) return found;
    return tx.record_conflicts(found);
}

MutationResult SchedulingService::create_entry(const std::string& tenant_id, ScheduleEntry draft) {
    return guarded("create_entry", tenant_id, [&] {
        if (draft.original_entry_id || draft.occurrence_date) {
            throw SchedulingError(ErrorCode::InvalidEntry, "detached exceptions are created through single-scope edits");
        }
        if (!in_supported_range(draft.scheduled_start) || !in_supported_range(draft.scheduled_end)) {
            throw SchedulingError(ErrorCode::InvalidEntry, "time outside the supported calendar range");
        }
        const auto& tz = zones_.for_tenant(tenant_id);
        draft.tenant_id = tenant_id;
        draft.split_from_entry_id.reset();
        check_entry(draft);
        anchor_pattern(draft, tz);
        check_assignees(tenant_id, draft.assigned_user_ids);

        auto tx = store_.begin(tenant_id);
        draft.entry_id = new_id();
        tx->insert(draft);
        MutationResult result{draft, record_for(*tx, tz, draft, draft.scheduled_start)};
        tx->commit();
        log_info("entry.created", {{"tenant", tenant_id}, {"entry_id", draft.entry_id},
            {"recurring", int64_t(draft.is_master() ? 1 : 0)}, {"conflicts", int64_t(result.conflicts.size())}});
        return result;
    });
}

MutationResult SchedulingService::update_entry(const std::string& tenant_id, const EntryRef& ref, const EntryChanges& changes, std::optional<EditScope> scope) {
    return guarded("update_entry", tenant_id, [&] {
        if (changes.assigned_user_ids) check_assignees(tenant_id, normalize_assignees(*changes.assigned_user_ids));
        if ((changes.scheduled_start && !in_supported_range(*changes.scheduled_start))
            || (changes.scheduled_end && !in_supported_range(*changes.scheduled_end))) {
            throw SchedulingError(ErrorCode::InvalidEntry, "time outside the supported calendar range");
        }
        const auto& tz = zones_.for_tenant(tenant_id);
        auto tx = store_.begin(tenant_id);
        EditScopeResolver resolver(*tx, tz, holidays_);
        ScheduleEntry updated = resolver.update(ref, changes, scope);
        // the edited occurrence, not the series start, bounds the scan of an open-ended series
        std::time_t focus = updated.scheduled_start;
        if (updated.is_master() && updated.entry_id == ref.entry_id && ref.occurrence_date) {
            focus = recurrence::occurrence_on(series_anchor(updated), *ref.occurrence_date, tz).start;
            if (changes.scheduled_start) focus = std::min(focus, *changes.scheduled_start);
        }
        MutationResult result{updated, record_for(*tx, tz, updated, focus)};
        tx->commit();
        log_info("entry.updated", {{"tenant", tenant_id}, {"entry_id", to_string(ref)},
            {"scope", std::string(scope ? scope_name(*scope) : "none")}, {"result_id", updated.entry_id}});
        return result;
    });
}

void SchedulingService::delete_entry(const std::string& tenant_id, const EntryRef& ref, std::optional<EditScope> scope) {
    guarded("delete_entry", tenant_id, [&] {
        const auto& tz = zones_.for_tenant(tenant_id);
        auto tx = store_.begin(tenant_id);
        EditScopeResolver resolver(*tx, tz, holidays_);
        resolver.remove(ref, scope);
        tx->commit();
        log_info("entry.deleted", {{"tenant", tenant_id}, {"entry_id", to_string(ref)},
            {"scope", std::string(scope ? scope_name(*scope) : "none")}});
    });
}

std::optional<ScheduleEntry> SchedulingService::earliest_entry(const std::string& tenant_id) {
    return guarded("earliest_entry", tenant_id, [&] {
        auto tx = store_.begin(tenant_id);
        return tx->earliest();
    });
}

std::vector<ScheduleConflict> SchedulingService::list_conflicts(const std::string& tenant_id, bool include_resolved) {
    return guarded("list_conflicts", tenant_id, [&] {
        auto tx = store_.begin(tenant_id);
        return tx->list_conflicts(include_resolved);
    });
}

ScheduleConflict SchedulingService::resolve_conflict(const std::string& tenant_id, const std::string& conflict_id, const std::string& resolution_notes) {
    return guarded("resolve_conflict", tenant_id, [&] {
        auto tx = store_.begin(tenant_id);
        auto c = tx->resolve_conflict(conflict_id, resolution_notes);
        if (!c) throw SchedulingError(ErrorCode::NotFound, "conflict not found: " + conflict_id);
        tx->commit();
        log_info("conflict.resolved", {{"tenant", tenant_id}, {"conflict_id", conflict_id}});
        return *c;
    });
}

}
