#include "Entry.h"
#include <unordered_set>

namespace scheduling {

bool operator==(const WorkItemRef& a, const WorkItemRef& b) {
    return a.type == b.type && a.id == b.id;
}

bool operator==(const EntryRef& a, const EntryRef& b) {
    return a.entry_id == b.entry_id && a.occurrence_date == b.occurrence_date;
}

bool operator!=(const EntryRef& a, const EntryRef& b) {
    return !(a == b);
}

bool operator<(const EntryRef& a, const EntryRef& b) {
    if (a.entry_id != b.entry_id) return a.entry_id < b.entry_id;
    return a.occurrence_date < b.occurrence_date;
}

std::string to_string(const EntryRef& ref) {
    if (!ref.occurrence_date) return ref.entry_id;
    return ref.entry_id + "@" + recurrence::format_iso_date(*ref.occurrence_date);
}

const char* scope_name(EditScope scope) {
    switch (scope) {
        case EditScope::Single: return "single";
        case EditScope::Future: return "future";
        case EditScope::All: return "all";
    }
    return "single";
}

std::optional<EditScope> parse_scope(const std::string& s) {
    if (s == "single") return EditScope::Single;
    if (s == "future") return EditScope::Future;
    if (s == "all") return EditScope::All;
    return std::nullopt;
}

bool EntryChanges::empty() const {
    return !scheduled_start && !scheduled_end && !assigned_user_ids && !title && !notes
        && !status && !work_item && !recurrence;
}

std::string conflict_pair_key(const EntryRef& a, const EntryRef& b) {
    if (b < a) return to_string(b) + "|" + to_string(a);
    return to_string(a) + "|" + to_string(b);
}

std::vector<std::string> normalize_assignees(const std::vector<std::string>& ids) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& id : ids) {
        if (id.empty()) continue;
        if (seen.insert(id).second) out.push_back(id);
    }
    return out;
}

std::optional<std::string> validate_entry(const ScheduleEntry& e) {
    if (e.scheduled_end <= e.scheduled_start) return std::string("scheduled_end must be after scheduled_start");
    if (e.assigned_user_ids.empty()) return std::string("at least one assignee is required");
    if (e.recurrence && e.original_entry_id) return std::string("a detached exception cannot carry a recurrence pattern");
    if (e.original_entry_id.has_value() != e.occurrence_date.has_value()) {
        return std::string("original_entry_id and occurrence_date go together");
    }
    const auto& w = e.work_item;
    if (w.type == "ad_hoc") {
        if (w.id) return std::string("ad_hoc work items carry no id");
    } else if (w.type == "ticket" || w.type == "project_task") {
        if (!w.id || w.id->empty()) return std::string("work item id is required for " + w.type);
    } else {
        return std::string("unknown work item type: " + w.type);
    }
    if (e.status.empty()) return std::string("status must not be empty");
    return std::nullopt;
}

void apply_fields(ScheduleEntry& e, const EntryChanges& changes) {
    if (changes.scheduled_start) e.scheduled_start = *changes.scheduled_start;
    if (changes.scheduled_end) e.scheduled_end = *changes.scheduled_end;
    if (changes.assigned_user_ids) e.assigned_user_ids = normalize_assignees(*changes.assigned_user_ids);
    if (changes.title) e.title = *changes.title;
    if (changes.notes) e.notes = *changes.notes;
    if (changes.status) e.status = *changes.status;
    if (changes.work_item) e.work_item = *changes.work_item;
}

}
