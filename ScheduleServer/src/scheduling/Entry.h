#pragma once

#include "../recurrence/Pattern.h"
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace scheduling {

using recurrence::Date;

// Opaque link to the work being scheduled.
struct WorkItemRef {
    std::string type = "ad_hoc"; // ticket | project_task | ad_hoc
    std::optional<std::string> id;
};

bool operator==(const WorkItemRef& a, const WorkItemRef& b);

// A standalone entry, a recurrence master (has a pattern) or a detached exception
// (has original_entry_id + occurrence_date).
struct ScheduleEntry {
    std::string entry_id;
    std::string tenant_id;
    std::optional<std::string> original_entry_id;
    std::optional<Date> occurrence_date;
    std::optional<std::string> split_from_entry_id;
    std::optional<recurrence::Pattern> recurrence;
    std::time_t scheduled_start = 0;
    std::time_t scheduled_end = 0;
    std::vector<std::string> assigned_user_ids;
    std::string title;
    std::string notes;
    std::string status = "scheduled";
    WorkItemRef work_item;

    bool is_master() const { return recurrence.has_value(); }
    bool is_exception() const { return original_entry_id.has_value(); }
    bool is_standalone() const { return !is_master() && !is_exception(); }
};

// Row id, or {series id, occurrence date} for a virtual instance.
struct EntryRef {
    std::string entry_id;
    std::optional<Date> occurrence_date;

    bool is_virtual() const { return occurrence_date.has_value(); }
};

bool operator==(const EntryRef& a, const EntryRef& b);
bool operator!=(const EntryRef& a, const EntryRef& b);
bool operator<(const EntryRef& a, const EntryRef& b);
std::string to_string(const EntryRef& ref);

enum class EditScope { Single, Future, All };

const char* scope_name(EditScope scope);
std::optional<EditScope> parse_scope(const std::string& s);

// Fields to change; unset members are left alone. `recurrence` holding an empty
// optional clears the pattern.
struct EntryChanges {
    std::optional<std::time_t> scheduled_start;
    std::optional<std::time_t> scheduled_end;
    std::optional<std::vector<std::string>> assigned_user_ids;
    std::optional<std::string> title;
    std::optional<std::string> notes;
    std::optional<std::string> status;
    std::optional<WorkItemRef> work_item;
    std::optional<std::optional<recurrence::Pattern>> recurrence;

    bool empty() const;
    bool changes_times() const { return scheduled_start.has_value() || scheduled_end.has_value(); }
};

struct ScheduleConflict {
    std::string conflict_id;
    EntryRef entry_1;
    EntryRef entry_2;
    std::string conflict_type = "double_booking";
    bool resolved = false;
    std::string resolution_notes;

    bool involves(const std::string& entry_id) const {
        return entry_1.entry_id == entry_id || entry_2.entry_id == entry_id;
    }
};

// "a|b" with the smaller reference first; identifies the unordered pair.
std::string conflict_pair_key(const EntryRef& a, const EntryRef& b);

// One item of a range query. For a virtual instance `entry` is the master with the
// occurrence's times and occurrence_date filled in.
struct EntryView {
    EntryRef ref;
    ScheduleEntry entry;
    bool is_virtual = false;
    std::vector<ScheduleConflict> conflicts;
};

// Drops empty ids and repeats, keeping the first occurrence of each.
std::vector<std::string> normalize_assignees(const std::vector<std::string>& ids);

// nullopt when the entry satisfies its invariants; the pattern is checked separately.
std::optional<std::string> validate_entry(const ScheduleEntry& e);

// Copies every field set in `changes` except the pattern.
void apply_fields(ScheduleEntry& e, const EntryChanges& changes);

}
