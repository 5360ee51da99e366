#pragma once

#include "AssigneeDirectory.h"
#include "ConflictDetector.h"
#include "Entry.h"
#include "Errors.h"
#include "Store.h"
#include "../recurrence/HolidayCalendar.h"
#include "../recurrence/TimeZone.h"
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scheduling {

struct ServiceLimits {
    size_t max_occurrences = 5000;
    int max_window_days = 731;
};

// Tenant -> wall-clock zone, with a default for tenants not listed.
class TenantTimeZones {
public:
    explicit TenantTimeZones(recurrence::TimeZone default_zone) : default_(std::move(default_zone)) {}
    void set(const std::string& tenant_id, recurrence::TimeZone tz) { zones_.insert_or_assign(tenant_id, std::move(tz)); }
    const recurrence::TimeZone& for_tenant(const std::string& tenant_id) const;
private:
    recurrence::TimeZone default_;
    std::map<std::string, recurrence::TimeZone> zones_;
};

struct MutationResult {
    ScheduleEntry entry;
    std::vector<ScheduleConflict> conflicts;
};

// Entry point for range queries and scoped mutations. Every call runs in one store
// transaction for the tenant; failures raise SchedulingError.
class SchedulingService {
public:
    SchedulingService(ScheduleStore& store,
                      const AssigneeDirectory& directory,
                      const TenantTimeZones& zones,
                      const recurrence::HolidayCalendar* holidays,
                      ServiceLimits limits = {});

    std::vector<EntryView> get_entries(const std::string& tenant_id, std::time_t from, std::time_t to);
    MutationResult create_entry(const std::string& tenant_id, ScheduleEntry draft);
    MutationResult update_entry(const std::string& tenant_id, const EntryRef& ref, const EntryChanges& changes, std::optional<EditScope> scope);
    void delete_entry(const std::string& tenant_id, const EntryRef& ref, std::optional<EditScope> scope);
    // Earliest persisted entry of the tenant, for calendar navigation.
    std::optional<ScheduleEntry> earliest_entry(const std::string& tenant_id);

    std::vector<ScheduleConflict> list_conflicts(const std::string& tenant_id, bool include_resolved);
    ScheduleConflict resolve_conflict(const std::string& tenant_id, const std::string& conflict_id, const std::string& resolution_notes);

private:
    std::vector<EntryView> collect(StoreTransaction& tx, const recurrence::TimeZone& tz, std::time_t from, std::time_t to);
    // Detects and records conflicts of `e`. A series is checked over its whole extent when
    // bounded, otherwise over max_window_days from `focus`.
    std::vector<ScheduleConflict> record_for(StoreTransaction& tx, const recurrence::TimeZone& tz, const ScheduleEntry& e, std::time_t focus);
    std::vector<Booking> own_bookings(StoreTransaction& tx, const recurrence::TimeZone& tz, const ScheduleEntry& e, std::time_t focus);
    void scan_others(StoreTransaction& tx, const recurrence::TimeZone& tz, const std::string& entry_id,
                     std::time_t from, std::time_t to, std::vector<Booking>& out);
    void check_window(std::time_t from, std::time_t to) const;
    void check_assignees(const std::string& tenant_id, const std::vector<std::string>& ids) const;

    ScheduleStore& store_;
    const AssigneeDirectory& directory_;
    const TenantTimeZones& zones_;
    const recurrence::HolidayCalendar* holidays_;
    ServiceLimits limits_;
};

}
