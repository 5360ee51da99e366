#pragma once

#include "Entry.h"
#include <ctime>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace scheduling {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unit of work over one tenant's rows. Anything not committed is rolled back when the
// transaction is destroyed. Storage failures throw StoreError.
class StoreTransaction {
public:
    virtual ~StoreTransaction() = default;

    // Standalone entries and detached exceptions overlapping [from, to), plus every
    // master whose series may produce an occurrence there.
    virtual std::vector<ScheduleEntry> fetch_range(std::time_t from, std::time_t to) = 0;
    virtual std::optional<ScheduleEntry> find(const std::string& entry_id) = 0;
    virtual std::vector<ScheduleEntry> exceptions_of(const std::string& series_id) = 0;
    virtual std::vector<ScheduleEntry> masters_split_from(const std::string& series_id) = 0;
    // Row with the smallest scheduled_start, ties broken by entry id.
    virtual std::optional<ScheduleEntry> earliest() = 0;

    virtual void insert(const ScheduleEntry& e) = 0;
    virtual void update(const ScheduleEntry& e) = 0;
    // Also drops conflict records naming the entry.
    virtual void remove(const std::string& entry_id) = 0;

    // Upserts by unordered pair; returns the stored records with ids and resolution state.
    virtual std::vector<ScheduleConflict> record_conflicts(const std::vector<ScheduleConflict>& conflicts) = 0;
    virtual std::vector<ScheduleConflict> list_conflicts(bool include_resolved) = 0;
    virtual std::optional<ScheduleConflict> resolve_conflict(const std::string& conflict_id, const std::string& notes) = 0;

    virtual void commit() = 0;
};

class ScheduleStore {
public:
    virtual ~ScheduleStore() = default;
    virtual std::unique_ptr<StoreTransaction> begin(const std::string& tenant_id) = 0;
};

// False only when the master provably has no occurrence overlapping [from, to).
bool master_may_reach(const ScheduleEntry& master, std::time_t from, std::time_t to);

}
