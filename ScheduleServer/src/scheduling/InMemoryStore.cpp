#include "InMemoryStore.h"
#include "Ids.h"
#include <utility>

namespace scheduling {

namespace {

bool overlaps(const ScheduleEntry& e, std::time_t from, std::time_t to) {
    return e.scheduled_end > from && e.scheduled_start < to;
}

class InMemoryTransaction : public StoreTransaction {
public:
    InMemoryTransaction(std::unique_lock<std::mutex> lock, InMemoryStore::TenantData& live, std::string tenant)
        : lock_(std::move(lock)), live_(live), work_(live), tenant_(std::move(tenant)) {}

    std::vector<ScheduleEntry> fetch_range(std::time_t from, std::time_t to) override {
        std::vector<ScheduleEntry> out;
        for (const auto& kv : work_.entries) {
            const auto& e = kv.second;
            if (e.is_master() ? master_may_reach(e, from, to) : overlaps(e, from, to)) out.push_back(e);
        }
        return out;
    }

    std::optional<ScheduleEntry> find(const std::string& entry_id) override {
        auto it = work_.entries.find(entry_id);
        if (it == work_.entries.end()) return std::nullopt;
        return it->second;
    }

    std::optional<ScheduleEntry> earliest() override {
        const ScheduleEntry* best = nullptr;
        for (const auto& kv : work_.entries) {
            const auto& e = kv.second;
            if (!best || e.scheduled_start < best->scheduled_start
                || (e.scheduled_start == best->scheduled_start && e.entry_id < best->entry_id)) {
                best = &e;
            }
        }
        if (!best) return std::nullopt;
        return *best;
    }

    std::vector<ScheduleEntry> exceptions_of(const std::string& series_id) override {
        std::vector<ScheduleEntry> out;
        for (const auto& kv : work_.entries) {
            if (kv.second.original_entry_id == series_id) out.push_back(kv.second);
        }
        return out;
    }

    std::vector<ScheduleEntry> masters_split_from(const std::string& series_id) override {
        std::vector<ScheduleEntry> out;
        for (const auto& kv : work_.entries) {
            if (kv.second.is_master() && kv.second.split_from_entry_id == series_id) out.push_back(kv.second);
        }
        return out;
    }

    void insert(const ScheduleEntry& e) override {
        if (work_.entries.count(e.entry_id)) throw StoreError("duplicate entry id " + e.entry_id);
        if (e.original_entry_id) {
            for (const auto& kv : work_.entries) {
                if (kv.second.original_entry_id == e.original_entry_id && kv.second.occurrence_date == e.occurrence_date) {
                    throw StoreError("occurrence already detached");
                }
            }
        }
        ScheduleEntry row = e;
        row.tenant_id = tenant_;
        work_.entries.emplace(row.entry_id, std::move(row));
    }

    void update(const ScheduleEntry& e) override {
        auto it = work_.entries.find(e.entry_id);
        if (it == work_.entries.end()) throw StoreError("no entry " + e.entry_id);
        it->second = e;
        it->second.tenant_id = tenant_;
    }

    void remove(const std::string& entry_id) override {
        if (work_.entries.erase(entry_id) == 0) throw StoreError("no entry " + entry_id);
        for (auto it = work_.conflicts.begin(); it != work_.conflicts.end();) {
            if (it->second.involves(entry_id)) it = work_.conflicts.erase(it);
            else ++it;
        }
    }

    std::vector<ScheduleConflict> record_conflicts(const std::vector<ScheduleConflict>& conflicts) override {
        std::vector<ScheduleConflict> out;
        for (const auto& c : conflicts) {
            const std::string key = conflict_pair_key(c.entry_1, c.entry_2);
            auto found = work_.conflicts.end();
            for (auto it = work_.conflicts.begin(); it != work_.conflicts.end(); ++it) {
                if (conflict_pair_key(it->second.entry_1, it->second.entry_2) == key) { found = it; break; }
            }
            if (found != work_.conflicts.end()) {
                out.push_back(found->second);
                continue;
            }
            ScheduleConflict stored = c;
            if (stored.entry_2 < stored.entry_1) std::swap(stored.entry_1, stored.entry_2);
            stored.conflict_id = new_id();
            work_.conflicts.emplace(stored.conflict_id, stored);
            out.push_back(std::move(stored));
        }
        return out;
    }

    std::vector<ScheduleConflict> list_conflicts(bool include_resolved) override {
        std::vector<ScheduleConflict> out;
        for (const auto& kv : work_.conflicts) {
            if (include_resolved || !kv.second.resolved) out.push_back(kv.second);
        }
        return out;
    }

    std::optional<ScheduleConflict> resolve_conflict(const std::string& conflict_id, const std::string& notes) override {
        auto it = work_.conflicts.find(conflict_id);
        if (it == work_.conflicts.end()) return std::nullopt;
        it->second.resolved = true;
        it->second.resolution_notes = notes;
        return it->second;
    }

    void commit() override {
        if (committed_) throw StoreError("transaction already committed");
        live_ = std::move(work_);
        committed_ = true;
    }

private:
    std::unique_lock<std::mutex> lock_;
    InMemoryStore::TenantData& live_;
    InMemoryStore::TenantData work_;
    std::string tenant_;
    bool committed_ = false;
};

}

InMemoryStore::TenantSlot& InMemoryStore::slot(const std::string& tenant_id) {
    std::lock_guard lk(mu_);
    auto& s = tenants_[tenant_id];
    if (!s) s = std::make_unique<TenantSlot>();
    return *s;
}

std::unique_ptr<StoreTransaction> InMemoryStore::begin(const std::string& tenant_id) {
    TenantSlot& s = slot(tenant_id);
    std::unique_lock<std::mutex> lock(s.tx_mu);
    return std::make_unique<InMemoryTransaction>(std::move(lock), s.data, tenant_id);
}

size_t InMemoryStore::entry_count(const std::string& tenant_id) const {
    std::lock_guard lk(mu_);
    auto it = tenants_.find(tenant_id);
    if (it == tenants_.end()) return 0;
    std::lock_guard tx(it->second->tx_mu);
    return it->second->data.entries.size();
}

}
