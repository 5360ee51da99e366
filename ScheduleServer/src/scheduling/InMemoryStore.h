#pragma once

#include "Store.h"
#include <map>
#include <mutex>
#include <unordered_map>

namespace scheduling {

// Process-local store. A transaction works on a copy of the tenant's rows and swaps it
// in on commit; transactions on the same tenant are serialized.
class InMemoryStore : public ScheduleStore {
public:
    struct TenantData {
        std::map<std::string, ScheduleEntry> entries;
        std::map<std::string, ScheduleConflict> conflicts;
    };

    std::unique_ptr<StoreTransaction> begin(const std::string& tenant_id) override;

    size_t entry_count(const std::string& tenant_id) const;

private:
    struct TenantSlot {
        std::mutex tx_mu;
        TenantData data;
    };
    TenantSlot& slot(const std::string& tenant_id);

    mutable std::mutex mu_;
    std::unordered_map<std::string, std::unique_ptr<TenantSlot>> tenants_;
};

}
