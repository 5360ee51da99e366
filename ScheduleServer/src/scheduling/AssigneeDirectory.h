#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace scheduling {

// Validates assignee ids; never used to compute schedules.
class AssigneeDirectory {
public:
    virtual ~AssigneeDirectory() = default;
    // ids that are not active users of the tenant, in input order
    virtual std::vector<std::string> unknown(const std::string& tenant_id, const std::vector<std::string>& user_ids) const = 0;
};

// Fixed roster per tenant. A tenant without a roster accepts any id.
class StaticAssigneeDirectory : public AssigneeDirectory {
public:
    void add(const std::string& tenant_id, const std::string& user_id) { rosters_[tenant_id].insert(user_id); }
    std::vector<std::string> unknown(const std::string& tenant_id, const std::vector<std::string>& user_ids) const override;
private:
    std::map<std::string, std::set<std::string>> rosters_;
};

}
