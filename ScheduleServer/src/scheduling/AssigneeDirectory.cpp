#include "AssigneeDirectory.h"

namespace scheduling {

std::vector<std::string> StaticAssigneeDirectory::unknown(const std::string& tenant_id, const std::vector<std::string>& user_ids) const {
    std::vector<std::string> out;
    auto it = rosters_.find(tenant_id);
    if (it == rosters_.end()) return out;
    for (const auto& id : user_ids) {
        if (!it->second.count(id)) out.push_back(id);
    }
    return out;
}

}
