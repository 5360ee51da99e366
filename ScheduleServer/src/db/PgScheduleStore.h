#pragma once

#include "../scheduling/AssigneeDirectory.h"
#include "../scheduling/Store.h"
#include <libpq-fe.h>
#include <optional>
#include <string>
#include <vector>

namespace db {

// Store over one libpq connection owned by the caller (a DbPool worker). Each
// transaction is a BEGIN ... COMMIT block; statements are synchronous.
class PgScheduleStore : public scheduling::ScheduleStore {
public:
    explicit PgScheduleStore(PGconn* conn) : conn_(conn) {}
    std::unique_ptr<scheduling::StoreTransaction> begin(const std::string& tenant_id) override;
private:
    PGconn* conn_;
};

// Active users from tenant_users. A tenant with no users listed accepts any id.
class PgAssigneeDirectory : public scheduling::AssigneeDirectory {
public:
    explicit PgAssigneeDirectory(PGconn* conn) : conn_(conn) {}
    std::vector<std::string> unknown(const std::string& tenant_id, const std::vector<std::string>& user_ids) const override;
private:
    PGconn* conn_;
};

// PostgreSQL array text format helpers
std::string build_pg_array(const std::vector<std::string>& vals);
std::vector<std::string> parse_pg_array(const std::string& text);

}
