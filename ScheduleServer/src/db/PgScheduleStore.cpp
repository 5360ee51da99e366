#include "PgScheduleStore.h"
#include "DbPool.h"
#include "../observability/Logging.h"
#include "../scheduling/Ids.h"
#include <memory>
#include <utility>
#include <variant>

namespace db {

using scheduling::EntryRef;
using scheduling::ScheduleConflict;
using scheduling::ScheduleEntry;
using scheduling::StoreError;

namespace {

using Param = std::optional<std::string>;

DbResult exec(PGconn* conn, const char* sql, const std::vector<Param>& params) {
    if (!conn) throw StoreError("database unavailable");
    std::vector<const char*> cparams;
    cparams.reserve(params.size());
    for (const auto& p : params) cparams.push_back(p ? p->c_str() : nullptr);
    ResultPtr rp(PQexecParams(conn, sql, int(cparams.size()), nullptr, cparams.data(), nullptr, nullptr, 0),
                 [](PGresult* p){ if (p) PQclear(p); });
    if (!rp) throw StoreError(std::string("connection lost: ") + PQerrorMessage(conn));
    DbResult r = to_db_result(rp.get());
    if (!r.ok) throw StoreError(r.sqlstate + " " + r.message);
    return r;
}

void exec_simple(PGconn* conn, const char* sql) {
    exec(conn, sql, {});
}

Param opt(const std::optional<std::string>& v) { return v; }

Param date_param(const std::optional<recurrence::Date>& d) {
    if (!d) return std::nullopt;
    return recurrence::format_iso_date(*d);
}

const std::string& col(const std::vector<std::optional<std::string>>& row, size_t i) {
    static const std::string empty;
    return row[i] ? *row[i] : empty;
}

std::optional<recurrence::Date> col_date(const std::vector<std::optional<std::string>>& row, size_t i) {
    if (!row[i]) return std::nullopt;
    auto d = recurrence::parse_iso_date(*row[i]);
    if (!d) throw StoreError("bad date in column " + std::to_string(i) + ": " + *row[i]);
    return d;
}

int64_t col_int(const std::vector<std::optional<std::string>>& row, size_t i) {
    try {
        return std::stoll(col(row, i));
    } catch (const std::exception&) {
        throw StoreError("bad integer in column " + std::to_string(i));
    }
}

bool col_bool(const std::vector<std::optional<std::string>>& row, size_t i) {
    return col(row, i) == "t";
}

const char* kEntryColumns =
    "SELECT e.entry_id, e.title, e.notes, e.status, "
    "extract(epoch from e.scheduled_start)::bigint, extract(epoch from e.scheduled_end)::bigint, "
    "e.work_item_type, e.work_item_id, e.original_entry_id, e.occurrence_date, e.split_from_entry_id, "
    "p.frequency, p.interval_n, p.start_date, p.end_date, p.occurrence_count, p.workdays_only, "
    "p.weekdays, p.day_of_month, p.exceptions, "
    "(SELECT coalesce(array_agg(a.user_id ORDER BY a.position), '{}') FROM schedule_entry_assignees a "
    " WHERE a.tenant = e.tenant AND a.entry_id = e.entry_id) "
    "FROM schedule_entries e LEFT JOIN recurrence_patterns p ON p.tenant = e.tenant AND p.entry_id = e.entry_id ";

ScheduleEntry row_to_entry(const std::vector<std::optional<std::string>>& row, const std::string& tenant) {
    if (row.size() < 21) throw StoreError("unexpected column count");
    ScheduleEntry e;
    e.tenant_id = tenant;
    e.entry_id = col(row, 0);
    e.title = col(row, 1);
    e.notes = col(row, 2);
    e.status = col(row, 3);
    e.scheduled_start = static_cast<std::time_t>(col_int(row, 4));
    e.scheduled_end = static_cast<std::time_t>(col_int(row, 5));
    e.work_item.type = col(row, 6);
    e.work_item.id = row[7];
    e.original_entry_id = row[8];
    e.occurrence_date = col_date(row, 9);
    e.split_from_entry_id = row[10];
    if (row[11]) {
        recurrence::Pattern p;
        auto freq = recurrence::frequency_from_name(*row[11]);
        if (!freq) throw StoreError("unknown frequency " + *row[11]);
        p.frequency = *freq;
        p.interval = static_cast<int>(col_int(row, 12));
        p.start_date = *col_date(row, 13);
        p.end_date = col_date(row, 14);
        if (row[15]) p.occurrence_count = static_cast<int>(col_int(row, 15));
        const int dom = static_cast<int>(col_int(row, 18));
        if (auto* d = std::get_if<recurrence::Daily>(&p.frequency)) {
            d->workdays_only = col_bool(row, 16);
        } else if (auto* w = std::get_if<recurrence::Weekly>(&p.frequency)) {
            for (const auto& s : parse_pg_array(col(row, 17))) w->weekdays.push_back(std::stoi(s));
        } else if (auto* m = std::get_if<recurrence::Monthly>(&p.frequency)) {
            m->day_of_month = dom;
        } else if (auto* y = std::get_if<recurrence::Yearly>(&p.frequency)) {
            y->day_of_month = dom;
        }
        for (const auto& s : parse_pg_array(col(row, 19))) {
            auto d = recurrence::parse_iso_date(s);
            if (!d) throw StoreError("bad exception date " + s);
            p.exceptions.insert(*d);
        }
        e.recurrence = std::move(p);
    }
    e.assigned_user_ids = parse_pg_array(col(row, 20));
    return e;
}

const char* kConflictColumns =
    "SELECT conflict_id, entry_1_id, entry_1_date, entry_2_id, entry_2_date, conflict_type, resolved, resolution_notes "
    "FROM schedule_conflicts ";

ScheduleConflict row_to_conflict(const std::vector<std::optional<std::string>>& row) {
    ScheduleConflict c;
    c.conflict_id = col(row, 0);
    c.entry_1 = EntryRef{col(row, 1), col_date(row, 2)};
    c.entry_2 = EntryRef{col(row, 3), col_date(row, 4)};
    c.conflict_type = col(row, 5);
    c.resolved = col_bool(row, 6);
    c.resolution_notes = col(row, 7);
    return c;
}

class PgTransaction : public scheduling::StoreTransaction {
public:
    PgTransaction(PGconn* conn, std::string tenant) : conn_(conn), tenant_(std::move(tenant)) {
        exec_simple(conn_, "BEGIN");
        try {
            exec_simple(conn_, "SET LOCAL datestyle = 'ISO, YMD'");
        } catch (const StoreError&) {
            rollback();
            throw;
        }
    }

    ~PgTransaction() override {
        if (!committed_) rollback();
    }

    std::vector<ScheduleEntry> fetch_range(std::time_t from, std::time_t to) override {
        std::string sql = std::string(kEntryColumns) +
            "WHERE e.tenant = $1 AND ("
            " (p.entry_id IS NULL AND e.scheduled_end > to_timestamp($2::bigint) AND e.scheduled_start < to_timestamp($3::bigint))"
            " OR (p.entry_id IS NOT NULL AND e.scheduled_start < to_timestamp($3::bigint)"
            "     AND (p.end_date IS NULL OR p.end_date >= (to_timestamp($2::bigint) - (e.scheduled_end - e.scheduled_start))::date - 2)))"
            " ORDER BY e.scheduled_start, e.entry_id";
        auto r = exec(conn_, sql.c_str(), {tenant_, std::to_string(from), std::to_string(to)});
        std::vector<ScheduleEntry> out;
        out.reserve(r.rows.size());
        for (const auto& row : r.rows) {
            auto e = row_to_entry(row, tenant_);
            if (e.is_master() && !scheduling::master_may_reach(e, from, to)) continue;
            out.push_back(std::move(e));
        }
        return out;
    }

    std::optional<ScheduleEntry> find(const std::string& entry_id) override {
        if (!scheduling::looks_like_id(entry_id)) return std::nullopt;
        std::string sql = std::string(kEntryColumns) + "WHERE e.tenant = $1 AND e.entry_id = $2::uuid";
        auto r = exec(conn_, sql.c_str(), {tenant_, entry_id});
        if (r.rows.empty()) return std::nullopt;
        return row_to_entry(r.rows[0], tenant_);
    }

    std::optional<ScheduleEntry> earliest() override {
        std::string sql = std::string(kEntryColumns) + "WHERE e.tenant = $1 ORDER BY e.scheduled_start, e.entry_id LIMIT 1";
        auto r = exec(conn_, sql.c_str(), {tenant_});
        if (r.rows.empty()) return std::nullopt;
        return row_to_entry(r.rows[0], tenant_);
    }

    std::vector<ScheduleEntry> exceptions_of(const std::string& series_id) override {
        std::string sql = std::string(kEntryColumns) + "WHERE e.tenant = $1 AND e.original_entry_id = $2::uuid ORDER BY e.occurrence_date";
        return select_entries(sql, series_id);
    }

    std::vector<ScheduleEntry> masters_split_from(const std::string& series_id) override {
        std::string sql = std::string(kEntryColumns) +
            "WHERE e.tenant = $1 AND e.split_from_entry_id = $2::uuid AND p.entry_id IS NOT NULL ORDER BY e.scheduled_start";
        return select_entries(sql, series_id);
    }

    void insert(const ScheduleEntry& e) override {
        exec(conn_,
            "INSERT INTO schedule_entries(tenant, entry_id, title, notes, status, scheduled_start, scheduled_end, "
            "work_item_type, work_item_id, original_entry_id, occurrence_date, split_from_entry_id) "
            "VALUES($1, $2::uuid, $3, $4, $5, to_timestamp($6::bigint), to_timestamp($7::bigint), $8, $9, $10::uuid, $11::date, $12::uuid)",
            entry_params(e));
        write_assignees(e);
        write_pattern(e);
    }

    void update(const ScheduleEntry& e) override {
        auto r = exec(conn_,
            "UPDATE schedule_entries SET title = $3, notes = $4, status = $5, "
            "scheduled_start = to_timestamp($6::bigint), scheduled_end = to_timestamp($7::bigint), "
            "work_item_type = $8, work_item_id = $9, original_entry_id = $10::uuid, occurrence_date = $11::date, "
            "split_from_entry_id = $12::uuid, updated_at = now() "
            "WHERE tenant = $1 AND entry_id = $2::uuid",
            entry_params(e));
        if (r.affected_rows == 0) throw StoreError("no entry " + e.entry_id);
        write_assignees(e);
        write_pattern(e);
    }

    void remove(const std::string& entry_id) override {
        auto r = exec(conn_, "DELETE FROM schedule_entries WHERE tenant = $1 AND entry_id = $2::uuid", {tenant_, entry_id});
        if (r.affected_rows == 0) throw StoreError("no entry " + entry_id);
    }

    // Insert-or-keep on the pair index; a pair committed by a concurrent writer is
    // read back instead of failing the unique constraint.
    std::vector<ScheduleConflict> record_conflicts(const std::vector<ScheduleConflict>& conflicts) override {
        std::vector<ScheduleConflict> out;
        for (auto c : conflicts) {
            if (c.entry_2 < c.entry_1) std::swap(c.entry_1, c.entry_2);
            auto inserted = exec(conn_,
                "INSERT INTO schedule_conflicts(tenant, conflict_id, entry_1_id, entry_1_date, entry_2_id, entry_2_date, conflict_type) "
                "VALUES($1, $2::uuid, $3::uuid, $4::date, $5::uuid, $6::date, $7) "
                "ON CONFLICT (tenant, entry_1_id, COALESCE(entry_1_date, DATE 'infinity'), "
                "entry_2_id, COALESCE(entry_2_date, DATE 'infinity')) DO NOTHING "
                "RETURNING conflict_id, entry_1_id, entry_1_date, entry_2_id, entry_2_date, conflict_type, resolved, resolution_notes",
                {tenant_, scheduling::new_id(), c.entry_1.entry_id, date_param(c.entry_1.occurrence_date),
                 c.entry_2.entry_id, date_param(c.entry_2.occurrence_date), c.conflict_type});
            if (!inserted.rows.empty()) {
                out.push_back(row_to_conflict(inserted.rows[0]));
                continue;
            }
            std::string sql = std::string(kConflictColumns) +
                "WHERE tenant = $1 AND entry_1_id = $2::uuid AND entry_1_date IS NOT DISTINCT FROM $3::date "
                "AND entry_2_id = $4::uuid AND entry_2_date IS NOT DISTINCT FROM $5::date";
            auto existing = exec(conn_, sql.c_str(), {tenant_, c.entry_1.entry_id, date_param(c.entry_1.occurrence_date),
                                                      c.entry_2.entry_id, date_param(c.entry_2.occurrence_date)});
            if (existing.rows.empty()) throw StoreError("conflict row vanished for " + c.entry_1.entry_id);
            out.push_back(row_to_conflict(existing.rows[0]));
        }
        return out;
    }

    std::vector<ScheduleConflict> list_conflicts(bool include_resolved) override {
        std::string sql = std::string(kConflictColumns) +
            "WHERE tenant = $1 AND ($2::boolean OR NOT resolved) ORDER BY created_at, conflict_id";
        auto r = exec(conn_, sql.c_str(), {tenant_, std::string(include_resolved ? "true" : "false")});
        std::vector<ScheduleConflict> out;
        for (const auto& row : r.rows) out.push_back(row_to_conflict(row));
        return out;
    }

    std::optional<ScheduleConflict> resolve_conflict(const std::string& conflict_id, const std::string& notes) override {
        if (!scheduling::looks_like_id(conflict_id)) return std::nullopt;
        auto r = exec(conn_,
            "UPDATE schedule_conflicts SET resolved = TRUE, resolution_notes = $3 "
            "WHERE tenant = $1 AND conflict_id = $2::uuid "
            "RETURNING conflict_id, entry_1_id, entry_1_date, entry_2_id, entry_2_date, conflict_type, resolved, resolution_notes",
            {tenant_, conflict_id, notes});
        if (r.rows.empty()) return std::nullopt;
        return row_to_conflict(r.rows[0]);
    }

    void commit() override {
        if (committed_) throw StoreError("transaction already committed");
        exec_simple(conn_, "COMMIT");
        committed_ = true;
    }

private:
    std::vector<ScheduleEntry> select_entries(const std::string& sql, const std::string& id) {
        std::vector<ScheduleEntry> out;
        if (!scheduling::looks_like_id(id)) return out;
        auto r = exec(conn_, sql.c_str(), {tenant_, id});
        for (const auto& row : r.rows) out.push_back(row_to_entry(row, tenant_));
        return out;
    }

    std::vector<Param> entry_params(const ScheduleEntry& e) const {
        return {tenant_, e.entry_id, e.title, e.notes, e.status,
                std::to_string(e.scheduled_start), std::to_string(e.scheduled_end),
                e.work_item.type, opt(e.work_item.id), opt(e.original_entry_id),
                date_param(e.occurrence_date), opt(e.split_from_entry_id)};
    }

    void write_assignees(const ScheduleEntry& e) {
        exec(conn_, "DELETE FROM schedule_entry_assignees WHERE tenant = $1 AND entry_id = $2::uuid", {tenant_, e.entry_id});
        exec(conn_,
            "INSERT INTO schedule_entry_assignees(tenant, entry_id, user_id, position) "
            "SELECT $1, $2::uuid, u, o::int FROM unnest($3::text[]) WITH ORDINALITY AS t(u, o)",
            {tenant_, e.entry_id, build_pg_array(e.assigned_user_ids)});
    }

    void write_pattern(const ScheduleEntry& e) {
        if (!e.recurrence) {
            exec(conn_, "DELETE FROM recurrence_patterns WHERE tenant = $1 AND entry_id = $2::uuid", {tenant_, e.entry_id});
            return;
        }
        const auto& p = *e.recurrence;
        std::vector<std::string> weekdays;
        std::vector<std::string> exceptions;
        int dom = 0;
        if (const auto* w = std::get_if<recurrence::Weekly>(&p.frequency)) {
            for (int wd : w->weekdays) weekdays.push_back(std::to_string(wd));
        } else if (const auto* m = std::get_if<recurrence::Monthly>(&p.frequency)) {
            dom = m->day_of_month;
        } else if (const auto* y = std::get_if<recurrence::Yearly>(&p.frequency)) {
            dom = y->day_of_month;
        }
        for (const auto& d : p.exceptions) exceptions.push_back(recurrence::format_iso_date(d));
        Param count;
        if (p.occurrence_count) count = std::to_string(*p.occurrence_count);
        exec(conn_,
            "INSERT INTO recurrence_patterns(tenant, entry_id, frequency, interval_n, start_date, end_date, occurrence_count, "
            "workdays_only, weekdays, day_of_month, exceptions) "
            "VALUES($1, $2::uuid, $3, $4::int, $5::date, $6::date, $7::int, $8::boolean, $9::smallint[], $10::smallint, $11::date[]) "
            "ON CONFLICT (tenant, entry_id) DO UPDATE SET frequency = EXCLUDED.frequency, interval_n = EXCLUDED.interval_n, "
            "start_date = EXCLUDED.start_date, end_date = EXCLUDED.end_date, occurrence_count = EXCLUDED.occurrence_count, "
            "workdays_only = EXCLUDED.workdays_only, weekdays = EXCLUDED.weekdays, day_of_month = EXCLUDED.day_of_month, "
            "exceptions = EXCLUDED.exceptions",
            {tenant_, e.entry_id, recurrence::frequency_name(p.frequency), std::to_string(p.interval),
             recurrence::format_iso_date(p.start_date), date_param(p.end_date), count,
             std::string(recurrence::workdays_only(p) ? "true" : "false"),
             build_pg_array(weekdays), std::to_string(dom), build_pg_array(exceptions)});
    }

    void rollback() {
        PGresult* r = PQexec(conn_, "ROLLBACK");
        if (!r || PQresultStatus(r) != PGRES_COMMAND_OK) {
            observability::log_warn("pgstore.rollback_failed", {{"tenant", tenant_}});
        }
        if (r) PQclear(r);
    }

    PGconn* conn_;
    std::string tenant_;
    bool committed_ = false;
};

}

std::string build_pg_array(const std::vector<std::string>& vals) {
    std::string out = "{";
    for (size_t i = 0; i < vals.size(); ++i) {
        if (i) out += ",";
        out += '"';
        for (char c : vals[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += "}";
    return out;
}

std::vector<std::string> parse_pg_array(const std::string& text) {
    std::vector<std::string> out;
    if (text.size() < 2 || text.front() != '{' || text.back() != '}') return out;
    size_t i = 1;
    const size_t end = text.size() - 1;
    while (i < end) {
        std::string item;
        if (text[i] == '"') {
            ++i;
            while (i < end && text[i] != '"') {
                if (text[i] == '\\' && i + 1 < end) ++i;
                item += text[i++];
            }
            ++i;
        } else {
            while (i < end && text[i] != ',') item += text[i++];
        }
        out.push_back(std::move(item));
        if (i < end && text[i] == ',') ++i;
    }
    return out;
}

std::unique_ptr<scheduling::StoreTransaction> PgScheduleStore::begin(const std::string& tenant_id) {
    if (!conn_) throw StoreError("database unavailable");
    return std::make_unique<PgTransaction>(conn_, tenant_id);
}

std::vector<std::string> PgAssigneeDirectory::unknown(const std::string& tenant_id, const std::vector<std::string>& user_ids) const {
    auto roster = exec(conn_, "SELECT EXISTS(SELECT 1 FROM tenant_users WHERE tenant = $1)", {tenant_id});
    if (roster.rows.empty() || col(roster.rows[0], 0) != "t") return {};
    auto r = exec(conn_,
        "SELECT u FROM unnest($2::text[]) WITH ORDINALITY AS t(u, o) "
        "WHERE NOT EXISTS (SELECT 1 FROM tenant_users tu WHERE tu.tenant = $1 AND tu.user_id = t.u AND NOT tu.is_inactive) "
        "ORDER BY o",
        {tenant_id, build_pg_array(user_ids)});
    std::vector<std::string> out;
    for (const auto& row : r.rows) out.push_back(col(row, 0));
    return out;
}

}
