#pragma once

#include <libpq-fe.h>
#include <optional>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <boost/asio.hpp>

namespace db {

using ResultPtr = std::shared_ptr<PGresult>;

struct DbResult {
    bool ok = false;
    std::string sqlstate;
    std::string message;
    std::vector<std::string> columns;
    std::vector<std::vector<std::optional<std::string>>> rows;
    int affected_rows = 0;
};

using DbResultCb = std::function<void(const boost::system::error_code&, DbResult)>;

DbResult to_db_result(PGresult* pr);

// Fixed set of worker threads, each owning one libpq connection. Work is queued and
// run on the first free worker; single-statement helpers post their result back to
// the application io_context.
class DbPool {
public:
    DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers = 4);
    ~DbPool();

    void async_exec(const std::string& sql, DbResultCb cb);
    void async_exec_params(const std::string& sql, std::vector<std::string> params, DbResultCb cb);

    using ScalarIntCb = std::function<void(const boost::system::error_code&, int)>;
    void async_scalar_int(const std::string& sql, ScalarIntCb cb);

    // Runs `task` on a worker with that worker's connection, reconnecting first when
    // needed. The connection is null when the database is unreachable; the task may
    // reset it to null after a fatal error. Delivering results is up to the task.
    using ConnTask = std::function<void(PGconn*&)>;
    void async_with_connection(ConnTask task);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
