#include "DbPool.h"
#include <condition_variable>
#include <cstdlib>
#include <mutex>
#include <queue>
#include <thread>
#include "../observability/Logging.h"

namespace db {

static void post_db_result(boost::asio::io_context& ioc, DbResultCb cb, boost::system::error_code ec, DbResult&& r) {
    boost::asio::post(ioc, [cb, ec, r = std::move(r)]() mutable {
        cb(ec, std::move(r));
    });
}

DbResult to_db_result(PGresult* pr) {
    DbResult r;
    if (!pr) return r;
    ExecStatusType st = PQresultStatus(pr);
    r.ok = (st == PGRES_TUPLES_OK || st == PGRES_COMMAND_OK);
    const char* ss = PQresultErrorField(pr, PG_DIAG_SQLSTATE);
    r.sqlstate = ss ? ss : std::string();
    const char* msg = PQresultErrorMessage(pr);
    r.message = msg ? msg : std::string();
    int nfields = PQnfields(pr);
    for (int i = 0; i < nfields; ++i) r.columns.emplace_back(PQfname(pr, i) ? PQfname(pr, i) : "");
    int ntuples = PQntuples(pr);
    r.rows.reserve(ntuples);
    for (int i = 0; i < ntuples; ++i) {
        std::vector<std::optional<std::string>> row;
        row.reserve(nfields);
        for (int j = 0; j < nfields; ++j) {
            if (PQgetisnull(pr, i, j)) row.emplace_back(std::nullopt);
            else row.emplace_back(std::string(PQgetvalue(pr, i, j)));
        }
        r.rows.emplace_back(std::move(row));
    }
    if (st == PGRES_COMMAND_OK) {
        char* ct = PQcmdTuples(pr);
        r.affected_rows = ct ? std::atoi(ct) : 0;
    } else {
        r.affected_rows = ntuples;
    }
    return r;
}

struct DbPool::Impl {
    boost::asio::io_context& app_ioc;
    std::string conninfo;
    int workers = 2;

    std::queue<ConnTask> tasks;
    std::mutex mu_tasks;
    std::condition_variable cv_tasks;
    bool stopping = false;

    std::vector<std::thread> threads;

    Impl(boost::asio::io_context& ioc, const std::string& ci, int workers_)
        : app_ioc(ioc), conninfo(ci), workers(workers_) {
        for (int i = 0; i < workers; ++i) threads.emplace_back([this]{ this->worker_loop(); });
    }

    ~Impl() {
        { std::lock_guard<std::mutex> lk(mu_tasks); stopping = true; }
        cv_tasks.notify_all();
        for (auto& t : threads) if (t.joinable()) t.join();
    }

    PGconn* connect_one() {
        PGconn* c = PQconnectdb(conninfo.c_str());
        if (c == nullptr) return nullptr;
        if (PQstatus(c) != CONNECTION_OK) {
            observability::log_warn("dbpool.connect_failed", {{"error", std::string(PQerrorMessage(c))}});
            PQfinish(c);
            return nullptr;
        }
        return c;
    }

    void worker_loop() {
        PGconn* local_conn = connect_one();
        observability::log_info("dbpool.worker_started", {{"local_conn", local_conn ? std::string("ok") : std::string("null")}});
        while (true) {
            ConnTask task;
            {
                std::unique_lock<std::mutex> lk(mu_tasks);
                cv_tasks.wait(lk, [this]{ return stopping || !tasks.empty(); });
                if (stopping && tasks.empty()) {
                    if (local_conn) { PQfinish(local_conn); local_conn = nullptr; }
                    return;
                }
                task = std::move(tasks.front());
                tasks.pop();
            }
            if (local_conn && PQstatus(local_conn) != CONNECTION_OK) {
                PQreset(local_conn);
                if (PQstatus(local_conn) != CONNECTION_OK) { PQfinish(local_conn); local_conn = nullptr; }
            }
            if (!local_conn) local_conn = connect_one();
            try {
                task(local_conn);
            } catch (const std::exception& e) {
                observability::log_error(std::string("db task exception: ") + e.what());
            }
        }
    }

    void post_task(ConnTask f) {
        {
            std::lock_guard<std::mutex> lk(mu_tasks);
            tasks.push(std::move(f));
        }
        cv_tasks.notify_one();
    }
};

DbPool::DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers) {
    impl_ = std::make_unique<Impl>(app_ioc, conninfo, workers);
}

DbPool::~DbPool() = default;

void DbPool::async_with_connection(ConnTask task) {
    impl_->post_task(std::move(task));
}

void DbPool::async_exec(const std::string& sql, DbResultCb cb) {
    async_exec_params(sql, {}, std::move(cb));
}

void DbPool::async_exec_params(const std::string& sql, std::vector<std::string> params, DbResultCb cb) {
    auto impl = impl_.get();
    impl->post_task([impl, sql, params = std::move(params), cb](PGconn*& local_conn) mutable {
        boost::system::error_code ec;
        PGresult* r = nullptr;
        for (int attempt = 0; attempt < 2; ++attempt) {
            if (!local_conn) {
                local_conn = impl->connect_one();
                if (!local_conn) { ec = boost::system::errc::make_error_code(boost::system::errc::host_unreachable); break; }
            }
            std::vector<const char*> cparams;
            cparams.reserve(params.size());
            for (const auto& p : params) cparams.push_back(p.c_str());
            r = PQexecParams(local_conn, sql.c_str(), int(cparams.size()), nullptr, cparams.data(), nullptr, nullptr, 0);
            if (!r) {
                PQfinish(local_conn);
                local_conn = nullptr;
                ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
                continue;
            }
            ec = {};
            break;
        }
        ResultPtr rp;
        if (r) rp = ResultPtr(r, [](PGresult* p){ PQclear(p); });
        DbResult out = to_db_result(rp.get());
        if (rp && !out.ok) {
            observability::log_warn("dbpool.exec_params_non_ok", {{"sqlstate", out.sqlstate}, {"error", out.message}});
        }
        post_db_result(impl->app_ioc, cb, ec, std::move(out));
    });
}

void DbPool::async_scalar_int(const std::string& sql, ScalarIntCb cb) {
    async_exec(sql, [cb](const boost::system::error_code& ec, const DbResult& r) {
        if (ec) { cb(ec, 0); return; }
        if (!r.ok || r.rows.empty() || r.rows[0].empty() || !r.rows[0][0].has_value()) {
            cb(boost::asio::error::operation_aborted, 0);
            return;
        }
        int val = 0;
        try {
            val = std::stoi(*r.rows[0][0]);
        } catch (const std::exception&) {
            cb(boost::asio::error::invalid_argument, 0);
            return;
        }
        cb({}, val);
    });
}

}
