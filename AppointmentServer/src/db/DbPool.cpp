#include "DbPool.h"
#include <condition_variable>
#include <cstdlib>
#include <mutex>
#include <queue>
#include <thread>
#include "observability/Logging.h"

namespace db {

DbResult make_result(PGresult* pr) {
    DbResult r;
    if (!pr) {
        r.message = "no result from server";
        return r;
    }
    std::unique_ptr<PGresult, void(*)(PGresult*)> guard(pr, [](PGresult* p){ PQclear(p); });
    ExecStatusType st = PQresultStatus(pr);
    r.ok = (st == PGRES_TUPLES_OK || st == PGRES_COMMAND_OK);
    const char* ss = PQresultErrorField(pr, PG_DIAG_SQLSTATE);
    r.sqlstate = ss ? ss : std::string();
    const char* msg = PQresultErrorMessage(pr);
    r.message = msg ? msg : std::string();
    int nfields = PQnfields(pr);
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
        r.affected_rows = (ct && *ct) ? std::atoi(ct) : 0;
    } else {
        r.affected_rows = ntuples;
    }
    if (!r.ok) {
        observability::log_debug("db.exec_failed", {{"status", std::string(PQresStatus(st))}, {"sqlstate", r.sqlstate}});
    }
    return r;
}

DbResult exec_params(PGconn* conn, const std::string& sql, const Params& params) {
    std::vector<const char*> cparams;
    cparams.reserve(params.size());
    for (const auto& p : params) cparams.push_back(p ? p->c_str() : nullptr);
    PGresult* r = PQexecParams(conn, sql.c_str(), int(cparams.size()), nullptr, cparams.data(), nullptr, nullptr, 0);
    return make_result(r);
}

struct DbPool::Impl {
    std::string conninfo;
    std::queue<std::function<void(PGconn*&)>> tasks;
    std::mutex mu;
    std::condition_variable cv;
    bool stopping = false;
    std::vector<std::thread> threads;

    Impl(const std::string& ci, int workers) : conninfo(ci) {
        for (int i = 0; i < workers; ++i) threads.emplace_back([this, i]{ worker_loop(i); });
    }

    ~Impl() {
        { std::lock_guard<std::mutex> lk(mu); stopping = true; }
        cv.notify_all();
        for (auto& t : threads) if (t.joinable()) t.join();
    }

    PGconn* connect_one() {
        PGconn* c = PQconnectdb(conninfo.c_str());
        if (c == nullptr) return nullptr;
        if (PQstatus(c) != CONNECTION_OK) {
            observability::log_warn("db.connect_failed", {{"msg", std::string(PQerrorMessage(c))}});
            PQfinish(c);
            return nullptr;
        }
        return c;
    }

    void worker_loop(int index) {
        PGconn* conn = connect_one();
        observability::log_info("db.worker_started", {{"worker", int64_t(index)}, {"conn", conn ? std::string("ok") : std::string("null")}});
        while (true) {
            std::function<void(PGconn*&)> task;
            {
                std::unique_lock<std::mutex> lk(mu);
                cv.wait(lk, [this]{ return stopping || !tasks.empty(); });
                if (stopping && tasks.empty()) break;
                task = std::move(tasks.front());
                tasks.pop();
            }
            try {
                task(conn);
            } catch (const std::exception& e) {
                observability::log_error("db.task_exception", {{"worker", int64_t(index)}, {"err", std::string(e.what())}});
            }
            if (conn && PQstatus(conn) != CONNECTION_OK) {
                observability::log_warn("db.connection_dropped", {{"worker", int64_t(index)}});
                PQfinish(conn);
                conn = nullptr;
            }
        }
        if (conn) PQfinish(conn);
    }

    void post(std::function<void(PGconn*&)> f) {
        {
            std::lock_guard<std::mutex> lk(mu);
            tasks.push(std::move(f));
        }
        cv.notify_one();
    }
};

DbPool::DbPool(const std::string& conninfo, int workers)
    : impl_(std::make_unique<Impl>(conninfo, workers < 1 ? 1 : workers)) {}

DbPool::~DbPool() = default;

void DbPool::async_run(std::function<void(PGconn*)> work) {
    auto impl = impl_.get();
    impl->post([impl, work = std::move(work)](PGconn*& conn) {
        if (!conn) conn = impl->connect_one();
        work(conn);
    });
}

}
