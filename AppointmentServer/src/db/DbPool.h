#pragma once

#include <libpq-fe.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace db {

struct DbResult {
    bool ok = false;
    std::string sqlstate;
    std::string message;
    std::vector<std::vector<std::optional<std::string>>> rows;
    int affected_rows = 0;
};

// nullopt binds SQL NULL
using Params = std::vector<std::optional<std::string>>;

// Converts (and takes ownership of) a libpq result. A null result yields ok=false.
DbResult make_result(PGresult* r);

// Synchronous parameterized exec on a connection the caller owns for the duration.
DbResult exec_params(PGconn* conn, const std::string& sql, const Params& params);

// Fixed set of worker threads, each owning one libpq connection for its lifetime.
// Work is queued FIFO and picked up by whichever worker is idle.
class DbPool {
public:
    DbPool(const std::string& conninfo, int workers = 4);
    ~DbPool();

    DbPool(const DbPool&) = delete;
    DbPool& operator=(const DbPool&) = delete;

    // Runs work on a worker thread with that worker's connection. A reconnect is attempted
    // first if the worker has none, so conn may still be null. Broken connections are dropped afterwards.
    void async_run(std::function<void(PGconn*)> work);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
