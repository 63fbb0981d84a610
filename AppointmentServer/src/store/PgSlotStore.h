#pragma once

#include <libpq-fe.h>
#include <memory>
#include "SlotStore.h"

namespace db { class DbPool; }

namespace store {

// SlotStore over one libpq connection the caller lends for the store's lifetime.
class PgSlotStore : public SlotStore {
public:
    explicit PgSlotStore(PGconn* conn) : conn_(conn) {}

    std::unique_ptr<Transaction> begin() override;

private:
    PGconn* conn_;
};

// Runs each piece of work on a DbPool worker, wrapping that worker's connection.
class PgStoreRunner : public StoreRunner {
public:
    explicit PgStoreRunner(std::shared_ptr<db::DbPool> pool) : pool_(std::move(pool)) {}

    void post(std::function<void(SlotStore&)> work) override;

private:
    std::shared_ptr<db::DbPool> pool_;
};

}
