#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <boost/asio/thread_pool.hpp>
#include "SlotStore.h"

namespace store {

// In-process SlotStore. A transaction holds the store mutex for its whole lifetime.
// Read-only transactions work on the committed state; the first write stages a copy
// that replaces the committed state on commit().
class MemorySlotStore : public SlotStore {
public:
    explicit MemorySlotStore(int64_t first_slot_id = 1, int64_t first_appointment_id = 1);

    std::unique_ptr<Transaction> begin() override;

    // Profile-store view: which specialties a doctor lists.
    void set_doctor_specialties(int64_t doctor_id, std::set<int64_t> specialties);

    // Transactions that have staged a write copy so far.
    uint64_t staged_copies();

    struct State {
        std::map<int64_t, scheduling::Slot> slots;
        std::map<int64_t, scheduling::Appointment> appointments;
        std::map<int64_t, std::set<int64_t>> specialties;
        int64_t next_slot_id = 1;
        int64_t next_appointment_id = 1;
    };

private:
    class Tx;
    std::mutex mu_;
    State state_;
    uint64_t staged_copies_ = 0;
};

class MemoryStoreRunner : public StoreRunner {
public:
    MemoryStoreRunner(std::shared_ptr<MemorySlotStore> store, std::size_t threads);
    ~MemoryStoreRunner() override;

    void post(std::function<void(SlotStore&)> work) override;

private:
    std::shared_ptr<MemorySlotStore> store_;
    boost::asio::thread_pool pool_;
};

}
