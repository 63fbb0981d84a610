#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "scheduling/Types.h"

namespace store {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what, std::string sqlstate = {})
        : std::runtime_error(what), sqlstate_(std::move(sqlstate)) {}
    const std::string& sqlstate() const noexcept { return sqlstate_; }
private:
    std::string sqlstate_;
};

// One unit of work against the slot store. Destroying it without commit() rolls back.
class Transaction {
public:
    virtual ~Transaction() = default;

    // Serializes schedule changes (insert/shift) for one doctor until the transaction ends.
    virtual void lock_doctor(int64_t doctor_id) = 0;
    // Postpones the live-slot overlap check to commit(), so a set of slots can be moved
    // through intermediate states that overlap. commit() throws StoreError (23P01) if the
    // final state still overlaps.
    virtual void defer_overlap_check() = 0;

    virtual std::optional<scheduling::Slot> find_slot(int64_t slot_id, bool for_update) = 0;
    // All states, ordered by start_time.
    virtual std::vector<scheduling::Slot> slots_on(int64_t doctor_id, const scheduling::Date& date) = 0;
    // Non-cancelled slots on a date, restricted to one doctor when given. Locked for update.
    virtual std::vector<scheduling::Slot> live_slots_on(const scheduling::Date& date, const std::optional<int64_t>& doctor_id) = 0;
    // Free slots ordered by (date, start_time).
    virtual std::vector<scheduling::Slot> free_slots_for_doctor(int64_t doctor_id, const std::optional<scheduling::Date>& from) = 0;
    virtual std::vector<scheduling::Slot> free_slots_for_specialty(int64_t specialty_id, const std::optional<scheduling::Date>& from) = 0;

    virtual scheduling::Slot insert_slot(const scheduling::NewSlot& s) = 0;
    // free -> booked only if the slot is still free; false when another writer got there first.
    virtual bool claim_slot(int64_t slot_id) = 0;
    // Conditional transition; false when the slot is not in `from`.
    virtual bool transition_slot(int64_t slot_id, scheduling::SlotState from, scheduling::SlotState to) = 0;
    // Also sets duration_minutes to end - start.
    virtual void update_slot_schedule(int64_t slot_id, const scheduling::Date& date, scheduling::TimeOfDay start, scheduling::TimeOfDay end) = 0;
    virtual void update_slot_mode(int64_t slot_id, scheduling::DeliveryMode mode) = 0;

    virtual std::optional<scheduling::Appointment> find_appointment(int64_t appointment_id, bool for_update) = 0;
    virtual std::optional<scheduling::Appointment> live_appointment_for_slot(int64_t slot_id) = 0;
    virtual std::vector<scheduling::Appointment> appointments(const scheduling::AppointmentFilter& filter) = 0;
    virtual scheduling::Appointment insert_appointment(const scheduling::NewAppointment& a) = 0;
    // Persists slot_id, state and delivery_mode.
    virtual void update_appointment(const scheduling::Appointment& a) = 0;

    virtual void commit() = 0;
};

class SlotStore {
public:
    virtual ~SlotStore() = default;
    virtual std::unique_ptr<Transaction> begin() = 0;
};

// Runs work against a store away from the I/O thread.
class StoreRunner {
public:
    virtual ~StoreRunner() = default;
    virtual void post(std::function<void(SlotStore&)> work) = 0;
};

}
