#pragma once

#include <vector>
#include "SlotGenerator.h"
#include "Types.h"
#include "store/SlotStore.h"

namespace scheduling {

// Mutations of existing slots. Each operation runs in one transaction and refuses
// slots outside the caller's scope with errc::forbidden.
class ModificationEngine {
public:
    ModificationEngine(store::SlotStore& store, Clock clock, Limits limits = Limits{})
        : store_(store), clock_(std::move(clock)), limits_(limits) {}

    // Moves the slot to start at (date, time) keeping its id, length, state and any
    // bound appointment.
    Slot shift(const SlotScope& scope, int64_t slot_id, const Date& date, TimeOfDay time);

    // Returns how many slots actually changed; already-cancelled ids count zero.
    // An unknown id fails the whole call.
    int cancel_slots(const SlotScope& scope, const std::vector<int64_t>& slot_ids);

    int cancel_by_date(const SlotScope& scope, const Date& date);

    // Moves every live slot of target.doctor_id on `date`, in start order, onto the
    // first candidates plan_slots(target) yields. Ids, states, delivery modes and bound
    // appointments are kept; each slot takes its candidate's length. All or nothing:
    // slot_conflict if a candidate overlaps a slot that is not being moved,
    // validation_error if the target holds fewer candidates than there are slots.
    std::vector<Slot> shift_by_date(const SlotScope& scope, const Date& date, const GenerateRequest& target);

    Slot convert(const SlotScope& scope, int64_t slot_id, DeliveryMode mode);

private:
    Slot load_in_scope(store::Transaction& tx, const SlotScope& scope, int64_t slot_id);
    static bool cancel_one(store::Transaction& tx, const Slot& s);

    store::SlotStore& store_;
    Clock clock_;
    Limits limits_;
};

}
