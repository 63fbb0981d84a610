#include "ModificationEngine.h"
#include <algorithm>
#include <map>
#include "Errors.h"

namespace scheduling {

Slot ModificationEngine::load_in_scope(store::Transaction& tx, const SlotScope& scope, int64_t slot_id) {
    auto s = tx.find_slot(slot_id, true);
    if (!s) fail(errc::not_found, "slot " + std::to_string(slot_id) + " not found");
    if (!scope.covers(s->doctor_id)) fail(errc::forbidden, "slot " + std::to_string(slot_id) + " belongs to another doctor");
    return *s;
}

// Cascades to the bound appointment, if any. The slot is not released.
bool ModificationEngine::cancel_one(store::Transaction& tx, const Slot& s) {
    if (!s.live()) return false;
    if (!tx.transition_slot(s.id, s.state, SlotState::cancelled)) return false;
    if (auto a = tx.live_appointment_for_slot(s.id)) {
        a->state = AppointmentState::cancelled;
        tx.update_appointment(*a);
    }
    return true;
}

Slot ModificationEngine::shift(const SlotScope& scope, int64_t slot_id, const Date& date, TimeOfDay time) {
    auto tx = store_.begin();
    Slot s = load_in_scope(*tx, scope, slot_id);
    if (!s.live()) fail(errc::invalid_state, "slot is cancelled");
    auto now = clock_();
    if (s.starts_at() < now) fail(errc::invalid_state, "slot already started");
    if (time.minutes < 0 || time.minutes >= TimeOfDay::kMinutesPerDay) fail(errc::validation_error, "time out of range");
    if (LocalDateTime{date, time} < now) fail(errc::validation_error, "cannot shift a slot into the past");

    TimeOfDay end{time.minutes + (s.end_time.minutes - s.start_time.minutes)};
    if (end.minutes > TimeOfDay::kMinutesPerDay) fail(errc::validation_error, "shifted slot would run past midnight");

    tx->lock_doctor(s.doctor_id);
    for (const auto& other : tx->slots_on(s.doctor_id, date)) {
        if (other.id == s.id || !other.live()) continue;
        if (other.overlaps(date, time, end))
            fail(errc::slot_conflict, "slot " + std::to_string(other.id) + " already occupies " + date.to_string() + " " + time.to_string());
    }
    tx->update_slot_schedule(s.id, date, time, end);
    tx->commit();
    s.date = date;
    s.start_time = time;
    s.end_time = end;
    return s;
}

int ModificationEngine::cancel_slots(const SlotScope& scope, const std::vector<int64_t>& slot_ids) {
    std::vector<int64_t> ids = slot_ids;
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    auto tx = store_.begin();
    std::vector<Slot> slots;
    slots.reserve(ids.size());
    for (int64_t id : ids) slots.push_back(load_in_scope(*tx, scope, id));

    int changed = 0;
    for (const auto& s : slots) {
        if (cancel_one(*tx, s)) ++changed;
    }
    tx->commit();
    return changed;
}

int ModificationEngine::cancel_by_date(const SlotScope& scope, const Date& date) {
    auto tx = store_.begin();
    int changed = 0;
    for (const auto& s : tx->live_slots_on(date, scope.doctor_id())) {
        if (cancel_one(*tx, s)) ++changed;
    }
    tx->commit();
    return changed;
}

std::vector<Slot> ModificationEngine::shift_by_date(const SlotScope& scope, const Date& date, const GenerateRequest& target) {
    auto now = clock_();
    validate_generate_request(target, limits_, now);
    if (!scope.covers(target.doctor_id)) fail(errc::forbidden, "doctor " + std::to_string(target.doctor_id) + " is outside the caller's scope");

    auto tx = store_.begin();
    tx->lock_doctor(target.doctor_id);
    auto moving = tx->live_slots_on(date, target.doctor_id);
    if (moving.empty()) {
        tx->commit();
        return moving;
    }
    for (const auto& s : moving) {
        if (s.starts_at() < now) fail(errc::invalid_state, "slot " + std::to_string(s.id) + " already started");
    }

    auto candidates = plan_slots(target);
    if (candidates.size() < moving.size())
        fail(errc::validation_error, "target range holds " + std::to_string(candidates.size()) + " slots, " +
             date.to_string() + " has " + std::to_string(moving.size()));
    candidates.resize(moving.size());

    std::map<int64_t, std::vector<Slot>> staying_by_day;
    for (const auto& c : candidates) {
        int64_t day = c.date.days_since_epoch();
        auto it = staying_by_day.find(day);
        if (it == staying_by_day.end()) {
            std::vector<Slot> staying;
            for (auto& s : tx->slots_on(target.doctor_id, c.date)) {
                if (s.live() && s.date != date) staying.push_back(std::move(s));
            }
            it = staying_by_day.emplace(day, std::move(staying)).first;
        }
        for (const auto& s : it->second) {
            if (s.overlaps(c.date, c.start_time, c.end_time))
                fail(errc::slot_conflict, "slot " + std::to_string(s.id) + " already occupies " + c.date.to_string() + " " + c.start_time.to_string());
        }
    }

    tx->defer_overlap_check();
    for (std::size_t i = 0; i < moving.size(); ++i) {
        const NewSlot& c = candidates[i];
        tx->update_slot_schedule(moving[i].id, c.date, c.start_time, c.end_time);
        moving[i].date = c.date;
        moving[i].start_time = c.start_time;
        moving[i].end_time = c.end_time;
        moving[i].duration_minutes = c.duration_minutes;
    }
    tx->commit();
    return moving;
}

Slot ModificationEngine::convert(const SlotScope& scope, int64_t slot_id, DeliveryMode mode) {
    auto tx = store_.begin();
    Slot s = load_in_scope(*tx, scope, slot_id);
    if (!s.live()) fail(errc::invalid_state, "cannot convert a cancelled slot");
    if (s.delivery_mode == mode) return s;
    tx->update_slot_mode(s.id, mode);
    if (auto a = tx->live_appointment_for_slot(s.id)) {
        a->delivery_mode = mode;
        tx->update_appointment(*a);
    }
    tx->commit();
    s.delivery_mode = mode;
    return s;
}

}
