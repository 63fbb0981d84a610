#include "BookingManager.h"
#include "Errors.h"

namespace scheduling {

Slot BookingManager::load_slot(store::Transaction& tx, int64_t slot_id) {
    auto s = tx.find_slot(slot_id, true);
    if (!s) fail(errc::store_failure, "appointment references missing slot " + std::to_string(slot_id));
    return *s;
}

void BookingManager::claim(store::Transaction& tx, const Slot& s) {
    if (!tx.claim_slot(s.id)) fail(errc::slot_unavailable, "slot " + std::to_string(s.id) + " is no longer free");
}

// A slot whose start has passed stays booked for the record.
void BookingManager::release_unless_started(store::Transaction& tx, Slot& s) {
    if (s.state != SlotState::booked || s.starts_at() < clock_()) return;
    if (tx.transition_slot(s.id, SlotState::booked, SlotState::free)) s.state = SlotState::free;
}

Slot BookingManager::resolve_slot(store::Transaction& tx, const SlotTarget& t, const AppointmentDetails&) {
    if (t.slot_id <= 0) fail(errc::validation_error, "slot_id must be positive");
    auto s = tx.find_slot(t.slot_id, false);
    if (!s) fail(errc::not_found, "slot " + std::to_string(t.slot_id) + " not found");
    if (s->starts_at() < clock_()) fail(errc::validation_error, "slot is in the past");
    if (s->state != SlotState::free) fail(errc::slot_unavailable, "slot " + std::to_string(t.slot_id) + " is not free");
    claim(tx, *s);
    s->state = SlotState::booked;
    return *s;
}

Slot BookingManager::resolve_slot(store::Transaction& tx, const DoctorTimeTarget& t, const AppointmentDetails& d) {
    if (t.doctor_id <= 0) fail(errc::validation_error, "doctor_id must be positive");
    if (t.at.time.minutes >= TimeOfDay::kMinutesPerDay) fail(errc::validation_error, "appointment time out of range");
    if (t.at < clock_()) fail(errc::validation_error, "appointment date is in the past");

    tx.lock_doctor(t.doctor_id);
    auto day = tx.slots_on(t.doctor_id, t.at.date);
    for (auto& s : day) {
        if (!s.live() || s.start_time != t.at.time) continue;
        if (s.state != SlotState::free) fail(errc::slot_unavailable, "slot at requested time is already booked");
        claim(tx, s);
        s.state = SlotState::booked;
        return s;
    }

    int duration = t.duration_minutes.value_or(limits_.default_slot_minutes);
    if (duration <= 0) fail(errc::validation_error, "duration_minutes must be positive");
    TimeOfDay end{t.at.time.minutes + duration};
    if (end.minutes > TimeOfDay::kMinutesPerDay) fail(errc::validation_error, "appointment would run past midnight");
    for (const auto& s : day) {
        if (s.live() && s.overlaps(t.at.date, t.at.time, end)) fail(errc::slot_conflict, "requested time overlaps slot " + std::to_string(s.id));
    }

    NewSlot n;
    n.doctor_id = t.doctor_id;
    n.date = t.at.date;
    n.start_time = t.at.time;
    n.end_time = end;
    n.duration_minutes = duration;
    n.delivery_mode = d.delivery_mode.value_or(DeliveryMode::physical);
    n.state = SlotState::booked;
    return tx.insert_slot(n);
}

Booking BookingManager::book(const auth::Caller& caller, const BookingRequest& req) {
    const auto& d = req.details;
    if (d.initial_state == AppointmentState::cancelled) fail(errc::validation_error, "an appointment cannot start cancelled");
    if (d.urgency.empty() || d.urgency.size() > 32) fail(errc::validation_error, "invalid urgency");
    if (d.visit_type.empty() || d.visit_type.size() > 64) fail(errc::validation_error, "invalid visit_type");

    auto tx = store_.begin();
    Slot slot = std::visit([&](const auto& t) { return resolve_slot(*tx, t, d); }, req.target);
    if (d.delivery_mode && *d.delivery_mode != slot.delivery_mode)
        fail(errc::validation_error, std::string("slot delivery mode is ") + to_string(slot.delivery_mode));

    NewAppointment n;
    n.slot_id = slot.id;
    n.patient_id = caller.user_id;
    n.doctor_id = slot.doctor_id;
    n.institution_id = d.institution_id;
    n.specialty_id = d.specialty_id;
    n.urgency = d.urgency;
    n.visit_type = d.visit_type;
    n.delivery_mode = slot.delivery_mode;
    n.state = d.initial_state;
    n.created_by = caller.user_id;
    n.created_at = format_timestamp(clock_());
    Appointment a = tx->insert_appointment(n);
    tx->commit();
    return Booking{std::move(a), std::move(slot)};
}

Booking BookingManager::read(const auth::Caller& caller, int64_t appointment_id) {
    auto tx = store_.begin();
    auto a = tx->find_appointment(appointment_id, false);
    if (!a) fail(errc::not_found, "appointment " + std::to_string(appointment_id) + " not found");
    if (!auth::allowed(auth::can_read_appointment(caller, *a))) fail(errc::forbidden, "not your appointment");
    auto s = tx->find_slot(a->slot_id, false);
    if (!s) fail(errc::store_failure, "appointment references missing slot");
    return Booking{*a, *s};
}

Booking BookingManager::update(const auth::Caller& caller, int64_t appointment_id, const AppointmentChanges& changes) {
    auto tx = store_.begin();
    auto found = tx->find_appointment(appointment_id, true);
    if (!found) fail(errc::not_found, "appointment " + std::to_string(appointment_id) + " not found");
    Appointment a = *found;
    if (!auth::allowed(auth::can_update_appointment(caller, a))) fail(errc::forbidden, "not your appointment");
    if (a.state == AppointmentState::cancelled) fail(errc::invalid_state, "appointment is cancelled");

    Slot slot = load_slot(*tx, a.slot_id);
    auto now = clock_();

    if (changes.appointment_date && *changes.appointment_date != slot.starts_at()) {
        const LocalDateTime& to = *changes.appointment_date;
        if (slot.starts_at() < now) fail(errc::invalid_state, "appointment already started");
        if (to < now) fail(errc::validation_error, "appointment date is in the past");

        tx->lock_doctor(a.doctor_id);
        std::optional<Slot> target;
        for (auto& s : tx->slots_on(a.doctor_id, to.date)) {
            if (s.live() && s.id != slot.id && s.start_time == to.time) { target = std::move(s); break; }
        }
        if (!target || target->state != SlotState::free)
            fail(errc::slot_conflict, "no free slot of this doctor at " + to.to_string());
        claim(*tx, *target);
        tx->transition_slot(slot.id, SlotState::booked, SlotState::free);
        target->state = SlotState::booked;
        slot = *target;
        a.slot_id = slot.id;
        a.delivery_mode = slot.delivery_mode;
    }

    if (changes.state && *changes.state != a.state) {
        if (*changes.state < a.state) fail(errc::invalid_state, std::string("cannot move appointment back to ") + to_string(*changes.state));
        a.state = *changes.state;
        if (a.state == AppointmentState::cancelled) release_unless_started(*tx, slot);
    }

    tx->update_appointment(a);
    tx->commit();
    return Booking{std::move(a), std::move(slot)};
}

Booking BookingManager::cancel(const auth::Caller& caller, int64_t appointment_id) {
    auto tx = store_.begin();
    auto found = tx->find_appointment(appointment_id, true);
    if (!found || found->state == AppointmentState::cancelled)
        fail(errc::not_found, "appointment " + std::to_string(appointment_id) + " not found");
    Appointment a = *found;
    if (!auth::allowed(auth::can_delete_appointment(caller, a))) fail(errc::forbidden, "only the creator may delete an appointment");

    Slot slot = load_slot(*tx, a.slot_id);
    a.state = AppointmentState::cancelled;
    tx->update_appointment(a);
    release_unless_started(*tx, slot);
    tx->commit();
    return Booking{std::move(a), std::move(slot)};
}

std::vector<Booking> BookingManager::list(const auth::Caller& caller, const std::optional<Date>& date) {
    AppointmentFilter f;
    f.date = date;
    if (caller.role == auth::Role::patient) f.created_by = caller.user_id;
    else if (caller.role == auth::Role::doctor) f.doctor_id = caller.user_id;

    auto tx = store_.begin();
    std::vector<Booking> out;
    for (auto& a : tx->appointments(f)) {
        auto s = tx->find_slot(a.slot_id, false);
        if (!s) continue;
        out.push_back(Booking{std::move(a), std::move(*s)});
    }
    return out;
}

}
