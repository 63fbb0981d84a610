#include "Scheduler.h"
#include "Errors.h"
#include "observability/Logging.h"
#include "observability/Metrics.h"

namespace scheduling {

Scheduler::Scheduler(store::SlotStore& store, Clock clock, Limits limits)
    : clock_(clock),
      generator_(store, clock, limits),
      search_(store, clock),
      booking_(store, clock, limits),
      modification_(store, clock, limits) {}

template <typename F>
auto Scheduler::guarded(const char* operation, observability::Fields fields, F&& f) -> decltype(f()) {
    auto& metrics = observability::Metrics::instance();
    fields["op"] = std::string(operation);
    try {
        auto result = f();
        metrics.inc_operation(operation, "ok");
        observability::log_debug("scheduling.ok", fields);
        return result;
    } catch (const SchedulingError& e) {
        const char* kind = error_kind(e.code());
        metrics.inc_operation(operation, kind);
        fields["kind"] = std::string(kind);
        fields["err"] = std::string(e.what());
        if (e.code() == make_error_code(errc::store_failure)) observability::log_error("scheduling.failed", fields);
        else observability::log_warn("scheduling.rejected", fields);
        throw;
    } catch (const store::StoreError& e) {
        errc code = classify(e);
        const char* kind = error_kind(make_error_code(code));
        metrics.inc_operation(operation, kind);
        fields["kind"] = std::string(kind);
        fields["sqlstate"] = e.sqlstate();
        fields["err"] = std::string(e.what());
        if (code == errc::store_failure) observability::log_error("scheduling.store_error", fields);
        else observability::log_warn("scheduling.rejected", fields);
        throw SchedulingError(code, e.what());
    }
}

GenerateResult Scheduler::generate_slots(const GenerateRequest& req) {
    auto r = guarded("generate_slots", {{"doctor_id", req.doctor_id}}, [&] { return generator_.generate(req); });
    observability::log_info("slots.generated", {{"doctor_id", req.doctor_id},
        {"created", int64_t(r.created_count)}, {"skipped", int64_t(r.skipped_count)}});
    return r;
}

std::vector<Slot> Scheduler::search_slots(int64_t doctor_id, const Date& date) {
    return guarded("search_slots", {{"doctor_id", doctor_id}}, [&] { return search_.search_slots(doctor_id, date); });
}

std::vector<Slot> Scheduler::search_by_specialty(int64_t specialty_id, std::optional<Date> from) {
    return guarded("search_by_specialty", {{"specialty_id", specialty_id}}, [&] { return search_.search_by_specialty(specialty_id, from); });
}

std::vector<Slot> Scheduler::doctor_availability(int64_t doctor_id, std::optional<Date> from) {
    return guarded("doctor_availability", {{"doctor_id", doctor_id}}, [&] { return search_.doctor_availability(doctor_id, from); });
}

Booking Scheduler::book_appointment(const auth::Caller& caller, const BookingRequest& req) {
    auto b = guarded("book_appointment", {{"caller", caller.user_id}}, [&] { return booking_.book(caller, req); });
    observability::log_info("appointment.booked", {{"appointment_id", b.appointment.id}, {"slot_id", b.slot.id},
        {"doctor_id", b.slot.doctor_id}, {"caller", caller.user_id}});
    return b;
}

Booking Scheduler::read_appointment(const auth::Caller& caller, int64_t appointment_id) {
    return guarded("read_appointment", {{"appointment_id", appointment_id}, {"caller", caller.user_id}},
                   [&] { return booking_.read(caller, appointment_id); });
}

Booking Scheduler::update_appointment(const auth::Caller& caller, int64_t appointment_id, const AppointmentChanges& changes) {
    auto b = guarded("update_appointment", {{"appointment_id", appointment_id}, {"caller", caller.user_id}},
                     [&] { return booking_.update(caller, appointment_id, changes); });
    observability::log_info("appointment.updated", {{"appointment_id", appointment_id}, {"slot_id", b.slot.id},
        {"state", std::string(to_string(b.appointment.state))}});
    return b;
}

Booking Scheduler::delete_appointment(const auth::Caller& caller, int64_t appointment_id) {
    auto b = guarded("delete_appointment", {{"appointment_id", appointment_id}, {"caller", caller.user_id}},
                     [&] { return booking_.cancel(caller, appointment_id); });
    observability::log_info("appointment.deleted", {{"appointment_id", appointment_id}, {"slot_id", b.slot.id},
        {"slot_state", std::string(to_string(b.slot.state))}});
    return b;
}

std::vector<Booking> Scheduler::list_appointments(const auth::Caller& caller, const std::optional<Date>& date) {
    return guarded("list_appointments", {{"caller", caller.user_id}}, [&] { return booking_.list(caller, date); });
}

Slot Scheduler::shift_slot(const SlotScope& scope, int64_t slot_id, const Date& date, TimeOfDay time) {
    auto s = guarded("shift_slot", {{"slot_id", slot_id}}, [&] { return modification_.shift(scope, slot_id, date, time); });
    observability::log_info("slot.shifted", {{"slot_id", slot_id}, {"date", date.to_string()}, {"time", time.to_string()}});
    return s;
}

int Scheduler::cancel_slots(const SlotScope& scope, const std::vector<int64_t>& slot_ids) {
    int n = guarded("cancel_slots", {{"requested", int64_t(slot_ids.size())}}, [&] { return modification_.cancel_slots(scope, slot_ids); });
    observability::log_info("slots.cancelled", {{"requested", int64_t(slot_ids.size())}, {"cancelled", int64_t(n)}});
    return n;
}

int Scheduler::cancel_slots_by_date(const SlotScope& scope, const Date& date) {
    int n = guarded("cancel_slots_by_date", {{"date", date.to_string()}}, [&] { return modification_.cancel_by_date(scope, date); });
    observability::log_info("slots.cancelled_by_date", {{"date", date.to_string()}, {"cancelled", int64_t(n)},
        {"doctor_id", scope.doctor_id() ? *scope.doctor_id() : int64_t(0)}});
    return n;
}

std::vector<Slot> Scheduler::shift_slots_by_date(const SlotScope& scope, const Date& date, const GenerateRequest& target) {
    auto moved = guarded("shift_slots_by_date", {{"date", date.to_string()}, {"doctor_id", target.doctor_id}},
                         [&] { return modification_.shift_by_date(scope, date, target); });
    observability::log_info("slots.shifted_by_date", {{"date", date.to_string()}, {"doctor_id", target.doctor_id},
        {"moved", int64_t(moved.size())}});
    return moved;
}

Slot Scheduler::convert_delivery_mode(const SlotScope& scope, int64_t slot_id, DeliveryMode mode) {
    auto s = guarded("convert_delivery_mode", {{"slot_id", slot_id}}, [&] { return modification_.convert(scope, slot_id, mode); });
    observability::log_info("slot.converted", {{"slot_id", slot_id}, {"delivery_mode", std::string(to_string(mode))}});
    return s;
}

}
