#pragma once

#include <optional>
#include <vector>
#include "AvailabilitySearch.h"
#include "BookingManager.h"
#include "ModificationEngine.h"
#include "SlotGenerator.h"
#include "observability/Logging.h"

namespace scheduling {

// Entry point for the serving layer. Store failures leave here as SchedulingError,
// and every operation is logged and counted.
class Scheduler {
public:
    Scheduler(store::SlotStore& store, Clock clock, Limits limits);

    GenerateResult generate_slots(const GenerateRequest& req);

    std::vector<Slot> search_slots(int64_t doctor_id, const Date& date);
    std::vector<Slot> search_by_specialty(int64_t specialty_id, std::optional<Date> from = std::nullopt);
    std::vector<Slot> doctor_availability(int64_t doctor_id, std::optional<Date> from = std::nullopt);

    Booking book_appointment(const auth::Caller& caller, const BookingRequest& req);
    Booking read_appointment(const auth::Caller& caller, int64_t appointment_id);
    Booking update_appointment(const auth::Caller& caller, int64_t appointment_id, const AppointmentChanges& changes);
    Booking delete_appointment(const auth::Caller& caller, int64_t appointment_id);
    std::vector<Booking> list_appointments(const auth::Caller& caller, const std::optional<Date>& date);

    Slot shift_slot(const SlotScope& scope, int64_t slot_id, const Date& date, TimeOfDay time);
    int cancel_slots(const SlotScope& scope, const std::vector<int64_t>& slot_ids);
    int cancel_slots_by_date(const SlotScope& scope, const Date& date);
    std::vector<Slot> shift_slots_by_date(const SlotScope& scope, const Date& date, const GenerateRequest& target);
    Slot convert_delivery_mode(const SlotScope& scope, int64_t slot_id, DeliveryMode mode);

    const Clock& clock() const { return clock_; }

private:
    template <typename F>
    auto guarded(const char* operation, observability::Fields fields, F&& f) -> decltype(f());

    Clock clock_;
    SlotGenerator generator_;
    AvailabilitySearch search_;
    BookingManager booking_;
    ModificationEngine modification_;
};

}
