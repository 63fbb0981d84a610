#include "AvailabilitySearch.h"
#include "Errors.h"

namespace scheduling {

std::vector<Slot> AvailabilitySearch::search_slots(int64_t doctor_id, const Date& date) {
    if (doctor_id <= 0) fail(errc::validation_error, "doctor_id must be positive");
    auto tx = store_.begin();
    return tx->slots_on(doctor_id, date);
}

std::vector<Slot> AvailabilitySearch::search_by_specialty(int64_t specialty_id, std::optional<Date> from) {
    if (specialty_id <= 0) fail(errc::validation_error, "specialty_id must be positive");
    if (!from) from = clock_().date;
    auto tx = store_.begin();
    return tx->free_slots_for_specialty(specialty_id, from);
}

std::vector<Slot> AvailabilitySearch::doctor_availability(int64_t doctor_id, std::optional<Date> from) {
    if (doctor_id <= 0) fail(errc::validation_error, "doctor_id must be positive");
    if (!from) from = clock_().date;
    auto tx = store_.begin();
    return tx->free_slots_for_doctor(doctor_id, from);
}

}
