#pragma once

#include <optional>
#include <vector>
#include "Types.h"
#include "store/SlotStore.h"

namespace scheduling {

// Read-only queries. Every call opens its own transaction so results reflect the
// latest committed state.
class AvailabilitySearch {
public:
    AvailabilitySearch(store::SlotStore& store, Clock clock) : store_(store), clock_(std::move(clock)) {}

    // All slots of the doctor on the date, any state, ordered by start_time.
    std::vector<Slot> search_slots(int64_t doctor_id, const Date& date);

    // Free slots of every doctor listing the specialty, ordered by (date, start_time).
    // `from` defaults to today.
    std::vector<Slot> search_by_specialty(int64_t specialty_id, std::optional<Date> from = std::nullopt);

    // Free slots of one doctor from `from` (default today) onwards.
    std::vector<Slot> doctor_availability(int64_t doctor_id, std::optional<Date> from = std::nullopt);

private:
    store::SlotStore& store_;
    Clock clock_;
};

}
