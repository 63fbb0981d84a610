#pragma once

#include <vector>
#include "Types.h"
#include "store/SlotStore.h"

namespace scheduling {

struct GenerateRequest {
    int64_t doctor_id = 0;
    DeliveryMode delivery_mode = DeliveryMode::physical;
    Date start_date;
    Date end_date;
    TimeOfDay start_time;
    TimeOfDay end_time;
    int duration_minutes = 0;
};

struct GenerateResult {
    int created_count = 0;
    int skipped_count = 0;
    std::vector<Slot> created;
};

// Candidate slots in (date, start) order. A trailing segment shorter than the
// duration is dropped. Does not validate the request.
std::vector<NewSlot> plan_slots(const GenerateRequest& req);

// Throws SchedulingError(validation_error) for a malformed range, one longer than
// limits.max_generate_days, or one starting before now.
void validate_generate_request(const GenerateRequest& req, const Limits& limits, const LocalDateTime& now);

class SlotGenerator {
public:
    SlotGenerator(store::SlotStore& store, Clock clock, Limits limits)
        : store_(store), clock_(std::move(clock)), limits_(limits) {}

    // Inserts every candidate that does not overlap a live slot of the doctor, in one
    // transaction. Overlapping candidates are counted as skipped.
    GenerateResult generate(const GenerateRequest& req);

    void validate(const GenerateRequest& req) const;

private:
    store::SlotStore& store_;
    Clock clock_;
    Limits limits_;
};

}
