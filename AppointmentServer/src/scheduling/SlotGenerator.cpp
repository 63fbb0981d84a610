#include "SlotGenerator.h"
#include <map>
#include "Errors.h"

namespace scheduling {

std::vector<NewSlot> plan_slots(const GenerateRequest& req) {
    std::vector<NewSlot> out;
    if (req.duration_minutes <= 0) return out;
    for (Date d = req.start_date; d <= req.end_date; d = d.add_days(1)) {
        for (int t = req.start_time.minutes; t + req.duration_minutes <= req.end_time.minutes; t += req.duration_minutes) {
            NewSlot s;
            s.doctor_id = req.doctor_id;
            s.date = d;
            s.start_time = TimeOfDay{t};
            s.end_time = TimeOfDay{t + req.duration_minutes};
            s.duration_minutes = req.duration_minutes;
            s.delivery_mode = req.delivery_mode;
            s.state = SlotState::free;
            out.push_back(s);
        }
    }
    return out;
}

void validate_generate_request(const GenerateRequest& req, const Limits& limits, const LocalDateTime& now) {
    if (req.doctor_id <= 0) fail(errc::validation_error, "doctor_id must be positive");
    if (req.duration_minutes <= 0) fail(errc::validation_error, "duration_minutes must be positive");
    if (req.duration_minutes > TimeOfDay::kMinutesPerDay) fail(errc::validation_error, "duration_minutes exceeds one day");
    if (req.start_time.minutes < 0 || req.end_time.minutes > TimeOfDay::kMinutesPerDay)
        fail(errc::validation_error, "time out of range");
    if (!(req.start_time < req.end_time)) fail(errc::validation_error, "start_time must be before end_time");
    if (req.end_date < req.start_date) fail(errc::validation_error, "end_date must not be before start_date");
    int64_t days = req.end_date.days_since_epoch() - req.start_date.days_since_epoch() + 1;
    if (days > limits.max_generate_days)
        fail(errc::validation_error, "range longer than " + std::to_string(limits.max_generate_days) + " days");
    if (LocalDateTime{req.start_date, req.start_time} < now)
        fail(errc::validation_error, "cannot generate slots in the past");
}

void SlotGenerator::validate(const GenerateRequest& req) const {
    validate_generate_request(req, limits_, clock_());
}

GenerateResult SlotGenerator::generate(const GenerateRequest& req) {
    validate(req);
    auto candidates = plan_slots(req);

    GenerateResult res;
    auto tx = store_.begin();
    tx->lock_doctor(req.doctor_id);

    std::map<int64_t, std::vector<Slot>> live_by_day;
    for (const auto& c : candidates) {
        int64_t day = c.date.days_since_epoch();
        auto it = live_by_day.find(day);
        if (it == live_by_day.end()) {
            std::vector<Slot> live;
            for (auto& s : tx->slots_on(req.doctor_id, c.date)) {
                if (s.live()) live.push_back(std::move(s));
            }
            it = live_by_day.emplace(day, std::move(live)).first;
        }
        bool clash = false;
        for (const auto& s : it->second) {
            if (s.overlaps(c.date, c.start_time, c.end_time)) { clash = true; break; }
        }
        if (clash) {
            ++res.skipped_count;
            continue;
        }
        Slot inserted = tx->insert_slot(c);
        it->second.push_back(inserted);
        res.created.push_back(std::move(inserted));
        ++res.created_count;
    }
    tx->commit();
    return res;
}

}
