#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "Calendar.h"

namespace scheduling {

enum class DeliveryMode { physical, telemedicine };
enum class SlotState { free, booked, cancelled };
// Ordered: a live appointment only ever moves forward through these.
enum class AppointmentState { free = 0, confirmed = 1, cancelled = 2 };

const char* to_string(DeliveryMode m);
const char* to_string(SlotState s);
const char* to_string(AppointmentState s);

std::optional<DeliveryMode> parse_delivery_mode(std::string_view s);
std::optional<SlotState> parse_slot_state(std::string_view s);
std::optional<AppointmentState> parse_appointment_state(std::string_view s);

struct Slot {
    int64_t id = 0;
    int64_t doctor_id = 0;
    Date date;
    TimeOfDay start_time;
    TimeOfDay end_time;
    int duration_minutes = 0;
    DeliveryMode delivery_mode = DeliveryMode::physical;
    SlotState state = SlotState::free;

    LocalDateTime starts_at() const { return LocalDateTime{date, start_time}; }
    bool live() const { return state != SlotState::cancelled; }
    bool overlaps(const Date& d, TimeOfDay start, TimeOfDay end) const {
        return date == d && start_time < end && start < end_time;
    }
};

struct NewSlot {
    int64_t doctor_id = 0;
    Date date;
    TimeOfDay start_time;
    TimeOfDay end_time;
    int duration_minutes = 0;
    DeliveryMode delivery_mode = DeliveryMode::physical;
    SlotState state = SlotState::free;
};

struct Appointment {
    int64_t id = 0;
    int64_t slot_id = 0;
    int64_t patient_id = 0;
    int64_t doctor_id = 0;
    std::optional<int64_t> institution_id;
    std::optional<int64_t> specialty_id;
    std::string urgency;
    std::string visit_type;
    DeliveryMode delivery_mode = DeliveryMode::physical;
    AppointmentState state = AppointmentState::confirmed;
    int64_t created_by = 0;
    std::string created_at;
};

struct NewAppointment {
    int64_t slot_id = 0;
    int64_t patient_id = 0;
    int64_t doctor_id = 0;
    std::optional<int64_t> institution_id;
    std::optional<int64_t> specialty_id;
    std::string urgency;
    std::string visit_type;
    DeliveryMode delivery_mode = DeliveryMode::physical;
    AppointmentState state = AppointmentState::confirmed;
    int64_t created_by = 0;
    std::string created_at;
};

// An appointment together with the slot it occupies.
struct Booking {
    Appointment appointment;
    Slot slot;
};

class SlotScope {
public:
    static SlotScope all_doctors() { return SlotScope(std::nullopt); }
    static SlotScope doctor(int64_t doctor_id) { return SlotScope(doctor_id); }

    bool covers(int64_t doctor_id) const { return !doctor_id_ || *doctor_id_ == doctor_id; }
    const std::optional<int64_t>& doctor_id() const { return doctor_id_; }

private:
    explicit SlotScope(std::optional<int64_t> d) : doctor_id_(d) {}
    std::optional<int64_t> doctor_id_;
};

struct AppointmentFilter {
    std::optional<int64_t> created_by;
    std::optional<int64_t> doctor_id;
    std::optional<Date> date;
};

// Operator-tunable bounds on generation and the legacy booking path.
struct Limits {
    int default_slot_minutes = 30;
    int max_generate_days = 92;
};

}
