#include "Types.h"
#include <algorithm>
#include <cctype>

namespace scheduling {

static std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

const char* to_string(DeliveryMode m) {
    switch (m) {
        case DeliveryMode::physical: return "physical";
        case DeliveryMode::telemedicine: return "telemedicine";
    }
    return "physical";
}

const char* to_string(SlotState s) {
    switch (s) {
        case SlotState::free: return "free";
        case SlotState::booked: return "booked";
        case SlotState::cancelled: return "cancelled";
    }
    return "free";
}

const char* to_string(AppointmentState s) {
    switch (s) {
        case AppointmentState::free: return "free";
        case AppointmentState::confirmed: return "confirmed";
        case AppointmentState::cancelled: return "cancelled";
    }
    return "free";
}

std::optional<DeliveryMode> parse_delivery_mode(std::string_view s) {
    auto v = lower(s);
    if (v == "physical" || v == "in_person" || v == "offline") return DeliveryMode::physical;
    if (v == "telemedicine" || v == "telemed" || v == "online") return DeliveryMode::telemedicine;
    return std::nullopt;
}

std::optional<SlotState> parse_slot_state(std::string_view s) {
    auto v = lower(s);
    if (v == "free") return SlotState::free;
    if (v == "booked") return SlotState::booked;
    if (v == "cancelled") return SlotState::cancelled;
    return std::nullopt;
}

std::optional<AppointmentState> parse_appointment_state(std::string_view s) {
    auto v = lower(s);
    if (v == "free") return AppointmentState::free;
    if (v == "confirmed") return AppointmentState::confirmed;
    if (v == "cancelled") return AppointmentState::cancelled;
    return std::nullopt;
}

}
