#include "JsonViews.h"
#include <sstream>
#include "net/MiniJson.h"
#include "scheduling/Errors.h"

namespace api {

using scheduling::errc;

static std::string quoted(const std::string& s) {
    return "\"" + json_escape_resp(s) + "\"";
}

static std::string opt_int(const std::optional<int64_t>& v) {
    return v ? std::to_string(*v) : std::string("null");
}

std::string slot_json(const scheduling::Slot& s) {
    std::ostringstream ss;
    ss << "{\"id\":" << s.id
       << ",\"doctor_id\":" << s.doctor_id
       << ",\"date\":" << quoted(s.date.to_string())
       << ",\"start_time\":" << quoted(s.start_time.to_string())
       << ",\"end_time\":" << quoted(s.end_time.to_string())
       << ",\"duration_minutes\":" << s.duration_minutes
       << ",\"delivery_mode\":\"" << to_string(s.delivery_mode) << '"'
       << ",\"state\":\"" << to_string(s.state) << "\"}";
    return ss.str();
}

std::string slots_json(const std::vector<scheduling::Slot>& slots) {
    std::string out = "{\"slots\":[";
    for (size_t i = 0; i < slots.size(); ++i) {
        if (i) out += ',';
        out += slot_json(slots[i]);
    }
    out += "],\"count\":" + std::to_string(slots.size()) + "}";
    return out;
}

std::string booking_json(const scheduling::Booking& b) {
    const auto& a = b.appointment;
    std::ostringstream ss;
    ss << "{\"id\":" << a.id
       << ",\"slot_id\":" << a.slot_id
       << ",\"patient_id\":" << a.patient_id
       << ",\"doctor_id\":" << a.doctor_id
       << ",\"institution_id\":" << opt_int(a.institution_id)
       << ",\"specialty_id\":" << opt_int(a.specialty_id)
       << ",\"urgency\":" << quoted(a.urgency)
       << ",\"visit_type\":" << quoted(a.visit_type)
       << ",\"delivery_mode\":\"" << to_string(a.delivery_mode) << '"'
       << ",\"state\":\"" << to_string(a.state) << '"'
       << ",\"created_by\":" << a.created_by
       << ",\"created_at\":" << quoted(a.created_at)
       << ",\"appointment_date\":" << quoted(scheduling::format_timestamp(b.slot.starts_at()))
       << ",\"slot\":" << slot_json(b.slot) << '}';
    return ss.str();
}

std::string bookings_json(const std::vector<scheduling::Booking>& bookings) {
    std::string out = "{\"appointments\":[";
    for (size_t i = 0; i < bookings.size(); ++i) {
        if (i) out += ',';
        out += booking_json(bookings[i]);
    }
    out += "],\"count\":" + std::to_string(bookings.size()) + "}";
    return out;
}

std::string generate_result_json(const scheduling::GenerateResult& r) {
    std::string out = "{\"created_count\":" + std::to_string(r.created_count) +
                      ",\"skipped_count\":" + std::to_string(r.skipped_count) + ",\"slots\":[";
    for (size_t i = 0; i < r.created.size(); ++i) {
        if (i) out += ',';
        out += slot_json(r.created[i]);
    }
    return out + "]}";
}

std::string shifted_slots_json(const std::vector<scheduling::Slot>& moved) {
    std::string out = "{\"moved_count\":" + std::to_string(moved.size()) + ",\"slots\":[";
    for (size_t i = 0; i < moved.size(); ++i) {
        if (i) out += ',';
        out += slot_json(moved[i]);
    }
    return out + "]}";
}

std::string error_json(const std::string& kind, const std::string& message) {
    return "{\"error\":" + quoted(kind) + ",\"message\":" + quoted(message) + "}";
}

boost::beast::http::status status_for(const boost::system::error_code& ec) {
    using boost::beast::http::status;
    if (ec.category() != scheduling::scheduling_category()) return status::internal_server_error;
    switch (static_cast<errc>(ec.value())) {
        case errc::validation_error: return status::bad_request;
        case errc::not_found: return status::not_found;
        case errc::forbidden: return status::forbidden;
        case errc::slot_unavailable: return status::conflict;
        case errc::slot_conflict: return status::conflict;
        case errc::invalid_state: return status::unprocessable_entity;
        case errc::store_failure: return status::service_unavailable;
    }
    return status::internal_server_error;
}

}
