#include "Policy.h"

namespace auth {

const char* to_string(Role r) {
    switch (r) {
        case Role::patient: return "patient";
        case Role::doctor: return "doctor";
        case Role::admin: return "admin";
    }
    return "patient";
}

std::optional<Role> parse_role(std::string_view s) {
    if (s == "patient") return Role::patient;
    if (s == "doctor") return Role::doctor;
    if (s == "admin") return Role::admin;
    return std::nullopt;
}

static bool is_assigned_doctor(const Caller& c, const scheduling::Appointment& a) {
    return c.role == Role::doctor && c.user_id == a.doctor_id;
}

Decision can_read_appointment(const Caller& c, const scheduling::Appointment& a) {
    if (c.user_id == a.created_by || is_assigned_doctor(c, a)) return Decision::allow;
    return Decision::deny;
}

Decision can_update_appointment(const Caller& c, const scheduling::Appointment& a) {
    return can_read_appointment(c, a);
}

Decision can_delete_appointment(const Caller& c, const scheduling::Appointment& a) {
    return c.user_id == a.created_by ? Decision::allow : Decision::deny;
}

Decision can_manage_doctor_slots(const Caller& c, int64_t doctor_id) {
    if (c.role == Role::admin) return Decision::allow;
    if (c.role == Role::doctor && c.user_id == doctor_id) return Decision::allow;
    return Decision::deny;
}

std::optional<scheduling::SlotScope> slot_scope_for(const Caller& c) {
    switch (c.role) {
        case Role::admin: return scheduling::SlotScope::all_doctors();
        case Role::doctor: return scheduling::SlotScope::doctor(c.user_id);
        case Role::patient: return std::nullopt;
    }
    return std::nullopt;
}

}
