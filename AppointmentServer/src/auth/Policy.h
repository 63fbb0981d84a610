#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include "scheduling/Types.h"

namespace auth {

enum class Role { patient, doctor, admin };

const char* to_string(Role r);
std::optional<Role> parse_role(std::string_view s);

// Identity handed over by the authentication gate.
struct Caller {
    int64_t user_id = 0;
    Role role = Role::patient;
};

enum class Decision { allow, deny };

inline bool allowed(Decision d) { return d == Decision::allow; }

// created_by, or the doctor the appointment is assigned to
Decision can_read_appointment(const Caller& c, const scheduling::Appointment& a);
Decision can_update_appointment(const Caller& c, const scheduling::Appointment& a);
// created_by only; the assigned doctor may not delete
Decision can_delete_appointment(const Caller& c, const scheduling::Appointment& a);

Decision can_manage_doctor_slots(const Caller& c, int64_t doctor_id);

// Slots a caller may modify: a doctor their own, an admin everyone's, a patient none.
std::optional<scheduling::SlotScope> slot_scope_for(const Caller& c);

}
