#include <iostream>
#include <string>
#include "auth/Policy.h"

using namespace auth;

int main() {
    scheduling::Appointment a;
    a.id = 1;
    a.created_by = 100;
    a.patient_id = 100;
    a.doctor_id = 12;

    const Caller owner{100, Role::patient};
    const Caller stranger{101, Role::patient};
    const Caller assigned{12, Role::doctor};
    const Caller other_doctor{13, Role::doctor};
    const Caller admin{1, Role::admin};
    // a patient whose id happens to equal the doctor's gains nothing from it
    const Caller namesake{12, Role::patient};

    if (!allowed(can_read_appointment(owner, a))) { std::cerr << "owner cannot read\n"; return 1; }
    if (!allowed(can_read_appointment(assigned, a))) { std::cerr << "assigned doctor cannot read\n"; return 1; }
    if (allowed(can_read_appointment(stranger, a))) { std::cerr << "stranger can read\n"; return 1; }
    if (allowed(can_read_appointment(other_doctor, a))) { std::cerr << "other doctor can read\n"; return 1; }
    if (allowed(can_read_appointment(namesake, a))) { std::cerr << "patient namesake can read\n"; return 1; }

    if (!allowed(can_update_appointment(owner, a)) || !allowed(can_update_appointment(assigned, a))) { std::cerr << "update denied to owner or doctor\n"; return 1; }
    if (allowed(can_update_appointment(stranger, a))) { std::cerr << "stranger can update\n"; return 1; }

    if (!allowed(can_delete_appointment(owner, a))) { std::cerr << "owner cannot delete\n"; return 1; }
    if (allowed(can_delete_appointment(assigned, a))) { std::cerr << "assigned doctor can delete\n"; return 1; }
    if (allowed(can_delete_appointment(admin, a))) { std::cerr << "admin can delete someone else's appointment\n"; return 1; }

    if (!allowed(can_manage_doctor_slots(assigned, 12))) { std::cerr << "doctor cannot manage own slots\n"; return 1; }
    if (allowed(can_manage_doctor_slots(other_doctor, 12))) { std::cerr << "doctor can manage another doctor's slots\n"; return 1; }
    if (!allowed(can_manage_doctor_slots(admin, 12))) { std::cerr << "admin cannot manage slots\n"; return 1; }
    if (allowed(can_manage_doctor_slots(namesake, 12))) { std::cerr << "patient can manage slots\n"; return 1; }

    {
        auto s = slot_scope_for(assigned);
        if (!s || !s->covers(12) || s->covers(13)) { std::cerr << "doctor scope wrong\n"; return 1; }
        auto all = slot_scope_for(admin);
        if (!all || !all->covers(12) || !all->covers(13) || all->doctor_id()) { std::cerr << "admin scope wrong\n"; return 1; }
        if (slot_scope_for(owner)) { std::cerr << "patient got a slot scope\n"; return 1; }
    }

    if (parse_role("doctor") != Role::doctor || parse_role("admin") != Role::admin || parse_role("patient") != Role::patient) {
        std::cerr << "parse_role failed\n"; return 1;
    }
    if (parse_role("nurse") || parse_role("")) { std::cerr << "parse_role accepted junk\n"; return 1; }
    if (std::string(to_string(Role::doctor)) != "doctor") { std::cerr << "to_string(Role) wrong\n"; return 1; }

    std::cout << "policy_unit ok\n";
    return 0;
}
