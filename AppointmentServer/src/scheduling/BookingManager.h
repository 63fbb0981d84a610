#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "Types.h"
#include "auth/Policy.h"
#include "store/SlotStore.h"

namespace scheduling {

struct SlotTarget {
    int64_t slot_id = 0;
};

// Legacy form: book whatever free slot the doctor has starting at `at`, or create a
// minimal one there when the doctor's schedule is empty at that time.
struct DoctorTimeTarget {
    int64_t doctor_id = 0;
    LocalDateTime at;
    std::optional<int> duration_minutes;
};

using BookingTarget = std::variant<SlotTarget, DoctorTimeTarget>;

struct AppointmentDetails {
    std::optional<int64_t> institution_id;
    std::optional<int64_t> specialty_id;
    std::string urgency = "a";
    std::string visit_type = "general";
    // must match the slot when given
    std::optional<DeliveryMode> delivery_mode;
    AppointmentState initial_state = AppointmentState::confirmed;
};

struct BookingRequest {
    BookingTarget target;
    AppointmentDetails details;
};

struct AppointmentChanges {
    std::optional<LocalDateTime> appointment_date;
    std::optional<AppointmentState> state;
};

class BookingManager {
public:
    BookingManager(store::SlotStore& store, Clock clock, Limits limits)
        : store_(store), clock_(std::move(clock)), limits_(limits) {}

    // Claims the slot and creates the appointment in one transaction. The caller is
    // both patient and owner.
    Booking book(const auth::Caller& caller, const BookingRequest& req);

    Booking read(const auth::Caller& caller, int64_t appointment_id);

    // Re-targets to another free slot of the same doctor and/or moves the state forward.
    Booking update(const auth::Caller& caller, int64_t appointment_id, const AppointmentChanges& changes);

    // Cancels the appointment and releases its slot unless the slot already started.
    Booking cancel(const auth::Caller& caller, int64_t appointment_id);

    // Patients: appointments they created. Doctors: appointments assigned to them.
    // Admins: all. Newest first.
    std::vector<Booking> list(const auth::Caller& caller, const std::optional<Date>& date);

private:
    Slot resolve_slot(store::Transaction& tx, const SlotTarget& t, const AppointmentDetails& d);
    Slot resolve_slot(store::Transaction& tx, const DoctorTimeTarget& t, const AppointmentDetails& d);
    void claim(store::Transaction& tx, const Slot& s);
    void release_unless_started(store::Transaction& tx, Slot& s);
    Slot load_slot(store::Transaction& tx, int64_t slot_id);

    store::SlotStore& store_;
    Clock clock_;
    Limits limits_;
};

}
