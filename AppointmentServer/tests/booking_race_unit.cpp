#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>
#include "scheduling/Errors.h"
#include "scheduling/Scheduler.h"
#include "store/MemorySlotStore.h"
#include "test_util.h"

using namespace scheduling;

// Reads report every slot as free, as a reader that lost the race to another writer
// would have seen it. Writes go to the real store.
class StaleReadTransaction : public store::Transaction {
public:
    explicit StaleReadTransaction(std::unique_ptr<store::Transaction> inner) : inner_(std::move(inner)) {}

    void lock_doctor(int64_t doctor_id) override { inner_->lock_doctor(doctor_id); }
    void defer_overlap_check() override { inner_->defer_overlap_check(); }

    std::optional<Slot> find_slot(int64_t slot_id, bool for_update) override {
        auto s = inner_->find_slot(slot_id, for_update);
        if (s && s->live()) s->state = SlotState::free;
        return s;
    }
    std::vector<Slot> slots_on(int64_t doctor_id, const Date& date) override {
        auto out = inner_->slots_on(doctor_id, date);
        for (auto& s : out) {
            if (s.live()) s.state = SlotState::free;
        }
        return out;
    }
    std::vector<Slot> live_slots_on(const Date& date, const std::optional<int64_t>& doctor_id) override {
        return inner_->live_slots_on(date, doctor_id);
    }
    std::vector<Slot> free_slots_for_doctor(int64_t doctor_id, const std::optional<Date>& from) override {
        return inner_->free_slots_for_doctor(doctor_id, from);
    }
    std::vector<Slot> free_slots_for_specialty(int64_t specialty_id, const std::optional<Date>& from) override {
        return inner_->free_slots_for_specialty(specialty_id, from);
    }
    Slot insert_slot(const NewSlot& n) override { return inner_->insert_slot(n); }
    bool claim_slot(int64_t slot_id) override { return inner_->claim_slot(slot_id); }
    bool transition_slot(int64_t slot_id, SlotState from, SlotState to) override { return inner_->transition_slot(slot_id, from, to); }
    void update_slot_schedule(int64_t slot_id, const Date& date, TimeOfDay start, TimeOfDay end) override {
        inner_->update_slot_schedule(slot_id, date, start, end);
    }
    void update_slot_mode(int64_t slot_id, DeliveryMode mode) override { inner_->update_slot_mode(slot_id, mode); }
    std::optional<Appointment> find_appointment(int64_t id, bool for_update) override { return inner_->find_appointment(id, for_update); }
    std::optional<Appointment> live_appointment_for_slot(int64_t slot_id) override { return inner_->live_appointment_for_slot(slot_id); }
    std::vector<Appointment> appointments(const AppointmentFilter& f) override { return inner_->appointments(f); }
    Appointment insert_appointment(const NewAppointment& n) override { return inner_->insert_appointment(n); }
    void update_appointment(const Appointment& a) override { inner_->update_appointment(a); }
    void commit() override { inner_->commit(); }

private:
    std::unique_ptr<store::Transaction> inner_;
};

class StaleReadStore : public store::SlotStore {
public:
    explicit StaleReadStore(store::SlotStore& inner) : inner_(inner) {}
    std::unique_ptr<store::Transaction> begin() override {
        return std::make_unique<StaleReadTransaction>(inner_.begin());
    }
private:
    store::SlotStore& inner_;
};

static size_t appointments_of(store::SlotStore& st, int64_t doctor_id) {
    auto tx = st.begin();
    AppointmentFilter f;
    f.doctor_id = doctor_id;
    return tx->appointments(f).size();
}

int main() {
    auto store = std::make_shared<store::MemorySlotStore>();
    int64_t slot_id = 0;
    {
        Scheduler s(*store, test_clock(), Limits{});
        GenerateRequest g;
        g.doctor_id = 21;
        g.start_date = ymd(2025, 4, 11);
        g.end_date = ymd(2025, 4, 11);
        g.start_time = hm(9, 0);
        g.end_time = hm(9, 30);
        g.duration_minutes = 30;
        auto res = s.generate_slots(g);
        if (res.created_count != 1) { std::cerr << "setup: expected one slot\n"; return 1; }
        slot_id = res.created.front().id;
    }

    const int kPatients = 16;
    Waiter w;
    std::atomic<int> booked{0}, unavailable{0}, other{0};
    store::MemoryStoreRunner runner(store, 8);

    for (int i = 0; i < kPatients; ++i) {
        runner.post([&, i](store::SlotStore& st) {
            Scheduler s(st, test_clock(), Limits{});
            BookingRequest r;
            r.target = SlotTarget{slot_id};
            auto err = error_of([&] { s.book_appointment(auth::Caller{1000 + i, auth::Role::patient}, r); });
            if (!err) ++booked;
            else if (*err == errc::slot_unavailable) ++unavailable;
            else ++other;
            std::lock_guard<std::mutex> lk(w.mu);
            ++w.done;
            w.cv.notify_one();
        });
    }
    {
        std::unique_lock<std::mutex> lk(w.mu);
        if (!w.cv.wait_for(lk, std::chrono::seconds(10), [&] { return w.done == kPatients; })) {
            std::cerr << "timed out, " << w.done << " of " << kPatients << " finished\n"; return 1;
        }
    }

    if (booked != 1) { std::cerr << "expected exactly one winner, got " << booked << "\n"; return 1; }
    if (unavailable != kPatients - 1 || other != 0) { std::cerr << "losers: unavailable=" << unavailable << " other=" << other << "\n"; return 1; }

    {
        auto tx = store->begin();
        auto s = tx->find_slot(slot_id, false);
        if (!s || s->state != SlotState::booked) { std::cerr << "slot not booked after race\n"; return 1; }
        AppointmentFilter f;
        f.doctor_id = 21;
        auto all = tx->appointments(f);
        if (all.size() != 1 || !tx->live_appointment_for_slot(slot_id)) { std::cerr << "expected one live appointment, found " << all.size() << "\n"; return 1; }
    }

    // The free check passed on a stale read; the conditional claim must still refuse.
    {
        StaleReadStore stale(*store);
        Scheduler s(stale, test_clock(), Limits{});
        BookingRequest r;
        r.target = SlotTarget{slot_id};
        if (error_of([&] { s.book_appointment(auth::Caller{2000, auth::Role::patient}, r); }) != errc::slot_unavailable) {
            std::cerr << "lost claim by id not refused\n"; return 1;
        }
        BookingRequest legacy;
        legacy.target = DoctorTimeTarget{21, at(2025, 4, 11, 9, 0), std::nullopt};
        if (error_of([&] { s.book_appointment(auth::Caller{2001, auth::Role::patient}, legacy); }) != errc::slot_unavailable) {
            std::cerr << "lost claim by time not refused\n"; return 1;
        }
        if (appointments_of(*store, 21) != 1) { std::cerr << "lost claim left an appointment behind\n"; return 1; }
    }

    std::cout << "booking_race_unit ok\n";
    return 0;
}
