#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include "db/DbPool.h"
#include "scheduling/Errors.h"
#include "scheduling/Scheduler.h"
#include "store/PgSlotStore.h"
#include "test_util.h"

using namespace scheduling;

// Runs against a database that already has sql/001_schema.sql applied.
static int scenario(store::SlotStore& st, int64_t doctor_id) {
    Scheduler s(st, system_clock(0), Limits{});
    const Date day = s.clock()().date.add_days(60);

    GenerateRequest g;
    g.doctor_id = doctor_id;
    g.start_date = day;
    g.end_date = day;
    g.start_time = hm(9, 0);
    g.end_time = hm(11, 0);
    g.duration_minutes = 30;
    auto gen = s.generate_slots(g);
    if (gen.created_count != 4) { std::cerr << "generate created " << gen.created_count << "\n"; return 1; }
    if (s.generate_slots(g).skipped_count != 4) { std::cerr << "regenerate should skip 4\n"; return 1; }

    auto slots = s.search_slots(doctor_id, day);
    if (slots.size() != 4 || slots[0].start_time != hm(9, 0) || slots[3].start_time != hm(10, 30)) { std::cerr << "search_slots wrong\n"; return 1; }
    if (s.doctor_availability(doctor_id, day).size() != 4) { std::cerr << "availability wrong\n"; return 1; }

    const auth::Caller patient{doctor_id + 1, auth::Role::patient};
    const auth::Caller other{doctor_id + 2, auth::Role::patient};
    BookingRequest r;
    r.target = SlotTarget{slots[0].id};
    Booking b = s.book_appointment(patient, r);
    if (b.slot.state != SlotState::booked || b.appointment.slot_id != slots[0].id) { std::cerr << "booking wrong\n"; return 1; }
    if (error_of([&] { s.book_appointment(other, r); }) != errc::slot_unavailable) { std::cerr << "double booking not refused\n"; return 1; }

    const auto scope = SlotScope::doctor(doctor_id);
    if (error_of([&] { s.shift_slot(scope, slots[1].id, day, hm(10, 0)); }) != errc::slot_conflict) { std::cerr << "overlapping shift allowed\n"; return 1; }
    {
        Slot moved = s.shift_slot(scope, slots[1].id, day, hm(13, 0));
        if (moved.start_time != hm(13, 0) || moved.end_time != hm(13, 30)) { std::cerr << "shift wrong\n"; return 1; }
    }

    BookingRequest legacy;
    legacy.target = DoctorTimeTarget{doctor_id, LocalDateTime{day, hm(15, 0)}, std::nullopt};
    Booking made = s.book_appointment(other, legacy);
    if (made.slot.start_time != hm(15, 0) || made.slot.state != SlotState::booked) { std::cerr << "legacy slot wrong\n"; return 1; }

    if (s.cancel_slots(scope, {slots[3].id}) != 1) { std::cerr << "cancel should count 1\n"; return 1; }
    if (s.cancel_slots(scope, {slots[3].id}) != 0) { std::cerr << "repeat cancel should count 0\n"; return 1; }
    if (s.convert_delivery_mode(scope, slots[0].id, DeliveryMode::telemedicine).delivery_mode != DeliveryMode::telemedicine) { std::cerr << "convert failed\n"; return 1; }

    {
        Booking gone = s.delete_appointment(patient, b.appointment.id);
        if (gone.appointment.state != AppointmentState::cancelled) { std::cerr << "delete state wrong\n"; return 1; }
        if (s.read_appointment(patient, b.appointment.id).slot.state != SlotState::free) { std::cerr << "delete did not release slot\n"; return 1; }
    }
    if (s.list_appointments(other, day).size() != 1) { std::cerr << "list for other patient\n"; return 1; }

    // live now: slots[0] free, slots[1] moved, slots[2] free, the legacy slot booked
    if (s.cancel_slots_by_date(scope, day) != 4) { std::cerr << "cancel by date should count 4\n"; return 1; }
    if (!s.doctor_availability(doctor_id, day).empty()) { std::cerr << "free slots left after cancel by date\n"; return 1; }

    // whole-day move onto longer slots; the overlap constraint is checked at commit
    const Date next = day.add_days(1);
    g.start_date = next;
    g.end_date = next;
    g.end_time = hm(10, 30);
    if (s.generate_slots(g).created_count != 3) { std::cerr << "second day generate wrong\n"; return 1; }
    GenerateRequest target = g;
    target.start_time = hm(9, 30);
    target.end_time = hm(12, 30);
    target.duration_minutes = 45;
    auto moved = s.shift_slots_by_date(scope, next, target);
    if (moved.size() != 3) { std::cerr << "day move count wrong\n"; return 1; }
    auto after = s.search_slots(doctor_id, next);
    if (after.size() != 3 || after[0].start_time != hm(9, 30) || after[2].end_time != hm(11, 45) || after[1].duration_minutes != 45) {
        std::cerr << "day move not persisted\n"; return 1;
    }
    target.start_time = hm(9, 0);
    target.end_time = hm(10, 0);
    if (error_of([&] { s.shift_slots_by_date(scope, next, target); }) != errc::validation_error) { std::cerr << "day move into too few slots allowed\n"; return 1; }
    return 0;
}

// Many bookers on one slot through separate connections: one wins, the rest are refused.
static int race(store::PgStoreRunner& runner, int64_t doctor_id) {
    int64_t slot_id = 0;
    {
        Waiter ready;
        std::atomic<int> setup_code{1};
        runner.post([&](store::SlotStore& st) {
            try {
                Scheduler s(st, system_clock(0), Limits{});
                GenerateRequest g;
                g.doctor_id = doctor_id;
                g.start_date = s.clock()().date.add_days(61);
                g.end_date = g.start_date;
                g.start_time = hm(9, 0);
                g.end_time = hm(9, 30);
                g.duration_minutes = 30;
                auto res = s.generate_slots(g);
                if (res.created_count == 1) {
                    slot_id = res.created.front().id;
                    setup_code = 0;
                }
            } catch (const std::exception& e) {
                std::cerr << "race setup threw: " << e.what() << "\n";
            }
            std::lock_guard<std::mutex> lk(ready.mu);
            ready.done = 1;
            ready.cv.notify_one();
        });
        std::unique_lock<std::mutex> lk(ready.mu);
        if (!ready.cv.wait_for(lk, std::chrono::seconds(30), [&] { return ready.done == 1; })) { std::cerr << "race setup timed out\n"; return 1; }
        if (setup_code != 0) { std::cerr << "race setup failed\n"; return 1; }
    }

    const int kBookers = 12;
    Waiter w;
    std::atomic<int> booked{0}, unavailable{0}, other{0};
    for (int i = 0; i < kBookers; ++i) {
        runner.post([&, i](store::SlotStore& st) {
            Scheduler s(st, system_clock(0), Limits{});
            BookingRequest r;
            r.target = SlotTarget{slot_id};
            std::optional<errc> err;
            try {
                err = error_of([&] { s.book_appointment(auth::Caller{doctor_id + 100 + i, auth::Role::patient}, r); });
            } catch (const std::exception& e) {
                std::cerr << "booker threw: " << e.what() << "\n";
                err = errc::store_failure;
            }
            if (!err) ++booked;
            else if (*err == errc::slot_unavailable) ++unavailable;
            else ++other;
            std::lock_guard<std::mutex> lk(w.mu);
            ++w.done;
            w.cv.notify_one();
        });
    }
    std::unique_lock<std::mutex> lk(w.mu);
    if (!w.cv.wait_for(lk, std::chrono::seconds(30), [&] { return w.done == kBookers; })) {
        std::cerr << "race timed out, " << w.done << " of " << kBookers << " finished\n"; return 1;
    }
    if (booked != 1) { std::cerr << "expected exactly one winner, got " << booked << "\n"; return 1; }
    if (unavailable != kBookers - 1 || other != 0) { std::cerr << "losers: unavailable=" << unavailable << " other=" << other << "\n"; return 1; }
    return 0;
}

int main() {
    const char* url = std::getenv("DATABASE_URL");
    if (!url || !url[0]) {
        std::cout << "pg_store_smoke skipped: DATABASE_URL not set\n";
        return 77;
    }

    Waiter w;
    std::atomic<int> exit_code{1};
    auto pool = std::make_shared<db::DbPool>(std::string(url), 4);
    store::PgStoreRunner runner(pool);

    // fresh doctor ids per run keep reruns independent
    const int64_t doctor_id = 1000000 + std::chrono::system_clock::now().time_since_epoch().count() % 1000000000;

    runner.post([&](store::SlotStore& st) {
        try {
            exit_code = scenario(st, doctor_id);
        } catch (const std::exception& e) {
            std::cerr << "scenario threw: " << e.what() << "\n";
            exit_code = 1;
        }
        std::lock_guard<std::mutex> lk(w.mu);
        w.done = 1;
        w.cv.notify_one();
    });

    {
        std::unique_lock<std::mutex> lk(w.mu);
        if (!w.cv.wait_for(lk, std::chrono::seconds(30), [&] { return w.done == 1; })) {
            std::cerr << "timed out\n";
            return 1;
        }
    }
    if (exit_code != 0) return 1;
    if (race(runner, doctor_id + 50) != 0) return 1;
    std::cout << "pg_store_smoke ok\n";
    return 0;
}
