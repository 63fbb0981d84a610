#include <iostream>
#include "scheduling/AvailabilitySearch.h"
#include "scheduling/Errors.h"
#include "scheduling/SlotGenerator.h"
#include "store/MemorySlotStore.h"
#include "test_util.h"

using namespace scheduling;

static void generate(store::MemorySlotStore& store, int64_t doctor, Date day, int h_from, int h_to, int duration) {
    SlotGenerator gen(store, test_clock(), Limits{});
    GenerateRequest r;
    r.doctor_id = doctor;
    r.start_date = day;
    r.end_date = day;
    r.start_time = hm(h_from, 0);
    r.end_time = hm(h_to, 0);
    r.duration_minutes = duration;
    gen.generate(r);
}

int main() {
    store::MemorySlotStore store;
    store.set_doctor_specialties(1, {7});
    store.set_doctor_specialties(2, {7, 8});
    store.set_doctor_specialties(3, {8});

    generate(store, 1, ymd(2025, 4, 12), 9, 11, 30);   // 4 slots
    generate(store, 2, ymd(2025, 4, 11), 14, 15, 30);  // 2 slots
    generate(store, 3, ymd(2025, 4, 11), 9, 10, 60);   // 1 slot

    // a slot of doctor 1 from before today
    {
        auto tx = store.begin();
        NewSlot past;
        past.doctor_id = 1;
        past.date = ymd(2025, 4, 9);
        past.start_time = hm(9, 0);
        past.end_time = hm(9, 30);
        past.duration_minutes = 30;
        tx->insert_slot(past);
        tx->commit();
    }

    AvailabilitySearch search(store, test_clock());

    {
        auto day = search.search_slots(1, ymd(2025, 4, 12));
        if (day.size() != 4) { std::cerr << "doctor 1 should have 4 slots, got " << day.size() << "\n"; return 1; }
        if (day[0].start_time != hm(9, 0) || day[3].start_time != hm(10, 30)) { std::cerr << "search_slots order wrong\n"; return 1; }
    }
    {
        // booked and cancelled slots still show up in the day view
        auto tx = store.begin();
        auto day = tx->slots_on(1, ymd(2025, 4, 12));
        tx->claim_slot(day[1].id);
        tx->transition_slot(day[2].id, SlotState::free, SlotState::cancelled);
        tx->commit();
        auto view = search.search_slots(1, ymd(2025, 4, 12));
        if (view.size() != 4 || view[1].state != SlotState::booked || view[2].state != SlotState::cancelled) {
            std::cerr << "day view should report every state\n"; return 1;
        }
    }
    if (!search.search_slots(1, ymd(2025, 4, 13)).empty()) { std::cerr << "empty day not empty\n"; return 1; }

    {
        auto av = search.doctor_availability(1);
        if (av.size() != 2) { std::cerr << "doctor 1 availability should be 2 free slots, got " << av.size() << "\n"; return 1; }
        for (const auto& s : av) {
            if (s.state != SlotState::free) { std::cerr << "availability returned non-free slot\n"; return 1; }
        }
        auto from_past = search.doctor_availability(1, ymd(2025, 4, 1));
        if (from_past.size() != 3 || from_past.front().date != ymd(2025, 4, 9)) { std::cerr << "explicit from not honored\n"; return 1; }
    }
    {
        auto s7 = search.search_by_specialty(7);
        if (s7.size() != 4) { std::cerr << "specialty 7 should have 4 free slots, got " << s7.size() << "\n"; return 1; }
        // doctor 2 on the 11th comes before doctor 1 on the 12th
        if (s7.front().doctor_id != 2 || s7.back().doctor_id != 1) { std::cerr << "specialty results not date ordered\n"; return 1; }
        for (size_t i = 1; i < s7.size(); ++i) {
            if (s7[i].starts_at() < s7[i - 1].starts_at()) { std::cerr << "specialty results out of order\n"; return 1; }
        }
        auto s8 = search.search_by_specialty(8);
        if (s8.size() != 3 || s8.front().doctor_id != 3) { std::cerr << "specialty 8 wrong\n"; return 1; }
        if (!search.search_by_specialty(99).empty()) { std::cerr << "unknown specialty returned slots\n"; return 1; }
    }

    if (error_of([&] { search.search_slots(0, ymd(2025, 4, 12)); }) != errc::validation_error) { std::cerr << "doctor 0 accepted\n"; return 1; }
    if (error_of([&] { search.search_by_specialty(-1); }) != errc::validation_error) { std::cerr << "specialty -1 accepted\n"; return 1; }

    std::cout << "availability_unit ok\n";
    return 0;
}
