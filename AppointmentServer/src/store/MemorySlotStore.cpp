#include "MemorySlotStore.h"
#include <algorithm>
#include <tuple>
#include <boost/asio/post.hpp>
#include "observability/Logging.h"

namespace store {

using scheduling::Appointment;
using scheduling::Date;
using scheduling::Slot;
using scheduling::SlotState;
using scheduling::TimeOfDay;

static bool by_schedule(const Slot& a, const Slot& b) {
    if (a.date != b.date) return a.date < b.date;
    if (a.start_time != b.start_time) return a.start_time < b.start_time;
    return a.doctor_id < b.doctor_id;
}

static bool overlaps_live(const MemorySlotStore::State& st, int64_t skip_id, int64_t doctor_id,
                          const Date& date, TimeOfDay start, TimeOfDay end) {
    for (const auto& p : st.slots) {
        if (p.first == skip_id || !p.second.live() || p.second.doctor_id != doctor_id) continue;
        if (p.second.overlaps(date, start, end)) return true;
    }
    return false;
}

// Any two live slots of one doctor sharing time.
static bool has_overlap(const MemorySlotStore::State& st) {
    std::vector<const Slot*> live;
    for (const auto& p : st.slots) {
        if (p.second.live()) live.push_back(&p.second);
    }
    std::sort(live.begin(), live.end(), [](const Slot* a, const Slot* b) {
        return std::make_tuple(a->doctor_id, a->date.days_since_epoch(), a->start_time.minutes) <
               std::make_tuple(b->doctor_id, b->date.days_since_epoch(), b->start_time.minutes);
    });
    for (std::size_t i = 1; i < live.size(); ++i) {
        const Slot& prev = *live[i - 1];
        const Slot& cur = *live[i];
        if (prev.doctor_id == cur.doctor_id && prev.date == cur.date && cur.start_time < prev.end_time) return true;
    }
    return false;
}

// Reads see the committed state until the first write stages a private copy;
// commit() swaps the copy in.
class MemorySlotStore::Tx : public Transaction {
public:
    Tx(std::unique_lock<std::mutex> lk, MemorySlotStore& owner)
        : lk_(std::move(lk)), owner_(owner) {}

    void lock_doctor(int64_t) override {}

    void defer_overlap_check() override { deferred_overlap_ = true; }

    std::optional<Slot> find_slot(int64_t slot_id, bool) override {
        const auto& slots = view().slots;
        auto it = slots.find(slot_id);
        if (it == slots.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Slot> slots_on(int64_t doctor_id, const Date& date) override {
        std::vector<Slot> out;
        for (const auto& p : view().slots) {
            if (p.second.doctor_id == doctor_id && p.second.date == date) out.push_back(p.second);
        }
        std::sort(out.begin(), out.end(), by_schedule);
        return out;
    }

    std::vector<Slot> live_slots_on(const Date& date, const std::optional<int64_t>& doctor_id) override {
        std::vector<Slot> out;
        for (const auto& p : view().slots) {
            const Slot& s = p.second;
            if (s.date != date || !s.live()) continue;
            if (doctor_id && s.doctor_id != *doctor_id) continue;
            out.push_back(s);
        }
        std::sort(out.begin(), out.end(), by_schedule);
        return out;
    }

    std::vector<Slot> free_slots_for_doctor(int64_t doctor_id, const std::optional<Date>& from) override {
        std::vector<Slot> out;
        for (const auto& p : view().slots) {
            const Slot& s = p.second;
            if (s.doctor_id != doctor_id || s.state != SlotState::free) continue;
            if (from && s.date < *from) continue;
            out.push_back(s);
        }
        std::sort(out.begin(), out.end(), by_schedule);
        return out;
    }

    std::vector<Slot> free_slots_for_specialty(int64_t specialty_id, const std::optional<Date>& from) override {
        const State& st = view();
        std::vector<Slot> out;
        for (const auto& p : st.slots) {
            const Slot& s = p.second;
            if (s.state != SlotState::free) continue;
            if (from && s.date < *from) continue;
            auto sp = st.specialties.find(s.doctor_id);
            if (sp == st.specialties.end() || sp->second.count(specialty_id) == 0) continue;
            out.push_back(s);
        }
        std::sort(out.begin(), out.end(), by_schedule);
        return out;
    }

    Slot insert_slot(const scheduling::NewSlot& n) override {
        if (!deferred_overlap_ && n.state != SlotState::cancelled &&
            overlaps_live(view(), 0, n.doctor_id, n.date, n.start_time, n.end_time)) {
            throw StoreError("slot overlaps an existing slot", "23P01");
        }
        State& st = writable();
        Slot s;
        s.id = st.next_slot_id++;
        s.doctor_id = n.doctor_id;
        s.date = n.date;
        s.start_time = n.start_time;
        s.end_time = n.end_time;
        s.duration_minutes = n.duration_minutes;
        s.delivery_mode = n.delivery_mode;
        s.state = n.state;
        st.slots.emplace(s.id, s);
        return s;
    }

    bool claim_slot(int64_t slot_id) override {
        return transition_slot(slot_id, SlotState::free, SlotState::booked);
    }

    bool transition_slot(int64_t slot_id, SlotState from, SlotState to) override {
        auto current = find_slot(slot_id, true);
        if (!current || current->state != from) return false;
        existing_slot(slot_id).state = to;
        return true;
    }

    void update_slot_schedule(int64_t slot_id, const Date& date, TimeOfDay start, TimeOfDay end) override {
        auto current = find_slot(slot_id, true);
        if (!current) throw StoreError("slot vanished during update");
        if (!deferred_overlap_ && current->live() && overlaps_live(view(), slot_id, current->doctor_id, date, start, end)) {
            throw StoreError("slot overlaps an existing slot", "23P01");
        }
        Slot& s = existing_slot(slot_id);
        s.date = date;
        s.start_time = start;
        s.end_time = end;
        s.duration_minutes = end.minutes - start.minutes;
    }

    void update_slot_mode(int64_t slot_id, scheduling::DeliveryMode mode) override {
        existing_slot(slot_id).delivery_mode = mode;
    }

    std::optional<Appointment> find_appointment(int64_t appointment_id, bool) override {
        const auto& appointments = view().appointments;
        auto it = appointments.find(appointment_id);
        if (it == appointments.end()) return std::nullopt;
        return it->second;
    }

    std::optional<Appointment> live_appointment_for_slot(int64_t slot_id) override {
        for (const auto& p : view().appointments) {
            if (p.second.slot_id == slot_id && p.second.state != scheduling::AppointmentState::cancelled) return p.second;
        }
        return std::nullopt;
    }

    std::vector<Appointment> appointments(const scheduling::AppointmentFilter& f) override {
        const State& st = view();
        std::vector<std::pair<scheduling::LocalDateTime, Appointment>> rows;
        for (const auto& p : st.appointments) {
            const Appointment& a = p.second;
            if (f.created_by && a.created_by != *f.created_by) continue;
            if (f.doctor_id && a.doctor_id != *f.doctor_id) continue;
            auto s = st.slots.find(a.slot_id);
            if (s == st.slots.end()) continue;
            if (f.date && s->second.date != *f.date) continue;
            rows.emplace_back(s->second.starts_at(), a);
        }
        std::stable_sort(rows.begin(), rows.end(), [](const auto& a, const auto& b){ return b.first < a.first; });
        std::vector<Appointment> out;
        out.reserve(rows.size());
        for (auto& r : rows) out.push_back(std::move(r.second));
        return out;
    }

    Appointment insert_appointment(const scheduling::NewAppointment& n) override {
        if (view().slots.count(n.slot_id) == 0) throw StoreError("appointment references unknown slot", "23503");
        if (n.state != scheduling::AppointmentState::cancelled && live_appointment_for_slot(n.slot_id)) {
            throw StoreError("slot already has a live appointment", "23505");
        }
        State& st = writable();
        Appointment a;
        a.id = st.next_appointment_id++;
        a.slot_id = n.slot_id;
        a.patient_id = n.patient_id;
        a.doctor_id = n.doctor_id;
        a.institution_id = n.institution_id;
        a.specialty_id = n.specialty_id;
        a.urgency = n.urgency;
        a.visit_type = n.visit_type;
        a.delivery_mode = n.delivery_mode;
        a.state = n.state;
        a.created_by = n.created_by;
        a.created_at = n.created_at;
        st.appointments.emplace(a.id, a);
        return a;
    }

    void update_appointment(const Appointment& a) override {
        if (view().appointments.count(a.id) == 0) throw StoreError("appointment vanished during update");
        Appointment& row = writable().appointments.at(a.id);
        row.slot_id = a.slot_id;
        row.state = a.state;
        row.delivery_mode = a.delivery_mode;
    }

    void commit() override {
        if (!lk_.owns_lock()) throw StoreError("transaction already finished");
        if (staged_) {
            if (deferred_overlap_ && has_overlap(*staged_)) throw StoreError("slots overlap at commit", "23P01");
            owner_.state_ = std::move(*staged_);
            staged_.reset();
        }
        lk_.unlock();
    }

private:
    const State& view() const { return staged_ ? *staged_ : owner_.state_; }

    State& writable() {
        if (!staged_) {
            staged_.emplace(owner_.state_);
            ++owner_.staged_copies_;
        }
        return *staged_;
    }

    Slot& existing_slot(int64_t slot_id) {
        auto& slots = writable().slots;
        auto it = slots.find(slot_id);
        if (it == slots.end()) throw StoreError("slot vanished during update");
        return it->second;
    }

    std::unique_lock<std::mutex> lk_;
    MemorySlotStore& owner_;
    std::optional<State> staged_;
    bool deferred_overlap_ = false;
};

MemorySlotStore::MemorySlotStore(int64_t first_slot_id, int64_t first_appointment_id) {
    state_.next_slot_id = first_slot_id;
    state_.next_appointment_id = first_appointment_id;
}

std::unique_ptr<Transaction> MemorySlotStore::begin() {
    std::unique_lock<std::mutex> lk(mu_);
    return std::make_unique<Tx>(std::move(lk), *this);
}

void MemorySlotStore::set_doctor_specialties(int64_t doctor_id, std::set<int64_t> specialties) {
    std::lock_guard<std::mutex> lk(mu_);
    state_.specialties[doctor_id] = std::move(specialties);
}

uint64_t MemorySlotStore::staged_copies() {
    std::lock_guard<std::mutex> lk(mu_);
    return staged_copies_;
}

MemoryStoreRunner::MemoryStoreRunner(std::shared_ptr<MemorySlotStore> store, std::size_t threads)
    : store_(std::move(store)), pool_(std::max<std::size_t>(1, threads)) {}

MemoryStoreRunner::~MemoryStoreRunner() {
    pool_.join();
}

void MemoryStoreRunner::post(std::function<void(SlotStore&)> work) {
    auto store = store_;
    boost::asio::post(pool_, [store, work = std::move(work)]() {
        try {
            work(*store);
        } catch (const std::exception& e) {
            observability::log_error("memory_store.task_exception", {{"err", std::string(e.what())}});
        }
    });
}

}
