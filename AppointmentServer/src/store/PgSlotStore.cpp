#include "PgSlotStore.h"
#include "db/DbPool.h"
#include "observability/Logging.h"

namespace store {

using scheduling::Appointment;
using scheduling::Date;
using scheduling::Slot;
using scheduling::TimeOfDay;

namespace {

const char* kSlotColumns =
    "s.id, s.doctor_id, to_char(s.slot_date, 'YYYY-MM-DD'), to_char(s.start_time, 'HH24:MI'), "
    "to_char(s.end_time, 'HH24:MI'), s.duration_minutes, s.delivery_mode, s.state";

const char* kAppointmentColumns =
    "a.id, a.slot_id, a.patient_id, a.doctor_id, a.institution_id, a.specialty_id, a.urgency, a.visit_type, "
    "a.delivery_mode, a.state, a.created_by, to_char(a.created_at, 'YYYY-MM-DD HH24:MI:SS')";

std::string cell(const std::vector<std::optional<std::string>>& row, size_t i) {
    if (i >= row.size() || !row[i].has_value()) throw StoreError("unexpected NULL column in slot store row");
    return *row[i];
}

int64_t cell_i64(const std::vector<std::optional<std::string>>& row, size_t i) {
    try { return std::stoll(cell(row, i)); } catch (const std::logic_error&) { throw StoreError("non-numeric column in slot store row"); }
}

std::optional<int64_t> cell_opt_i64(const std::vector<std::optional<std::string>>& row, size_t i) {
    if (i >= row.size() || !row[i].has_value()) return std::nullopt;
    return cell_i64(row, i);
}

TimeOfDay cell_time(const std::vector<std::optional<std::string>>& row, size_t i) {
    auto t = scheduling::parse_time(cell(row, i));
    if (!t) throw StoreError("malformed time column in slot store row");
    return *t;
}

Slot slot_from_row(const std::vector<std::optional<std::string>>& row) {
    Slot s;
    s.id = cell_i64(row, 0);
    s.doctor_id = cell_i64(row, 1);
    auto d = scheduling::parse_date(cell(row, 2));
    if (!d) throw StoreError("malformed date column in slot store row");
    s.date = *d;
    s.start_time = cell_time(row, 3);
    s.end_time = cell_time(row, 4);
    s.duration_minutes = static_cast<int>(cell_i64(row, 5));
    auto m = scheduling::parse_delivery_mode(cell(row, 6));
    auto st = scheduling::parse_slot_state(cell(row, 7));
    if (!m || !st) throw StoreError("unknown enum value in slot row");
    s.delivery_mode = *m;
    s.state = *st;
    return s;
}

Appointment appointment_from_row(const std::vector<std::optional<std::string>>& row) {
    Appointment a;
    a.id = cell_i64(row, 0);
    a.slot_id = cell_i64(row, 1);
    a.patient_id = cell_i64(row, 2);
    a.doctor_id = cell_i64(row, 3);
    a.institution_id = cell_opt_i64(row, 4);
    a.specialty_id = cell_opt_i64(row, 5);
    a.urgency = cell(row, 6);
    a.visit_type = cell(row, 7);
    auto m = scheduling::parse_delivery_mode(cell(row, 8));
    auto st = scheduling::parse_appointment_state(cell(row, 9));
    if (!m || !st) throw StoreError("unknown enum value in appointment row");
    a.delivery_mode = *m;
    a.state = *st;
    a.created_by = cell_i64(row, 10);
    a.created_at = cell(row, 11);
    return a;
}

std::optional<std::string> opt_str(const std::optional<int64_t>& v) {
    if (!v) return std::nullopt;
    return std::to_string(*v);
}

std::optional<std::string> opt_str(const std::optional<Date>& v) {
    if (!v) return std::nullopt;
    return v->to_string();
}

class PgTransaction : public Transaction {
public:
    explicit PgTransaction(PGconn* conn) : conn_(conn) {
        run("BEGIN ISOLATION LEVEL READ COMMITTED", {});
        open_ = true;
    }

    ~PgTransaction() override {
        if (!open_) return;
        db::DbResult r = db::make_result(PQexec(conn_, "ROLLBACK"));
        if (!r.ok) observability::log_warn("pg_store.rollback_failed", {{"msg", r.message}});
    }

    void lock_doctor(int64_t doctor_id) override {
        run("SELECT pg_advisory_xact_lock($1::bigint)", {std::to_string(doctor_id)});
    }

    void defer_overlap_check() override {
        run("SET CONSTRAINTS slots_no_overlap DEFERRED", {});
    }

    std::optional<Slot> find_slot(int64_t slot_id, bool for_update) override {
        std::string sql = std::string("SELECT ") + kSlotColumns + " FROM slots s WHERE s.id = $1";
        if (for_update) sql += " FOR UPDATE";
        auto r = run(sql, {std::to_string(slot_id)});
        if (r.rows.empty()) return std::nullopt;
        return slot_from_row(r.rows[0]);
    }

    std::vector<Slot> slots_on(int64_t doctor_id, const Date& date) override {
        std::string sql = std::string("SELECT ") + kSlotColumns +
            " FROM slots s WHERE s.doctor_id = $1 AND s.slot_date = $2::date ORDER BY s.start_time, s.id";
        return slots(run(sql, {std::to_string(doctor_id), date.to_string()}));
    }

    std::vector<Slot> live_slots_on(const Date& date, const std::optional<int64_t>& doctor_id) override {
        std::string sql = std::string("SELECT ") + kSlotColumns +
            " FROM slots s WHERE s.slot_date = $1::date AND s.state <> 'cancelled'"
            " AND ($2::bigint IS NULL OR s.doctor_id = $2::bigint)"
            " ORDER BY s.start_time, s.doctor_id FOR UPDATE";
        return slots(run(sql, {date.to_string(), opt_str(doctor_id)}));
    }

    std::vector<Slot> free_slots_for_doctor(int64_t doctor_id, const std::optional<Date>& from) override {
        std::string sql = std::string("SELECT ") + kSlotColumns +
            " FROM slots s WHERE s.doctor_id = $1 AND s.state = 'free'"
            " AND ($2::date IS NULL OR s.slot_date >= $2::date)"
            " ORDER BY s.slot_date, s.start_time";
        return slots(run(sql, {std::to_string(doctor_id), opt_str(from)}));
    }

    std::vector<Slot> free_slots_for_specialty(int64_t specialty_id, const std::optional<Date>& from) override {
        std::string sql = std::string("SELECT ") + kSlotColumns +
            " FROM slots s JOIN doctor_specialties ds ON ds.doctor_id = s.doctor_id"
            " WHERE ds.specialty_id = $1 AND s.state = 'free'"
            " AND ($2::date IS NULL OR s.slot_date >= $2::date)"
            " ORDER BY s.slot_date, s.start_time, s.doctor_id";
        return slots(run(sql, {std::to_string(specialty_id), opt_str(from)}));
    }

    Slot insert_slot(const scheduling::NewSlot& n) override {
        std::string sql = std::string("INSERT INTO slots AS s (doctor_id, slot_date, start_time, end_time, duration_minutes, delivery_mode, state)"
            " VALUES ($1, $2::date, $3::time, $4::time, $5, $6, $7) RETURNING ") + kSlotColumns;
        auto r = run(sql, {std::to_string(n.doctor_id), n.date.to_string(), n.start_time.to_string(), n.end_time.to_string(),
                           std::to_string(n.duration_minutes), std::string(to_string(n.delivery_mode)), std::string(to_string(n.state))});
        if (r.rows.empty()) throw StoreError("insert into slots returned no row");
        return slot_from_row(r.rows[0]);
    }

    bool claim_slot(int64_t slot_id) override {
        return transition_slot(slot_id, scheduling::SlotState::free, scheduling::SlotState::booked);
    }

    bool transition_slot(int64_t slot_id, scheduling::SlotState from, scheduling::SlotState to) override {
        auto r = run("UPDATE slots SET state = $3, updated_at = now() WHERE id = $1 AND state = $2",
                     {std::to_string(slot_id), std::string(to_string(from)), std::string(to_string(to))});
        return r.affected_rows == 1;
    }

    void update_slot_schedule(int64_t slot_id, const Date& date, TimeOfDay start, TimeOfDay end) override {
        auto r = run("UPDATE slots SET slot_date = $2::date, start_time = $3::time, end_time = $4::time, duration_minutes = $5::int, updated_at = now() WHERE id = $1",
                     {std::to_string(slot_id), date.to_string(), start.to_string(), end.to_string(),
                      std::to_string(end.minutes - start.minutes)});
        if (r.affected_rows != 1) throw StoreError("slot vanished during update");
    }

    void update_slot_mode(int64_t slot_id, scheduling::DeliveryMode mode) override {
        auto r = run("UPDATE slots SET delivery_mode = $2, updated_at = now() WHERE id = $1",
                     {std::to_string(slot_id), std::string(to_string(mode))});
        if (r.affected_rows != 1) throw StoreError("slot vanished during update");
    }

    std::optional<Appointment> find_appointment(int64_t appointment_id, bool for_update) override {
        std::string sql = std::string("SELECT ") + kAppointmentColumns + " FROM appointments a WHERE a.id = $1";
        if (for_update) sql += " FOR UPDATE";
        auto r = run(sql, {std::to_string(appointment_id)});
        if (r.rows.empty()) return std::nullopt;
        return appointment_from_row(r.rows[0]);
    }

    std::optional<Appointment> live_appointment_for_slot(int64_t slot_id) override {
        std::string sql = std::string("SELECT ") + kAppointmentColumns +
            " FROM appointments a WHERE a.slot_id = $1 AND a.state <> 'cancelled' FOR UPDATE";
        auto r = run(sql, {std::to_string(slot_id)});
        if (r.rows.empty()) return std::nullopt;
        return appointment_from_row(r.rows[0]);
    }

    std::vector<Appointment> appointments(const scheduling::AppointmentFilter& f) override {
        std::string sql = std::string("SELECT ") + kAppointmentColumns +
            " FROM appointments a JOIN slots s ON s.id = a.slot_id"
            " WHERE ($1::bigint IS NULL OR a.created_by = $1::bigint)"
            " AND ($2::bigint IS NULL OR a.doctor_id = $2::bigint)"
            " AND ($3::date IS NULL OR s.slot_date = $3::date)"
            " ORDER BY s.slot_date DESC, s.start_time DESC, a.id";
        auto r = run(sql, {opt_str(f.created_by), opt_str(f.doctor_id), opt_str(f.date)});
        std::vector<Appointment> out;
        out.reserve(r.rows.size());
        for (const auto& row : r.rows) out.push_back(appointment_from_row(row));
        return out;
    }

    Appointment insert_appointment(const scheduling::NewAppointment& n) override {
        std::string sql = std::string("INSERT INTO appointments AS a (slot_id, patient_id, doctor_id, institution_id, specialty_id,"
            " urgency, visit_type, delivery_mode, state, created_by, created_at)"
            " VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11::timestamp) RETURNING ") + kAppointmentColumns;
        auto r = run(sql, {std::to_string(n.slot_id), std::to_string(n.patient_id), std::to_string(n.doctor_id),
                           opt_str(n.institution_id), opt_str(n.specialty_id), n.urgency, n.visit_type,
                           std::string(to_string(n.delivery_mode)), std::string(to_string(n.state)),
                           std::to_string(n.created_by), n.created_at});
        if (r.rows.empty()) throw StoreError("insert into appointments returned no row");
        return appointment_from_row(r.rows[0]);
    }

    void update_appointment(const Appointment& a) override {
        auto r = run("UPDATE appointments SET slot_id = $2, state = $3, delivery_mode = $4, updated_at = now() WHERE id = $1",
                     {std::to_string(a.id), std::to_string(a.slot_id), std::string(to_string(a.state)), std::string(to_string(a.delivery_mode))});
        if (r.affected_rows != 1) throw StoreError("appointment vanished during update");
    }

    void commit() override {
        run("COMMIT", {});
        open_ = false;
    }

private:
    db::DbResult run(const std::string& sql, const db::Params& params) {
        db::DbResult r = db::exec_params(conn_, sql, params);
        if (!r.ok) throw StoreError(r.message.empty() ? std::string("query failed") : r.message, r.sqlstate);
        return r;
    }

    static std::vector<Slot> slots(const db::DbResult& r) {
        std::vector<Slot> out;
        out.reserve(r.rows.size());
        for (const auto& row : r.rows) out.push_back(slot_from_row(row));
        return out;
    }

    PGconn* conn_;
    bool open_ = false;
};

}

std::unique_ptr<Transaction> PgSlotStore::begin() {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) throw StoreError("database unavailable");
    return std::make_unique<PgTransaction>(conn_);
}

void PgStoreRunner::post(std::function<void(SlotStore&)> work) {
    pool_->async_run([work = std::move(work)](PGconn* conn) {
        PgSlotStore store(conn);
        work(store);
    });
}

}
