#include "SchedulingRoutes.h"
#include <boost/beast/http.hpp>
#include <stdexcept>
#include "JsonViews.h"
#include "net/MiniJson.h"
#include "observability/Logging.h"
#include "scheduling/Errors.h"
#include "scheduling/Scheduler.h"

namespace api {

namespace http = boost::beast::http;
using scheduling::errc;
using scheduling::fail;

namespace {

using Work = std::function<Response(scheduling::Scheduler&, const Request&)>;

Response error_response(const Request& req, const boost::system::error_code& ec, const std::string& message) {
    return json_response(req, status_for(ec), error_json(scheduling::error_kind(ec), message));
}

// Runs work against the store off the I/O thread and always replies.
void run(const std::shared_ptr<store::StoreRunner>& runner, const scheduling::Clock& clock, scheduling::Limits limits,
         const Request& req, Router::Reply reply, Work work) {
    auto head = std::make_shared<Request>(req);
    runner->post([clock, limits, head, reply, work](store::SlotStore& store) {
        Response res;
        try {
            scheduling::Scheduler sched(store, clock, limits);
            res = work(sched, *head);
        } catch (const boost::system::system_error& e) {
            res = error_response(*head, e.code(), e.what());
        } catch (const std::exception& e) {
            observability::log_error("api.unexpected_exception", {{"err", std::string(e.what())}});
            res = json_response(*head, http::status::internal_server_error, error_json("internal", "internal error"));
        }
        reply(std::move(res));
    });
}

// Parse-phase failures become 400 (or the carried scheduling code) without touching the store.
void guard(const Request& req, const Router::Reply& reply, const std::function<void()>& body) {
    try {
        body();
    } catch (const boost::system::system_error& e) {
        reply(error_response(req, e.code(), e.what()));
    } catch (const std::runtime_error& e) {
        reply(error_response(req, scheduling::make_error_code(errc::validation_error), e.what()));
    }
}

const std::string& json_body(const Request& req) {
    auto ct = req[http::field::content_type];
    if (ct.find("application/json") == boost::beast::string_view::npos)
        fail(errc::validation_error, "content type must be application/json");
    if (req.body().size() > 64 * 1024) fail(errc::validation_error, "body too large");
    json_require_object(req.body());
    return req.body();
}

int64_t path_id(const Router::Context& ctx, const char* name) {
    auto it = ctx.params.find(name);
    std::optional<int64_t> v;
    if (it != ctx.params.end()) v = parse_int64_strict_sv(it->second);
    if (!v || *v <= 0) fail(errc::validation_error, std::string(name) + " must be a positive integer");
    return *v;
}

scheduling::Date date_field(const std::string& value, const char* name) {
    auto d = scheduling::parse_date(value);
    if (!d) fail(errc::validation_error, std::string(name) + " must be YYYY-MM-DD");
    return *d;
}

scheduling::TimeOfDay time_field(const std::string& value, const char* name) {
    auto t = scheduling::parse_time(value);
    if (!t) fail(errc::validation_error, std::string(name) + " must be HH:MM or hh:mm AM/PM");
    return *t;
}

std::string required_string(const std::string& js, const char* key) {
    auto v = json_extract_string(js, key);
    if (v.empty()) fail(errc::validation_error, std::string(key) + " is required");
    return v;
}

std::optional<scheduling::Date> query_date(const Router::Context& ctx, const char* name) {
    auto it = ctx.query.find(name);
    if (it == ctx.query.end() || it->second.empty()) return std::nullopt;
    return date_field(it->second, name);
}

// Doctors default to themselves; an admin must name the doctor.
int64_t slot_owner(const std::string& js, const auth::Caller& caller) {
    if (auto d = json_extract_int_opt(js, "doctor_id")) return *d;
    if (caller.role == auth::Role::admin) fail(errc::validation_error, "doctor_id is required");
    return caller.user_id;
}

scheduling::GenerateRequest generate_request(const std::string& js, const auth::Caller& caller) {
    scheduling::GenerateRequest g;
    g.doctor_id = slot_owner(js, caller);
    auto mode = json_extract_string(js, "delivery_mode");
    if (mode.empty()) g.delivery_mode = scheduling::DeliveryMode::physical;
    else {
        auto m = scheduling::parse_delivery_mode(mode);
        if (!m) fail(errc::validation_error, "unknown delivery_mode");
        g.delivery_mode = *m;
    }
    g.start_date = date_field(required_string(js, "start_date"), "start_date");
    auto end_date = json_extract_string(js, "end_date");
    g.end_date = end_date.empty() ? g.start_date : date_field(end_date, "end_date");
    g.start_time = time_field(required_string(js, "start_time"), "start_time");
    g.end_time = time_field(required_string(js, "end_time"), "end_time");
    auto duration = json_extract_int_opt(js, "duration_minutes");
    if (!duration) fail(errc::validation_error, "duration_minutes is required");
    if (*duration <= 0 || *duration > scheduling::TimeOfDay::kMinutesPerDay)
        fail(errc::validation_error, "duration_minutes out of range");
    g.duration_minutes = static_cast<int>(*duration);
    if (!auth::allowed(auth::can_manage_doctor_slots(caller, g.doctor_id)))
        fail(errc::forbidden, "cannot manage slots of another doctor");
    return g;
}

scheduling::SlotScope scope_of(const auth::Caller& caller) {
    auto scope = auth::slot_scope_for(caller);
    if (!scope) fail(errc::forbidden, "only doctors and admins manage slots");
    return *scope;
}

}

void SchedulingRoutes::register_routes(Router& router) {
    auto runner = runner_;
    auto clock = clock_;
    auto limits = limits_;

    router.add_async_route("GET", "/db/health", [runner](const Request& req, const Router::Context&, Router::Reply reply) {
        auto head = std::make_shared<Request>(req);
        runner->post([head, reply](store::SlotStore& store) {
            try {
                auto tx = store.begin();
                tx.reset();
                reply(json_response(*head, http::status::ok, "{\"status\":\"ok\"}"));
            } catch (const std::exception& e) {
                observability::log_warn("db_health.failed", {{"err", std::string(e.what())}});
                reply(json_response(*head, http::status::service_unavailable, error_json("store_failure", e.what())));
            }
        });
    }, Router::Access::open);

    router.add_async_route("POST", "/slots/generate", [=](const Request& req, const Router::Context& ctx, Router::Reply reply) {
        guard(req, reply, [&] {
            auto g = generate_request(json_body(req), *ctx.caller);
            run(runner, clock, limits, req, reply, [g](scheduling::Scheduler& s, const Request& r) {
                return json_response(r, http::status::created, generate_result_json(s.generate_slots(g)));
            });
        });
    });

    router.add_async_route("GET", "/doctors/{id}/slots", [=](const Request& req, const Router::Context& ctx, Router::Reply reply) {
        guard(req, reply, [&] {
            int64_t doctor = path_id(ctx, "id");
            auto date = query_date(ctx, "date");
            run(runner, clock, limits, req, reply, [doctor, date](scheduling::Scheduler& s, const Request& r) {
                auto slots = date ? s.search_slots(doctor, *date) : s.doctor_availability(doctor);
                return json_response(r, http::status::ok, slots_json(slots));
            });
        });
    });

    router.add_async_route("GET", "/specialties/{id}/slots", [=](const Request& req, const Router::Context& ctx, Router::Reply reply) {
        guard(req, reply, [&] {
            int64_t specialty = path_id(ctx, "id");
            auto from = query_date(ctx, "from");
            run(runner, clock, limits, req, reply, [specialty, from](scheduling::Scheduler& s, const Request& r) {
                return json_response(r, http::status::ok, slots_json(s.search_by_specialty(specialty, from)));
            });
        });
    });

    router.add_async_route("POST", "/appointments", [=](const Request& req, const Router::Context& ctx, Router::Reply reply) {
        guard(req, reply, [&] {
            const auto& js = json_body(req);
            scheduling::BookingRequest b;
            if (auto slot_id = json_extract_int_opt(js, "slot_id")) {
                b.target = scheduling::SlotTarget{*slot_id};
            } else {
                auto doctor = json_extract_int_opt(js, "doctor_id");
                auto when = json_extract_string(js, "appointment_date");
                if (!doctor || when.empty()) fail(errc::validation_error, "slot_id, or doctor_id with appointment_date, is required");
                auto at = scheduling::parse_local_datetime(when);
                if (!at) fail(errc::validation_error, "appointment_date must be YYYY-MM-DD HH:MM");
                scheduling::DoctorTimeTarget t;
                t.doctor_id = *doctor;
                t.at = *at;
                if (auto d = json_extract_int_opt(js, "duration_minutes")) {
                    if (*d <= 0 || *d > scheduling::TimeOfDay::kMinutesPerDay) fail(errc::validation_error, "duration_minutes out of range");
                    t.duration_minutes = static_cast<int>(*d);
                }
                b.target = t;
            }
            auto& d = b.details;
            d.institution_id = json_extract_int_opt(js, "institution_id");
            d.specialty_id = json_extract_int_opt(js, "specialty_id");
            auto urgency = json_extract_string(js, "urgency");
            if (!urgency.empty()) d.urgency = urgency;
            auto visit_type = json_extract_string(js, "visit_type");
            if (!visit_type.empty()) d.visit_type = visit_type;
            auto mode = json_extract_string(js, "delivery_mode");
            if (!mode.empty()) {
                d.delivery_mode = scheduling::parse_delivery_mode(mode);
                if (!d.delivery_mode) fail(errc::validation_error, "unknown delivery_mode");
            }
            auto state = json_extract_string(js, "state");
            if (!state.empty()) {
                auto st = scheduling::parse_appointment_state(state);
                if (!st) fail(errc::validation_error, "unknown state");
                d.initial_state = *st;
            }
            auto caller = *ctx.caller;
            run(runner, clock, limits, req, reply, [caller, b](scheduling::Scheduler& s, const Request& r) {
                return json_response(r, http::status::created, booking_json(s.book_appointment(caller, b)));
            });
        });
    });

    router.add_async_route("GET", "/appointments", [=](const Request& req, const Router::Context& ctx, Router::Reply reply) {
        guard(req, reply, [&] {
            auto date = query_date(ctx, "date");
            auto caller = *ctx.caller;
            run(runner, clock, limits, req, reply, [caller, date](scheduling::Scheduler& s, const Request& r) {
                return json_response(r, http::status::ok, bookings_json(s.list_appointments(caller, date)));
            });
        });
    });

    router.add_async_route("GET", "/appointments/{id}", [=](const Request& req, const Router::Context& ctx, Router::Reply reply) {
        guard(req, reply, [&] {
            int64_t id = path_id(ctx, "id");
            auto caller = *ctx.caller;
            run(runner, clock, limits, req, reply, [caller, id](scheduling::Scheduler& s, const Request& r) {
                return json_response(r, http::status::ok, booking_json(s.read_appointment(caller, id)));
            });
        });
    });

    router.add_async_route("PATCH", "/appointments/{id}", [=](const Request& req, const Router::Context& ctx, Router::Reply reply) {
        guard(req, reply, [&] {
            int64_t id = path_id(ctx, "id");
            const auto& js = json_body(req);
            scheduling::AppointmentChanges ch;
            auto when = json_extract_string(js, "appointment_date");
            if (!when.empty()) {
                ch.appointment_date = scheduling::parse_local_datetime(when);
                if (!ch.appointment_date) fail(errc::validation_error, "appointment_date must be YYYY-MM-DD HH:MM");
            }
            auto state = json_extract_string(js, "state");
            if (!state.empty()) {
                ch.state = scheduling::parse_appointment_state(state);
                if (!ch.state) fail(errc::validation_error, "unknown state");
            }
            if (!ch.appointment_date && !ch.state) fail(errc::validation_error, "nothing to update");
            auto caller = *ctx.caller;
            run(runner, clock, limits, req, reply, [caller, id, ch](scheduling::Scheduler& s, const Request& r) {
                return json_response(r, http::status::ok, booking_json(s.update_appointment(caller, id, ch)));
            });
        });
    });

    router.add_async_route("DELETE", "/appointments/{id}", [=](const Request& req, const Router::Context& ctx, Router::Reply reply) {
        guard(req, reply, [&] {
            int64_t id = path_id(ctx, "id");
            auto caller = *ctx.caller;
            run(runner, clock, limits, req, reply, [caller, id](scheduling::Scheduler& s, const Request& r) {
                s.delete_appointment(caller, id);
                Response res{http::status::no_content, r.version()};
                res.keep_alive(r.keep_alive());
                res.prepare_payload();
                return res;
            });
        });
    });

    router.add_async_route("POST", "/slots/{id}/shift", [=](const Request& req, const Router::Context& ctx, Router::Reply reply) {
        guard(req, reply, [&] {
            int64_t id = path_id(ctx, "id");
            auto scope = scope_of(*ctx.caller);
            const auto& js = json_body(req);
            auto date = date_field(required_string(js, "date"), "date");
            auto time = time_field(required_string(js, "time"), "time");
            run(runner, clock, limits, req, reply, [scope, id, date, time](scheduling::Scheduler& s, const Request& r) {
                return json_response(r, http::status::ok, slot_json(s.shift_slot(scope, id, date, time)));
            });
        });
    });

    router.add_async_route("POST", "/slots/cancel", [=](const Request& req, const Router::Context& ctx, Router::Reply reply) {
        guard(req, reply, [&] {
            auto scope = scope_of(*ctx.caller);
            const auto& js = json_body(req);
            auto ids = json_extract_int_array(js, "ids");
            if (!ids || ids->empty()) fail(errc::validation_error, "ids must be a non-empty array");
            for (int64_t id : *ids) {
                if (id <= 0) fail(errc::validation_error, "slot ids must be positive");
            }
            run(runner, clock, limits, req, reply, [scope, ids = *ids](scheduling::Scheduler& s, const Request& r) {
                int n = s.cancel_slots(scope, ids);
                return json_response(r, http::status::ok, "{\"cancelled_count\":" + std::to_string(n) + "}");
            });
        });
    });

    router.add_async_route("POST", "/slots/cancel-by-date", [=](const Request& req, const Router::Context& ctx, Router::Reply reply) {
        guard(req, reply, [&] {
            auto scope = scope_of(*ctx.caller);
            const auto& js = json_body(req);
            auto date = date_field(required_string(js, "date"), "date");
            if (auto doctor = json_extract_int_opt(js, "doctor_id")) {
                if (!auth::allowed(auth::can_manage_doctor_slots(*ctx.caller, *doctor)))
                    fail(errc::forbidden, "cannot cancel another doctor's slots");
                scope = scheduling::SlotScope::doctor(*doctor);
            }
            run(runner, clock, limits, req, reply, [scope, date](scheduling::Scheduler& s, const Request& r) {
                int n = s.cancel_slots_by_date(scope, date);
                return json_response(r, http::status::ok, "{\"cancelled_count\":" + std::to_string(n) + "}");
            });
        });
    });

    router.add_async_route("POST", "/slots/shift-by-date", [=](const Request& req, const Router::Context& ctx, Router::Reply reply) {
        guard(req, reply, [&] {
            auto scope = scope_of(*ctx.caller);
            const auto& js = json_body(req);
            auto date = date_field(required_string(js, "date"), "date");
            auto target = generate_request(js, *ctx.caller);
            run(runner, clock, limits, req, reply, [scope, date, target](scheduling::Scheduler& s, const Request& r) {
                return json_response(r, http::status::ok, shifted_slots_json(s.shift_slots_by_date(scope, date, target)));
            });
        });
    });

    router.add_async_route("POST", "/slots/{id}/delivery-mode", [=](const Request& req, const Router::Context& ctx, Router::Reply reply) {
        guard(req, reply, [&] {
            int64_t id = path_id(ctx, "id");
            auto scope = scope_of(*ctx.caller);
            const auto& js = json_body(req);
            auto mode = scheduling::parse_delivery_mode(required_string(js, "delivery_mode"));
            if (!mode) fail(errc::validation_error, "unknown delivery_mode");
            run(runner, clock, limits, req, reply, [scope, id, mode = *mode](scheduling::Scheduler& s, const Request& r) {
                return json_response(r, http::status::ok, slot_json(s.convert_delivery_mode(scope, id, mode)));
            });
        });
    });
}

}
