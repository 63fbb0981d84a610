#include <algorithm>
#include <boost/asio.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "api/SchedulingRoutes.h"
#include "config/Config.h"
#include "db/DbPool.h"
#include "net/HttpServer.h"
#include "net/Router.h"
#include "observability/Logging.h"
#include "observability/Metrics.h"
#include "store/MemorySlotStore.h"
#include "store/PgSlotStore.h"

using config::Config;
using observability::log_info;
using observability::log_warn;

int main(int argc, char** argv) {
    auto cfg = Config::from_env(argc, argv);
    observability::set_log_level(cfg.log_level);

    if (cfg.jwt_secret.empty()) {
        std::cerr << "fatal: JWT_SECRET environment variable is not set\n";
        return 2;
    }
    if (cfg.store_backend == Config::StoreBackend::postgres && cfg.database_url.empty()) {
        std::cerr << "fatal: STORE_BACKEND=postgres requires DATABASE_URL\n";
        return 2;
    }

    try {
        boost::asio::io_context io;
        Router router;

        router.add_route("GET", "/health", [](const Request& req) {
            return json_response(req, boost::beast::http::status::ok, "{\"status\":\"ok\"}");
        });
        if (cfg.metrics_enabled) {
            router.add_route("GET", "/metrics", [](const Request& req) {
                Response res{boost::beast::http::status::ok, req.version()};
                res.set(boost::beast::http::field::content_type, "text/plain; version=0.0.4");
                res.keep_alive(req.keep_alive());
                res.body() = observability::Metrics::instance().scrape();
                res.prepare_payload();
                return res;
            });
        }

        std::shared_ptr<db::DbPool> dbpool;
        std::shared_ptr<store::StoreRunner> runner;
        if (cfg.store_backend == Config::StoreBackend::postgres) {
            dbpool = std::make_shared<db::DbPool>(cfg.database_url, cfg.db_workers);
            runner = std::make_shared<store::PgStoreRunner>(dbpool);
            log_info("store_backend", {{"backend", std::string("postgres")}, {"workers", int64_t(cfg.db_workers)}});
        } else {
            auto threads = std::max(1u, std::thread::hardware_concurrency());
            auto memory = std::make_shared<store::MemorySlotStore>();
            for (const auto& d : cfg.doctor_specialties) memory->set_doctor_specialties(d.first, d.second);
            runner = std::make_shared<store::MemoryStoreRunner>(memory, threads);
            log_warn("store_backend", {{"backend", std::string("memory")}, {"note", std::string("state is lost on exit")},
                                       {"doctors_with_specialties", int64_t(cfg.doctor_specialties.size())}});
        }

        scheduling::Limits limits;
        limits.default_slot_minutes = cfg.default_slot_minutes;
        limits.max_generate_days = cfg.max_generate_days;
        api::SchedulingRoutes routes(runner, scheduling::system_clock(cfg.clinic_utc_offset_min), limits);
        routes.register_routes(router);

        ServerOptions options;
        options.metrics_enabled = cfg.metrics_enabled;
        options.access_log = cfg.access_log;
        options.jwt_secret = cfg.jwt_secret;
        HttpServer server(io, cfg.port, router, options);
        log_info("server_start", {{"port", int64_t(server.local_port())}, {"utc_offset_min", int64_t(cfg.clinic_utc_offset_min)}});
        server.run();

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&io](const boost::system::error_code&, int sig) {
            log_info("server_stop", {{"signal", int64_t(sig)}});
            io.stop();
        });
        io.run();
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
