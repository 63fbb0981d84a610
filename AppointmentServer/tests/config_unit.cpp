#include <cstdlib>
#include <iostream>
#include <set>
#include "config/Config.h"

static void clear_env() {
    for (const char* k : {"PORT", "LOG_LEVEL", "METRICS_ENABLED", "ACCESS_LOG", "DATABASE_URL", "DB_WORKERS", "DB_POOL_SIZE",
                          "JWT_SECRET", "STORE_BACKEND", "CLINIC_UTC_OFFSET_MIN", "DEFAULT_SLOT_MINUTES", "MAX_GENERATE_DAYS",
                          "DOCTOR_SPECIALTIES"}) {
        unsetenv(k);
    }
}

int main() {
    using config::Config;
    char prog[] = "appointment_server";
    char* argv0[] = {prog, nullptr};

    clear_env();
    {
        auto c = Config::from_env(1, argv0);
        if (c.port != 8080) { std::cerr << "default port\n"; return 1; }
        if (c.log_level != observability::Level::info) { std::cerr << "default log level\n"; return 1; }
        if (!c.metrics_enabled || !c.access_log) { std::cerr << "metrics/access log should default on\n"; return 1; }
        if (c.db_workers != 16) { std::cerr << "default db_workers\n"; return 1; }
        if (c.store_backend != Config::StoreBackend::memory) { std::cerr << "no DATABASE_URL should mean memory\n"; return 1; }
        if (c.default_slot_minutes != 30 || c.max_generate_days != 92 || c.clinic_utc_offset_min != 0) { std::cerr << "scheduling defaults\n"; return 1; }
        if (!c.doctor_specialties.empty()) { std::cerr << "specialties should default empty\n"; return 1; }
    }

    setenv("PORT", "9090", 1);
    setenv("LOG_LEVEL", "warning", 1);
    setenv("METRICS_ENABLED", "0", 1);
    setenv("DATABASE_URL", "postgresql://u:p@localhost/clinic", 1);
    setenv("DB_POOL_SIZE", "4", 1);
    setenv("JWT_SECRET", "s3", 1);
    setenv("CLINIC_UTC_OFFSET_MIN", "180", 1);
    setenv("DEFAULT_SLOT_MINUTES", "15", 1);
    setenv("MAX_GENERATE_DAYS", "31", 1);
    {
        auto c = Config::from_env(1, argv0);
        if (c.port != 9090) { std::cerr << "PORT not read\n"; return 1; }
        if (c.log_level != observability::Level::warn) { std::cerr << "LOG_LEVEL=warning not read\n"; return 1; }
        if (c.metrics_enabled) { std::cerr << "METRICS_ENABLED=0 ignored\n"; return 1; }
        if (c.db_workers != 4) { std::cerr << "DB_POOL_SIZE fallback not read\n"; return 1; }
        if (c.jwt_secret != "s3") { std::cerr << "JWT_SECRET not read\n"; return 1; }
        if (c.store_backend != Config::StoreBackend::postgres) { std::cerr << "DATABASE_URL should select postgres\n"; return 1; }
        if (c.clinic_utc_offset_min != 180 || c.default_slot_minutes != 15 || c.max_generate_days != 31) { std::cerr << "scheduling env not read\n"; return 1; }
    }

    {
        char flag[] = "--port";
        char val[] = "7000";
        char* argv[] = {prog, flag, val, nullptr};
        if (Config::from_env(3, argv).port != 7000) { std::cerr << "--port should override PORT\n"; return 1; }
    }

    setenv("STORE_BACKEND", "memory", 1);
    setenv("DB_WORKERS", "1000", 1);
    setenv("CLINIC_UTC_OFFSET_MIN", "-5000", 1);
    setenv("DEFAULT_SLOT_MINUTES", "abc", 1);
    setenv("MAX_GENERATE_DAYS", "0", 1);
    setenv("PORT", "70000", 1);
    {
        auto c = Config::from_env(1, argv0);
        if (c.store_backend != Config::StoreBackend::memory) { std::cerr << "STORE_BACKEND=memory ignored\n"; return 1; }
        if (c.db_workers != 256) { std::cerr << "DB_WORKERS not clamped: " << c.db_workers << "\n"; return 1; }
        if (c.clinic_utc_offset_min != -840) { std::cerr << "offset not clamped\n"; return 1; }
        if (c.default_slot_minutes != 30) { std::cerr << "bad DEFAULT_SLOT_MINUTES kept\n"; return 1; }
        if (c.max_generate_days != 92) { std::cerr << "bad MAX_GENERATE_DAYS kept\n"; return 1; }
        if (c.port != 8080) { std::cerr << "out-of-range PORT kept\n"; return 1; }
    }

    {
        auto m = config::parse_doctor_specialties(" 12: 1, 2 ;13:3;bad;14:x;0:5;15:;12:4");
        if (m.size() != 2) { std::cerr << "DOCTOR_SPECIALTIES: expected 2 doctors, got " << m.size() << "\n"; return 1; }
        if (m[12] != std::set<int64_t>{1, 2, 4} || m[13] != std::set<int64_t>{3}) { std::cerr << "DOCTOR_SPECIALTIES parsed wrong\n"; return 1; }
        if (!config::parse_doctor_specialties("").empty()) { std::cerr << "empty DOCTOR_SPECIALTIES\n"; return 1; }
        setenv("DOCTOR_SPECIALTIES", "21:7", 1);
        auto c = Config::from_env(1, argv0);
        if (c.doctor_specialties.size() != 1 || c.doctor_specialties[21].count(7) != 1) { std::cerr << "DOCTOR_SPECIALTIES not read\n"; return 1; }
    }

    clear_env();
    setenv("STORE_BACKEND", "PG", 1);
    if (Config::from_env(1, argv0).store_backend != Config::StoreBackend::postgres) { std::cerr << "STORE_BACKEND=PG ignored\n"; return 1; }
    clear_env();

    std::cout << "config_unit ok\n";
    return 0;
}
