#include "Config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

// Malformed values keep the default.
static int int_or(const std::string& s, int def) {
    if (s.empty()) return def;
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        return pos == s.size() ? v : def;
    } catch (const std::logic_error&) {
        return def;
    }
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool positive_id(const std::string& s, int64_t& out) {
    if (s.empty() || s.size() > 18) return false;
    for (char ch : s) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
    }
    out = std::stoll(s);
    return out > 0;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

std::map<int64_t, std::set<int64_t>> parse_doctor_specialties(const std::string& s) {
    std::map<int64_t, std::set<int64_t>> out;
    size_t pos = 0;
    while (pos <= s.size()) {
        size_t semi = s.find(';', pos);
        std::string entry = s.substr(pos, semi == std::string::npos ? std::string::npos : semi - pos);
        pos = semi == std::string::npos ? s.size() + 1 : semi + 1;

        size_t colon = entry.find(':');
        int64_t doctor = 0;
        if (colon == std::string::npos || !positive_id(trim(entry.substr(0, colon)), doctor)) continue;
        std::set<int64_t> specialties;
        std::string list = entry.substr(colon + 1);
        size_t p = 0;
        while (p <= list.size()) {
            size_t comma = list.find(',', p);
            int64_t id = 0;
            if (positive_id(trim(list.substr(p, comma == std::string::npos ? std::string::npos : comma - p)), id))
                specialties.insert(id);
            p = comma == std::string::npos ? list.size() + 1 : comma + 1;
        }
        if (!specialties.empty()) out[doctor].insert(specialties.begin(), specialties.end());
    }
    return out;
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    int port = int_or(getenv_or("PORT", "8080"), 8080);
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i + 1 < argc) port = int_or(argv[i + 1], port);
    }
    if (port >= 0 && port <= 65535) c.port = static_cast<uint16_t>(port);

    c.log_level = observability::level_from_name(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_or("METRICS_ENABLED", "1") != "0";
    c.access_log = getenv_or("ACCESS_LOG", "1") != "0";
    c.database_url = getenv_or("DATABASE_URL", "");

    auto w = getenv_or("DB_WORKERS", "");
    c.db_workers = w.empty() ? int_or(getenv_or("DB_POOL_SIZE", "16"), 16) : int_or(w, 16);
    c.db_workers = std::clamp(c.db_workers, 1, 256);

    c.jwt_secret = getenv_or("JWT_SECRET", "");

    auto backend = lower(getenv_or("STORE_BACKEND", ""));
    if (backend == "postgres" || backend == "pg") c.store_backend = StoreBackend::postgres;
    else if (backend == "memory") c.store_backend = StoreBackend::memory;
    else c.store_backend = c.database_url.empty() ? StoreBackend::memory : StoreBackend::postgres;

    c.clinic_utc_offset_min = std::clamp(int_or(getenv_or("CLINIC_UTC_OFFSET_MIN", "0"), 0), -14 * 60, 14 * 60);

    c.default_slot_minutes = int_or(getenv_or("DEFAULT_SLOT_MINUTES", "30"), 30);
    if (c.default_slot_minutes <= 0 || c.default_slot_minutes > 24 * 60) c.default_slot_minutes = 30;
    c.max_generate_days = int_or(getenv_or("MAX_GENERATE_DAYS", "92"), 92);
    if (c.max_generate_days <= 0) c.max_generate_days = 92;
    c.doctor_specialties = parse_doctor_specialties(getenv_or("DOCTOR_SPECIALTIES", ""));
    return c;
}

}
