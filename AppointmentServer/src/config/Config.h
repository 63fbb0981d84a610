#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include "observability/Logging.h"

namespace config {

struct Config {
    enum class StoreBackend { postgres, memory };

    uint16_t port = 8080;
    observability::Level log_level = observability::Level::info;
    bool metrics_enabled = true;
    bool access_log = true;
    std::string database_url;
    int db_workers = 16;
    std::string jwt_secret;
    StoreBackend store_backend = StoreBackend::memory;
    int clinic_utc_offset_min = 0;
    int default_slot_minutes = 30;
    int max_generate_days = 92;
    // Memory backend only: doctor id -> specialty ids.
    std::map<int64_t, std::set<int64_t>> doctor_specialties;

    static Config from_env(int argc, char** argv);
};

// "12:1,2;13:3" -> {12: {1, 2}, 13: {3}}. Malformed entries and non-positive ids are skipped.
std::map<int64_t, std::set<int64_t>> parse_doctor_specialties(const std::string& s);

}
