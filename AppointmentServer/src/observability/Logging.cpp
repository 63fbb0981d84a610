#include "Logging.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace observability {

static std::atomic<int> g_level{static_cast<int>(Level::info)};
static std::mutex g_out_mu;

void set_log_level(Level level) { g_level.store(static_cast<int>(level)); }

Level log_level() { return static_cast<Level>(g_level.load()); }

Level level_from_name(const std::string& name) {
    std::string u = name;
    std::transform(u.begin(), u.end(), u.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    if (u == "DEBUG") return Level::debug;
    if (u == "WARN" || u == "WARNING") return Level::warn;
    if (u == "ERROR") return Level::error;
    return Level::info;
}

static int64_t now_ms() {
    using namespace std::chrono;
    return static_cast<int64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static std::string escape_json(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string format_record(int64_t ts_ms, const char* level, const std::string& msg, const Fields& fields) {
    std::ostringstream ss;
    ss << "{\"ts\":" << ts_ms << ",\"level\":\"" << level << "\",\"msg\":\"" << escape_json(msg) << "\"";
    for (const auto& p : fields) {
        ss << ",\"" << escape_json(p.first) << "\":";
        if (std::holds_alternative<std::string>(p.second)) {
            ss << '"' << escape_json(std::get<std::string>(p.second)) << '"';
        } else if (std::holds_alternative<int64_t>(p.second)) {
            ss << std::get<int64_t>(p.second);
        } else {
            std::ostringstream tmp; tmp << std::fixed << std::setprecision(3) << std::get<double>(p.second);
            ss << tmp.str();
        }
    }
    ss << '}';
    return ss.str();
}

static void log_generic(Level level, const char* name, const std::string& msg, const Fields& fields) {
    if (static_cast<int>(level) < g_level.load()) return;
    std::string line = format_record(now_ms(), name, msg, fields);
    std::lock_guard<std::mutex> lk(g_out_mu);
    std::cout << line << '\n' << std::flush;
}

void log_debug(const std::string& msg, const Fields& fields) { log_generic(Level::debug, "DEBUG", msg, fields); }
void log_info(const std::string& msg, const Fields& fields) { log_generic(Level::info, "INFO", msg, fields); }
void log_warn(const std::string& msg, const Fields& fields) { log_generic(Level::warn, "WARN", msg, fields); }
void log_error(const std::string& msg, const Fields& fields) { log_generic(Level::error, "ERROR", msg, fields); }

}
