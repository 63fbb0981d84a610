#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include "observability/Logging.h"

using namespace observability;

static bool is_json_line(const std::string& s) {
    return !s.empty() && s.front() == '{' && s.back() == '}' && s.find("\"level\"") != std::string::npos && s.find("\"msg\"") != std::string::npos;
}

int main() {
    {
        auto line = format_record(1700000000123, "INFO", "slots.generated", {{"doctor_id", int64_t(12)}});
        if (line != "{\"ts\":1700000000123,\"level\":\"INFO\",\"msg\":\"slots.generated\",\"doctor_id\":12}") {
            std::cerr << "format_record: " << line << "\n"; return 1;
        }
    }
    {
        auto line = format_record(1, "WARN", "quote \" and\nnewline", {{"err", std::string("a\\b")}});
        if (line.find("quote \\\" and\\nnewline") == std::string::npos || line.find("\"err\":\"a\\\\b\"") == std::string::npos) {
            std::cerr << "escaping broken: " << line << "\n"; return 1;
        }
        if (line.find('\n') != std::string::npos) { std::cerr << "record spans lines\n"; return 1; }
    }
    {
        auto line = format_record(1, "DEBUG", "m", {{"ms", 1.5}});
        if (line.find("\"ms\":1.500") == std::string::npos) { std::cerr << "double field: " << line << "\n"; return 1; }
    }

    if (level_from_name("debug") != Level::debug) { std::cerr << "debug\n"; return 1; }
    if (level_from_name("WARNING") != Level::warn || level_from_name("warn") != Level::warn) { std::cerr << "warn\n"; return 1; }
    if (level_from_name("Error") != Level::error) { std::cerr << "error\n"; return 1; }
    if (level_from_name("verbose") != Level::info || level_from_name("") != Level::info) { std::cerr << "unknown names should be INFO\n"; return 1; }

    // level filtering, captured through stdout
    set_log_level(Level::warn);
    if (log_level() != Level::warn) { std::cerr << "log_level not stored\n"; return 1; }
    const char* tmp = "/tmp/logging_unit_capture.txt";
    std::fflush(stdout);
    std::cout.flush();
    int saved = dup(fileno(stdout));
    if (saved == -1) { std::cerr << "dup failed\n"; return 1; }
    if (!std::freopen(tmp, "w+", stdout)) { std::cerr << "freopen failed\n"; return 1; }

    log_debug("debug-message");
    log_info("info-message");
    log_warn("warn-message", {{"slot_id", int64_t(370)}});
    log_error("error-message");

    std::cout.flush();
    std::fflush(stdout);
    if (dup2(saved, fileno(stdout)) == -1) { std::cerr << "dup2 restore failed\n"; return 1; }
    close(saved);
    set_log_level(Level::info);

    std::ifstream in(tmp);
    if (!in) { std::cerr << "open capture failed\n"; return 1; }
    std::string line;
    int lines = 0;
    bool saw_warn = false, saw_error = false;
    while (std::getline(in, line)) {
        ++lines;
        if (!is_json_line(line)) { std::cerr << "not a json line: " << line << "\n"; return 1; }
        if (line.find("debug-message") != std::string::npos || line.find("info-message") != std::string::npos) {
            std::cerr << "filtered record written: " << line << "\n"; return 1;
        }
        if (line.find("\"level\":\"WARN\"") != std::string::npos && line.find("\"slot_id\":370") != std::string::npos) saw_warn = true;
        if (line.find("\"level\":\"ERROR\"") != std::string::npos) saw_error = true;
    }
    std::remove(tmp);
    if (lines != 2 || !saw_warn || !saw_error) { std::cerr << "expected WARN and ERROR only, got " << lines << " lines\n"; return 1; }

    std::cout << "logging_unit ok\n";
    return 0;
}
