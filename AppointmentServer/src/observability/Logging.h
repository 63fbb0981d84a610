#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>

namespace observability {

using FieldValue = std::variant<std::string, int64_t, double>;
using Fields = std::unordered_map<std::string, FieldValue>;

enum class Level { debug = 1, info = 2, warn = 3, error = 4 };

void log_debug(const std::string& msg, const Fields& fields = {});
void log_info(const std::string& msg, const Fields& fields = {});
void log_warn(const std::string& msg, const Fields& fields = {});
void log_error(const std::string& msg, const Fields& fields = {});

void set_log_level(Level level);
Level log_level();

// Unknown names map to INFO.
Level level_from_name(const std::string& name);

// One JSON object without the trailing newline. Exposed for tests.
std::string format_record(int64_t ts_ms, const char* level, const std::string& msg, const Fields& fields);

}
