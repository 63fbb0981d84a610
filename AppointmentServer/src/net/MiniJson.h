#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Field extraction from a flat JSON request object. Only top-level keys are matched.
// Malformed documents and wrongly typed values throw std::runtime_error; an absent key
// or an explicit null is "not present".

std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key);
std::string json_extract_string(const std::string& js, const std::string& key);
std::optional<int64_t> json_extract_int_opt(const std::string& js, const std::string& key);
std::optional<std::vector<int64_t>> json_extract_int_array(const std::string& js, const std::string& key);

// Throws unless js is one well-formed JSON object.
void json_require_object(const std::string& js);

std::string json_escape_resp(const std::string& s);

inline std::optional<int64_t> parse_int64_strict_sv(std::string_view s) {
    if (s.empty()) return std::nullopt;
    size_t i = 0;
    bool neg = false;
    if (s[i] == '-') { neg = true; ++i; }
    if (i >= s.size()) return std::nullopt;

    const uint64_t maxAbs = neg ? (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL) : uint64_t(std::numeric_limits<int64_t>::max());
    uint64_t v = 0;
    for (; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t d = uint64_t(c - '0');
        if (v > (maxAbs - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }
    if (!neg) return static_cast<int64_t>(v);
    if (v == (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL)) return std::numeric_limits<int64_t>::min();
    return -static_cast<int64_t>(v);
}
