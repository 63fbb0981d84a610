#include <iostream>
#include <stdexcept>
#include <string>
#include "net/MiniJson.h"

template <typename F>
static bool throws(F&& f) {
    try {
        f();
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

int main() {
    const std::string body = R"({"doctor_id": 12, "delivery_mode": "telemedicine", "note": "line\nbreak \"q\" \u00e9",
        "nested": {"doctor_id": 99, "slot_ids": [1]}, "slot_ids": [370, 369], "institution_id": null, "empty": []})";

    if (json_extract_int_opt(body, "doctor_id") != 12) { std::cerr << "top-level int\n"; return 1; }
    if (json_extract_string(body, "delivery_mode") != "telemedicine") { std::cerr << "string\n"; return 1; }
    if (json_extract_string(body, "note") != "line\nbreak \"q\" \xC3\xA9") { std::cerr << "escapes: " << json_extract_string(body, "note") << "\n"; return 1; }
    {
        auto ids = json_extract_int_array(body, "slot_ids");
        if (!ids || ids->size() != 2 || (*ids)[0] != 370 || (*ids)[1] != 369) { std::cerr << "int array\n"; return 1; }
        auto empty = json_extract_int_array(body, "empty");
        if (!empty || !empty->empty()) { std::cerr << "empty array\n"; return 1; }
        if (json_extract_int_array(body, "missing")) { std::cerr << "missing array should be nullopt\n"; return 1; }
    }
    if (json_extract_int_opt(body, "institution_id")) { std::cerr << "null int should be nullopt\n"; return 1; }
    {
        auto p = json_extract_string_opt_present(body, "institution_id");
        if (!p.first || p.second) { std::cerr << "null string should be present without value\n"; return 1; }
        auto q = json_extract_string_opt_present(body, "absent");
        if (q.first) { std::cerr << "absent key reported present\n"; return 1; }
    }
    if (json_extract_int_opt(R"({"nested": {"x": 1}})", "x")) { std::cerr << "nested key matched at top level\n"; return 1; }

    if (!throws([&] { json_extract_int_opt(body, "delivery_mode"); })) { std::cerr << "string as int accepted\n"; return 1; }
    if (!throws([&] { json_extract_string(body, "doctor_id"); })) { std::cerr << "int as string accepted\n"; return 1; }
    if (!throws([&] { json_extract_int_array(R"({"ids": [1, "2"]})", "ids"); })) { std::cerr << "mixed array accepted\n"; return 1; }
    if (!throws([&] { json_extract_int_opt(R"({"n": 1.5})", "n"); })) { std::cerr << "fraction accepted as int\n"; return 1; }
    if (!throws([&] { json_extract_int_opt(R"({"n": 99999999999999999999})", "n"); })) { std::cerr << "int64 overflow accepted\n"; return 1; }

    json_require_object(body);
    if (!throws([] { json_require_object("[1,2]"); })) { std::cerr << "array body accepted\n"; return 1; }
    if (!throws([] { json_require_object(R"({"a": 1)"); })) { std::cerr << "unterminated object accepted\n"; return 1; }
    if (!throws([] { json_require_object(R"({"a": 1} x)"); })) { std::cerr << "trailing data accepted\n"; return 1; }
    if (!throws([] { json_require_object(R"({"a" 1})"); })) { std::cerr << "missing colon accepted\n"; return 1; }

    if (json_escape_resp("a\"b\\c\n\x01") != "a\\\"b\\\\c\\n\\u0001") { std::cerr << "json_escape_resp\n"; return 1; }

    if (parse_int64_strict_sv("-42") != -42 || parse_int64_strict_sv("") || parse_int64_strict_sv("4x") || parse_int64_strict_sv("-")) {
        std::cerr << "parse_int64_strict_sv\n"; return 1;
    }

    std::cout << "minijson_unit ok\n";
    return 0;
}
