#include "MiniJson.h"
#include <cctype>
#include <stdexcept>

namespace {

struct Scanner {
    const std::string& js;
    size_t i = 0;

    explicit Scanner(const std::string& s, size_t start = 0) : js(s), i(start) {}

    bool at_end() const { return i >= js.size(); }
    char peek() const { return at_end() ? '\0' : js[i]; }

    void ws() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(js[i]))) ++i;
    }

    void expect(char c) {
        if (peek() != c) throw std::runtime_error(std::string("expected '") + c + "' in json");
        ++i;
    }

    static int hex(char h) {
        if (h >= '0' && h <= '9') return h - '0';
        if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
        if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
        return -1;
    }

    // at the opening quote; leaves i past the closing quote
    std::string string() {
        expect('"');
        std::string out;
        while (true) {
            if (at_end()) throw std::runtime_error("unterminated json string");
            char c = js[i++];
            if (c == '"') return out;
            if (c != '\\') { out.push_back(c); continue; }
            if (at_end()) throw std::runtime_error("unterminated escape in json string");
            char e = js[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    if (i + 4 > js.size()) throw std::runtime_error("invalid unicode escape in json string");
                    unsigned code = 0;
                    for (int k = 0; k < 4; ++k) {
                        int h = hex(js[i + k]);
                        if (h < 0) throw std::runtime_error("invalid hex in unicode escape");
                        code = (code << 4) | unsigned(h);
                    }
                    i += 4;
                    // BMP only
                    if (code <= 0x7f) out.push_back(char(code));
                    else if (code <= 0x7ff) {
                        out.push_back(char(0xc0 | ((code >> 6) & 0x1f)));
                        out.push_back(char(0x80 | (code & 0x3f)));
                    } else {
                        out.push_back(char(0xe0 | ((code >> 12) & 0x0f)));
                        out.push_back(char(0x80 | ((code >> 6) & 0x3f)));
                        out.push_back(char(0x80 | (code & 0x3f)));
                    }
                    break;
                }
                default: throw std::runtime_error("unsupported escape in json string");
            }
        }
    }

    // number, true, false or null
    std::string_view token() {
        size_t start = i;
        while (!at_end()) {
            char c = js[i];
            if (c == ',' || c == '}' || c == ']' || std::isspace(static_cast<unsigned char>(c))) break;
            ++i;
        }
        if (i == start) throw std::runtime_error("missing json value");
        return std::string_view(js).substr(start, i - start);
    }

    void skip_value() {
        ws();
        char c = peek();
        if (c == '"') { string(); return; }
        if (c == '{') {
            ++i; ws();
            if (peek() == '}') { ++i; return; }
            while (true) {
                ws(); string(); ws(); expect(':'); skip_value(); ws();
                if (peek() == ',') { ++i; continue; }
                expect('}');
                return;
            }
        }
        if (c == '[') {
            ++i; ws();
            if (peek() == ']') { ++i; return; }
            while (true) {
                skip_value(); ws();
                if (peek() == ',') { ++i; continue; }
                expect(']');
                return;
            }
        }
        token();
    }
};

// Position of the value for a top-level key, or npos when absent.
size_t find_value(const std::string& js, const std::string& key) {
    Scanner sc(js);
    sc.ws();
    sc.expect('{');
    sc.ws();
    if (sc.peek() == '}') return std::string::npos;
    while (true) {
        sc.ws();
        std::string k = sc.string();
        sc.ws();
        sc.expect(':');
        sc.ws();
        if (k == key) return sc.i;
        sc.skip_value();
        sc.ws();
        if (sc.peek() == ',') { ++sc.i; continue; }
        sc.expect('}');
        return std::string::npos;
    }
}

bool is_null_at(const std::string& js, size_t pos) {
    return js.compare(pos, 4, "null") == 0;
}

int64_t int_token(Scanner& sc) {
    auto tok = sc.token();
    auto v = parse_int64_strict_sv(tok);
    if (!v) throw std::runtime_error("invalid json int value");
    return *v;
}

}

void json_require_object(const std::string& js) {
    Scanner sc(js);
    sc.ws();
    if (sc.peek() != '{') throw std::runtime_error("json body must be an object");
    sc.skip_value();
    sc.ws();
    if (!sc.at_end()) throw std::runtime_error("trailing data after json object");
}

std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key) {
    size_t pos = find_value(js, key);
    if (pos == std::string::npos) return {false, std::nullopt};
    if (is_null_at(js, pos)) return {true, std::nullopt};
    if (js[pos] != '"') throw std::runtime_error("invalid type for json string field");
    Scanner sc(js, pos);
    return {true, sc.string()};
}

std::string json_extract_string(const std::string& js, const std::string& key) {
    auto p = json_extract_string_opt_present(js, key);
    return p.second.value_or(std::string());
}

std::optional<int64_t> json_extract_int_opt(const std::string& js, const std::string& key) {
    size_t pos = find_value(js, key);
    if (pos == std::string::npos || is_null_at(js, pos)) return std::nullopt;
    Scanner sc(js, pos);
    return int_token(sc);
}

std::optional<std::vector<int64_t>> json_extract_int_array(const std::string& js, const std::string& key) {
    size_t pos = find_value(js, key);
    if (pos == std::string::npos || is_null_at(js, pos)) return std::nullopt;
    if (js[pos] != '[') throw std::runtime_error("invalid type for json array field");
    Scanner sc(js, pos + 1);
    std::vector<int64_t> out;
    sc.ws();
    if (sc.peek() == ']') return out;
    while (true) {
        sc.ws();
        out.push_back(int_token(sc));
        sc.ws();
        if (sc.peek() == ',') { ++sc.i; continue; }
        sc.expect(']');
        return out;
    }
}

// control chars < 0x20 become \u00XX
std::string json_escape_resp(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(s.size() + 8);
    for (unsigned char uc : s) {
        if (uc == '"') { out += "\\\""; }
        else if (uc == '\\') { out += "\\\\"; }
        else if (uc == '\n') { out += "\\n"; }
        else if (uc == '\r') { out += "\\r"; }
        else if (uc == '\t') { out += "\\t"; }
        else if (uc < 0x20) {
            out += "\\u00";
            out.push_back(hex[(uc >> 4) & 0xF]); out.push_back(hex[uc & 0xF]);
        } else out.push_back(char(uc));
    }
    return out;
}
