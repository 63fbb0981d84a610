#include "Calendar.h"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <tuple>

namespace scheduling {

static bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static int days_in_month(int y, int m) {
    static const int dim[12] = {31,28,31,30,31,30,31,31,30,31,30,31};
    if (m == 2 && is_leap(y)) return 29;
    return dim[m - 1];
}

// civil <-> day count, Howard Hinnant's algorithm
int64_t Date::days_since_epoch() const {
    int64_t y = year;
    const int64_t m = month;
    const int64_t d = day;
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = yoe + era * 400;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;
    const int64_t m = mp < 10 ? mp + 3 : mp - 9;
    Date out;
    out.year = static_cast<int>(y + (m <= 2));
    out.month = static_cast<int>(m);
    out.day = static_cast<int>(d);
    return out;
}

std::string Date::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return std::string(buf);
}

bool operator==(const Date& a, const Date& b) { return a.year == b.year && a.month == b.month && a.day == b.day; }
bool operator!=(const Date& a, const Date& b) { return !(a == b); }
bool operator<(const Date& a, const Date& b) { return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day); }
bool operator<=(const Date& a, const Date& b) { return !(b < a); }
bool operator>(const Date& a, const Date& b) { return b < a; }
bool operator>=(const Date& a, const Date& b) { return !(a < b); }

std::string TimeOfDay::to_string() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", hour(), minute());
    return std::string(buf);
}

std::string LocalDateTime::to_string() const {
    return date.to_string() + " " + time.to_string();
}

bool operator==(const LocalDateTime& a, const LocalDateTime& b) { return a.date == b.date && a.time == b.time; }
bool operator!=(const LocalDateTime& a, const LocalDateTime& b) { return !(a == b); }
bool operator<(const LocalDateTime& a, const LocalDateTime& b) {
    if (a.date != b.date) return a.date < b.date;
    return a.time < b.time;
}
bool operator<=(const LocalDateTime& a, const LocalDateTime& b) { return !(b < a); }
bool operator>(const LocalDateTime& a, const LocalDateTime& b) { return b < a; }

static bool read_digits(std::string_view s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

static std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::optional<Date> parse_date(std::string_view s) {
    s = trim(s);
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    Date d;
    if (!read_digits(s, 0, 4, d.year) || !read_digits(s, 5, 2, d.month) || !read_digits(s, 8, 2, d.day)) return std::nullopt;
    if (d.year < 1900 || d.month < 1 || d.month > 12) return std::nullopt;
    if (d.day < 1 || d.day > days_in_month(d.year, d.month)) return std::nullopt;
    return d;
}

std::optional<TimeOfDay> parse_time(std::string_view s) {
    s = trim(s);
    // 12-hour form: "hh:mm AM" / "h:mm pm"
    std::optional<bool> pm;
    if (s.size() >= 2) {
        auto suffix = s.substr(s.size() - 2);
        char a = static_cast<char>(std::toupper(static_cast<unsigned char>(suffix[0])));
        char b = static_cast<char>(std::toupper(static_cast<unsigned char>(suffix[1])));
        if (b == 'M' && (a == 'A' || a == 'P')) {
            pm = (a == 'P');
            s = trim(s.substr(0, s.size() - 2));
        }
    }
    auto colon = s.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon > 2) return std::nullopt;
    int h = 0, m = 0, sec = 0;
    if (!read_digits(s, 0, colon, h) || !read_digits(s, colon + 1, 2, m)) return std::nullopt;
    size_t rest = colon + 3;
    if (rest < s.size()) {
        if (s[rest] != ':' || s.size() != rest + 3 || !read_digits(s, rest + 1, 2, sec)) return std::nullopt;
        if (sec != 0) return std::nullopt;
    }
    if (m > 59) return std::nullopt;
    if (pm.has_value()) {
        if (h < 1 || h > 12) return std::nullopt;
        if (h == 12) h = 0;
        if (*pm) h += 12;
    } else if (h == 24) {
        if (m != 0) return std::nullopt;
    } else if (h > 23) {
        return std::nullopt;
    }
    return TimeOfDay{h * 60 + m};
}

std::optional<LocalDateTime> parse_local_datetime(std::string_view s) {
    s = trim(s);
    if (s.size() < 16) return std::nullopt;
    if (s[10] != ' ' && s[10] != 'T') return std::nullopt;
    auto d = parse_date(s.substr(0, 10));
    if (!d) return std::nullopt;
    auto t = parse_time(s.substr(11));
    if (!t || t->minutes >= TimeOfDay::kMinutesPerDay) return std::nullopt;
    return LocalDateTime{*d, *t};
}

std::string format_timestamp(const LocalDateTime& t) {
    return t.date.to_string() + " " + t.time.to_string() + ":00";
}

Clock system_clock(int utc_offset_minutes) {
    return [utc_offset_minutes]() {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        now += static_cast<std::time_t>(utc_offset_minutes) * 60;
        std::tm tm{};
        gmtime_r(&now, &tm);
        LocalDateTime out;
        out.date = Date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
        out.time = TimeOfDay{tm.tm_hour * 60 + tm.tm_min};
        return out;
    };
}

Clock fixed_clock(LocalDateTime at) {
    return [at]() { return at; };
}

}
