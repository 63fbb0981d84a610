#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace scheduling {

struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    int64_t days_since_epoch() const;
    static Date from_days(int64_t days);
    Date add_days(int64_t n) const { return from_days(days_since_epoch() + n); }
    std::string to_string() const;
};

bool operator==(const Date& a, const Date& b);
bool operator!=(const Date& a, const Date& b);
bool operator<(const Date& a, const Date& b);
bool operator<=(const Date& a, const Date& b);
bool operator>(const Date& a, const Date& b);
bool operator>=(const Date& a, const Date& b);

// Minutes since local midnight. 1440 is only meaningful as an exclusive end bound.
struct TimeOfDay {
    int minutes = 0;

    static constexpr int kMinutesPerDay = 24 * 60;

    int hour() const { return minutes / 60; }
    int minute() const { return minutes % 60; }
    std::string to_string() const;
};

inline bool operator==(TimeOfDay a, TimeOfDay b) { return a.minutes == b.minutes; }
inline bool operator!=(TimeOfDay a, TimeOfDay b) { return a.minutes != b.minutes; }
inline bool operator<(TimeOfDay a, TimeOfDay b) { return a.minutes < b.minutes; }
inline bool operator<=(TimeOfDay a, TimeOfDay b) { return a.minutes <= b.minutes; }
inline bool operator>(TimeOfDay a, TimeOfDay b) { return a.minutes > b.minutes; }
inline bool operator>=(TimeOfDay a, TimeOfDay b) { return a.minutes >= b.minutes; }

struct LocalDateTime {
    Date date;
    TimeOfDay time;

    std::string to_string() const;
};

bool operator==(const LocalDateTime& a, const LocalDateTime& b);
bool operator!=(const LocalDateTime& a, const LocalDateTime& b);
bool operator<(const LocalDateTime& a, const LocalDateTime& b);
bool operator<=(const LocalDateTime& a, const LocalDateTime& b);
bool operator>(const LocalDateTime& a, const LocalDateTime& b);

// YYYY-MM-DD
std::optional<Date> parse_date(std::string_view s);

// HH:MM, HH:MM:SS (seconds must be zero) or hh:mm AM/PM. "24:00" is accepted.
std::optional<TimeOfDay> parse_time(std::string_view s);

// "YYYY-MM-DD HH:MM[:SS]", 'T' separator also accepted, as is a 12-hour time part.
std::optional<LocalDateTime> parse_local_datetime(std::string_view s);

// "YYYY-MM-DD HH:MM:SS"
std::string format_timestamp(const LocalDateTime& t);

using Clock = std::function<LocalDateTime()>;

// Wall clock shifted by a fixed UTC offset (the clinic's local time).
Clock system_clock(int utc_offset_minutes);

Clock fixed_clock(LocalDateTime at);

}
