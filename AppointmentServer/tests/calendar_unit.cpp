#include <iostream>
#include <string>
#include "scheduling/Calendar.h"

using namespace scheduling;

int main() {
    {
        auto d = parse_date("2024-02-29");
        if (!d || d->year != 2024 || d->month != 2 || d->day != 29) { std::cerr << "leap day did not parse\n"; return 1; }
        if (d->add_days(1).to_string() != "2024-03-01") { std::cerr << "leap day + 1: " << d->add_days(1).to_string() << "\n"; return 1; }
    }
    if (parse_date("2023-02-29")) { std::cerr << "2023-02-29 unexpectedly parsed\n"; return 1; }
    if (parse_date("2025-4-1")) { std::cerr << "unpadded date unexpectedly parsed\n"; return 1; }
    if (parse_date("2025-13-01")) { std::cerr << "month 13 unexpectedly parsed\n"; return 1; }

    if (Date{1970, 1, 1}.days_since_epoch() != 0) { std::cerr << "epoch is not day 0\n"; return 1; }
    if (Date::from_days(Date{2025, 12, 31}.days_since_epoch() + 1).to_string() != "2026-01-01") { std::cerr << "year rollover broken\n"; return 1; }
    if (!(Date{2025, 4, 11} < Date{2025, 4, 12})) { std::cerr << "date ordering broken\n"; return 1; }

    {
        auto t = parse_time("10:20");
        if (!t || t->minutes != 620) { std::cerr << "10:20 did not parse\n"; return 1; }
        if (t->to_string() != "10:20") { std::cerr << "10:20 format: " << t->to_string() << "\n"; return 1; }
    }
    {
        auto t = parse_time("12:40:00");
        if (!t || t->minutes != 760) { std::cerr << "12:40:00 did not parse\n"; return 1; }
    }
    if (parse_time("12:40:30")) { std::cerr << "non-zero seconds unexpectedly parsed\n"; return 1; }
    {
        auto am = parse_time("12:15 AM");
        auto pm = parse_time("01:30 PM");
        auto noon = parse_time("12:00 pm");
        if (!am || am->minutes != 15) { std::cerr << "12:15 AM parse\n"; return 1; }
        if (!pm || pm->minutes != 13 * 60 + 30) { std::cerr << "01:30 PM parse\n"; return 1; }
        if (!noon || noon->minutes != 12 * 60) { std::cerr << "12:00 pm parse\n"; return 1; }
    }
    if (parse_time("13:00 PM")) { std::cerr << "13:00 PM unexpectedly parsed\n"; return 1; }
    {
        auto t = parse_time("24:00");
        if (!t || t->minutes != TimeOfDay::kMinutesPerDay) { std::cerr << "24:00 end bound did not parse\n"; return 1; }
    }
    if (parse_time("24:30")) { std::cerr << "24:30 unexpectedly parsed\n"; return 1; }

    {
        auto a = parse_local_datetime("2025-04-12 12:00");
        auto b = parse_local_datetime("2025-04-12T12:00:00");
        if (!a || !b || *a != *b) { std::cerr << "datetime separators disagree\n"; return 1; }
        if (format_timestamp(*a) != "2025-04-12 12:00:00") { std::cerr << "timestamp format: " << format_timestamp(*a) << "\n"; return 1; }
    }
    if (parse_local_datetime("2025-04-12 24:00")) { std::cerr << "24:00 is not a start time\n"; return 1; }
    if (parse_local_datetime("2025-04-12")) { std::cerr << "bare date unexpectedly parsed as datetime\n"; return 1; }

    {
        LocalDateTime fixed{Date{2025, 4, 10}, TimeOfDay{8 * 60}};
        auto clock = fixed_clock(fixed);
        if (clock() != fixed) { std::cerr << "fixed clock drifted\n"; return 1; }
        auto wall = system_clock(120)();
        if (wall.date.year < 2024 || wall.time.minutes < 0 || wall.time.minutes >= TimeOfDay::kMinutesPerDay) {
            std::cerr << "system clock out of range: " << format_timestamp(wall) << "\n"; return 1;
        }
    }

    std::cout << "calendar_unit ok\n";
    return 0;
}
