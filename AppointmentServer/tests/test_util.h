#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include "scheduling/Calendar.h"
#include "scheduling/Errors.h"

struct Waiter {
  std::mutex mu;
  std::condition_variable cv;
  int done = 0;
};

// The scheduling error f throws, or nullopt when it returns normally.
template <typename F>
std::optional<scheduling::errc> error_of(F&& f) {
    try {
        f();
    } catch (const scheduling::SchedulingError& e) {
        return static_cast<scheduling::errc>(e.code().value());
    }
    return std::nullopt;
}

inline scheduling::Date ymd(int y, int m, int d) { return scheduling::Date{y, m, d}; }
inline scheduling::TimeOfDay hm(int h, int m) { return scheduling::TimeOfDay{h * 60 + m}; }
inline scheduling::LocalDateTime at(int y, int mo, int d, int h, int mi) {
    return scheduling::LocalDateTime{ymd(y, mo, d), hm(h, mi)};
}

// Wall clock used by the scheduling tests: 2025-04-10 08:00 clinic time.
inline scheduling::Clock test_clock() { return scheduling::fixed_clock(at(2025, 4, 10, 8, 0)); }
