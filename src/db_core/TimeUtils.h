#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <string>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <optional>

using TimePoint = std::chrono::system_clock::time_point;

// Source of "now" for deadline checks; tests substitute a manual clock
using ClockFn = std::function<TimePoint()>;

class TimeUtils {
public:
    static TimePoint now();

    static int64_t toEpochMs(TimePoint time);
    static TimePoint fromEpochMs(int64_t ms);

    // "2025-12-23T06:41:46.123Z"
    static std::string toIso8601Utc(TimePoint time);
    static std::optional<TimePoint> parseIso8601Utc(const std::string& timestamp);

    // Whole seconds left until deadline, floored, never negative
    static int secondsUntil(TimePoint deadline, TimePoint now);

    // Expiry rule shared by the store, the reclaimer and clients
    static bool isExpired(TimePoint deadline, TimePoint now) { return now >= deadline; }

private:
    static time_t toUtcTime(std::tm* tm);
};

#endif // TIME_UTILS_H
