#include "TimeUtils.h"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cctype>

TimePoint TimeUtils::now() {
    return std::chrono::system_clock::now();
}

int64_t TimeUtils::toEpochMs(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint TimeUtils::fromEpochMs(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

std::string TimeUtils::toIso8601Utc(TimePoint time) {
    const int64_t ms_total = toEpochMs(time);
    int64_t seconds = ms_total / 1000;
    int64_t millis = ms_total % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    time_t sec = static_cast<time_t>(seconds);
    struct tm utc_tm{};
#ifdef _WIN32
    gmtime_s(&utc_tm, &sec);
#else
    gmtime_r(&sec, &utc_tm);
#endif
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc_tm);

    std::ostringstream ss;
    ss << buf << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

std::optional<TimePoint> TimeUtils::parseIso8601Utc(const std::string& timestamp) {
    std::tm tm = {};
    std::istringstream ss(timestamp);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    int64_t millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        int digits = 0;
        while (std::isdigit(ss.peek())) {
            const int d = ss.get() - '0';
            // sub-millisecond digits are dropped
            if (digits < 3) millis = millis * 10 + d;
            ++digits;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 3; ++digits) millis *= 10;
    }

    if (ss.get() != 'Z') {
        return std::nullopt;
    }
    if (ss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    // timegm normalises out-of-range fields (Feb 30 -> Mar 2); refuse those
    const std::tm requested = tm;
    const time_t seconds = toUtcTime(&tm);
    if (tm.tm_year != requested.tm_year || tm.tm_mon != requested.tm_mon ||
        tm.tm_mday != requested.tm_mday || tm.tm_hour != requested.tm_hour ||
        tm.tm_min != requested.tm_min || tm.tm_sec != requested.tm_sec) {
        return std::nullopt;
    }
    return fromEpochMs(static_cast<int64_t>(seconds) * 1000 + millis);
}

int TimeUtils::secondsUntil(TimePoint deadline, TimePoint now) {
    if (now >= deadline) return 0;
    auto left = std::chrono::duration_cast<std::chrono::seconds>(deadline - now);
    return static_cast<int>(left.count());
}

time_t TimeUtils::toUtcTime(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}
