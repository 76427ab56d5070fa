#include "core/clock.hpp"
#include <cstdio>
#include <ctime>

namespace lockbox::core {

int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

TimePoint fromEpochMillis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(millis)));
}

std::string formatIso8601(TimePoint tp) {
    int64_t millis = toEpochMillis(tp);
    int64_t seconds = millis / 1000;
    int64_t fraction = millis % 1000;
    if (fraction < 0) {
        fraction += 1000;
        seconds -= 1;
    }

    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<int>(fraction));
    return std::string(buf);
}

} // namespace lockbox::core
