#include "common/Clock.hpp"

#include <cstdio>
#include <ctime>

namespace common {

static std::tm to_utc(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

long long to_epoch_ms(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

TimePoint from_epoch_ms(long long ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

std::string format_utc(TimePoint t, const char* fmt) {
    std::tm tm = to_utc(Clock::to_time_t(t));
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

std::string iso8601(TimePoint t) {
    long long ms = to_epoch_ms(t) % 1000;
    if (ms < 0) ms += 1000;
    char frac[8];
    std::snprintf(frac, sizeof(frac), ".%03lld", ms);
    return format_utc(t, "%Y-%m-%dT%H:%M:%S") + frac + "Z";
}

}  // namespace common
