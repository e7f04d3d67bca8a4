#pragma once

#include <chrono>
#include <string>

namespace common {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

long long to_epoch_ms(TimePoint t);
TimePoint from_epoch_ms(long long ms);

// strftime-style formatting in UTC, e.g. "%Y%m%d"
std::string format_utc(TimePoint t, const char* fmt);

// "2024-05-01T08:30:00.123Z"
std::string iso8601(TimePoint t);

}  // namespace common
