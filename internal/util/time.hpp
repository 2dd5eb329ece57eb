#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace pgshadow::util {

/*
  Time utilities; the one place that reads the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// UTC "YYYYMMDDhhmmss", used to stamp archived table names.
std::string CompactUtcStamp(TimePoint tp);

// UTC ISO-8601 with seconds precision, for logs and status output.
std::string IsoUtc(TimePoint tp);

} // namespace pgshadow::util
