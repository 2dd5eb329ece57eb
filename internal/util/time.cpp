#include "time.hpp"

#include <ctime>

namespace pgshadow::util {

namespace {

std::tm ToUtc(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&t, &utc);
  return utc;
}

std::string Format(TimePoint tp, const char* pattern) {
  const auto utc = ToUtc(tp);
  char       buf[32];
  const auto n = std::strftime(buf, sizeof(buf), pattern, &utc);
  return std::string(buf, n);
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string CompactUtcStamp(TimePoint tp) {
  return Format(tp, "%Y%m%d%H%M%S");
}

std::string IsoUtc(TimePoint tp) {
  return Format(tp, "%Y-%m-%dT%H:%M:%SZ");
}

} // namespace pgshadow::util
