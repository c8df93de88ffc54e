#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace twingraph::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string ToIso8601(TimePoint tp) {
  using Ticks = std::chrono::duration<int64_t, std::ratio<1, 10000000>>;

  auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
  auto ticks   = std::chrono::duration_cast<Ticks>(tp - seconds).count();

  std::time_t t = Clock::to_time_t(seconds);
  std::tm     utc{};
  gmtime_r(&t, &utc);

  char buffer[40];
  std::snprintf(buffer,
                sizeof(buffer),
                "%04d-%02d-%02dT%02d:%02d:%02d.%07lldZ",
                utc.tm_year + 1900,
                utc.tm_mon + 1,
                utc.tm_mday,
                utc.tm_hour,
                utc.tm_min,
                utc.tm_sec,
                static_cast<long long>(ticks));
  return buffer;
}

} // namespace twingraph::util
