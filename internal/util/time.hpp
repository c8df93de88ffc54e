#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace twingraph::util {

/*
  Time utilities - single place to control clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// ISO-8601 UTC with seven fractional digits, e.g. 2024-01-01T00:00:00.0000000Z
std::string ToIso8601(TimePoint tp);

} // namespace twingraph::util
