#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace catalog::util {

/*
  Time utilities: single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// "2021-04-01T13:37:00.000Z", the format written to next_update_at/last_discovery_at
std::string ToIso8601(TimePoint tp);

} // namespace catalog::util
