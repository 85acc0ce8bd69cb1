#pragma once

#include <chrono>
#include <string>

namespace cic::util {

/*
  Time utilities — single place to control clock source later.

  Persisted timestamps are float seconds since the Unix epoch.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

double    ToUnixSeconds(TimePoint tp);
TimePoint FromUnixSeconds(double seconds);

double SecondsBetween(TimePoint earlier, TimePoint later);

// "HH:MM" in local time.
std::string LocalHourMinute(TimePoint tp);

} // namespace cic::util
