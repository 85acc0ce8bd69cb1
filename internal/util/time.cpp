#include "time.hpp"

#include <ctime>

namespace cic::util {

TimePoint Now() {
  return Clock::now();
}

double ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

TimePoint FromUnixSeconds(double seconds) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

double SecondsBetween(TimePoint earlier, TimePoint later) {
  return std::chrono::duration<double>(later - earlier).count();
}

std::string LocalHourMinute(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           local{};
  localtime_r(&t, &local);

  char buf[8];
  std::strftime(buf, sizeof(buf), "%H:%M", &local);
  return buf;
}

} // namespace cic::util
