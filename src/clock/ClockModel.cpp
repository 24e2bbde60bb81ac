// File Overview: Implements the virtual clock arithmetic and time-of-day conversion.
#include "ClockModel.hpp"

namespace {
  // 2024-01-01 00:00:00 UTC; the date part is never announced, only the time of day.
  constexpr time_t REFERENCE_DAY = 1704067200;
}

ClockModel::ClockModel(std::function<uint32_t()> monotonicMs)
  : _monotonicMs(monotonicMs) {}

time_t ClockModel::monotonic() const {
  return (time_t)(_monotonicMs() / 1000u);
}

time_t ClockModel::now() const {
  return monotonic() + _offset;
}

void ClockModel::fixOffset(time_t workingTime) {
  _offset = workingTime - monotonic();
  _fixed  = true;
}

int ClockModel::toTimeOfDayMinutes(time_t t) {
  struct tm parts;
  gmtime_r(&t, &parts);
  return toTimeOfDayMinutes(parts.tm_hour, parts.tm_min);
}

int ClockModel::toTimeOfDayMinutes(int hour, int minute) {
  int m = (hour * 60 + minute) % MINUTES_PER_DAY;
  return m < 0 ? m + MINUTES_PER_DAY : m;
}

int ClockModel::secondsWithinMinute(time_t t) {
  int s = (int)(t % 60);
  return s < 0 ? s + 60 : s;
}

time_t ClockModel::powerUpTime(int hour, int minute) {
  return REFERENCE_DAY + (time_t)toTimeOfDayMinutes(hour, minute) * 60;
}
