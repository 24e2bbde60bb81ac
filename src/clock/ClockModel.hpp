// File Overview: Declares the virtual wall clock: a monotonic tick plus the
// correction offset the operator fixes once with the time-setting buttons.
#pragma once
#include <stdint.h>
#include <time.h>
#include <functional>

class ClockModel {
public:
  static constexpr int MINUTES_PER_DAY = 1440;

  explicit ClockModel(std::function<uint32_t()> monotonicMs);

  // Monotonic seconds since boot (tick truncated to whole seconds)
  time_t monotonic() const;
  // Virtual time: monotonic() + correction offset
  time_t now() const;

  // Pins the offset so that now() == workingTime at this instant. Called once,
  // when the operator leaves the time setter.
  void fixOffset(time_t workingTime);
  time_t offset() const { return _offset; }
  bool   isFixed() const { return _fixed; }

  // Minutes since midnight (0..1439). The instant form decomposes the calendar
  // time in UTC; the pair form is taken literally and wraps at 1440.
  static int toTimeOfDayMinutes(time_t t);
  static int toTimeOfDayMinutes(int hour, int minute);

  static int secondsWithinMinute(time_t t);
  // Working time the setter starts from: the reference day at hour:minute.
  static time_t powerUpTime(int hour, int minute);

private:
  std::function<uint32_t()> _monotonicMs;
  time_t _offset = 0;
  bool   _fixed  = false;
};
