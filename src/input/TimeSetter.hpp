// File Overview: Declares the pre-run time setter. The operator steps a working time
// forward with the Hour and Minute buttons, hearing each value over the air, and
// leaves with the Run button; the Run press length picks the operating mode.
#pragma once
#include <time.h>
#include <functional>
#include "io/FoxIo.hpp"
#include "config/FoxConfig.hpp"
#include "clock/ClockModel.hpp"
#include "scheduler/SchedulerContext.hpp"

class TimeSetter {
public:
  static constexpr time_t HOUR_STEP_S   = 3600;
  static constexpr time_t MINUTE_STEP_S = 300;

  struct Callbacks {
    std::function<void(time_t working)> onAdjusted;
    std::function<void(OperatingMode, time_t working)> onFinished;
  };

  void begin(const FoxIo& io, const FoxConfig& cfg, Talker talk, const Callbacks& cb = {});

  // Blocks until Run is pressed, then selects the mode and fixes the clock
  // offset from the working time. False if an announcement could not be played.
  bool run(ClockModel& clock, OperatingMode& mode);

  // Run has just been seen pressed: a press still held after the hold delay
  // selects On-Demand (and waits for release), a released one Scheduled.
  OperatingMode selectMode();

  time_t workingTime() const { return _working; }

private:
  bool announce();

  FoxIo     _io{};
  Talker    _talk;
  Callbacks _cb{};
  time_t    _working = 0;
  uint32_t  _holdMs  = 1000;
  uint32_t  _pollMs  = 10;
};
