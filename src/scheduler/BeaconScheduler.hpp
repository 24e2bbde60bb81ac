// File Overview: Declares the beacon control loop: the activity predicate, the
// minute-aligned message slots, the battery report at the end of each playlist pass,
// and the On-Demand session handling.
#pragma once
#include <time.h>
#include <functional>
#include <string>
#include "io/FoxIo.hpp"
#include "config/FoxConfig.hpp"
#include "clock/ClockModel.hpp"
#include "power/BatteryMonitor.hpp"
#include "rx/SignalDetector.hpp"
#include "SchedulerContext.hpp"

class BeaconScheduler {
public:
  struct Callbacks {
    std::function<void(ActivityState, int nowMins, bool batteryOk)> onActivityChanged;
    std::function<void(size_t index, const std::string& id, time_t start)> onMessage;
    std::function<void(float volts, time_t start)> onBatteryReport;
    std::function<void(const ScheduleWindow&)> onSessionStarted;
    std::function<void(const char* what)> onFault;
  };

  void begin(const FoxIo& io, const FoxConfig& cfg, ClockModel* clock,
             BatteryMonitor* battery, SignalDetector* detector, Talker talk,
             const Callbacks& cb = {});

  // Leaves the time setter for ctx.mode: Scheduled installs the daily window and
  // runs; On-Demand waits for the first request and starts a session.
  bool start(SchedulerContext& ctx);

  // One control-loop iteration of the Running phase. Returns false on a fatal
  // fault (a clip that cannot be played, a battery value with no word).
  bool runCycle(SchedulerContext& ctx);

  // SessionStartup: fresh window [now, now + run duration], intro and stop time.
  bool startSession(SchedulerContext& ctx);

  // Blocking waits, no timeout
  void waitForMinuteBoundary() const;
  void waitUntil(time_t t) const;

private:
  bool playSlot(SchedulerContext& ctx);
  bool announceBattery(time_t start);
  void setActivity(SchedulerContext& ctx, ActivityState s, int nowMins, bool batteryOk);
  bool fault(const char* what);

  FoxIo           _io{};
  FoxConfig       _cfg{};
  ClockModel*     _clock    = nullptr;
  BatteryMonitor* _battery  = nullptr;
  SignalDetector* _detector = nullptr;
  Talker          _talk;
  Callbacks       _cb{};
};
