// File Overview: Simple structs bundling the control-loop state that flows between the
// time setter, the scheduler and the firmware loop. One SchedulerContext exists per
// run and is owned by the loop; nothing else mutates it.
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

enum class OperatingMode : uint8_t { Scheduled, OnDemand };
enum class ActivityState : uint8_t { Inactive, Active };
enum class SchedulerPhase : uint8_t { SettingTime, AwaitingTrigger, SessionStartup, Running };

// Inclusive at both ends. stop < start spans midnight.
struct ScheduleWindow {
  int startMins = 0;
  int stopMins  = 0;

  bool contains(int mins) const {
    if (startMins <= stopMins) return mins >= startMins && mins <= stopMins;
    return mins >= startMins || mins <= stopMins;
  }
};

struct SchedulerContext {
  OperatingMode  mode     = OperatingMode::Scheduled;
  SchedulerPhase phase    = SchedulerPhase::SettingTime;
  ActivityState  activity = ActivityState::Inactive;
  ScheduleWindow window{};
  size_t         cursor   = 0;   // playlist.size() means "battery report next"
  uint32_t       sessions = 0;   // On-Demand sessions started since boot
  std::vector<std::string> playlist;
};

inline const char* modeName(OperatingMode m) {
  return m == OperatingMode::OnDemand ? "on-demand" : "scheduled";
}
