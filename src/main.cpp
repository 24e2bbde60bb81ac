#include <Arduino.h>
#include <LittleFS.h>

// ESP-IDF C headers already provide their own extern "C" guards; direct includes keep this cleaner.
#include "esp_task_wdt.h"
#include <esp_log.h>

#include "pins.hpp"
#include "prefs.hpp"
#include "radio/ptt.hpp"
#include "config/FoxConfig.hpp"
#include "config/ConfigStore.hpp"
#include "io/FoxIo.hpp"
#include "clock/ClockModel.hpp"
#include "power/BatteryMonitor.hpp"
#include "rx/SignalDetector.hpp"
#include "input/Buttons.hpp"
#include "input/TimeSetter.hpp"
#include "sensors/AnalogIn.hpp"
#include "audio/MessagePlayer.hpp"
#include "audio/Playlist.hpp"
#include "scheduler/BeaconScheduler.hpp"

// ---------------- Globals ----------------
static const char* kBootLogTag  = "boot";
static const char* kSchedLogTag = "sched";
static const char* kRxLogTag    = "rx";
static const char* kSetLogTag   = "setter";

static constexpr uint32_t FAULT_RESTART_MS = 3000;

static FoxConfig        cfg{};
static FoxIo            io{};
static ClockModel       clk([](){ return io.millis(); });   // io is wired in setup() before first use
static BatteryMonitor   battery;
static SignalDetector   detector;
static TimeSetter       setter;
static BeaconScheduler  scheduler;
static SchedulerContext ctx{};   // owned by the control loop; passed down by reference

static bool talk(const std::vector<std::string>& messages, const char* folder){
  return player().talk(messages, folder);
}

static void fmtMins(int mins, char* buf, size_t n){
  snprintf(buf, n, "%02d:%02d", mins / 60, mins % 60);
}

// Field units recover by power cycling; do the same in software.
static void restartOnFault(const char* why){
  pttKey(false);
  ESP_LOGE(kBootLogTag, "FATAL: %s, restarting in %ums", why, (unsigned)FAULT_RESTART_MS);
  Serial.flush();
  delay(FAULT_RESTART_MS);
  ESP.restart();
}

static void wireIo(){
  io.millis         = [](){ return (uint32_t)millis(); };
  io.sleepMs        = [](uint32_t ms){ delay(ms); };
  io.readBatteryRaw = [](){ return AnalogIn::readBatteryRaw(); };
  io.readRxRaw      = [](){ return AnalogIn::readRxRaw(); };
  io.hourPressed    = [](){ return Buttons::hourPressed(); };
  io.minutePressed  = [](){ return Buttons::minutePressed(); };
  io.runPressed     = [](){ return Buttons::runPressed(); };
}

static SignalDetector::Callbacks detectorCallbacks(){
  SignalDetector::Callbacks cb;
  cb.onRejected = [](int over, int taken){
    ESP_LOGD(kRxLogTag, "Request rejected (%d/%d over)", over, taken);
  };
  cb.onConfirmed = [](int over, int taken){
    ESP_LOGI(kRxLogTag, "Request confirmed (%d/%d over), waiting for carrier drop", over, taken);
  };
  return cb;
}

static TimeSetter::Callbacks setterCallbacks(){
  TimeSetter::Callbacks cb;
  cb.onAdjusted = [](time_t working){
    char hm[8]; fmtMins(ClockModel::toTimeOfDayMinutes(working), hm, sizeof(hm));
    ESP_LOGI(kSetLogTag, "Working time %s", hm);
  };
  cb.onFinished = [](OperatingMode mode, time_t working){
    char hm[8]; fmtMins(ClockModel::toTimeOfDayMinutes(working), hm, sizeof(hm));
    ESP_LOGI(kSetLogTag, "Clock set to %s, mode %s, offset %ld", hm, modeName(mode), (long)clk.offset());
  };
  return cb;
}

static BeaconScheduler::Callbacks schedulerCallbacks(){
  BeaconScheduler::Callbacks cb;
  cb.onActivityChanged = [](ActivityState s, int nowMins, bool batteryOk){
    char hm[8]; fmtMins(nowMins, hm, sizeof(hm));
    ESP_LOGI(kSchedLogTag, "%s at %s (battery %s)",
             s == ActivityState::Active ? "ACTIVE" : "inactive", hm, batteryOk ? "ok" : "LOW");
  };
  cb.onMessage = [](size_t index, const std::string& id, time_t start){
    char hm[8]; fmtMins(ClockModel::toTimeOfDayMinutes(start), hm, sizeof(hm));
    ESP_LOGI(kSchedLogTag, "%s TX [%u] %s", hm, (unsigned)index, id.c_str());
  };
  cb.onBatteryReport = [](float volts, time_t start){
    char hm[8]; fmtMins(ClockModel::toTimeOfDayMinutes(start), hm, sizeof(hm));
    ESP_LOGI(kSchedLogTag, "%s TX battery %.2fV", hm, volts);
  };
  cb.onSessionStarted = [](const ScheduleWindow& w){
    char a[8], b[8]; fmtMins(w.startMins, a, sizeof(a)); fmtMins(w.stopMins, b, sizeof(b));
    ESP_LOGI(kSchedLogTag, "On-demand session #%u %s-%s", (unsigned)ctx.sessions, a, b);
  };
  cb.onFault = [](const char* what){
    ESP_LOGE(kSchedLogTag, "%s", what);
  };
  return cb;
}

// ---------------- setup/loop ----------------
void setup() {
  // Every wait in this firmware may outlast the task watchdog period
  esp_task_wdt_deinit();

  // Transmitter unkeyed before anything else can fail
  pttBegin();

  Serial.begin(115200);
  Serial.println("[FOX] foxbeacon " FW_VERSION);

  bool provisioned = ConfigStore::load(cfg);
  ESP_LOGI(kBootLogTag, "Config: %s", provisioned ? "factory overrides" : "built-in defaults");
  ConfigStore::logSummary(cfg);

  Buttons::begin();
  AnalogIn::begin();
  wireIo();

  if (!LittleFS.begin(false)) restartOnFault("LittleFS mount failed");
  if (!Playlist::load(MESSAGE_FOLDER, ctx.playlist)) restartOnFault("playlist folder missing");

  player().begin(cfg.pttLeadMs);
  battery.begin(io.readBatteryRaw, cfg.batteryFactor);
  detector.begin(io, cfg, detectorCallbacks());
  ESP_LOGI(kBootLogTag, "Battery %.2fV", battery.measure());

  ctx.phase = SchedulerPhase::SettingTime;
  setter.begin(io, cfg, talk, setterCallbacks());
  if (!setter.run(clk, ctx.mode)) restartOnFault("time announcement failed");

  scheduler.begin(io, cfg, &clk, &battery, &detector, talk, schedulerCallbacks());
  if (ctx.mode == OperatingMode::OnDemand) {
    ESP_LOGI(kSchedLogTag, "Listening for a request on the monitor receiver");
  }
  if (!scheduler.start(ctx)) restartOnFault("scheduler start failed");
}

void loop() {
  if (!scheduler.runCycle(ctx)) restartOnFault("control loop fault");
}
