// File Overview: Implements the read-only NVS override loader for the beacon config.
#include "ConfigStore.hpp"
#include <Arduino.h>
#include <esp_log.h>
#include "prefs.hpp"

static const char* kCfgLogTag = "config";

namespace ConfigStore {

bool load(FoxConfig& cfg) {
  Preferences p;
  bool found = p.begin(NVS_NS, true);
  if (found) {
    cfg.messageIntervalS  = p.getUShort(KEY_MSG_INTERVAL, cfg.messageIntervalS);
    cfg.powerUpHour       = p.getUChar(KEY_PWRUP_HOUR,    cfg.powerUpHour);
    cfg.powerUpMinute     = p.getUChar(KEY_PWRUP_MIN,     cfg.powerUpMinute);
    cfg.scheduleStartMins = p.getUShort(KEY_SCHED_START,  cfg.scheduleStartMins);
    cfg.scheduleStopMins  = p.getUShort(KEY_SCHED_STOP,   cfg.scheduleStopMins);
    cfg.onDemandRunMins   = p.getUShort(KEY_RUN_MINS,     cfg.onDemandRunMins);
    cfg.rxDetectMinV      = p.getFloat(KEY_RX_MIN_V,      cfg.rxDetectMinV);
    cfg.rxDetectMinT      = p.getFloat(KEY_RX_MIN_T,      cfg.rxDetectMinT);
    cfg.minBatteryV       = p.getFloat(KEY_BATT_MIN_V,    cfg.minBatteryV);
    cfg.batteryFactor     = p.getFloat(KEY_BATT_FACTOR,   cfg.batteryFactor);
    cfg.pttLeadMs         = p.getUShort(KEY_PTT_LEAD_MS,  cfg.pttLeadMs);
    p.end();
  } else {
    ESP_LOGI(kCfgLogTag, "No factory overrides, using built-in defaults");
  }

  if (cfg.clamp()) {
    ESP_LOGW(kCfgLogTag, "Provisioned values out of range were clamped");
  }
  return found;
}

void logSummary(const FoxConfig& cfg) {
  ESP_LOGI(kCfgLogTag, "interval=%us window=%02u:%02u-%02u:%02u run=%umin power-up=%02u:%02u",
           (unsigned)cfg.messageIntervalS,
           (unsigned)(cfg.scheduleStartMins / 60), (unsigned)(cfg.scheduleStartMins % 60),
           (unsigned)(cfg.scheduleStopMins / 60), (unsigned)(cfg.scheduleStopMins % 60),
           (unsigned)cfg.onDemandRunMins,
           (unsigned)cfg.powerUpHour, (unsigned)cfg.powerUpMinute);
  ESP_LOGI(kCfgLogTag, "rx>%.2fV for %.1fs, battery>%.2fV (x%.3f), ptt lead %ums",
           cfg.rxDetectMinV, cfg.rxDetectMinT, cfg.minBatteryV, cfg.batteryFactor,
           (unsigned)cfg.pttLeadMs);
}

} // namespace ConfigStore
