#include "FoxConfig.hpp"
#include <math.h>

namespace {
  template <typename T>
  bool clampField(T& v, T lo, T hi) {
    if (v < lo) { v = lo; return true; }
    if (v > hi) { v = hi; return true; }
    return false;
  }

  // A corrupt float entry reads back as NaN, which no range comparison catches
  bool resetNan(float& v, float fallback) {
    if (!isnan(v)) return false;
    v = fallback;
    return true;
  }
}

bool FoxConfig::clamp() {
  bool changed = false;
  const FoxConfig defaults;
  changed |= resetNan(rxDetectMinV, defaults.rxDetectMinV);
  changed |= resetNan(rxDetectMinT, defaults.rxDetectMinT);
  changed |= resetNan(minBatteryV, defaults.minBatteryV);
  changed |= resetNan(batteryFactor, defaults.batteryFactor);

  changed |= clampField<uint16_t>(messageIntervalS, INTERVAL_MIN_S, INTERVAL_MAX_S);
  changed |= clampField<uint8_t>(powerUpHour, 0, 23);
  changed |= clampField<uint8_t>(powerUpMinute, 0, 59);
  changed |= clampField<uint16_t>(scheduleStartMins, 0, 1439);
  changed |= clampField<uint16_t>(scheduleStopMins, 0, 1439);
  changed |= clampField<uint16_t>(onDemandRunMins, 1, RUN_MAX_MINS);
  changed |= clampField(rxDetectMinV, RX_MIN_V, ADC_REF_VOLTS);
  changed |= clampField(rxDetectMinT, RX_MIN_T, RX_MAX_T);
  changed |= clampField(minBatteryV, 0.0f, BATT_MAX_V);
  changed |= clampField(batteryFactor, FACTOR_MIN, FACTOR_MAX);
  changed |= clampField<uint16_t>(pttLeadMs, 0, PTT_LEAD_MAX_MS);
  changed |= clampField<uint16_t>(modeHoldMs, 100, 5000);
  changed |= clampField<uint16_t>(settleMs, 0, 5000);
  changed |= clampField<uint16_t>(pollMs, POLL_MIN_MS, POLL_MAX_MS);
  changed |= clampField<uint16_t>(idlePollMs, POLL_MIN_MS, POLL_MAX_MS);
  return changed;
}
