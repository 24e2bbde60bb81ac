// File Overview: Declares the beacon configuration block with its factory defaults
// and the clamp that keeps provisioned overrides inside safe operating ranges.
#pragma once
#include <stdint.h>
#include "io/FoxIo.hpp"

struct FoxConfig {
  uint16_t messageIntervalS   = 60;    // cadence of minute-aligned message slots
  uint8_t  powerUpHour        = 7;     // working time shown when the setter starts
  uint8_t  powerUpMinute      = 0;
  uint16_t scheduleStartMins  = 480;   // 08:00
  uint16_t scheduleStopMins   = 1200;  // 20:00
  uint16_t onDemandRunMins    = 60;
  float    rxDetectMinV       = 0.50f;
  float    rxDetectMinT       = 1.5f;  // seconds
  float    minBatteryV        = 11.5f;
  float    batteryFactor      = 5.7f;  // divider ratio on the battery sense input
  uint16_t pttLeadMs          = 500;   // let the radio key up before audio starts
  uint16_t modeHoldMs         = 1000;
  uint16_t settleMs           = 1000;
  uint16_t pollMs             = 10;
  uint16_t idlePollMs         = 250;

  // Limits for provisioned values
  static constexpr uint16_t INTERVAL_MIN_S = 10;
  static constexpr uint16_t INTERVAL_MAX_S = 600;
  // A session window must leave at least one minute of the day outside it,
  // otherwise the wrap-aware window never closes.
  static constexpr uint16_t RUN_MAX_MINS   = 1438;
  static constexpr float    RX_MIN_V       = 0.05f;
  static constexpr float    RX_MIN_T       = 0.25f;
  static constexpr float    RX_MAX_T       = 10.0f;
  static constexpr float    BATT_MAX_V     = 16.0f;
  static constexpr float    FACTOR_MIN     = 1.0f;
  static constexpr float    FACTOR_MAX     = 20.0f;
  static constexpr uint16_t PTT_LEAD_MAX_MS = 3000;
  static constexpr uint16_t POLL_MIN_MS    = 1;
  static constexpr uint16_t POLL_MAX_MS    = 1000;

  // Pull every field back into range; returns true if anything was changed.
  bool clamp();

  int rxSampleSpacingMs() const { return (int)(rxDetectMinT * 1000.0f / 5.0f); }
};
