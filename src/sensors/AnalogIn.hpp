// File Overview: Declares the ADC helpers for the battery sense divider and the
// monitor receiver level, both reported on the 16-bit scale the core expects.
#pragma once
#include <Arduino.h>

namespace AnalogIn {
  void     begin();
  uint16_t readBatteryRaw();
  uint16_t readRxRaw();
}
