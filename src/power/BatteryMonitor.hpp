// File Overview: Declares the battery sense helper: averaged readings for the
// spoken report and a single-sample threshold check for the control loop.
#pragma once
#include <stdint.h>
#include <functional>

class BatteryMonitor {
public:
  static constexpr int AVERAGE_SAMPLES = 10;

  void begin(std::function<uint16_t()> readRaw, float correctionFactor);

  // Mean of AVERAGE_SAMPLES back-to-back scaled samples
  float measure() const;
  // One scaled sample
  float sample() const;
  // Hot-path gate: one instantaneous sample, strictly above minVoltage
  bool isAboveThreshold(float minVoltage) const;

private:
  float scale(uint16_t raw) const;

  std::function<uint16_t()> _readRaw;
  float _factor = 1.0f;
};
