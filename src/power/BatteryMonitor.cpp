#include "BatteryMonitor.hpp"
#include "io/FoxIo.hpp"

void BatteryMonitor::begin(std::function<uint16_t()> readRaw, float correctionFactor) {
  _readRaw = readRaw;
  _factor  = correctionFactor;
}

float BatteryMonitor::scale(uint16_t raw) const {
  return adcToVolts(raw) * _factor;
}

float BatteryMonitor::measure() const {
  float sum = 0.0f;
  for (int i = 0; i < AVERAGE_SAMPLES; ++i) sum += scale(_readRaw());
  return sum / (float)AVERAGE_SAMPLES;
}

float BatteryMonitor::sample() const {
  return scale(_readRaw());
}

bool BatteryMonitor::isAboveThreshold(float minVoltage) const {
  return sample() > minVoltage;
}
