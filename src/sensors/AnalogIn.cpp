#include "AnalogIn.hpp"
#include "pins.hpp"
#include "io/FoxIo.hpp"

// ===== Config =====
static constexpr uint8_t  ADC_BITS    = 12;
static constexpr uint16_t ADC_NATIVE_MAX = (1u << ADC_BITS) - 1;   // 4095

// Widen a native reading onto 0..ADC_FULL_SCALE
static uint16_t widen(uint16_t raw){
  if (raw > ADC_NATIVE_MAX) raw = ADC_NATIVE_MAX;
  return (uint16_t)(((uint32_t)raw * ADC_FULL_SCALE + ADC_NATIVE_MAX / 2) / ADC_NATIVE_MAX);
}

void AnalogIn::begin(){
  analogReadResolution(ADC_BITS);
  // 11 dB attenuation: full 0..3.3 V span on both pins
  analogSetPinAttenuation(PIN_BATT_SENSE, ADC_11db);
  analogSetPinAttenuation(PIN_RX_LEVEL,   ADC_11db);
}

uint16_t AnalogIn::readBatteryRaw(){ return widen((uint16_t)analogRead(PIN_BATT_SENSE)); }

uint16_t AnalogIn::readRxRaw(){ return widen((uint16_t)analogRead(PIN_RX_LEVEL)); }
