// src/radio/ptt.hpp
#pragma once
#include <Arduino.h>
#include "pins.hpp"

// PTT line plus the TX LED that mirrors it. Unkeyed is the safe default.
inline void pttBegin() {
  pinMode(PIN_PTT, OUTPUT);
  digitalWrite(PIN_PTT, LOW);
  pinMode(PIN_TX_LED, OUTPUT);
  digitalWrite(PIN_TX_LED, LOW);
}

inline void pttKey(bool on) {
  digitalWrite(PIN_PTT, on ? HIGH : LOW);
  digitalWrite(PIN_TX_LED, on ? HIGH : LOW);
}
