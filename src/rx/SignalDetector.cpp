// File Overview: Implements the debounced multi-sample request detector used in
// On-Demand mode.
#include "SignalDetector.hpp"

void SignalDetector::begin(const FoxIo& io, const FoxConfig& cfg, const Callbacks& cb) {
  _io        = io;
  _cb        = cb;
  _minV      = cfg.rxDetectMinV;
  _spacingMs = (uint32_t)cfg.rxSampleSpacingMs();
  _settleMs  = cfg.settleMs;
  _pollMs    = cfg.pollMs;
  _state     = State::Idle;
  _lastOver  = 0;
}

float SignalDetector::level() const {
  return adcToVolts(_io.readRxRaw());
}

bool SignalDetector::confirm() {
  _state = State::Confirming;
  int over = 0;
  for (int taken = 0; taken < CONFIRM_SAMPLES; ++taken) {
    _io.sleepMs(_spacingMs);
    if (overThreshold()) over++;
  }
  _lastOver = over;
  // >= 75% of the samples, i.e. 4 of 5
  return over * 4 >= CONFIRM_SAMPLES * 3;
}

void SignalDetector::waitForCarrier() {
  _state = State::Idle;
  while (!overThreshold()) _io.sleepMs(_pollMs);
}

void SignalDetector::waitForRelease() {
  _state = State::AwaitRelease;
  while (overThreshold()) _io.sleepMs(_pollMs);
  _io.sleepMs(_settleMs);
}

void SignalDetector::waitForRequest() {
  for (;;) {
    waitForCarrier();
    if (confirm()) break;
    // Spike or fade: drop the samples and go back to listening
    if (_cb.onRejected) _cb.onRejected(_lastOver, CONFIRM_SAMPLES);
  }
  if (_cb.onConfirmed) _cb.onConfirmed(_lastOver, CONFIRM_SAMPLES);
  waitForRelease();
  _state = State::Idle;
}
