// File Overview: Declares the receive-level detector that turns a sustained carrier
// on the monitor receiver into an On-Demand session request, rejecting short spikes.
#pragma once
#include <stdint.h>
#include <functional>
#include "io/FoxIo.hpp"
#include "config/FoxConfig.hpp"

// Idle -> Confirming -> AwaitRelease. Call waitForRequest() to run the whole
// protocol; it returns only after a confirmed request has dropped and settled.
// There is no timeout: with no carrier the call never returns.
class SignalDetector {
public:
  static constexpr int CONFIRM_SAMPLES = 5;

  enum class State : uint8_t { Idle, Confirming, AwaitRelease };

  struct Callbacks {
    std::function<void(int over, int taken)> onRejected;
    std::function<void(int over, int taken)> onConfirmed;
  };

  void begin(const FoxIo& io, const FoxConfig& cfg, const Callbacks& cb = {});

  // Instantaneous scaled level (volts at the ADC pin)
  float level() const;
  bool  overThreshold() const { return level() > _minV; }

  // One Confirming pass: CONFIRM_SAMPLES samples spaced across the detect time.
  // True when at least 75% of them were over the threshold.
  bool confirm();

  void waitForRequest();

  State state() const { return _state; }
  int   lastOverCount() const { return _lastOver; }

private:
  void waitForCarrier();
  void waitForRelease();

  FoxIo     _io{};
  Callbacks _cb{};
  float     _minV = 0.5f;
  uint32_t  _spacingMs = 300;
  uint32_t  _settleMs  = 1000;
  uint32_t  _pollMs    = 10;
  State     _state = State::Idle;
  int       _lastOver = 0;
};
