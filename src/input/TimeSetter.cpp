// File Overview: Implements the button-driven time setting loop and the Run-press
// mode selection.
#include "TimeSetter.hpp"
#include "voice/Vocabulary.hpp"

void TimeSetter::begin(const FoxIo& io, const FoxConfig& cfg, Talker talk, const Callbacks& cb) {
  _io      = io;
  _talk    = talk;
  _cb      = cb;
  _working = ClockModel::powerUpTime(cfg.powerUpHour, cfg.powerUpMinute);
  _holdMs  = cfg.modeHoldMs;
  _pollMs  = cfg.pollMs;
}

bool TimeSetter::announce() {
  return _talk(Vocabulary::timeOfDay(_working), PHRASE_FOLDER);
}

bool TimeSetter::run(ClockModel& clock, OperatingMode& mode) {
  if (!announce()) return false;

  bool lastHour = false, lastMinute = false;
  while (!_io.runPressed()) {
    bool hour = _io.hourPressed();
    bool minute = _io.minutePressed();

    if (hour && !lastHour) {
      _working += HOUR_STEP_S;
      if (_cb.onAdjusted) _cb.onAdjusted(_working);
      if (!announce()) return false;
    }
    if (minute && !lastMinute) {
      _working += MINUTE_STEP_S;
      if (_cb.onAdjusted) _cb.onAdjusted(_working);
      if (!announce()) return false;
    }
    lastHour = hour;
    lastMinute = minute;
    _io.sleepMs(_pollMs);
  }

  mode = selectMode();
  clock.fixOffset(_working);
  if (_cb.onFinished) _cb.onFinished(mode, _working);
  return true;
}

OperatingMode TimeSetter::selectMode() {
  // A press that ends exactly at the hold delay reads whatever the pin shows now.
  _io.sleepMs(_holdMs);
  if (!_io.runPressed()) return OperatingMode::Scheduled;

  while (_io.runPressed()) _io.sleepMs(_pollMs);
  return OperatingMode::OnDemand;
}
