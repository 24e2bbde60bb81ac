// File Overview: Implements the beacon control loop. Each Running cycle decides
// whether the fox should transmit, lines the next slot up on a whole minute, plays
// one message (or the battery report after the last one) and holds the slot open
// for the configured interval.
#include "BeaconScheduler.hpp"
#include "voice/Vocabulary.hpp"

void BeaconScheduler::begin(const FoxIo& io, const FoxConfig& cfg, ClockModel* clock,
                            BatteryMonitor* battery, SignalDetector* detector, Talker talk,
                            const Callbacks& cb) {
  _io       = io;
  _cfg      = cfg;
  _clock    = clock;
  _battery  = battery;
  _detector = detector;
  _talk     = talk;
  _cb       = cb;
}

bool BeaconScheduler::fault(const char* what) {
  if (_cb.onFault) _cb.onFault(what);
  return false;
}

void BeaconScheduler::setActivity(SchedulerContext& ctx, ActivityState s, int nowMins, bool batteryOk) {
  if (ctx.activity == s) return;
  ctx.activity = s;
  if (s == ActivityState::Active) ctx.cursor = 0;   // every active stretch starts at the top
  if (_cb.onActivityChanged) _cb.onActivityChanged(s, nowMins, batteryOk);
}

bool BeaconScheduler::start(SchedulerContext& ctx) {
  ctx.activity = ActivityState::Inactive;
  ctx.cursor   = 0;

  if (ctx.mode == OperatingMode::Scheduled) {
    ctx.window.startMins = _cfg.scheduleStartMins;
    ctx.window.stopMins  = _cfg.scheduleStopMins;
    ctx.phase = SchedulerPhase::Running;
    return true;
  }

  ctx.phase = SchedulerPhase::AwaitingTrigger;
  _detector->waitForRequest();
  return startSession(ctx);
}

bool BeaconScheduler::startSession(SchedulerContext& ctx) {
  ctx.phase = SchedulerPhase::SessionStartup;

  // Always from the current time; the previous session's window is discarded.
  int nowMins = ClockModel::toTimeOfDayMinutes(_clock->now());
  ctx.window.startMins = nowMins;
  ctx.window.stopMins  = ClockModel::toTimeOfDayMinutes(0, nowMins + _cfg.onDemandRunMins);
  ctx.sessions++;
  if (_cb.onSessionStarted) _cb.onSessionStarted(ctx.window);

  std::vector<std::string> words{Vocabulary::SESSION_INTRO, Vocabulary::UNTIL};
  std::vector<std::string> stop = Vocabulary::timeOfDay(ctx.window.stopMins);
  words.insert(words.end(), stop.begin(), stop.end());
  if (!_talk(words, PHRASE_FOLDER)) return fault("session announcement failed");

  ctx.phase = SchedulerPhase::Running;
  return true;
}

void BeaconScheduler::waitForMinuteBoundary() const {
  while (ClockModel::secondsWithinMinute(_clock->now()) != 0) _io.sleepMs(_cfg.pollMs);
}

void BeaconScheduler::waitUntil(time_t t) const {
  while (_clock->now() < t) _io.sleepMs(_cfg.pollMs);
}

bool BeaconScheduler::announceBattery(time_t start) {
  float volts = _battery->measure();
  if (_cb.onBatteryReport) _cb.onBatteryReport(volts, start);

  std::vector<std::string> words;
  if (!Vocabulary::batteryReport(volts, words)) return fault("battery voltage outside spoken range");
  if (!_talk(words, PHRASE_FOLDER)) return fault("battery report playback failed");
  return true;
}

bool BeaconScheduler::playSlot(SchedulerContext& ctx) {
  waitForMinuteBoundary();
  time_t slotStart = _clock->now();

  if (ctx.cursor >= ctx.playlist.size()) {
    if (!announceBattery(slotStart)) return false;
    ctx.cursor = 0;
  } else {
    const std::string& id = ctx.playlist[ctx.cursor];
    if (_cb.onMessage) _cb.onMessage(ctx.cursor, id, slotStart);
    if (!_talk(std::vector<std::string>{id}, MESSAGE_FOLDER)) return fault("message playback failed");
    ctx.cursor++;
  }

  // Fixed cadence regardless of how long the clip ran
  waitUntil(slotStart + (time_t)_cfg.messageIntervalS);
  return true;
}

bool BeaconScheduler::runCycle(SchedulerContext& ctx) {
  time_t now   = _clock->now();
  int nowMins  = ClockModel::toTimeOfDayMinutes(now);
  bool tActive = ctx.window.contains(nowMins);
  bool batOk   = _battery->isAboveThreshold(_cfg.minBatteryV);

  if (tActive && batOk) {
    setActivity(ctx, ActivityState::Active, nowMins, batOk);
    return playSlot(ctx);
  }

  setActivity(ctx, ActivityState::Inactive, nowMins, batOk);

  if (ctx.mode == OperatingMode::OnDemand) {
    ctx.phase = SchedulerPhase::AwaitingTrigger;
    _detector->waitForRequest();
    return startSession(ctx);
  }

  _io.sleepMs(_cfg.idlePollMs);
  return true;
}
