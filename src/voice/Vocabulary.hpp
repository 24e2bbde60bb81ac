// File Overview: Declares the canned-phrase vocabulary and the helpers that turn a
// time of day or a battery voltage into an ordered list of phrase identifiers.
#pragma once
#include <time.h>
#include <string>
#include <vector>

namespace Vocabulary {
  static constexpr const char* AM            = "am";
  static constexpr const char* PM            = "pm";
  static constexpr const char* BATTERY       = "battery";
  static constexpr const char* VOLTS         = "volts";
  static constexpr const char* SESSION_INTRO = "intro";
  static constexpr const char* UNTIL         = "until";

  static constexpr int HOUR_WORDS    = 12;
  static constexpr int MINUTE_WORDS  = 12;   // 5-minute steps
  static constexpr int BATTERY_WORDS = 17;   // 0..16 volts

  const char* hourWord(int hour24);
  const char* minuteWord(int minute);

  // hour (12-hour clock), minute floored to 5, am/pm
  std::vector<std::string> timeOfDay(int minutesOfDay);
  std::vector<std::string> timeOfDay(time_t t);

  // "battery <n> volts" with the voltage rounded to whole volts. Returns false,
  // leaving out untouched, when the rounded value has no word.
  bool batteryReport(float volts, std::vector<std::string>& out);
}
