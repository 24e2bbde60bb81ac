#include "Vocabulary.hpp"
#include <math.h>
#include "clock/ClockModel.hpp"

namespace {
  const char* const kHours[Vocabulary::HOUR_WORDS] = {
    "h12", "h01", "h02", "h03", "h04", "h05",
    "h06", "h07", "h08", "h09", "h10", "h11"
  };

  const char* const kMinutes[Vocabulary::MINUTE_WORDS] = {
    "m00", "m05", "m10", "m15", "m20", "m25",
    "m30", "m35", "m40", "m45", "m50", "m55"
  };

  const char* const kNumbers[Vocabulary::BATTERY_WORDS] = {
    "n00", "n01", "n02", "n03", "n04", "n05", "n06", "n07", "n08",
    "n09", "n10", "n11", "n12", "n13", "n14", "n15", "n16"
  };
}

namespace Vocabulary {

const char* hourWord(int hour24) {
  int h = hour24 % 24;
  if (h < 0) h += 24;
  return kHours[h % 12];
}

const char* minuteWord(int minute) {
  int m = minute % 60;
  if (m < 0) m += 60;
  return kMinutes[m / 5];
}

std::vector<std::string> timeOfDay(int minutesOfDay) {
  int mins = ClockModel::toTimeOfDayMinutes(0, minutesOfDay);
  int hour = mins / 60;
  std::vector<std::string> out;
  out.reserve(3);
  out.emplace_back(hourWord(hour));
  out.emplace_back(minuteWord(mins % 60));
  out.emplace_back(hour < 12 ? AM : PM);
  return out;
}

std::vector<std::string> timeOfDay(time_t t) {
  return timeOfDay(ClockModel::toTimeOfDayMinutes(t));
}

bool batteryReport(float volts, std::vector<std::string>& out) {
  if (isnan(volts)) return false;
  long whole = lroundf(volts);
  if (whole < 0 || whole >= BATTERY_WORDS) return false;
  out.clear();
  out.emplace_back(BATTERY);
  out.emplace_back(kNumbers[whole]);
  out.emplace_back(VOLTS);
  return true;
}

} // namespace Vocabulary
