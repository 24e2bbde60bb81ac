// File Overview: Declares the hardware hook bundle the portable beacon core runs on.
// The firmware wires these to millis()/delay()/ADC/GPIO and the audio player; the
// host tests wire them to a simulated rig.
#pragma once
#include <stdint.h>
#include <functional>
#include <string>
#include <vector>

// Folder holding the operator's playlist clips (full file names).
static constexpr const char* MESSAGE_FOLDER = "/messages";
// Folder holding the canned vocabulary; identifiers get PHRASE_EXT appended.
static constexpr const char* PHRASE_FOLDER  = "/phrases";
static constexpr const char* PHRASE_EXT     = ".wav";

// Full scale of a widened ADC sample and the reference it represents.
static constexpr uint16_t ADC_FULL_SCALE = 65535;
static constexpr float    ADC_REF_VOLTS  = 3.3f;

// Renders the identifiers in order from the folder while PTT is keyed.
// Blocks until playback completes; false means a clip could not be played.
using Talker = std::function<bool(const std::vector<std::string>&, const char*)>;

struct FoxIo {
  std::function<uint32_t()>     millis;      // monotonic tick
  std::function<void(uint32_t)> sleepMs;     // blocking delay
  std::function<uint16_t()>     readBatteryRaw;
  std::function<uint16_t()>     readRxRaw;
  // Buttons report true while pressed (the active-low inversion is done by the driver)
  std::function<bool()>         hourPressed;
  std::function<bool()>         minutePressed;
  std::function<bool()>         runPressed;
};

inline float adcToVolts(uint16_t raw) {
  return (float)raw / (float)ADC_FULL_SCALE * ADC_REF_VOLTS;
}
