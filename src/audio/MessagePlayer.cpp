// File Overview: Implements PTT-wrapped clip playback with ESP8266Audio's WAV
// generator reading straight from LittleFS.
#include "MessagePlayer.hpp"

#include <LittleFS.h>
#include <esp_log.h>
#include "AudioFileSourceLittleFS.h"
#include "AudioGeneratorWAV.h"
#include "AudioOutputI2SNoDAC.h"

#include "pins.hpp"
#include "ClipPath.hpp"
#include "radio/ptt.hpp"

static const char* kPlayerLogTag = "player";

static constexpr uint16_t PTT_TAIL_MS = 150;   // keep the carrier up past the last sample

static MessagePlayer g_inst;
MessagePlayer& player(){ return g_inst; }

void MessagePlayer::begin(uint16_t pttLeadMs) {
  _leadMs = pttLeadMs;
  if (!_out) {
    _out = new AudioOutputI2SNoDAC();
    _out->SetPinout(PIN_I2S_BCLK, PIN_I2S_WCLK, PIN_AUDIO_OUT);
    // Radio mic inputs overload easily; start well below full scale
    _out->SetGain(0.5f);
  }
}

bool MessagePlayer::playFile(const char* path) {
  if (!LittleFS.exists(path)) {
    ESP_LOGE(kPlayerLogTag, "Missing clip %s", path);
    return false;
  }

  AudioFileSourceLittleFS src(path);
  AudioGeneratorWAV wav;
  if (!wav.begin(&src, _out)) {
    ESP_LOGE(kPlayerLogTag, "Cannot decode %s", path);
    return false;
  }
  // Runs until the decoder drains the file; no timeout
  while (wav.isRunning()) {
    if (!wav.loop()) wav.stop();
  }
  return true;
}

bool MessagePlayer::talk(const std::vector<std::string>& messages, const char* folder) {
  if (!_out) {
    ESP_LOGE(kPlayerLogTag, "talk() before begin()");
    return false;
  }

  pttKey(true);
  delay(_leadMs);   // let the radio spin up

  bool ok = true;
  for (const std::string& id : messages) {
    std::string path = ClipPath::resolve(id, folder);
    ESP_LOGD(kPlayerLogTag, "Playing %s", path.c_str());
    if (!playFile(path.c_str())) { ok = false; break; }
  }

  delay(PTT_TAIL_MS);
  pttKey(false);
  return ok;
}
