// File Overview: Declares the voice player that keys the transmitter and plays a
// sequence of WAV clips from LittleFS through the sigma-delta I2S output.
#pragma once
#include <Arduino.h>
#include <string>
#include <vector>

class AudioOutputI2SNoDAC;

class MessagePlayer {
public:
  // LittleFS must already be mounted.
  void begin(uint16_t pttLeadMs);

  // PTT on, play every clip to completion, PTT off. Stops at the first clip that
  // is missing or will not decode and returns false; PTT is released either way.
  bool talk(const std::vector<std::string>& messages, const char* folder);

private:
  bool playFile(const char* path);

  AudioOutputI2SNoDAC* _out = nullptr;
  uint16_t _leadMs = 500;
};

// Singleton accessor (keeps usage simple)
MessagePlayer& player();
