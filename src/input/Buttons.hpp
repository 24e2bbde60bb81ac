// File Overview: Declares the operator button readers (Hour, Minute, Run). The
// switches pull to ground, so a LOW pin reads as pressed.
#pragma once
#include <Arduino.h>

namespace Buttons {
  void begin();
  bool hourPressed();
  bool minutePressed();
  bool runPressed();
}
