#include "Buttons.hpp"
#include "pins.hpp"

static inline bool low(int pin){ return digitalRead(pin) == LOW; }

void Buttons::begin(){
  for (int pin : BUTTON_PIN) pinMode(pin, INPUT_PULLUP);
  delay(10); // allow pins to settle
}

bool Buttons::hourPressed(){   return low(PIN_BTN_HOUR); }
bool Buttons::minutePressed(){ return low(PIN_BTN_MINUTE); }
bool Buttons::runPressed(){    return low(PIN_BTN_RUN); }
