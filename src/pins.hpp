#pragma once

// ======================= Radio interface =======================
#define PIN_PTT         32   // drives the PTT optocoupler, HIGH = keyed
#define PIN_TX_LED      2    // on-board LED mirrors PTT

// ======================= Audio (I2S sigma-delta, no DAC) =======================
#define PIN_I2S_BCLK    18
#define PIN_I2S_WCLK    19
#define PIN_AUDIO_OUT   22   // RC-filtered into the radio mic input

// ======================= Analog inputs (ADC1 only) =======================
#define PIN_BATT_SENSE  34   // battery through the divider (see batteryFactor)
#define PIN_RX_LEVEL    35   // monitor receiver audio/level detector output

// ======================= Operator buttons (active-low) =======================
#define PIN_BTN_HOUR    25
#define PIN_BTN_MINUTE  26
#define PIN_BTN_RUN     27

// Array for Buttons.cpp pull-up setup
static const int BUTTON_PIN[] = {
  PIN_BTN_HOUR,
  PIN_BTN_MINUTE,
  PIN_BTN_RUN
};
