#pragma once
#include <Arduino.h>

#include "hal/DigitalPins.h"

// DigitalPins on the real board: pinMode() / digitalWrite()
class ArduinoPins : public DigitalPins {
public:
  void makeOutput(uint8_t pin) override;
  void write(uint8_t pin, bool high) override;
};
