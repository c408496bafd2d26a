#pragma once

#include <stdint.h>

/*
  DigitalPins

  The only GPIO surface the motor layer touches. The firmware backs it with
  pinMode()/digitalWrite(); unit tests back it with a recording fake.
*/

class DigitalPins {
public:
  virtual ~DigitalPins() {}

  virtual void makeOutput(uint8_t pin) = 0;
  virtual void write(uint8_t pin, bool high) = 0;
};
