#include "hal/ArduinoPins.h"

void ArduinoPins::makeOutput(uint8_t pin) {
  pinMode(pin, OUTPUT);
  digitalWrite(pin, LOW);
}

void ArduinoPins::write(uint8_t pin, bool high) {
  digitalWrite(pin, high ? HIGH : LOW);
}
