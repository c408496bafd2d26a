#include "sensors/HcSr04RangeFinder.h"
#include <HCSR04.h>  // Martinsos library

/*
  HcSr04RangeFinder.cpp

  The library object is created in begin(), not in the constructor: its
  constructor calls pinMode(), and the firmware's instance is a global that
  is built before the core has set up the GPIO block.
*/

HcSr04RangeFinder::HcSr04RangeFinder(uint8_t trig_pin,
                                     uint8_t echo_pin,
                                     uint16_t max_distance_cm,
                                     uint32_t max_timeout_us)
: _trig_pin(trig_pin),
  _echo_pin(echo_pin),
  _max_distance_cm(max_distance_cm),
  _max_timeout_us(max_timeout_us)
{
}

HcSr04RangeFinder::~HcSr04RangeFinder() {
  delete _sonar;
  _sonar = nullptr;
}

void HcSr04RangeFinder::begin() {
  if (_sonar) return;

  _sonar = new UltraSonicDistanceSensor(
      _trig_pin,
      _echo_pin,
      _max_distance_cm,
      _max_timeout_us
  );
}

float HcSr04RangeFinder::measureDistanceCm() {
  // Not started yet: same as a missed echo
  if (!_sonar) return -1.0f;

  return _sonar->measureDistanceCm();
}
