#pragma once

#include <Arduino.h>

#include "hal/RangeFinder.h"

class UltraSonicDistanceSensor;

/*
  HcSr04RangeFinder

  RangeFinder on the kit's HC-SR04, through the Martinsos library. One
  measurement is one trigger pulse and a pulseIn() that gives up after
  max_timeout_us, so a control tick never blocks longer than that.
*/

class HcSr04RangeFinder : public RangeFinder {
public:
  HcSr04RangeFinder(uint8_t trig_pin,
                    uint8_t echo_pin,
                    uint16_t max_distance_cm = 400,
                    uint32_t max_timeout_us = 25000);

  ~HcSr04RangeFinder();

  // Creates the library object (sets the pin modes)
  void begin() override;

  // Library value: cm, or -1.0 when nothing echoed back in time
  float measureDistanceCm() override;

private:
  HcSr04RangeFinder(const HcSr04RangeFinder&);
  HcSr04RangeFinder& operator=(const HcSr04RangeFinder&);

  uint8_t _trig_pin;
  uint8_t _echo_pin;
  uint16_t _max_distance_cm;
  uint32_t _max_timeout_us;

  UltraSonicDistanceSensor* _sonar = nullptr;
};
