#pragma once
#include <stdint.h>

#include "control/DriveTypes.h"
#include "hal/DigitalPins.h"

/*
===============================================================================
  SideMotors.h
===============================================================================

  PURPOSE
  -------
  Thin hardware wrapper for the two DC motors on one side of the robot
  (front + rear), each on its own H-bridge input pair.

  Assumed wiring (matches Pins.h):
    - INa / INb per motor, enable pins tied high (no speed control)

  Responsibilities:
    - Initialize the four direction pins
    - Accept a SideDirection and drive both motors identically
    - Skip pin writes when the direction did not change

  Notes:
    - This class does NOT decide anything. ControlLoop owns the decisions.
===============================================================================
*/

class SideMotors {
public:
  struct Wiring {
    uint8_t front_in_a;
    uint8_t front_in_b;
    uint8_t rear_in_a;
    uint8_t rear_in_b;
  };

  /*
    invert:
      If true, FORWARD and REVERSE are swapped
      (useful when motor wiring polarity differs side-to-side)
  */
  SideMotors(DigitalPins& pins, const Wiring& wiring, bool invert = false);

  // Configure GPIO and force safe stopped state (coast).
  void begin();

  void setDirection(SideDirection dir);

  // INa=LOW, INb=LOW on both motors
  void coast();

  // Debug/introspection
  SideDirection direction() const { return _dir; }
  uint32_t pinUpdates() const { return _updates; }

private:
  void drive_(bool in_a, bool in_b);

  DigitalPins& _pins;
  Wiring _wiring;

  bool _invert;

  // Last commanded direction (before inversion)
  SideDirection _dir = SideDirection::OFF;
  bool _started = false;

  uint32_t _updates = 0;
};
