#include "actuators/SideMotors.h"

/*
===============================================================================
  SideMotors.cpp
===============================================================================

  H-bridge truth table (enable tied high):
    - INa=0, INb=0 -> Coast
    - INa=1, INb=0 -> Forward (full speed)
    - INa=0, INb=1 -> Reverse (full speed)

  INa=1, INb=1 is never written.
===============================================================================
*/

SideMotors::SideMotors(DigitalPins& pins, const Wiring& wiring, bool invert)
: _pins(pins),
  _wiring(wiring),
  _invert(invert)
{
}

void SideMotors::begin() {
  _pins.makeOutput(_wiring.front_in_a);
  _pins.makeOutput(_wiring.front_in_b);
  _pins.makeOutput(_wiring.rear_in_a);
  _pins.makeOutput(_wiring.rear_in_b);

  // Safe default state at startup
  coast();
  _started = true;
}

void SideMotors::setDirection(SideDirection dir) {
  // Repeated commands must not toggle the pins
  if (_started && dir == _dir) return;

  _dir = dir;

  SideDirection out = dir;
  if (_invert) {
    if (dir == SideDirection::FORWARD) out = SideDirection::REVERSE;
    else if (dir == SideDirection::REVERSE) out = SideDirection::FORWARD;
  }

  switch (out) {
    case SideDirection::FORWARD:
      drive_(true, false);
      break;
    case SideDirection::REVERSE:
      drive_(false, true);
      break;
    case SideDirection::OFF:
    default:
      drive_(false, false);
      break;
  }
}

void SideMotors::coast() {
  _dir = SideDirection::OFF;
  drive_(false, false);
}

void SideMotors::drive_(bool in_a, bool in_b) {
  // Release before engage so a reversal never has both inputs high
  if (!in_a) {
    _pins.write(_wiring.front_in_a, false);
    _pins.write(_wiring.rear_in_a, false);
  }
  if (!in_b) {
    _pins.write(_wiring.front_in_b, false);
    _pins.write(_wiring.rear_in_b, false);
  }
  if (in_a) {
    _pins.write(_wiring.front_in_a, true);
    _pins.write(_wiring.rear_in_a, true);
  }
  if (in_b) {
    _pins.write(_wiring.front_in_b, true);
    _pins.write(_wiring.rear_in_b, true);
  }

  _updates++;
}
