#pragma once
#include <stdint.h>

#include "actuators/SideMotors.h"
#include "control/DriveTypes.h"
#include "hal/DigitalPins.h"

/*
===============================================================================
  MotorDriver.h
===============================================================================

  PURPOSE
  -------
  The robot's whole drivetrain: left pair and right pair, tank steering.

  Responsibilities:
    - Realize a DriveCommand or a per-side TankCommand on the four wheels
    - Remember the active command for telemetry

  Notes:
    - Open loop. There is no feedback from the motors, so nothing here can
      fail or report an error.
===============================================================================
*/

class MotorDriver {
public:
  MotorDriver(DigitalPins& pins,
              const SideMotors::Wiring& left,
              const SideMotors::Wiring& right,
              bool invert_left = false,
              bool invert_right = false);

  // Configure pins, all wheels coasting
  void begin();

  void setCommand(DriveCommand cmd);
  void setTank(const TankCommand& cmd);
  void stop() { setCommand(DriveCommand::STOP); }

  const TankCommand& current() const { return _current; }

  const SideMotors& left() const { return _left; }
  const SideMotors& right() const { return _right; }

private:
  SideMotors _left;
  SideMotors _right;

  TankCommand _current;
};
