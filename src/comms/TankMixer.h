#pragma once

#include "control/DriveTypes.h"
#include "control/RobotConfig.h"

/*
  TankMixer

  Turns the Freenove app's two joystick values (-100..100, left and right
  side) into a direction per side.

  The app sends something like (60, 5) when the stick is pushed hard to
  one side. Driving just one side would pivot around a stopped wheel pair,
  so that case becomes a tank turn instead: the idle side is driven opposite
  to the active one. Hysteresis (enter at tank_enter, leave at tank_exit)
  keeps a wobbly thumb from flipping between the two.
*/

class TankMixer {
public:
  enum class TankTurn : uint8_t {
    NONE = 0,
    LEFT,
    RIGHT,
  };

  explicit TankMixer(const JoystickConfig& cfg = JoystickConfig());

  TankCommand mix(int left_raw, int right_raw);

  // Leave tank mode (client disconnect, explicit stop)
  void reset() { _tank = TankTurn::NONE; }

  TankTurn tankTurn() const { return _tank; }
  bool inTankTurn() const { return _tank != TankTurn::NONE; }

private:
  int clamp_(int v) const;
  int deadzone_(int v) const;
  SideDirection toSide_(int v) const;

  JoystickConfig _cfg;
  TankTurn _tank = TankTurn::NONE;
};
