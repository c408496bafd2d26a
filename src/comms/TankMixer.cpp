#include "comms/TankMixer.h"

#include <stdlib.h>  // abs

TankMixer::TankMixer(const JoystickConfig& cfg)
: _cfg(cfg)
{
}

int TankMixer::clamp_(int v) const {
  if (v > 100) return 100;
  if (v < -100) return -100;
  return v;
}

int TankMixer::deadzone_(int v) const {
  return (abs(v) < _cfg.deadzone) ? 0 : v;
}

SideDirection TankMixer::toSide_(int v) const {
  if (v > _cfg.direction_threshold) return SideDirection::FORWARD;
  if (v < -_cfg.direction_threshold) return SideDirection::REVERSE;
  return SideDirection::OFF;
}

TankCommand TankMixer::mix(int left_raw, int right_raw) {
  const int left = deadzone_(clamp_(left_raw));
  const int right = deadzone_(clamp_(right_raw));

  // Both sides barely touched: stop
  if (abs(left) < _cfg.min_command && abs(right) < _cfg.min_command) {
    _tank = TankTurn::NONE;
    return TankCommand();
  }

  if (_tank == TankTurn::NONE) {
    if (abs(left) > _cfg.tank_enter && abs(right) < _cfg.tank_enter) {
      _tank = TankTurn::RIGHT;
    } else if (abs(right) > _cfg.tank_enter && abs(left) < _cfg.tank_enter) {
      _tank = TankTurn::LEFT;
    }
  } else if (_tank == TankTurn::RIGHT) {
    if (abs(right) > _cfg.tank_exit) _tank = TankTurn::NONE;
  } else {
    if (abs(left) > _cfg.tank_exit) _tank = TankTurn::NONE;
  }

  int out_left = left;
  int out_right = right;

  if (_tank == TankTurn::RIGHT) {
    out_left = left;
    out_right = -left;
  } else if (_tank == TankTurn::LEFT) {
    out_left = -right;
    out_right = right;
  }

  return TankCommand(toSide_(out_left), toSide_(out_right));
}
