#include "control/DriveTypes.h"

TankCommand toTank(DriveCommand cmd) {
  switch (cmd) {
    case DriveCommand::FORWARD:
      return TankCommand(SideDirection::FORWARD, SideDirection::FORWARD);
    case DriveCommand::BACKWARD:
      return TankCommand(SideDirection::REVERSE, SideDirection::REVERSE);
    case DriveCommand::TURN_LEFT:
      return TankCommand(SideDirection::REVERSE, SideDirection::FORWARD);
    case DriveCommand::TURN_RIGHT:
      return TankCommand(SideDirection::FORWARD, SideDirection::REVERSE);
    case DriveCommand::STOP:
    default:
      return TankCommand(SideDirection::OFF, SideDirection::OFF);
  }
}

bool toDriveCommand(const TankCommand& tank, DriveCommand& out) {
  static const DriveCommand kAll[] = {
    DriveCommand::STOP,
    DriveCommand::FORWARD,
    DriveCommand::BACKWARD,
    DriveCommand::TURN_LEFT,
    DriveCommand::TURN_RIGHT,
  };

  for (DriveCommand cmd : kAll) {
    if (toTank(cmd) == tank) {
      out = cmd;
      return true;
    }
  }
  return false;
}

const char* driveCommandName(DriveCommand cmd) {
  switch (cmd) {
    case DriveCommand::STOP:       return "STOP";
    case DriveCommand::FORWARD:    return "FORWARD";
    case DriveCommand::BACKWARD:   return "BACKWARD";
    case DriveCommand::TURN_LEFT:  return "TURN_LEFT";
    case DriveCommand::TURN_RIGHT: return "TURN_RIGHT";
  }
  return "UNKNOWN";
}

const char* sideDirectionName(SideDirection dir) {
  switch (dir) {
    case SideDirection::REVERSE: return "REV";
    case SideDirection::OFF:     return "OFF";
    case SideDirection::FORWARD: return "FWD";
  }
  return "UNKNOWN";
}

const char* tankCommandName(const TankCommand& tank) {
  DriveCommand cmd;
  if (toDriveCommand(tank, cmd)) return driveCommandName(cmd);
  return "CUSTOM";
}

const char* turnStrategyName(TurnStrategy strategy) {
  switch (strategy) {
    case TurnStrategy::ALWAYS_LEFT:  return "LEFT";
    case TurnStrategy::ALWAYS_RIGHT: return "RIGHT";
    case TurnStrategy::ALTERNATE:    return "ALTERNATE";
    case TurnStrategy::RANDOM:       return "RANDOM";
  }
  return "UNKNOWN";
}

const char* behaviorName(Behavior behavior) {
  switch (behavior) {
    case Behavior::NONE:                return "NONE";
    case Behavior::SQUARE:              return "SQUARE";
    case Behavior::SPIN:                return "SPIN";
    case Behavior::FIGURE_EIGHT:        return "FIGURE_EIGHT";
    case Behavior::MOVE_UNTIL_OBSTACLE: return "MOVE_UNTIL_OBSTACLE";
    case Behavior::CRUISE:              return "CRUISE";
  }
  return "UNKNOWN";
}
