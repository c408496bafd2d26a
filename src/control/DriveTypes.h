#pragma once
#include <stdint.h>

/*
===============================================================================
  DriveTypes.h
===============================================================================

  PURPOSE
  -------
  Value types shared by the motor layer, the control loop and every command
  source (phone app link, behavior sequencer).

  Notes:
  - The kit's H-bridges have no enable/PWM lines wired, so every command is
    a direction only. A side is either forward, reverse or off.
  - DriveCommand is the five named intents. TankCommand is the per-side form
    the motors actually consume; every DriveCommand maps to exactly one.
===============================================================================
*/

enum class DriveCommand : uint8_t {
  STOP = 0,
  FORWARD,
  BACKWARD,
  TURN_LEFT,
  TURN_RIGHT,
};

enum class SideDirection : int8_t {
  REVERSE = -1,
  OFF     = 0,
  FORWARD = 1,
};

// Direction for the left wheel pair and the right wheel pair
struct TankCommand {
  SideDirection left  = SideDirection::OFF;
  SideDirection right = SideDirection::OFF;

  TankCommand() {}
  TankCommand(SideDirection l, SideDirection r) : left(l), right(r) {}
};

inline bool operator==(const TankCommand& a, const TankCommand& b) {
  return a.left == b.left && a.right == b.right;
}

inline bool operator!=(const TankCommand& a, const TankCommand& b) {
  return !(a == b);
}

// Tank/differential steering: turns spin the two sides in opposite directions
TankCommand toTank(DriveCommand cmd);

// Reverse mapping. Returns false for one-sided commands such as (FORWARD, OFF).
bool toDriveCommand(const TankCommand& tank, DriveCommand& out);

const char* driveCommandName(DriveCommand cmd);
const char* sideDirectionName(SideDirection dir);

// Name of the DriveCommand if there is one, otherwise "CUSTOM"
const char* tankCommandName(const TankCommand& tank);


/*=============================================================================
  MODE SELECTION
=============================================================================*/

// Which way the avoidance maneuver turns after backing up
enum class TurnStrategy : uint8_t {
  ALWAYS_LEFT = 0,
  ALWAYS_RIGHT,
  ALTERNATE,   // left first, then right, then left...
  RANDOM,
};

// Where Idle-state commands come from
enum class DriveMode : uint8_t {
  REMOTE = 0,   // Freenove phone app over Wi-Fi
  AUTONOMOUS,   // scripted behavior from BehaviorSequencer
};

// Scripted behaviors used in autonomous mode
enum class Behavior : uint8_t {
  NONE = 0,
  SQUARE,
  SPIN,
  FIGURE_EIGHT,
  MOVE_UNTIL_OBSTACLE,
  CRUISE,   // forward forever, avoidance handles obstacles
};

const char* turnStrategyName(TurnStrategy strategy);
const char* behaviorName(Behavior behavior);
