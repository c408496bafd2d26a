#pragma once

#include <stdint.h>
#include <random>

#include "actuators/MotorDriver.h"
#include "control/CommandSlot.h"
#include "control/DriveTypes.h"
#include "control/RobotConfig.h"
#include "sensors/DistanceSensor.h"
#include "utils/DebugNote.h"

/*
===============================================================================
  ControlLoop.h
===============================================================================

  PURPOSE
  -------
  The robot's one decision maker. Called once per control tick, it either
  passes the latest remote command through to the motors or runs the
  obstacle avoidance maneuver.

    IDLE          read distance; obstacle closer than the threshold starts
                  AVOID_BACKUP, otherwise forward the pending remote command
    AVOID_BACKUP  BACKWARD for backup_duration_ms, then AVOID_TURN
    AVOID_TURN    TURN_LEFT/TURN_RIGHT for turn_duration_ms, then STOP and
                  back to IDLE

  While avoiding, the distance sensor is not read and every remote command
  is discarded. Nothing is replayed when the maneuver ends.

  Rules:
    - Only this class writes MotorDriver
    - Only this class reads CommandSlot
    - tick() never fails; bad readings just mean "no obstacle"
===============================================================================
*/

class ControlLoop {
public:
  enum class Mode : uint8_t {
    IDLE = 0,
    AVOID_BACKUP,
    AVOID_TURN,
  };

  struct State {
    Mode mode = Mode::IDLE;
    uint32_t mode_entered_ms = 0;

    // Command currently on the motors
    TankCommand active;

    // Turn chosen for the current (or last) maneuver
    DriveCommand avoid_turn = DriveCommand::TURN_RIGHT;

    // Remote command bookkeeping
    bool has_remote = false;
    uint32_t last_remote_ms = 0;
    bool remote_timed_out = false;

    // Distance that started the current (or last) maneuver
    float trigger_distance_cm = 0.0f;

    // Stats
    uint32_t ticks = 0;
    uint32_t avoid_count = 0;
    uint32_t dropped_remote = 0;
  };

  ControlLoop(const RobotConfig& cfg,
              DistanceSensor& sensor,
              MotorDriver& motors,
              CommandSlot& slot);

  // Motors stopped, state back to IDLE
  void begin(uint32_t now_ms);

  void tick(uint32_t now_ms);

  const State& getState() const { return _state; }

  bool avoiding() const { return _state.mode != Mode::IDLE; }

  // Time since the last consumed remote command. Large if never received.
  uint32_t remoteAgeMs(uint32_t now_ms) const;

  const DebugNote& note() const { return _note; }

  static const char* modeName(Mode mode);

private:
  void tickIdle_(uint32_t now_ms);
  void tickBackup_(uint32_t now_ms);
  void tickTurn_(uint32_t now_ms);

  void enterBackup_(uint32_t now_ms, float distance_cm);
  void enterTurn_(uint32_t now_ms);
  void finishAvoid_(uint32_t now_ms);

  void issue_(const TankCommand& cmd);
  void dropRemote_();
  DriveCommand chooseTurn_();

  AvoidanceConfig _avoid;
  DriveMode _drive_mode;
  uint32_t _remote_timeout_ms;

  DistanceSensor& _sensor;
  MotorDriver& _motors;
  CommandSlot& _slot;

  State _state;

  // ALTERNATE: next turn is left when true
  bool _next_turn_left = true;
  std::minstd_rand _rng;

  DebugNote _note;
};
