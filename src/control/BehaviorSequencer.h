#pragma once

#include <stdint.h>
#include <stddef.h>

#include "control/CommandSlot.h"
#include "control/DriveTypes.h"
#include "sensors/DistanceSensor.h"

/*
===============================================================================
  BehaviorSequencer.h
===============================================================================

  PURPOSE
  -------
  Command source for autonomous mode. Plays a behavior as a list of timed
  steps and publishes the current step's command to the CommandSlot on
  every tick, exactly like the phone app keeps re-sending its joystick.

  Because the command is re-published every tick, driving resumes by itself
  after ControlLoop finishes an avoidance maneuver.

  Steps:
    - duration_ms > 0: hold for that long, then advance
    - duration_ms == 0: hold until stop_below_cm is seen (or forever when
      stop_below_cm <= 0)

  A finished behavior publishes STOP once and then stays quiet.
===============================================================================
*/

struct BehaviorStep {
  TankCommand command;
  uint32_t duration_ms;
  float stop_below_cm;
};

class BehaviorSequencer {
public:
  explicit BehaviorSequencer(CommandSlot& slot);

  void start(Behavior behavior, uint32_t now_ms);

  // reading: latest DistanceSensor state (only MOVE_UNTIL_OBSTACLE uses it)
  void tick(uint32_t now_ms, const DistanceSensor::State& reading);

  Behavior behavior() const { return _behavior; }
  bool running() const { return _running; }
  bool finished() const { return _finished; }
  size_t stepIndex() const { return _step; }

  // Step table for a behavior; count 0 for Behavior::NONE
  static const BehaviorStep* steps(Behavior behavior, size_t& count);

private:
  void advance_(uint32_t now_ms);
  void finish_();

  CommandSlot& _slot;

  Behavior _behavior = Behavior::NONE;
  const BehaviorStep* _steps = nullptr;
  size_t _count = 0;
  size_t _step = 0;
  uint32_t _step_started_ms = 0;

  bool _running = false;
  bool _finished = false;
};
