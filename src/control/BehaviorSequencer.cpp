#include "control/BehaviorSequencer.h"

#include "Params.h"
#include "utils/Rate.h"

/*=============================================================================
  STEP TABLES
=============================================================================*/

namespace {

const TankCommand kStop(SideDirection::OFF, SideDirection::OFF);
const TankCommand kForward(SideDirection::FORWARD, SideDirection::FORWARD);
const TankCommand kTurnRight(SideDirection::FORWARD, SideDirection::REVERSE);

// One side only: the robot circles around the stopped side
const TankCommand kCircleLeft(SideDirection::OFF, SideDirection::FORWARD);
const TankCommand kCircleRight(SideDirection::FORWARD, SideDirection::OFF);

// Four times: side, pause, 90 deg right, pause
const BehaviorStep kSquare[] = {
  {kForward,   SQUARE_SIDE_MS,  0.0f},
  {kStop,      SQUARE_PAUSE_MS, 0.0f},
  {kTurnRight, SQUARE_TURN_MS,  0.0f},
  {kStop,      SQUARE_PAUSE_MS, 0.0f},

  {kForward,   SQUARE_SIDE_MS,  0.0f},
  {kStop,      SQUARE_PAUSE_MS, 0.0f},
  {kTurnRight, SQUARE_TURN_MS,  0.0f},
  {kStop,      SQUARE_PAUSE_MS, 0.0f},

  {kForward,   SQUARE_SIDE_MS,  0.0f},
  {kStop,      SQUARE_PAUSE_MS, 0.0f},
  {kTurnRight, SQUARE_TURN_MS,  0.0f},
  {kStop,      SQUARE_PAUSE_MS, 0.0f},

  {kForward,   SQUARE_SIDE_MS,  0.0f},
  {kStop,      SQUARE_PAUSE_MS, 0.0f},
  {kTurnRight, SQUARE_TURN_MS,  0.0f},
  {kStop,      SQUARE_PAUSE_MS, 0.0f},
};

const BehaviorStep kSpin[] = {
  {kTurnRight, SPIN_MS, 0.0f},
};

const BehaviorStep kFigureEight[] = {
  {kCircleLeft,  FIGURE8_CIRCLE_MS,     0.0f},
  {kForward,     FIGURE8_TRANSITION_MS, 0.0f},
  {kCircleRight, FIGURE8_CIRCLE_MS,     0.0f},
};

const BehaviorStep kMoveUntilObstacle[] = {
  {kForward, 0, MOVE_UNTIL_STOP_CM},
};

const BehaviorStep kCruise[] = {
  {kForward, 0, 0.0f},
};

template <size_t N>
const BehaviorStep* table(const BehaviorStep (&t)[N], size_t& count) {
  count = N;
  return t;
}

}  // namespace


/*=============================================================================
  SEQUENCER
=============================================================================*/

BehaviorSequencer::BehaviorSequencer(CommandSlot& slot)
: _slot(slot)
{
}

const BehaviorStep* BehaviorSequencer::steps(Behavior behavior, size_t& count) {
  switch (behavior) {
    case Behavior::SQUARE:              return table(kSquare, count);
    case Behavior::SPIN:                return table(kSpin, count);
    case Behavior::FIGURE_EIGHT:        return table(kFigureEight, count);
    case Behavior::MOVE_UNTIL_OBSTACLE: return table(kMoveUntilObstacle, count);
    case Behavior::CRUISE:              return table(kCruise, count);
    case Behavior::NONE:
    default:
      count = 0;
      return nullptr;
  }
}

void BehaviorSequencer::start(Behavior behavior, uint32_t now_ms) {
  _behavior = behavior;
  _steps = steps(behavior, _count);
  _step = 0;
  _step_started_ms = now_ms;
  _finished = false;
  _running = (_count > 0);
}

void BehaviorSequencer::tick(uint32_t now_ms, const DistanceSensor::State& reading) {
  if (!_running) return;

  // Advance through any steps whose time is up
  while (_running) {
    const BehaviorStep& step = _steps[_step];

    if (step.duration_ms > 0) {
      if (Rate::elapsedMs(now_ms, _step_started_ms) < step.duration_ms) break;
      advance_(_step_started_ms + step.duration_ms);
      continue;
    }

    if (step.stop_below_cm > 0.0f && reading.valid &&
        reading.distance_cm < step.stop_below_cm) {
      advance_(now_ms);
      continue;
    }
    break;
  }

  if (_running) {
    _slot.publish(_steps[_step].command);
  }
}

void BehaviorSequencer::advance_(uint32_t now_ms) {
  _step++;
  _step_started_ms = now_ms;
  if (_step >= _count) finish_();
}

void BehaviorSequencer::finish_() {
  _running = false;
  _finished = true;
  _step = _count;
  _slot.publish(kStop);
}
