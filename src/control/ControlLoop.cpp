#include "control/ControlLoop.h"

#include "utils/Rate.h"

/*
===============================================================================
  ControlLoop.cpp
===============================================================================

  Timing:
  - Every window is measured from the tick that entered the state, so the
    maneuver lasts exactly backup + turn, quantized to the control tick.
  - Readings taken elsewhere (telemetry, app queries) never touch the state
    machine; only tickIdle_() samples the sensor.
===============================================================================
*/

ControlLoop::ControlLoop(const RobotConfig& cfg,
                         DistanceSensor& sensor,
                         MotorDriver& motors,
                         CommandSlot& slot)
: _avoid(cfg.avoidance),
  _drive_mode(cfg.mode),
  _remote_timeout_ms(cfg.remote_timeout_ms),
  _sensor(sensor),
  _motors(motors),
  _slot(slot),
  _rng(cfg.random_seed == 0 ? 1 : cfg.random_seed)
{
  // A zero window would skip a state; one tick is the shortest real window
  if (_avoid.backup_duration_ms == 0) _avoid.backup_duration_ms = 1;
  if (_avoid.turn_duration_ms == 0) _avoid.turn_duration_ms = 1;
}

void ControlLoop::begin(uint32_t now_ms) {
  _state = State();
  _state.mode_entered_ms = now_ms;
  _next_turn_left = true;

  _slot.discard();
  _motors.stop();

  _note.set(now_ms, "READY threshold=%.1fcm backup=%lums turn=%lums strategy=%s",
            (double)_avoid.detection_threshold_cm,
            (unsigned long)_avoid.backup_duration_ms,
            (unsigned long)_avoid.turn_duration_ms,
            turnStrategyName(_avoid.turn_strategy));
}

void ControlLoop::tick(uint32_t now_ms) {
  _state.ticks++;

  switch (_state.mode) {
    case Mode::IDLE:
      tickIdle_(now_ms);
      break;
    case Mode::AVOID_BACKUP:
      tickBackup_(now_ms);
      break;
    case Mode::AVOID_TURN:
      tickTurn_(now_ms);
      break;
  }
}

uint32_t ControlLoop::remoteAgeMs(uint32_t now_ms) const {
  if (!_state.has_remote) return 0xFFFFFFFFUL;
  return Rate::elapsedMs(now_ms, _state.last_remote_ms);
}

const char* ControlLoop::modeName(Mode mode) {
  switch (mode) {
    case Mode::IDLE:         return "IDLE";
    case Mode::AVOID_BACKUP: return "AVOID_BACKUP";
    case Mode::AVOID_TURN:   return "AVOID_TURN";
  }
  return "UNKNOWN";
}


/*=============================================================================
  STATES
=============================================================================*/

void ControlLoop::tickIdle_(uint32_t now_ms) {
  _sensor.tick(now_ms);
  const DistanceSensor::State& reading = _sensor.getState();

  // Invalid reading (no echo) is treated as a clear path
  if (_avoid.enabled && reading.valid &&
      reading.distance_cm < _avoid.detection_threshold_cm) {
    dropRemote_();
    enterBackup_(now_ms, reading.distance_cm);
    return;
  }

  TankCommand cmd;
  if (_slot.take(cmd)) {
    _state.has_remote = true;
    _state.last_remote_ms = now_ms;
    _state.remote_timed_out = false;
    issue_(cmd);
    return;
  }

  // App went quiet: stop once and wait for the next command
  if (_drive_mode == DriveMode::REMOTE && _remote_timeout_ms > 0 &&
      _state.has_remote && !_state.remote_timed_out &&
      Rate::elapsedMs(now_ms, _state.last_remote_ms) > _remote_timeout_ms) {
    _state.remote_timed_out = true;
    issue_(toTank(DriveCommand::STOP));
    _note.set(now_ms, "REMOTE TIMEOUT after %lums, motors stopped",
              (unsigned long)Rate::elapsedMs(now_ms, _state.last_remote_ms));
  }
}

void ControlLoop::tickBackup_(uint32_t now_ms) {
  dropRemote_();

  if (Rate::elapsedMs(now_ms, _state.mode_entered_ms) >= _avoid.backup_duration_ms) {
    enterTurn_(now_ms);
  }
}

void ControlLoop::tickTurn_(uint32_t now_ms) {
  dropRemote_();

  if (Rate::elapsedMs(now_ms, _state.mode_entered_ms) >= _avoid.turn_duration_ms) {
    finishAvoid_(now_ms);
  }
}


/*=============================================================================
  TRANSITIONS
=============================================================================*/

void ControlLoop::enterBackup_(uint32_t now_ms, float distance_cm) {
  _state.mode = Mode::AVOID_BACKUP;
  _state.mode_entered_ms = now_ms;
  _state.trigger_distance_cm = distance_cm;
  _state.avoid_count++;

  issue_(toTank(DriveCommand::BACKWARD));

  const bool critical = distance_cm < _avoid.critical_distance_cm;
  _note.set(now_ms, "OBSTACLE %.1fcm%s - backing up %lums",
            (double)distance_cm,
            critical ? " CRITICAL" : "",
            (unsigned long)_avoid.backup_duration_ms);
}

void ControlLoop::enterTurn_(uint32_t now_ms) {
  _state.mode = Mode::AVOID_TURN;
  _state.mode_entered_ms = now_ms;
  _state.avoid_turn = chooseTurn_();

  issue_(toTank(_state.avoid_turn));

  _note.set(now_ms, "AVOID turning %s %lums",
            driveCommandName(_state.avoid_turn),
            (unsigned long)_avoid.turn_duration_ms);
}

void ControlLoop::finishAvoid_(uint32_t now_ms) {
  issue_(toTank(DriveCommand::STOP));

  _state.mode = Mode::IDLE;
  _state.mode_entered_ms = now_ms;

  // Motors are already stopped; the watchdog has nothing left to stop until
  // the next command. last_remote_ms keeps the real command time.
  _state.remote_timed_out = true;

  _note.set(now_ms, "AVOID done (#%lu), control resumed",
            (unsigned long)_state.avoid_count);
}


/*=============================================================================
  HELPERS
=============================================================================*/

void ControlLoop::issue_(const TankCommand& cmd) {
  _motors.setTank(cmd);
  _state.active = cmd;
}

void ControlLoop::dropRemote_() {
  if (_slot.discard()) _state.dropped_remote++;
}

DriveCommand ControlLoop::chooseTurn_() {
  switch (_avoid.turn_strategy) {
    case TurnStrategy::ALWAYS_LEFT:
      return DriveCommand::TURN_LEFT;

    case TurnStrategy::ALWAYS_RIGHT:
      return DriveCommand::TURN_RIGHT;

    case TurnStrategy::ALTERNATE: {
      const bool left = _next_turn_left;
      _next_turn_left = !_next_turn_left;
      return left ? DriveCommand::TURN_LEFT : DriveCommand::TURN_RIGHT;
    }

    case TurnStrategy::RANDOM:
    default: {
      std::uniform_int_distribution<int> coin(0, 1);
      return coin(_rng) == 0 ? DriveCommand::TURN_LEFT : DriveCommand::TURN_RIGHT;
    }
  }
}
