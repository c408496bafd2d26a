#include "sensors/DistanceSensor.h"

/*
  DistanceSensor.cpp

  Responsibilities:
  - Take a measurement when tick() is called
  - Validate the reading against the sensor's usable range
  - Optionally smooth valid readings
  - Store the latest state for other code to read

  A timed-out or out-of-range pulse only clears `valid`. distance_cm keeps
  the last good value so the app's distance query still has something to
  show, but the control loop never acts on an invalid reading.

  Rate limiting is handled by the caller (ControlLoop runs on a Rate).
*/

constexpr float DistanceSensor::NO_ECHO_CM;

DistanceSensor::DistanceSensor(RangeFinder& ranger,
                               float min_valid_cm,
                               float max_valid_cm,
                               float smoothing)
: _ranger(ranger),
  _min_valid_cm(min_valid_cm),
  _max_valid_cm(max_valid_cm),
  _smoothing(smoothing)
{
  // Guard against swapped bounds
  if (_max_valid_cm < _min_valid_cm) {
    float tmp = _max_valid_cm;
    _max_valid_cm = _min_valid_cm;
    _min_valid_cm = tmp;
  }

  if (_smoothing <= 0.0f || _smoothing > 1.0f) _smoothing = 1.0f;
}

void DistanceSensor::begin() {
  _ranger.begin();
  _state = State();
}

void DistanceSensor::tick(uint32_t now_ms) {
  const float cm = _ranger.measureDistanceCm();

  _state.last_update_ms = now_ms;
  _state.raw_cm = (cm > 0.0f) ? cm : -1.0f;

  // Ranger returns <= 0 when no echo arrived
  if (cm <= 0.0f || cm < _min_valid_cm || cm > _max_valid_cm) {
    _state.valid = false;
    _state.timeouts++;
    return;
  }

  if (_state.has_reading && _smoothing < 1.0f) {
    _state.distance_cm = _smoothing * cm + (1.0f - _smoothing) * _state.distance_cm;
  } else {
    _state.distance_cm = cm;
  }

  _state.valid = true;
  _state.has_reading = true;
}

float DistanceSensor::readDistanceCm(uint32_t now_ms) {
  tick(now_ms);
  return _state.valid ? _state.distance_cm : NO_ECHO_CM;
}
