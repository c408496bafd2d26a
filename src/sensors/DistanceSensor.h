#pragma once

#include <stdint.h>

#include "hal/RangeFinder.h"

class DistanceSensor {
public:
  // Returned by readDistanceCm() when the latest pulse timed out.
  // Far beyond any detection threshold, so it always reads as "clear".
  static constexpr float NO_ECHO_CM = 999.0f;

  struct State {
    float distance_cm = 0.0f;       // last valid (optionally smoothed) distance
    bool  valid = false;            // latest reading valid?
    bool  has_reading = false;      // at least one valid reading since begin()
    uint32_t last_update_ms = 0;    // time of the latest measurement
    float raw_cm = -1.0f;           // latest raw value (-1 on timeout)
    uint32_t timeouts = 0;          // invalid readings since begin()
  };

  // min_valid_cm / max_valid_cm: readings outside are treated as no echo.
  // smoothing: exponential factor in (0, 1], 1.0 = raw readings.
  DistanceSensor(RangeFinder& ranger,
                 float min_valid_cm = 2.0f,
                 float max_valid_cm = 400.0f,
                 float smoothing = 1.0f);

  void begin();

  // One blocking measurement (bounded by the ranger's echo timeout)
  void tick(uint32_t now_ms);

  // tick() and return the distance, or NO_ECHO_CM if there was no echo
  float readDistanceCm(uint32_t now_ms);

  const State& getState() const { return _state; }

private:
  RangeFinder& _ranger;

  float _min_valid_cm;
  float _max_valid_cm;
  float _smoothing;

  State _state;
};
