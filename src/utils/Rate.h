#pragma once

#include <stdint.h>

/*
  Rate

  Fixed-period task gate for the cooperative main loop. Every periodic job
  (control tick, app link, behaviors, telemetry) owns one.

  All comparisons use the signed subtraction trick, so millis() rollover
  after ~49 days is harmless.
*/

class Rate {
public:
  // hz = how many times per second the task should run
  explicit Rate(uint16_t hz = 1) { setHz(hz); }

  void setHz(uint16_t hz) {
    if (hz == 0) hz = 1;
    _period_ms = (uint32_t)(1000UL / hz);
    if (_period_ms == 0) _period_ms = 1;
  }

  void setPeriodMs(uint32_t period_ms) {
    _period_ms = (period_ms == 0) ? 1 : period_ms;
  }

  // True when the task is due. Schedules the following run from now_ms,
  // so a late tick pushes the schedule instead of bursting to catch up.
  bool ready(uint32_t now_ms) {
    if (!_initialized) {
      _next_ms = now_ms;
      _initialized = true;
    }

    if (reached(now_ms, _next_ms)) {
      if (_ticks > 0 && elapsedMs(now_ms, _next_ms) >= _period_ms) _late++;
      _next_ms = now_ms + _period_ms;
      _ticks++;
      return true;
    }
    return false;
  }

  // Next ready() returns true immediately
  void reset() {
    _initialized = false;
  }

  uint32_t periodMs() const { return _period_ms; }
  uint32_t ticks() const { return _ticks; }

  // Runs that started a full period or more behind schedule
  uint32_t lateTicks() const { return _late; }

  static bool reached(uint32_t now_ms, uint32_t deadline_ms) {
    return (int32_t)(now_ms - deadline_ms) >= 0;
  }

  static uint32_t elapsedMs(uint32_t now_ms, uint32_t since_ms) {
    return now_ms - since_ms;
  }

private:
  uint32_t _period_ms = 1000;
  uint32_t _next_ms = 0;
  bool _initialized = false;

  uint32_t _ticks = 0;
  uint32_t _late = 0;
};
