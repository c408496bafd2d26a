#pragma once

/*
  RangeFinder

  One blocking ultrasonic measurement. Implementations return the distance
  in centimeters, or a value <= 0 when no echo came back before the timeout
  (the same convention the Martinsos HCSR04 library uses).
*/

class RangeFinder {
public:
  virtual ~RangeFinder() {}

  virtual void begin() {}
  virtual float measureDistanceCm() = 0;
};
