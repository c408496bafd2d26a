#pragma once
#include <stdint.h>
#include <stddef.h>

#include "control/DriveTypes.h"

/*
  Params.h

  Purpose:
  Central location for robot constants and tunable parameters.
  This is the file students edit between runs.

  Board:
  Raspberry Pi Pico W (Freenove 4WD kit)

  Convention:
  - Distances: centimeters (cm)
  - Durations: milliseconds (ms) unless the name says _US
  - Joystick values from the app: -100..100
*/

/* ============================================================================
   OBSTACLE AVOIDANCE
============================================================================ */

constexpr float OBSTACLE_DETECT_CM   = 20.0f;   // start avoiding below this
constexpr float OBSTACLE_CRITICAL_CM = 10.0f;   // logged as CRITICAL (no extra action)

constexpr uint32_t AVOID_BACKUP_MS = 600;       // full speed reverse
constexpr uint32_t AVOID_TURN_MS   = 1200;      // tank turn, roughly 180 deg on carpet

constexpr TurnStrategy AVOID_TURN_STRATEGY = TurnStrategy::RANDOM;

/* ============================================================================
   DRIVE MODE
============================================================================ */

// REMOTE: phone app drives, AUTONOMOUS: AUTONOMOUS_BEHAVIOR drives
constexpr DriveMode DRIVE_MODE = DriveMode::REMOTE;
constexpr Behavior AUTONOMOUS_BEHAVIOR = Behavior::CRUISE;

// Stop motors if the app goes quiet for this long (0 disables)
constexpr uint32_t REMOTE_COMMAND_TIMEOUT_MS = 800;

/* ============================================================================
   BEHAVIOR TIMING (autonomous mode)
============================================================================ */

constexpr uint32_t SQUARE_SIDE_MS   = 2000;
constexpr uint32_t SQUARE_TURN_MS   = 600;     // ~90 deg
constexpr uint32_t SQUARE_PAUSE_MS  = 200;

constexpr uint32_t SPIN_MS          = 2400;    // ~360 deg

constexpr uint32_t FIGURE8_CIRCLE_MS     = 4000;
constexpr uint32_t FIGURE8_TRANSITION_MS = 500;

constexpr float MOVE_UNTIL_STOP_CM = 15.0f;

/* ============================================================================
   JOYSTICK MIXING (Freenove app "M#left#right#")
============================================================================ */

constexpr int JOY_DEADZONE            = 15;  // |v| below this reads as 0
constexpr int JOY_MIN_COMMAND         = 20;  // both sides below this = stop
constexpr int JOY_TANK_ENTER          = 25;  // one side above, other below = tank turn
constexpr int JOY_TANK_EXIT           = 40;  // other side above this leaves tank turn
constexpr int JOY_DIRECTION_THRESHOLD = 10;  // |v| above this drives the side

/* ============================================================================
   ULTRASONIC SENSOR (HC-SR04)
============================================================================ */

// HC-SR04 datasheet range. Anything outside is treated as no echo.
constexpr float ULTRASONIC_MIN_VALID_CM = 2.0f;
constexpr float ULTRASONIC_MAX_VALID_CM = 400.0f;

// Martinsos library uses max distance in centimeters
constexpr uint16_t ULTRASONIC_MAX_DISTANCE_CM = 400;

// Speed of sound (for computing a reasonable timeout from desired range)
constexpr float SPEED_OF_SOUND_CMPS = 34300.0f;    // ~20 C

// Round-trip time to ULTRASONIC_MAX_DISTANCE_CM with a 25% margin
constexpr uint32_t ULTRASONIC_TIMEOUT_US_FROM_RANGE =
    (uint32_t)(1.25f * (2.0f * ULTRASONIC_MAX_DISTANCE_CM / SPEED_OF_SOUND_CMPS) * 1000000.0f);

// Hard cap on how long one read may block the control tick
constexpr uint32_t ULTRASONIC_TIMEOUT_US_HARD = 25000UL;  // 25 ms

constexpr uint32_t ULTRASONIC_TIMEOUT_US =
    (ULTRASONIC_TIMEOUT_US_FROM_RANGE < ULTRASONIC_TIMEOUT_US_HARD)
      ? ULTRASONIC_TIMEOUT_US_FROM_RANGE
      : ULTRASONIC_TIMEOUT_US_HARD;

// 1.0 = raw readings, smaller = heavier exponential smoothing
constexpr float ULTRASONIC_SMOOTHING = 1.0f;

/* ============================================================================
   MOTOR WIRING
============================================================================ */

// Flip if one side drives backwards when commanded forward
constexpr bool MOTOR_LEFT_INVERT  = false;
constexpr bool MOTOR_RIGHT_INVERT = false;

/* ============================================================================
   TASK RATES / TIMING
============================================================================ */

constexpr uint16_t CONTROL_UPDATE_HZ   = 20;    // 50 ms control tick
constexpr uint16_t RxCOMM_UPDATE_HZ    = 200;
constexpr uint16_t BEHAVIOR_UPDATE_HZ  = 20;
constexpr uint16_t TELEMETRY_UPDATE_HZ = 5;

/* ============================================================================
   NETWORK / TELEMETRY
============================================================================ */

constexpr uint16_t APP_TCP_PORT = 5000;
constexpr uint32_t WIFI_CONNECT_TIMEOUT_MS = 15000;

constexpr uint16_t APP_LINE_BUFFER_BYTES = 1024;

constexpr uint32_t SERIAL_BAUD = 115200;
constexpr size_t TELEMETRY_LINE_BYTES = 512;

// Boot-time sensor check
constexpr uint8_t SENSOR_SELF_TEST_READS = 5;
constexpr uint32_t SENSOR_SELF_TEST_GAP_MS = 300;

/* ============================================================================
   DEBUG FLAGS
============================================================================ */

constexpr bool ENABLE_SERIAL_DEBUG = true;
