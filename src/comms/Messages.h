#pragma once
#include <stdint.h>
#include <math.h>

/*
===============================================================================
  Messages.h
===============================================================================

  PURPOSE
  -------
  Data structures exchanged with the outside world:

    - AppRequest:     one decoded line from the Freenove phone app (TCP)
    - TelemetryFrame: one status line sent to the serial monitor (USB)

  Notes:
  - Optional numeric telemetry fields use NAN and are encoded as JSON null.
===============================================================================
*/


/*=============================================================================
  APP REQUESTS (Phone -> Robot)
=============================================================================*/

enum class AppRequestType : uint8_t {
  UNKNOWN = 0,
  MOTOR,            // "M#<left>#<right>#"
  CONTROL,          // "C#<mode>#" (mode 3 is a distance query)
  DISTANCE_QUERY,   // anything mentioning SONIC / DISTANCE / SONAR
  STATUS_QUERY,     // anything mentioning STATUS
};

struct AppRequest {
  AppRequestType type = AppRequestType::UNKNOWN;

  // MOTOR: raw joystick values, -100..100 after clamping
  int left = 0;
  int right = 0;

  // CONTROL: mode number, -1 if the field was empty or not a number
  int control_mode = -1;

  bool valid = false;  // set true after successful decode
};


/*=============================================================================
  TELEMETRY STRUCTURES (Robot -> Serial monitor)
=============================================================================*/

// {"left": "FWD", "right": "REV", "command": "TURN_RIGHT"}
struct MotorState {
  const char* left = "OFF";
  const char* right = "OFF";
  const char* command = "STOP";
};

// {"distance_cm": <float>|null, "valid": <bool>}
struct UltrasonicState {
  float distance_cm = NAN;
  bool  valid = false;
};

// {"rx_ok": .., "rx_fail": .., "rx_overflow": .., "rx_max_len": .., "client": <bool>}
struct LinkState {
  uint32_t rx_ok = 0;
  uint32_t rx_fail = 0;
  uint32_t rx_overflow = 0;
  uint16_t rx_max_len = 0;     // longest line received so far
  bool client_connected = false;
};

// Full telemetry frame
struct TelemetryFrame {
  uint32_t time_ms = 0;

  const char* mode = "IDLE";          // ControlLoop mode name
  const char* behavior = nullptr;     // autonomous behavior name, null in remote mode

  MotorState motors;
  UltrasonicState ultrasonic;
  LinkState link;

  float remote_age_ms = NAN;          // null if no remote command yet
  uint32_t avoid_count = 0;

  const char* note = nullptr;         // optional debug string
};
