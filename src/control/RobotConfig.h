#pragma once

#include <stdint.h>

#include "control/DriveTypes.h"

/*
===============================================================================
  RobotConfig.h
===============================================================================

  PURPOSE
  -------
  Everything a run is configured with, gathered into one object that is
  built once in setup() and handed to the components that need it.
  Nothing here changes while the robot is running.

  Defaults come from Params.h and WifiSecrets.h via defaultRobotConfig().
===============================================================================
*/

struct AvoidanceConfig {
  bool enabled = true;
  float detection_threshold_cm = 20.0f;
  uint32_t backup_duration_ms = 600;
  uint32_t turn_duration_ms = 1200;
  TurnStrategy turn_strategy = TurnStrategy::RANDOM;
  float critical_distance_cm = 10.0f;    // log level only
};

// Freenove app joystick -> tank command mapping
struct JoystickConfig {
  int deadzone = 15;
  int min_command = 20;
  int tank_enter = 25;
  int tank_exit = 40;
  int direction_threshold = 10;
};

struct SensorConfig {
  float min_valid_cm = 2.0f;
  float max_valid_cm = 400.0f;
  float smoothing = 1.0f;
  uint16_t max_distance_cm = 400;
  uint32_t echo_timeout_us = 25000;
};

struct NetworkConfig {
  const char* ssid = "";
  const char* password = "";
  uint16_t port = 5000;
  uint32_t connect_timeout_ms = 15000;
};

struct RobotConfig {
  AvoidanceConfig avoidance;
  JoystickConfig joystick;
  SensorConfig sensor;
  NetworkConfig network;

  DriveMode mode = DriveMode::REMOTE;
  Behavior behavior = Behavior::NONE;

  uint32_t remote_timeout_ms = 800;    // 0 disables the watchdog
  uint32_t tick_period_ms = 50;
  uint32_t random_seed = 1;
};

// Config assembled from Params.h / WifiSecrets.h
RobotConfig defaultRobotConfig();

/*
  Checks the values a student is likely to mistype.

  Returns:
    - true if the config is usable
    - false otherwise, with a short reason in *reason (if non-null)
*/
bool validateConfig(const RobotConfig& cfg, const char** reason);
