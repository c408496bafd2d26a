#include "control/RobotConfig.h"

#include "Params.h"
#include "WifiSecrets.h"

RobotConfig defaultRobotConfig() {
  RobotConfig cfg;

  cfg.avoidance.enabled = true;
  cfg.avoidance.detection_threshold_cm = OBSTACLE_DETECT_CM;
  cfg.avoidance.backup_duration_ms = AVOID_BACKUP_MS;
  cfg.avoidance.turn_duration_ms = AVOID_TURN_MS;
  cfg.avoidance.turn_strategy = AVOID_TURN_STRATEGY;
  cfg.avoidance.critical_distance_cm = OBSTACLE_CRITICAL_CM;

  cfg.joystick.deadzone = JOY_DEADZONE;
  cfg.joystick.min_command = JOY_MIN_COMMAND;
  cfg.joystick.tank_enter = JOY_TANK_ENTER;
  cfg.joystick.tank_exit = JOY_TANK_EXIT;
  cfg.joystick.direction_threshold = JOY_DIRECTION_THRESHOLD;

  cfg.sensor.min_valid_cm = ULTRASONIC_MIN_VALID_CM;
  cfg.sensor.max_valid_cm = ULTRASONIC_MAX_VALID_CM;
  cfg.sensor.smoothing = ULTRASONIC_SMOOTHING;
  cfg.sensor.max_distance_cm = ULTRASONIC_MAX_DISTANCE_CM;
  cfg.sensor.echo_timeout_us = ULTRASONIC_TIMEOUT_US;

  cfg.network.ssid = WIFI_SSID;
  cfg.network.password = WIFI_PASSWORD;
  cfg.network.port = APP_TCP_PORT;
  cfg.network.connect_timeout_ms = WIFI_CONNECT_TIMEOUT_MS;

  cfg.mode = DRIVE_MODE;
  cfg.behavior = (DRIVE_MODE == DriveMode::AUTONOMOUS) ? AUTONOMOUS_BEHAVIOR : Behavior::NONE;

  // Stop-until-obstacle must reach its own stop distance, so no maneuver
  if (cfg.behavior == Behavior::MOVE_UNTIL_OBSTACLE) cfg.avoidance.enabled = false;

  cfg.remote_timeout_ms = REMOTE_COMMAND_TIMEOUT_MS;
  cfg.tick_period_ms = 1000UL / CONTROL_UPDATE_HZ;

  return cfg;
}

bool validateConfig(const RobotConfig& cfg, const char** reason) {
  const char* why = nullptr;

  if (cfg.avoidance.detection_threshold_cm <= 0.0f) {
    why = "detection threshold must be > 0 cm";
  } else if (cfg.avoidance.backup_duration_ms == 0) {
    why = "backup duration must be > 0 ms";
  } else if (cfg.avoidance.turn_duration_ms == 0) {
    why = "turn duration must be > 0 ms";
  } else if (cfg.sensor.max_valid_cm <= cfg.sensor.min_valid_cm) {
    why = "sensor valid range is empty";
  } else if (cfg.avoidance.detection_threshold_cm > cfg.sensor.max_valid_cm) {
    why = "detection threshold beyond sensor range";
  } else if (cfg.tick_period_ms == 0) {
    why = "tick period must be > 0 ms";
  } else if (cfg.mode == DriveMode::AUTONOMOUS && cfg.behavior == Behavior::NONE) {
    why = "autonomous mode needs a behavior";
  }

  if (reason) *reason = why;
  return why == nullptr;
}
