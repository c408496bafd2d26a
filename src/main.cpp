/*
  Pico 4WD Robot Controller

  Purpose:
  Drive the Freenove 4WD kit from the phone app (or a scripted behavior)
  and back away from anything closer than OBSTACLE_DETECT_CM.

  Loop tasks, each on its own Rate:
  - App link:   read the TCP client, decode requests, publish to CommandSlot
  - Behavior:   autonomous mode only, publish the current step to CommandSlot
  - Control:    ControlLoop.tick(): read distance, avoid or forward the command
  - Telemetry:  one JSON status line on USB serial

  NOTE: Motors are DIRECTION ONLY (enable pins not wired, full speed when on)
*/

#include <Arduino.h>

#include "Pins.h"
#include "Params.h"

#include "utils/Rate.h"
#include "utils/DebugNote.h"
#include "hal/ArduinoPins.h"
#include "actuators/MotorDriver.h"
#include "sensors/DistanceSensor.h"
#include "sensors/HcSr04RangeFinder.h"
#include "control/RobotConfig.h"
#include "control/CommandSlot.h"
#include "control/ControlLoop.h"
#include "control/BehaviorSequencer.h"
#include "comms/CommandLink.h"
#include "comms/AppServer.h"
#include "comms/Protocol.h"



/*=============================================================================
  GLOBALS
=============================================================================*/

static RobotConfig g_config = defaultRobotConfig();

// Hardware
ArduinoPins g_pins;

MotorDriver g_motors(
  g_pins,
  SideMotors::Wiring{PIN_FRONT_LEFT_IN1, PIN_FRONT_LEFT_IN2, PIN_REAR_LEFT_IN1, PIN_REAR_LEFT_IN2},
  SideMotors::Wiring{PIN_FRONT_RIGHT_IN3, PIN_FRONT_RIGHT_IN4, PIN_REAR_RIGHT_IN3, PIN_REAR_RIGHT_IN4},
  MOTOR_LEFT_INVERT,
  MOTOR_RIGHT_INVERT
);

HcSr04RangeFinder g_sonar(
  PIN_ULTRASONIC_TRIG,
  PIN_ULTRASONIC_ECHO,
  g_config.sensor.max_distance_cm,
  g_config.sensor.echo_timeout_us
);

DistanceSensor g_distance_sensor(
  g_sonar,
  g_config.sensor.min_valid_cm,
  g_config.sensor.max_valid_cm,
  g_config.sensor.smoothing
);

// Command path: app link / behavior -> slot -> control loop
CommandSlot g_command_slot;
CommandLink g_link(g_command_slot, g_distance_sensor, g_config.joystick);
AppServer g_app_server(g_link, g_config.network, PIN_STATUS_LED);
BehaviorSequencer g_behavior(g_command_slot);

ControlLoop* g_control = nullptr;

// Rates
Rate g_comms_rate(RxCOMM_UPDATE_HZ);
Rate g_behavior_rate(BEHAVIOR_UPDATE_HZ);
Rate g_control_rate(CONTROL_UPDATE_HZ);
Rate g_telemetry_rate(TELEMETRY_UPDATE_HZ);

// Last note sequence echoed to the serial monitor, per source
static uint32_t g_echoed_control_seq = 0;
static uint32_t g_echoed_link_seq = 0;


/*=============================================================================
  HELPERS
=============================================================================*/

static void echoNote(const char* tag, const DebugNote& note, uint32_t& echoed_seq) {
  if (!ENABLE_SERIAL_DEBUG) return;
  if (note.sequence() == echoed_seq) return;
  echoed_seq = note.sequence();

  SERIAL_USB.print('[');
  SERIAL_USB.print(tag);
  SERIAL_USB.print("] ");
  SERIAL_USB.println(note.text());
}

// Newest of the two component notes that is still fresh
static const char* freshestNote(uint32_t now_ms) {
  const char* ctrl = g_control->note().get(now_ms);
  const char* link = g_link.note().get(now_ms);
  if (ctrl && link) {
    return (g_control->note().writtenMs() >= g_link.note().writtenMs()) ? ctrl : link;
  }
  return ctrl ? ctrl : link;
}

static void sensorSelfTest() {
  SERIAL_USB.println("Testing ultrasonic sensor...");
  for (uint8_t i = 0; i < SENSOR_SELF_TEST_READS; ++i) {
    g_distance_sensor.tick(millis());
    const DistanceSensor::State& s = g_distance_sensor.getState();
    SERIAL_USB.print("  Test ");
    SERIAL_USB.print(i + 1);
    SERIAL_USB.print(": ");
    if (s.valid) {
      SERIAL_USB.print(s.distance_cm, 1);
      SERIAL_USB.println(" cm");
    } else {
      SERIAL_USB.println("no echo");
    }
    delay(SENSOR_SELF_TEST_GAP_MS);
  }
}


/*=============================================================================
  SETUP
=============================================================================*/

void setup() {
  SERIAL_USB.begin(SERIAL_BAUD);

  SERIAL_USB.println("==================================================");
  SERIAL_USB.println("4WD Robot - Auto Obstacle Avoidance");
  SERIAL_USB.println("Direction Control Only (Full Speed)");
  SERIAL_USB.println("==================================================");

  // Motors first so nothing twitches while Wi-Fi comes up
  g_motors.begin();

  const char* reason = nullptr;
  if (!validateConfig(g_config, &reason)) {
    SERIAL_USB.print("CONFIG ERROR: ");
    SERIAL_USB.println(reason);
    SERIAL_USB.println("Fix Params.h and upload again. Motors stay off.");
    for (;;) {
      delay(1000);
    }
  }

  g_control_rate.setPeriodMs(g_config.tick_period_ms);

  // Different turn sequence on every boot for RANDOM strategy
  randomSeed(analogRead(A0) ^ micros());
  g_config.random_seed = (uint32_t)random(1, 0x7FFFFFFF);

  g_distance_sensor.begin();
  sensorSelfTest();

  static ControlLoop control(g_config, g_distance_sensor, g_motors, g_command_slot);
  g_control = &control;

  g_link.begin();

  if (g_config.mode == DriveMode::REMOTE) {
    if (!g_app_server.begin()) {
      // Avoidance still runs; robot just has nobody to take commands from
      SERIAL_USB.println("No app link. Check WifiSecrets.h and reset.");
    }
  } else {
    SERIAL_USB.print("AUTONOMOUS behavior: ");
    SERIAL_USB.println(behaviorName(g_config.behavior));
  }

  SERIAL_USB.print("Detects obstacles at ");
  SERIAL_USB.print(g_config.avoidance.detection_threshold_cm, 1);
  SERIAL_USB.println(" cm");

  const uint32_t now_ms = millis();
  g_control->begin(now_ms);
  if (g_config.mode == DriveMode::AUTONOMOUS) {
    g_behavior.start(g_config.behavior, now_ms);
  }
}

/*=============================================================================
  LOOP
=============================================================================*/

void loop() {

  const uint32_t now_ms = millis();

  // App link: bytes in, replies out, commands into the slot
  if (g_comms_rate.ready(now_ms)) {
    g_app_server.tick(now_ms);
    echoNote("link", g_link.note(), g_echoed_link_seq);
  }

  // Behavior: autonomous command source
  if (g_config.mode == DriveMode::AUTONOMOUS && g_behavior_rate.ready(now_ms)) {
    g_behavior.tick(now_ms, g_distance_sensor.getState());
  }

  // Control tick: the only place motors change
  if (g_control_rate.ready(now_ms)) {
    g_control->tick(now_ms);
    echoNote("ctrl", g_control->note(), g_echoed_control_seq);
  }

  // TX tick: status line for the serial monitor
  if (g_telemetry_rate.ready(now_ms)) {
    TelemetryFrame t;
    t.time_ms = now_ms;

    const ControlLoop::State& cs = g_control->getState();
    t.mode = ControlLoop::modeName(cs.mode);
    t.behavior = (g_config.mode == DriveMode::AUTONOMOUS) ? behaviorName(g_behavior.behavior()) : nullptr;

    t.motors.left = sideDirectionName(cs.active.left);
    t.motors.right = sideDirectionName(cs.active.right);
    t.motors.command = tankCommandName(cs.active);

    const DistanceSensor::State& us = g_distance_sensor.getState();
    t.ultrasonic.valid = us.valid;
    t.ultrasonic.distance_cm = us.valid ? us.distance_cm : NAN;

    t.link.rx_ok = g_link.rxOk();
    t.link.rx_fail = g_link.rxFail();
    t.link.rx_overflow = g_link.rxOverflow();
    t.link.rx_max_len = g_link.rxMaxLenSeen();
    t.link.client_connected = g_app_server.clientConnected();

    t.remote_age_ms = cs.has_remote ? (float)g_control->remoteAgeMs(now_ms) : NAN;
    t.avoid_count = cs.avoid_count;

    t.note = freshestNote(now_ms);

    char line[TELEMETRY_LINE_BYTES];
    const size_t n = protocol::encodeTelemetryLine(t, line, sizeof(line));
    if (n > 0) {
      SERIAL_USB.write((const uint8_t*)line, n);
    }
  }

}
