#include <gtest/gtest.h>

#include <string>

#include "FakeHardware.h"
#include "actuators/MotorDriver.h"
#include "control/BehaviorSequencer.h"
#include "control/CommandSlot.h"
#include "control/ControlLoop.h"
#include "sensors/DistanceSensor.h"

namespace {

const uint32_t kTickMs = 50;

RobotConfig testConfig(TurnStrategy strategy = TurnStrategy::ALWAYS_RIGHT) {
  RobotConfig cfg;
  cfg.avoidance.enabled = true;
  cfg.avoidance.detection_threshold_cm = 20.0f;
  cfg.avoidance.backup_duration_ms = 600;
  cfg.avoidance.turn_duration_ms = 1200;
  cfg.avoidance.turn_strategy = strategy;
  cfg.mode = DriveMode::REMOTE;
  cfg.remote_timeout_ms = 800;
  cfg.random_seed = 7;
  return cfg;
}

// Everything a ControlLoop needs, wired to fakes
struct Rig {
  explicit Rig(const RobotConfig& c)
  : cfg(c),
    ranger(100.0f),
    sensor(ranger),
    motors(pins, leftWiring(), rightWiring()),
    loop(cfg, sensor, motors, slot)
  {
    motors.begin();
    sensor.begin();
    loop.begin(0);
  }

  TankCommand output() const { return motors.current(); }
  ControlLoop::Mode mode() const { return loop.getState().mode; }

  RobotConfig cfg;
  FakePins pins;
  ScriptedRangeFinder ranger;
  DistanceSensor sensor;
  MotorDriver motors;
  CommandSlot slot;
  ControlLoop loop;
};

// Clear path, obstacle at `start`, then clear again. Returns the turn used.
TankCommand runManeuver(Rig& rig, uint32_t start) {
  rig.ranger.distance_cm = 12.0f;
  rig.loop.tick(start);
  rig.ranger.distance_cm = 100.0f;

  uint32_t t = start;
  while (rig.mode() != ControlLoop::Mode::AVOID_TURN) {
    t += kTickMs;
    rig.loop.tick(t);
  }
  const TankCommand turn = rig.output();

  while (rig.mode() != ControlLoop::Mode::IDLE) {
    t += kTickMs;
    rig.loop.tick(t);
  }
  return turn;
}


/*=============================================================================
  SCENARIOS
=============================================================================*/

TEST(ControlLoop, ObstacleRunsBackupThenTurnThenStopsAndResumes) {
  Rig rig(testConfig());
  const uint32_t T = 1000;

  for (uint32_t t = 0; t < T; t += kTickMs) {
    rig.slot.publish(DriveCommand::FORWARD);
    rig.loop.tick(t);
    ASSERT_EQ(rig.output(), toTank(DriveCommand::FORWARD));
  }

  rig.ranger.distance_cm = 15.0f;
  rig.loop.tick(T);
  EXPECT_EQ(rig.mode(), ControlLoop::Mode::AVOID_BACKUP);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::BACKWARD));
  EXPECT_FLOAT_EQ(rig.loop.getState().trigger_distance_cm, 15.0f);

  // Backward for the whole backup window
  for (uint32_t t = T + kTickMs; t < T + 600; t += kTickMs) {
    rig.loop.tick(t);
    ASSERT_EQ(rig.output(), toTank(DriveCommand::BACKWARD)) << "t=" << t;
  }

  // Then the turn, for the whole turn window
  for (uint32_t t = T + 600; t < T + 1800; t += kTickMs) {
    rig.loop.tick(t);
    ASSERT_EQ(rig.mode(), ControlLoop::Mode::AVOID_TURN) << "t=" << t;
    ASSERT_EQ(rig.output(), toTank(DriveCommand::TURN_RIGHT)) << "t=" << t;
  }

  rig.ranger.distance_cm = 100.0f;
  rig.loop.tick(T + 1800);
  EXPECT_EQ(rig.mode(), ControlLoop::Mode::IDLE);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::STOP));
  EXPECT_EQ(rig.loop.getState().avoid_count, 1u);

  // Remote control is back
  rig.slot.publish(DriveCommand::TURN_LEFT);
  rig.loop.tick(T + 1850);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::TURN_LEFT));
}

TEST(ControlLoop, ClearPathMirrorsRemoteCommands) {
  Rig rig(testConfig());

  rig.slot.publish(DriveCommand::FORWARD);
  rig.loop.tick(0);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::FORWARD));

  rig.slot.publish(DriveCommand::TURN_LEFT);
  rig.loop.tick(50);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::TURN_LEFT));

  for (uint32_t t = 100; t < 2000; t += kTickMs) {
    rig.slot.publish(DriveCommand::TURN_LEFT);
    rig.loop.tick(t);
    ASSERT_EQ(rig.mode(), ControlLoop::Mode::IDLE);
  }
  EXPECT_EQ(rig.loop.getState().avoid_count, 0u);
}

TEST(ControlLoop, SensorTimeoutEveryTickNeverTriggers) {
  Rig rig(testConfig());
  rig.ranger.distance_cm = -1.0f;

  for (uint32_t t = 0; t < 5000; t += kTickMs) {
    rig.slot.publish(DriveCommand::FORWARD);
    rig.loop.tick(t);
    ASSERT_EQ(rig.mode(), ControlLoop::Mode::IDLE);
    ASSERT_EQ(rig.output(), toTank(DriveCommand::FORWARD));
  }
  EXPECT_EQ(rig.loop.getState().avoid_count, 0u);
  EXPECT_EQ(rig.sensor.getState().timeouts, 100u);
}


/*=============================================================================
  ARBITRATION
=============================================================================*/

TEST(ControlLoop, ReadingAtThresholdIsNotAnObstacle) {
  Rig rig(testConfig());
  rig.ranger.distance_cm = 20.0f;

  rig.slot.publish(DriveCommand::FORWARD);
  rig.loop.tick(0);
  EXPECT_EQ(rig.mode(), ControlLoop::Mode::IDLE);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::FORWARD));

  rig.ranger.distance_cm = 19.9f;
  rig.loop.tick(50);
  EXPECT_EQ(rig.mode(), ControlLoop::Mode::AVOID_BACKUP);
}

TEST(ControlLoop, ObstacleBeatsCommandPublishedSameTick) {
  Rig rig(testConfig());
  rig.ranger.distance_cm = 10.0f;

  rig.slot.publish(DriveCommand::FORWARD);
  rig.loop.tick(0);

  EXPECT_EQ(rig.output(), toTank(DriveCommand::BACKWARD));
  EXPECT_FALSE(rig.slot.pending());
  EXPECT_EQ(rig.loop.getState().dropped_remote, 1u);
}

TEST(ControlLoop, RemoteCommandsDuringManeuverAreDroppedNotReplayed) {
  Rig rig(testConfig());
  rig.ranger.distance_cm = 10.0f;
  rig.loop.tick(0);

  uint32_t t = 0;
  while (rig.loop.avoiding()) {
    t += kTickMs;
    rig.slot.publish(DriveCommand::FORWARD);
    rig.loop.tick(t);
    if (rig.loop.avoiding()) {
      ASSERT_NE(rig.output(), toTank(DriveCommand::FORWARD)) << "t=" << t;
    }
  }

  EXPECT_EQ(rig.output(), toTank(DriveCommand::STOP));
  EXPECT_FALSE(rig.slot.pending());
  EXPECT_GT(rig.loop.getState().dropped_remote, 0u);

  // Nothing queued up: the next idle tick without a new command stays stopped
  rig.ranger.distance_cm = 100.0f;
  rig.loop.tick(t + kTickMs);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::STOP));
}

TEST(ControlLoop, SensorIsNotReadWhileAvoiding) {
  Rig rig(testConfig());
  rig.ranger.distance_cm = 10.0f;
  rig.loop.tick(0);
  const uint32_t reads = rig.ranger.measurements;

  // Sub-threshold readings do not stretch the windows either
  for (uint32_t t = kTickMs; t < 1800; t += kTickMs) {
    rig.loop.tick(t);
  }
  EXPECT_EQ(rig.ranger.measurements, reads);

  rig.loop.tick(1800);
  EXPECT_EQ(rig.mode(), ControlLoop::Mode::IDLE);
  EXPECT_EQ(rig.ranger.measurements, reads);
}

TEST(ControlLoop, ObstacleStillThereRetriggersAfterManeuver) {
  Rig rig(testConfig());
  rig.ranger.distance_cm = 10.0f;
  rig.loop.tick(0);
  for (uint32_t t = kTickMs; t <= 1800; t += kTickMs) rig.loop.tick(t);
  ASSERT_EQ(rig.mode(), ControlLoop::Mode::IDLE);

  rig.loop.tick(1850);
  EXPECT_EQ(rig.mode(), ControlLoop::Mode::AVOID_BACKUP);
  EXPECT_EQ(rig.loop.getState().avoid_count, 2u);
}

TEST(ControlLoop, ZeroWindowsStillRunEachStateForOneTick) {
  RobotConfig cfg = testConfig();
  cfg.avoidance.backup_duration_ms = 0;
  cfg.avoidance.turn_duration_ms = 0;
  Rig rig(cfg);

  rig.ranger.distance_cm = 10.0f;
  rig.loop.tick(0);
  EXPECT_EQ(rig.mode(), ControlLoop::Mode::AVOID_BACKUP);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::BACKWARD));
  rig.ranger.distance_cm = 100.0f;

  // Same millisecond: the window is 1 ms, not 0
  rig.loop.tick(0);
  EXPECT_EQ(rig.mode(), ControlLoop::Mode::AVOID_BACKUP);

  rig.loop.tick(kTickMs);
  EXPECT_EQ(rig.mode(), ControlLoop::Mode::AVOID_TURN);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::TURN_RIGHT));

  rig.loop.tick(kTickMs);
  EXPECT_EQ(rig.mode(), ControlLoop::Mode::AVOID_TURN);

  rig.loop.tick(2 * kTickMs);
  EXPECT_EQ(rig.mode(), ControlLoop::Mode::IDLE);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::STOP));
}

TEST(ControlLoop, RepeatedCommandKeepsPinsStable) {
  Rig rig(testConfig());

  rig.slot.publish(DriveCommand::FORWARD);
  rig.loop.tick(0);
  const uint32_t writes = rig.pins.writes;

  for (uint32_t t = kTickMs; t < 3000; t += kTickMs) {
    rig.slot.publish(DriveCommand::FORWARD);
    rig.loop.tick(t);
  }
  EXPECT_EQ(rig.pins.writes, writes);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::FORWARD));
}

TEST(ControlLoop, NoPendingCommandKeepsLastOutput) {
  RobotConfig cfg = testConfig();
  cfg.remote_timeout_ms = 0;
  Rig rig(cfg);

  rig.slot.publish(DriveCommand::TURN_RIGHT);
  rig.loop.tick(0);
  for (uint32_t t = kTickMs; t < 5000; t += kTickMs) rig.loop.tick(t);

  EXPECT_EQ(rig.output(), toTank(DriveCommand::TURN_RIGHT));
}

TEST(ControlLoop, DisabledAvoidanceIgnoresObstacles) {
  RobotConfig cfg = testConfig();
  cfg.avoidance.enabled = false;
  Rig rig(cfg);
  rig.ranger.distance_cm = 5.0f;

  rig.slot.publish(DriveCommand::FORWARD);
  rig.loop.tick(0);
  EXPECT_EQ(rig.mode(), ControlLoop::Mode::IDLE);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::FORWARD));
}

TEST(ControlLoop, BeginStopsMotorsAndClearsSlot) {
  Rig rig(testConfig());
  rig.slot.publish(DriveCommand::FORWARD);
  rig.loop.tick(0);

  rig.slot.publish(DriveCommand::BACKWARD);
  rig.loop.begin(100);

  EXPECT_EQ(rig.output(), toTank(DriveCommand::STOP));
  EXPECT_FALSE(rig.slot.pending());
  EXPECT_EQ(rig.mode(), ControlLoop::Mode::IDLE);
  EXPECT_EQ(rig.loop.getState().ticks, 0u);
  ASSERT_NE(rig.loop.note().get(100), nullptr);
  EXPECT_NE(std::string(rig.loop.note().get(100)).find("READY"), std::string::npos);
}


/*=============================================================================
  REMOTE WATCHDOG
=============================================================================*/

TEST(ControlLoop, QuietAppStopsMotorsOnce) {
  Rig rig(testConfig());

  rig.slot.publish(DriveCommand::FORWARD);
  rig.loop.tick(0);

  for (uint32_t t = kTickMs; t <= 800; t += kTickMs) {
    rig.loop.tick(t);
    ASSERT_EQ(rig.output(), toTank(DriveCommand::FORWARD)) << "t=" << t;
  }

  rig.loop.tick(850);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::STOP));
  EXPECT_TRUE(rig.loop.getState().remote_timed_out);
  ASSERT_NE(rig.loop.note().get(850), nullptr);
  EXPECT_NE(std::string(rig.loop.note().get(850)).find("REMOTE TIMEOUT"), std::string::npos);

  const uint32_t seq = rig.loop.note().sequence();
  rig.loop.tick(900);
  EXPECT_EQ(rig.loop.note().sequence(), seq);

  // Next command drives again
  rig.slot.publish(DriveCommand::BACKWARD);
  rig.loop.tick(950);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::BACKWARD));
  EXPECT_FALSE(rig.loop.getState().remote_timed_out);
}

TEST(ControlLoop, WatchdogIdleUntilFirstCommand) {
  Rig rig(testConfig());
  for (uint32_t t = 0; t < 3000; t += kTickMs) rig.loop.tick(t);
  EXPECT_FALSE(rig.loop.getState().has_remote);
  EXPECT_EQ(rig.loop.remoteAgeMs(3000), 0xFFFFFFFFu);
}

TEST(ControlLoop, RemoteAgeCountsFromLastCommandAcrossManeuver) {
  Rig rig(testConfig());

  rig.slot.publish(DriveCommand::FORWARD);
  rig.loop.tick(0);

  rig.ranger.distance_cm = 12.0f;
  rig.loop.tick(50);
  rig.ranger.distance_cm = 100.0f;

  uint32_t t = 50;
  while (rig.loop.avoiding()) {
    t += kTickMs;
    rig.loop.tick(t);
  }
  ASSERT_EQ(t, 1850u);

  rig.loop.tick(1950);
  EXPECT_EQ(rig.loop.remoteAgeMs(1950), 1950u);

  // Maneuver already stopped the motors; no timeout stop follows it
  const uint32_t seq = rig.loop.note().sequence();
  for (t = 2000; t < 4000; t += kTickMs) rig.loop.tick(t);
  EXPECT_EQ(rig.loop.note().sequence(), seq);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::STOP));
}

TEST(ControlLoop, WatchdogOffInAutonomousMode) {
  RobotConfig cfg = testConfig();
  cfg.mode = DriveMode::AUTONOMOUS;
  cfg.behavior = Behavior::CRUISE;
  Rig rig(cfg);

  rig.slot.publish(DriveCommand::FORWARD);
  rig.loop.tick(0);
  for (uint32_t t = kTickMs; t < 3000; t += kTickMs) rig.loop.tick(t);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::FORWARD));
}


/*=============================================================================
  TURN STRATEGIES
=============================================================================*/

TEST(ControlLoopTurn, AlwaysLeft) {
  Rig rig(testConfig(TurnStrategy::ALWAYS_LEFT));
  EXPECT_EQ(runManeuver(rig, 0), toTank(DriveCommand::TURN_LEFT));
  EXPECT_EQ(runManeuver(rig, 5000), toTank(DriveCommand::TURN_LEFT));
}

TEST(ControlLoopTurn, AlwaysRight) {
  Rig rig(testConfig(TurnStrategy::ALWAYS_RIGHT));
  EXPECT_EQ(runManeuver(rig, 0), toTank(DriveCommand::TURN_RIGHT));
  EXPECT_EQ(runManeuver(rig, 5000), toTank(DriveCommand::TURN_RIGHT));
}

TEST(ControlLoopTurn, AlternateStartsLeft) {
  Rig rig(testConfig(TurnStrategy::ALTERNATE));
  EXPECT_EQ(runManeuver(rig, 0), toTank(DriveCommand::TURN_LEFT));
  EXPECT_EQ(runManeuver(rig, 5000), toTank(DriveCommand::TURN_RIGHT));
  EXPECT_EQ(runManeuver(rig, 10000), toTank(DriveCommand::TURN_LEFT));
}

TEST(ControlLoopTurn, RandomIsRepeatableForASeed) {
  Rig a(testConfig(TurnStrategy::RANDOM));
  Rig b(testConfig(TurnStrategy::RANDOM));

  int lefts = 0;
  for (uint32_t i = 0; i < 32; ++i) {
    const TankCommand ta = runManeuver(a, i * 5000);
    const TankCommand tb = runManeuver(b, i * 5000);
    ASSERT_EQ(ta, tb);
    ASSERT_TRUE(ta == toTank(DriveCommand::TURN_LEFT) || ta == toTank(DriveCommand::TURN_RIGHT));
    if (ta == toTank(DriveCommand::TURN_LEFT)) lefts++;
  }
  EXPECT_GT(lefts, 0);
  EXPECT_LT(lefts, 32);
}


/*=============================================================================
  AUTONOMOUS COMMAND SOURCE
=============================================================================*/

TEST(ControlLoop, CruiseResumesAfterAvoidance) {
  RobotConfig cfg = testConfig();
  cfg.mode = DriveMode::AUTONOMOUS;
  cfg.behavior = Behavior::CRUISE;
  Rig rig(cfg);

  BehaviorSequencer behavior(rig.slot);
  behavior.start(Behavior::CRUISE, 0);

  uint32_t t = 0;
  behavior.tick(t, rig.sensor.getState());
  rig.loop.tick(t);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::FORWARD));

  t += kTickMs;
  rig.ranger.distance_cm = 8.0f;
  behavior.tick(t, rig.sensor.getState());
  rig.loop.tick(t);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::BACKWARD));
  rig.ranger.distance_cm = 100.0f;

  while (rig.loop.avoiding()) {
    t += kTickMs;
    behavior.tick(t, rig.sensor.getState());
    rig.loop.tick(t);
  }
  EXPECT_EQ(rig.output(), toTank(DriveCommand::STOP));

  t += kTickMs;
  behavior.tick(t, rig.sensor.getState());
  rig.loop.tick(t);
  EXPECT_EQ(rig.output(), toTank(DriveCommand::FORWARD));
}

}  // namespace
