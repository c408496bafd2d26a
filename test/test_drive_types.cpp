#include <gtest/gtest.h>

#include "control/DriveTypes.h"

namespace {

TEST(DriveTypes, TankMappingUsesDifferentialTurns) {
  EXPECT_EQ(toTank(DriveCommand::STOP), TankCommand(SideDirection::OFF, SideDirection::OFF));
  EXPECT_EQ(toTank(DriveCommand::FORWARD), TankCommand(SideDirection::FORWARD, SideDirection::FORWARD));
  EXPECT_EQ(toTank(DriveCommand::BACKWARD), TankCommand(SideDirection::REVERSE, SideDirection::REVERSE));
  EXPECT_EQ(toTank(DriveCommand::TURN_LEFT), TankCommand(SideDirection::REVERSE, SideDirection::FORWARD));
  EXPECT_EQ(toTank(DriveCommand::TURN_RIGHT), TankCommand(SideDirection::FORWARD, SideDirection::REVERSE));
}

TEST(DriveTypes, NamedTankCommandsMapBack) {
  DriveCommand cmd = DriveCommand::STOP;
  ASSERT_TRUE(toDriveCommand(toTank(DriveCommand::TURN_LEFT), cmd));
  EXPECT_EQ(cmd, DriveCommand::TURN_LEFT);
}

TEST(DriveTypes, OneSidedCommandHasNoName) {
  DriveCommand cmd = DriveCommand::FORWARD;
  const TankCommand pivot(SideDirection::FORWARD, SideDirection::OFF);
  EXPECT_FALSE(toDriveCommand(pivot, cmd));
  EXPECT_EQ(cmd, DriveCommand::FORWARD);
  EXPECT_STREQ(tankCommandName(pivot), "CUSTOM");
}

TEST(DriveTypes, Names) {
  EXPECT_STREQ(tankCommandName(toTank(DriveCommand::BACKWARD)), "BACKWARD");
  EXPECT_STREQ(sideDirectionName(SideDirection::REVERSE), "REV");
  EXPECT_STREQ(turnStrategyName(TurnStrategy::ALTERNATE), "ALTERNATE");
  EXPECT_STREQ(behaviorName(Behavior::FIGURE_EIGHT), "FIGURE_EIGHT");
}

}  // namespace
