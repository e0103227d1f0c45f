#include <gtest/gtest.h>

#include "drive/MotionCommand.h"

TEST(MotionCommand, ParsesEveryCanonicalName) {
  for (uint8_t i = 0; i < MOTION_COMMAND_COUNT; ++i) {
    const MotionCommand cmd = (MotionCommand)i;
    EXPECT_EQ(cmd, parseMotionCommand(motionCommandName(cmd))) << motionCommandName(cmd);
  }
}

TEST(MotionCommand, AcceptsLegacyMoveAliases) {
  EXPECT_EQ(MotionCommand::FORWARD, parseMotionCommand("move_forward"));
  EXPECT_EQ(MotionCommand::LEFT, parseMotionCommand("move_left"));
  EXPECT_EQ(MotionCommand::RIGHT_BACK, parseMotionCommand("move_right_back"));
}

TEST(MotionCommand, RejectsGarbage) {
  EXPECT_EQ(MotionCommand::UNKNOWN, parseMotionCommand(nullptr));
  EXPECT_EQ(MotionCommand::UNKNOWN, parseMotionCommand(""));
  EXPECT_EQ(MotionCommand::UNKNOWN, parseMotionCommand("Forward"));
  EXPECT_EQ(MotionCommand::UNKNOWN, parseMotionCommand("fly"));
  EXPECT_STREQ("unknown", motionCommandName(MotionCommand::UNKNOWN));
}

TEST(MotionCommand, OnlyTurnsAreRotations) {
  EXPECT_TRUE(isRotation(MotionCommand::TURN_LEFT));
  EXPECT_TRUE(isRotation(MotionCommand::TURN_RIGHT));
  EXPECT_FALSE(isRotation(MotionCommand::LEFT));
  EXPECT_FALSE(isRotation(MotionCommand::STOP));
}
