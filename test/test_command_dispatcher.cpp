#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

#include "FakeGpioPort.h"
#include "Pins.h"
#include "control/CommandDispatcher.h"
#include "utils/Clock.h"

namespace {

class DispatcherTest : public ::testing::Test {
protected:
  DispatcherTest()
  : port(PIN_ULTRASONIC_TRIG, PIN_ULTRASONIC_ECHO),
    drive(port, defaultDrivetrainConfig()),
    range(port, PIN_ULTRASONIC_TRIG, PIN_ULTRASONIC_ECHO)
  {
    cfg.grace_ms = 2000;
    cfg.rotation_hold_ms = 50;
  }

  void SetUp() override {
    ASSERT_TRUE(drive.begin());
    ASSERT_TRUE(range.begin());
  }

  // Polls until pred() holds or timeout_ms passes
  template <typename Pred>
  static bool waitFor(Pred pred, uint32_t timeout_ms = 2000) {
    const uint32_t until = millis() + timeout_ms;
    while (!pred()) {
      if ((int32_t)(millis() - until) >= 0) return false;
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
  }

  FakeGpioPort port;
  Drivetrain drive;
  RangeSensor range;
  DispatcherConfig cfg;
};

}  // namespace

TEST_F(DispatcherTest, ExecutesInSubmissionOrder) {
  CommandDispatcher d(drive, range, cfg);
  std::vector<MotionCommand> seen;
  d.setExecutedHook([&seen](MotionCommand c) { seen.push_back(c); });

  EXPECT_EQ(SubmitResult::ACCEPTED, d.submit(MotionCommand::FORWARD, 0));
  EXPECT_EQ(SubmitResult::ACCEPTED, d.submit(MotionCommand::LEFT, 0));
  EXPECT_EQ(2u, d.pending());

  EXPECT_TRUE(d.step());
  EXPECT_EQ(MotionCommand::FORWARD, drive.currentMotion());
  EXPECT_TRUE(d.step());
  EXPECT_EQ(MotionCommand::LEFT, drive.currentMotion());
  EXPECT_FALSE(d.step());

  ASSERT_EQ(2u, seen.size());
  EXPECT_EQ(MotionCommand::FORWARD, seen[0]);
  EXPECT_EQ(MotionCommand::LEFT, seen[1]);
  EXPECT_EQ(MotionCommand::LEFT, d.lastExecuted());
}

TEST_F(DispatcherTest, StopDrainsEverythingPending) {
  CommandDispatcher d(drive, range, cfg);
  d.submit(MotionCommand::FORWARD, 0);
  d.submit(MotionCommand::RIGHT, 0);
  d.submit(MotionCommand::LEFT_BACK, 0);
  d.submit(MotionCommand::STOP, 0);

  const std::vector<MotionCommand> q = d.pendingSnapshot();
  ASSERT_EQ(1u, q.size());
  EXPECT_EQ(MotionCommand::STOP, q[0]);

  drive.forward();
  EXPECT_TRUE(d.step());
  EXPECT_TRUE(drive.isStopped());
  EXPECT_FALSE(d.step());
}

TEST_F(DispatcherTest, CommandsAfterStopStillRun) {
  CommandDispatcher d(drive, range, cfg);
  d.submit(MotionCommand::STOP, 0);
  d.submit(MotionCommand::BACK, 0);

  EXPECT_TRUE(d.step());
  EXPECT_TRUE(d.step());
  EXPECT_EQ(MotionCommand::BACK, drive.currentMotion());
}

TEST_F(DispatcherTest, StopForcesDetectionOn) {
  CommandDispatcher d(drive, range, cfg);
  range.setEnabled(false);
  d.submit(MotionCommand::STOP, 0);
  d.step();
  EXPECT_TRUE(range.enabled());
}

TEST_F(DispatcherTest, BackArmsGraceAndStopClearsIt) {
  CommandDispatcher d(drive, range, cfg);

  EXPECT_FALSE(d.gracePending(1000));
  d.submit(MotionCommand::BACK, 1000);
  EXPECT_TRUE(d.gracePending(1001));
  EXPECT_TRUE(d.gracePending(2999));
  EXPECT_EQ(1000u, d.graceRemainingMs(2000));

  d.submit(MotionCommand::STOP, 1500);
  EXPECT_FALSE(d.gracePending(1501));
}

TEST_F(DispatcherTest, GraceExpiresOnItsOwn) {
  CommandDispatcher d(drive, range, cfg);
  d.submit(MotionCommand::BACK, 1000);
  EXPECT_FALSE(d.gracePending(3000));
  EXPECT_FALSE(d.gracePending(3500));
  EXPECT_EQ(0u, d.graceRemainingMs(3500));
}

TEST_F(DispatcherTest, ForwardDoesNotArmGrace) {
  CommandDispatcher d(drive, range, cfg);
  d.submit(MotionCommand::FORWARD, 1000);
  d.submit(MotionCommand::LEFT_BACK, 1000);
  EXPECT_FALSE(d.gracePending(1001));
}

TEST_F(DispatcherTest, UnknownCommandsAreRejected) {
  CommandDispatcher d(drive, range, cfg);
  EXPECT_EQ(SubmitResult::UNKNOWN_COMMAND, d.submit(MotionCommand::UNKNOWN, 0));
  EXPECT_EQ(SubmitResult::UNKNOWN_COMMAND, d.submit("moonwalk"));
  EXPECT_EQ(SubmitResult::UNKNOWN_COMMAND, d.submit((const char*)nullptr));
  EXPECT_EQ(0u, d.pending());

  EXPECT_EQ(SubmitResult::ACCEPTED, d.submit("move_left"));
  EXPECT_EQ(1u, d.pending());
}

TEST_F(DispatcherTest, RotationHoldsThenStopsAndRestoresDetection) {
  CommandDispatcher d(drive, range, cfg);

  bool detection_during_turn = true;
  MotionCommand motion_during_turn = MotionCommand::STOP;
  std::thread observer;

  d.submit(MotionCommand::TURN_LEFT, 0);
  const uint32_t t0 = millis();

  observer = std::thread([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    detection_during_turn = range.enabled();
    motion_during_turn = drive.currentMotion();
  });

  EXPECT_TRUE(d.step());
  observer.join();

  EXPECT_GE(millis() - t0, cfg.rotation_hold_ms);
  EXPECT_FALSE(detection_during_turn);
  EXPECT_EQ(MotionCommand::TURN_LEFT, motion_during_turn);
  EXPECT_TRUE(drive.isStopped());
  EXPECT_TRUE(range.enabled());
}

TEST_F(DispatcherTest, PendingStopCutsRotationShort) {
  cfg.rotation_hold_ms = 5000;
  CommandDispatcher d(drive, range, cfg);
  ASSERT_TRUE(d.start());

  const uint32_t t0 = millis();
  d.submit(MotionCommand::TURN_RIGHT);
  ASSERT_TRUE(waitFor([&]() { return drive.currentMotion() == MotionCommand::TURN_RIGHT; }));

  d.submit(MotionCommand::STOP);
  ASSERT_TRUE(waitFor([&]() { return d.lastExecuted() == MotionCommand::STOP && !d.busy(); }));

  EXPECT_LT(millis() - t0, 2000u);
  EXPECT_TRUE(drive.isStopped());
  EXPECT_TRUE(range.enabled());
  d.shutdown();
}

TEST_F(DispatcherTest, ThreadDrainsQueue) {
  CommandDispatcher d(drive, range, cfg);
  ASSERT_TRUE(d.start());
  EXPECT_TRUE(d.running());

  d.submit(MotionCommand::FORWARD);
  d.submit(MotionCommand::RIGHT_FORWARD);
  ASSERT_TRUE(waitFor([&]() { return d.lastExecuted() == MotionCommand::RIGHT_FORWARD; }));
  EXPECT_EQ(MotionCommand::RIGHT_FORWARD, drive.currentMotion());

  d.shutdown();
  EXPECT_FALSE(d.running());
}

TEST_F(DispatcherTest, ShutdownRejectsFurtherWork) {
  CommandDispatcher d(drive, range, cfg);
  ASSERT_TRUE(d.start());
  d.shutdown();
  d.shutdown();

  EXPECT_EQ(SubmitResult::REJECTED_STOPPED, d.submit(MotionCommand::FORWARD));
  EXPECT_EQ(SubmitResult::REJECTED_STOPPED, d.submit(MotionCommand::STOP));
  EXPECT_EQ(0u, d.pending());
}

TEST_F(DispatcherTest, ShutdownEndsRotationHold) {
  cfg.rotation_hold_ms = 5000;
  CommandDispatcher d(drive, range, cfg);
  ASSERT_TRUE(d.start());

  d.submit(MotionCommand::TURN_LEFT);
  ASSERT_TRUE(waitFor([&]() { return drive.currentMotion() == MotionCommand::TURN_LEFT; }));

  const uint32_t t0 = millis();
  d.shutdown();
  EXPECT_LT(millis() - t0, 2000u);
  EXPECT_TRUE(drive.isStopped());
  EXPECT_TRUE(range.enabled());
}

TEST_F(DispatcherTest, ObstacleStopDrainsLikeStop) {
  CommandDispatcher d(drive, range, cfg);
  d.submit(MotionCommand::FORWARD, 0);
  d.submit(MotionCommand::LEFT, 0);

  EXPECT_EQ(SubmitResult::ACCEPTED, d.submitObstacleStop(100));
  const std::vector<MotionCommand> q = d.pendingSnapshot();
  ASSERT_EQ(1u, q.size());
  EXPECT_EQ(MotionCommand::STOP, q[0]);
}

TEST_F(DispatcherTest, ObstacleStopYieldsToGracePeriod) {
  CommandDispatcher d(drive, range, cfg);
  d.submit(MotionCommand::BACK, 1000);

  EXPECT_EQ(SubmitResult::GRACE_PENDING, d.submitObstacleStop(1500));
  EXPECT_EQ(1u, d.pending());
  EXPECT_TRUE(d.gracePending(1500));

  EXPECT_EQ(SubmitResult::ACCEPTED, d.submitObstacleStop(3100));
}

TEST_F(DispatcherTest, ObstacleStopYieldsToRunningRotation) {
  cfg.rotation_hold_ms = 5000;
  CommandDispatcher d(drive, range, cfg);
  ASSERT_TRUE(d.start());

  d.submit(MotionCommand::TURN_LEFT);
  // busy and detection-off are set together when the turn is taken
  ASSERT_TRUE(waitFor([&]() { return d.busy(); }));

  EXPECT_EQ(SubmitResult::DETECTION_OFF, d.submitObstacleStop(millis()));
  EXPECT_EQ(0u, d.pending());
  EXPECT_TRUE(waitFor([&]() { return drive.currentMotion() == MotionCommand::TURN_LEFT; }));

  d.shutdown();
  EXPECT_TRUE(range.enabled());
}

TEST_F(DispatcherTest, ObstacleStopRejectedAfterShutdown) {
  CommandDispatcher d(drive, range, cfg);
  d.shutdown();
  EXPECT_EQ(SubmitResult::REJECTED_STOPPED, d.submitObstacleStop(0));
}
