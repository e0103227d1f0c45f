#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "FakeGpioPort.h"
#include "Pins.h"
#include "control/ManeuverRunner.h"
#include "utils/Clock.h"

namespace {

class ManeuverRunnerTest : public ::testing::Test {
protected:
  ManeuverRunnerTest()
  : port(PIN_ULTRASONIC_TRIG, PIN_ULTRASONIC_ECHO),
    drive(port, defaultDrivetrainConfig()),
    range(port, PIN_ULTRASONIC_TRIG, PIN_ULTRASONIC_ECHO),
    dispatcher(drive, range, dispatchConfig())
  {}

  static DispatcherConfig dispatchConfig() {
    DispatcherConfig cfg;
    cfg.rotation_hold_ms = 20;
    return cfg;
  }

  void SetUp() override {
    ASSERT_TRUE(drive.begin());
    ASSERT_TRUE(range.begin());
    dispatcher.setExecutedHook([this](MotionCommand c) {
      std::lock_guard<std::mutex> lock(seen_mutex);
      seen.push_back(c);
    });
    ASSERT_TRUE(dispatcher.start());
  }

  void TearDown() override {
    dispatcher.shutdown();
  }

  std::vector<MotionCommand> executed() {
    std::lock_guard<std::mutex> lock(seen_mutex);
    return seen;
  }

  template <typename Pred>
  static bool waitFor(Pred pred, uint32_t timeout_ms = 3000) {
    const uint32_t until = millis() + timeout_ms;
    while (!pred()) {
      if ((int32_t)(millis() - until) >= 0) return false;
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
  }

  FakeGpioPort port;
  Drivetrain drive;
  RangeSensor range;
  CommandDispatcher dispatcher;

  std::mutex seen_mutex;
  std::vector<MotionCommand> seen;
};

}  // namespace

TEST(ManeuverCatalog, BuiltInsExist) {
  const char* names[] = {"digit_0", "digit_1", "digit_2", "digit_3", "digit_4",
                         "digit_5", "digit_6", "digit_7", "digit_8", "digit_9",
                         "crab_walk", "box_step", "s_curve", "z_curve", "spin_fast"};
  for (size_t i = 0; i < sizeof(names) / sizeof(names[0]); ++i) {
    const Maneuver* m = findManeuver(names[i]);
    ASSERT_NE(nullptr, m) << names[i];
    EXPECT_FALSE(m->steps.empty());
  }
  EXPECT_EQ(nullptr, findManeuver("moonwalk"));
  EXPECT_EQ(nullptr, findManeuver(nullptr));
  EXPECT_EQ("digit_0, digit_1, digit_2, digit_3, digit_4, digit_5, digit_6, digit_7, "
            "digit_8, digit_9, crab_walk, box_step, s_curve, z_curve, spin_fast",
            maneuverNames());
}

TEST(ManeuverCatalog, BoxStepTracesFourSides) {
  const Maneuver* m = findManeuver("box_step");
  ASSERT_NE(nullptr, m);
  const MotionCommand sides[] = {MotionCommand::FORWARD, MotionCommand::LEFT,
                                 MotionCommand::BACK, MotionCommand::RIGHT};
  ASSERT_EQ(4u, m->steps.size());
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_EQ(sides[i], m->steps[i].cmd);
    EXPECT_EQ(1500u, m->steps[i].duration_ms);
  }
}

TEST(ManeuverCatalog, CrabWalkWigglesFiveTimes) {
  const Maneuver* m = findManeuver("crab_walk");
  ASSERT_NE(nullptr, m);
  ASSERT_EQ(10u, m->steps.size());
  for (size_t i = 0; i < 10; ++i) {
    EXPECT_EQ(i % 2 == 0 ? MotionCommand::LEFT : MotionCommand::RIGHT, m->steps[i].cmd);
    EXPECT_EQ(400u, m->steps[i].duration_ms);
  }
}

TEST(ManeuverCatalog, CurvesAndSpinUseRotations) {
  const Maneuver* s = findManeuver("s_curve");
  ASSERT_NE(nullptr, s);
  ASSERT_EQ(5u, s->steps.size());
  EXPECT_EQ(MotionCommand::TURN_LEFT, s->steps[1].cmd);
  EXPECT_EQ(MotionCommand::TURN_RIGHT, s->steps[3].cmd);

  const Maneuver* z = findManeuver("z_curve");
  ASSERT_NE(nullptr, z);
  ASSERT_EQ(5u, z->steps.size());
  EXPECT_EQ(MotionCommand::TURN_RIGHT, z->steps[1].cmd);
  EXPECT_EQ(MotionCommand::TURN_LEFT, z->steps[3].cmd);

  const Maneuver* spin = findManeuver("spin_fast");
  ASSERT_NE(nullptr, spin);
  ASSERT_EQ(6u, spin->steps.size());
  for (size_t i = 0; i < spin->steps.size(); ++i) {
    EXPECT_TRUE(isRotation(spin->steps[i].cmd));
  }
}

TEST_F(ManeuverRunnerTest, RunsStepsAndEndsWithStop) {
  Maneuver m;
  m.name = "test";
  m.steps.push_back(ManeuverStep{MotionCommand::FORWARD, 30});
  m.steps.push_back(ManeuverStep{MotionCommand::LEFT, 30});

  ManeuverRunner runner(dispatcher);
  ASSERT_TRUE(runner.start(m));
  EXPECT_TRUE(runner.active());
  EXPECT_EQ("test", runner.current());

  ASSERT_TRUE(waitFor([&]() { return !runner.active(); }));
  ASSERT_TRUE(waitFor([&]() { return executed().size() >= 3; }));

  const std::vector<MotionCommand> got = executed();
  ASSERT_EQ(3u, got.size());
  EXPECT_EQ(MotionCommand::FORWARD, got[0]);
  EXPECT_EQ(MotionCommand::LEFT, got[1]);
  EXPECT_EQ(MotionCommand::STOP, got[2]);
  EXPECT_TRUE(drive.isStopped());
  EXPECT_EQ("", runner.current());
}

TEST_F(ManeuverRunnerTest, OnlyOneAtATime) {
  Maneuver m;
  m.name = "long";
  m.steps.push_back(ManeuverStep{MotionCommand::FORWARD, 5000});

  ManeuverRunner runner(dispatcher);
  ASSERT_TRUE(runner.start(m));
  EXPECT_FALSE(runner.start("crab_walk"));
  EXPECT_TRUE(runner.stop());
  EXPECT_FALSE(runner.active());
}

TEST_F(ManeuverRunnerTest, StopCancelsAndStopsTheRover) {
  Maneuver m;
  m.name = "long";
  m.steps.push_back(ManeuverStep{MotionCommand::FORWARD, 5000});
  m.steps.push_back(ManeuverStep{MotionCommand::BACK, 5000});

  ManeuverRunner runner(dispatcher);
  ASSERT_TRUE(runner.start(m));
  ASSERT_TRUE(waitFor([&]() { return drive.currentMotion() == MotionCommand::FORWARD; }));

  const uint32_t t0 = millis();
  EXPECT_TRUE(runner.stop());
  EXPECT_LT(millis() - t0, 2000u);

  ASSERT_TRUE(waitFor([&]() { return dispatcher.lastExecuted() == MotionCommand::STOP; }));
  EXPECT_TRUE(drive.isStopped());
  EXPECT_FALSE(runner.stop());

  for (MotionCommand c : executed()) EXPECT_NE(MotionCommand::BACK, c);
}

TEST_F(ManeuverRunnerTest, RefusesUnknownOrEmpty) {
  ManeuverRunner runner(dispatcher);
  EXPECT_FALSE(runner.start("moonwalk"));

  Maneuver empty;
  empty.name = "empty";
  EXPECT_FALSE(runner.start(empty));
  EXPECT_FALSE(runner.active());
}

TEST_F(ManeuverRunnerTest, AbortsWhenDispatcherIsDown) {
  dispatcher.shutdown();

  Maneuver m;
  m.name = "late";
  m.steps.push_back(ManeuverStep{MotionCommand::FORWARD, 10});

  ManeuverRunner runner(dispatcher);
  ASSERT_TRUE(runner.start(m));
  ASSERT_TRUE(waitFor([&]() { return !runner.active(); }));
  EXPECT_TRUE(drive.isStopped());
}

TEST_F(ManeuverRunnerTest, ConcurrentStartsLaunchOnlyOne) {
  Maneuver m;
  m.name = "long";
  m.steps.push_back(ManeuverStep{MotionCommand::FORWARD, 5000});

  ManeuverRunner runner(dispatcher);
  for (int round = 0; round < 20; ++round) {
    std::atomic<int> started(0);
    std::atomic<bool> go(false);
    std::vector<std::thread> callers;
    for (int i = 0; i < 4; ++i) {
      callers.push_back(std::thread([&]() {
        while (!go.load()) std::this_thread::yield();
        if (runner.start(m)) started++;
      }));
    }
    go.store(true);
    for (size_t i = 0; i < callers.size(); ++i) callers[i].join();

    EXPECT_EQ(1, started.load());
    EXPECT_TRUE(runner.active());

    std::atomic<int> stopped(0);
    go.store(false);
    callers.clear();
    for (int i = 0; i < 4; ++i) {
      callers.push_back(std::thread([&]() {
        while (!go.load()) std::this_thread::yield();
        if (runner.stop()) stopped++;
      }));
    }
    go.store(true);
    for (size_t i = 0; i < callers.size(); ++i) callers[i].join();

    EXPECT_EQ(1, stopped.load());
    EXPECT_FALSE(runner.active());
  }
}
