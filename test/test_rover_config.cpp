#include <gtest/gtest.h>

#include <sstream>

#include "TempDir.h"
#include "config/RoverConfig.h"

TEST(RoverConfig, DefaultsComeFromParams) {
  RoverConfig cfg;
  EXPECT_EQ(GPIO_CHIP_NAME, cfg.gpio_chip);
  EXPECT_EQ(MIN_SPEED_LIMIT, cfg.drive.min_speed);
  EXPECT_EQ(DEFAULT_SPEED, cfg.drive.initial_speed);
  EXPECT_EQ(GRACE_PERIOD_MS, cfg.dispatch.grace_ms);
  EXPECT_EQ(ROTATION_HOLD_MS, cfg.dispatch.rotation_hold_ms);
  EXPECT_FLOAT_EQ(OBSTACLE_BASE_DISTANCE_CM, cfg.safety.base_cm);
  EXPECT_FLOAT_EQ(OBSTACLE_SPEED_FACTOR, cfg.safety.speed_factor);
  EXPECT_EQ(MONITOR_PERIOD_MS, cfg.safety.period_ms);
  EXPECT_EQ(DISTANCE_BUFFER_SIZE, cfg.distance_buffer_size);
  EXPECT_EQ(PIN_LF_IN_A, cfg.drive.wheels[(uint8_t)WheelRole::LEFT_FRONT].pin_a);
  EXPECT_EQ(PIN_RB_EN, cfg.drive.wheels[(uint8_t)WheelRole::RIGHT_BACK].pin_en);
}

TEST(RoverConfig, OverridesOnlyTheKeysGiven) {
  std::istringstream in(
    "{\"grace_ms\": 3000, \"obstacle_speed_factor\": 0.5, \"temperature_c\": 5.5,"
    " \"gpio_chip\": \"gpiochip4\", \"log_level\": \"debug\"}");

  RoverConfig cfg;
  ASSERT_TRUE(parseRoverConfig(in, cfg));
  EXPECT_EQ(3000u, cfg.dispatch.grace_ms);
  EXPECT_FLOAT_EQ(0.5f, cfg.safety.speed_factor);
  EXPECT_FLOAT_EQ(5.5f, cfg.temperature_c);
  EXPECT_EQ("gpiochip4", cfg.gpio_chip);
  EXPECT_EQ(LogLevel::LVL_DEBUG, cfg.log_level);

  EXPECT_EQ(ROTATION_HOLD_MS, cfg.dispatch.rotation_hold_ms);
  EXPECT_FLOAT_EQ(OBSTACLE_BASE_DISTANCE_CM, cfg.safety.base_cm);
}

TEST(RoverConfig, CalibrationIsReadPerWheelAndClamped) {
  std::istringstream in(
    "{\"calibration\": {\"right_front\": 0.92, \"left_back\": 1.4}}");

  RoverConfig cfg;
  ASSERT_TRUE(parseRoverConfig(in, cfg));
  EXPECT_FLOAT_EQ(0.92f, cfg.drive.wheels[(uint8_t)WheelRole::RIGHT_FRONT].calibration);
  EXPECT_FLOAT_EQ(1.0f, cfg.drive.wheels[(uint8_t)WheelRole::LEFT_BACK].calibration);
  EXPECT_FLOAT_EQ(1.0f, cfg.drive.wheels[(uint8_t)WheelRole::LEFT_FRONT].calibration);
}

TEST(RoverConfig, OutOfRangeValuesAreIgnored) {
  std::istringstream in(
    "{\"distance_buffer_size\": 40, \"min_speed\": 150, \"pwm_hz\": 0,"
    " \"log_level\": \"chatty\"}");

  RoverConfig cfg;
  ASSERT_TRUE(parseRoverConfig(in, cfg));
  EXPECT_EQ(DISTANCE_BUFFER_SIZE, cfg.distance_buffer_size);
  EXPECT_EQ(MIN_SPEED_LIMIT, cfg.drive.min_speed);
  EXPECT_EQ(PWM_FREQUENCY_HZ, cfg.pwm_hz);
  EXPECT_EQ(LogLevel::LVL_INFO, cfg.log_level);
}

TEST(RoverConfig, MalformedDocumentLeavesConfigUntouched) {
  RoverConfig cfg;
  cfg.dispatch.grace_ms = 1234;

  std::istringstream broken("{\"grace_ms\": 3000,");
  EXPECT_FALSE(parseRoverConfig(broken, cfg));
  EXPECT_EQ(1234u, cfg.dispatch.grace_ms);

  std::istringstream array("[1, 2, 3]");
  EXPECT_FALSE(parseRoverConfig(array, cfg));
  EXPECT_EQ(1234u, cfg.dispatch.grace_ms);
}

TEST(RoverConfig, LoadsFromFile) {
  TempDir dir;
  const std::string path = dir.write("rover.json",
    "{\"link_timeout_ms\": 500, \"speed_store_path\": \"/var/lib/rover/speed.json\"}");

  RoverConfig cfg;
  ASSERT_TRUE(loadRoverConfig(path.c_str(), cfg));
  EXPECT_EQ(500u, cfg.link_timeout_ms);
  EXPECT_EQ("/var/lib/rover/speed.json", cfg.speed_store_path);
}

TEST(RoverConfig, MissingFileIsAnError) {
  RoverConfig cfg;
  EXPECT_FALSE(loadRoverConfig("/nonexistent/rover.json", cfg));
  EXPECT_FALSE(loadRoverConfig(nullptr, cfg));
}
