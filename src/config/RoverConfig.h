#pragma once

#include <iosfwd>
#include <stdint.h>
#include <string>

#include "Params.h"
#include "Pins.h"
#include "control/CommandDispatcher.h"
#include "control/SafetyMonitor.h"
#include "drive/Drivetrain.h"
#include "utils/Log.h"

/*
===============================================================================
  RoverConfig.h
===============================================================================

  PURPOSE
  -------
  Runtime configuration. Starts from the compile-time defaults in Params.h /
  Pins.h; an optional JSON file overrides individual values.

  File format (every key optional, unknown keys ignored):

    {
      "gpio_chip": "gpiochip0",
      "pwm_hz": 100,
      "min_speed": 30,
      "default_speed": 50,
      "obstacle_base_cm": 10.0,
      "obstacle_speed_factor": 0.4,
      "grace_ms": 2000,
      "rotation_hold_ms": 1000,
      "monitor_period_ms": 100,
      "echo_timeout_us": 30000,
      "distance_buffer_size": 5,
      "temperature_c": 20.0,
      "speed_store_path": "rover_speed.json",
      "link_timeout_ms": 0,
      "log_level": "info",
      "calibration": {"left_front": 1.0, "left_back": 1.0,
                      "right_front": 0.95, "right_back": 1.0}
    }
===============================================================================
*/

struct RoverConfig {
  std::string gpio_chip = GPIO_CHIP_NAME;
  uint16_t pwm_hz = PWM_FREQUENCY_HZ;

  DrivetrainConfig drive = defaultDrivetrainConfig();
  DispatcherConfig dispatch;
  SafetyConfig safety;

  uint8_t trig_pin = PIN_ULTRASONIC_TRIG;
  uint8_t echo_pin = PIN_ULTRASONIC_ECHO;
  uint32_t echo_timeout_us = ECHO_TIMEOUT_US;
  uint8_t distance_buffer_size = DISTANCE_BUFFER_SIZE;
  float temperature_c = DEFAULT_TEMPERATURE_C;

  std::string speed_store_path = SPEED_STORE_PATH;
  uint32_t link_timeout_ms = LINK_TIMEOUT_MS;
  LogLevel log_level = LogLevel::LVL_INFO;
};

/*
  Overrides cfg from a JSON document.

  Returns:
    - true if the document parsed (values out of range are clamped + logged)
    - false on malformed JSON or a non-object root; cfg is left untouched
*/
bool parseRoverConfig(std::istream& in, RoverConfig& cfg);

// Same, from a file. A missing file is an error here (it was asked for).
bool loadRoverConfig(const char* path, RoverConfig& cfg);
