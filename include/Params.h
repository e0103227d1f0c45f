#pragma once
#include <stddef.h>
#include <stdint.h>

/*
  Params.h

  Purpose:
  Central location for rover constants and tunable parameters.
  Everything here is a compile-time default; the runtime config file
  (see config/RoverConfig.h) can override the tuned values.

  Convention:
  - Distances: centimeters (cm)
  - Speeds: percent of full PWM duty (0..100)
  - Times: milliseconds (ms) unless the name ends in _US
  - Temperatures: degrees Celsius
*/

/* ============================================================================
   DRIVE / SPEED
============================================================================ */

// Below this duty the L298N + TT motors stall under load
constexpr int MIN_SPEED_LIMIT = 30;
constexpr int MAX_SPEED_LIMIT = 100;

// Used when the speed store is missing or unreadable
constexpr int DEFAULT_SPEED = 50;

// Software PWM frequency on the EN pins
constexpr uint16_t PWM_FREQUENCY_HZ = 100;

// Per-wheel calibration multipliers, [0, 1]
// Trim the faster wheels down until the rover tracks straight.
constexpr float CAL_LEFT_FRONT  = 1.0f;
constexpr float CAL_LEFT_BACK   = 1.0f;
constexpr float CAL_RIGHT_FRONT = 1.0f;
constexpr float CAL_RIGHT_BACK  = 1.0f;

/* ============================================================================
   ULTRASONIC SENSOR (HC-SR04)
============================================================================ */

// Ambient temperature used for the speed of sound
constexpr float DEFAULT_TEMPERATURE_C = 20.0f;

// Speed of sound model: c(T) = 331.3 + 0.606 * T  [m/s]
constexpr float SOUND_SPEED_0C_MPS = 331.3f;
constexpr float SOUND_SPEED_PER_C  = 0.606f;

// Max wait for each echo edge
constexpr uint32_t ECHO_TIMEOUT_US = 30000UL;   // 30 ms

// Median filter window
constexpr uint8_t DISTANCE_BUFFER_SIZE = 5;
constexpr uint8_t DISTANCE_BUFFER_MAX  = 15;

/* ============================================================================
   SAFETY / OBSTACLE AVOIDANCE
============================================================================ */

// threshold_cm = OBSTACLE_BASE_DISTANCE_CM + speed * OBSTACLE_SPEED_FACTOR
constexpr float OBSTACLE_BASE_DISTANCE_CM = 10.0f;
constexpr float OBSTACLE_SPEED_FACTOR     = 0.4f;   // cm per speed percent

// Monitor is suppressed this long after a "back" command
constexpr uint32_t GRACE_PERIOD_MS = 2000;

/* ============================================================================
   TASK RATES / TIMING
============================================================================ */

constexpr uint32_t MONITOR_PERIOD_MS = 100;
constexpr uint32_t ROTATION_HOLD_MS  = 1000;

constexpr uint16_t LINK_UPDATE_HZ      = 100;
constexpr uint16_t TELEMETRY_UPDATE_HZ = 5;

// 0 disables the link watchdog (motions stay open-loop)
constexpr uint32_t LINK_TIMEOUT_MS = 0;

/* ============================================================================
   HOST LINK / PERSISTENCE
============================================================================ */

constexpr uint16_t LINK_LINE_BUFFER_BYTES = 512;
constexpr size_t   LINK_JSON_DOC_BYTES    = 512;
constexpr size_t   CONFIG_JSON_DOC_BYTES  = 4096;
constexpr size_t   STORE_JSON_DOC_BYTES   = 256;

#define SPEED_STORE_PATH "rover_speed.json"

/* ============================================================================
   BRING-UP
============================================================================ */

// Duty steps used by --bringup, held BRINGUP_STEP_MS each
constexpr int BRINGUP_DUTY_STEPS[] = {30, 60, 100};
constexpr uint32_t BRINGUP_STEP_MS = 1500;
