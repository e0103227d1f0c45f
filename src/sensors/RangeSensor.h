#pragma once

#include <atomic>
#include <mutex>
#include <stdint.h>

#include "Params.h"
#include "hal/GpioPort.h"

/*
===============================================================================
  RangeSensor.h
===============================================================================

  PURPOSE
  -------
  HC-SR04 driver with temperature compensation and a median filter.

  Responsibilities:
    - Trigger a ping and time the echo with bounded busy-waits
    - Convert round-trip time to cm using c(T) = 331.3 + 0.606 * T
    - Keep the last N raw readings in a ring buffer, report their median
    - Honour the detection enable flag (disabled => no hardware access; a
      ping that completes after it was switched off reports DISABLED)

  measure() blocks for up to two echo timeouts. Call it from the monitor
  thread only, never from the dispatch thread or the host loop.
===============================================================================
*/

class RangeSensor {
public:
  enum class Status : uint8_t {
    OK = 0,
    FAILED,     // echo edge timed out; filter history kept
    DISABLED,   // detection switched off, nothing measured
  };

  struct Sample {
    Status status = Status::FAILED;
    float distance_cm = -1.0f;   // filtered, only meaningful when status == OK

    bool valid() const { return status == Status::OK; }
  };

  struct State {
    float distance_cm = -1.0f;   // last filtered distance (-1 if none yet)
    float raw_cm = -1.0f;        // last raw reading (-1 if the last ping failed)
    bool  valid = false;         // last measure() returned OK
    bool  enabled = true;
    uint32_t last_update_ms = 0;
    uint32_t failures = 0;       // total echo timeouts since begin()
    uint8_t  samples = 0;        // readings currently in the filter window
  };

  RangeSensor(GpioPort& port,
              uint8_t trig_pin,
              uint8_t echo_pin,
              uint32_t timeout_us = ECHO_TIMEOUT_US,
              uint8_t buffer_size = DISTANCE_BUFFER_SIZE,
              float temp_c = DEFAULT_TEMPERATURE_C);

  // Claims TRIG (output, low) and ECHO (input). false = hardware unavailable.
  bool begin();

  Sample measure(uint32_t now_ms);

  void setEnabled(bool enabled) { _enabled.store(enabled); }
  bool enabled() const { return _enabled.load(); }

  void setTemperatureC(float temp_c);
  float temperatureC() const;

  // Drops the filter history (e.g. after the sensor was re-aimed)
  void clearHistory();

  State getState() const;

  uint8_t bufferSize() const { return _buffer_size; }

  // m/s at temp_c
  static float speedOfSoundMps(float temp_c) {
    return SOUND_SPEED_0C_MPS + SOUND_SPEED_PER_C * temp_c;
  }

  // Round-trip echo time -> one-way distance in cm
  static float echoToCm(uint32_t echo_us, float temp_c) {
    return (float)echo_us * 1e-6f * speedOfSoundMps(temp_c) * 0.5f * 100.0f;
  }

private:
  bool ping_(uint32_t& echo_us, const char*& failed_edge);
  bool waitForEcho_(bool level, uint32_t since_us, uint32_t& edge_us);
  float push_(float cm);
  float median_() const;

  GpioPort& _port;

  uint8_t _trig_pin;
  uint8_t _echo_pin;
  uint32_t _timeout_us;
  uint8_t _buffer_size;
  float _temp_c;

  std::atomic<bool> _enabled;

  // Ring buffer of raw readings (guarded by _mutex)
  float _buf[DISTANCE_BUFFER_MAX];
  uint8_t _head = 0;
  uint8_t _count = 0;

  // Consecutive failures, used to log a timeout streak once
  uint32_t _fail_streak = 0;

  State _state;

  // Held for a whole ping so two callers never interleave trigger pulses
  std::mutex _ping_mutex;

  // Guards buffer, state and temperature (short critical sections only)
  mutable std::mutex _mutex;
};
