#include "hal/GpiodPort.h"

#include <gpiod.h>

#include <algorithm>
#include <chrono>
#include <errno.h>
#include <string.h>

#include "utils/Clock.h"
#include "utils/Log.h"

/*
===============================================================================
  GpiodPort.cpp
===============================================================================

  Software PWM cycle (period = 1 / pwm_hz):
    t = 0        -> every channel with duty > 0 goes HIGH
    t = duty * T -> that channel goes LOW (skipped at 100 %)
    t = T        -> next cycle

  Duty changes are picked up at the start of the next cycle.
===============================================================================
*/

static const char* TAG = "Gpio";
static const char* CONSUMER = "rover";

using SteadyClock = std::chrono::steady_clock;

GpiodPort::GpiodPort(const char* chip_name, uint16_t pwm_hz)
: _chip_name(chip_name ? chip_name : GPIO_CHIP_NAME),
  _pwm_running(false)
{
  if (pwm_hz == 0) pwm_hz = PWM_FREQUENCY_HZ;
  _pwm_period_us = 1000000UL / pwm_hz;
}

GpiodPort::~GpiodPort() {
  release();
}

bool GpiodPort::begin() {
  if (_chip) return true;

  _chip = gpiod_chip_open_by_name(_chip_name.c_str());
  if (!_chip) {
    LOG_E(TAG, "cannot open %s: %s", _chip_name.c_str(), strerror(errno));
    return false;
  }

  LOG_I(TAG, "opened %s, software PWM period %lu us",
        _chip_name.c_str(), (unsigned long)_pwm_period_us);
  return true;
}

bool GpiodPort::pinMode(uint8_t pin, PinMode mode) {
  if (!_chip) {
    LOG_E(TAG, "pinMode(%u) before begin()", (unsigned)pin);
    return false;
  }

  std::lock_guard<std::mutex> lock(_lines_mutex);

  if (_lines.count(pin)) {
    LOG_E(TAG, "line %u requested twice", (unsigned)pin);
    return false;
  }

  gpiod_line* line = gpiod_chip_get_line(_chip, pin);
  if (!line) {
    LOG_E(TAG, "line %u not found on %s", (unsigned)pin, _chip_name.c_str());
    return false;
  }

  int rc;
  if (mode == PinMode::INPUT) {
    rc = gpiod_line_request_input(line, CONSUMER);
  } else {
    // Outputs and PWM channels start low
    rc = gpiod_line_request_output(line, CONSUMER, 0);
  }

  if (rc < 0) {
    LOG_E(TAG, "request line %u failed: %s", (unsigned)pin, strerror(errno));
    return false;
  }

  Line entry;
  entry.line = line;
  entry.mode = mode;
  _lines[pin] = entry;

  if (mode == PinMode::PWM) {
    {
      std::lock_guard<std::mutex> pwm_lock(_pwm_mutex);
      PwmChannel ch;
      ch.pin = pin;
      ch.line = line;
      ch.duty_pct = 0.0f;
      _pwm.push_back(ch);
    }
    startPwm_();
  }

  return true;
}

gpiod_line* GpiodPort::lineFor_(uint8_t pin) {
  std::lock_guard<std::mutex> lock(_lines_mutex);
  std::map<uint8_t, Line>::iterator it = _lines.find(pin);
  if (it == _lines.end()) return nullptr;
  return it->second.line;
}

void GpiodPort::digitalWrite(uint8_t pin, bool high) {
  gpiod_line* line = lineFor_(pin);
  if (!line) {
    LOG_E(TAG, "digitalWrite on unclaimed line %u", (unsigned)pin);
    return;
  }
  if (gpiod_line_set_value(line, high ? 1 : 0) < 0) {
    LOG_E(TAG, "set line %u failed: %s", (unsigned)pin, strerror(errno));
  }
}

bool GpiodPort::digitalRead(uint8_t pin) {
  gpiod_line* line = lineFor_(pin);
  if (!line) return false;

  // A read error looks like a low line; the caller's edge timeout handles it
  return gpiod_line_get_value(line) == 1;
}

void GpiodPort::pwmWrite(uint8_t pin, float duty_pct) {
  if (duty_pct < 0.0f) duty_pct = 0.0f;
  if (duty_pct > 100.0f) duty_pct = 100.0f;

  std::lock_guard<std::mutex> lock(_pwm_mutex);
  for (size_t i = 0; i < _pwm.size(); ++i) {
    if (_pwm[i].pin == pin) {
      _pwm[i].duty_pct = duty_pct;
      return;
    }
  }
  LOG_E(TAG, "pwmWrite on line %u which is not a PWM channel", (unsigned)pin);
}

uint32_t GpiodPort::micros() {
  return ::micros();
}

void GpiodPort::delayMicroseconds(uint32_t us) {
  // Trigger pulses are a few microseconds; sleeping would overshoot by ~60 us
  if (us < 1000) {
    const SteadyClock::time_point until = SteadyClock::now() + std::chrono::microseconds(us);
    while (SteadyClock::now() < until) {
    }
    return;
  }
  std::this_thread::sleep_for(std::chrono::microseconds(us));
}

void GpiodPort::startPwm_() {
  if (_pwm_running.exchange(true)) return;
  _pwm_thread = std::thread(&GpiodPort::pwmLoop_, this);
}

void GpiodPort::stopPwm_() {
  if (!_pwm_running.exchange(false)) return;
  if (_pwm_thread.joinable()) _pwm_thread.join();
}

void GpiodPort::pwmLoop_() {
  std::vector<PwmChannel> snapshot;
  const std::chrono::microseconds period(_pwm_period_us);

  while (_pwm_running.load()) {
    {
      std::lock_guard<std::mutex> lock(_pwm_mutex);
      snapshot = _pwm;
    }

    // Order by on-time so one pass turns channels off in sequence
    std::sort(snapshot.begin(), snapshot.end(),
              [](const PwmChannel& a, const PwmChannel& b) { return a.duty_pct < b.duty_pct; });

    const SteadyClock::time_point cycle_start = SteadyClock::now();

    for (size_t i = 0; i < snapshot.size(); ++i) {
      gpiod_line_set_value(snapshot[i].line, snapshot[i].duty_pct > 0.0f ? 1 : 0);
    }

    for (size_t i = 0; i < snapshot.size(); ++i) {
      const float duty = snapshot[i].duty_pct;
      if (duty <= 0.0f || duty >= 100.0f) continue;

      const std::chrono::microseconds on_time((long)(duty * 0.01f * (float)_pwm_period_us));
      std::this_thread::sleep_until(cycle_start + on_time);
      gpiod_line_set_value(snapshot[i].line, 0);
    }

    std::this_thread::sleep_until(cycle_start + period);
  }

  // Leave every channel low when the engine stops
  for (size_t i = 0; i < snapshot.size(); ++i) {
    gpiod_line_set_value(snapshot[i].line, 0);
  }
}

void GpiodPort::release() {
  stopPwm_();

  {
    std::lock_guard<std::mutex> lock(_pwm_mutex);
    _pwm.clear();
  }

  std::lock_guard<std::mutex> lock(_lines_mutex);
  for (std::map<uint8_t, Line>::iterator it = _lines.begin(); it != _lines.end(); ++it) {
    if (it->second.mode != PinMode::INPUT) {
      gpiod_line_set_value(it->second.line, 0);
    }
    gpiod_line_release(it->second.line);
  }
  _lines.clear();

  if (_chip) {
    gpiod_chip_close(_chip);
    _chip = nullptr;
    LOG_I(TAG, "released %s", _chip_name.c_str());
  }
}
