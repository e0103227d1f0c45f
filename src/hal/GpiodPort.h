#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "Params.h"
#include "Pins.h"
#include "hal/GpioPort.h"

struct gpiod_chip;
struct gpiod_line;

/*
===============================================================================
  GpiodPort.h
===============================================================================

  PURPOSE
  -------
  GpioPort backend on the Linux GPIO character device (libgpiod v1 API).

  Responsibilities:
    - Open the GPIO chip and request lines on pinMode()
    - Plain digital read/write on requested lines
    - Software PWM for PWM-mode lines (one thread drives all channels,
      same scheme as RPi.GPIO software PWM at 100 Hz)
    - release(): stop PWM, drive outputs low, free lines, close the chip

  Notes:
    - begin() must succeed before any pinMode() call
    - Software PWM jitter is a few tens of microseconds; fine for L298N EN pins
===============================================================================
*/

class GpiodPort : public GpioPort {
public:
  explicit GpiodPort(const char* chip_name = GPIO_CHIP_NAME,
                     uint16_t pwm_hz = PWM_FREQUENCY_HZ);
  ~GpiodPort() override;

  // Opens the chip. Returns false (and logs) when the device is missing.
  bool begin();

  bool pinMode(uint8_t pin, PinMode mode) override;
  void digitalWrite(uint8_t pin, bool high) override;
  bool digitalRead(uint8_t pin) override;
  void pwmWrite(uint8_t pin, float duty_pct) override;
  uint32_t micros() override;
  void delayMicroseconds(uint32_t us) override;
  void release() override;

private:
  struct Line {
    gpiod_line* line = nullptr;
    PinMode mode = PinMode::INPUT;
  };

  struct PwmChannel {
    uint8_t pin = 0;
    gpiod_line* line = nullptr;
    float duty_pct = 0.0f;
  };

  gpiod_line* lineFor_(uint8_t pin);
  void startPwm_();
  void stopPwm_();
  void pwmLoop_();

  std::string _chip_name;
  gpiod_chip* _chip = nullptr;

  std::mutex _lines_mutex;
  std::map<uint8_t, Line> _lines;

  std::mutex _pwm_mutex;
  std::vector<PwmChannel> _pwm;
  std::thread _pwm_thread;
  std::atomic<bool> _pwm_running;
  uint32_t _pwm_period_us;
};
