#pragma once

#include <stdint.h>

/*
===============================================================================
  GpioPort.h
===============================================================================

  PURPOSE
  -------
  Owned handle on every GPIO line and PWM channel the rover uses.

  The drive and sensor classes only ever talk to hardware through this
  interface, with Arduino-style calls (pinMode / digitalWrite / ...), so the
  same code runs on the libgpiod backend (hal/GpiodPort.h) and on the
  scripted fake used by the tests.

  Pins are BCM line offsets on the GPIO chip.
===============================================================================
*/

enum class PinMode : uint8_t {
  INPUT = 0,
  OUTPUT,
  PWM,      // output driven by the port's PWM engine, duty set by pwmWrite()
};

class GpioPort {
public:
  virtual ~GpioPort() {}

  // Claims the line. Returns false if the line (or PWM channel) is unavailable.
  virtual bool pinMode(uint8_t pin, PinMode mode) = 0;

  virtual void digitalWrite(uint8_t pin, bool high) = 0;
  virtual bool digitalRead(uint8_t pin) = 0;

  // duty_pct in [0, 100]; 0 holds the line low
  virtual void pwmWrite(uint8_t pin, float duty_pct) = 0;

  // Monotonic microsecond counter used for echo timing (wraps at 32 bits)
  virtual uint32_t micros() = 0;
  virtual void delayMicroseconds(uint32_t us) = 0;

  // Drives every claimed output low and gives the lines back. Idempotent.
  virtual void release() = 0;
};
