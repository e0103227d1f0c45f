#include "actuators/WheelMotor.h"

/*
===============================================================================
  WheelMotor.cpp
===============================================================================

  L298N truth table (per channel):
    - IN_A=0, IN_B=0, EN=x   -> Coast
    - IN_A=1, IN_B=0, EN=PWM -> One direction
    - IN_A=0, IN_B=1, EN=PWM -> Opposite direction

  This implementation maps (invert = false):
    FORWARD -> IN_A HIGH, IN_B LOW
    BACK    -> IN_A LOW,  IN_B HIGH
    NEUTRAL -> coast()
  invert = true swaps IN_A/IN_B for FORWARD and BACK.
===============================================================================
*/

WheelMotor::WheelMotor(GpioPort& port,
                       uint8_t pin_a,
                       uint8_t pin_b,
                       uint8_t pin_en,
                       bool invert,
                       float calibration)
: _port(port),
  _pin_a(pin_a),
  _pin_b(pin_b),
  _pin_en(pin_en),
  _invert(invert),
  _calibration(calibration)
{
  if (_calibration < 0.0f) _calibration = 0.0f;
  if (_calibration > 1.0f) _calibration = 1.0f;
}

bool WheelMotor::begin() {
  if (!_port.pinMode(_pin_a, PinMode::OUTPUT)) return false;
  if (!_port.pinMode(_pin_b, PinMode::OUTPUT)) return false;
  if (!_port.pinMode(_pin_en, PinMode::PWM)) return false;

  // Safe default state at startup
  coast();
  return true;
}

void WheelMotor::pattern(WheelDir dir, bool invert, bool& a, bool& b) {
  switch (dir) {
    case WheelDir::FORWARD:
      a = true;
      b = false;
      break;
    case WheelDir::BACK:
      a = false;
      b = true;
      break;
    case WheelDir::NEUTRAL:
    default:
      a = false;
      b = false;
      return;
  }

  if (invert) {
    const bool tmp = a;
    a = b;
    b = tmp;
  }
}

float WheelMotor::dutyFor_(float speed_pct) const {
  if (speed_pct < 0.0f) speed_pct = 0.0f;
  if (speed_pct > 100.0f) speed_pct = 100.0f;
  return speed_pct * _calibration;
}

void WheelMotor::drive(WheelDir dir, float speed_pct) {
  if (dir == WheelDir::NEUTRAL) {
    coast();
    return;
  }

  bool a = false;
  bool b = false;
  pattern(dir, _invert, a, b);

  // Duty first to zero so a direction flip never runs at the old speed backwards
  _port.pwmWrite(_pin_en, 0.0f);
  _port.digitalWrite(_pin_a, a);
  _port.digitalWrite(_pin_b, b);

  _dir = dir;
  _duty_cmd = dutyFor_(speed_pct);
  _port.pwmWrite(_pin_en, _duty_cmd);
}

void WheelMotor::setSpeed(float speed_pct) {
  if (!energized()) return;

  _duty_cmd = dutyFor_(speed_pct);
  _port.pwmWrite(_pin_en, _duty_cmd);
}

void WheelMotor::coast() {
  _port.digitalWrite(_pin_a, false);
  _port.digitalWrite(_pin_b, false);
  _port.pwmWrite(_pin_en, 0.0f);

  _dir = WheelDir::NEUTRAL;
  _duty_cmd = 0.0f;
}
