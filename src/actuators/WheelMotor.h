#pragma once

#include <stdint.h>

#include "hal/GpioPort.h"

/*
===============================================================================
  WheelMotor.h
===============================================================================

  PURPOSE
  -------
  Thin hardware wrapper for one mecanum wheel motor on an L298N channel.

  Wiring:
    - IN_A / IN_B = direction pair
    - EN          = PWM (speed)

  Responsibilities:
    - Claim the three lines
    - Turn a logical direction (FORWARD / BACK / NEUTRAL) into an IN_A/IN_B
      pattern, honouring the polarity flag of mirrored (right side) wheels
    - Scale the logical speed by the wheel calibration and write the duty

  Notes:
    - This class does NOT do closed-loop control.
    - Not thread safe on its own; Drivetrain serializes all calls.
===============================================================================
*/

enum class WheelDir : uint8_t {
  NEUTRAL = 0,
  FORWARD,
  BACK,
};

class WheelMotor {
public:
  /*
    invert:
      Right-side motors are mounted mirrored, so the same IN_A/IN_B pattern
      spins them the other way. true swaps the pattern for FORWARD / BACK.

    calibration:
      Multiplier on the logical speed, clamped to [0, 1].
  */
  WheelMotor(GpioPort& port,
             uint8_t pin_a,
             uint8_t pin_b,
             uint8_t pin_en,
             bool invert = false,
             float calibration = 1.0f);

  // Claim lines and force the safe stopped state. false if any line is unavailable.
  bool begin();

  // Set direction pins and duty = speed_pct * calibration (0 for NEUTRAL).
  void drive(WheelDir dir, float speed_pct);

  // Re-apply duty for a new speed, keeping the current direction.
  void setSpeed(float speed_pct);

  // IN_A=LOW, IN_B=LOW, duty 0
  void coast();

  // Pin pattern for a direction (a = IN_A, b = IN_B)
  static void pattern(WheelDir dir, bool invert, bool& a, bool& b);

  WheelDir direction() const { return _dir; }
  bool energized() const { return _dir != WheelDir::NEUTRAL; }
  bool inverted() const { return _invert; }
  float calibration() const { return _calibration; }
  float dutyCmd() const { return _duty_cmd; }

  uint8_t pinA() const { return _pin_a; }
  uint8_t pinB() const { return _pin_b; }
  uint8_t pinEn() const { return _pin_en; }

private:
  float dutyFor_(float speed_pct) const;

  GpioPort& _port;

  uint8_t _pin_a;
  uint8_t _pin_b;
  uint8_t _pin_en;

  bool _invert;
  float _calibration;

  // Last command values (for telemetry/debug)
  WheelDir _dir = WheelDir::NEUTRAL;
  float _duty_cmd = 0.0f;
};
