#pragma once

#include <mutex>
#include <stdint.h>
#include <vector>

#include "Params.h"
#include "actuators/WheelMotor.h"
#include "drive/MotionCommand.h"
#include "hal/GpioPort.h"

/*
===============================================================================
  Drivetrain.h
===============================================================================

  PURPOSE
  -------
  Four-wheel mecanum base. Owns the four WheelMotors and the single logical
  speed setting.

  Every motion primitive is one row of a per-wheel direction table
  (FORWARD / BACK / NEUTRAL for LF, LB, RF, RB). Right-side polarity is a
  property of the wheel (WheelMotor invert flag), not of the primitive.

  Thread safety:
    All public methods take the drivetrain mutex, and a primitive writes all
    four wheels inside one critical section. A stop() from the safety
    monitor therefore lands either before or after a primitive, never in the
    middle of one.
===============================================================================
*/

enum class WheelRole : uint8_t {
  LEFT_FRONT = 0,
  LEFT_BACK,
  RIGHT_FRONT,
  RIGHT_BACK,
};

constexpr uint8_t WHEEL_COUNT = 4;

// Pins + calibration for one wheel role
struct WheelAssignment {
  uint8_t pin_a = 0;
  uint8_t pin_b = 0;
  uint8_t pin_en = 0;
  float calibration = 1.0f;   // [0, 1]
};

struct DrivetrainConfig {
  WheelAssignment wheels[WHEEL_COUNT];   // indexed by WheelRole
  int min_speed = MIN_SPEED_LIMIT;
  int initial_speed = DEFAULT_SPEED;
};

// Pin map from Pins.h, calibration from Params.h
DrivetrainConfig defaultDrivetrainConfig();

const char* wheelRoleName(WheelRole role);

class Drivetrain {
public:
  Drivetrain(GpioPort& port, const DrivetrainConfig& cfg);

  // Claims all wheel lines and stops. false = hardware unavailable (fatal).
  bool begin();

  // Runs the table row for cmd. Logs and returns false for UNKNOWN.
  bool apply(MotionCommand cmd);

  // Named primitives
  void forward()      { apply(MotionCommand::FORWARD); }
  void back()         { apply(MotionCommand::BACK); }
  void left()         { apply(MotionCommand::LEFT); }
  void right()        { apply(MotionCommand::RIGHT); }
  void turnLeft()     { apply(MotionCommand::TURN_LEFT); }
  void turnRight()    { apply(MotionCommand::TURN_RIGHT); }
  void leftForward()  { apply(MotionCommand::LEFT_FORWARD); }
  void rightForward() { apply(MotionCommand::RIGHT_FORWARD); }
  void leftBack()     { apply(MotionCommand::LEFT_BACK); }
  void rightBack()    { apply(MotionCommand::RIGHT_BACK); }

  // All direction pins low, all duty 0. Safe from any state, any thread.
  void stop();

  // Clamps to [min_speed, 100], re-applies duty to energized wheels.
  // Returns the value actually applied.
  int setSpeed(int pct);
  int getSpeed() const;
  int clampSpeed(int pct) const;

  // Bring-up helper: drives one wheel, leaves the others as they are.
  void driveWheel(WheelRole role, WheelDir dir);

  // Raw duty on one wheel, bypassing speed clamping (bring-up duty sweeps).
  void driveWheelDuty(WheelRole role, WheelDir dir, float duty_pct);

  // Introspection
  MotionCommand currentMotion() const;
  bool isStopped() const;
  WheelDir wheelDirection(WheelRole role) const;
  float wheelDuty(WheelRole role) const;
  const WheelMotor& wheel(WheelRole role) const { return _wheels[(uint8_t)role]; }

  // Direction row for a command, nullptr for UNKNOWN
  static const WheelDir* directionRow(MotionCommand cmd);

  // Mirrored wiring: true for the right-side roles
  static bool wheelInverted(WheelRole role);

private:
  std::vector<WheelMotor> _wheels;

  int _min_speed;
  int _speed;
  MotionCommand _motion = MotionCommand::STOP;

  mutable std::mutex _mutex;
};
