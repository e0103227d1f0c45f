#include "drive/Drivetrain.h"

#include "Pins.h"
#include "utils/Log.h"

/*
===============================================================================
  Drivetrain.cpp
===============================================================================

  Mecanum kinematics, roller angles in an "X" when seen from above.
  Wheel order in every row: LF, LB, RF, RB.

    forward / back   : all four same direction
    left / right     : front and back of each side opposed
    turn_left/right  : left side against right side
    diagonals        : only the two wheels whose rollers point along the
                       diagonal are driven, the other pair is left neutral
===============================================================================
*/

static const char* TAG = "Drive";

#define F WheelDir::FORWARD
#define B WheelDir::BACK
#define N WheelDir::NEUTRAL

static const WheelDir kMotionTable[MOTION_COMMAND_COUNT][WHEEL_COUNT] = {
  //  LF  LB  RF  RB
  {   F,  F,  F,  F },   // FORWARD
  {   B,  B,  B,  B },   // BACK
  {   B,  F,  F,  B },   // LEFT
  {   F,  B,  B,  F },   // RIGHT
  {   B,  B,  F,  F },   // TURN_LEFT
  {   F,  F,  B,  B },   // TURN_RIGHT
  {   N,  F,  F,  N },   // LEFT_FORWARD
  {   F,  N,  N,  F },   // RIGHT_FORWARD
  {   B,  N,  N,  B },   // LEFT_BACK
  {   N,  B,  B,  N },   // RIGHT_BACK
  {   N,  N,  N,  N },   // STOP
};

#undef F
#undef B
#undef N

// Right-side motors are wired mirrored
static const bool kWheelInverted[WHEEL_COUNT] = {false, false, true, true};

DrivetrainConfig defaultDrivetrainConfig() {
  DrivetrainConfig cfg;

  WheelAssignment& lf = cfg.wheels[(uint8_t)WheelRole::LEFT_FRONT];
  lf.pin_a = PIN_LF_IN_A;
  lf.pin_b = PIN_LF_IN_B;
  lf.pin_en = PIN_LF_EN;
  lf.calibration = CAL_LEFT_FRONT;

  WheelAssignment& lb = cfg.wheels[(uint8_t)WheelRole::LEFT_BACK];
  lb.pin_a = PIN_LB_IN_A;
  lb.pin_b = PIN_LB_IN_B;
  lb.pin_en = PIN_LB_EN;
  lb.calibration = CAL_LEFT_BACK;

  WheelAssignment& rf = cfg.wheels[(uint8_t)WheelRole::RIGHT_FRONT];
  rf.pin_a = PIN_RF_IN_A;
  rf.pin_b = PIN_RF_IN_B;
  rf.pin_en = PIN_RF_EN;
  rf.calibration = CAL_RIGHT_FRONT;

  WheelAssignment& rb = cfg.wheels[(uint8_t)WheelRole::RIGHT_BACK];
  rb.pin_a = PIN_RB_IN_A;
  rb.pin_b = PIN_RB_IN_B;
  rb.pin_en = PIN_RB_EN;
  rb.calibration = CAL_RIGHT_BACK;

  cfg.min_speed = MIN_SPEED_LIMIT;
  cfg.initial_speed = DEFAULT_SPEED;
  return cfg;
}

const char* wheelRoleName(WheelRole role) {
  switch (role) {
    case WheelRole::LEFT_FRONT:  return "left_front";
    case WheelRole::LEFT_BACK:   return "left_back";
    case WheelRole::RIGHT_FRONT: return "right_front";
    case WheelRole::RIGHT_BACK:  return "right_back";
  }
  return "unknown";
}

const WheelDir* Drivetrain::directionRow(MotionCommand cmd) {
  if (!isValidCommand(cmd)) return nullptr;
  return kMotionTable[(uint8_t)cmd];
}

bool Drivetrain::wheelInverted(WheelRole role) {
  return kWheelInverted[(uint8_t)role];
}

Drivetrain::Drivetrain(GpioPort& port, const DrivetrainConfig& cfg)
: _min_speed(cfg.min_speed)
{
  if (_min_speed < 0) _min_speed = 0;
  if (_min_speed > MAX_SPEED_LIMIT) _min_speed = MAX_SPEED_LIMIT;

  _speed = clampSpeed(cfg.initial_speed);

  _wheels.reserve(WHEEL_COUNT);
  for (uint8_t i = 0; i < WHEEL_COUNT; ++i) {
    const WheelAssignment& w = cfg.wheels[i];
    _wheels.push_back(WheelMotor(port, w.pin_a, w.pin_b, w.pin_en,
                                 kWheelInverted[i], w.calibration));
  }
}

bool Drivetrain::begin() {
  std::lock_guard<std::mutex> lock(_mutex);

  for (uint8_t i = 0; i < WHEEL_COUNT; ++i) {
    if (!_wheels[i].begin()) {
      LOG_E(TAG, "%s wheel: cannot claim pins %u/%u/%u",
            wheelRoleName((WheelRole)i),
            (unsigned)_wheels[i].pinA(),
            (unsigned)_wheels[i].pinB(),
            (unsigned)_wheels[i].pinEn());
      return false;
    }
  }

  _motion = MotionCommand::STOP;
  LOG_I(TAG, "ready, speed %d%% (min %d%%)", _speed, _min_speed);
  return true;
}

bool Drivetrain::apply(MotionCommand cmd) {
  const WheelDir* row = directionRow(cmd);
  if (!row) {
    LOG_E(TAG, "unsupported motion primitive %u", (unsigned)cmd);
    return false;
  }

  std::lock_guard<std::mutex> lock(_mutex);
  for (uint8_t i = 0; i < WHEEL_COUNT; ++i) {
    _wheels[i].drive(row[i], (float)_speed);
  }
  _motion = cmd;

  LOG_D(TAG, "%s at %d%%", motionCommandName(cmd), _speed);
  return true;
}

void Drivetrain::stop() {
  std::lock_guard<std::mutex> lock(_mutex);
  for (uint8_t i = 0; i < WHEEL_COUNT; ++i) {
    _wheels[i].coast();
  }
  _motion = MotionCommand::STOP;
}

int Drivetrain::clampSpeed(int pct) const {
  if (pct < _min_speed) return _min_speed;
  if (pct > MAX_SPEED_LIMIT) return MAX_SPEED_LIMIT;
  return pct;
}

int Drivetrain::setSpeed(int pct) {
  const int applied = clampSpeed(pct);
  if (applied != pct) {
    LOG_W(TAG, "speed %d%% out of range, using %d%%", pct, applied);
  }

  std::lock_guard<std::mutex> lock(_mutex);
  _speed = applied;
  for (uint8_t i = 0; i < WHEEL_COUNT; ++i) {
    _wheels[i].setSpeed((float)_speed);
  }
  return applied;
}

int Drivetrain::getSpeed() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _speed;
}

void Drivetrain::driveWheel(WheelRole role, WheelDir dir) {
  std::lock_guard<std::mutex> lock(_mutex);
  _wheels[(uint8_t)role].drive(dir, (float)_speed);
  _motion = MotionCommand::UNKNOWN;   // no named primitive matches a single wheel
}

void Drivetrain::driveWheelDuty(WheelRole role, WheelDir dir, float duty_pct) {
  std::lock_guard<std::mutex> lock(_mutex);
  _wheels[(uint8_t)role].drive(dir, duty_pct);
  _motion = MotionCommand::UNKNOWN;
}

MotionCommand Drivetrain::currentMotion() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _motion;
}

bool Drivetrain::isStopped() const {
  std::lock_guard<std::mutex> lock(_mutex);
  for (uint8_t i = 0; i < WHEEL_COUNT; ++i) {
    if (_wheels[i].energized()) return false;
  }
  return true;
}

WheelDir Drivetrain::wheelDirection(WheelRole role) const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _wheels[(uint8_t)role].direction();
}

float Drivetrain::wheelDuty(WheelRole role) const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _wheels[(uint8_t)role].dutyCmd();
}
