#pragma once

#include <stdint.h>

/*
  MotionCommand.h

  Named motion intents accepted by the dispatcher. Values carry no payload;
  speed is a separate setting on the Drivetrain.

  Wire names (what the host link and callers send):
    forward back left right turn_left turn_right
    left_forward right_forward left_back right_back stop

  The older "move_*" spellings (move_forward, move_left_back, ...) are
  accepted as aliases.
*/

enum class MotionCommand : uint8_t {
  FORWARD = 0,
  BACK,
  LEFT,             // lateral translation
  RIGHT,
  TURN_LEFT,        // rotate in place
  TURN_RIGHT,
  LEFT_FORWARD,     // diagonals
  RIGHT_FORWARD,
  LEFT_BACK,
  RIGHT_BACK,
  STOP,
  UNKNOWN,
};

constexpr uint8_t MOTION_COMMAND_COUNT = (uint8_t)MotionCommand::UNKNOWN;

// Returns UNKNOWN for null, empty or unrecognised names.
MotionCommand parseMotionCommand(const char* name);

// Canonical wire name ("unknown" for UNKNOWN / out of range values).
const char* motionCommandName(MotionCommand cmd);

inline bool isRotation(MotionCommand cmd) {
  return cmd == MotionCommand::TURN_LEFT || cmd == MotionCommand::TURN_RIGHT;
}

inline bool isValidCommand(MotionCommand cmd) {
  return (uint8_t)cmd < MOTION_COMMAND_COUNT;
}
