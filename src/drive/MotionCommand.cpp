#include "drive/MotionCommand.h"

#include <string.h>

namespace {

struct NameEntry {
  const char* name;
  MotionCommand cmd;
};

// Canonical names, indexed by enum value
const char* const kNames[MOTION_COMMAND_COUNT] = {
  "forward",
  "back",
  "left",
  "right",
  "turn_left",
  "turn_right",
  "left_forward",
  "right_forward",
  "left_back",
  "right_back",
  "stop",
};

const NameEntry kAliases[] = {
  {"move_forward",       MotionCommand::FORWARD},
  {"move_back",          MotionCommand::BACK},
  {"move_left",          MotionCommand::LEFT},
  {"move_right",         MotionCommand::RIGHT},
  {"move_left_forward",  MotionCommand::LEFT_FORWARD},
  {"move_right_forward", MotionCommand::RIGHT_FORWARD},
  {"move_left_back",     MotionCommand::LEFT_BACK},
  {"move_right_back",    MotionCommand::RIGHT_BACK},
};

}  // namespace

MotionCommand parseMotionCommand(const char* name) {
  if (!name || name[0] == '\0') return MotionCommand::UNKNOWN;

  for (uint8_t i = 0; i < MOTION_COMMAND_COUNT; ++i) {
    if (strcmp(name, kNames[i]) == 0) return (MotionCommand)i;
  }

  for (size_t i = 0; i < sizeof(kAliases) / sizeof(kAliases[0]); ++i) {
    if (strcmp(name, kAliases[i].name) == 0) return kAliases[i].cmd;
  }

  return MotionCommand::UNKNOWN;
}

const char* motionCommandName(MotionCommand cmd) {
  if (!isValidCommand(cmd)) return "unknown";
  return kNames[(uint8_t)cmd];
}
