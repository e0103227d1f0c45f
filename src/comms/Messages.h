#pragma once
#include <math.h>
#include <stdint.h>

/*
===============================================================================
  Messages.h
===============================================================================

  PURPOSE
  -------
  Command and telemetry structures exchanged between the rover process and
  its host (anything that writes to stdin / reads stdout) as
  newline-delimited JSON.

  Notes:
  - Optional numeric fields use NAN and are encoded as JSON null.
  - Every command field is optional; *_present says whether it was sent.
===============================================================================
*/


/*=============================================================================
  COMMAND STRUCTURES (Host -> Rover)
=============================================================================*/

constexpr uint8_t FRAME_NAME_MAX = 32;

// {"type":"cmd","seq":7,"command":"forward","speed":60,"detection":true,"maneuver":"box_step"}
struct CommandFrame {
  uint32_t seq = 0;

  char command[FRAME_NAME_MAX] = {0};   // motion command wire name
  bool command_present = false;

  int speed = 0;                        // percent
  bool speed_present = false;

  bool detection = true;                // distance detection on/off
  bool detection_present = false;

  char maneuver[FRAME_NAME_MAX] = {0};  // maneuver name, or "stop" to cancel
  bool maneuver_present = false;

  bool valid = false;  // set true after successful decode
};


/*=============================================================================
  TELEMETRY STRUCTURES (Rover -> Host)
=============================================================================*/

struct TelemetryFrame {
  uint32_t time_ms = 0;
  uint32_t ack_seq = 0;

  int speed = 0;

  // {"distance_cm": <float>|null, "distance_valid": <bool>}
  float distance_cm = NAN;
  bool distance_valid = false;

  bool detection = true;
  bool running = false;
  const char* maneuver = nullptr;       // running maneuver, null if none

  const char* last_command = nullptr;   // last executed motion
  const char* result = nullptr;         // result of the last submitted frame

  const char* note = nullptr;  // optional debug string
};
