#pragma once
#include <iosfwd>

#include "comms/Messages.h"

/*
===============================================================================
  Protocol.h
===============================================================================

  PURPOSE
  -------
  Encode/decode helpers for the host <-> rover line protocol.

  Wire format:
    - Newline-delimited JSON (one object per line)
    - Host -> Rover: type="cmd"
    - Rover -> Host: type="telemetry"
===============================================================================
*/

namespace protocol {

/*=============================================================================
  ENCODE (Rover -> Host)
=============================================================================*/

// Writes one telemetry JSON line (includes trailing '\n')
void encodeTelemetryLine(const TelemetryFrame& t, std::ostream& out);


/*=============================================================================
  DECODE (Host -> Rover)
=============================================================================*/

/*
  Attempts to parse one command JSON line.

  Returns:
    - true if decoded into out_cmd (and out_cmd.valid will be true)
    - false if not a valid command frame or parse failed
*/
bool decodeCommandLine(const char* line, CommandFrame& out_cmd);

}  // namespace protocol
