#include "comms/Protocol.h"

#include <ostream>
#include <string.h>

/*
===============================================================================
  Protocol.cpp
===============================================================================

  PURPOSE
  -------
  Implements newline-delimited JSON protocol helpers.

  Notes:
  - Both directions use ArduinoJson.
  - A command frame must carry "type":"cmd" and "seq"; all other fields are
    optional. A frame with none of them is a heartbeat.
  - Names longer than FRAME_NAME_MAX - 1 are rejected, not truncated, so a
    garbled name can never turn into a valid shorter one.
===============================================================================
*/

#include <ArduinoJson.h>

#include "Params.h"


/*=============================================================================
  SMALL HELPERS
=============================================================================*/

// Copy a string field into a fixed buffer; false if missing, not a string or too long
static bool copyName(JsonVariantConst v, char* dst, size_t dst_len) {
  const char* s = v.as<const char*>();
  if (!s) return false;
  const size_t n = strlen(s);
  if (n == 0 || n >= dst_len) return false;
  memcpy(dst, s, n + 1);
  return true;
}


namespace protocol {

/*=============================================================================
  ENCODE (Rover -> Host)
=============================================================================*/

void encodeTelemetryLine(const TelemetryFrame& t, std::ostream& out) {
  StaticJsonDocument<LINK_JSON_DOC_BYTES> doc;

  doc["type"] = "telemetry";
  doc["time_ms"] = t.time_ms;
  doc["ack_seq"] = t.ack_seq;
  doc["speed"] = t.speed;

  if (t.distance_valid && isfinite(t.distance_cm))
    doc["distance_cm"] = t.distance_cm;
  else
    doc["distance_cm"] = nullptr;
  doc["distance_valid"] = t.distance_valid;

  doc["detection"] = t.detection;
  doc["running"] = t.running;

  if (t.maneuver)
    doc["maneuver"] = t.maneuver;
  else
    doc["maneuver"] = nullptr;

  if (t.last_command)
    doc["last_command"] = t.last_command;
  else
    doc["last_command"] = nullptr;

  if (t.result)
    doc["result"] = t.result;
  else
    doc["result"] = nullptr;

  if (t.note)
    doc["note"] = t.note;
  else
    doc["note"] = nullptr;

  serializeJson(doc, out);
  out << '\n';
  out.flush();
}


/*=============================================================================
  DECODE (Host -> Rover)
=============================================================================*/

bool decodeCommandLine(const char* line, CommandFrame& out_cmd) {
  out_cmd = CommandFrame();   // reset everything
  if (!line) return false;

  StaticJsonDocument<LINK_JSON_DOC_BYTES> doc;

  if (deserializeJson(doc, line)) {
    return false;
  }

  JsonObjectConst obj = doc.as<JsonObjectConst>();
  if (obj.isNull()) return false;

  // Must be a command
  const char* type = obj["type"].as<const char*>();
  if (!type || strcmp(type, "cmd") != 0) return false;

  // Required fields
  if (!obj["seq"].is<uint32_t>()) return false;
  out_cmd.seq = obj["seq"].as<uint32_t>();

  // command (nullable)
  if (!obj["command"].isNull()) {
    if (!copyName(obj["command"], out_cmd.command, sizeof(out_cmd.command))) return false;
    out_cmd.command_present = true;
  }

  // speed (nullable)
  if (!obj["speed"].isNull()) {
    if (!obj["speed"].is<int>()) return false;
    out_cmd.speed = obj["speed"].as<int>();
    out_cmd.speed_present = true;
  }

  // detection (nullable)
  if (!obj["detection"].isNull()) {
    if (!obj["detection"].is<bool>()) return false;
    out_cmd.detection = obj["detection"].as<bool>();
    out_cmd.detection_present = true;
  }

  // maneuver (nullable)
  if (!obj["maneuver"].isNull()) {
    if (!copyName(obj["maneuver"], out_cmd.maneuver, sizeof(out_cmd.maneuver))) return false;
    out_cmd.maneuver_present = true;
  }

  // A frame that asks for nothing is a heartbeat; still valid (refreshes the link)
  out_cmd.valid = true;
  return true;
}

}  // namespace protocol
