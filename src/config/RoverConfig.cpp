#include "config/RoverConfig.h"

#include <ArduinoJson.h>

#include <fstream>

/*
  RoverConfig.cpp

  Parsing uses ArduinoJson with the "value | default" idiom: a key that is
  missing (or of the wrong type) keeps whatever cfg already holds.
*/

static const char* TAG = "Config";

static float clampf(float v, float lo, float hi) {
  if (v < lo) return lo;
  if (v > hi) return hi;
  return v;
}

static void readCalibration(JsonObjectConst cal, const char* key, WheelAssignment& w) {
  if (cal[key].isNull()) return;

  const float v = cal[key] | w.calibration;
  w.calibration = clampf(v, 0.0f, 1.0f);
  if (w.calibration != v) {
    LOG_W(TAG, "calibration.%s=%.3f clamped to %.3f", key, (double)v, (double)w.calibration);
  }
}

bool parseRoverConfig(std::istream& in, RoverConfig& cfg) {
  StaticJsonDocument<CONFIG_JSON_DOC_BYTES> doc;

  DeserializationError err = deserializeJson(doc, in);
  if (err) {
    LOG_E(TAG, "config parse failed: %s", err.c_str());
    return false;
  }

  JsonObjectConst root = doc.as<JsonObjectConst>();
  if (root.isNull()) {
    LOG_E(TAG, "config root must be a JSON object");
    return false;
  }

  RoverConfig out = cfg;

  // hardware
  out.gpio_chip = root["gpio_chip"] | cfg.gpio_chip.c_str();
  out.pwm_hz = root["pwm_hz"] | cfg.pwm_hz;
  if (out.pwm_hz == 0) {
    LOG_W(TAG, "pwm_hz=0 ignored");
    out.pwm_hz = cfg.pwm_hz;
  }

  // speed
  int min_speed = root["min_speed"] | cfg.drive.min_speed;
  if (min_speed < 0 || min_speed > MAX_SPEED_LIMIT) {
    LOG_W(TAG, "min_speed=%d out of [0, %d], ignored", min_speed, MAX_SPEED_LIMIT);
    min_speed = cfg.drive.min_speed;
  }
  out.drive.min_speed = min_speed;
  out.drive.initial_speed = root["default_speed"] | cfg.drive.initial_speed;

  JsonObjectConst cal = root["calibration"].as<JsonObjectConst>();
  if (!cal.isNull()) {
    readCalibration(cal, "left_front",  out.drive.wheels[(uint8_t)WheelRole::LEFT_FRONT]);
    readCalibration(cal, "left_back",   out.drive.wheels[(uint8_t)WheelRole::LEFT_BACK]);
    readCalibration(cal, "right_front", out.drive.wheels[(uint8_t)WheelRole::RIGHT_FRONT]);
    readCalibration(cal, "right_back",  out.drive.wheels[(uint8_t)WheelRole::RIGHT_BACK]);
  }

  // safety policy
  out.safety.base_cm = root["obstacle_base_cm"] | cfg.safety.base_cm;
  out.safety.speed_factor = root["obstacle_speed_factor"] | cfg.safety.speed_factor;
  out.safety.period_ms = root["monitor_period_ms"] | cfg.safety.period_ms;
  if (out.safety.base_cm < 0.0f || out.safety.speed_factor < 0.0f) {
    LOG_W(TAG, "negative obstacle threshold terms ignored");
    out.safety.base_cm = cfg.safety.base_cm;
    out.safety.speed_factor = cfg.safety.speed_factor;
  }
  if (out.safety.period_ms == 0) out.safety.period_ms = cfg.safety.period_ms;

  out.dispatch.grace_ms = root["grace_ms"] | cfg.dispatch.grace_ms;
  out.dispatch.rotation_hold_ms = root["rotation_hold_ms"] | cfg.dispatch.rotation_hold_ms;

  // range sensor
  out.echo_timeout_us = root["echo_timeout_us"] | cfg.echo_timeout_us;
  if (out.echo_timeout_us == 0) out.echo_timeout_us = cfg.echo_timeout_us;

  int window = root["distance_buffer_size"] | (int)cfg.distance_buffer_size;
  if (window < 1 || window > DISTANCE_BUFFER_MAX) {
    LOG_W(TAG, "distance_buffer_size=%d out of [1, %u], ignored", window, (unsigned)DISTANCE_BUFFER_MAX);
    window = cfg.distance_buffer_size;
  }
  out.distance_buffer_size = (uint8_t)window;
  out.temperature_c = root["temperature_c"] | cfg.temperature_c;

  // host side
  out.speed_store_path = root["speed_store_path"] | cfg.speed_store_path.c_str();
  out.link_timeout_ms = root["link_timeout_ms"] | cfg.link_timeout_ms;

  const char* level = root["log_level"].as<const char*>();
  if (level) {
    LogLevel parsed;
    if (parseLogLevel(level, parsed)) {
      out.log_level = parsed;
    } else {
      LOG_W(TAG, "unknown log_level '%s', keeping default", level);
    }
  }

  cfg = out;
  return true;
}

bool loadRoverConfig(const char* path, RoverConfig& cfg) {
  if (!path) return false;

  std::ifstream in(path);
  if (!in) {
    LOG_E(TAG, "cannot open config %s", path);
    return false;
  }

  if (!parseRoverConfig(in, cfg)) {
    LOG_E(TAG, "config %s rejected, using defaults", path);
    return false;
  }

  LOG_I(TAG, "loaded %s", path);
  return true;
}
