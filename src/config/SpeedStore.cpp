#include "config/SpeedStore.h"

#include <ArduinoJson.h>

#include <fstream>
#include <stdio.h>

#include "utils/Log.h"

static const char* TAG = "Config";

SpeedStore::SpeedStore(const std::string& path, int min_speed, int default_speed)
: _path(path),
  _min_speed(min_speed),
  _default_speed(default_speed)
{
  _default_speed = clamp_(_default_speed);
}

int SpeedStore::clamp_(int v) const {
  if (v < _min_speed) return _min_speed;
  if (v > MAX_SPEED_LIMIT) return MAX_SPEED_LIMIT;
  return v;
}

int SpeedStore::load() {
  _source = Source::DEFAULT;

  std::ifstream in(_path.c_str());
  if (!in) {
    LOG_I(TAG, "no speed store at %s, using %d%%", _path.c_str(), _default_speed);
    return _default_speed;
  }

  StaticJsonDocument<STORE_JSON_DOC_BYTES> doc;
  DeserializationError err = deserializeJson(doc, in);
  if (err) {
    LOG_W(TAG, "speed store %s unreadable (%s), using %d%%",
          _path.c_str(), err.c_str(), _default_speed);
    return _default_speed;
  }

  int raw = 0;
  if (doc.is<int>()) {
    raw = doc.as<int>();
    _source = Source::LEGACY;
  } else if (doc["speed"].is<int>()) {
    raw = doc["speed"].as<int>();
    _source = Source::STORED;
  } else if (doc["default_speed"].is<int>()) {
    raw = doc["default_speed"].as<int>();
    _source = Source::LEGACY;
  } else {
    LOG_W(TAG, "speed store %s has no speed value, using %d%%", _path.c_str(), _default_speed);
    return _default_speed;
  }

  const int speed = clamp_(raw);
  if (speed != raw) {
    LOG_W(TAG, "stored speed %d%% clamped to %d%%", raw, speed);
  }
  LOG_I(TAG, "speed %d%% loaded from %s%s", speed, _path.c_str(),
        _source == Source::LEGACY ? " (legacy format)" : "");
  return speed;
}

bool SpeedStore::save(int speed) {
  const std::string tmp = _path + ".tmp";

  StaticJsonDocument<STORE_JSON_DOC_BYTES> doc;
  doc["speed"] = clamp_(speed);

  {
    std::ofstream out(tmp.c_str(), std::ios::trunc);
    if (!out) {
      LOG_E(TAG, "cannot write %s", tmp.c_str());
      return false;
    }
    serializeJson(doc, out);
    out << '\n';
    out.flush();
    if (!out) {
      LOG_E(TAG, "write to %s failed", tmp.c_str());
      return false;
    }
  }

  if (rename(tmp.c_str(), _path.c_str()) != 0) {
    LOG_E(TAG, "cannot replace %s", _path.c_str());
    remove(tmp.c_str());
    return false;
  }

  LOG_D(TAG, "speed %d%% saved to %s", clamp_(speed), _path.c_str());
  return true;
}
