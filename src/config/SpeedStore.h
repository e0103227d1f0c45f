#pragma once

#include <string>

#include "Params.h"

/*
===============================================================================
  SpeedStore.h
===============================================================================

  PURPOSE
  -------
  Persists the logical drive speed in a small JSON key-value file so the
  rover comes back at the speed it was left at.

  Current format:
    {"speed": 60}

  Also accepted on load (older front-ends wrote these):
    60
    {"default_speed": 60}

  load() never fails: a missing, unreadable or malformed file gives the
  default speed. Loaded values are clamped to [min_speed, 100].
===============================================================================
*/

class SpeedStore {
public:
  enum class Source : uint8_t {
    DEFAULT = 0,   // nothing usable on disk
    STORED,        // current format
    LEGACY,        // bare integer or "default_speed"
  };

  SpeedStore(const std::string& path,
             int min_speed = MIN_SPEED_LIMIT,
             int default_speed = DEFAULT_SPEED);

  int load();

  // Writes path.tmp then renames it over path. false (and logs) on I/O error.
  bool save(int speed);

  Source lastSource() const { return _source; }
  const std::string& path() const { return _path; }

private:
  int clamp_(int v) const;

  std::string _path;
  int _min_speed;
  int _default_speed;
  Source _source = Source::DEFAULT;
};
