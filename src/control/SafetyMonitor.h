#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdint.h>
#include <thread>

#include "Params.h"
#include "control/CommandDispatcher.h"
#include "drive/Drivetrain.h"
#include "sensors/RangeSensor.h"

/*
===============================================================================
  SafetyMonitor.h
===============================================================================

  PURPOSE
  -------
  Obstacle interlock. Polls the range sensor and submits STOP through the
  dispatcher (same entry point as every other caller) when the filtered
  distance drops below a speed-scaled threshold:

    threshold_cm = base_cm + speed_pct * speed_factor

  While the dispatcher's grace period is pending (armed by BACK) the tick is
  skipped entirely: no ping, no decision. The STOP itself goes through
  submitObstacleStop(), which re-checks grace and detection atomically, so a
  BACK or a rotation that begins mid-ping still wins over a stale sample.

  Runs on its own thread so the blocking ping never stalls dispatch or the
  host loop. tick() is public so the policy can be driven directly.
===============================================================================
*/

struct SafetyConfig {
  float base_cm = OBSTACLE_BASE_DISTANCE_CM;
  float speed_factor = OBSTACLE_SPEED_FACTOR;   // cm per speed percent
  uint32_t period_ms = MONITOR_PERIOD_MS;
};

class SafetyMonitor {
public:
  enum class TickResult : uint8_t {
    GRACE = 0,   // grace period pending, nothing measured
    DISABLED,    // detection switched off (e.g. rotating)
    NO_ECHO,     // ping failed this tick
    CLEAR,       // valid sample at or above threshold
    STOP_SENT,   // obstacle inside threshold, STOP accepted
    STOP_REJECTED, // obstacle inside threshold, dispatcher refused the STOP
  };

  struct Stats {
    uint32_t ticks = 0;
    uint32_t stops = 0;            // accepted only
    uint32_t rejected_stops = 0;
    uint32_t grace_skips = 0;
    uint32_t no_echo = 0;
    float last_distance_cm = -1.0f;
    float last_threshold_cm = 0.0f;
  };

  SafetyMonitor(RangeSensor& range,
                Drivetrain& drive,
                CommandDispatcher& dispatcher,
                const SafetyConfig& cfg);
  ~SafetyMonitor();

  // One monitor iteration at now_ms
  TickResult tick(uint32_t now_ms);

  // Threshold for a given speed
  float thresholdCm(int speed_pct) const {
    return _cfg.base_cm + (float)speed_pct * _cfg.speed_factor;
  }

  bool start();
  void shutdown();
  bool running() const { return _running.load(); }

  Stats stats() const;

private:
  void loop_();

  RangeSensor& _range;
  Drivetrain& _drive;
  CommandDispatcher& _dispatcher;
  SafetyConfig _cfg;

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  bool _stopping = false;
  Stats _stats;

  std::atomic<bool> _running;
  std::thread _thread;
};

const char* tickResultName(SafetyMonitor::TickResult r);
