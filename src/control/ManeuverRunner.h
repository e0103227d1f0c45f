#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <thread>
#include <vector>

#include "control/CommandDispatcher.h"
#include "drive/MotionCommand.h"

/*
===============================================================================
  ManeuverRunner.h
===============================================================================

  PURPOSE
  -------
  Plays a scripted sequence of (command, duration) steps through the
  dispatcher, on its own thread. Used for demos and drivetrain checks.

  Rules:
    - Every step goes through CommandDispatcher::submit, so grace periods,
      priority stop and the obstacle monitor apply exactly as for a caller
    - Only one maneuver at a time; start() while one runs fails
    - start() and stop() are serialized, so concurrent callers (host loop,
      watchdog) never launch two threads or join one twice
    - stop() cancels the remaining steps and submits STOP
    - A finished maneuver always ends with STOP
===============================================================================
*/

struct ManeuverStep {
  MotionCommand cmd;
  uint32_t duration_ms;   // time until the next step is submitted
};

struct Maneuver {
  std::string name;
  std::vector<ManeuverStep> steps;
};

// Built-ins: digit_0 .. digit_9, crab_walk, box_step, s_curve, z_curve,
// spin_fast. nullptr if not found.
const Maneuver* findManeuver(const char* name);

// Comma separated list of built-in names (for help / errors)
std::string maneuverNames();

class ManeuverRunner {
public:
  explicit ManeuverRunner(CommandDispatcher& dispatcher);
  ~ManeuverRunner();

  bool start(const char* name);
  bool start(const Maneuver& m);

  // Returns false if nothing was running
  bool stop();

  bool active() const { return _active.load(); }
  std::string current() const;

private:
  void run_(Maneuver m);
  void reap_();

  CommandDispatcher& _dispatcher;

  // Held across check, reap and launch / cancel and join. run_ never takes it.
  std::mutex _lifecycle_mutex;

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  bool _cancel = false;
  std::string _current;

  std::atomic<bool> _active;
  std::thread _thread;
};
