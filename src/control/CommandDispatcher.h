#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stdint.h>
#include <thread>
#include <vector>

#include "Params.h"
#include "drive/Drivetrain.h"
#include "drive/MotionCommand.h"
#include "sensors/RangeSensor.h"
#include "utils/Deadline.h"

/*
===============================================================================
  CommandDispatcher.h
===============================================================================

  PURPOSE
  -------
  Single-consumer execution loop between callers and the Drivetrain.

  Submission rules (submit):
    - STOP  : drain every pending command, clear the grace period, enqueue
              STOP. Flush and push happen in one critical section, so nothing
              submitted before the STOP can run after it.
              submitObstacleStop() does the same but refuses while the grace
              period is pending or detection is off.
    - BACK  : arm the obstacle-monitor grace period, then enqueue.
    - other : enqueue.

  Execution rules (step, one command at a time):
    - TURN_LEFT / TURN_RIGHT : detection off, rotate, hold rotation_hold_ms,
                               stop, detection on. Always self-terminates.
    - STOP                   : stop, detection forced on.
    - other motions          : apply and return; the motion keeps running
                               until the next command replaces it.

  Threads:
    start() runs step() on a dedicated thread. submit() may be called from
    any thread (host loop, safety monitor, maneuver runner).
===============================================================================
*/

struct DispatcherConfig {
  uint32_t grace_ms = GRACE_PERIOD_MS;
  uint32_t rotation_hold_ms = ROTATION_HOLD_MS;
};

enum class SubmitResult : uint8_t {
  ACCEPTED = 0,
  UNKNOWN_COMMAND,
  REJECTED_STOPPED,   // dispatcher shutting down / shut down
  GRACE_PENDING,      // obstacle stop refused, grace period pending
  DETECTION_OFF,      // obstacle stop refused, detection off (rotating)
};

const char* submitResultName(SubmitResult r);

class CommandDispatcher {
public:
  // Called on the dispatch thread after each command finished executing
  typedef std::function<void(MotionCommand)> ExecutedHook;

  CommandDispatcher(Drivetrain& drive, RangeSensor& range, const DispatcherConfig& cfg);
  ~CommandDispatcher();

  SubmitResult submit(MotionCommand cmd, uint32_t now_ms);
  SubmitResult submit(MotionCommand cmd);

  // Parses the wire name first; unknown names are logged and rejected.
  SubmitResult submit(const char* name);

  // STOP on behalf of the obstacle monitor. Grace period and detection are
  // re-checked in the same critical section that drains and enqueues, so a
  // BACK or a rotation that started while the ping was in flight wins.
  SubmitResult submitObstacleStop(uint32_t now_ms);

  // Executes the oldest pending command. Returns false if the queue was empty.
  bool step();

  // Dispatch thread
  bool start();
  void shutdown();
  bool running() const { return _running.load(); }

  // Grace period: pending => monitor must not measure or act.
  // An expired grace period is cleared (and logged) by this call.
  bool gracePending(uint32_t now_ms);
  uint32_t graceRemainingMs(uint32_t now_ms) const;

  size_t pending() const;
  std::vector<MotionCommand> pendingSnapshot() const;

  bool busy() const { return _busy.load(); }
  MotionCommand lastExecuted() const;

  void setExecutedHook(const ExecutedHook& hook);

private:
  void loop_();
  void execute_(MotionCommand cmd);
  void rotate_(MotionCommand cmd);
  bool holdInterrupted_();
  void enqueueStop_();

  Drivetrain& _drive;
  RangeSensor& _range;
  DispatcherConfig _cfg;

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::deque<MotionCommand> _queue;
  Deadline _grace;
  bool _accepting = true;
  bool _stopping = false;

  MotionCommand _last = MotionCommand::STOP;
  ExecutedHook _hook;

  std::atomic<bool> _running;
  std::atomic<bool> _busy;
  std::thread _thread;
};
