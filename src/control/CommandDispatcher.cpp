#include "control/CommandDispatcher.h"

#include <chrono>

#include "utils/Clock.h"
#include "utils/Log.h"

static const char* TAG = "Dispatch";

const char* submitResultName(SubmitResult r) {
  switch (r) {
    case SubmitResult::ACCEPTED:         return "accepted";
    case SubmitResult::UNKNOWN_COMMAND:  return "unknown_command";
    case SubmitResult::REJECTED_STOPPED: return "stopped";
    case SubmitResult::GRACE_PENDING:    return "grace_pending";
    case SubmitResult::DETECTION_OFF:    return "detection_off";
  }
  return "unknown";
}

CommandDispatcher::CommandDispatcher(Drivetrain& drive, RangeSensor& range, const DispatcherConfig& cfg)
: _drive(drive),
  _range(range),
  _cfg(cfg),
  _running(false),
  _busy(false)
{
}

CommandDispatcher::~CommandDispatcher() {
  shutdown();
}

/*=============================================================================
  SUBMISSION
=============================================================================*/

SubmitResult CommandDispatcher::submit(MotionCommand cmd) {
  return submit(cmd, millis());
}

SubmitResult CommandDispatcher::submit(const char* name) {
  const MotionCommand cmd = parseMotionCommand(name);
  if (cmd == MotionCommand::UNKNOWN) {
    LOG_E(TAG, "unknown command '%s' dropped", name ? name : "(null)");
    return SubmitResult::UNKNOWN_COMMAND;
  }
  return submit(cmd, millis());
}

SubmitResult CommandDispatcher::submit(MotionCommand cmd, uint32_t now_ms) {
  if (!isValidCommand(cmd)) {
    LOG_E(TAG, "unknown command %u dropped", (unsigned)cmd);
    return SubmitResult::UNKNOWN_COMMAND;
  }

  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_accepting) {
      LOG_W(TAG, "'%s' rejected, dispatcher stopped", motionCommandName(cmd));
      return SubmitResult::REJECTED_STOPPED;
    }

    if (cmd == MotionCommand::STOP) {
      enqueueStop_();
    } else {
      if (cmd == MotionCommand::BACK) {
        _grace.armFor(now_ms, _cfg.grace_ms);
        LOG_I(TAG, "obstacle grace period armed for %lu ms", (unsigned long)_cfg.grace_ms);
      }
      _queue.push_back(cmd);
      LOG_D(TAG, "'%s' queued (%u pending)", motionCommandName(cmd), (unsigned)_queue.size());
    }
  }

  _cv.notify_all();
  return SubmitResult::ACCEPTED;
}

SubmitResult CommandDispatcher::submitObstacleStop(uint32_t now_ms) {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_accepting) {
      LOG_W(TAG, "obstacle stop rejected, dispatcher stopped");
      return SubmitResult::REJECTED_STOPPED;
    }
    if (_grace.pending(now_ms)) {
      LOG_D(TAG, "obstacle stop ignored, grace period pending");
      return SubmitResult::GRACE_PENDING;
    }
    if (!_range.enabled()) {
      LOG_D(TAG, "obstacle stop ignored, detection off");
      return SubmitResult::DETECTION_OFF;
    }
    enqueueStop_();
  }

  _cv.notify_all();
  return SubmitResult::ACCEPTED;
}

// Caller holds _mutex
void CommandDispatcher::enqueueStop_() {
  const size_t dropped = _queue.size();
  _queue.clear();
  _grace.clear();
  _queue.push_back(MotionCommand::STOP);
  LOG_I(TAG, "stop: %u pending command(s) dropped", (unsigned)dropped);
}

/*=============================================================================
  GRACE PERIOD
=============================================================================*/

bool CommandDispatcher::gracePending(uint32_t now_ms) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_grace.pending(now_ms)) return true;

  if (_grace.expired(now_ms)) {
    _grace.clear();
    LOG_I(TAG, "obstacle grace period over, monitoring resumed");
  }
  return false;
}

uint32_t CommandDispatcher::graceRemainingMs(uint32_t now_ms) const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _grace.remainingMs(now_ms);
}

/*=============================================================================
  EXECUTION
=============================================================================*/

bool CommandDispatcher::step() {
  MotionCommand cmd;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_queue.empty()) return false;
    cmd = _queue.front();
    _queue.pop_front();
    _busy.store(true);
    // Off before the lock drops so no obstacle stop can slip in ahead of the turn
    if (isRotation(cmd)) _range.setEnabled(false);
  }

  execute_(cmd);

  ExecutedHook hook;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _last = cmd;
    hook = _hook;
  }
  _busy.store(false);

  if (hook) hook(cmd);
  return true;
}

void CommandDispatcher::execute_(MotionCommand cmd) {
  LOG_I(TAG, "executing '%s'", motionCommandName(cmd));

  if (isRotation(cmd)) {
    rotate_(cmd);
    return;
  }

  if (cmd == MotionCommand::STOP) {
    _drive.stop();
    _range.setEnabled(true);
    return;
  }

  if (!_drive.apply(cmd)) {
    LOG_E(TAG, "command %u could not be executed, skipped", (unsigned)cmd);
  }
}

// True when the rotation hold should end early
bool CommandDispatcher::holdInterrupted_() {
  return _stopping || (!_queue.empty() && _queue.front() == MotionCommand::STOP);
}

// Detection is already off (step)
void CommandDispatcher::rotate_(MotionCommand cmd) {
  _drive.apply(cmd);

  {
    std::unique_lock<std::mutex> lock(_mutex);
    const bool cut_short = _cv.wait_for(lock,
                                        std::chrono::milliseconds(_cfg.rotation_hold_ms),
                                        [this]() { return holdInterrupted_(); });
    if (cut_short) {
      LOG_I(TAG, "'%s' cut short", motionCommandName(cmd));
    }
  }

  _drive.stop();
  _range.setEnabled(true);
}

/*=============================================================================
  THREAD
=============================================================================*/

bool CommandDispatcher::start() {
  if (_running.load()) return true;

  {
    std::lock_guard<std::mutex> lock(_mutex);
    _accepting = true;
    _stopping = false;
  }

  _running.store(true);
  _thread = std::thread(&CommandDispatcher::loop_, this);
  LOG_I(TAG, "dispatch loop started");
  return true;
}

void CommandDispatcher::loop_() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(_mutex);
      _cv.wait(lock, [this]() { return _stopping || !_queue.empty(); });
      if (_stopping) break;
    }
    step();
  }
}

void CommandDispatcher::shutdown() {
  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _accepting = false;
    _stopping = true;
    dropped = _queue.size();
    _queue.clear();
    _grace.clear();
  }
  _cv.notify_all();

  if (_thread.joinable()) {
    _thread.join();
    LOG_I(TAG, "dispatch loop stopped (%u pending dropped)", (unsigned)dropped);
  }
  _running.store(false);
}

/*=============================================================================
  INTROSPECTION
=============================================================================*/

size_t CommandDispatcher::pending() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _queue.size();
}

std::vector<MotionCommand> CommandDispatcher::pendingSnapshot() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return std::vector<MotionCommand>(_queue.begin(), _queue.end());
}

MotionCommand CommandDispatcher::lastExecuted() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _last;
}

void CommandDispatcher::setExecutedHook(const ExecutedHook& hook) {
  std::lock_guard<std::mutex> lock(_mutex);
  _hook = hook;
}
