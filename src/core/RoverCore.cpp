#include "core/RoverCore.h"

#include "utils/Log.h"

static const char* TAG = "Core";

RoverCore::RoverCore(GpioPort& port, const RoverConfig& cfg)
: _port(port),
  _cfg(cfg),
  _store(cfg.speed_store_path, cfg.drive.min_speed, cfg.drive.initial_speed),
  _drive(port, cfg.drive),
  _range(port, cfg.trig_pin, cfg.echo_pin, cfg.echo_timeout_us,
         cfg.distance_buffer_size, cfg.temperature_c),
  _dispatcher(_drive, _range, cfg.dispatch),
  _monitor(_range, _drive, _dispatcher, cfg.safety),
  _maneuvers(_dispatcher),
  _running(false)
{
}

RoverCore::~RoverCore() {
  shutdown();
}

bool RoverCore::begin() {
  std::lock_guard<std::mutex> lock(_lifecycle_mutex);
  if (_begun) return true;

  if (!_drive.begin()) {
    LOG_E(TAG, "drivetrain init failed, refusing to start");
    return false;
  }
  if (!_range.begin()) {
    LOG_E(TAG, "range sensor init failed, refusing to start");
    _drive.stop();
    return false;
  }

  _drive.setSpeed(_store.load());

  _begun = true;
  LOG_I(TAG, "hardware ready");
  return true;
}

bool RoverCore::start() {
  {
    std::lock_guard<std::mutex> lock(_lifecycle_mutex);
    if (!_begun) {
      LOG_E(TAG, "start() without a successful begin()");
      return false;
    }
    if (_shut_down) {
      LOG_E(TAG, "start() after shutdown()");
      return false;
    }
    if (_running.load()) return true;

    _dispatcher.start();
    _monitor.start();
    _running.store(true);
  }

  LOG_I(TAG, "started, speed %d%%", _drive.getSpeed());
  notify_(true);
  return true;
}

void RoverCore::shutdown() {
  bool was_running = false;
  {
    std::lock_guard<std::mutex> lock(_lifecycle_mutex);
    if (_shut_down) return;
    _shut_down = true;
    was_running = _running.exchange(false);

    // Order matters: the monitor must not submit into a stopped dispatcher,
    // and the motors are stopped only once nothing can restart them.
    _maneuvers.stop();
    _monitor.shutdown();
    _dispatcher.shutdown();
    if (_begun) _drive.stop();
    _port.release();
  }

  LOG_I(TAG, "shut down, motors stopped, GPIO released");
  if (was_running) notify_(false);
}

void RoverCore::setLifecycleListener(const LifecycleListener& listener) {
  std::lock_guard<std::mutex> lock(_lifecycle_mutex);
  _listener = listener;
}

void RoverCore::notify_(bool running) {
  LifecycleListener listener;
  {
    std::lock_guard<std::mutex> lock(_lifecycle_mutex);
    listener = _listener;
  }
  if (listener) listener(running);
}

SubmitResult RoverCore::submitCommand(const char* name) {
  const MotionCommand cmd = parseMotionCommand(name);
  if (cmd == MotionCommand::UNKNOWN) {
    LOG_E(TAG, "unknown command '%s'", name ? name : "(null)");
    return SubmitResult::UNKNOWN_COMMAND;
  }
  return submitCommand(cmd);
}

SubmitResult RoverCore::submitCommand(MotionCommand cmd) {
  if (!_running.load()) {
    LOG_W(TAG, "'%s' rejected, core not running", motionCommandName(cmd));
    return SubmitResult::REJECTED_STOPPED;
  }
  return _dispatcher.submit(cmd);
}

int RoverCore::setSpeed(int pct) {
  const int applied = _drive.setSpeed(pct);
  if (!_store.save(applied)) {
    LOG_W(TAG, "speed %d%% applied but not persisted", applied);
  }
  LOG_I(TAG, "speed %d%%", applied);
  return applied;
}

void RoverCore::enableDistanceDetection(bool enabled) {
  _range.setEnabled(enabled);
  LOG_I(TAG, "distance detection %s", enabled ? "on" : "off");
}

bool RoverCore::startManeuver(const char* name) {
  if (!_running.load()) {
    LOG_W(TAG, "maneuver refused, core not running");
    return false;
  }
  return _maneuvers.start(name);
}

bool RoverCore::stopManeuver() {
  return _maneuvers.stop();
}
