#include "control/SafetyMonitor.h"

#include <chrono>

#include "utils/Clock.h"
#include "utils/Log.h"
#include "utils/Rate.h"

static const char* TAG = "Safety";

const char* tickResultName(SafetyMonitor::TickResult r) {
  switch (r) {
    case SafetyMonitor::TickResult::GRACE:     return "grace";
    case SafetyMonitor::TickResult::DISABLED:  return "disabled";
    case SafetyMonitor::TickResult::NO_ECHO:   return "no_echo";
    case SafetyMonitor::TickResult::CLEAR:     return "clear";
    case SafetyMonitor::TickResult::STOP_SENT: return "stop_sent";
    case SafetyMonitor::TickResult::STOP_REJECTED: return "stop_rejected";
  }
  return "unknown";
}

SafetyMonitor::SafetyMonitor(RangeSensor& range,
                             Drivetrain& drive,
                             CommandDispatcher& dispatcher,
                             const SafetyConfig& cfg)
: _range(range),
  _drive(drive),
  _dispatcher(dispatcher),
  _cfg(cfg),
  _running(false)
{
  if (_cfg.period_ms == 0) _cfg.period_ms = MONITOR_PERIOD_MS;
}

SafetyMonitor::~SafetyMonitor() {
  shutdown();
}

SafetyMonitor::TickResult SafetyMonitor::tick(uint32_t now_ms) {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _stats.ticks++;
  }

  if (_dispatcher.gracePending(now_ms)) {
    std::lock_guard<std::mutex> lock(_mutex);
    _stats.grace_skips++;
    return TickResult::GRACE;
  }

  const RangeSensor::Sample s = _range.measure(now_ms);

  if (s.status == RangeSensor::Status::DISABLED) {
    return TickResult::DISABLED;
  }

  if (!s.valid()) {
    std::lock_guard<std::mutex> lock(_mutex);
    _stats.no_echo++;
    return TickResult::NO_ECHO;
  }

  const float threshold = thresholdCm(_drive.getSpeed());
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _stats.last_distance_cm = s.distance_cm;
    _stats.last_threshold_cm = threshold;
  }

  if (s.distance_cm > 0.0f && s.distance_cm < threshold) {
    const SubmitResult r = _dispatcher.submitObstacleStop(now_ms);

    std::lock_guard<std::mutex> lock(_mutex);
    switch (r) {
      case SubmitResult::ACCEPTED:
        LOG_W(TAG, "obstacle at %.1f cm (< %.1f cm), stopping",
              (double)s.distance_cm, (double)threshold);
        _stats.stops++;
        return TickResult::STOP_SENT;
      case SubmitResult::GRACE_PENDING:
        _stats.grace_skips++;
        return TickResult::GRACE;
      case SubmitResult::DETECTION_OFF:
        return TickResult::DISABLED;
      default:
        LOG_W(TAG, "obstacle at %.1f cm but stop %s",
              (double)s.distance_cm, submitResultName(r));
        _stats.rejected_stops++;
        return TickResult::STOP_REJECTED;
    }
  }

  return TickResult::CLEAR;
}

bool SafetyMonitor::start() {
  if (_running.load()) return true;

  {
    std::lock_guard<std::mutex> lock(_mutex);
    _stopping = false;
  }

  _running.store(true);
  _thread = std::thread(&SafetyMonitor::loop_, this);
  LOG_I(TAG, "monitor started, every %lu ms, threshold %.1f + %.2f * speed cm",
        (unsigned long)_cfg.period_ms, (double)_cfg.base_cm, (double)_cfg.speed_factor);
  return true;
}

void SafetyMonitor::loop_() {
  Rate rate;
  rate.setPeriodMs(_cfg.period_ms);

  while (true) {
    const uint32_t now_ms = millis();
    if (rate.ready(now_ms)) {
      tick(now_ms);
    }

    std::unique_lock<std::mutex> lock(_mutex);
    const uint32_t wait_ms = rate.msUntilNext(millis());
    if (_cv.wait_for(lock, std::chrono::milliseconds(wait_ms), [this]() { return _stopping; })) {
      break;
    }
  }
}

void SafetyMonitor::shutdown() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _stopping = true;
  }
  _cv.notify_all();

  if (_thread.joinable()) {
    _thread.join();
    LOG_I(TAG, "monitor stopped");
  }
  _running.store(false);
}

SafetyMonitor::Stats SafetyMonitor::stats() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _stats;
}
