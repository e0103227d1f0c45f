#include "control/ManeuverRunner.h"

#include <chrono>
#include <string.h>

#include "utils/Log.h"

static const char* TAG = "Maneuver";

/*=============================================================================
  BUILT-IN MANEUVERS
=============================================================================*/

static const MotionCommand F  = MotionCommand::FORWARD;
static const MotionCommand B  = MotionCommand::BACK;
static const MotionCommand L  = MotionCommand::LEFT;
static const MotionCommand R  = MotionCommand::RIGHT;
static const MotionCommand LB = MotionCommand::LEFT_BACK;
static const MotionCommand RB = MotionCommand::RIGHT_BACK;
static const MotionCommand TL = MotionCommand::TURN_LEFT;
static const MotionCommand TR = MotionCommand::TURN_RIGHT;

// times x (a, b), each held for ms
static std::vector<ManeuverStep> alternate(MotionCommand a, MotionCommand b,
                                           uint32_t ms, int times) {
  std::vector<ManeuverStep> out;
  for (int i = 0; i < times; ++i) {
    out.push_back(ManeuverStep{a, ms});
    out.push_back(ManeuverStep{b, ms});
  }
  return out;
}

// Digits are traced with straight and diagonal strokes.
// Turn steps shorter than the rotation hold queue behind the turn.
static const std::vector<Maneuver>& builtIns() {
  static const std::vector<Maneuver> kManeuvers = {
    {"digit_0",   {{F, 1500}, {R, 1500}, {B, 1500}, {L, 1500}, {F, 750}}},
    {"digit_1",   {{F, 1000}, {R, 1000}, {B, 1000}, {L, 1000}, {B, 1000},
                   {F, 1000}, {R, 1000}, {B, 1000}, {L, 1000}, {F, 500}}},
    {"digit_2",   {{R, 1000}, {LB, 1500}, {R, 1000}, {F, 500}, {L, 500}}},
    {"digit_3",   {{R, 1000}, {LB, 750}, {L, 500}, {R, 500}, {LB, 750},
                   {B, 500}, {L, 500}}},
    {"digit_4",   {{RB, 1500}, {R, 1000}, {F, 1500}, {B, 500}, {L, 500}}},
    {"digit_5",   {{R, 1000}, {B, 1000}, {LB, 750}, {L, 1000}, {F, 500}}},
    {"digit_6",   {{L, 1000}, {B, 1000}, {R, 1000}, {F, 1000}, {L, 500}}},
    {"digit_7",   {{R, 1500}, {LB, 2000}, {F, 750}, {L, 750}}},
    {"digit_8",   {{F, 1000}, {R, 1000}, {B, 1000}, {L, 1000}, {B, 1000},
                   {F, 1000}, {R, 1000}, {B, 1000}, {L, 1000}, {F, 500}}},
    {"digit_9",   {{R, 1000}, {B, 1000}, {L, 1000}, {F, 1000}, {B, 1000},
                   {L, 500}}},
    {"crab_walk", alternate(L, R, 400, 5)},
    {"box_step",  {{F, 1500}, {L, 1500}, {B, 1500}, {R, 1500}}},
    {"s_curve",   {{F, 1200}, {TL, 700}, {F, 1200}, {TR, 700}, {F, 1200}}},
    {"z_curve",   {{F, 1500}, {TR, 1000}, {F, 1500}, {TL, 1000}, {F, 1500}}},
    {"spin_fast", alternate(TL, TR, 800, 3)},
  };
  return kManeuvers;
}

const Maneuver* findManeuver(const char* name) {
  if (!name) return nullptr;
  const std::vector<Maneuver>& all = builtIns();
  for (size_t i = 0; i < all.size(); ++i) {
    if (all[i].name == name) return &all[i];
  }
  return nullptr;
}

std::string maneuverNames() {
  std::string out;
  const std::vector<Maneuver>& all = builtIns();
  for (size_t i = 0; i < all.size(); ++i) {
    if (i) out += ", ";
    out += all[i].name;
  }
  return out;
}

/*=============================================================================
  RUNNER
=============================================================================*/

ManeuverRunner::ManeuverRunner(CommandDispatcher& dispatcher)
: _dispatcher(dispatcher),
  _active(false)
{
}

ManeuverRunner::~ManeuverRunner() {
  stop();
  std::lock_guard<std::mutex> lifecycle(_lifecycle_mutex);
  reap_();
}

// Joins a thread that already finished on its own. Caller holds _lifecycle_mutex.
void ManeuverRunner::reap_() {
  if (_thread.joinable()) _thread.join();
}

bool ManeuverRunner::start(const char* name) {
  const Maneuver* m = findManeuver(name);
  if (!m) {
    LOG_E(TAG, "unknown maneuver '%s' (have: %s)", name ? name : "(null)", maneuverNames().c_str());
    return false;
  }
  return start(*m);
}

bool ManeuverRunner::start(const Maneuver& m) {
  std::lock_guard<std::mutex> lifecycle(_lifecycle_mutex);

  if (_active.load()) {
    LOG_W(TAG, "'%s' still running, '%s' refused", current().c_str(), m.name.c_str());
    return false;
  }
  if (m.steps.empty()) {
    LOG_E(TAG, "maneuver '%s' has no steps", m.name.c_str());
    return false;
  }

  reap_();

  {
    std::lock_guard<std::mutex> lock(_mutex);
    _cancel = false;
    _current = m.name;
  }

  _active.store(true);
  _thread = std::thread(&ManeuverRunner::run_, this, m);
  LOG_I(TAG, "'%s' started (%u steps)", m.name.c_str(), (unsigned)m.steps.size());
  return true;
}

void ManeuverRunner::run_(Maneuver m) {
  bool cancelled = false;

  for (size_t i = 0; i < m.steps.size() && !cancelled; ++i) {
    const ManeuverStep& step = m.steps[i];

    const SubmitResult r = _dispatcher.submit(step.cmd);
    if (r != SubmitResult::ACCEPTED) {
      LOG_E(TAG, "'%s' step %u (%s) %s, aborting", m.name.c_str(), (unsigned)i,
            motionCommandName(step.cmd), submitResultName(r));
      break;
    }

    std::unique_lock<std::mutex> lock(_mutex);
    cancelled = _cv.wait_for(lock, std::chrono::milliseconds(step.duration_ms),
                             [this]() { return _cancel; });
  }

  // On cancel stop() submits STOP itself
  if (!cancelled) {
    const SubmitResult r = _dispatcher.submit(MotionCommand::STOP);
    if (r != SubmitResult::ACCEPTED) {
      LOG_W(TAG, "'%s' final stop %s", m.name.c_str(), submitResultName(r));
    }
    LOG_I(TAG, "'%s' finished", m.name.c_str());
  }

  {
    std::lock_guard<std::mutex> lock(_mutex);
    _current.clear();
  }
  _active.store(false);
}

bool ManeuverRunner::stop() {
  std::lock_guard<std::mutex> lifecycle(_lifecycle_mutex);

  if (!_active.load()) return false;

  std::string name;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _cancel = true;
    name = _current;
  }
  _cv.notify_all();
  reap_();

  _dispatcher.submit(MotionCommand::STOP);
  LOG_I(TAG, "'%s' cancelled", name.c_str());
  return true;
}

std::string ManeuverRunner::current() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _current;
}
