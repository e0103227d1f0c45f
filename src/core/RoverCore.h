#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <stdint.h>
#include <string>

#include "config/RoverConfig.h"
#include "config/SpeedStore.h"
#include "control/CommandDispatcher.h"
#include "control/ManeuverRunner.h"
#include "control/SafetyMonitor.h"
#include "drive/Drivetrain.h"
#include "hal/GpioPort.h"
#include "sensors/RangeSensor.h"

/*
===============================================================================
  RoverCore.h
===============================================================================

  PURPOSE
  -------
  The interface the hosting process (web server, voice front-end, the
  stdin link in main.cpp, ...) uses to drive the rover.

  Lifecycle:
    begin()     claim hardware, reload the persisted speed.
                false = fatal startup error, loops must not start.
    start()     start the dispatch and safety loops.
    shutdown()  stop accepting work, join both loops, stop the motors,
                release the GPIO port. Safe mid-motion, idempotent.

  Commands are accepted only between start() and shutdown().
===============================================================================
*/

class RoverCore {
public:
  // true when the loops came up, false when they went down
  typedef std::function<void(bool running)> LifecycleListener;

  RoverCore(GpioPort& port, const RoverConfig& cfg);
  ~RoverCore();

  bool begin();
  bool start();
  void shutdown();

  bool running() const { return _running.load(); }
  void setLifecycleListener(const LifecycleListener& listener);

  SubmitResult submitCommand(const char* name);
  SubmitResult submitCommand(MotionCommand cmd);

  // Applies (clamped) and persists. Returns the applied speed.
  int setSpeed(int pct);
  int getSpeed() const { return _drive.getSpeed(); }

  void enableDistanceDetection(bool enabled);
  bool distanceDetectionEnabled() const { return _range.enabled(); }
  RangeSensor::State distance() const { return _range.getState(); }
  void setTemperatureC(float temp_c) { _range.setTemperatureC(temp_c); }

  bool startManeuver(const char* name);
  bool stopManeuver();
  bool maneuverActive() const { return _maneuvers.active(); }
  std::string maneuverName() const { return _maneuvers.current(); }

  MotionCommand lastExecuted() const { return _dispatcher.lastExecuted(); }

  const RoverConfig& config() const { return _cfg; }
  Drivetrain& drivetrain() { return _drive; }
  RangeSensor& rangeSensor() { return _range; }
  CommandDispatcher& dispatcher() { return _dispatcher; }
  SafetyMonitor& monitor() { return _monitor; }

private:
  void notify_(bool running);

  GpioPort& _port;
  RoverConfig _cfg;

  SpeedStore _store;
  Drivetrain _drive;
  RangeSensor _range;
  CommandDispatcher _dispatcher;
  SafetyMonitor _monitor;
  ManeuverRunner _maneuvers;

  std::mutex _lifecycle_mutex;
  LifecycleListener _listener;
  bool _begun = false;
  bool _shut_down = false;
  std::atomic<bool> _running;
};
