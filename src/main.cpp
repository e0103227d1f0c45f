/*
  Mecanum Rover Controller (host process)

  Purpose:
  Runs the rover control core on a Linux single-board computer and exposes
  it over a newline-delimited JSON link on stdin/stdout.

  Loop:
  - RX: HostLink.tick() reads stdin and decodes command frames
  - Apply: motion command, speed, detection switch, maneuver (in that order)
  - Watchdog: optional link timeout stops a link-commanded motion
  - TX: telemetry at TELEMETRY_UPDATE_HZ

  Usage:
    rover [--config FILE] [--log-level error|warn|info|debug] [--bringup]
*/

#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <atomic>
#include <iostream>
#include <string>

#include "Params.h"
#include "Pins.h"

#include "comms/HostLink.h"
#include "config/RoverConfig.h"
#include "core/RoverCore.h"
#include "hal/GpiodPort.h"
#include "utils/Clock.h"
#include "utils/Log.h"
#include "utils/Rate.h"

static const char* TAG = "Main";


/*=============================================================================
  GLOBALS
=============================================================================*/

static std::atomic<bool> g_quit(false);

// Rates
static Rate g_link_rate(LINK_UPDATE_HZ);
static Rate g_telemetry_rate(TELEMETRY_UPDATE_HZ);

// Result of the last applied frame, echoed in telemetry
static const char* g_last_result = nullptr;

// Link watchdog: set while a motion started by the link may still be running
static bool g_link_motion = false;


/*=============================================================================
  ARGUMENTS
=============================================================================*/

struct Options {
  const char* config_path = nullptr;
  const char* log_level = nullptr;
  bool bringup = false;
};

static void usage(const char* argv0) {
  fprintf(stderr,
          "usage: %s [--config FILE] [--log-level error|warn|info|debug] [--bringup]\n",
          argv0);
}

static bool parseArgs(int argc, char** argv, Options& opt) {
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      opt.config_path = argv[++i];
    } else if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
      opt.log_level = argv[++i];
    } else if (strcmp(argv[i], "--bringup") == 0) {
      opt.bringup = true;
    } else {
      return false;
    }
  }
  return true;
}

static void onSignal(int) {
  g_quit.store(true);
}

static void installSignalHandlers() {
  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = onSignal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}


/*=============================================================================
  BRING-UP
=============================================================================*/

// Sleeps in small slices so a signal ends the routine promptly
static bool holdFor(uint32_t ms) {
  const uint32_t until = millis() + ms;
  while ((int32_t)(millis() - until) < 0) {
    if (g_quit.load()) return false;
    delayMs(20);
  }
  return !g_quit.load();
}

// Spins each wheel forward then back at every duty step. Rover on blocks!
static void runBringup(Drivetrain& drive) {
  LOG_I(TAG, "bring-up: each wheel forward then back, %u duty steps",
        (unsigned)(sizeof(BRINGUP_DUTY_STEPS) / sizeof(BRINGUP_DUTY_STEPS[0])));

  for (uint8_t w = 0; w < WHEEL_COUNT; ++w) {
    const WheelRole role = (WheelRole)w;

    for (size_t s = 0; s < sizeof(BRINGUP_DUTY_STEPS) / sizeof(BRINGUP_DUTY_STEPS[0]); ++s) {
      const float duty = (float)BRINGUP_DUTY_STEPS[s];

      LOG_I(TAG, "%s forward %d%%", wheelRoleName(role), BRINGUP_DUTY_STEPS[s]);
      drive.driveWheelDuty(role, WheelDir::FORWARD, duty);
      if (!holdFor(BRINGUP_STEP_MS)) { drive.stop(); return; }

      LOG_I(TAG, "%s back %d%%", wheelRoleName(role), BRINGUP_DUTY_STEPS[s]);
      drive.driveWheelDuty(role, WheelDir::BACK, duty);
      if (!holdFor(BRINGUP_STEP_MS)) { drive.stop(); return; }
    }

    drive.stop();
    if (!holdFor(500)) return;
  }

  LOG_I(TAG, "bring-up done");
}


/*=============================================================================
  FRAME HANDLING
=============================================================================*/

static void applyFrame(RoverCore& core, const CommandFrame& cmd) {
  g_last_result = "accepted";

  if (cmd.command_present) {
    const SubmitResult r = core.submitCommand(cmd.command);
    g_last_result = submitResultName(r);
    if (r == SubmitResult::ACCEPTED) {
      g_link_motion = (parseMotionCommand(cmd.command) != MotionCommand::STOP);
    }
  }

  if (cmd.speed_present) {
    core.setSpeed(cmd.speed);
  }

  if (cmd.detection_present) {
    core.enableDistanceDetection(cmd.detection);
  }

  if (cmd.maneuver_present) {
    if (strcmp(cmd.maneuver, "stop") == 0) {
      core.stopManeuver();
      g_link_motion = false;
    } else if (core.startManeuver(cmd.maneuver)) {
      g_link_motion = true;
    } else {
      g_last_result = "bad_maneuver";
    }
  }
}

static void publishTelemetry(RoverCore& core, HostLink& link, uint32_t now_ms) {
  TelemetryFrame t;
  t.time_ms = now_ms;
  t.ack_seq = link.ackSeq();     // ACK = last received + parsed command seq
  t.speed = core.getSpeed();

  const RangeSensor::State range = core.distance();
  t.distance_valid = range.valid && range.enabled;
  t.distance_cm = t.distance_valid ? range.distance_cm : NAN;

  t.detection = core.distanceDetectionEnabled();
  t.running = core.running();

  const std::string maneuver = core.maneuverName();
  t.maneuver = maneuver.empty() ? nullptr : maneuver.c_str();

  t.last_command = motionCommandName(core.lastExecuted());
  t.result = g_last_result;

  // Optional note
  t.note = link.debugNote(now_ms);

  link.sendTelemetry(t);
}


/*=============================================================================
  MAIN
=============================================================================*/

int main(int argc, char** argv) {
  Options opt;
  if (!parseArgs(argc, argv, opt)) {
    usage(argv[0]);
    return 2;
  }

  RoverConfig cfg;
  if (opt.config_path && !loadRoverConfig(opt.config_path, cfg)) {
    return 1;
  }
  logSetLevel(cfg.log_level);

  if (opt.log_level) {
    LogLevel level;
    if (!parseLogLevel(opt.log_level, level)) {
      usage(argv[0]);
      return 2;
    }
    logSetLevel(level);
  }

  installSignalHandlers();

  GpiodPort port(cfg.gpio_chip.c_str(), cfg.pwm_hz);
  if (!port.begin()) {
    LOG_E(TAG, "no GPIO, exiting");
    return 1;
  }

  RoverCore core(port, cfg);
  if (!core.begin()) {
    core.shutdown();
    return 1;
  }

  if (opt.bringup) {
    runBringup(core.drivetrain());
    core.shutdown();
    return 0;
  }

  HostLink link(STDIN_FILENO, std::cout);
  if (!link.begin()) {
    core.shutdown();
    return 1;
  }

  if (!core.start()) {
    core.shutdown();
    return 1;
  }

  while (!g_quit.load()) {
    const uint32_t now_ms = millis();

    // RX tick: read stdin and apply every decoded frame in arrival order
    if (g_link_rate.ready(now_ms)) {
      link.tick(now_ms);

      CommandFrame cmd;
      while (link.nextCommand(cmd)) {
        applyFrame(core, cmd);
      }
    }

    // Link watchdog: one stop per silence, only for motions the link started
    if (cfg.link_timeout_ms > 0 && g_link_motion &&
        link.commandTimedOut(now_ms, cfg.link_timeout_ms)) {
      LOG_W(TAG, "no command for %lu ms, stopping", (unsigned long)link.commandAgeMs(now_ms));
      core.stopManeuver();
      core.submitCommand(MotionCommand::STOP);
      g_link_motion = false;
    }

    // TX tick
    if (g_telemetry_rate.ready(now_ms)) {
      publishTelemetry(core, link, now_ms);
    }

    // Sleep until the next tick is due
    uint32_t wait_ms = g_link_rate.msUntilNext(millis());
    const uint32_t tx_wait = g_telemetry_rate.msUntilNext(millis());
    if (tx_wait < wait_ms) wait_ms = tx_wait;
    delayMs(wait_ms ? wait_ms : 1);
  }

  LOG_I(TAG, "shutting down");
  core.shutdown();
  return 0;
}
