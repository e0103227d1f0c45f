#pragma once

#include <stdint.h>

/*
===============================================================================
  Log.h
===============================================================================

  PURPOSE
  -------
  Small leveled logger for the control core.

    LOG_E(TAG, "failed to open %s", name);
    LOG_I(TAG, "speed set to %d", pct);

  Output format (stderr, one line per call):
    [    1234 ms] W/Range: echo timeout (rise)

  Thread safe: each line is formatted first and written under a mutex, so
  lines from the dispatch and monitor threads never interleave.
===============================================================================
*/

enum class LogLevel : uint8_t {
  LVL_ERROR = 0,
  LVL_WARN,
  LVL_INFO,
  LVL_DEBUG,
};

void logSetLevel(LogLevel level);
LogLevel logLevel();

// Accepts "error", "warn", "info", "debug". Returns false on anything else.
bool parseLogLevel(const char* s, LogLevel& out);

// Optional capture hook (tests). nullptr restores stderr only.
typedef void (*LogSink)(LogLevel level, const char* tag, const char* msg);
void logSetSink(LogSink sink);

void logPrintf(LogLevel level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

#define LOG_E(tag, ...) logPrintf(LogLevel::LVL_ERROR, tag, __VA_ARGS__)
#define LOG_W(tag, ...) logPrintf(LogLevel::LVL_WARN, tag, __VA_ARGS__)
#define LOG_I(tag, ...) logPrintf(LogLevel::LVL_INFO, tag, __VA_ARGS__)
#define LOG_D(tag, ...) logPrintf(LogLevel::LVL_DEBUG, tag, __VA_ARGS__)
