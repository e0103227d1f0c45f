#include "utils/Log.h"

#include <atomic>
#include <mutex>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#include "utils/Clock.h"

namespace {

std::atomic<uint8_t> g_level((uint8_t)LogLevel::LVL_INFO);
std::atomic<LogSink> g_sink(nullptr);
std::mutex g_out_mutex;

char levelChar(LogLevel level) {
  switch (level) {
    case LogLevel::LVL_ERROR: return 'E';
    case LogLevel::LVL_WARN:  return 'W';
    case LogLevel::LVL_INFO:  return 'I';
    case LogLevel::LVL_DEBUG: return 'D';
  }
  return '?';
}

}  // namespace

void logSetLevel(LogLevel level) {
  g_level.store((uint8_t)level);
}

LogLevel logLevel() {
  return (LogLevel)g_level.load();
}

bool parseLogLevel(const char* s, LogLevel& out) {
  if (!s) return false;
  if (strcmp(s, "error") == 0) { out = LogLevel::LVL_ERROR; return true; }
  if (strcmp(s, "warn") == 0)  { out = LogLevel::LVL_WARN;  return true; }
  if (strcmp(s, "info") == 0)  { out = LogLevel::LVL_INFO;  return true; }
  if (strcmp(s, "debug") == 0) { out = LogLevel::LVL_DEBUG; return true; }
  return false;
}

void logSetSink(LogSink sink) {
  g_sink.store(sink);
}

void logPrintf(LogLevel level, const char* tag, const char* fmt, ...) {
  if ((uint8_t)level > g_level.load()) return;

  char msg[256];
  va_list args;
  va_start(args, fmt);
  vsnprintf(msg, sizeof(msg), fmt, args);
  va_end(args);

  std::lock_guard<std::mutex> lock(g_out_mutex);
  fprintf(stderr, "[%8lu ms] %c/%s: %s\n",
          (unsigned long)millis(), levelChar(level), tag ? tag : "-", msg);

  LogSink sink = g_sink.load();
  if (sink) sink(level, tag, msg);
}
