#include "utils/Clock.h"

#include <chrono>
#include <thread>

namespace {

const std::chrono::steady_clock::time_point g_epoch = std::chrono::steady_clock::now();

}  // namespace

uint32_t millis() {
  const auto dt = std::chrono::steady_clock::now() - g_epoch;
  return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(dt).count();
}

uint32_t micros() {
  const auto dt = std::chrono::steady_clock::now() - g_epoch;
  return (uint32_t)std::chrono::duration_cast<std::chrono::microseconds>(dt).count();
}

void delayMs(uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}
