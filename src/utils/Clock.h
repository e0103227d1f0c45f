#pragma once

#include <stdint.h>

/*
  Clock.h

  Arduino-style monotonic time for the Linux build.
  Both counters start at process start and wrap like millis()/micros()
  do on a microcontroller, so callers compare with signed subtraction.
*/

uint32_t millis();
uint32_t micros();

// Sleeps the calling thread (not a busy-wait).
void delayMs(uint32_t ms);
