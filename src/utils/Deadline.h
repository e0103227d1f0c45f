#pragma once

#include <stdint.h>

/*
  Deadline

  An optional expiry time on the millisecond clock. Either disarmed, or
  armed with an absolute "until" timestamp. Keeping both in one value means
  the flag can never be cleared without the timestamp (or the reverse).

  Used for the obstacle monitor grace period.
*/

class Deadline {
public:
  void arm(uint32_t until_ms) {
    _until_ms = until_ms;
    _armed = true;
  }

  void armFor(uint32_t now_ms, uint32_t duration_ms) { arm(now_ms + duration_ms); }

  void clear() { _armed = false; }

  bool armed() const { return _armed; }

  // Armed and not reached yet
  bool pending(uint32_t now_ms) const {
    return _armed && (int32_t)(now_ms - _until_ms) < 0;
  }

  // Armed and reached; the owner should clear() it
  bool expired(uint32_t now_ms) const {
    return _armed && (int32_t)(now_ms - _until_ms) >= 0;
  }

  uint32_t untilMs() const { return _until_ms; }

  uint32_t remainingMs(uint32_t now_ms) const {
    return pending(now_ms) ? (uint32_t)(_until_ms - now_ms) : 0;
  }

private:
  uint32_t _until_ms = 0;
  bool _armed = false;
};
