#include "comms/HostLink.h"

#include <errno.h>
#include <fcntl.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include "comms/Protocol.h"
#include "drive/MotionCommand.h"
#include "utils/Log.h"

/*
===============================================================================
  HostLink.cpp
===============================================================================

  Key behavior:
  - Ignores '\r'
  - '\n' ends a frame
  - If RX buffer would overflow, enters "dropping" mode until next '\n'
===============================================================================
*/

static const char* TAG = "Link";

// Cap on decoded-but-unapplied frames; the main loop drains every tick
static const size_t MAX_PENDING_FRAMES = 64;

HostLink::HostLink(int in_fd, std::ostream& out)
: _fd(in_fd),
  _out(out)
{
  memset(_rx_buf, 0, sizeof(_rx_buf));
  memset(_note_buf, 0, sizeof(_note_buf));
}

bool HostLink::begin() {
  _rx_len = 0;
  _dropping = false;
  _eof = false;
  _pending.clear();

  const int flags = fcntl(_fd, F_GETFL, 0);
  if (flags < 0 || fcntl(_fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    LOG_E(TAG, "cannot make fd %d non-blocking: %s", _fd, strerror(errno));
    return false;
  }

  LOG_I(TAG, "listening on fd %d, line buffer %u bytes", _fd, (unsigned)RX_BUF_SIZE);
  return true;
}

void HostLink::sendTelemetry(const TelemetryFrame& t) {
  protocol::encodeTelemetryLine(t, _out);
}

bool HostLink::commandTimedOut(uint32_t now_ms, uint32_t timeout_ms) const {
  if (!_has_cmd) return true; // never received
  return (now_ms - _last_cmd_ms) > timeout_ms;
}

uint32_t HostLink::commandAgeMs(uint32_t now_ms) const {
  if (!_has_cmd) return 0xFFFFFFFFUL;
  return now_ms - _last_cmd_ms;
}

bool HostLink::nextCommand(CommandFrame& out) {
  if (_pending.empty()) return false;
  out = _pending.front();
  _pending.pop_front();
  return true;
}

void HostLink::note_(uint32_t now_ms, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vsnprintf(_note_buf, sizeof(_note_buf), fmt, args);
  va_end(args);
  _note_until_ms = now_ms + 1500;
}

void HostLink::tick(uint32_t now_ms) {
  if (_eof) return;

  char chunk[256];
  while (true) {
    const ssize_t n = read(_fd, chunk, sizeof(chunk));
    if (n > 0) {
      feed(chunk, (size_t)n, now_ms);
      continue;
    }
    if (n == 0) {
      _eof = true;
      LOG_I(TAG, "host closed the link");
      return;
    }
    if (errno == EINTR) continue;
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      LOG_E(TAG, "read failed: %s", strerror(errno));
      _eof = true;
    }
    return;
  }
}

void HostLink::feed(const char* data, size_t len, uint32_t now_ms) {
  for (size_t i = 0; i < len; ++i) {
    const char ch = data[i];

    if (ch == '\r') continue;

    if (_dropping) {
      // We overflowed earlier; discard until newline to resync
      if (ch == '\n') {
        _dropping = false;
        _rx_len = 0;
      }
      continue;
    }

    if (ch == '\n') {
      // End of frame
      _rx_buf[_rx_len] = '\0';
      _lines++;
      handleLine_(now_ms);
      _rx_len = 0;
      continue;
    }

    // Append to buffer if there is room (leave space for '\0')
    if (_rx_len + 1 < RX_BUF_SIZE) {
      _rx_buf[_rx_len++] = ch;
    } else {
      // Buffer overflow: discard remainder until newline
      _ovf++;
      _dropping = true;
      _rx_buf[RX_BUF_SIZE - 1] = '\0';
      note_(now_ms, "RX OVERFLOW ovf=%lu head=%.24s", (unsigned long)_ovf, _rx_buf);
      LOG_W(TAG, "line longer than %u bytes dropped", (unsigned)RX_BUF_SIZE);
      _rx_len = 0;
    }
  }
}

// Frames that halt the rover: a stop command or a maneuver cancel
static bool isStopFrame(const CommandFrame& f) {
  if (f.command_present && parseMotionCommand(f.command) == MotionCommand::STOP) return true;
  return f.maneuver_present && strcmp(f.maneuver, "stop") == 0;
}

// A full backlog sheds its oldest non-stop frame; stop frames are never evicted
void HostLink::enqueue_(const CommandFrame& f) {
  if (_pending.size() >= MAX_PENDING_FRAMES) {
    std::deque<CommandFrame>::iterator victim = _pending.begin();
    while (victim != _pending.end() && isStopFrame(*victim)) ++victim;

    _dropped++;
    if (victim != _pending.end()) {
      LOG_W(TAG, "frame backlog full, seq %lu dropped", (unsigned long)victim->seq);
      _pending.erase(victim);
    } else if (!isStopFrame(f)) {
      LOG_W(TAG, "frame backlog full of stops, seq %lu dropped", (unsigned long)f.seq);
      return;
    } else {
      // Another stop is already pending
      LOG_W(TAG, "frame backlog full of stops, seq %lu dropped", (unsigned long)_pending.front().seq);
      _pending.pop_front();
    }
  }
  _pending.push_back(f);
}

void HostLink::handleLine_(uint32_t now_ms) {
  if (_rx_buf[0] == '\0') return;

  CommandFrame cmd;
  if (protocol::decodeCommandLine(_rx_buf, cmd) && cmd.valid) {
    enqueue_(cmd);
    _has_cmd = true;
    _last_cmd_ms = now_ms;
    _ack_seq = cmd.seq;
    _ok++;
    note_(now_ms, "RX OK seq=%lu", (unsigned long)cmd.seq);
  } else {
    _fail++;
    note_(now_ms, "RX FAIL (ok=%lu fail=%lu) head=%.24s",
          (unsigned long)_ok, (unsigned long)_fail, _rx_buf);
    LOG_W(TAG, "undecodable frame: %.48s", _rx_buf);
  }
}
