#pragma once
#include <deque>
#include <iosfwd>
#include <stddef.h>
#include <stdint.h>

#include "Params.h"
#include "comms/Messages.h"

/*
===============================================================================
  HostLink.h
===============================================================================

  PURPOSE
  -------
  Rover-side line link to the host process:

    - Non-blocking read from a file descriptor (stdin by default)
    - Accumulate bytes into a newline-delimited line buffer
    - Decode "cmd" frames into a FIFO the main loop drains
    - Track command age for the optional link watchdog
    - Send telemetry frames via Protocol

  IMPORTANT
  ---------
  On RX buffer overflow, this class will DISCARD bytes until the next '\n'
  to resynchronize cleanly. This prevents "tail fragments" from being decoded.

===============================================================================
*/

class HostLink {
public:
  HostLink(int in_fd, std::ostream& out);

  // Puts the input fd in non-blocking mode. false if that failed.
  bool begin();

  // Reads whatever is available and decodes complete lines. Never blocks.
  void tick(uint32_t now_ms);

  // Feed raw bytes directly (tick() uses this; tests can too)
  void feed(const char* data, size_t len, uint32_t now_ms);

  // Pops the oldest decoded command. false if none pending.
  bool nextCommand(CommandFrame& out);

  // Encodes and writes one telemetry line.
  void sendTelemetry(const TelemetryFrame& t);

  // True if no command arrived within timeout_ms (or none ever did).
  bool commandTimedOut(uint32_t now_ms, uint32_t timeout_ms) const;

  // Time since last command was received (ms). If never received, returns large.
  uint32_t commandAgeMs(uint32_t now_ms) const;

  // ACK = last command seq that was received + parsed successfully
  uint32_t ackSeq() const { return _ack_seq; }

  // Input reached end of file (host closed its end)
  bool eof() const { return _eof; }
  int fd() const { return _fd; }

  // Short RX debug note (valid until _note_until_ms)
  const char* debugNote(uint32_t now_ms) const {
    return ((int32_t)(_note_until_ms - now_ms) >= 0 && _note_buf[0]) ? _note_buf : nullptr;
  }

  // RX stats
  uint32_t rxLines() const { return _lines; }
  uint32_t rxOk() const { return _ok; }
  uint32_t rxFail() const { return _fail; }
  uint32_t rxOverflow() const { return _ovf; }
  uint32_t rxDropped() const { return _dropped; }   // frames lost to a full backlog

private:
  void handleLine_(uint32_t now_ms);
  void enqueue_(const CommandFrame& f);
  void note_(uint32_t now_ms, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

  int _fd;
  std::ostream& _out;
  bool _eof = false;

  static constexpr size_t RX_BUF_SIZE = LINK_LINE_BUFFER_BYTES;
  char _rx_buf[RX_BUF_SIZE];
  size_t _rx_len = 0;

  // When true, we are discarding bytes until newline due to overflow
  bool _dropping = false;

  std::deque<CommandFrame> _pending;

  // Command freshness
  bool _has_cmd = false;
  uint32_t _last_cmd_ms = 0;

  // ACK bookkeeping
  uint32_t _ack_seq = 0;

  // RX debug stats
  uint32_t _lines = 0;
  uint32_t _ok = 0;
  uint32_t _fail = 0;
  uint32_t _ovf = 0;
  uint32_t _dropped = 0;

  // Debug note buffer (for telemetry note)
  char _note_buf[96];
  uint32_t _note_until_ms = 0;
};
