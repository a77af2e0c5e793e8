#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "Params.h"
#include "comms/Messages.h"

/*
===============================================================================
  SerialLink.h
===============================================================================

  PURPOSE
  -------
  Host-side serial link to the I/O board:

    - Non-blocking read from a POSIX tty
    - Accumulate bytes into a newline-delimited line buffer
    - Decode "telemetry" frames and keep the latest valid one
    - Track telemetry age for TELEMETRY_STALE_MS
    - Write command lines produced by Protocol

  IMPORTANT
  ---------
  On RX buffer overflow, this class will DISCARD bytes until the next '\n'
  to resynchronize cleanly. This prevents "tail fragments" from being decoded.

  Not thread-safe on its own; SerialBackend serializes every call.
===============================================================================
*/

class SerialLink {
public:
  SerialLink(const std::string& device, uint32_t baud);
  ~SerialLink();

  SerialLink(const SerialLink&) = delete;
  SerialLink& operator=(const SerialLink&) = delete;

  // Open and configure the tty (raw 8N1). False if the device is unusable.
  bool begin();
  void end();

  bool isOpen() const { return _fd >= 0; }
  const std::string& device() const { return _device; }

  // Reads any available bytes and decodes complete lines. Never blocks.
  void tick(uint32_t now_ms);

  // Feed bytes as if they arrived on the wire (used by tick and by tests)
  void consume(const char* data, size_t len, uint32_t now_ms);

  // Writes one complete line. False if the port is closed or the write failed.
  bool writeLine(const std::string& line);

  // True if at least one valid telemetry frame has been received.
  bool hasTelemetry() const { return _has_telemetry; }

  // Latest successfully decoded frame (only meaningful if hasTelemetry()).
  const TelemetryFrame& latestTelemetry() const { return _latest; }

  // True if no telemetry arrived within TELEMETRY_STALE_MS.
  bool telemetryStale(uint32_t now_ms) const;

  // RX stats
  uint32_t rxLines() const { return _lines; }
  uint32_t rxOk() const { return _ok; }
  uint32_t rxFail() const { return _fail; }
  uint32_t rxOverflow() const { return _ovf; }
  uint16_t rxMaxLenSeen() const { return _max_len_seen; }

private:
  void handleLine_(uint32_t now_ms);

  std::string _device;
  uint32_t _baud;
  int _fd = -1;

  static constexpr size_t RX_BUF_SIZE = SERIAL_LINE_BUFFER_BYTES;
  char _rx_buf[RX_BUF_SIZE];
  size_t _rx_len = 0;

  // When true, we are discarding bytes until newline due to overflow
  bool _dropping = false;

  // Latest decoded telemetry
  TelemetryFrame _latest;
  bool _has_telemetry = false;
  uint32_t _last_rx_ms = 0;

  // RX debug stats
  uint32_t _lines = 0;
  uint32_t _ok = 0;
  uint32_t _fail = 0;
  uint32_t _ovf = 0;
  uint16_t _max_len_seen = 0;
};
