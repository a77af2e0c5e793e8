#include "comms/SerialLink.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

#include "comms/Protocol.h"
#include "utils/Log.h"

/*
===============================================================================
  SerialLink.cpp
===============================================================================

  Key behavior:
  - Ignores '\r'
  - '\n' ends a frame
  - If RX buffer would overflow, enters "dropping" mode until next '\n'
===============================================================================
*/

namespace {

const char* kTag = "Serial";

bool baudConstant(uint32_t baud, speed_t& out) {
  switch (baud) {
    case 9600:   out = B9600;   return true;
    case 19200:  out = B19200;  return true;
    case 38400:  out = B38400;  return true;
    case 57600:  out = B57600;  return true;
    case 115200: out = B115200; return true;
    case 230400: out = B230400; return true;
    default:     return false;
  }
}

}  // namespace

SerialLink::SerialLink(const std::string& device, uint32_t baud)
: _device(device),
  _baud(baud)
{
  memset(_rx_buf, 0, sizeof(_rx_buf));
}

SerialLink::~SerialLink() {
  end();
}

bool SerialLink::begin() {
  _rx_len = 0;
  _dropping = false;
  _has_telemetry = false;
  _last_rx_ms = 0;
  _lines = _ok = _fail = _ovf = 0;
  _max_len_seen = 0;
  memset(_rx_buf, 0, sizeof(_rx_buf));

  speed_t speed;
  if (!baudConstant(_baud, speed)) {
    LOG_ERROR(kTag, "unsupported baud %lu", (unsigned long)_baud);
    return false;
  }

  _fd = open(_device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if (_fd < 0) {
    LOG_WARN(kTag, "open %s failed: %s", _device.c_str(), strerror(errno));
    return false;
  }

  struct termios tio;
  if (tcgetattr(_fd, &tio) != 0) {
    LOG_WARN(kTag, "%s is not a tty: %s", _device.c_str(), strerror(errno));
    end();
    return false;
  }

  cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CSTOPB;
  tio.c_cflag &= ~CRTSCTS;
  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);

  if (tcsetattr(_fd, TCSANOW, &tio) != 0) {
    LOG_WARN(kTag, "configure %s failed: %s", _device.c_str(), strerror(errno));
    end();
    return false;
  }
  tcflush(_fd, TCIOFLUSH);

  LOG_INFO(kTag, "opened %s @ %lu baud, RX_BUF_SIZE=%u",
           _device.c_str(), (unsigned long)_baud, (unsigned)RX_BUF_SIZE);
  return true;
}

void SerialLink::end() {
  if (_fd < 0) return;
  close(_fd);
  _fd = -1;
}

bool SerialLink::telemetryStale(uint32_t now_ms) const {
  if (!_has_telemetry) return true; // never received
  return (now_ms - _last_rx_ms) > TELEMETRY_STALE_MS;
}

bool SerialLink::writeLine(const std::string& line) {
  if (_fd < 0) return false;

  size_t off = 0;
  while (off < line.size()) {
    const ssize_t w = write(_fd, line.data() + off, line.size() - off);
    if (w < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN) {
        // Output buffer full: wait for the driver to drain rather than split a frame
        tcdrain(_fd);
        continue;
      }
      LOG_WARN(kTag, "write failed: %s", strerror(errno));
      return false;
    }
    off += (size_t)w;
  }
  return true;
}

void SerialLink::tick(uint32_t now_ms) {
  if (_fd < 0) return;

  char chunk[256];
  for (;;) {
    const ssize_t n = read(_fd, chunk, sizeof(chunk));
    if (n > 0) {
      consume(chunk, (size_t)n, now_ms);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && errno != EAGAIN) {
      LOG_WARN(kTag, "read failed: %s", strerror(errno));
    }
    break;
  }
}

void SerialLink::consume(const char* data, size_t len, uint32_t now_ms) {
  for (size_t i = 0; i < len; i++) {
    const char ch = data[i];

    if (ch == '\r') continue;

    if (_dropping) {
      // We overflowed earlier; discard until newline to resync
      if (ch == '\n') {
        _dropping = false;
        _rx_len = 0;
        memset(_rx_buf, 0, sizeof(_rx_buf));
        LOG_DEBUG(kTag, "RX RESYNC");
      }
      continue;
    }

    if (ch == '\n') {
      // End of frame
      _rx_buf[_rx_len] = '\0';

      _lines++;

      // Track max length seen (helps confirm sizing)
      if (_rx_len > _max_len_seen) _max_len_seen = (uint16_t)_rx_len;

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
      LOG_WARN(kTag, "RX OVERFLOW lines=%lu ok=%lu fail=%lu ovf=%lu head=%.24s",
               (unsigned long)_lines,
               (unsigned long)_ok,
               (unsigned long)_fail,
               (unsigned long)_ovf,
               _rx_buf);

      // Reset buffer for next frame after resync
      _rx_len = 0;
      memset(_rx_buf, 0, sizeof(_rx_buf));
    }
  }
}

void SerialLink::handleLine_(uint32_t now_ms) {
  if (_rx_buf[0] == '\0') return;

  TelemetryFrame frame;
  if (protocol::decodeTelemetryLine(_rx_buf, frame) && frame.valid) {
    _latest = frame;
    _has_telemetry = true;
    _last_rx_ms = now_ms;
    _ok++;
  } else {
    _fail++;

    // Show head + length so we can tell if schema/JSON is weird
    LOG_WARN(kTag, "RX FAIL (lines=%lu ok=%lu fail=%lu ovf=%lu) len=%u head=%.24s",
             (unsigned long)_lines,
             (unsigned long)_ok,
             (unsigned long)_fail,
             (unsigned long)_ovf,
             (unsigned)_rx_len,
             _rx_buf);
  }
}
