#include "commands/CommandProcessor.h"

#include <ctype.h>
#include <errno.h>
#include <math.h>
#include <poll.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

#include "Params.h"
#include "actuators/ActuatorController.h"
#include "events/EventBus.h"
#include "game/GameController.h"
#include "sensors/SensorMonitor.h"
#include "utils/Log.h"

namespace {

const char* kTag = "Console";

struct KeyBinding {
  char key;
  const char* line;
};

const KeyBinding KEY_TABLE[] = {
  {'s', "start"},
  {'n', "next"},
  {'r', "dispense red"},
  {'g', "dispense green"},
  {'1', "hit 1"},
  {'2', "hit 2"},
  {'3', "hit 3"},
  {'4', "hit 4"},
  {'5', "hit 5"},
  {'6', "hit 6"},
  {'7', "hit 7"},
  {'c', "confirm 1"},
  {'t', "tunnel"},
  {'b', "return"},
  {'l', "launch"},
};

std::string ok() { return "OK"; }

std::string err(int code, const std::string& msg) {
  return "ERR:" + std::to_string(code) + ":" + msg;
}

std::vector<std::string> split(const std::string& line) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && isspace((unsigned char)line[i])) i++;
    size_t j = i;
    while (j < line.size() && !isspace((unsigned char)line[j])) j++;
    if (j > i) out.push_back(line.substr(i, j - i));
    i = j;
  }
  return out;
}

bool parseInt(const std::string& text, long& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const long v = strtol(text.c_str(), &end, 10);
  if (errno != 0 || *end != '\0') return false;
  out = v;
  return true;
}

bool parseFloat(const std::string& text, float& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const float v = strtof(text.c_str(), &end);
  if (errno != 0 || *end != '\0' || !isfinite(v)) return false;
  out = v;
  return true;
}

bool parseId(const std::string& text, long max, uint8_t& out) {
  long v = 0;
  if (!parseInt(text, v) || v < 0 || v > max) return false;
  out = (uint8_t)v;
  return true;
}

}  // namespace

CommandProcessor::CommandProcessor(EventBus& bus, ActuatorController& actuators,
                                   SensorMonitor& sensors, const GameController* game)
: _bus(bus),
  _actuators(actuators),
  _sensors(sensors),
  _game(game),
  _running(false)
{
}

CommandProcessor::~CommandProcessor() {
  stop();
}

/*=============================================================================
  PARSING
=============================================================================*/

std::string CommandProcessor::handleLine(const std::string& line) {
  const std::vector<std::string> args = split(line);
  if (args.empty()) return std::string();

  std::string verb = args[0];
  for (char& c : verb) c = (char)tolower((unsigned char)c);
  const size_t argc = args.size() - 1;

  // Verbs without arguments
  struct Simple { const char* verb; EventKind kind; };
  static const Simple SIMPLE[] = {
    {"start",  EventKind::START},
    {"reset",  EventKind::RESET},
    {"next",   EventKind::NEXT_TURN},
    {"tunnel", EventKind::TUNNEL},
    {"launch", EventKind::LAUNCH},
    {"return", EventKind::BALL_RETURN},
  };
  for (const Simple& s : SIMPLE) {
    if (verb != s.verb) continue;
    if (argc != 0) return err(ERR_FORMAT, std::string("usage: ") + s.verb);
    return publish_(events::make(s.kind, EventSource::COMMAND));
  }

  if (verb == "dispense") {
    Team team;
    if (argc != 1) return err(ERR_FORMAT, "usage: dispense red|green");
    if (!parseTeam(args[1].c_str(), team)) return err(ERR_UNKNOWN_ID, "unknown team " + args[1]);
    return publish_(events::dispense(EventSource::COMMAND, team));
  }

  if (verb == "hit" || verb == "confirm") {
    long target = 0;
    if (argc != 1 || !parseInt(args[1], target)) return err(ERR_FORMAT, "usage: " + verb + " <n>");
    if (target < 1 || target > NUM_TARGETS) {
      return err(ERR_UNKNOWN_ID, "no target " + args[1]);
    }
    return publish_(verb == "hit" ? events::targetHit(EventSource::COMMAND, (int)target)
                                  : events::targetConfirm(EventSource::COMMAND, (int)target));
  }

  if (verb == "servo") {
    uint8_t id = 0;
    float deg = 0.0f;
    float dps = 0.0f;
    if (argc < 2 || argc > 3 || !parseFloat(args[2], deg) ||
        (argc == 3 && !parseFloat(args[3], dps))) {
      return err(ERR_FORMAT, "usage: servo <id> <deg> [dps]");
    }
    if (!parseId(args[1], 255, id) || !_actuators.hasServo(id)) {
      return err(ERR_UNKNOWN_ID, "no servo " + args[1]);
    }
    if (argc == 3 && dps <= 0.0f) return err(ERR_RANGE, "speed must be > 0");
    if (!_actuators.move(id, deg, dps)) return err(ERR_UNKNOWN_ID, "no servo " + args[1]);
    return ok();
  }

  if (verb == "calibrate") {
    uint8_t id = 0;
    float deg = 0.0f;
    if (argc != 2 || !parseFloat(args[2], deg)) return err(ERR_FORMAT, "usage: calibrate <id> <deg>");
    if (!parseId(args[1], 255, id) || !_actuators.hasServo(id)) {
      return err(ERR_UNKNOWN_ID, "no servo " + args[1]);
    }
    if (!_actuators.calibrate(id, deg)) return err(ERR_UNKNOWN_ID, "no servo " + args[1]);
    return ok();
  }

  if (verb == "sensitivity") {
    uint8_t channel = 0;
    long value = 0;
    if (argc != 2 || !parseInt(args[2], value)) {
      return err(ERR_FORMAT, "usage: sensitivity <ch> <value>");
    }
    if (!parseId(args[1], 255, channel) || !_sensors.hasChannel(channel)) {
      return err(ERR_UNKNOWN_ID, "no sensor channel " + args[1]);
    }
    if (value < PRESSURE_MIN_THRESHOLD || value > PRESSURE_MAX_THRESHOLD) {
      return err(ERR_RANGE, "value must be 0..1023");
    }
    if (!_sensors.setThreshold(channel, (int)value)) {
      LOG_WARN(kTag, "threshold for channel %u kept in memory only", (unsigned)channel);
    }
    return ok();
  }

  if (verb == "status") {
    if (argc != 0) return err(ERR_FORMAT, "usage: status");
    return status_() + "OK";
  }

  if (verb == "help") {
    return help() + "OK";
  }

  return err(ERR_FORMAT, "unknown command " + args[0]);
}

std::string CommandProcessor::handleKey(char key) {
  const char k = (char)tolower((unsigned char)key);
  for (const KeyBinding& b : KEY_TABLE) {
    if (b.key == k) return handleLine(b.line);
  }
  return err(ERR_FORMAT, std::string("unbound key '") + key + "'");
}

std::string CommandProcessor::publish_(const Event& ev) {
  if (!_bus.publish(ev)) return err(ERR_FORMAT, "shutting down");
  return ok();
}

std::string CommandProcessor::status_() const {
  std::string out;
  char buf[128];

  if (_game) {
    const GameController::Snapshot s = _game->snapshot();
    snprintf(buf, sizeof(buf), "state %s, turn %lu, outcome %s\n",
             stateName(s.state), (unsigned long)s.turn, outcomeName(s.outcome));
    out += buf;

    for (int i = 0; i < TEAM_COUNT; i++) {
      const Team t = (Team)i;
      snprintf(buf, sizeof(buf), "%s%s: %u hits, next target %u\n",
               (s.has_active && s.active == t) ? "* " : "  ",
               teamName(t), (unsigned)s.hits[i], (unsigned)s.required[i]);
      out += buf;
    }
  }

  snprintf(buf, sizeof(buf), "events: %llu published, %lu dropped\n",
           (unsigned long long)_bus.published(), (unsigned long)_bus.dropped());
  out += buf;
  return out;
}

std::string CommandProcessor::help() {
  return
    "start                      new game (coin flip)\n"
    "reset                      back to waiting for start\n"
    "next                       force the next turn\n"
    "dispense red|green         pour for a team\n"
    "hit <n>                    target n was hit\n"
    "confirm <n>                second stage of target n\n"
    "tunnel                     ball went through the tunnel\n"
    "launch                     fire the plunger\n"
    "return                     ball came back\n"
    "servo <id> <deg> [dps]     move a servo\n"
    "calibrate <id> <deg>       set a servo's start angle\n"
    "sensitivity <ch> <value>   set a pressure threshold (0..1023)\n"
    "status                     game summary\n"
    "keys: s n r g 1-7 c t b l\n";
}

/*=============================================================================
  READER THREAD
=============================================================================*/

void CommandProcessor::start(int in_fd, int out_fd, bool key_mode) {
  if (_running.exchange(true)) return;
  // A reader that ended on EOF or an error is still joinable
  if (_thread.joinable()) _thread.join();
  _thread = std::thread(&CommandProcessor::loop_, this, in_fd, out_fd, key_mode);
}

void CommandProcessor::stop() {
  _running.store(false);
  if (_thread.joinable()) _thread.join();
}

void CommandProcessor::run(int in_fd, int out_fd, bool key_mode) {
  _running.store(true);
  loop_(in_fd, out_fd, key_mode);
}

void CommandProcessor::loop_(int in_fd, int out_fd, bool key_mode) {
  // Key mode on a terminal: no line buffering, no echo
  struct termios saved;
  bool restore_tty = false;
  if (key_mode && isatty(in_fd) && tcgetattr(in_fd, &saved) == 0) {
    struct termios raw = saved;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    restore_tty = (tcsetattr(in_fd, TCSANOW, &raw) == 0);
  }

  LOG_INFO(kTag, "console ready (%s mode)", key_mode ? "key" : "line");

  std::string pending;
  bool dropping = false;
  char buf[256];

  while (_running.load()) {
    struct pollfd pfd;
    pfd.fd = in_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    const int rc = poll(&pfd, 1, (int)CONSOLE_POLL_MS);
    if (rc < 0) {
      if (errno == EINTR) continue;
      LOG_ERROR(kTag, "poll failed: %s", strerror(errno));
      break;
    }
    if (rc == 0) continue;

    const ssize_t n = read(in_fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      LOG_ERROR(kTag, "read failed: %s", strerror(errno));
      break;
    }
    if (n == 0) {
      LOG_INFO(kTag, "console input closed");
      break;
    }

    for (ssize_t i = 0; i < n; i++) {
      const char c = buf[i];

      if (key_mode) {
        if (isspace((unsigned char)c)) continue;
        respond_(out_fd, handleKey(c));
        continue;
      }

      if (c == '\r') continue;

      if (dropping) {
        // Overlong line: discard until newline, then report it once
        if (c == '\n') {
          dropping = false;
          respond_(out_fd, err(ERR_FORMAT, "line too long"));
        }
        continue;
      }

      if (c != '\n') {
        if (pending.size() >= SERIAL_LINE_BUFFER_BYTES) {
          LOG_WARN(kTag, "console line over %u bytes dropped (head=%.24s)",
                   (unsigned)SERIAL_LINE_BUFFER_BYTES, pending.c_str());
          pending.clear();
          dropping = true;
          continue;
        }
        pending += c;
        continue;
      }
      respond_(out_fd, handleLine(pending));
      pending.clear();
    }
  }

  if (restore_tty) tcsetattr(in_fd, TCSANOW, &saved);
  _running.store(false);
}

void CommandProcessor::respond_(int out_fd, const std::string& text) {
  if (text.empty() || out_fd < 0) return;

  const std::string line = text + "\n";
  size_t off = 0;
  while (off < line.size()) {
    const ssize_t n = write(out_fd, line.data() + off, line.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      LOG_WARN(kTag, "response not written: %s", strerror(errno));
      return;
    }
    off += (size_t)n;
  }
}
