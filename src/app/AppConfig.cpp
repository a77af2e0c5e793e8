#include "app/AppConfig.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include "Pins.h"

namespace {

bool parseUnsigned(const char* text, unsigned long max, unsigned long& out) {
  if (!text || text[0] == '\0' || text[0] == '-') return false;
  char* end = nullptr;
  errno = 0;
  const unsigned long v = strtoul(text, &end, 10);
  if (errno != 0 || *end != '\0' || v > max) return false;
  out = v;
  return true;
}

DigitalBinding digital(uint8_t line, EventKind kind, Team team = Team::RED) {
  DigitalBinding b;
  b.line = line;
  b.kind = kind;
  b.value = 0;
  b.team = team;
  b.debounce_ms = DIGITAL_DEBOUNCE_MS;
  return b;
}

}  // namespace

AppConfig AppConfig::defaults() {
  AppConfig cfg;

  // Pressure pads: one per target
  for (uint8_t t = 1; t <= NUM_PRESSURE_CHANNELS; t++) {
    AnalogBinding a;
    a.channel = PRESSURE_CHANNEL_FOR_TARGET[t - 1];
    a.kind = EventKind::TARGET_HIT;
    a.value = t;
    cfg.sensors.analog.push_back(a);
  }

  DigitalBinding confirm = digital(LINE_TARGET1_IR, EventKind::TARGET_CONFIRM);
  confirm.value = TWO_STAGE_TARGET;
  cfg.sensors.digital.push_back(confirm);
  cfg.sensors.digital.push_back(digital(LINE_TUNNEL_IR, EventKind::TUNNEL));
  cfg.sensors.digital.push_back(digital(LINE_BALL_RETURN_IR, EventKind::BALL_RETURN));
  cfg.sensors.digital.push_back(digital(LINE_BTN_START, EventKind::START));
  cfg.sensors.digital.push_back(digital(LINE_BTN_NEXT, EventKind::NEXT_TURN));
  cfg.sensors.digital.push_back(digital(LINE_BTN_LAUNCH, EventKind::LAUNCH));
  cfg.sensors.digital.push_back(digital(LINE_BTN_DISPENSE_RED, EventKind::DISPENSE, Team::RED));
  cfg.sensors.digital.push_back(digital(LINE_BTN_DISPENSE_GRN, EventKind::DISPENSE, Team::GREEN));

  /*                       id                 name            start  dps     door */
  cfg.servos.servos.push_back({SERVO_REVEAL,      "reveal",       0.0f, 120.0f, true});
  cfg.servos.servos.push_back({SERVO_DOOR_RED,    "door_red",     0.0f,  90.0f, true});
  cfg.servos.servos.push_back({SERVO_DOOR_GREEN,  "door_green",   0.0f,  90.0f, true});
  cfg.servos.servos.push_back({SERVO_TUNNEL_FLAP, "tunnel_flap", 90.0f, SERVO_DEFAULT_DPS, false});

  return cfg;
}

ServoCalibrationMap AppConfig::servoDefaults() const {
  ServoCalibrationMap out;
  for (const ServoSpec& s : servos.servos) {
    ServoCalibration cal;
    cal.angle = s.start_deg;
    cal.start = s.start_deg;
    out[s.id] = cal;
  }
  return out;
}

SensorThresholdMap AppConfig::thresholdDefaults() const {
  SensorThresholdMap out;
  for (const AnalogBinding& a : sensors.analog) {
    SensorThreshold t;
    t.channel = a.channel;
    t.value = PRESSURE_DEFAULT_THRESHOLD;
    t.debounce_ms = PRESSURE_DEBOUNCE_MS;
    out[a.channel] = t;
  }
  return out;
}

bool parseTargetOrder(const std::string& text, std::vector<uint8_t>& out) {
  std::vector<uint8_t> order;
  bool seen[NUM_TARGETS + 1] = {false};

  size_t pos = 0;
  while (pos <= text.size()) {
    size_t comma = text.find(',', pos);
    if (comma == std::string::npos) comma = text.size();

    const std::string item = text.substr(pos, comma - pos);
    unsigned long id = 0;
    if (!parseUnsigned(item.c_str(), NUM_TARGETS, id) || id == 0 || seen[id]) return false;
    seen[id] = true;
    order.push_back((uint8_t)id);

    pos = comma + 1;
  }

  if (order.size() != NUM_TARGETS) return false;
  out.swap(order);
  return true;
}

std::string usage(const char* prog) {
  std::string u = "usage: ";
  u += prog ? prog : "castles";
  u += " [options]\n"
       "  --data-dir <dir>     calibration directory (default ";
  u += DEFAULT_DATA_DIR;
  u += ")\n"
       "  --no-persist         keep calibration in memory only\n"
       "  --serial <device>    I/O board tty (default: simulated hardware)\n"
       "  --baud <rate>        I/O board baud rate\n"
       "  --seed <n>           random seed for coin flip and target shuffle\n"
       "  --order <a,b,...>    play a fixed target order instead of shuffling\n"
       "  --log-level <lvl>    debug | info | warn | error | off\n"
       "  --keys               console takes single-key input\n"
       "  --help               show this text\n";
  return u;
}

ParseResult parseArgs(int argc, char** argv, AppConfig& cfg, std::string& error) {
  for (int i = 1; i < argc; i++) {
    const char* arg = argv[i];
    const char* next = (i + 1 < argc) ? argv[i + 1] : nullptr;

    if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
      return ParseResult::HELP;
    }
    if (strcmp(arg, "--no-persist") == 0) {
      cfg.data_dir.clear();
      continue;
    }
    if (strcmp(arg, "--keys") == 0) {
      cfg.key_mode = true;
      continue;
    }

    if (!next) {
      error = std::string("missing value for ") + arg;
      return ParseResult::ERROR;
    }

    if (strcmp(arg, "--data-dir") == 0) {
      cfg.data_dir = next;
    } else if (strcmp(arg, "--serial") == 0) {
      cfg.serial_device = next;
    } else if (strcmp(arg, "--baud") == 0) {
      unsigned long baud = 0;
      if (!parseUnsigned(next, 4000000UL, baud) || baud == 0) {
        error = std::string("bad baud rate: ") + next;
        return ParseResult::ERROR;
      }
      cfg.baud = (uint32_t)baud;
    } else if (strcmp(arg, "--seed") == 0) {
      unsigned long seed = 0;
      if (!parseUnsigned(next, 0xFFFFFFFFUL, seed)) {
        error = std::string("bad seed: ") + next;
        return ParseResult::ERROR;
      }
      cfg.game.seed = (uint32_t)seed;
    } else if (strcmp(arg, "--order") == 0) {
      if (!parseTargetOrder(next, cfg.game.fixed_order)) {
        error = std::string("order must be a permutation of 1..7: ") + next;
        return ParseResult::ERROR;
      }
    } else if (strcmp(arg, "--log-level") == 0) {
      if (!logging::parseLevel(next, cfg.log_level)) {
        error = std::string("bad log level: ") + next;
        return ParseResult::ERROR;
      }
    } else {
      error = std::string("unknown option: ") + arg;
      return ParseResult::ERROR;
    }
    i++;
  }
  return ParseResult::OK;
}
