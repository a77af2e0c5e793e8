#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Params.h"
#include "events/Event.h"
#include "storage/CalibrationStore.h"
#include "utils/Log.h"

/*
===============================================================================
  AppConfig.h
===============================================================================

  PURPOSE
  -------
  Immutable runtime configuration. Built once in main() from the
  Params.h/Pins.h defaults plus the command line, then handed to each
  component by const reference. Nothing mutates it after startup.
===============================================================================
*/

struct ServoSpec {
  uint8_t id;
  const char* name;
  float start_deg;      // default calibration when nothing is persisted
  float default_dps;
  bool door;            // auto-returns to start after SERVO_DOOR_DWELL_MS
};

// Pressure pad channel -> event published when it crosses its threshold
struct AnalogBinding {
  uint8_t channel;
  EventKind kind;
  int value;
};

// Digital line -> event published on a debounced rising edge
struct DigitalBinding {
  uint8_t line;
  EventKind kind;
  int value;
  Team team;
  uint32_t debounce_ms;
};

struct GameParams {
  uint32_t launch_countdown_ms = LAUNCH_COUNTDOWN_MS;
  uint32_t win_fan_ms = WIN_FAN_MS;
  uint8_t two_stage_target = TWO_STAGE_TARGET;

  // Empty: each team gets its own shuffle of 1..NUM_TARGETS.
  // Otherwise both teams play this order (fixed-order variant).
  std::vector<uint8_t> fixed_order;

  // 0 = seed from std::random_device
  uint32_t seed = 0;
};

struct SensorParams {
  uint16_t poll_hz = SENSOR_POLL_HZ;
  std::vector<AnalogBinding> analog;
  std::vector<DigitalBinding> digital;
};

struct ServoParams {
  uint16_t update_hz = SERVO_UPDATE_HZ;
  float instant_dps = SERVO_INSTANT_DPS;
  float deadband_deg = SERVO_DEADBAND_DEG;
  uint32_t door_dwell_ms = SERVO_DOOR_DWELL_MS;
  std::vector<ServoSpec> servos;
};

struct AppConfig {
  std::string data_dir = DEFAULT_DATA_DIR;   // empty = in-memory calibration
  std::string serial_device;                 // empty = simulated hardware
  uint32_t baud = SERIAL_DEFAULT_BAUD;
  LogLevel log_level = LogLevel::INFO;
  bool key_mode = false;                     // console reads single keys

  GameParams game;
  SensorParams sensors;
  ServoParams servos;

  // Table layout from Pins.h with Params.h defaults
  static AppConfig defaults();

  ServoCalibrationMap servoDefaults() const;
  SensorThresholdMap thresholdDefaults() const;
};

enum class ParseResult : uint8_t {
  OK = 0,
  HELP,
  ERROR,
};

ParseResult parseArgs(int argc, char** argv, AppConfig& cfg, std::string& error);
std::string usage(const char* prog);

// "3,1,5,7,2,6,4" -> {3,1,5,7,2,6,4}; must be a permutation of 1..NUM_TARGETS
bool parseTargetOrder(const std::string& text, std::vector<uint8_t>& out);
