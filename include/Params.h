#pragma once

#include <cstddef>
#include <cstdint>

/*
  Params.h

  Purpose:
  Central location for game constants and tunable parameters.
  Runtime overrides (data directory, serial device, seed) live in AppConfig;
  everything here is a compile-time default.

  Host:
  Raspberry Pi class Linux board

  Convention:
  - Times: milliseconds (ms)
  - Angles: degrees
  - Angular speeds: degrees per second (dps)
  - Sensor readings: raw ADC counts (10-bit, 0..1023)
*/

/* ============================================================================
   GAME RULES
============================================================================ */

// Targets are numbered 1..NUM_TARGETS; each team gets a permutation of all of them
constexpr uint8_t NUM_TARGETS = 7;

// Target that needs a pressure trigger followed by an IR confirmation
constexpr uint8_t TWO_STAGE_TARGET = 1;

// Tunnel index passed to activate_tunnel()
constexpr uint8_t GAME_TUNNEL_ID = 1;

/* ============================================================================
   GAME TIMING
============================================================================ */

// Countdown between the ball entering the tunnel and "ready to launch"
constexpr uint32_t LAUNCH_COUNTDOWN_MS = 2000;

// Fan burst on victory
constexpr uint32_t WIN_FAN_MS = 3000;

/* ============================================================================
   SERVO PARAMETERS
============================================================================ */

constexpr float SERVO_MIN_DEG = 0.0f;
constexpr float SERVO_MAX_DEG = 180.0f;

// Requests at or above this speed snap straight to the target
constexpr float SERVO_INSTANT_DPS = 360.0f;

// Used when a move request does not name a speed
constexpr float SERVO_DEFAULT_DPS = 60.0f;

// How close is "at target"
constexpr float SERVO_DEADBAND_DEG = 0.5f;

// Door-type servos return to their start angle after sitting open this long
constexpr uint32_t SERVO_DOOR_DWELL_MS = 3000;

// Reveal door over target 1
constexpr float REVEAL_OPEN_DEG = 90.0f;
constexpr float REVEAL_OPEN_DPS = 120.0f;

/* ============================================================================
   SENSOR PARAMETERS
============================================================================ */

// 10-bit ADC midpoint; tuned per channel with the "sensitivity" command
constexpr int PRESSURE_DEFAULT_THRESHOLD = 512;
constexpr int PRESSURE_MIN_THRESHOLD = 0;
constexpr int PRESSURE_MAX_THRESHOLD = 1023;

constexpr uint32_t PRESSURE_DEBOUNCE_MS = 150;
constexpr uint32_t DIGITAL_DEBOUNCE_MS = 50;

/* ============================================================================
   TASK RATES / TIMING
============================================================================ */

constexpr uint16_t SENSOR_POLL_HZ = 50;    // 20 ms cadence
constexpr uint16_t SERVO_UPDATE_HZ = 50;

// Consumer wakes at least this often to notice shutdown
constexpr uint32_t EVENT_WAIT_MS = 100;

// Console input poll timeout
constexpr uint32_t CONSOLE_POLL_MS = 100;

/* ============================================================================
   EVENT BUS
============================================================================ */

// When full, the oldest queued event is dropped so producers never block
constexpr size_t EVENT_QUEUE_CAPACITY = 256;

/* ============================================================================
   SERIAL I/O BOARD
============================================================================ */

constexpr uint32_t SERIAL_DEFAULT_BAUD = 230400;
constexpr uint16_t SERIAL_LINE_BUFFER_BYTES = 1024;
constexpr size_t SERIAL_JSON_DOC_BYTES = 768;

// Reads fail once the newest telemetry frame is older than this
constexpr uint32_t TELEMETRY_STALE_MS = 500;

// Maximum channels carried in one telemetry frame
constexpr uint8_t TELEMETRY_MAX_ANALOG = 16;
constexpr uint8_t TELEMETRY_MAX_DIGITAL = 16;

/* ============================================================================
   PERSISTENCE
============================================================================ */

constexpr const char* DEFAULT_DATA_DIR = "/var/lib/castles";
constexpr const char* SERVO_CALIBRATION_FILE = "servo_calibration.json";
constexpr const char* SENSOR_SENSITIVITY_FILE = "sensor_sensitivity.json";
constexpr const char* DATA_LOCK_FILE = ".castles.lock";

constexpr size_t CALIBRATION_JSON_DOC_BYTES = 2048;

/* ============================================================================
   LOGGING
============================================================================ */

constexpr size_t LOG_LINE_BUFFER_BYTES = 256;
