#pragma once

#include <cstdint>

#include "Params.h"
#include "game/GameTypes.h"

/*
===============================================================================
  Messages.h
===============================================================================

  PURPOSE
  -------
  Defines the frames exchanged between this host and the I/O board over
  newline-delimited JSON.

  Must mirror the I/O board firmware:
    host -> board : {"type":"cmd", "seq":N, "action":"<name>", ...}
    board -> host : {"type":"telemetry", "board_time_ms":T,
                     "analog":[...], "digital":[...]}

  Notes:
  - Only the fields that belong to an action are written on the wire.
  - Field names must match the board firmware exactly.
===============================================================================
*/


/*=============================================================================
  COMMAND STRUCTURES (Host -> Board)
=============================================================================*/

enum class BoardAction : uint8_t {
  BLOW_FAN = 0,
  START_CHUG,
  STOP_CHUG,
  HIT_TARGET,
  DROP_GATE,
  DISPENSE,
  ACTIVATE_TUNNEL,
  LAUNCH_PLUNGER,
  RESTORE_TARGETS,
  PLAY_SOUND,
  SET_TARGET_LED,
  SET_THEME_LIGHTING,
  RAISE_PONG_PLATFORM,
  SERVO,
};

struct ActionFrame {
  uint32_t seq = 0;
  BoardAction action = BoardAction::DROP_GATE;

  Team team = Team::RED;               // START/STOP_CHUG, DISPENSE, RESTORE_TARGETS, SET_THEME_LIGHTING
  uint32_t duration_ms = 0;            // BLOW_FAN
  uint8_t target = 0;                  // HIT_TARGET, SET_TARGET_LED
  uint8_t tunnel = 0;                  // ACTIVATE_TUNNEL
  uint8_t hits = 0;                    // RESTORE_TARGETS
  SoundEffect sound = SoundEffect::NEUTRAL;
  LedColor color = LedColor::OFF;

  uint8_t servo_id = 0;                // SERVO
  float servo_deg = 0.0f;
};


/*=============================================================================
  TELEMETRY STRUCTURES (Board -> Host)
=============================================================================*/

struct TelemetryFrame {
  uint32_t board_time_ms = 0;

  int analog[TELEMETRY_MAX_ANALOG] = {0};
  uint8_t analog_count = 0;

  bool digital[TELEMETRY_MAX_DIGITAL] = {false};
  uint8_t digital_count = 0;

  bool valid = false;  // set true after successful decode
};
