// src/actuators/ServoActuator.h
#pragma once

#include <cstdint>

class IoBoard;
struct ServoSpec;

/*
  ServoActuator

  Purpose:
  - Accept a degree setpoint and a speed
  - Smoothly ramp the servo toward the target (non-blocking)
  - Snap straight to the target when the speed is at or above the
    instant-move threshold
  - Door servos: after sitting away from their home (start) angle for the
    dwell time, ramp back home on their own

  Usage pattern:
  - Call setTargetDeg(...) only when a new target is desired
  - Call tick(now_ms) at a fixed rate (e.g. 50 Hz) to perform ramping

  Not thread-safe; ActuatorController serializes access.
*/

class ServoActuator {
public:
  struct State {
    float target_deg = 90.0f;
    float current_deg = 90.0f;
    float home_deg = 90.0f;     // calibrated start angle
    float speed_dps = 0.0f;     // speed of the move in progress

    bool moving = false;
    uint32_t last_update_ms = 0;
    uint32_t last_moved_ms = 0;

    // For door dwell timing
    uint32_t at_target_since_ms = 0;

    bool output_ok = true;      // last write to the board succeeded
  };

  /*
    board         : where servo positions are written
    spec          : id, name, default speed, door flag
    instant_dps   : speeds at or above this snap (no ramp)
    deadband_deg  : how far from home still counts as "home" for doors
    door_dwell_ms : how long a door stays open before returning
  */
  ServoActuator(IoBoard& board, const ServoSpec& spec, float instant_dps,
                float deadband_deg, uint32_t door_dwell_ms);

  // Initialize at initial_deg (clamped) without motion. Writes once.
  void begin(float initial_deg, float home_deg, uint32_t now_ms);

  // Set a new desired target (clamped). Does not block.
  // dps <= 0 uses the servo's default speed.
  // Returns false if the target is unchanged.
  bool setTargetDeg(float deg, float dps, uint32_t now_ms);

  void setHomeDeg(float deg);

  // Call periodically at a fixed rate (external Rate).
  // Returns true on the tick the servo arrives at its target.
  bool tick(uint32_t now_ms);

  uint8_t id() const { return _id; }
  const char* name() const { return _name; }
  bool isDoor() const { return _door; }
  float defaultDps() const { return _default_dps; }

  const State& getState() const { return _state; }

  static float clampDeg(float deg);

private:
  void write_(float deg);

  IoBoard* _board;
  uint8_t _id;
  const char* _name;

  float _default_dps;
  float _instant_dps;
  float _deadband_deg;
  uint32_t _door_dwell_ms;
  bool _door;

  State _state;
};
