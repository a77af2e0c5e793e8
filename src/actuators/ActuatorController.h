#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

#include "actuators/ServoActuator.h"
#include "app/AppConfig.h"

class CalibrationStore;
class IoBoard;

/*
===============================================================================
  ActuatorController.h
===============================================================================

  PURPOSE
  -------
  Owns every servo on the table and is the only writer of their angles.

    - move()      : clamp to 0..180 and ramp (or snap) to the new angle
    - calibrate() : set and persist a servo's start angle, then move there
    - tick()      : advance ramps and door dwell timers (own thread, Rate)

  PERSISTENCE
  -----------
  Each time a servo comes to rest at a new angle, {angle, start} is written
  to the CalibrationStore. At begin(), a servo whose persisted angle differs
  from its start angle is driven back to start; one that already matches is
  only re-asserted in place.

  Safe to call from any thread.
===============================================================================
*/

class ActuatorController {
public:
  ActuatorController(IoBoard& board, CalibrationStore& store, const ServoParams& params);
  ~ActuatorController();

  ActuatorController(const ActuatorController&) = delete;
  ActuatorController& operator=(const ActuatorController&) = delete;

  // Restore every servo from calibration (call once, before start()).
  void begin(uint32_t now_ms);

  // Background tick thread at params.update_hz
  void start();
  void stop();

  // dps <= 0 uses the servo's default speed. False for an unknown id.
  bool move(uint8_t id, float deg, float dps = 0.0f);

  // New start angle (clamped). Persists, then moves there. False for an unknown id.
  bool calibrate(uint8_t id, float deg);

  // Same as the worker thread's cycle; tests drive it directly.
  void tick(uint32_t now_ms);

  bool hasServo(uint8_t id) const;
  bool state(uint8_t id, ServoActuator::State& out) const;

private:
  ServoActuator* find_(uint8_t id);
  const ServoActuator* find_(uint8_t id) const;

  // Caller holds _mutex
  void persist_(const ServoActuator& servo);

  void run_();

  CalibrationStore& _store;
  const ServoParams& _params;

  mutable std::mutex _mutex;
  std::vector<ServoActuator> _servos;

  std::atomic<bool> _running;
  std::thread _thread;
};
