// src/actuators/ServoActuator.cpp
#include "actuators/ServoActuator.h"

#include <math.h>  // fabsf

#include "Params.h"
#include "app/AppConfig.h"
#include "hardware/HardwareInterface.h"
#include "utils/Log.h"

ServoActuator::ServoActuator(IoBoard& board, const ServoSpec& spec, float instant_dps,
                             float deadband_deg, uint32_t door_dwell_ms)
: _board(&board),
  _id(spec.id),
  _name(spec.name),
  _default_dps(spec.default_dps <= 0.0f ? SERVO_DEFAULT_DPS : spec.default_dps),
  _instant_dps(instant_dps),
  _deadband_deg(deadband_deg < 0.0f ? 0.0f : deadband_deg),
  _door_dwell_ms(door_dwell_ms),
  _door(spec.door)
{
  _state.home_deg = clampDeg(spec.start_deg);
  _state.current_deg = _state.home_deg;
  _state.target_deg = _state.home_deg;
}

void ServoActuator::begin(float initial_deg, float home_deg, uint32_t now_ms) {
  const float init = clampDeg(initial_deg);
  _state.current_deg = init;
  _state.target_deg = init;
  _state.home_deg = clampDeg(home_deg);
  _state.moving = false;
  _state.last_update_ms = now_ms;
  _state.at_target_since_ms = now_ms;

  write_(init);
}

void ServoActuator::setHomeDeg(float deg) {
  _state.home_deg = clampDeg(deg);
}

bool ServoActuator::setTargetDeg(float deg, float dps, uint32_t now_ms) {
  const float new_target = clampDeg(deg);

  // If target is unchanged (within a tiny epsilon), do nothing
  if (fabsf(new_target - _state.target_deg) < 0.001f) {
    return false;
  }

  _state.target_deg = new_target;
  _state.speed_dps = (dps > 0.0f) ? dps : _default_dps;
  _state.last_update_ms = now_ms;
  _state.last_moved_ms = now_ms;
  _state.at_target_since_ms = 0;

  // Fast enough to count as instant: snap now
  if (_state.speed_dps >= _instant_dps) {
    _state.current_deg = _state.target_deg;
    _state.moving = false;
    _state.at_target_since_ms = now_ms;
    write_(_state.current_deg);
    return true;
  }

  _state.moving = true;
  return true;
}

bool ServoActuator::tick(uint32_t now_ms) {
  if (!_state.moving) {
    // Doors swing home on their own after the dwell
    if (_door && fabsf(_state.target_deg - _state.home_deg) > _deadband_deg &&
        (now_ms - _state.at_target_since_ms) >= _door_dwell_ms) {
      LOG_DEBUG("Servo", "%s dwell over, returning to %.1f", _name, _state.home_deg);
      // A snap lands immediately and counts as an arrival
      return setTargetDeg(_state.home_deg, _default_dps, now_ms) && !_state.moving;
    }
    _state.last_update_ms = now_ms;
    return false;
  }

  // Compute dt
  const uint32_t dt_ms = now_ms - _state.last_update_ms;
  if (dt_ms == 0) return false;
  _state.last_update_ms = now_ms;

  // Move current toward target by at most (speed * dt)
  const float tgt = _state.target_deg;
  float cur = _state.current_deg;

  const float err = tgt - cur;
  const float dt_s = (float)dt_ms / 1000.0f;
  const float max_step = _state.speed_dps * dt_s;

  if (fabsf(err) <= 0.0001f) {
    // already there
    cur = tgt;
  } else if (err > 0.0f) {
    cur = (cur + max_step >= tgt) ? tgt : (cur + max_step);
  } else {
    cur = (cur - max_step <= tgt) ? tgt : (cur - max_step);
  }

  _state.current_deg = clampDeg(cur);
  _state.last_moved_ms = now_ms;
  write_(_state.current_deg);

  if (_state.current_deg == tgt) {
    _state.moving = false;
    _state.at_target_since_ms = now_ms;
    return true;
  }
  return false;
}

void ServoActuator::write_(float deg) {
  const bool ok = _board->writeServo(_id, deg);
  if (!ok && _state.output_ok) {
    LOG_WARN("Servo", "%s (id %u): write failed", _name, (unsigned)_id);
  } else if (ok && !_state.output_ok) {
    LOG_INFO("Servo", "%s (id %u): output recovered", _name, (unsigned)_id);
  }
  _state.output_ok = ok;
}

float ServoActuator::clampDeg(float deg) {
  if (!(deg >= SERVO_MIN_DEG)) return SERVO_MIN_DEG;   // also catches NaN
  if (deg > SERVO_MAX_DEG) return SERVO_MAX_DEG;
  return deg;
}
