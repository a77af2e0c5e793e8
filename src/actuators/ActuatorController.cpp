#include "actuators/ActuatorController.h"

#include <math.h>

#include "hardware/HardwareInterface.h"
#include "storage/CalibrationStore.h"
#include "utils/Clock.h"
#include "utils/Log.h"
#include "utils/Rate.h"

namespace {
const char* kTag = "Servo";
}

ActuatorController::ActuatorController(IoBoard& board, CalibrationStore& store,
                                       const ServoParams& params)
: _store(store),
  _params(params),
  _running(false)
{
  _servos.reserve(params.servos.size());
  for (const ServoSpec& spec : params.servos) {
    _servos.emplace_back(board, spec, params.instant_dps, params.deadband_deg,
                         params.door_dwell_ms);
  }
}

ActuatorController::~ActuatorController() {
  stop();
}

void ActuatorController::begin(uint32_t now_ms) {
  std::lock_guard<std::mutex> lock(_mutex);

  for (ServoActuator& s : _servos) {
    ServoCalibration cal;
    if (!_store.servo(s.id(), cal)) {
      cal.angle = s.getState().home_deg;
      cal.start = s.getState().home_deg;
    }

    if (fabsf(cal.angle - cal.start) < 0.001f) {
      s.begin(cal.start, cal.start, now_ms);
      LOG_INFO(kTag, "%s at start %.1f", s.name(), cal.start);
      continue;
    }

    // Last run ended away from start (door left open, power cut mid-move)
    s.begin(cal.angle, cal.start, now_ms);
    s.setTargetDeg(cal.start, 0.0f, now_ms);
    LOG_INFO(kTag, "%s resting at %.1f, returning to start %.1f",
             s.name(), cal.angle, cal.start);
    if (!s.getState().moving) persist_(s);
  }
}

void ActuatorController::start() {
  if (_running.exchange(true)) return;
  _thread = std::thread(&ActuatorController::run_, this);
}

void ActuatorController::stop() {
  if (!_running.exchange(false)) return;
  if (_thread.joinable()) _thread.join();
}

bool ActuatorController::move(uint8_t id, float deg, float dps) {
  std::lock_guard<std::mutex> lock(_mutex);

  ServoActuator* s = find_(id);
  if (!s) {
    LOG_WARN(kTag, "move: no servo with id %u", (unsigned)id);
    return false;
  }

  const float clamped = ServoActuator::clampDeg(deg);
  if (clamped != deg) {
    LOG_WARN(kTag, "%s: %.1f deg out of range, clamped to %.1f", s->name(), deg, clamped);
  }

  if (!s->setTargetDeg(clamped, dps, clock_ms::now())) {
    // Already there or already heading there
    return true;
  }

  LOG_INFO(kTag, "%s -> %.1f deg at %.1f dps", s->name(), clamped, s->getState().speed_dps);
  if (!s->getState().moving) persist_(*s);
  return true;
}

bool ActuatorController::calibrate(uint8_t id, float deg) {
  std::lock_guard<std::mutex> lock(_mutex);

  ServoActuator* s = find_(id);
  if (!s) {
    LOG_WARN(kTag, "calibrate: no servo with id %u", (unsigned)id);
    return false;
  }

  const float start = ServoActuator::clampDeg(deg);
  s->setHomeDeg(start);
  persist_(*s);
  LOG_INFO(kTag, "%s start angle calibrated to %.1f", s->name(), start);

  if (s->setTargetDeg(start, 0.0f, clock_ms::now()) && !s->getState().moving) {
    persist_(*s);
  }
  return true;
}

void ActuatorController::tick(uint32_t now_ms) {
  std::lock_guard<std::mutex> lock(_mutex);
  for (ServoActuator& s : _servos) {
    if (s.tick(now_ms)) {
      LOG_DEBUG(kTag, "%s arrived at %.1f", s.name(), s.getState().current_deg);
      persist_(s);
    }
  }
}

bool ActuatorController::hasServo(uint8_t id) const {
  std::lock_guard<std::mutex> lock(_mutex);
  return find_(id) != nullptr;
}

bool ActuatorController::state(uint8_t id, ServoActuator::State& out) const {
  std::lock_guard<std::mutex> lock(_mutex);
  const ServoActuator* s = find_(id);
  if (!s) return false;
  out = s->getState();
  return true;
}

ServoActuator* ActuatorController::find_(uint8_t id) {
  for (ServoActuator& s : _servos) {
    if (s.id() == id) return &s;
  }
  return nullptr;
}

const ServoActuator* ActuatorController::find_(uint8_t id) const {
  for (const ServoActuator& s : _servos) {
    if (s.id() == id) return &s;
  }
  return nullptr;
}

void ActuatorController::persist_(const ServoActuator& servo) {
  ServoCalibration cal;
  cal.angle = servo.getState().current_deg;
  cal.start = servo.getState().home_deg;
  if (!_store.saveServo(servo.id(), cal)) {
    LOG_WARN(kTag, "%s: calibration not saved", servo.name());
  }
}

void ActuatorController::run_() {
  Rate rate(_params.update_hz);

  while (_running.load()) {
    const uint32_t now_ms = clock_ms::now();
    if (rate.ready(now_ms)) {
      tick(now_ms);
    }
    const uint32_t wait_ms = rate.msUntilReady(clock_ms::now());
    clock_ms::sleep(wait_ms > 0 ? wait_ms : 1);
  }
}
