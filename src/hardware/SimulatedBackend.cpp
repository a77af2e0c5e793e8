#include "hardware/SimulatedBackend.h"

#include "utils/Log.h"

namespace {
const char* kTag = "HW";
}

SimulatedBackend::SimulatedBackend() {
  for (uint8_t i = 0; i < MAX_ANALOG; i++) {
    _analog[i] = 0;
    _analog_fault[i] = false;
  }
  for (uint8_t i = 0; i < MAX_DIGITAL; i++) {
    _digital[i] = false;
    _digital_fault[i] = false;
  }
  for (uint8_t i = 0; i < MAX_SERVOS; i++) {
    _servo_deg[i] = 0.0f;
    _servo_writes[i] = 0;
  }
}

/*=============================================================================
  ACTIONS
  The mutex keeps log lines of concurrent callers in call order.
=============================================================================*/

void SimulatedBackend::blowFan(uint32_t duration_ms) {
  std::lock_guard<std::mutex> lock(_mutex);
  LOG_INFO(kTag, "BLOW_FAN %lu ms", (unsigned long)duration_ms);
}

void SimulatedBackend::startChug(Team team) {
  std::lock_guard<std::mutex> lock(_mutex);
  LOG_INFO(kTag, "START_CHUG for %s", teamName(team));
}

void SimulatedBackend::stopChug(Team team) {
  std::lock_guard<std::mutex> lock(_mutex);
  LOG_INFO(kTag, "STOP_CHUG for %s", teamName(team));
}

void SimulatedBackend::hitTarget(uint8_t target) {
  std::lock_guard<std::mutex> lock(_mutex);
  LOG_INFO(kTag, "HIT_TARGET_%u", (unsigned)target);
}

void SimulatedBackend::dropGate() {
  std::lock_guard<std::mutex> lock(_mutex);
  LOG_INFO(kTag, "DROP_GATE");
}

void SimulatedBackend::dispense(Team team) {
  std::lock_guard<std::mutex> lock(_mutex);
  LOG_INFO(kTag, "DISPENSE_%s", teamName(team));
}

void SimulatedBackend::activateTunnel(uint8_t tunnel) {
  std::lock_guard<std::mutex> lock(_mutex);
  LOG_INFO(kTag, "ACTIVATE_TUNNEL_%u", (unsigned)tunnel);
}

void SimulatedBackend::launchPlunger() {
  std::lock_guard<std::mutex> lock(_mutex);
  LOG_INFO(kTag, "LAUNCH_PLUNGER");
}

void SimulatedBackend::restoreTargets(Team team, uint8_t hits) {
  std::lock_guard<std::mutex> lock(_mutex);
  LOG_INFO(kTag, "RESTORE_TARGETS for %s at hit count %u", teamName(team), (unsigned)hits);
}

void SimulatedBackend::playSound(SoundEffect effect) {
  std::lock_guard<std::mutex> lock(_mutex);
  LOG_INFO(kTag, "PLAY_SOUND %s", soundName(effect));
}

void SimulatedBackend::setTargetLed(uint8_t target, LedColor color) {
  std::lock_guard<std::mutex> lock(_mutex);
  LOG_INFO(kTag, "TARGET_LED_%u %s", (unsigned)target, colorName(color));
}

void SimulatedBackend::setThemeLighting(Team team) {
  std::lock_guard<std::mutex> lock(_mutex);
  LOG_INFO(kTag, "THEME_LIGHTING %s", teamName(team));
}

void SimulatedBackend::raisePongPlatform() {
  std::lock_guard<std::mutex> lock(_mutex);
  LOG_INFO(kTag, "RAISE_PONG_PLATFORM");
}

/*=============================================================================
  CHANNELS
=============================================================================*/

bool SimulatedBackend::readAnalog(uint8_t channel, int& out) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (channel >= MAX_ANALOG || _analog_fault[channel]) return false;
  out = _analog[channel];
  return true;
}

bool SimulatedBackend::readDigital(uint8_t line, bool& out) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (line >= MAX_DIGITAL || _digital_fault[line]) return false;
  out = _digital[line];
  return true;
}

bool SimulatedBackend::writeServo(uint8_t id, float deg) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (id >= MAX_SERVOS) return false;
  _servo_deg[id] = deg;
  _servo_writes[id]++;
  LOG_DEBUG(kTag, "SERVO_%u %.1f deg", (unsigned)id, deg);
  return true;
}

void SimulatedBackend::setAnalog(uint8_t channel, int value) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (channel < MAX_ANALOG) _analog[channel] = value;
}

void SimulatedBackend::setDigital(uint8_t line, bool level) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (line < MAX_DIGITAL) _digital[line] = level;
}

void SimulatedBackend::setAnalogFault(uint8_t channel, bool failing) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (channel < MAX_ANALOG) _analog_fault[channel] = failing;
}

void SimulatedBackend::setDigitalFault(uint8_t line, bool failing) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (line < MAX_DIGITAL) _digital_fault[line] = failing;
}

float SimulatedBackend::servoDeg(uint8_t id) const {
  std::lock_guard<std::mutex> lock(_mutex);
  return (id < MAX_SERVOS) ? _servo_deg[id] : 0.0f;
}

uint32_t SimulatedBackend::servoWrites(uint8_t id) const {
  std::lock_guard<std::mutex> lock(_mutex);
  return (id < MAX_SERVOS) ? _servo_writes[id] : 0;
}
