#include "hardware/SerialBackend.h"

#include "comms/Protocol.h"
#include "utils/Clock.h"
#include "utils/Log.h"

namespace {
const char* kTag = "HW";

ActionFrame frameFor(BoardAction action) {
  ActionFrame f;
  f.action = action;
  return f;
}
}  // namespace

SerialBackend::SerialBackend(const std::string& device, uint32_t baud)
: _link(device, baud)
{
}

bool SerialBackend::begin() {
  std::lock_guard<std::mutex> lock(_mutex);
  return _link.begin();
}

bool SerialBackend::send_(ActionFrame frame) {
  std::lock_guard<std::mutex> lock(_mutex);

  frame.seq = ++_seq;
  std::string line;
  protocol::encodeActionLine(frame, line);

  if (!_link.writeLine(line)) {
    _send_failures++;
    LOG_WARN(kTag, "%s seq=%lu not sent (failures=%lu)",
             protocol::actionName(frame.action),
             (unsigned long)frame.seq,
             (unsigned long)_send_failures);
    return false;
  }

  LOG_DEBUG(kTag, "TX %s seq=%lu", protocol::actionName(frame.action), (unsigned long)frame.seq);
  return true;
}

/*=============================================================================
  ACTIONS
=============================================================================*/

void SerialBackend::blowFan(uint32_t duration_ms) {
  ActionFrame f = frameFor(BoardAction::BLOW_FAN);
  f.duration_ms = duration_ms;
  send_(f);
}

void SerialBackend::startChug(Team team) {
  ActionFrame f = frameFor(BoardAction::START_CHUG);
  f.team = team;
  send_(f);
}

void SerialBackend::stopChug(Team team) {
  ActionFrame f = frameFor(BoardAction::STOP_CHUG);
  f.team = team;
  send_(f);
}

void SerialBackend::hitTarget(uint8_t target) {
  ActionFrame f = frameFor(BoardAction::HIT_TARGET);
  f.target = target;
  send_(f);
}

void SerialBackend::dropGate() {
  send_(frameFor(BoardAction::DROP_GATE));
}

void SerialBackend::dispense(Team team) {
  ActionFrame f = frameFor(BoardAction::DISPENSE);
  f.team = team;
  send_(f);
}

void SerialBackend::activateTunnel(uint8_t tunnel) {
  ActionFrame f = frameFor(BoardAction::ACTIVATE_TUNNEL);
  f.tunnel = tunnel;
  send_(f);
}

void SerialBackend::launchPlunger() {
  send_(frameFor(BoardAction::LAUNCH_PLUNGER));
}

void SerialBackend::restoreTargets(Team team, uint8_t hits) {
  ActionFrame f = frameFor(BoardAction::RESTORE_TARGETS);
  f.team = team;
  f.hits = hits;
  send_(f);
}

void SerialBackend::playSound(SoundEffect effect) {
  ActionFrame f = frameFor(BoardAction::PLAY_SOUND);
  f.sound = effect;
  send_(f);
}

void SerialBackend::setTargetLed(uint8_t target, LedColor color) {
  ActionFrame f = frameFor(BoardAction::SET_TARGET_LED);
  f.target = target;
  f.color = color;
  send_(f);
}

void SerialBackend::setThemeLighting(Team team) {
  ActionFrame f = frameFor(BoardAction::SET_THEME_LIGHTING);
  f.team = team;
  send_(f);
}

void SerialBackend::raisePongPlatform() {
  send_(frameFor(BoardAction::RAISE_PONG_PLATFORM));
}

/*=============================================================================
  CHANNELS
=============================================================================*/

bool SerialBackend::freshTelemetry_(uint32_t now_ms) {
  _link.tick(now_ms);

  const bool stale = _link.telemetryStale(now_ms);
  if (stale != _was_stale) {
    _was_stale = stale;
    if (stale) {
      LOG_WARN(kTag, "telemetry from %s went stale", _link.device().c_str());
    } else {
      LOG_INFO(kTag, "telemetry from %s is live", _link.device().c_str());
    }
  }
  return !stale;
}

bool SerialBackend::readAnalog(uint8_t channel, int& out) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (!freshTelemetry_(clock_ms::now())) return false;

  const TelemetryFrame& t = _link.latestTelemetry();
  if (channel >= t.analog_count) return false;
  out = t.analog[channel];
  return true;
}

bool SerialBackend::readDigital(uint8_t line, bool& out) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (!freshTelemetry_(clock_ms::now())) return false;

  const TelemetryFrame& t = _link.latestTelemetry();
  if (line >= t.digital_count) return false;
  out = t.digital[line];
  return true;
}

bool SerialBackend::writeServo(uint8_t id, float deg) {
  ActionFrame f = frameFor(BoardAction::SERVO);
  f.servo_id = id;
  f.servo_deg = deg;
  return send_(f);
}
