#include "game/GameController.h"

#include <algorithm>
#include <string>

#include "Pins.h"
#include "actuators/ActuatorController.h"
#include "events/EventBus.h"
#include "events/TimerService.h"
#include "hardware/HardwareInterface.h"
#include "utils/Log.h"

namespace {

const char* kTag = "Game";

uint32_t seedFrom(uint32_t seed) {
  if (seed != 0) return seed;
  std::random_device rd;
  return rd();
}

bool validTarget(int target) {
  return target >= 1 && target <= NUM_TARGETS;
}

}  // namespace

GameController::GameController(const GameParams& params, HardwareInterface& hw,
                               ActuatorController& actuators, TimerScheduler& timers)
: _params(params),
  _hw(hw),
  _actuators(actuators),
  _timers(timers),
  _rng(seedFrom(params.seed))
{
  publishSnapshot_();
}

/*=============================================================================
  DISPATCH
=============================================================================*/

void GameController::handle(const Event& ev) {
  LOG_DEBUG(kTag, "#%llu %s(%d) from %s in %s",
            (unsigned long long)ev.seq, eventKindName(ev.kind), ev.value,
            eventSourceName(ev.source), stateName(_session.state));

  switch (ev.kind) {
    case EventKind::START:          onStart_(); break;
    case EventKind::RESET:          onReset_(); break;
    case EventKind::NEXT_TURN:      onForceNext_(); break;
    case EventKind::DISPENSE:       onDispense_(ev.team); break;
    case EventKind::TARGET_HIT:     onTargetHit_(ev.value); break;
    case EventKind::TARGET_CONFIRM: onTargetConfirm_(ev.value); break;
    case EventKind::TUNNEL:         onTunnel_(); break;
    case EventKind::LAUNCH:         onLaunch_(); break;
    case EventKind::BALL_RETURN:    onBallReturn_(); break;
    case EventKind::TIMER_EXPIRED:  onTimer_(ev); break;
  }

  publishSnapshot_();
}

bool GameController::processNext(EventBus& bus, uint32_t timeout_ms) {
  Event ev;
  if (!bus.pop(ev, timeout_ms)) return false;
  handle(ev);
  return true;
}

GameController::Snapshot GameController::snapshot() const {
  std::lock_guard<std::mutex> lock(_snapshot_mutex);
  return _snapshot;
}

/*=============================================================================
  SESSION CONTROL
=============================================================================*/

void GameController::onStart_() {
  cancelTimers_();
  stopActiveChug_();

  for (TeamProgress& t : _session.teams) t.clear();
  _session.has_active = false;
  _session.turn = 0;
  _session.outcome = Outcome::NONE;
  _session.pending_target = 0;
  _session.stage = TargetStage::ARMED;
  _session.launch_ready = false;

  transitionTo_(GameState::COIN_FLIP);

  assignTargets_();
  _hw.restoreTargets(Team::RED, 0);
  _hw.restoreTargets(Team::GREEN, 0);

  std::uniform_int_distribution<int> coin(0, TEAM_COUNT - 1);
  _session.active = (coin(_rng) == 0) ? Team::RED : Team::GREEN;
  _session.has_active = true;
  LOG_INFO(kTag, "coin flip: %s starts", teamName(_session.active));

  beginTurn_();
}

void GameController::onReset_() {
  cancelTimers_();
  stopActiveChug_();

  if (_lit_target != 0) {
    _hw.setTargetLed(_lit_target, LedColor::OFF);
    _lit_target = 0;
  }

  for (TeamProgress& t : _session.teams) t.clear();
  _session.has_active = false;
  _session.turn = 0;
  _session.outcome = Outcome::NONE;
  _session.pending_target = 0;
  _session.stage = TargetStage::ARMED;
  _session.launch_ready = false;

  transitionTo_(GameState::WAITING_START);
}

void GameController::onForceNext_() {
  if (!_session.has_active ||
      _session.state == GameState::WAITING_START ||
      _session.state == GameState::GAME_OVER) {
    LOG_DEBUG(kTag, "next turn ignored in %s", stateName(_session.state));
    return;
  }

  LOG_INFO(kTag, "%s turn forced over", teamName(_session.active));
  stopActiveChug_();
  advanceTurn_();
}

void GameController::onDispense_(Team team) {
  _hw.dispense(team);
}

/*=============================================================================
  TURN FLOW
=============================================================================*/

void GameController::onTargetHit_(int target) {
  if (!validTarget(target)) {
    LOG_WARN(kTag, "hit on unknown target %d ignored", target);
    return;
  }
  if (_session.state != GameState::PLAYER_TURN) {
    LOG_DEBUG(kTag, "target %d hit outside a turn (%s)", target, stateName(_session.state));
    return;
  }

  const uint8_t required = _session.activeTeam().requiredTarget();
  if ((uint8_t)target != required) {
    LOG_INFO(kTag, "%s hit target %d, needs %u", teamName(_session.active),
             target, (unsigned)required);
    _hw.playSound(SoundEffect::NEUTRAL);
    return;
  }

  if (_params.two_stage_target != 0 && (uint8_t)target == _params.two_stage_target) {
    if (_session.stage != TargetStage::ARMED) {
      LOG_DEBUG(kTag, "target %d already triggered, waiting for confirm", target);
      return;
    }
    // First stage only: open the reveal and wait for the IR confirm
    _session.stage = TargetStage::TRIGGERED;
    _actuators.move(SERVO_REVEAL, REVEAL_OPEN_DEG, REVEAL_OPEN_DPS);
    _hw.playSound(SoundEffect::REVEAL);
    LOG_INFO(kTag, "target %d triggered, awaiting confirm", target);
    return;
  }

  registerHit_((uint8_t)target);
}

void GameController::onTargetConfirm_(int target) {
  if (_session.state != GameState::PLAYER_TURN ||
      _params.two_stage_target == 0 ||
      target != _params.two_stage_target ||
      _session.stage != TargetStage::TRIGGERED) {
    LOG_DEBUG(kTag, "confirm %d ignored in %s", target, stateName(_session.state));
    return;
  }

  _session.stage = TargetStage::CONFIRMED;
  registerHit_((uint8_t)target);
}

void GameController::registerHit_(uint8_t target) {
  _session.pending_target = target;
  _hw.hitTarget(target);
  _hw.playSound(SoundEffect::HIT);
  LOG_INFO(kTag, "%s hit target %u", teamName(_session.active), (unsigned)target);
  transitionTo_(GameState::AWAITING_TUNNEL);
}

void GameController::onTunnel_() {
  if (_session.state != GameState::AWAITING_TUNNEL) {
    LOG_DEBUG(kTag, "tunnel ignored in %s", stateName(_session.state));
    return;
  }

  _hw.activateTunnel(GAME_TUNNEL_ID);
  cancelTimers_();
  _session.launch_ready = false;
  _session.timers.push_back(_timers.schedule(_params.launch_countdown_ms,
                                             TimerKind::LAUNCH_COUNTDOWN));
  transitionTo_(GameState::AWAITING_LAUNCH);
}

void GameController::onTimer_(const Event& ev) {
  std::vector<uint32_t>& ids = _session.timers;
  std::vector<uint32_t>::iterator it = std::find(ids.begin(), ids.end(), ev.timer_id);
  if (it == ids.end()) {
    LOG_DEBUG(kTag, "stale timer %lu ignored", (unsigned long)ev.timer_id);
    return;
  }
  ids.erase(it);

  if (ev.timer == TimerKind::LAUNCH_COUNTDOWN && _session.state == GameState::AWAITING_LAUNCH) {
    _session.launch_ready = true;
    _hw.playSound(SoundEffect::READY_TO_LAUNCH);
    LOG_INFO(kTag, "ready to launch");
  }
}

void GameController::onLaunch_() {
  if (_session.state != GameState::AWAITING_LAUNCH) {
    LOG_DEBUG(kTag, "launch ignored in %s", stateName(_session.state));
    return;
  }

  cancelTimers_();
  _hw.launchPlunger();
  transitionTo_(GameState::BALL_LAUNCHED);

  _hw.startChug(_session.active);
  transitionTo_(GameState::CHUG);
}

void GameController::onBallReturn_() {
  switch (_session.state) {
    case GameState::CHUG: {
      _hw.stopChug(_session.active);

      const uint8_t target = _session.pending_target;
      _session.pending_target = 0;
      if (target != 0 && _session.activeTeam().complete(target)) {
        LOG_INFO(kTag, "%s cleared target %u (%u/%u)", teamName(_session.active),
                 (unsigned)target, (unsigned)_session.activeTeam().hits(),
                 (unsigned)_session.activeTeam().assigned().size());
      }

      if (_session.activeTeam().finished()) {
        win_();
        return;
      }
      advanceTurn_();
      return;
    }

    case GameState::PLAYER_TURN:
    case GameState::AWAITING_TUNNEL:
      LOG_INFO(kTag, "%s missed, turn over", teamName(_session.active));
      advanceTurn_();
      return;

    default:
      LOG_DEBUG(kTag, "ball return ignored in %s", stateName(_session.state));
      return;
  }
}

void GameController::assignTargets_() {
  for (TeamProgress& t : _session.teams) {
    std::vector<uint8_t> order;
    if (!_params.fixed_order.empty()) {
      order = _params.fixed_order;
    } else {
      for (uint8_t id = 1; id <= NUM_TARGETS; id++) order.push_back(id);
      std::shuffle(order.begin(), order.end(), _rng);
    }
    t.assign(order);

    std::string text;
    for (uint8_t id : t.assigned()) {
      if (!text.empty()) text += ",";
      text += std::to_string((unsigned)id);
    }
    LOG_INFO(kTag, "%s order: %s", teamName(t.team()), text.c_str());
  }
}

void GameController::beginTurn_() {
  _session.pending_target = 0;
  _session.stage = TargetStage::ARMED;
  _session.launch_ready = false;

  const Team team = _session.active;
  _hw.restoreTargets(team, _session.activeTeam().hits());
  _hw.setThemeLighting(team);

  if (_lit_target != 0) {
    _hw.setTargetLed(_lit_target, LedColor::OFF);
    _lit_target = 0;
  }
  const uint8_t required = _session.activeTeam().requiredTarget();
  if (required != 0) {
    _hw.setTargetLed(required, teamColor(team));
    _lit_target = required;
  }

  transitionTo_(GameState::PLAYER_TURN);
  LOG_INFO(kTag, "turn %lu: %s, hit target %u", (unsigned long)_session.turn,
           teamName(team), (unsigned)required);
}

void GameController::advanceTurn_() {
  cancelTimers_();
  _session.turn++;
  _session.active = otherTeam(_session.active);
  beginTurn_();
}

void GameController::win_() {
  cancelTimers_();

  const Team winner = _session.active;
  _session.outcome = (winner == Team::RED) ? Outcome::RED_WINS : Outcome::GREEN_WINS;

  _hw.dropGate();
  _hw.raisePongPlatform();
  _hw.playSound(SoundEffect::VICTORY);
  _hw.blowFan(_params.win_fan_ms);

  LOG_INFO(kTag, "%s WINS", teamName(winner));
  transitionTo_(GameState::GAME_OVER);
}

/*=============================================================================
  HELPERS
=============================================================================*/

void GameController::stopActiveChug_() {
  if (_session.state == GameState::CHUG && _session.has_active) {
    _hw.stopChug(_session.active);
  }
}

void GameController::cancelTimers_() {
  for (uint32_t id : _session.timers) _timers.cancel(id);
  _session.timers.clear();
}

void GameController::transitionTo_(GameState next) {
  if (next == _session.state) return;
  LOG_INFO(kTag, "%s -> %s", stateName(_session.state), stateName(next));
  _session.state = next;
}

void GameController::publishSnapshot_() {
  Snapshot s;
  s.state = _session.state;
  s.has_active = _session.has_active;
  s.active = _session.active;
  for (int i = 0; i < TEAM_COUNT; i++) {
    s.hits[i] = _session.teams[i].hits();
    s.required[i] = _session.teams[i].requiredTarget();
  }
  s.turn = _session.turn;
  s.outcome = _session.outcome;
  s.pending_target = _session.pending_target;
  s.launch_ready = _session.launch_ready;

  std::lock_guard<std::mutex> lock(_snapshot_mutex);
  _snapshot = s;
}
