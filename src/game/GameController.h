#pragma once

#include <cstdint>
#include <mutex>
#include <random>

#include "app/AppConfig.h"
#include "events/Event.h"
#include "game/GameSession.h"

class ActuatorController;
class EventBus;
class HardwareInterface;
class TimerScheduler;

/*
===============================================================================
  GameController.h
===============================================================================

  PURPOSE
  -------
  The authoritative game state machine. It owns the GameSession and is the
  only thing that commands the table during play.

    WAITING_START -> COIN_FLIP -> PLAYER_TURN -> AWAITING_TUNNEL
      -> AWAITING_LAUNCH -> BALL_LAUNCHED -> CHUG -> PLAYER_TURN | GAME_OVER

  THREADING
  ---------
  handle()/processNext() run on the single consumer thread only. Every other
  thread talks to the game by publishing on the EventBus. snapshot() is the
  one call that is safe from any thread.

  SCORING
  -------
  A correct hit is held as pending_target. It is marked complete when the
  ball comes back during CHUG; the win check happens at that moment.
  A ball return before the chug (PLAYER_TURN, AWAITING_TUNNEL) is a missed
  shot: the turn passes and nothing is marked.
===============================================================================
*/

class GameController {
public:
  struct Snapshot {
    GameState state = GameState::WAITING_START;
    bool has_active = false;
    Team active = Team::RED;
    uint8_t hits[TEAM_COUNT] = {0, 0};
    uint8_t required[TEAM_COUNT] = {0, 0};   // 0 = none (finished or not started)
    uint32_t turn = 0;
    Outcome outcome = Outcome::NONE;
    uint8_t pending_target = 0;
    bool launch_ready = false;
  };

  GameController(const GameParams& params, HardwareInterface& hw,
                 ActuatorController& actuators, TimerScheduler& timers);

  GameController(const GameController&) = delete;
  GameController& operator=(const GameController&) = delete;

  // Process one event to completion
  void handle(const Event& ev);

  // Pop and handle one event. False on timeout or once the bus is closed and empty.
  bool processNext(EventBus& bus, uint32_t timeout_ms);

  Snapshot snapshot() const;

  // Consumer thread (and tests) only
  const GameSession& session() const { return _session; }

private:
  void onStart_();
  void onReset_();
  void onForceNext_();
  void onDispense_(Team team);
  void onTargetHit_(int target);
  void onTargetConfirm_(int target);
  void onTunnel_();
  void onTimer_(const Event& ev);
  void onLaunch_();
  void onBallReturn_();

  void assignTargets_();
  void beginTurn_();
  void advanceTurn_();
  void registerHit_(uint8_t target);
  void win_();

  void stopActiveChug_();
  void cancelTimers_();
  void transitionTo_(GameState next);
  void publishSnapshot_();

  const GameParams& _params;
  HardwareInterface& _hw;
  ActuatorController& _actuators;
  TimerScheduler& _timers;

  std::mt19937 _rng;

  GameSession _session;
  uint8_t _lit_target = 0;   // target LED currently lit for the active team

  mutable std::mutex _snapshot_mutex;
  Snapshot _snapshot;
};
