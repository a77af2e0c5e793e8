#pragma once

#include <cstdint>

/*
===============================================================================
  GameTypes.h
===============================================================================

  PURPOSE
  -------
  Small value types shared by the game logic, the event records and the
  hardware backends. Names returned by the *Name() helpers are what appears
  in log lines and on the serial wire.
===============================================================================
*/

enum class Team : uint8_t {
  RED = 0,
  GREEN = 1,
};

constexpr int TEAM_COUNT = 2;

enum class GameState : uint8_t {
  WAITING_START = 0,
  COIN_FLIP,
  PLAYER_TURN,
  AWAITING_TUNNEL,
  AWAITING_LAUNCH,
  BALL_LAUNCHED,
  CHUG,
  GAME_OVER,
};

enum class Outcome : uint8_t {
  NONE = 0,
  RED_WINS,
  GREEN_WINS,
};

// Completion sub-state of a two-stage target
enum class TargetStage : uint8_t {
  ARMED = 0,
  TRIGGERED,
  CONFIRMED,
};

enum class SoundEffect : uint8_t {
  NEUTRAL = 0,
  HIT,
  REVEAL,
  READY_TO_LAUNCH,
  VICTORY,
};

enum class LedColor : uint8_t {
  OFF = 0,
  RED,
  GREEN,
  WHITE,
};

inline Team otherTeam(Team t) { return (t == Team::RED) ? Team::GREEN : Team::RED; }
inline int teamIndex(Team t) { return (int)t; }
inline LedColor teamColor(Team t) { return (t == Team::RED) ? LedColor::RED : LedColor::GREEN; }

const char* teamName(Team t);
const char* stateName(GameState s);
const char* outcomeName(Outcome o);
const char* soundName(SoundEffect e);
const char* colorName(LedColor c);

// Accepts "red"/"green" (any case)
bool parseTeam(const char* text, Team& out);
