#include "game/GameTypes.h"

#include <strings.h>

const char* teamName(Team t) {
  return (t == Team::RED) ? "Red" : "Green";
}

const char* stateName(GameState s) {
  switch (s) {
    case GameState::WAITING_START:   return "WAITING_START";
    case GameState::COIN_FLIP:       return "COIN_FLIP";
    case GameState::PLAYER_TURN:     return "PLAYER_TURN";
    case GameState::AWAITING_TUNNEL: return "AWAITING_TUNNEL";
    case GameState::AWAITING_LAUNCH: return "AWAITING_LAUNCH";
    case GameState::BALL_LAUNCHED:   return "BALL_LAUNCHED";
    case GameState::CHUG:            return "CHUG";
    case GameState::GAME_OVER:       return "GAME_OVER";
  }
  return "UNKNOWN";
}

const char* outcomeName(Outcome o) {
  switch (o) {
    case Outcome::NONE:       return "none";
    case Outcome::RED_WINS:   return "RED_WINS";
    case Outcome::GREEN_WINS: return "GREEN_WINS";
  }
  return "none";
}

const char* soundName(SoundEffect e) {
  switch (e) {
    case SoundEffect::NEUTRAL:         return "neutral";
    case SoundEffect::HIT:             return "hit";
    case SoundEffect::REVEAL:          return "reveal";
    case SoundEffect::READY_TO_LAUNCH: return "ready_to_launch";
    case SoundEffect::VICTORY:         return "victory";
  }
  return "neutral";
}

const char* colorName(LedColor c) {
  switch (c) {
    case LedColor::OFF:   return "off";
    case LedColor::RED:   return "red";
    case LedColor::GREEN: return "green";
    case LedColor::WHITE: return "white";
  }
  return "off";
}

bool parseTeam(const char* text, Team& out) {
  if (!text) return false;
  if (strcasecmp(text, "red") == 0)   { out = Team::RED;   return true; }
  if (strcasecmp(text, "green") == 0) { out = Team::GREEN; return true; }
  return false;
}
