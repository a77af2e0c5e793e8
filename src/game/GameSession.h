#pragma once

#include <cstdint>
#include <vector>

#include "game/GameTypes.h"

/*
  GameSession

  Purpose:
  - TeamProgress: one team's assigned target order and completed set
  - GameSession: everything the state machine owns for one game

  Only GameController mutates a GameSession.
*/

class TeamProgress {
public:
  explicit TeamProgress(Team team = Team::RED) : _team(team) {}

  Team team() const { return _team; }

  // Start a new game with this target order (ids outside 1..NUM_TARGETS are dropped)
  void assign(const std::vector<uint8_t>& order);
  void clear();

  const std::vector<uint8_t>& assigned() const { return _assigned; }

  bool isAssigned(uint8_t target) const;
  bool isCompleted(uint8_t target) const;

  // Marks target complete. Returns false (and changes nothing) if the id is
  // not assigned or already completed.
  bool complete(uint8_t target);

  // First assigned target not yet completed, 0 when the team is finished
  uint8_t requiredTarget() const;

  uint8_t hits() const { return _hits; }
  bool finished() const { return !_assigned.empty() && _hits == _assigned.size(); }

private:
  Team _team;
  std::vector<uint8_t> _assigned;
  uint32_t _completed_mask = 0;   // bit n set = target n completed
  uint8_t _hits = 0;
};

struct GameSession {
  GameState state = GameState::WAITING_START;

  bool has_active = false;
  Team active = Team::RED;

  TeamProgress teams[TEAM_COUNT] = {TeamProgress(Team::RED), TeamProgress(Team::GREEN)};

  uint32_t turn = 0;
  Outcome outcome = Outcome::NONE;

  // Correct hit waiting for the ball-return to be scored (0 = none)
  uint8_t pending_target = 0;

  // Two-stage target progress for the current turn
  TargetStage stage = TargetStage::ARMED;

  bool launch_ready = false;

  // Timer ids scheduled by the controller that have not fired yet
  std::vector<uint32_t> timers;

  TeamProgress& team(Team t) { return teams[teamIndex(t)]; }
  const TeamProgress& team(Team t) const { return teams[teamIndex(t)]; }

  TeamProgress& activeTeam() { return team(active); }
  const TeamProgress& activeTeam() const { return team(active); }
};
