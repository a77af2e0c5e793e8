#include "game/GameSession.h"

#include "Params.h"

void TeamProgress::assign(const std::vector<uint8_t>& order) {
  clear();
  for (uint8_t id : order) {
    if (id < 1 || id > NUM_TARGETS) continue;
    if (isAssigned(id)) continue;
    _assigned.push_back(id);
  }
}

void TeamProgress::clear() {
  _assigned.clear();
  _completed_mask = 0;
  _hits = 0;
}

bool TeamProgress::isAssigned(uint8_t target) const {
  for (uint8_t id : _assigned) {
    if (id == target) return true;
  }
  return false;
}

bool TeamProgress::isCompleted(uint8_t target) const {
  if (target < 1 || target > NUM_TARGETS) return false;
  return (_completed_mask & (1UL << target)) != 0;
}

bool TeamProgress::complete(uint8_t target) {
  if (!isAssigned(target) || isCompleted(target)) return false;
  _completed_mask |= (1UL << target);
  _hits++;
  return true;
}

uint8_t TeamProgress::requiredTarget() const {
  for (uint8_t id : _assigned) {
    if (!isCompleted(id)) return id;
  }
  return 0;
}
