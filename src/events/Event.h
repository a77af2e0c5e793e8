#pragma once

#include <cstdint>

#include "game/GameTypes.h"

/*
===============================================================================
  Event.h
===============================================================================

  PURPOSE
  -------
  The one record type that travels over the EventBus. Producers build an
  Event by value with the helpers in namespace events; the bus stamps seq
  and publish time; the consumer never modifies it.

  Field use per kind:
    TARGET_HIT / TARGET_CONFIRM : value = target id
    DISPENSE                    : team
    TIMER_EXPIRED               : timer_id + timer
    everything else             : no payload
===============================================================================
*/

enum class EventKind : uint8_t {
  START = 0,
  RESET,
  NEXT_TURN,
  DISPENSE,
  TARGET_HIT,
  TARGET_CONFIRM,
  TUNNEL,
  LAUNCH,
  BALL_RETURN,
  TIMER_EXPIRED,
};

enum class EventSource : uint8_t {
  SENSOR = 0,
  COMMAND,
  TIMER,
  INTERRUPT,
};

enum class TimerKind : uint8_t {
  LAUNCH_COUNTDOWN = 0,
};

struct Event {
  EventKind kind = EventKind::START;
  EventSource source = EventSource::COMMAND;

  int value = 0;
  Team team = Team::RED;

  uint32_t timer_id = 0;
  TimerKind timer = TimerKind::LAUNCH_COUNTDOWN;

  // Stamped by EventBus::publish()
  uint64_t seq = 0;
  uint32_t published_ms = 0;
};

const char* eventKindName(EventKind kind);
const char* eventSourceName(EventSource source);

namespace events {

inline Event make(EventKind kind, EventSource source, int value = 0) {
  Event ev;
  ev.kind = kind;
  ev.source = source;
  ev.value = value;
  return ev;
}

inline Event start(EventSource src)                { return make(EventKind::START, src); }
inline Event reset(EventSource src)                { return make(EventKind::RESET, src); }
inline Event nextTurn(EventSource src)             { return make(EventKind::NEXT_TURN, src); }
inline Event tunnel(EventSource src)               { return make(EventKind::TUNNEL, src); }
inline Event launch(EventSource src)               { return make(EventKind::LAUNCH, src); }
inline Event ballReturn(EventSource src)           { return make(EventKind::BALL_RETURN, src); }
inline Event targetHit(EventSource src, int id)    { return make(EventKind::TARGET_HIT, src, id); }
inline Event targetConfirm(EventSource src, int id){ return make(EventKind::TARGET_CONFIRM, src, id); }

inline Event dispense(EventSource src, Team team) {
  Event ev = make(EventKind::DISPENSE, src);
  ev.team = team;
  return ev;
}

inline Event timerExpired(uint32_t id, TimerKind kind) {
  Event ev = make(EventKind::TIMER_EXPIRED, EventSource::TIMER);
  ev.timer_id = id;
  ev.timer = kind;
  return ev;
}

}  // namespace events
