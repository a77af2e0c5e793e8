#include "events/Event.h"

const char* eventKindName(EventKind kind) {
  switch (kind) {
    case EventKind::START:          return "start";
    case EventKind::RESET:          return "reset";
    case EventKind::NEXT_TURN:      return "next";
    case EventKind::DISPENSE:       return "dispense";
    case EventKind::TARGET_HIT:     return "hit";
    case EventKind::TARGET_CONFIRM: return "confirm";
    case EventKind::TUNNEL:         return "tunnel";
    case EventKind::LAUNCH:         return "launch";
    case EventKind::BALL_RETURN:    return "return";
    case EventKind::TIMER_EXPIRED:  return "timer";
  }
  return "unknown";
}

const char* eventSourceName(EventSource source) {
  switch (source) {
    case EventSource::SENSOR:    return "sensor";
    case EventSource::COMMAND:   return "command";
    case EventSource::TIMER:     return "timer";
    case EventSource::INTERRUPT: return "interrupt";
  }
  return "unknown";
}
