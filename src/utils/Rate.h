#pragma once

#include <cstdint>

/*
  Rate

  Fixed-rate gate for periodic work (sensor polling, servo ramping).
  Worker threads call ready(now_ms) every loop and sleep for msUntilReady()
  in between, so the loop body runs at the configured frequency without
  drifting when a cycle takes longer than expected.
*/

class Rate {
public:
  // hz = how many times per second you want to run
  explicit Rate(uint16_t hz = 1) { setHz(hz); }

  void setHz(uint16_t hz) {
    if (hz == 0) hz = 1;
    _period_ms = (uint32_t)(1000UL / hz);
    if (_period_ms == 0) _period_ms = 1;
  }

  void setPeriodMs(uint32_t period_ms) {
    _period_ms = (period_ms == 0) ? 1 : period_ms;
  }

  // Returns true when it's time to run. If true, it schedules the next tick.
  bool ready(uint32_t now_ms) {
    if (!_initialized) {
      _next_ms = now_ms;      // run immediately on first call
      _initialized = true;
    }

    // Safe with clock rollover because of signed subtraction trick
    if ((int32_t)(now_ms - _next_ms) >= 0) {
      _next_ms = now_ms + _period_ms;
      return true;
    }
    return false;
  }

  // How long a worker may sleep before the next tick is due (0 = due now).
  uint32_t msUntilReady(uint32_t now_ms) const {
    if (!_initialized) return 0;
    const int32_t remaining = (int32_t)(_next_ms - now_ms);
    return (remaining > 0) ? (uint32_t)remaining : 0;
  }

  // Forget the schedule; the next ready() call fires immediately.
  void reset() { _initialized = false; }

  uint32_t periodMs() const { return _period_ms; }
  uint32_t nextMs() const { return _next_ms; }

private:
  uint32_t _period_ms = 1000;
  uint32_t _next_ms = 0;
  bool _initialized = false;
};
