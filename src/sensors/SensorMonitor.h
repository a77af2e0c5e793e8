#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

#include "app/AppConfig.h"

class CalibrationStore;
class EventBus;
class IoBoard;

/*
===============================================================================
  SensorMonitor.h
===============================================================================

  PURPOSE
  -------
  Turns raw channel levels into discrete game events.

    Analog (pressure pads):
      - fires when a reading reaches the channel threshold after having been
        below it
      - re-arms only after it has stayed below for the whole debounce
        window; a dip shorter than that is contact noise and is ignored
      - the very first reading only primes the channel (a pad that is
        already pressed at startup does not fire)

    Digital (IR beams, panel buttons):
      - same rule on the line level: the rise fires at once, the release is
        accepted only once the line has stayed low for the window

  Each channel keeps its raw level (with the time it last changed) and a
  stable level. Events come from low -> high changes of the stable level.

  A failed read skips that channel for the cycle. The failure is logged
  once when it starts and once when it clears; other channels keep polling.

  pollOnce() is the whole cycle; the worker thread just calls it at
  poll_hz. Tests drive pollOnce() directly with a fake clock.
===============================================================================
*/

class SensorMonitor {
public:
  struct Stats {
    uint32_t cycles = 0;
    uint32_t events = 0;
    uint32_t read_errors = 0;
  };

  SensorMonitor(IoBoard& board, CalibrationStore& store, EventBus& bus,
                const SensorParams& params);
  ~SensorMonitor();

  SensorMonitor(const SensorMonitor&) = delete;
  SensorMonitor& operator=(const SensorMonitor&) = delete;

  // Load thresholds from the store. Call once before start()/pollOnce().
  void begin();

  void start();
  void stop();

  // One polling cycle over every bound channel
  void pollOnce(uint32_t now_ms);

  // Clamped to the ADC range and persisted. False for an unbound channel
  // (or if the write to disk failed).
  bool setThreshold(uint8_t channel, int value);
  bool threshold(uint8_t channel, SensorThreshold& out) const;
  bool hasChannel(uint8_t channel) const;

  Stats stats() const;

private:
  struct Edge {
    bool primed = false;
    bool raw = false;
    uint32_t raw_since_ms = 0;
    bool stable = false;
  };

  struct AnalogChannel {
    AnalogBinding binding;
    SensorThreshold threshold;
    Edge edge;
    bool failing = false;
  };

  struct DigitalChannel {
    DigitalBinding binding;
    Edge edge;
    bool failing = false;
  };

  // True when the stable level goes low -> high on this reading
  static bool risingEdge_(Edge& e, bool level, uint32_t window_ms, uint32_t now_ms);

  // Caller holds _mutex
  void pollAnalog_(AnalogChannel& ch, uint32_t now_ms);
  void pollDigital_(DigitalChannel& ch, uint32_t now_ms);
  void readFailed_(bool& failing, const char* what, uint8_t id);
  void readRecovered_(bool& failing, const char* what, uint8_t id);
  void emit_(EventKind kind, int value, Team team);

  void run_();

  IoBoard& _board;
  CalibrationStore& _store;
  EventBus& _bus;
  const SensorParams& _params;

  mutable std::mutex _mutex;
  std::vector<AnalogChannel> _analog;
  std::vector<DigitalChannel> _digital;
  Stats _stats;

  std::atomic<bool> _running;
  std::thread _thread;
};
