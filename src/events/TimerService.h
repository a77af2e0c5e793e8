#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

#include "events/Event.h"

class EventBus;

/*
===============================================================================
  TimerService.h
===============================================================================

  PURPOSE
  -------
  One-shot timers owned by the game. A timer never calls back into game
  code: at its deadline it publishes TIMER_EXPIRED(id, kind) on the
  EventBus, so expirations are ordered with every other input.

  TimerScheduler is the seam GameController depends on; tests substitute
  a manual scheduler.
===============================================================================
*/

class TimerScheduler {
public:
  virtual ~TimerScheduler() = default;

  // Returns a non-zero id unique for the lifetime of the scheduler
  virtual uint32_t schedule(uint32_t delay_ms, TimerKind kind) = 0;

  // Cancelling an unknown or already-fired id is a no-op
  virtual void cancel(uint32_t id) = 0;
  virtual void cancelAll() = 0;
};

class TimerService : public TimerScheduler {
public:
  explicit TimerService(EventBus& bus);
  ~TimerService() override;

  TimerService(const TimerService&) = delete;
  TimerService& operator=(const TimerService&) = delete;

  void start();
  void stop();

  uint32_t schedule(uint32_t delay_ms, TimerKind kind) override;
  void cancel(uint32_t id) override;
  void cancelAll() override;

  size_t pending() const;

private:
  struct Entry {
    uint32_t id;
    TimerKind kind;
    std::chrono::steady_clock::time_point due;
  };

  void run_();

  EventBus& _bus;

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::vector<Entry> _entries;
  uint32_t _next_id = 1;

  bool _running = false;
  std::thread _thread;
};
