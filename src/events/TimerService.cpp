#include "events/TimerService.h"

#include <algorithm>

#include "events/EventBus.h"
#include "utils/Log.h"

TimerService::TimerService(EventBus& bus)
: _bus(bus)
{
}

TimerService::~TimerService() {
  stop();
}

void TimerService::start() {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_running) return;
  _running = true;
  _thread = std::thread(&TimerService::run_, this);
}

void TimerService::stop() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_running) return;
    _running = false;
  }
  _cv.notify_all();
  if (_thread.joinable()) _thread.join();
}

uint32_t TimerService::schedule(uint32_t delay_ms, TimerKind kind) {
  uint32_t id;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    id = _next_id++;
    if (_next_id == 0) _next_id = 1;

    Entry e;
    e.id = id;
    e.kind = kind;
    e.due = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
    _entries.push_back(e);
  }
  _cv.notify_all();

  LOG_DEBUG("Timer", "scheduled id=%lu in %lu ms", (unsigned long)id, (unsigned long)delay_ms);
  return id;
}

void TimerService::cancel(uint32_t id) {
  std::lock_guard<std::mutex> lock(_mutex);
  _entries.erase(std::remove_if(_entries.begin(), _entries.end(),
                                [id](const Entry& e) { return e.id == id; }),
                 _entries.end());
  _cv.notify_all();
}

void TimerService::cancelAll() {
  std::lock_guard<std::mutex> lock(_mutex);
  _entries.clear();
  _cv.notify_all();
}

size_t TimerService::pending() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _entries.size();
}

void TimerService::run_() {
  std::unique_lock<std::mutex> lock(_mutex);

  while (_running) {
    if (_entries.empty()) {
      _cv.wait(lock);
      continue;
    }

    auto earliest = std::min_element(_entries.begin(), _entries.end(),
                                     [](const Entry& a, const Entry& b) { return a.due < b.due; });
    const auto due = earliest->due;

    if (std::chrono::steady_clock::now() < due) {
      // Woken early by schedule/cancel/stop: re-evaluate from the top
      _cv.wait_until(lock, due);
      continue;
    }

    const Entry fired = *earliest;
    _entries.erase(earliest);

    // Publish outside our lock so a slow bus never stalls schedule()/cancel()
    lock.unlock();
    _bus.publish(events::timerExpired(fired.id, fired.kind));
    lock.lock();
  }
}
