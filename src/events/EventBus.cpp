#include "events/EventBus.h"

#include <chrono>

#include "utils/Clock.h"
#include "utils/Log.h"

EventBus::EventBus(size_t capacity)
: _capacity(capacity == 0 ? 1 : capacity)
{
}

bool EventBus::publish(Event ev) {
  bool dropped_oldest = false;
  uint64_t dropped_seq = 0;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_closed) return false;

    if (_queue.size() >= _capacity) {
      dropped_seq = _queue.front().seq;
      _queue.pop_front();
      _dropped++;
      dropped_oldest = true;
    }

    ev.seq = _next_seq++;
    ev.published_ms = clock_ms::now();
    _queue.push_back(ev);
  }
  _cv.notify_one();

  if (dropped_oldest) {
    LOG_WARN("Bus", "queue full (%u), dropped event seq=%llu",
             (unsigned)_capacity, (unsigned long long)dropped_seq);
  }
  return true;
}

bool EventBus::pop(Event& out, uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lock(_mutex);
  _cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
               [this] { return !_queue.empty() || _closed; });

  if (_queue.empty()) return false;

  out = _queue.front();
  _queue.pop_front();
  return true;
}

bool EventBus::tryPop(Event& out) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_queue.empty()) return false;
  out = _queue.front();
  _queue.pop_front();
  return true;
}

void EventBus::close() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _closed = true;
  }
  _cv.notify_all();
}

bool EventBus::isClosed() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _closed;
}

size_t EventBus::size() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _queue.size();
}

uint64_t EventBus::published() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _next_seq - 1;
}

uint32_t EventBus::dropped() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _dropped;
}
