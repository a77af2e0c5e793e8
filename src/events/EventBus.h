#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

#include "Params.h"
#include "events/Event.h"

/*
===============================================================================
  EventBus.h
===============================================================================

  PURPOSE
  -------
  Multi-producer, single-consumer FIFO between the input threads (sensor
  poller, console, timers) and the game thread.

  IMPORTANT
  ---------
  - publish() never blocks: when the queue is full the OLDEST event is
    dropped and dropped() increments.
  - Every published event gets a global sequence number; pop() hands them
    out in exactly that order.
  - After close(), publish() refuses new events and pop() drains what is
    left, then returns false.
===============================================================================
*/

class EventBus {
public:
  explicit EventBus(size_t capacity = EVENT_QUEUE_CAPACITY);

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Returns false only if the bus is closed.
  bool publish(Event ev);

  // Waits up to timeout_ms for the next event. False on timeout or when
  // closed and empty.
  bool pop(Event& out, uint32_t timeout_ms);

  // Non-blocking variant
  bool tryPop(Event& out);

  void close();
  bool isClosed() const;

  size_t size() const;
  size_t capacity() const { return _capacity; }

  uint64_t published() const;
  uint32_t dropped() const;

private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::deque<Event> _queue;

  size_t _capacity;
  uint64_t _next_seq = 1;
  uint32_t _dropped = 0;
  bool _closed = false;
};
