#pragma once

#include <chrono>
#include <cstdint>
#include <thread>

/*
  Clock.h

  Monotonic millisecond time base shared by every worker thread.
  Values are 32-bit and wrap after ~49 days; compare them with unsigned
  subtraction (now_ms - then_ms) the same way the rest of the code does.
*/

namespace clock_ms {

inline uint32_t now() {
  using namespace std::chrono;
  static const steady_clock::time_point epoch = steady_clock::now();
  return (uint32_t)duration_cast<milliseconds>(steady_clock::now() - epoch).count();
}

inline void sleep(uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace clock_ms
