#include "sensors/SensorMonitor.h"

#include "events/EventBus.h"
#include "hardware/HardwareInterface.h"
#include "storage/CalibrationStore.h"
#include "utils/Clock.h"
#include "utils/Log.h"
#include "utils/Rate.h"

namespace {

const char* kTag = "Sensor";

int clampThreshold(int value) {
  if (value < PRESSURE_MIN_THRESHOLD) return PRESSURE_MIN_THRESHOLD;
  if (value > PRESSURE_MAX_THRESHOLD) return PRESSURE_MAX_THRESHOLD;
  return value;
}

}  // namespace

SensorMonitor::SensorMonitor(IoBoard& board, CalibrationStore& store, EventBus& bus,
                             const SensorParams& params)
: _board(board),
  _store(store),
  _bus(bus),
  _params(params),
  _running(false)
{
  for (const AnalogBinding& b : params.analog) {
    AnalogChannel ch;
    ch.binding = b;
    ch.threshold.channel = b.channel;
    _analog.push_back(ch);
  }
  for (const DigitalBinding& b : params.digital) {
    DigitalChannel ch;
    ch.binding = b;
    _digital.push_back(ch);
  }
}

SensorMonitor::~SensorMonitor() {
  stop();
}

void SensorMonitor::begin() {
  std::lock_guard<std::mutex> lock(_mutex);
  for (AnalogChannel& ch : _analog) {
    SensorThreshold t;
    if (_store.threshold(ch.binding.channel, t)) {
      ch.threshold = t;
      ch.threshold.value = clampThreshold(t.value);
    }
    LOG_DEBUG(kTag, "pad %u: threshold %d, debounce %lu ms",
              (unsigned)ch.binding.channel, ch.threshold.value,
              (unsigned long)ch.threshold.debounce_ms);
  }
  LOG_INFO(kTag, "monitoring %u pressure channels, %u digital lines",
           (unsigned)_analog.size(), (unsigned)_digital.size());
}

void SensorMonitor::start() {
  if (_running.exchange(true)) return;
  _thread = std::thread(&SensorMonitor::run_, this);
}

void SensorMonitor::stop() {
  if (!_running.exchange(false)) return;
  if (_thread.joinable()) _thread.join();
}

void SensorMonitor::pollOnce(uint32_t now_ms) {
  std::lock_guard<std::mutex> lock(_mutex);
  _stats.cycles++;
  for (AnalogChannel& ch : _analog) pollAnalog_(ch, now_ms);
  for (DigitalChannel& ch : _digital) pollDigital_(ch, now_ms);
}

bool SensorMonitor::risingEdge_(Edge& e, bool level, uint32_t window_ms, uint32_t now_ms) {
  if (!e.primed) {
    e.primed = true;
    e.raw = level;
    e.stable = level;
    e.raw_since_ms = now_ms;
    return false;
  }

  if (level != e.raw) {
    e.raw = level;
    e.raw_since_ms = now_ms;
  }

  if (e.raw && !e.stable) {
    e.stable = true;
    return true;
  }

  // A release only counts once it has held for the whole window
  if (!e.raw && e.stable && (uint32_t)(now_ms - e.raw_since_ms) >= window_ms) {
    e.stable = false;
  }
  return false;
}

void SensorMonitor::pollAnalog_(AnalogChannel& ch, uint32_t now_ms) {
  int reading = 0;
  if (!_board.readAnalog(ch.binding.channel, reading)) {
    readFailed_(ch.failing, "pad", ch.binding.channel);
    return;
  }
  readRecovered_(ch.failing, "pad", ch.binding.channel);

  const bool above = reading >= ch.threshold.value;
  if (!risingEdge_(ch.edge, above, ch.threshold.debounce_ms, now_ms)) return;

  LOG_DEBUG(kTag, "pad %u crossed %d (read %d)",
            (unsigned)ch.binding.channel, ch.threshold.value, reading);
  emit_(ch.binding.kind, ch.binding.value, Team::RED);
}

void SensorMonitor::pollDigital_(DigitalChannel& ch, uint32_t now_ms) {
  bool level = false;
  if (!_board.readDigital(ch.binding.line, level)) {
    readFailed_(ch.failing, "line", ch.binding.line);
    return;
  }
  readRecovered_(ch.failing, "line", ch.binding.line);

  if (!risingEdge_(ch.edge, level, ch.binding.debounce_ms, now_ms)) return;

  LOG_DEBUG(kTag, "line %u rising edge", (unsigned)ch.binding.line);
  emit_(ch.binding.kind, ch.binding.value, ch.binding.team);
}

void SensorMonitor::readFailed_(bool& failing, const char* what, uint8_t id) {
  _stats.read_errors++;
  if (!failing) {
    failing = true;
    LOG_WARN(kTag, "%s %u read failed, skipping until it recovers", what, (unsigned)id);
  }
}

void SensorMonitor::readRecovered_(bool& failing, const char* what, uint8_t id) {
  if (failing) {
    failing = false;
    LOG_INFO(kTag, "%s %u reading again", what, (unsigned)id);
  }
}

void SensorMonitor::emit_(EventKind kind, int value, Team team) {
  Event ev = events::make(kind, EventSource::SENSOR, value);
  ev.team = team;
  if (_bus.publish(ev)) {
    _stats.events++;
  }
}

bool SensorMonitor::setThreshold(uint8_t channel, int value) {
  std::lock_guard<std::mutex> lock(_mutex);

  for (AnalogChannel& ch : _analog) {
    if (ch.binding.channel != channel) continue;

    const int clamped = clampThreshold(value);
    if (clamped != value) {
      LOG_WARN(kTag, "pad %u: threshold %d out of range, clamped to %d",
               (unsigned)channel, value, clamped);
    }
    ch.threshold.value = clamped;
    LOG_INFO(kTag, "pad %u threshold set to %d", (unsigned)channel, clamped);
    return _store.saveThreshold(ch.threshold);
  }

  LOG_WARN(kTag, "setThreshold: no pressure channel %u", (unsigned)channel);
  return false;
}

bool SensorMonitor::threshold(uint8_t channel, SensorThreshold& out) const {
  std::lock_guard<std::mutex> lock(_mutex);
  for (const AnalogChannel& ch : _analog) {
    if (ch.binding.channel == channel) {
      out = ch.threshold;
      return true;
    }
  }
  return false;
}

bool SensorMonitor::hasChannel(uint8_t channel) const {
  std::lock_guard<std::mutex> lock(_mutex);
  for (const AnalogChannel& ch : _analog) {
    if (ch.binding.channel == channel) return true;
  }
  return false;
}

SensorMonitor::Stats SensorMonitor::stats() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _stats;
}

void SensorMonitor::run_() {
  Rate rate(_params.poll_hz);

  while (_running.load()) {
    const uint32_t now_ms = clock_ms::now();
    if (rate.ready(now_ms)) {
      pollOnce(now_ms);
    }
    const uint32_t wait_ms = rate.msUntilReady(clock_ms::now());
    clock_ms::sleep(wait_ms > 0 ? wait_ms : 1);
  }
}
