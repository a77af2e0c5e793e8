#include <gtest/gtest.h>

#include <vector>

#include "Pins.h"
#include "app/AppConfig.h"
#include "events/EventBus.h"
#include "hardware/SimulatedBackend.h"
#include "sensors/SensorMonitor.h"
#include "storage/CalibrationStore.h"

namespace {

class SensorMonitorTest : public ::testing::Test {
protected:
  SensorMonitorTest()
  : cfg(AppConfig::defaults()),
    store(""),
    bus(64),
    monitor(board, store, bus, cfg.sensors)
  {
    store.begin(cfg.servoDefaults(), cfg.thresholdDefaults());
    monitor.begin();
  }

  std::vector<Event> drain() {
    std::vector<Event> out;
    Event ev;
    while (bus.tryPop(ev)) out.push_back(ev);
    return out;
  }

  AppConfig cfg;
  CalibrationStore store;
  SimulatedBackend board;
  EventBus bus;
  SensorMonitor monitor;
};

TEST_F(SensorMonitorTest, FirstReadingOnlyPrimes) {
  board.setAnalog(PRESSURE_CHANNEL_FOR_TARGET[0], 900);
  board.setDigital(LINE_TUNNEL_IR, true);
  monitor.pollOnce(0);
  EXPECT_TRUE(drain().empty());
}

TEST_F(SensorMonitorTest, PadFiresOnceOnCrossing) {
  const uint8_t ch = PRESSURE_CHANNEL_FOR_TARGET[3];   // target 4
  monitor.pollOnce(0);

  board.setAnalog(ch, 600);
  monitor.pollOnce(20);
  monitor.pollOnce(40);
  monitor.pollOnce(400);

  const std::vector<Event> evs = drain();
  ASSERT_EQ(1u, evs.size());
  EXPECT_EQ(EventKind::TARGET_HIT, evs[0].kind);
  EXPECT_EQ(4, evs[0].value);
  EXPECT_EQ(EventSource::SENSOR, evs[0].source);
}

TEST_F(SensorMonitorTest, ReadingAtThresholdCounts) {
  const uint8_t ch = PRESSURE_CHANNEL_FOR_TARGET[0];
  monitor.pollOnce(0);
  board.setAnalog(ch, PRESSURE_DEFAULT_THRESHOLD);
  monitor.pollOnce(20);
  EXPECT_EQ(1u, drain().size());
}

TEST_F(SensorMonitorTest, PadRearmsOnlyAfterSteadyDrop) {
  const uint8_t ch = PRESSURE_CHANNEL_FOR_TARGET[1];
  monitor.pollOnce(0);

  board.setAnalog(ch, 700);
  monitor.pollOnce(20);                 // fires
  board.setAnalog(ch, 100);
  monitor.pollOnce(40);
  board.setAnalog(ch, 700);
  monitor.pollOnce(60);                 // dip shorter than the window
  monitor.pollOnce(60 + PRESSURE_DEBOUNCE_MS);
  monitor.pollOnce(60 + 2 * PRESSURE_DEBOUNCE_MS);
  EXPECT_EQ(1u, drain().size());

  const uint32_t release = 1000;
  board.setAnalog(ch, 100);
  monitor.pollOnce(release);
  monitor.pollOnce(release + PRESSURE_DEBOUNCE_MS);
  board.setAnalog(ch, 700);
  monitor.pollOnce(release + PRESSURE_DEBOUNCE_MS + 20);
  const std::vector<Event> evs = drain();
  ASSERT_EQ(1u, evs.size());
  EXPECT_EQ(2, evs[0].value);
}

TEST_F(SensorMonitorTest, BouncedLineFiresOnce) {
  monitor.pollOnce(0);

  board.setDigital(LINE_BALL_RETURN_IR, true);
  monitor.pollOnce(1000);
  board.setDigital(LINE_BALL_RETURN_IR, false);
  monitor.pollOnce(1020);
  board.setDigital(LINE_BALL_RETURN_IR, true);
  monitor.pollOnce(1040);
  monitor.pollOnce(1060);
  monitor.pollOnce(1080);
  monitor.pollOnce(1000 + 4 * DIGITAL_DEBOUNCE_MS);

  std::vector<Event> evs = drain();
  ASSERT_EQ(1u, evs.size());
  EXPECT_EQ(EventKind::BALL_RETURN, evs[0].kind);

  // Real release, then a new break
  board.setDigital(LINE_BALL_RETURN_IR, false);
  monitor.pollOnce(2000);
  monitor.pollOnce(2000 + DIGITAL_DEBOUNCE_MS);
  board.setDigital(LINE_BALL_RETURN_IR, true);
  monitor.pollOnce(2000 + DIGITAL_DEBOUNCE_MS + 20);

  evs = drain();
  ASSERT_EQ(1u, evs.size());
  EXPECT_EQ(EventKind::BALL_RETURN, evs[0].kind);
}

TEST_F(SensorMonitorTest, ShortBeamBreakStillFires) {
  monitor.pollOnce(0);
  board.setDigital(LINE_TUNNEL_IR, true);
  monitor.pollOnce(20);
  board.setDigital(LINE_TUNNEL_IR, false);
  monitor.pollOnce(40);

  const std::vector<Event> evs = drain();
  ASSERT_EQ(1u, evs.size());
  EXPECT_EQ(EventKind::TUNNEL, evs[0].kind);
}

TEST_F(SensorMonitorTest, FallingEdgeIgnored) {
  board.setDigital(LINE_BALL_RETURN_IR, true);
  monitor.pollOnce(0);
  board.setDigital(LINE_BALL_RETURN_IR, false);
  monitor.pollOnce(100);
  EXPECT_TRUE(drain().empty());
}

TEST_F(SensorMonitorTest, LinesMapToTheirEvents) {
  monitor.pollOnce(0);
  board.setDigital(LINE_TARGET1_IR, true);
  board.setDigital(LINE_BTN_DISPENSE_GRN, true);
  board.setDigital(LINE_BTN_START, true);
  monitor.pollOnce(100);

  const std::vector<Event> evs = drain();
  ASSERT_EQ(3u, evs.size());

  bool confirm = false, dispense = false, start = false;
  for (const Event& ev : evs) {
    if (ev.kind == EventKind::TARGET_CONFIRM) {
      confirm = true;
      EXPECT_EQ(TWO_STAGE_TARGET, ev.value);
    } else if (ev.kind == EventKind::DISPENSE) {
      dispense = true;
      EXPECT_EQ(Team::GREEN, ev.team);
    } else if (ev.kind == EventKind::START) {
      start = true;
    }
  }
  EXPECT_TRUE(confirm);
  EXPECT_TRUE(dispense);
  EXPECT_TRUE(start);
}

TEST_F(SensorMonitorTest, ReadErrorDoesNotStopOtherChannels) {
  const uint8_t bad = PRESSURE_CHANNEL_FOR_TARGET[0];
  const uint8_t good = PRESSURE_CHANNEL_FOR_TARGET[1];

  board.setAnalogFault(bad, true);
  monitor.pollOnce(0);
  board.setAnalog(bad, 900);
  board.setAnalog(good, 900);
  monitor.pollOnce(20);

  std::vector<Event> evs = drain();
  ASSERT_EQ(1u, evs.size());
  EXPECT_EQ(2, evs[0].value);
  EXPECT_EQ(2u, monitor.stats().read_errors);

  // Recovered channel primes first, then fires on its next crossing
  board.setAnalogFault(bad, false);
  board.setAnalog(bad, 0);
  monitor.pollOnce(40);
  board.setAnalog(bad, 900);
  monitor.pollOnce(60);
  evs = drain();
  ASSERT_EQ(1u, evs.size());
  EXPECT_EQ(1, evs[0].value);
}

TEST_F(SensorMonitorTest, SetThresholdClampsAndPersists) {
  const uint8_t ch = PRESSURE_CHANNEL_FOR_TARGET[2];

  EXPECT_TRUE(monitor.setThreshold(ch, 5000));
  SensorThreshold t;
  ASSERT_TRUE(monitor.threshold(ch, t));
  EXPECT_EQ(PRESSURE_MAX_THRESHOLD, t.value);
  ASSERT_TRUE(store.threshold(ch, t));
  EXPECT_EQ(PRESSURE_MAX_THRESHOLD, t.value);

  EXPECT_FALSE(monitor.setThreshold(99, 100));
  EXPECT_FALSE(monitor.hasChannel(99));
}

TEST_F(SensorMonitorTest, NewThresholdApplies) {
  const uint8_t ch = PRESSURE_CHANNEL_FOR_TARGET[4];
  ASSERT_TRUE(monitor.setThreshold(ch, 800));
  monitor.pollOnce(0);

  board.setAnalog(ch, 700);
  monitor.pollOnce(20);
  EXPECT_TRUE(drain().empty());

  board.setAnalog(ch, 850);
  monitor.pollOnce(40);
  EXPECT_EQ(1u, drain().size());
}

TEST_F(SensorMonitorTest, PersistedThresholdLoadedAtBegin) {
  SensorThreshold t;
  t.channel = PRESSURE_CHANNEL_FOR_TARGET[6];
  t.value = 100;
  t.debounce_ms = 10;
  ASSERT_TRUE(store.saveThreshold(t));

  SensorMonitor other(board, store, bus, cfg.sensors);
  other.begin();
  SensorThreshold loaded;
  ASSERT_TRUE(other.threshold(t.channel, loaded));
  EXPECT_EQ(100, loaded.value);
  EXPECT_EQ(10u, loaded.debounce_ms);
}

}  // namespace
