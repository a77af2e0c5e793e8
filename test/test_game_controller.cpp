#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "Pins.h"
#include "TestSupport.h"
#include "actuators/ActuatorController.h"
#include "app/AppConfig.h"
#include "events/EventBus.h"
#include "game/GameController.h"
#include "hardware/SimulatedBackend.h"
#include "sensors/SensorMonitor.h"
#include "storage/CalibrationStore.h"

namespace {

const std::vector<uint8_t> kOrder = {3, 1, 5, 7, 2, 6, 4};

class GameControllerTest : public ::testing::Test {
protected:
  GameControllerTest()
  : cfg(AppConfig::defaults()),
    store("")
  {
    cfg.game.fixed_order = kOrder;
    cfg.game.seed = 1234;
    store.begin(cfg.servoDefaults(), cfg.thresholdDefaults());

    actuators.reset(new ActuatorController(board, store, cfg.servos));
    actuators->begin(0);
    game.reset(new GameController(cfg.game, hw, *actuators, timers));
  }

  void send(const Event& ev) { game->handle(ev); }

  GameState state() const { return game->session().state; }
  Team active() const { return game->session().active; }
  const TeamProgress& team(Team t) const { return game->session().team(t); }

  // Hit the active team's required target, including the confirm stage of target 1
  void hitRequired() {
    const uint8_t target = game->session().activeTeam().requiredTarget();
    send(events::targetHit(EventSource::SENSOR, target));
    if (target == TWO_STAGE_TARGET) {
      send(events::targetConfirm(EventSource::SENSOR, target));
    }
  }

  // AWAITING_TUNNEL -> CHUG -> ball return
  void finishTurn() {
    send(events::tunnel(EventSource::SENSOR));
    send(timers.expire(timers.lastId()));
    send(events::launch(EventSource::COMMAND));
    send(events::ballReturn(EventSource::SENSOR));
  }

  AppConfig cfg;
  CalibrationStore store;
  SimulatedBackend board;
  RecordingHardware hw;
  ManualTimers timers;
  std::unique_ptr<ActuatorController> actuators;
  std::unique_ptr<GameController> game;
};

TEST_F(GameControllerTest, StartsWaiting) {
  EXPECT_EQ(GameState::WAITING_START, state());
  EXPECT_FALSE(game->session().has_active);
  EXPECT_EQ(GameState::WAITING_START, game->snapshot().state);
}

TEST_F(GameControllerTest, OnlyStartLeavesWaitingStart) {
  send(events::targetHit(EventSource::SENSOR, 3));
  send(events::targetConfirm(EventSource::SENSOR, 1));
  send(events::tunnel(EventSource::SENSOR));
  send(events::launch(EventSource::COMMAND));
  send(events::ballReturn(EventSource::SENSOR));
  send(events::nextTurn(EventSource::COMMAND));
  send(events::reset(EventSource::COMMAND));
  EXPECT_EQ(GameState::WAITING_START, state());

  send(events::start(EventSource::COMMAND));
  EXPECT_EQ(GameState::PLAYER_TURN, state());
  EXPECT_TRUE(game->session().has_active);
}

TEST_F(GameControllerTest, StartAssignsOrderAndRestoresTargets) {
  send(events::start(EventSource::COMMAND));

  EXPECT_EQ(kOrder, team(Team::RED).assigned());
  EXPECT_EQ(kOrder, team(Team::GREEN).assigned());
  EXPECT_EQ(0u, game->session().turn);
  EXPECT_TRUE(hw.called("restore_targets Red 0"));
  EXPECT_TRUE(hw.called("restore_targets Green 0"));
  EXPECT_TRUE(hw.called(std::string("set_theme_lighting ") + teamName(active())));
  EXPECT_TRUE(hw.called(std::string("set_target_led 3 ") + colorName(teamColor(active()))));
}

TEST_F(GameControllerTest, ShuffledOrdersArePermutations) {
  cfg.game.fixed_order.clear();
  send(events::start(EventSource::COMMAND));

  for (int i = 0; i < TEAM_COUNT; i++) {
    std::vector<uint8_t> sorted = game->session().teams[i].assigned();
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ((std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 7}), sorted);
  }
}

TEST_F(GameControllerTest, FixedOrderPlayedThroughWins) {
  send(events::start(EventSource::COMMAND));
  const Team winner = active();
  const Team loser = otherTeam(winner);

  int tunnel_waits = 0;
  for (size_t i = 0; i < kOrder.size(); i++) {
    // The other team misses so the winner is up again
    if (active() != winner) {
      send(events::ballReturn(EventSource::SENSOR));
    }
    ASSERT_EQ(winner, active());
    ASSERT_EQ(kOrder[i], team(winner).requiredTarget());

    hitRequired();
    ASSERT_EQ(GameState::AWAITING_TUNNEL, state());
    tunnel_waits++;

    finishTurn();
    EXPECT_TRUE(team(winner).isCompleted(kOrder[i]));
  }

  EXPECT_EQ(7, tunnel_waits);
  EXPECT_EQ(GameState::GAME_OVER, state());
  EXPECT_EQ(winner == Team::RED ? Outcome::RED_WINS : Outcome::GREEN_WINS,
            game->session().outcome);
  EXPECT_TRUE(team(winner).finished());
  EXPECT_EQ(0u, team(loser).hits());

  EXPECT_TRUE(hw.called("drop_gate"));
  EXPECT_TRUE(hw.called("raise_pong_platform"));
  EXPECT_TRUE(hw.called("play_sound victory"));
  EXPECT_TRUE(hw.called("blow_fan " + std::to_string(WIN_FAN_MS)));
}

TEST_F(GameControllerTest, OutOfOrderHitIsNeutral) {
  send(events::start(EventSource::COMMAND));
  hw.clear();

  send(events::targetHit(EventSource::SENSOR, 5));
  EXPECT_EQ(GameState::PLAYER_TURN, state());
  EXPECT_EQ(0, game->session().pending_target);
  EXPECT_TRUE(hw.called("play_sound neutral"));
  EXPECT_FALSE(hw.called("hit_target 5"));
  EXPECT_EQ(3, team(active()).requiredTarget());
}

TEST_F(GameControllerTest, UnknownTargetIgnored) {
  send(events::start(EventSource::COMMAND));
  hw.clear();

  send(events::targetHit(EventSource::SENSOR, 0));
  send(events::targetHit(EventSource::SENSOR, 8));
  send(events::targetHit(EventSource::SENSOR, -3));
  EXPECT_EQ(GameState::PLAYER_TURN, state());
  EXPECT_TRUE(hw.calls().empty());
}

TEST_F(GameControllerTest, CorrectHitGoesToTunnel) {
  send(events::start(EventSource::COMMAND));
  send(events::targetHit(EventSource::SENSOR, 3));

  EXPECT_EQ(GameState::AWAITING_TUNNEL, state());
  EXPECT_EQ(3, game->session().pending_target);
  EXPECT_TRUE(hw.called("hit_target 3"));
  // Not scored until the ball comes back from the chug
  EXPECT_FALSE(team(active()).isCompleted(3));
}

TEST_F(GameControllerTest, TwoStageTargetNeedsConfirm) {
  send(events::start(EventSource::COMMAND));
  const Team t = active();
  hitRequired();   // 3
  finishTurn();
  send(events::ballReturn(EventSource::SENSOR));   // other team misses
  ASSERT_EQ(t, active());
  ASSERT_EQ(1, team(t).requiredTarget());

  send(events::targetHit(EventSource::SENSOR, 1));
  EXPECT_EQ(GameState::PLAYER_TURN, state());
  EXPECT_EQ(TargetStage::TRIGGERED, game->session().stage);
  EXPECT_TRUE(hw.called("play_sound reveal"));
  EXPECT_FALSE(hw.called("hit_target 1"));

  ServoActuator::State reveal;
  ASSERT_TRUE(actuators->state(SERVO_REVEAL, reveal));
  EXPECT_FLOAT_EQ(REVEAL_OPEN_DEG, reveal.target_deg);

  // A second press does not count twice
  send(events::targetHit(EventSource::SENSOR, 1));
  EXPECT_EQ(GameState::PLAYER_TURN, state());

  send(events::targetConfirm(EventSource::SENSOR, 1));
  EXPECT_EQ(GameState::AWAITING_TUNNEL, state());
  EXPECT_EQ(1, game->session().pending_target);
  EXPECT_TRUE(hw.called("hit_target 1"));
}

TEST_F(GameControllerTest, ConfirmWithoutTriggerIgnored) {
  send(events::start(EventSource::COMMAND));
  send(events::targetConfirm(EventSource::SENSOR, 1));
  EXPECT_EQ(GameState::PLAYER_TURN, state());
  EXPECT_EQ(TargetStage::ARMED, game->session().stage);
}

TEST_F(GameControllerTest, UnconfirmedFirstStageDoesNotAdvance) {
  cfg.game.fixed_order = {1, 2, 3, 4, 5, 6, 7};
  send(events::start(EventSource::COMMAND));
  const Team t = active();

  send(events::targetHit(EventSource::SENSOR, 1));
  send(events::ballReturn(EventSource::SENSOR));   // missed
  EXPECT_EQ(otherTeam(t), active());
  EXPECT_EQ(1, team(t).requiredTarget());
  EXPECT_EQ(TargetStage::ARMED, game->session().stage);
}

TEST_F(GameControllerTest, TunnelStartsCountdown) {
  send(events::start(EventSource::COMMAND));
  send(events::targetHit(EventSource::SENSOR, 3));
  send(events::tunnel(EventSource::SENSOR));

  EXPECT_EQ(GameState::AWAITING_LAUNCH, state());
  EXPECT_TRUE(hw.called("activate_tunnel 1"));
  EXPECT_EQ(LAUNCH_COUNTDOWN_MS, timers.last_delay_ms);
  EXPECT_EQ(1u, game->session().timers.size());
  EXPECT_FALSE(game->session().launch_ready);

  send(timers.expire(timers.lastId()));
  EXPECT_TRUE(game->session().launch_ready);
  EXPECT_TRUE(hw.called("play_sound ready_to_launch"));
  EXPECT_TRUE(game->session().timers.empty());
}

TEST_F(GameControllerTest, TunnelOutsideAwaitingTunnelIgnored) {
  send(events::start(EventSource::COMMAND));
  send(events::tunnel(EventSource::SENSOR));
  EXPECT_EQ(GameState::PLAYER_TURN, state());
  EXPECT_EQ(0u, timers.pending());
}

TEST_F(GameControllerTest, LaunchStartsChug) {
  send(events::start(EventSource::COMMAND));
  const Team t = active();
  send(events::targetHit(EventSource::SENSOR, 3));
  send(events::launch(EventSource::COMMAND));   // too early
  EXPECT_EQ(GameState::AWAITING_TUNNEL, state());
  EXPECT_FALSE(hw.called("launch_plunger"));

  send(events::tunnel(EventSource::SENSOR));
  const uint32_t countdown = timers.lastId();
  hw.clear();
  send(events::launch(EventSource::COMMAND));

  EXPECT_EQ(GameState::CHUG, state());
  ASSERT_EQ(2u, hw.calls().size());
  EXPECT_EQ("launch_plunger", hw.calls()[0]);
  EXPECT_EQ(std::string("start_chug ") + teamName(t), hw.calls()[1]);
  EXPECT_FALSE(timers.isPending(countdown));
}

TEST_F(GameControllerTest, ReturnAfterChugScoresAndSwitches) {
  send(events::start(EventSource::COMMAND));
  const Team t = active();
  send(events::targetHit(EventSource::SENSOR, 3));
  finishTurn();

  EXPECT_EQ(GameState::PLAYER_TURN, state());
  EXPECT_TRUE(hw.called(std::string("stop_chug ") + teamName(t)));
  EXPECT_TRUE(team(t).isCompleted(3));
  EXPECT_EQ(1, team(t).hits());
  EXPECT_EQ(otherTeam(t), active());
  EXPECT_EQ(1u, game->session().turn);
  EXPECT_TRUE(hw.called(std::string("restore_targets ") + teamName(otherTeam(t)) + " 0"));
}

TEST_F(GameControllerTest, MissedShotFromAwaitingTunnelMarksNothing) {
  send(events::start(EventSource::COMMAND));
  const Team t = active();
  send(events::targetHit(EventSource::SENSOR, 3));
  ASSERT_EQ(GameState::AWAITING_TUNNEL, state());

  send(events::ballReturn(EventSource::SENSOR));
  EXPECT_EQ(GameState::PLAYER_TURN, state());
  EXPECT_EQ(otherTeam(t), active());
  EXPECT_EQ(0, team(t).hits());
  EXPECT_FALSE(team(t).isCompleted(3));
  EXPECT_EQ(0, game->session().pending_target);
  EXPECT_FALSE(hw.called(std::string("stop_chug ") + teamName(t)));
}

TEST_F(GameControllerTest, StaleTimerAfterResetIgnored) {
  send(events::start(EventSource::COMMAND));
  send(events::targetHit(EventSource::SENSOR, 3));
  send(events::tunnel(EventSource::SENSOR));
  const uint32_t countdown = timers.lastId();

  send(events::reset(EventSource::COMMAND));
  EXPECT_EQ(GameState::WAITING_START, state());
  EXPECT_FALSE(timers.isPending(countdown));

  hw.clear();
  // Already in flight on the bus when the reset happened
  send(events::timerExpired(countdown, TimerKind::LAUNCH_COUNTDOWN));
  EXPECT_EQ(GameState::WAITING_START, state());
  EXPECT_TRUE(hw.calls().empty());
}

TEST_F(GameControllerTest, StaleTimerAfterRestartIgnored) {
  send(events::start(EventSource::COMMAND));
  send(events::targetHit(EventSource::SENSOR, 3));
  send(events::tunnel(EventSource::SENSOR));
  const uint32_t old_countdown = timers.lastId();

  send(events::start(EventSource::COMMAND));
  send(events::targetHit(EventSource::SENSOR, 3));
  send(events::tunnel(EventSource::SENSOR));

  send(events::timerExpired(old_countdown, TimerKind::LAUNCH_COUNTDOWN));
  EXPECT_FALSE(game->session().launch_ready);

  send(timers.expire(timers.lastId()));
  EXPECT_TRUE(game->session().launch_ready);
}

TEST_F(GameControllerTest, ForceNextStopsChug) {
  send(events::start(EventSource::COMMAND));
  const Team t = active();
  send(events::targetHit(EventSource::SENSOR, 3));
  send(events::tunnel(EventSource::SENSOR));
  send(events::launch(EventSource::COMMAND));
  ASSERT_EQ(GameState::CHUG, state());

  send(events::nextTurn(EventSource::COMMAND));
  EXPECT_EQ(GameState::PLAYER_TURN, state());
  EXPECT_EQ(otherTeam(t), active());
  EXPECT_TRUE(hw.called(std::string("stop_chug ") + teamName(t)));
  EXPECT_FALSE(team(t).isCompleted(3));
}

TEST_F(GameControllerTest, ForceNextCancelsCountdown) {
  send(events::start(EventSource::COMMAND));
  send(events::targetHit(EventSource::SENSOR, 3));
  send(events::tunnel(EventSource::SENSOR));
  const uint32_t countdown = timers.lastId();

  send(events::nextTurn(EventSource::COMMAND));
  EXPECT_FALSE(timers.isPending(countdown));
  EXPECT_TRUE(game->session().timers.empty());
}

TEST_F(GameControllerTest, GameOverOnlyLeftByStartOrReset) {
  cfg.game.fixed_order = {2, 3, 4, 5, 6, 7, 1};
  send(events::start(EventSource::COMMAND));
  const Team winner = active();
  for (size_t i = 0; i < 7; i++) {
    if (active() != winner) send(events::ballReturn(EventSource::SENSOR));
    hitRequired();
    finishTurn();
  }
  ASSERT_EQ(GameState::GAME_OVER, state());

  send(events::targetHit(EventSource::SENSOR, 2));
  send(events::tunnel(EventSource::SENSOR));
  send(events::launch(EventSource::COMMAND));
  send(events::ballReturn(EventSource::SENSOR));
  send(events::nextTurn(EventSource::COMMAND));
  EXPECT_EQ(GameState::GAME_OVER, state());

  send(events::reset(EventSource::COMMAND));
  EXPECT_EQ(GameState::WAITING_START, state());
  EXPECT_EQ(Outcome::NONE, game->session().outcome);
}

TEST_F(GameControllerTest, DispenseInAnyState) {
  send(events::dispense(EventSource::COMMAND, Team::GREEN));
  EXPECT_TRUE(hw.called("dispense Green"));
  EXPECT_EQ(GameState::WAITING_START, state());

  send(events::start(EventSource::COMMAND));
  send(events::dispense(EventSource::SENSOR, Team::RED));
  EXPECT_TRUE(hw.called("dispense Red"));
  EXPECT_EQ(GameState::PLAYER_TURN, state());
}

TEST_F(GameControllerTest, CompletedSetsOnlyGrow) {
  send(events::start(EventSource::COMMAND));

  uint8_t last_hits[TEAM_COUNT] = {0, 0};
  const int script[] = {3, 9, 5, 3, 1, 1, 7, 2, 0, 6, 4, 5};
  for (int n : script) {
    send(events::targetHit(EventSource::SENSOR, n));
    send(events::targetConfirm(EventSource::SENSOR, n));
    send(events::tunnel(EventSource::SENSOR));
    send(events::launch(EventSource::COMMAND));
    send(events::ballReturn(EventSource::SENSOR));

    for (int i = 0; i < TEAM_COUNT; i++) {
      const TeamProgress& p = game->session().teams[i];
      EXPECT_GE(p.hits(), last_hits[i]);
      last_hits[i] = p.hits();
      for (uint8_t id = 1; id <= NUM_TARGETS; id++) {
        if (p.isCompleted(id)) {
          EXPECT_TRUE(p.isAssigned(id));
        }
      }
    }
  }
}

TEST_F(GameControllerTest, SnapshotTracksSession) {
  send(events::start(EventSource::COMMAND));
  send(events::targetHit(EventSource::SENSOR, 3));

  const GameController::Snapshot s = game->snapshot();
  EXPECT_EQ(GameState::AWAITING_TUNNEL, s.state);
  EXPECT_TRUE(s.has_active);
  EXPECT_EQ(active(), s.active);
  EXPECT_EQ(3, s.pending_target);
  EXPECT_EQ(3, s.required[teamIndex(active())]);
}

TEST_F(GameControllerTest, ProcessNextDrainsBus) {
  EventBus bus(16);
  bus.publish(events::start(EventSource::COMMAND));
  bus.publish(events::targetHit(EventSource::SENSOR, 3));

  EXPECT_TRUE(game->processNext(bus, 0));
  EXPECT_TRUE(game->processNext(bus, 0));
  EXPECT_FALSE(game->processNext(bus, 0));
  EXPECT_EQ(GameState::AWAITING_TUNNEL, state());
}

TEST_F(GameControllerTest, BouncedBallReturnCountsOnce) {
  EventBus bus(64);
  SensorMonitor monitor(board, store, bus, cfg.sensors);
  monitor.begin();
  monitor.pollOnce(0);

  send(events::start(EventSource::COMMAND));
  const Team t = active();
  send(events::targetHit(EventSource::SENSOR, 3));
  send(events::tunnel(EventSource::SENSOR));
  send(timers.expire(timers.lastId()));
  send(events::launch(EventSource::COMMAND));
  ASSERT_EQ(GameState::CHUG, state());

  board.setDigital(LINE_BALL_RETURN_IR, true);
  monitor.pollOnce(1000);
  board.setDigital(LINE_BALL_RETURN_IR, false);
  monitor.pollOnce(1020);
  board.setDigital(LINE_BALL_RETURN_IR, true);
  monitor.pollOnce(1040);
  monitor.pollOnce(1060);
  monitor.pollOnce(1080);

  int consumed = 0;
  while (game->processNext(bus, 0)) consumed++;

  EXPECT_EQ(1, consumed);
  EXPECT_EQ(GameState::PLAYER_TURN, state());
  EXPECT_EQ(otherTeam(t), active());
  EXPECT_EQ(1u, game->session().turn);
  EXPECT_TRUE(team(t).isCompleted(3));
}

TEST_F(GameControllerTest, InterleavedProducersConsumedOnce) {
  constexpr int kPerSource = 500;
  EventBus bus(2 * kPerSource);

  std::thread sensors([&bus]() {
    for (int i = 0; i < kPerSource; i++) {
      bus.publish(events::dispense(EventSource::SENSOR, Team::RED));
    }
  });
  std::thread console([&bus]() {
    for (int i = 0; i < kPerSource; i++) {
      bus.publish(events::dispense(EventSource::COMMAND, Team::GREEN));
    }
  });

  int consumed = 0;
  while (consumed < 2 * kPerSource && game->processNext(bus, 1000)) consumed++;
  sensors.join();
  console.join();

  EXPECT_EQ(2 * kPerSource, consumed);
  EXPECT_FALSE(game->processNext(bus, 0));
  EXPECT_EQ(0u, bus.dropped());
  EXPECT_EQ((size_t)kPerSource, hw.count("dispense Red"));
  EXPECT_EQ((size_t)kPerSource, hw.count("dispense Green"));
  EXPECT_EQ(GameState::WAITING_START, state());
}

}  // namespace
