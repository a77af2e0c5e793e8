/*
  Castles & Cans table coordinator

  Purpose:
  Runs one game table: polls the pads and IR beams, moves the servos,
  drives the I/O board (or the simulated one) and referees the game.

  Threads:
  - main      : game loop (the only thread that touches the game state)
  - sensors   : SensorMonitor at SENSOR_POLL_HZ
  - servos    : ActuatorController at SERVO_UPDATE_HZ
  - timers    : TimerService
  - console   : CommandProcessor on stdin/stdout

  Ctrl-C (SIGINT) or SIGTERM stops everything in order.
*/

#include <signal.h>
#include <stdio.h>
#include <string.h>

#include <atomic>
#include <string>

#include "app/App.h"
#include "app/AppConfig.h"
#include "utils/Log.h"


/*=============================================================================
  GLOBALS
=============================================================================*/

static std::atomic<bool> g_stop(false);

static void onSignal(int) {
  g_stop.store(true);
}

static void installSignalHandlers() {
  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = onSignal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}


/*=============================================================================
  MAIN
=============================================================================*/

int main(int argc, char** argv) {
  AppConfig cfg = AppConfig::defaults();

  std::string error;
  switch (parseArgs(argc, argv, cfg, error)) {
    case ParseResult::HELP:
      fputs(usage(argv[0]).c_str(), stdout);
      return 0;
    case ParseResult::ERROR:
      fprintf(stderr, "%s\n%s", error.c_str(), usage(argv[0]).c_str());
      return 2;
    case ParseResult::OK:
      break;
  }

  logging::setLevel(cfg.log_level);
  installSignalHandlers();

  App app(cfg);
  app.begin();
  app.loop(g_stop);
  app.shutdown();
  return 0;
}
