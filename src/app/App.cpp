#include "app/App.h"

#include <unistd.h>

#include "actuators/ActuatorController.h"
#include "commands/CommandProcessor.h"
#include "game/GameController.h"
#include "hardware/BackendFactory.h"
#include "sensors/SensorMonitor.h"
#include "utils/Clock.h"
#include "utils/Log.h"

namespace {
const char* kTag = "App";
}

App::App(const AppConfig& cfg)
: _cfg(cfg),
  _store(cfg.data_dir),
  _bus(EVENT_QUEUE_CAPACITY),
  _timers(_bus)
{
}

App::~App() {
  shutdown();
}

/*=============================================================================
  SETUP
=============================================================================*/

void App::begin() {
  if (_store.begin(_cfg.servoDefaults(), _cfg.thresholdDefaults())) {
    LOG_INFO(kTag, "calibration in %s", _cfg.data_dir.c_str());
  } else {
    LOG_INFO(kTag, "calibration kept in memory only");
  }

  _backend = makeBackend(_cfg.serial_device, _cfg.baud);
  LOG_INFO(kTag, "hardware backend: %s", _backend->name());

  // Servos first so doors are back at their start angles before play
  _actuators.reset(new ActuatorController(*_backend, _store, _cfg.servos));
  _actuators->begin(clock_ms::now());
  _actuators->start();

  _timers.start();

  _sensors.reset(new SensorMonitor(*_backend, _store, _bus, _cfg.sensors));
  _sensors->begin();
  _sensors->start();

  _game.reset(new GameController(_cfg.game, *_backend, *_actuators, _timers));

  _console.reset(new CommandProcessor(_bus, *_actuators, *_sensors, _game.get()));
  _console->start(STDIN_FILENO, STDOUT_FILENO, _cfg.key_mode);

  _started = true;
  LOG_INFO(kTag, "ready, press start");
}

/*=============================================================================
  LOOP
=============================================================================*/

void App::loop(const std::atomic<bool>& stop_requested) {
  if (!_started) return;

  while (!stop_requested.load()) {
    // Returns false on timeout; the stop flag is checked every EVENT_WAIT_MS
    if (!_game->processNext(_bus, EVENT_WAIT_MS) && _bus.isClosed()) break;
  }
}

/*=============================================================================
  SHUTDOWN
=============================================================================*/

void App::shutdown() {
  if (!_started) return;
  _started = false;

  LOG_INFO(kTag, "shutting down");

  if (_console) _console->stop();
  if (_sensors) _sensors->stop();
  _timers.stop();

  // Anything already queued is still applied so the table ends consistent
  _bus.close();
  while (_game->processNext(_bus, 0)) {
  }

  if (_actuators) _actuators->stop();

  LOG_INFO(kTag, "%llu events, %lu dropped",
           (unsigned long long)_bus.published(), (unsigned long)_bus.dropped());
}
