#pragma once

#include <atomic>
#include <memory>

#include "app/AppConfig.h"
#include "events/EventBus.h"
#include "events/TimerService.h"
#include "storage/CalibrationStore.h"

class ActuatorController;
class CommandProcessor;
class GameController;
class HardwareBackend;
class SensorMonitor;

/*
===============================================================================
  App.h
===============================================================================

  PURPOSE
  -------
  Owns every component and the threads they run on.

    begin()    : calibration -> hardware -> servos -> timers -> sensors
                 -> game -> console
    loop()     : the game thread; pops events until the stop flag is set
    shutdown() : stops producers first, closes the bus, drains, then servos

  Producers:  SensorMonitor, CommandProcessor, TimerService
  Consumer:   GameController (this thread)
===============================================================================
*/

class App {
public:
  explicit App(const AppConfig& cfg);
  ~App();

  App(const App&) = delete;
  App& operator=(const App&) = delete;

  void begin();
  void loop(const std::atomic<bool>& stop_requested);
  void shutdown();

private:
  const AppConfig& _cfg;

  CalibrationStore _store;
  std::unique_ptr<HardwareBackend> _backend;
  EventBus _bus;
  TimerService _timers;

  std::unique_ptr<ActuatorController> _actuators;
  std::unique_ptr<SensorMonitor> _sensors;
  std::unique_ptr<GameController> _game;
  std::unique_ptr<CommandProcessor> _console;

  bool _started = false;
};
