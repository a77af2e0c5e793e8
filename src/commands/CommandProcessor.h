#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "events/Event.h"

class ActuatorController;
class EventBus;
class GameController;
class SensorMonitor;

/*
===============================================================================
  CommandProcessor.h
===============================================================================

  PURPOSE
  -------
  Text console for operators and bench testing. One command per line:

    start | reset | next | tunnel | launch | return
    dispense red|green
    hit <n>            confirm <n>
    servo <id> <deg> [dps]
    calibrate <id> <deg>
    sensitivity <ch> <value>
    status | help

  Gameplay verbs only publish an event on the EventBus; the game thread
  decides what they mean. servo/calibrate/sensitivity go straight to the
  ActuatorController or SensorMonitor.

  RESPONSES
  ---------
    OK
    ERR:<code>:<message>     1 = unknown verb / bad format
                             2 = value out of range
                             3 = unknown id

  Key mode maps single keystrokes through a table onto the same verbs.
  Nothing here touches the GameSession; status reads the game snapshot.
===============================================================================
*/

class CommandProcessor {
public:
  enum ErrorCode : int {
    ERR_FORMAT = 1,
    ERR_RANGE = 2,
    ERR_UNKNOWN_ID = 3,
  };

  // game may be null (status then reports only the console side)
  CommandProcessor(EventBus& bus, ActuatorController& actuators,
                   SensorMonitor& sensors, const GameController* game);
  ~CommandProcessor();

  CommandProcessor(const CommandProcessor&) = delete;
  CommandProcessor& operator=(const CommandProcessor&) = delete;

  // Returns the response text without a trailing newline.
  // A blank line returns an empty string.
  std::string handleLine(const std::string& line);

  // Single-key input
  std::string handleKey(char key);

  // Reader thread: input from in_fd, responses to out_fd, until stop() or EOF
  void start(int in_fd, int out_fd, bool key_mode);
  void stop();
  bool isRunning() const { return _running.load(); }

  // Blocking version of the reader thread body
  void run(int in_fd, int out_fd, bool key_mode);

  static std::string help();

private:
  std::string publish_(const Event& ev);
  std::string status_() const;

  void loop_(int in_fd, int out_fd, bool key_mode);
  void respond_(int out_fd, const std::string& text);

  EventBus& _bus;
  ActuatorController& _actuators;
  SensorMonitor& _sensors;
  const GameController* _game;

  std::atomic<bool> _running;
  std::thread _thread;
};
