#pragma once

#include <cstdint>

#include "game/GameTypes.h"

/*
===============================================================================
  HardwareInterface.h
===============================================================================

  PURPOSE
  -------
  The contract between the game and the physical table.

  HardwareInterface : fire-and-forget actions issued by GameController
                      (relays, lights, sounds, plunger, gate, platform)
  IoBoard           : raw channel access used by SensorMonitor (reads) and
                      ActuatorController (servo writes)
  HardwareBackend   : one object that provides both; makeBackend() picks the
                      serial or simulated implementation at startup

  RULES
  -----
  - Actions return nothing. A backend logs and swallows its own failures;
    nothing here may throw into the game thread.
  - A backend serializes its calls internally so two threads never
    interleave on one physical line.
  - IoBoard calls return false on a transient failure; callers retry on
    their next cycle.
===============================================================================
*/

class HardwareInterface {
public:
  virtual ~HardwareInterface() = default;

  virtual void blowFan(uint32_t duration_ms) = 0;
  virtual void startChug(Team team) = 0;
  virtual void stopChug(Team team) = 0;
  virtual void hitTarget(uint8_t target) = 0;
  virtual void dropGate() = 0;
  virtual void dispense(Team team) = 0;
  virtual void activateTunnel(uint8_t tunnel) = 0;
  virtual void launchPlunger() = 0;
  virtual void restoreTargets(Team team, uint8_t hits) = 0;
  virtual void playSound(SoundEffect effect) = 0;
  virtual void setTargetLed(uint8_t target, LedColor color) = 0;
  virtual void setThemeLighting(Team team) = 0;
  virtual void raisePongPlatform() = 0;
};

class IoBoard {
public:
  virtual ~IoBoard() = default;

  virtual bool readAnalog(uint8_t channel, int& out) = 0;
  virtual bool readDigital(uint8_t line, bool& out) = 0;
  virtual bool writeServo(uint8_t id, float deg) = 0;
};

class HardwareBackend : public HardwareInterface, public IoBoard {
public:
  // Short name for logs ("simulated", "serial")
  virtual const char* name() const = 0;
};
