#pragma once

#include <cstdint>
#include <mutex>

#include "Params.h"
#include "Pins.h"
#include "hardware/HardwareInterface.h"

/*
  SimulatedBackend

  Purpose:
  - Stand-in for the table when no I/O board is connected
  - Every action becomes a "[HW] ..." log line
  - Sensor channels are plain values that tests (or a bench harness) set
    with setAnalog()/setDigital(); setReadFault() makes a channel fail
  - Servo writes are remembered so callers can check the last position
*/

class SimulatedBackend : public HardwareBackend {
public:
  SimulatedBackend();

  const char* name() const override { return "simulated"; }

  // HardwareInterface
  void blowFan(uint32_t duration_ms) override;
  void startChug(Team team) override;
  void stopChug(Team team) override;
  void hitTarget(uint8_t target) override;
  void dropGate() override;
  void dispense(Team team) override;
  void activateTunnel(uint8_t tunnel) override;
  void launchPlunger() override;
  void restoreTargets(Team team, uint8_t hits) override;
  void playSound(SoundEffect effect) override;
  void setTargetLed(uint8_t target, LedColor color) override;
  void setThemeLighting(Team team) override;
  void raisePongPlatform() override;

  // IoBoard
  bool readAnalog(uint8_t channel, int& out) override;
  bool readDigital(uint8_t line, bool& out) override;
  bool writeServo(uint8_t id, float deg) override;

  // Simulation controls
  void setAnalog(uint8_t channel, int value);
  void setDigital(uint8_t line, bool level);
  void setAnalogFault(uint8_t channel, bool failing);
  void setDigitalFault(uint8_t line, bool failing);

  float servoDeg(uint8_t id) const;
  uint32_t servoWrites(uint8_t id) const;

private:
  static constexpr uint8_t MAX_ANALOG = TELEMETRY_MAX_ANALOG;
  static constexpr uint8_t MAX_DIGITAL = TELEMETRY_MAX_DIGITAL;
  static constexpr uint8_t MAX_SERVOS = 16;

  mutable std::mutex _mutex;

  int _analog[MAX_ANALOG];
  bool _analog_fault[MAX_ANALOG];
  bool _digital[MAX_DIGITAL];
  bool _digital_fault[MAX_DIGITAL];

  float _servo_deg[MAX_SERVOS];
  uint32_t _servo_writes[MAX_SERVOS];
};
