#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "comms/Messages.h"
#include "comms/SerialLink.h"
#include "hardware/HardwareInterface.h"

/*
  SerialBackend

  Purpose:
  - Drive the real table through the I/O board on a serial port
  - Every action and servo write becomes one "cmd" line (see Protocol.h)
  - Channel reads are answered from the newest telemetry frame; a stale or
    missing frame, or a channel the frame does not carry, is a failed read

  All calls share one mutex, so the serial line only ever carries whole
  frames in the order they were issued.
*/

class SerialBackend : public HardwareBackend {
public:
  SerialBackend(const std::string& device, uint32_t baud);

  // Open the port. False if the board is not reachable.
  bool begin();

  const char* name() const override { return "serial"; }

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

private:
  // Stamps seq, encodes and writes; failures are logged, never thrown
  bool send_(ActionFrame frame);

  // Caller holds _mutex
  bool freshTelemetry_(uint32_t now_ms);

  std::mutex _mutex;
  SerialLink _link;
  uint32_t _seq = 0;
  uint32_t _send_failures = 0;
  bool _was_stale = true;
};
