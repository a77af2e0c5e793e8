#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "Params.h"

/*
===============================================================================
  CalibrationStore.h
===============================================================================

  PURPOSE
  -------
  Durable calibration shared by ActuatorController and SensorMonitor:

    servo_calibration.json   {"<servo id>": {"angle": A, "start": S}, ...}
    sensor_sensitivity.json  {"<channel>": {"threshold": T, "debounce_ms": D}, ...}

  Both documents are read once in begin(), laid over the built-in defaults
  (missing keys keep their default), and rewritten whole on every change.

  IMPORTANT
  ---------
  - Writes go to "<file>.tmp", are fsync'd, then renamed over the real file,
    so a power cut leaves either the old or the new document, never half.
  - One mutex (the persistence lock) covers the in-memory maps and the
    file writes: a reader never sees a value that is only partly saved.
  - If the data directory cannot be locked at startup the store logs one
    error and keeps working from memory only.
===============================================================================
*/

struct ServoCalibration {
  float angle = 90.0f;   // last resting angle
  float start = 90.0f;   // calibrated start/neutral angle
};

struct SensorThreshold {
  uint8_t channel = 0;
  int value = PRESSURE_DEFAULT_THRESHOLD;
  uint32_t debounce_ms = PRESSURE_DEBOUNCE_MS;
};

typedef std::map<uint8_t, ServoCalibration> ServoCalibrationMap;
typedef std::map<uint8_t, SensorThreshold> SensorThresholdMap;

class CalibrationStore {
public:
  // Empty data_dir keeps everything in memory (used by tests and --no-persist)
  explicit CalibrationStore(const std::string& data_dir);
  ~CalibrationStore();

  CalibrationStore(const CalibrationStore&) = delete;
  CalibrationStore& operator=(const CalibrationStore&) = delete;

  // Lock the data directory, load both documents over the defaults.
  // Returns true when the store is backed by disk.
  bool begin(const ServoCalibrationMap& servo_defaults,
             const SensorThresholdMap& threshold_defaults);

  bool isPersistent() const;

  bool servo(uint8_t id, ServoCalibration& out) const;
  bool threshold(uint8_t channel, SensorThreshold& out) const;

  ServoCalibrationMap servos() const;
  SensorThresholdMap thresholds() const;

  // Update memory and rewrite the document. False only if a disk write failed.
  bool saveServo(uint8_t id, const ServoCalibration& cal);
  bool saveThreshold(const SensorThreshold& threshold);

  // Number of documents successfully written since begin()
  uint32_t writeCount() const;

  const std::string& servoPath() const { return _servo_path; }
  const std::string& sensorPath() const { return _sensor_path; }

private:
  bool acquireLock_();
  void releaseLock_();

  bool writeServos_();
  bool writeThresholds_();

  std::string _data_dir;
  std::string _servo_path;
  std::string _sensor_path;
  std::string _lock_path;

  int _lock_fd = -1;
  bool _persistent = false;

  mutable std::mutex _mutex;
  ServoCalibrationMap _servos;
  SensorThresholdMap _thresholds;
  uint32_t _writes = 0;
};

/*=============================================================================
  DOCUMENT CODEC
  Exposed for tests; CalibrationStore is the only production caller.
=============================================================================*/

namespace calibration_doc {

std::string encodeServos(const ServoCalibrationMap& servos);
std::string encodeThresholds(const SensorThresholdMap& thresholds);

// Overlays what the document contains onto `inout`. Returns false (and leaves
// `inout` untouched) if the text is not a valid document.
bool decodeServos(const std::string& text, ServoCalibrationMap& inout);
bool decodeThresholds(const std::string& text, SensorThresholdMap& inout);

bool readFile(const std::string& path, std::string& out);
bool writeFileAtomic(const std::string& path, const std::string& text);

}  // namespace calibration_doc
