#include "storage/CalibrationStore.h"

#include <ArduinoJson.h>

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include "utils/Log.h"

/*
  CalibrationStore.cpp

  Document layout and atomic write rules are described in the header.
  Values read from disk are clamped to their legal range before use, so a
  hand-edited file can never push a servo past its end stops.
*/

namespace {

const char* kTag = "Calib";

float clampAngle(float deg) {
  if (!(deg >= SERVO_MIN_DEG)) return SERVO_MIN_DEG;   // also catches NaN
  if (deg > SERVO_MAX_DEG) return SERVO_MAX_DEG;
  return deg;
}

int clampThreshold(int value) {
  if (value < PRESSURE_MIN_THRESHOLD) return PRESSURE_MIN_THRESHOLD;
  if (value > PRESSURE_MAX_THRESHOLD) return PRESSURE_MAX_THRESHOLD;
  return value;
}

// Document keys are decimal ids "0".."255"
bool parseId(const char* key, uint8_t& out) {
  if (!key || key[0] == '\0') return false;
  char* end = nullptr;
  errno = 0;
  const long v = strtol(key, &end, 10);
  if (errno != 0 || *end != '\0' || v < 0 || v > 255) return false;
  out = (uint8_t)v;
  return true;
}

std::string joinPath(const std::string& dir, const char* file) {
  if (dir.empty()) return std::string();
  if (dir[dir.size() - 1] == '/') return dir + file;
  return dir + "/" + file;
}

// Drops the temp file while keeping the errno of the step that failed
bool discardTemp(const std::string& tmp, int fd) {
  const int saved = errno;
  if (fd >= 0) close(fd);
  unlink(tmp.c_str());
  errno = saved;
  return false;
}

// Makes a completed rename durable
bool syncParentDir(const std::string& path) {
  const size_t slash = path.rfind('/');
  const std::string dir = (slash == std::string::npos) ? std::string(".")
                        : (slash == 0) ? std::string("/")
                        : path.substr(0, slash);

  const int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) return false;
  if (fsync(fd) != 0) {
    const int saved = errno;
    close(fd);
    errno = saved;
    return false;
  }
  close(fd);
  return true;
}

}  // namespace


/*=============================================================================
  DOCUMENT CODEC
=============================================================================*/

namespace calibration_doc {

std::string encodeServos(const ServoCalibrationMap& servos) {
  StaticJsonDocument<CALIBRATION_JSON_DOC_BYTES> doc;
  doc.to<JsonObject>();

  for (const auto& kv : servos) {
    JsonObject entry = doc.createNestedObject(std::to_string((unsigned)kv.first));
    entry["angle"] = kv.second.angle;
    entry["start"] = kv.second.start;
  }

  std::string out;
  serializeJsonPretty(doc, out);
  out += '\n';
  return out;
}

std::string encodeThresholds(const SensorThresholdMap& thresholds) {
  StaticJsonDocument<CALIBRATION_JSON_DOC_BYTES> doc;
  doc.to<JsonObject>();

  for (const auto& kv : thresholds) {
    JsonObject entry = doc.createNestedObject(std::to_string((unsigned)kv.first));
    entry["threshold"] = kv.second.value;
    entry["debounce_ms"] = kv.second.debounce_ms;
  }

  std::string out;
  serializeJsonPretty(doc, out);
  out += '\n';
  return out;
}

bool decodeServos(const std::string& text, ServoCalibrationMap& inout) {
  StaticJsonDocument<CALIBRATION_JSON_DOC_BYTES> doc;
  if (deserializeJson(doc, text)) return false;

  JsonObject root = doc.as<JsonObject>();
  if (root.isNull()) return false;

  ServoCalibrationMap merged = inout;
  for (JsonPair kv : root) {
    uint8_t id = 0;
    if (!parseId(kv.key().c_str(), id)) {
      LOG_WARN(kTag, "ignoring servo key '%s'", kv.key().c_str());
      continue;
    }
    JsonObject entry = kv.value().as<JsonObject>();
    if (entry.isNull()) continue;

    ServoCalibration cal = merged[id];
    cal.angle = clampAngle(entry["angle"] | cal.angle);
    cal.start = clampAngle(entry["start"] | cal.start);
    merged[id] = cal;
  }

  inout.swap(merged);
  return true;
}

bool decodeThresholds(const std::string& text, SensorThresholdMap& inout) {
  StaticJsonDocument<CALIBRATION_JSON_DOC_BYTES> doc;
  if (deserializeJson(doc, text)) return false;

  JsonObject root = doc.as<JsonObject>();
  if (root.isNull()) return false;

  SensorThresholdMap merged = inout;
  for (JsonPair kv : root) {
    uint8_t ch = 0;
    if (!parseId(kv.key().c_str(), ch)) {
      LOG_WARN(kTag, "ignoring channel key '%s'", kv.key().c_str());
      continue;
    }
    JsonObject entry = kv.value().as<JsonObject>();
    if (entry.isNull()) continue;

    SensorThreshold t = merged.count(ch) ? merged[ch] : SensorThreshold();
    t.channel = ch;
    t.value = clampThreshold(entry["threshold"] | t.value);
    t.debounce_ms = entry["debounce_ms"] | t.debounce_ms;
    merged[ch] = t;
  }

  inout.swap(merged);
  return true;
}

bool readFile(const std::string& path, std::string& out) {
  out.clear();
  FILE* f = fopen(path.c_str(), "rb");
  if (!f) return false;

  char buf[512];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
    out.append(buf, n);
  }
  const bool ok = (ferror(f) == 0);
  fclose(f);
  return ok;
}

bool writeFileAtomic(const std::string& path, const std::string& text) {
  const std::string tmp = path + ".tmp";

  int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) return false;

  size_t off = 0;
  while (off < text.size()) {
    const ssize_t w = write(fd, text.data() + off, text.size() - off);
    if (w < 0) {
      if (errno == EINTR) continue;
      return discardTemp(tmp, fd);
    }
    off += (size_t)w;
  }

  if (fsync(fd) != 0) return discardTemp(tmp, fd);
  if (close(fd) != 0) return discardTemp(tmp, -1);

  if (rename(tmp.c_str(), path.c_str()) != 0) return discardTemp(tmp, -1);
  return syncParentDir(path);
}

}  // namespace calibration_doc


/*=============================================================================
  STORE
=============================================================================*/

CalibrationStore::CalibrationStore(const std::string& data_dir)
: _data_dir(data_dir),
  _servo_path(joinPath(data_dir, SERVO_CALIBRATION_FILE)),
  _sensor_path(joinPath(data_dir, SENSOR_SENSITIVITY_FILE)),
  _lock_path(joinPath(data_dir, DATA_LOCK_FILE))
{
}

CalibrationStore::~CalibrationStore() {
  releaseLock_();
}

bool CalibrationStore::begin(const ServoCalibrationMap& servo_defaults,
                             const SensorThresholdMap& threshold_defaults) {
  std::lock_guard<std::mutex> lock(_mutex);

  _servos = servo_defaults;
  _thresholds = threshold_defaults;
  _writes = 0;

  if (_data_dir.empty()) {
    LOG_INFO(kTag, "no data directory, calibration kept in memory");
    _persistent = false;
    return false;
  }

  _persistent = acquireLock_();
  if (!_persistent) {
    LOG_ERROR(kTag, "cannot lock %s, calibration will not survive restart",
              _lock_path.c_str());
  }

  std::string text;
  if (calibration_doc::readFile(_servo_path, text)) {
    if (calibration_doc::decodeServos(text, _servos)) {
      LOG_INFO(kTag, "loaded %u servo entries from %s",
               (unsigned)_servos.size(), _servo_path.c_str());
    } else {
      LOG_WARN(kTag, "%s is corrupt, using servo defaults", _servo_path.c_str());
    }
  } else {
    LOG_WARN(kTag, "%s not readable, using servo defaults", _servo_path.c_str());
  }

  if (calibration_doc::readFile(_sensor_path, text)) {
    if (calibration_doc::decodeThresholds(text, _thresholds)) {
      LOG_INFO(kTag, "loaded %u sensor thresholds from %s",
               (unsigned)_thresholds.size(), _sensor_path.c_str());
    } else {
      LOG_WARN(kTag, "%s is corrupt, using sensor defaults", _sensor_path.c_str());
    }
  } else {
    LOG_WARN(kTag, "%s not readable, using sensor defaults", _sensor_path.c_str());
  }

  return _persistent;
}

bool CalibrationStore::isPersistent() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _persistent;
}

bool CalibrationStore::servo(uint8_t id, ServoCalibration& out) const {
  std::lock_guard<std::mutex> lock(_mutex);
  auto it = _servos.find(id);
  if (it == _servos.end()) return false;
  out = it->second;
  return true;
}

bool CalibrationStore::threshold(uint8_t channel, SensorThreshold& out) const {
  std::lock_guard<std::mutex> lock(_mutex);
  auto it = _thresholds.find(channel);
  if (it == _thresholds.end()) return false;
  out = it->second;
  return true;
}

ServoCalibrationMap CalibrationStore::servos() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _servos;
}

SensorThresholdMap CalibrationStore::thresholds() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _thresholds;
}

bool CalibrationStore::saveServo(uint8_t id, const ServoCalibration& cal) {
  std::lock_guard<std::mutex> lock(_mutex);

  ServoCalibration clamped;
  clamped.angle = clampAngle(cal.angle);
  clamped.start = clampAngle(cal.start);
  _servos[id] = clamped;

  return writeServos_();
}

bool CalibrationStore::saveThreshold(const SensorThreshold& threshold) {
  std::lock_guard<std::mutex> lock(_mutex);

  SensorThreshold t = threshold;
  t.value = clampThreshold(t.value);
  _thresholds[t.channel] = t;

  return writeThresholds_();
}

uint32_t CalibrationStore::writeCount() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _writes;
}

bool CalibrationStore::acquireLock_() {
  if (mkdir(_data_dir.c_str(), 0755) != 0 && errno != EEXIST) {
    LOG_ERROR(kTag, "mkdir %s failed: %s", _data_dir.c_str(), strerror(errno));
    return false;
  }

  _lock_fd = open(_lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (_lock_fd < 0) {
    LOG_ERROR(kTag, "open %s failed: %s", _lock_path.c_str(), strerror(errno));
    return false;
  }

  if (flock(_lock_fd, LOCK_EX | LOCK_NB) != 0) {
    LOG_ERROR(kTag, "%s is held by another process", _lock_path.c_str());
    close(_lock_fd);
    _lock_fd = -1;
    return false;
  }
  return true;
}

void CalibrationStore::releaseLock_() {
  if (_lock_fd < 0) return;
  flock(_lock_fd, LOCK_UN);
  close(_lock_fd);
  _lock_fd = -1;
}

// Callers hold _mutex
bool CalibrationStore::writeServos_() {
  if (!_persistent) return true;

  if (!calibration_doc::writeFileAtomic(_servo_path, calibration_doc::encodeServos(_servos))) {
    const int err = errno;
    LOG_ERROR(kTag, "write %s failed: %s", _servo_path.c_str(), strerror(err));
    return false;
  }
  _writes++;
  return true;
}

bool CalibrationStore::writeThresholds_() {
  if (!_persistent) return true;

  if (!calibration_doc::writeFileAtomic(_sensor_path, calibration_doc::encodeThresholds(_thresholds))) {
    const int err = errno;
    LOG_ERROR(kTag, "write %s failed: %s", _sensor_path.c_str(), strerror(err));
    return false;
  }
  _writes++;
  return true;
}
