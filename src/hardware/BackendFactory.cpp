#include "hardware/BackendFactory.h"

#include <utility>

#include "hardware/SerialBackend.h"
#include "hardware/SimulatedBackend.h"
#include "utils/Log.h"

std::unique_ptr<HardwareBackend> makeBackend(const std::string& device, uint32_t baud) {
  if (device.empty()) {
    LOG_INFO("HW", "no I/O board configured, using simulated hardware");
    return std::unique_ptr<HardwareBackend>(new SimulatedBackend());
  }

  std::unique_ptr<SerialBackend> serial(new SerialBackend(device, baud));
  if (serial->begin()) {
    return std::move(serial);
  }

  LOG_WARN("HW", "I/O board on %s unavailable, falling back to simulated hardware",
           device.c_str());
  return std::unique_ptr<HardwareBackend>(new SimulatedBackend());
}
