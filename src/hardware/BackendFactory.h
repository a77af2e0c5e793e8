#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "hardware/HardwareInterface.h"

// Serial backend on `device` when it opens, otherwise the simulated backend.
// An empty device asks for the simulated backend directly.
std::unique_ptr<HardwareBackend> makeBackend(const std::string& device, uint32_t baud);
