#pragma once

#include <cstdint>

/*
===============================================================================
  Log.h
===============================================================================

  PURPOSE
  -------
  Tagged, printf-style logging shared by every thread.

  Output format (one line per call, stderr):
    <ms> <LEVEL> [<Tag>] <message>

  Notes:
  - Messages are formatted into a fixed buffer; long lines are truncated.
  - Lines from concurrent threads never interleave.
  - Calls below the global minimum level cost one comparison.
===============================================================================
*/

enum class LogLevel : uint8_t {
  DEBUG = 0,
  INFO,
  WARN,
  ERROR,
  OFF,
};

namespace logging {

void setLevel(LogLevel level);
LogLevel level();

// Accepts "debug", "info", "warn", "error", "off".
bool parseLevel(const char* text, LogLevel& out);

void write(LogLevel level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

}  // namespace logging

#define LOG_DEBUG(tag, ...) ::logging::write(LogLevel::DEBUG, tag, __VA_ARGS__)
#define LOG_INFO(tag, ...)  ::logging::write(LogLevel::INFO, tag, __VA_ARGS__)
#define LOG_WARN(tag, ...)  ::logging::write(LogLevel::WARN, tag, __VA_ARGS__)
#define LOG_ERROR(tag, ...) ::logging::write(LogLevel::ERROR, tag, __VA_ARGS__)
