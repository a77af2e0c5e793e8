#include "utils/Log.h"

#include <atomic>
#include <mutex>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#include "Params.h"
#include "utils/Clock.h"

namespace {

std::atomic<uint8_t> g_min_level((uint8_t)LogLevel::INFO);
std::mutex g_out_mutex;

const char* levelName(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO ";
    case LogLevel::WARN:  return "WARN ";
    case LogLevel::ERROR: return "ERROR";
    default:              return "?    ";
  }
}

}  // namespace

namespace logging {

void setLevel(LogLevel level) {
  g_min_level.store((uint8_t)level);
}

LogLevel level() {
  return (LogLevel)g_min_level.load();
}

bool parseLevel(const char* text, LogLevel& out) {
  if (!text) return false;
  if (strcmp(text, "debug") == 0) { out = LogLevel::DEBUG; return true; }
  if (strcmp(text, "info") == 0)  { out = LogLevel::INFO;  return true; }
  if (strcmp(text, "warn") == 0)  { out = LogLevel::WARN;  return true; }
  if (strcmp(text, "error") == 0) { out = LogLevel::ERROR; return true; }
  if (strcmp(text, "off") == 0)   { out = LogLevel::OFF;   return true; }
  return false;
}

void write(LogLevel level, const char* tag, const char* fmt, ...) {
  if ((uint8_t)level < g_min_level.load() || level == LogLevel::OFF) return;

  char msg[LOG_LINE_BUFFER_BYTES];
  va_list args;
  va_start(args, fmt);
  vsnprintf(msg, sizeof(msg), fmt, args);
  va_end(args);

  const uint32_t now_ms = clock_ms::now();

  std::lock_guard<std::mutex> lock(g_out_mutex);
  fprintf(stderr, "%10lu %s [%s] %s\n",
          (unsigned long)now_ms, levelName(level), tag ? tag : "-", msg);
  fflush(stderr);
}

}  // namespace logging
