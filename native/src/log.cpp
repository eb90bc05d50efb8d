#include "dotmask/log.h"

#include <iostream>
#include <utility>

namespace dotmask {

namespace {

void stderr_sink(LogLevel level, const std::string& message) {
  std::cerr << "dotmask: [" << LogLevelName(level) << "] " << message << "\n";
}

LogSink g_sink = stderr_sink;
LogLevel g_threshold = LogLevel::kInfo;

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "?";
}

void SetLogSink(LogSink sink) { g_sink = std::move(sink); }

void ResetLogSink() {
  g_sink = stderr_sink;
  g_threshold = LogLevel::kInfo;
}

void SetLogLevel(LogLevel threshold) { g_threshold = threshold; }

void Log(LogLevel level, const std::string& message) {
  if (static_cast<int>(level) < static_cast<int>(g_threshold)) return;
  if (g_sink) g_sink(level, message);
}

}  // namespace dotmask
