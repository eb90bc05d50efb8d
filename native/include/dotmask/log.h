#ifndef DOTMASK_LOG_H
#define DOTMASK_LOG_H

#include <functional>
#include <string>

namespace dotmask {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

using LogSink = std::function<void(LogLevel, const std::string&)>;

const char* LogLevelName(LogLevel level);

// Replaces the process-wide sink. An empty sink drops everything.
void SetLogSink(LogSink sink);
// Restores the stderr sink and the kInfo threshold.
void ResetLogSink();
void SetLogLevel(LogLevel threshold);

void Log(LogLevel level, const std::string& message);

inline void LogDebug(const std::string& m) { Log(LogLevel::kDebug, m); }
inline void LogInfo(const std::string& m) { Log(LogLevel::kInfo, m); }
inline void LogWarn(const std::string& m) { Log(LogLevel::kWarn, m); }
inline void LogError(const std::string& m) { Log(LogLevel::kError, m); }

}  // namespace dotmask

#endif
