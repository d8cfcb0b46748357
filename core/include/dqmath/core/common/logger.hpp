#pragma once
#include <cstdint>
#include <string>

namespace dqmath::core {

enum class LogLevel : std::uint8_t {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3
};

using LogSink = void(*)(LogLevel, const std::string&);

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Accepts "error", "warn", "info", "debug" (any case) or the digits 0-3.
bool parseLogLevel(const std::string& text, LogLevel* out);

// Reads DQMATH_LOG_LEVEL. Leaves the level untouched and returns false when
// the variable is unset or unparseable.
bool setLogLevelFromEnv();

void setLogSink(LogSink sink);
LogSink getLogSink();

bool shouldLog(LogLevel level);
void log(LogLevel level, const std::string& msg);
void log(LogLevel level, const char* msg);

const char* logLevelToString(LogLevel level);

}  // namespace dqmath::core
