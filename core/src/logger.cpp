#include "dqmath/core/common/logger.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>

#ifndef _WIN32
#include <unistd.h>
#include <cstdio>
#endif

namespace dqmath::core {

static std::atomic<LogLevel> g_level{LogLevel::Warn};
static std::atomic<LogSink> g_sink{nullptr};

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Info: return "INFO";
    case LogLevel::Debug: return "DEBUG";
  }
  return "UNKNOWN";
}

static bool useColor() {
#ifdef _WIN32
  return false;
#else
  static const bool enabled = [] {
    if (std::getenv("NO_COLOR") != nullptr) return false;
    return isatty(fileno(stderr)) != 0;
  }();
  return enabled;
#endif
}

static const char* logLevelToColor(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "\x1b[31m";  // red
    case LogLevel::Warn: return "\x1b[33m";   // yellow
    case LogLevel::Info: return "\x1b[36m";   // cyan
    case LogLevel::Debug: return "\x1b[90m";  // bright black
  }
  return "\x1b[0m";
}

static void defaultSink(LogLevel level, const std::string& msg) {
  if (useColor()) {
    const char* color = logLevelToColor(level);
    std::cerr << color << "[dqmath][" << logLevelToString(level) << "] "
              << msg << "\x1b[0m\n";
    return;
  }
  std::cerr << "[dqmath][" << logLevelToString(level) << "] "
            << msg << "\n";
}

static LogSink sinkOrDefault() {
  LogSink sink = g_sink.load();
  return sink ? sink : &defaultSink;
}

void setLogLevel(LogLevel level) {
  g_level.store(level);
}

LogLevel getLogLevel() {
  return g_level.load();
}

bool parseLogLevel(const std::string& text, LogLevel* out) {
  if (!out) return false;

  std::string lower;
  lower.reserve(text.size());
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lower == "error" || lower == "0") {
    *out = LogLevel::Error;
  } else if (lower == "warn" || lower == "warning" || lower == "1") {
    *out = LogLevel::Warn;
  } else if (lower == "info" || lower == "2") {
    *out = LogLevel::Info;
  } else if (lower == "debug" || lower == "3") {
    *out = LogLevel::Debug;
  } else {
    return false;
  }
  return true;
}

bool setLogLevelFromEnv() {
  const char* value = std::getenv("DQMATH_LOG_LEVEL");
  if (value == nullptr) return false;

  LogLevel level = LogLevel::Warn;
  if (!parseLogLevel(value, &level)) {
    log(LogLevel::Warn, std::string("setLogLevelFromEnv: unrecognized DQMATH_LOG_LEVEL '") +
                            value + "'");
    return false;
  }
  setLogLevel(level);
  return true;
}

void setLogSink(LogSink sink) {
  g_sink.store(sink);
}

LogSink getLogSink() {
  return g_sink.load();
}

bool shouldLog(LogLevel level) {
  return static_cast<int>(level) <= static_cast<int>(g_level.load());
}

void log(LogLevel level, const std::string& msg) {
  if (!shouldLog(level)) return;
  sinkOrDefault()(level, msg);
}

void log(LogLevel level, const char* msg) {
  if (!shouldLog(level)) return;
  sinkOrDefault()(level, msg ? std::string(msg) : std::string());
}

}  // namespace dqmath::core
