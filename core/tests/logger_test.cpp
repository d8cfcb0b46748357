#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "dqmath/core/common/logger.hpp"
#include "dqmath/core/common/status.hpp"

using dqmath::core::LogLevel;

static std::vector<std::string> g_lines;

static void captureSink(LogLevel level, const std::string& msg) {
  g_lines.push_back(std::string(dqmath::core::logLevelToString(level)) + ":" + msg);
}

// First use of the default sink from several threads at once; the color
// decision is made lazily inside it.
static void test_default_sink_concurrent_first_use() {
  dqmath::core::setLogSink(nullptr);
  dqmath::core::setLogLevel(LogLevel::Warn);
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([i] {
      dqmath::core::log(LogLevel::Warn, "default sink thread " + std::to_string(i));
    });
  }
  for (auto& t : threads) t.join();
  assert(dqmath::core::getLogLevel() == LogLevel::Warn);
}

static void test_level_filtering() {
  dqmath::core::setLogSink(&captureSink);
  dqmath::core::setLogLevel(LogLevel::Warn);

  g_lines.clear();
  dqmath::core::log(LogLevel::Error, "e");
  dqmath::core::log(LogLevel::Warn, std::string("w"));
  dqmath::core::log(LogLevel::Info, "i");
  dqmath::core::log(LogLevel::Debug, "d");
  assert(g_lines.size() == 2);
  assert(g_lines[0] == "ERROR:e");
  assert(g_lines[1] == "WARN:w");

  dqmath::core::setLogLevel(LogLevel::Debug);
  g_lines.clear();
  dqmath::core::log(LogLevel::Debug, static_cast<const char*>(nullptr));
  assert(g_lines.size() == 1 && g_lines[0] == "DEBUG:");

  dqmath::core::setLogLevel(LogLevel::Warn);
  dqmath::core::setLogSink(nullptr);
  assert(dqmath::core::getLogSink() == nullptr);
}

static void test_parse_level() {
  LogLevel level = LogLevel::Warn;
  assert(dqmath::core::parseLogLevel("debug", &level) && level == LogLevel::Debug);
  assert(dqmath::core::parseLogLevel(" ERROR ", &level) && level == LogLevel::Error);
  assert(dqmath::core::parseLogLevel("Info", &level) && level == LogLevel::Info);
  assert(dqmath::core::parseLogLevel("1", &level) && level == LogLevel::Warn);
  assert(!dqmath::core::parseLogLevel("verbose", &level));
  assert(level == LogLevel::Warn);
  assert(!dqmath::core::parseLogLevel("info", nullptr));
}

static void test_env_level() {
#ifndef _WIN32
  dqmath::core::setLogSink(&captureSink);
  dqmath::core::setLogLevel(LogLevel::Warn);

  unsetenv("DQMATH_LOG_LEVEL");
  assert(!dqmath::core::setLogLevelFromEnv());
  assert(dqmath::core::getLogLevel() == LogLevel::Warn);

  setenv("DQMATH_LOG_LEVEL", "info", 1);
  assert(dqmath::core::setLogLevelFromEnv());
  assert(dqmath::core::getLogLevel() == LogLevel::Info);

  g_lines.clear();
  setenv("DQMATH_LOG_LEVEL", "loud", 1);
  assert(!dqmath::core::setLogLevelFromEnv());
  assert(dqmath::core::getLogLevel() == LogLevel::Info);
  assert(g_lines.size() == 1);

  unsetenv("DQMATH_LOG_LEVEL");
  dqmath::core::setLogLevel(LogLevel::Warn);
  dqmath::core::setLogSink(nullptr);
#endif
}

static void test_status_names() {
  using dqmath::core::Status;
  assert(dqmath::core::ok(Status::Success));
  assert(!dqmath::core::ok(Status::ParseError));
  assert(std::string(dqmath::core::statusToString(Status::InvalidParameter)) == "InvalidParameter");
}

int main() {
  test_default_sink_concurrent_first_use();
  test_level_filtering();
  test_parse_level();
  test_env_level();
  test_status_names();
  std::cout << "dqmath_logger_test: PASS\n";
  return 0;
}
