#include "dqmath/core/common/debug_check.hpp"

#include "dqmath/core/common/logger.hpp"

#include <atomic>
#include <cstdlib>
#include <sstream>

namespace dqmath::core {

static std::atomic<DebugCheckHandler> g_handler{nullptr};

static void defaultHandler(const char* expr, const char* msg,
                           const char* file, int line) {
  std::ostringstream ss;
  ss << "debug check failed: " << (msg ? msg : "") << " [" << expr << "] at "
     << file << ":" << line;
  log(LogLevel::Error, ss.str());
  std::abort();
}

void setDebugCheckHandler(DebugCheckHandler handler) {
  g_handler.store(handler);
}

DebugCheckHandler getDebugCheckHandler() {
  return g_handler.load();
}

bool debugChecksEnabled() {
  return DQMATH_DEBUG_CHECKS_ACTIVE != 0;
}

void debugCheckFailed(const char* expr, const char* msg,
                      const char* file, int line) {
  DebugCheckHandler handler = g_handler.load();
  (handler ? handler : &defaultHandler)(expr, msg, file, line);
}

}  // namespace dqmath::core
