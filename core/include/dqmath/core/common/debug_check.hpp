#pragma once

namespace dqmath::core {

// Called when a DQMATH_DEBUG_CHECK condition is false. The default handler
// logs at Error level and aborts.
using DebugCheckHandler = void(*)(const char* expr, const char* msg,
                                  const char* file, int line);

void setDebugCheckHandler(DebugCheckHandler handler);
DebugCheckHandler getDebugCheckHandler();

// Whether the library itself was compiled with debug checks active.
bool debugChecksEnabled();

void debugCheckFailed(const char* expr, const char* msg,
                      const char* file, int line);

}  // namespace dqmath::core

// Active in non-NDEBUG builds and in builds configured with DQMATH_VALIDATE.
#if !defined(NDEBUG) || defined(DQMATH_VALIDATE)
  #define DQMATH_DEBUG_CHECKS_ACTIVE 1
  #define DQMATH_DEBUG_CHECK(cond, msg)                                        \
    do {                                                                       \
      if (!(cond)) {                                                           \
        ::dqmath::core::debugCheckFailed(#cond, (msg), __FILE__, __LINE__);    \
      }                                                                        \
    } while (0)
#else
  #define DQMATH_DEBUG_CHECKS_ACTIVE 0
  #define DQMATH_DEBUG_CHECK(cond, msg) \
    do {                                \
      (void)sizeof(cond);               \
    } while (0)
#endif
