#pragma once
#include <cstdint>

namespace dqmath::core {

// Result of the fallible entry points (blending, parsing, file I/O).
// The arithmetic core never returns a Status.
enum class Status : std::uint8_t {
  Success = 0,
  Failure = 1,
  InvalidParameter = 2,
  ParseError = 3
};

inline constexpr bool ok(Status s) { return s == Status::Success; }

const char* statusToString(Status s);

}  // namespace dqmath::core
