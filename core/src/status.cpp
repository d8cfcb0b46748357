#include "dqmath/core/common/status.hpp"

namespace dqmath::core {

const char* statusToString(Status s) {
  switch (s) {
    case Status::Success: return "Success";
    case Status::Failure: return "Failure";
    case Status::InvalidParameter: return "InvalidParameter";
    case Status::ParseError: return "ParseError";
  }
  return "Unknown";
}

}  // namespace dqmath::core
