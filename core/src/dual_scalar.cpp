#include "dqmath/core/dual_quat/dual_scalar.hpp"

#include <ostream>

namespace dqmath::core {

std::ostream& operator<<(std::ostream& os, const DualScalar& s) {
  os << "(" << s.real << " + " << s.dual << "e)";
  return os;
}

}  // namespace dqmath::core
