#pragma once

#include "dqmath/core/common/status.hpp"
#include "dqmath/core/dual_quat/dual_quat.hpp"

#include <string>
#include <vector>

namespace dqmath::core {

// One dual quaternion per row, fields in declaration order, each quaternion
// as x,y,z,w:
//   real_x,real_y,real_z,real_w,dual_x,dual_y,dual_z,dual_w
inline constexpr const char* kDualQuatCsvHeader =
    "real_x,real_y,real_z,real_w,dual_x,dual_y,dual_z,dual_w";

// Printed with enough digits to reproduce every float exactly.
std::string formatDualQuatCsvRow(const DualQuat& q);

// ParseError on a wrong field count or a field that is not a number.
Status parseDualQuatCsvRow(const std::string& line, DualQuat* out);

// Writes the header followed by one row per transform. Rejects non-finite
// values with InvalidParameter.
Status writeDualQuatCsv(const std::vector<DualQuat>& transforms,
                        const std::string& csv_path);

// Reads a file written by writeDualQuatCsv(). Blank lines are skipped; the
// header line is optional. `out` is replaced only on success.
Status readDualQuatCsv(const std::string& csv_path,
                       std::vector<DualQuat>* out);

}  // namespace dqmath::core
