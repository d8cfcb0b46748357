#include "dqmath/core/io/dual_quat_csv.hpp"

#include "dqmath/core/common/logger.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace dqmath::core {

static std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  const std::size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos) return std::string();
  const std::size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

static bool parseFloat(const std::string& field, float* out) {
  const std::string f = trim(field);
  if (f.empty()) return false;
  char* end = nullptr;
  const float v = std::strtof(f.c_str(), &end);
  if (end != f.c_str() + f.size()) return false;
  if (!std::isfinite(v)) return false;  // overflow, nan, inf
  *out = v;
  return true;
}

static bool allFinite(const DualQuat& q) {
  return q.real.coeffs().allFinite() && q.dual.coeffs().allFinite();
}

std::string formatDualQuatCsvRow(const DualQuat& q) {
  std::ostringstream ss;
  ss << std::setprecision(std::numeric_limits<float>::max_digits10);
  const Vec4& r = q.real.coeffs();
  const Vec4& d = q.dual.coeffs();
  ss << r.x() << "," << r.y() << "," << r.z() << "," << r.w() << ","
     << d.x() << "," << d.y() << "," << d.z() << "," << d.w();
  return ss.str();
}

Status parseDualQuatCsvRow(const std::string& line, DualQuat* out) {
  if (!out) return Status::InvalidParameter;

  // Split by hand: an empty trailing field still counts.
  float values[8];
  int count = 0;
  std::size_t begin = 0;
  while (true) {
    const std::size_t comma = line.find(',', begin);
    const std::string field =
        line.substr(begin, comma == std::string::npos ? std::string::npos : comma - begin);
    if (count >= 8) {
      log(LogLevel::Error, "parseDualQuatCsvRow: more than 8 fields");
      return Status::ParseError;
    }
    if (!parseFloat(field, &values[count])) {
      log(LogLevel::Error, "parseDualQuatCsvRow: invalid number '" + trim(field) + "'");
      return Status::ParseError;
    }
    ++count;
    if (comma == std::string::npos) break;
    begin = comma + 1;
  }
  if (count != 8) {
    log(LogLevel::Error, "parseDualQuatCsvRow: expected 8 fields, got " + std::to_string(count));
    return Status::ParseError;
  }

  out->real = quatFromCoeffs(Vec4(values[0], values[1], values[2], values[3]));
  out->dual = quatFromCoeffs(Vec4(values[4], values[5], values[6], values[7]));
  return Status::Success;
}

Status writeDualQuatCsv(const std::vector<DualQuat>& transforms,
                        const std::string& csv_path) {
  for (const auto& q : transforms) {
    if (!allFinite(q)) {
      log(LogLevel::Error, "writeDualQuatCsv: NaN/Inf component in transform list");
      return Status::InvalidParameter;
    }
  }

  std::ofstream out(csv_path);
  if (!out) {
    log(LogLevel::Error, "writeDualQuatCsv: failed to open output file");
    return Status::Failure;
  }

  out << kDualQuatCsvHeader << "\n";
  for (const auto& q : transforms) {
    out << formatDualQuatCsvRow(q) << "\n";
  }

  if (!out) {
    log(LogLevel::Error, "writeDualQuatCsv: write failed");
    return Status::Failure;
  }
  return Status::Success;
}

Status readDualQuatCsv(const std::string& csv_path,
                       std::vector<DualQuat>* out) {
  if (!out) return Status::InvalidParameter;

  std::ifstream in(csv_path);
  if (!in) {
    log(LogLevel::Error, "readDualQuatCsv: failed to open input file");
    return Status::Failure;
  }

  std::vector<DualQuat> parsed;
  std::string line;
  std::size_t line_no = 0;
  bool first_row = true;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string row = trim(line);
    if (row.empty()) continue;
    const bool is_first = first_row;
    first_row = false;
    if (is_first && row == kDualQuatCsvHeader) continue;

    DualQuat q;
    const Status st = parseDualQuatCsvRow(row, &q);
    if (!ok(st)) {
      log(LogLevel::Error, "readDualQuatCsv: bad row at line " + std::to_string(line_no));
      return st;
    }
    parsed.push_back(q);
  }

  *out = std::move(parsed);
  return Status::Success;
}

}  // namespace dqmath::core
