#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "dqmath/core/dual_quat/blend.hpp"
#include "dqmath/core/dual_quat/dual_quat.hpp"
#include "dqmath/core/math/so3.hpp"

using dqmath::core::DualQuat;
using dqmath::core::RotationTranslation;
using dqmath::core::Status;
using dqmath::core::Vec3;
using dqmath::core::ok;

static int parseIntArg(int argc, char** argv, const char* key, int def) {
  const std::string prefix = std::string(key) + "=";
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0 && i + 1 < argc) {
      return std::stoi(argv[i + 1]);
    }
    if (std::strncmp(argv[i], prefix.c_str(), prefix.size()) == 0) {
      return std::stoi(std::string(argv[i] + prefix.size()));
    }
  }
  return def;
}

static bool parseFlag(int argc, char** argv, const char* key) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0) {
      return true;
    }
  }
  return false;
}

// A set of bone transforms, deliberately left slightly non-unit the way an
// accumulated skinning sum is.
static std::vector<DualQuat> makeBenchBones(int count) {
  std::vector<DualQuat> bones;
  bones.reserve(count);
  for (int i = 0; i < count; ++i) {
    const float a = 0.37f * static_cast<float>(i);
    const Vec3 axis(std::sin(a), std::cos(1.3f * a), 0.5f);
    const Vec3 t(0.1f * i, -0.05f * i, 0.2f * std::sin(a));
    const DualQuat q = DualQuat::fromRotationTranslation(
        dqmath::core::quatFromAxisAngle(axis, 0.8f * a), t);
    bones.push_back(q * (1.0f + 0.01f * std::sin(3.0f * a)));
  }
  return bones;
}

template <typename Fn>
static double benchMs(Fn&& fn) {
  const auto t0 = std::chrono::steady_clock::now();
  fn();
  const auto t1 = std::chrono::steady_clock::now();
  const std::chrono::duration<double, std::milli> dt = t1 - t0;
  return dt.count();
}

int main(int argc, char** argv) {
  if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 ||
                   std::strcmp(argv[1], "-h") == 0)) {
    std::cout << "Usage: dqmath_core_benchmark [--bones=N] [--iters=N] [--influences=N]\n";
    std::cout << "  Optional: --trials=N --warmup=N --quiet\n";
    return 0;
  }

  const int bone_count = std::max(1, parseIntArg(argc, argv, "--bones", 64));
  const int iters = parseIntArg(argc, argv, "--iters", 20000);
  const int influences = std::max(1, std::min(bone_count, parseIntArg(argc, argv, "--influences", 4)));
  const int trials = parseIntArg(argc, argv, "--trials", 5);
  const int warmup = parseIntArg(argc, argv, "--warmup", 1);
  const bool quiet = parseFlag(argc, argv, "--quiet");

  const std::vector<DualQuat> bones = makeBenchBones(bone_count);
  const Vec3 offset(0.25f, -0.5f, 1.0f);
  float acc = 0.0f;

  auto run_decompose = [&](bool baseline) {
    for (int i = 0; i < iters; ++i) {
      const DualQuat& q = bones[i % bone_count];
      const RotationTranslation rt = baseline
        ? q.normalizeFull().toRotationTranslation()
        : q.normalizeToRotationTranslation();
      acc += rt.translation.x();
    }
  };

  auto run_right_mul = [&](bool baseline) {
    for (int i = 0; i < iters; ++i) {
      const DualQuat& q = bones[i % bone_count];
      const DualQuat r = baseline
        ? q * DualQuat::fromTranslation(offset)
        : q.rightMulTranslation(offset);
      acc += r.dual.w();
    }
  };

  std::vector<DualQuat> influence_bones(influences);
  std::vector<float> weights(influences, 1.0f / static_cast<float>(influences));
  auto run_blend = [&]() {
    RotationTranslation rt;
    for (int i = 0; i < iters; ++i) {
      for (int k = 0; k < influences; ++k) {
        influence_bones[k] = bones[(i + 7 * k) % bone_count];
      }
      const Status st = dqmath::core::blendToRotationTranslation(influence_bones, weights, &rt);
      if (!ok(st)) {
        std::cerr << "blendToRotationTranslation failed\n";
        std::exit(1);
      }
      acc += rt.translation.y();
    }
  };

  std::vector<double> dec_runs;
  std::vector<double> dec_base_runs;
  std::vector<double> rmul_runs;
  std::vector<double> rmul_base_runs;
  std::vector<double> blend_runs;
  dec_runs.reserve(trials);
  dec_base_runs.reserve(trials);
  rmul_runs.reserve(trials);
  rmul_base_runs.reserve(trials);
  blend_runs.reserve(trials);

  for (int i = 0; i < warmup; ++i) {
    run_decompose(false);
    run_decompose(true);
    run_right_mul(false);
    run_right_mul(true);
    run_blend();
  }

  for (int i = 0; i < trials; ++i) {
    dec_runs.push_back(benchMs([&]() { run_decompose(false); }));
    dec_base_runs.push_back(benchMs([&]() { run_decompose(true); }));
    rmul_runs.push_back(benchMs([&]() { run_right_mul(false); }));
    rmul_base_runs.push_back(benchMs([&]() { run_right_mul(true); }));
    blend_runs.push_back(benchMs([&]() { run_blend(); }));
    if (!quiet) {
      std::cout << "trial " << (i + 1) << "/" << trials << " done\n";
    }
  }

  auto median = [](std::vector<double> v) {
    if (v.empty()) return 0.0;
    std::nth_element(v.begin(), v.begin() + v.size() / 2, v.end());
    return v[v.size() / 2];
  };

  const double dec_ms = median(dec_runs);
  const double dec_base_ms = median(dec_base_runs);
  const double rmul_ms = median(rmul_runs);
  const double rmul_base_ms = median(rmul_base_runs);
  const double blend_ms = median(blend_runs);

  std::cout << "dqmath_core_benchmark\n";
  std::cout << "  bones: " << bone_count << ", influences: " << influences << "\n";
  std::cout << "  trials: " << trials << " (warmup " << warmup << ")\n";
  std::cout << "  normalizeToRotationTranslation: " << dec_ms << " ms total, "
            << (dec_ms * 1.0e6 / iters) << " ns/call\n";
  std::cout << "  normalizeFull + toRotationTranslation: " << dec_base_ms << " ms total, "
            << (dec_base_ms * 1.0e6 / iters) << " ns/call\n";
  std::cout << "  rightMulTranslation: " << rmul_ms << " ms total, "
            << (rmul_ms * 1.0e6 / iters) << " ns/call\n";
  std::cout << "  operator* fromTranslation: " << rmul_base_ms << " ms total, "
            << (rmul_base_ms * 1.0e6 / iters) << " ns/call\n";
  std::cout << "  blendToRotationTranslation: " << blend_ms << " ms total, "
            << (blend_ms * 1.0e6 / iters) << " ns/call\n";

  if (acc == 0.123456f) {
    std::cout << "ignore: " << acc << "\n";
  }
  return 0;
}
