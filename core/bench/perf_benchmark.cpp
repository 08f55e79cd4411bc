#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "batchkin/core/kinematics/batch_fk.hpp"
#include "batchkin/core/kinematics/reference_fk.hpp"
#include "batchkin/core/model/chain_model.hpp"
#include "batchkin/core/sampling/joint_sampler.hpp"

using batchkin::core::BatchArray;
using batchkin::core::BatchForwardKinematics;
using batchkin::core::ChainBuilder;
using batchkin::core::KinematicChainModel;
using batchkin::core::PoseFormat;
using batchkin::core::ReferenceKinematics;
using batchkin::core::Status;
using batchkin::core::Transform;
using batchkin::core::Vec3;
using batchkin::core::Vec7;
using batchkin::core::ok;

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

// Revolute chain cycling z/y/x axes, 0.3 m links, with a fixed plate every fourth joint.
static KinematicChainModel makeBenchModel(int dof) {
  const double link_len = 0.3;
  ChainBuilder builder;

  for (int i = 0; i < dof; ++i) {
    Transform origin = Transform::Identity();
    origin.translation() = Vec3(i == 0 ? 0.0 : link_len, 0.0, 0.0);

    Vec3 axis;
    switch (i % 3) {
      case 0: axis = Vec3(0.0, 0.0, 1.0); break;
      case 1: axis = Vec3(0.0, 1.0, 0.0); break;
      default: axis = Vec3(1.0, 0.0, 0.0); break;
    }
    builder.add_revolute("j" + std::to_string(i + 1), origin, axis);

    if (i % 4 == 3) {
      Transform plate = Transform::Identity();
      plate.linear() = Eigen::AngleAxisd(0.1, Vec3::UnitX()).toRotationMatrix();
      builder.add_fixed("plate" + std::to_string(i + 1), plate);
    }
  }

  Transform tool = Transform::Identity();
  tool.translation() = Vec3(link_len, 0.0, 0.0);
  builder.set_ee_offset(tool);

  KinematicChainModel model;
  const Status st = builder.build(&model);
  if (!ok(st)) {
    std::cerr << "ChainBuilder build failed\n";
    std::exit(1);
  }
  return model;
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
    std::cout << "Usage: batchkin_core_benchmark [--batch=N] [--dof=N] [--seed=N]\n";
    std::cout << "  Optional: --trials=N --warmup=N --quiet\n";
    return 0;
  }

  const int batch = parseIntArg(argc, argv, "--batch", 10000);
  const int dof = parseIntArg(argc, argv, "--dof", 7);
  const int seed = parseIntArg(argc, argv, "--seed", 0);
  const int trials = parseIntArg(argc, argv, "--trials", 5);
  const int warmup = parseIntArg(argc, argv, "--warmup", 1);
  const bool quiet = parseFlag(argc, argv, "--quiet");

  if (batch < 1 || dof < 1) {
    std::cerr << "--batch and --dof must be >= 1\n";
    return 1;
  }

  const KinematicChainModel model = makeBenchModel(dof);
  const BatchForwardKinematics fk(model);
  const ReferenceKinematics ref(model);

  batchkin::core::JointSampler sampler(model, static_cast<std::uint64_t>(seed));
  BatchArray angles;
  if (!ok(sampler.sample(batch, &angles))) {
    std::cerr << "JointSampler sample failed\n";
    return 1;
  }

  BatchArray poses;
  BatchArray jac;
  double acc = 0.0;

  auto run_batched = [&]() {
    if (!ok(fk.compute(angles, PoseFormat::Quaternion, &poses))) {
      std::cerr << "compute failed\n";
      std::exit(1);
    }
    acc += poses(0, 0);
  };

  auto run_jacobian = [&]() {
    if (!ok(fk.computeJacobian(angles, &jac))) {
      std::cerr << "computeJacobian failed\n";
      std::exit(1);
    }
    acc += jac(0, 0);
  };

  Eigen::VectorXd q(dof);
  Vec7 pose;
  auto run_reference = [&]() {
    for (Eigen::Index i = 0; i < angles.rows(); ++i) {
      q = angles.row(i).transpose();
      if (!ok(ref.computeSingle(q, &pose))) {
        std::cerr << "computeSingle failed\n";
        std::exit(1);
      }
      acc += pose(0);
    }
  };

  std::vector<double> batched_runs;
  std::vector<double> jac_runs;
  std::vector<double> ref_runs;
  batched_runs.reserve(trials);
  jac_runs.reserve(trials);
  ref_runs.reserve(trials);

  for (int i = 0; i < warmup; ++i) {
    run_batched();
    run_jacobian();
    run_reference();
  }

  for (int i = 0; i < trials; ++i) {
    batched_runs.push_back(benchMs(run_batched));
    jac_runs.push_back(benchMs(run_jacobian));
    ref_runs.push_back(benchMs(run_reference));
    if (!quiet) {
      std::cout << "trial " << (i + 1) << "/" << trials << " done\n";
    }
  }

  auto median = [](std::vector<double> v) {
    if (v.empty()) return 0.0;
    std::nth_element(v.begin(), v.begin() + v.size() / 2, v.end());
    return v[v.size() / 2];
  };

  const double batched_ms = median(batched_runs);
  const double jac_ms = median(jac_runs);
  const double ref_ms = median(ref_runs);

  std::cout << "batchkin_core_benchmark\n";
  std::cout << "  batch: " << batch << "  dof: " << dof << "\n";
  std::cout << "  trials: " << trials << " (warmup " << warmup << ")\n";
  std::cout << "  compute (batched):        " << batched_ms << " ms total, "
            << (batched_ms * 1000.0 / batch) << " us/sample\n";
  std::cout << "  computeJacobian:          " << jac_ms << " ms total, "
            << (jac_ms * 1000.0 / batch) << " us/sample\n";
  std::cout << "  computeSingle (per-sample): " << ref_ms << " ms total, "
            << (ref_ms * 1000.0 / batch) << " us/sample\n";
  if (batched_ms > 0.0) {
    std::cout << "  speedup: " << (ref_ms / batched_ms) << "x\n";
  }

  if (acc == 0.123456) {
    std::cout << "ignore: " << acc << "\n";
  }
  return 0;
}
