#pragma once
#include "batchkin/core/export.hpp"
#include "batchkin/core/common/status.hpp"
#include "batchkin/core/math/types.hpp"
#include "batchkin/core/model/chain_model.hpp"

#include <cstdint>
#include <random>

namespace batchkin::core {

// Uniform joint-angle sampler with its own seeded generator. Draws each column from the
// joint's enabled limits, or [-pi, pi] when the joint is unlimited.
class BATCHKIN_CORE_API JointSampler {
public:
  JointSampler(const KinematicChainModel& model, std::uint64_t seed);

  // (n, ndof); n must be >= 1.
  Status sample(Eigen::Index n, BatchArray* angles);

  void reseed(std::uint64_t seed) { rng_.seed(seed); }

private:
  Eigen::VectorXd lower_;
  Eigen::VectorXd upper_;
  std::mt19937_64 rng_;
};

}  // namespace batchkin::core
