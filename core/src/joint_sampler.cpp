#include "batchkin/core/sampling/joint_sampler.hpp"

#include "batchkin/core/common/logger.hpp"

namespace batchkin::core {

JointSampler::JointSampler(const KinematicChainModel& model, std::uint64_t seed)
  : lower_(model.lower_limits()),
    upper_(model.upper_limits()),
    rng_(seed) {}

Status JointSampler::sample(Eigen::Index n, BatchArray* angles) {
  if (!angles) return logFailure(Status::InvalidParameter, "JointSampler", "null output");
  if (n < 1) return logFailure(Status::Precondition, "JointSampler", "n must be >= 1");

  std::uniform_real_distribution<double> unit(0.0, 1.0);
  BatchArray out(n, lower_.size());
  for (Eigen::Index i = 0; i < n; ++i) {
    for (Eigen::Index j = 0; j < lower_.size(); ++j) {
      out(i, j) = lower_(j) + unit(rng_) * (upper_(j) - lower_(j));
    }
  }
  *angles = std::move(out);
  return Status::Success;
}

}  // namespace batchkin::core
