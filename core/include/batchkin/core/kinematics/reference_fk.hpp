#pragma once
#include "batchkin/core/export.hpp"
#include "batchkin/core/common/status.hpp"
#include "batchkin/core/math/types.hpp"
#include "batchkin/core/model/chain_model.hpp"

#include <vector>

namespace batchkin::core {

// Per-sample forward kinematics on Eigen::Isometry3d, one joint at a time.
// Used to cross-validate BatchForwardKinematics; same conventions and pose layout.
class BATCHKIN_CORE_API ReferenceKinematics {
public:
  explicit ReferenceKinematics(KinematicChainModel model);

  const KinematicChainModel& model() const { return model_; }

  // `q` must be size `model().ndof()`. Output is base -> end effector.
  Status forwardKinematics(const Eigen::VectorXd& q, Transform* g_base_ee) const;

  // [x y z qw qx qy qz] with qw >= 0.
  Status computeSingle(const Eigen::VectorXd& q, Vec7* pose) const;

  // Output includes:
  // - index 0: base frame (identity)
  // - indices 1..num_joints: per-joint child frames
  // - last index: end-effector frame
  Status forwardKinematicsAll(const Eigen::VectorXd& q,
                              std::vector<Transform>* intermediate_transforms) const;

private:
  KinematicChainModel model_;
};

}  // namespace batchkin::core
