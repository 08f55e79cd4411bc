#pragma once
#include "batchkin/core/export.hpp"
#include "batchkin/core/common/status.hpp"
#include "batchkin/core/math/types.hpp"
#include "batchkin/core/model/chain_model.hpp"

#include <cstdint>
#include <vector>

namespace batchkin::core {

enum class PoseFormat : std::uint8_t {
  Homogeneous = 0,  // (N,16), row-major 4x4 per sample
  Quaternion = 1    // (N,7),  [x y z qw qx qy qz], qw >= 0
};

// Batched forward kinematics for a `KinematicChainModel`.
//
// All N samples go through the chain together: each movable joint is one batched stage
// that updates a running (N,4,4) transform with column-array arithmetic, and runs of
// constant transforms (fixed joints, joint origins, the ee offset) are folded once at
// construction. The engine holds no mutable state; every method is const and may be
// called from several threads at once.
//
// `angles` is (N, ndof) with N >= 1. Errors:
//   N == 0 or cols != ndof   -> Status::Precondition
//   NaN/Inf angle            -> Status::NonFinite
//   null output              -> Status::InvalidParameter
class BATCHKIN_CORE_API BatchForwardKinematics {
public:
  explicit BatchForwardKinematics(KinematicChainModel model);

  const KinematicChainModel& model() const { return model_; }

  // Base -> end-effector pose for every row of `angles`.
  Status compute(const BatchArray& angles, PoseFormat format, BatchArray* poses) const;

  // World transforms of every joint's child frame (one (N,16) batch per joint, fixed
  // joints included) followed by the end-effector frame.
  Status computeAll(const BatchArray& angles, std::vector<BatchArray>* frames) const;

  // Analytic Jacobian of the (N,7) quaternion pose. Output is (N, 7 * ndof); each row
  // is a row-major 7 x ndof block, entry (r, j) at column r * ndof + j.
  //   revolute j:  d p / d q_j = w_j x (p_ee - p_j),  d quat / d q_j = 0.5 (0, w_j) ⊗ quat
  //   prismatic j: d p / d q_j = w_j,                 d quat / d q_j = 0
  // with w_j and p_j the world-frame axis and origin of joint j.
  Status computeJacobian(const BatchArray& angles, BatchArray* jacobian) const;

  // Vector-Jacobian product: given dL/dpose in `format` ((N,7) or (N,16)), writes
  // dL/dangles (N, ndof). The gradient of mean(compute(angles, Quaternion)) is
  // backward(angles, Quaternion, constant 1/(7N), ...).
  Status backward(const BatchArray& angles,
                  PoseFormat format,
                  const BatchArray& grad_pose,
                  BatchArray* grad_angles) const;

private:
  struct Stage {
    BatchArray pre;      // (1,16) constant transform folded in front of this joint's motion
    Vec3 axis;           // unit, joint frame
    JointType type;
    int column;          // angle column
  };

  struct ForwardCache {
    BatchArray tip;                   // (N,16) base -> ee
    std::vector<BatchArray> axes;     // per stage (N,3) world axis
    std::vector<BatchArray> origins;  // per stage (N,3) world joint origin
  };

  Status checkAngles(const char* op, const BatchArray& angles) const;
  Status forward(const BatchArray& angles, ForwardCache* cache) const;

  KinematicChainModel model_;
  std::vector<Stage> stages_;
  BatchArray tail_;  // (1,16) constants after the last movable joint, ee offset included
};

}  // namespace batchkin::core
