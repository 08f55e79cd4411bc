#pragma once
#include "batchkin/core/export.hpp"
#include "batchkin/core/common/status.hpp"
#include "batchkin/core/common/constants.hpp"
#include "batchkin/core/math/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace batchkin::core {

// Serial kinematic chain in URDF convention.
//
// Conventions:
// - Joints are ordered root to tip; joint i's `origin` maps the parent link frame (the
//   previous joint's child frame, or the base for i == 0) to the joint frame at q = 0.
// - `axis` is expressed in the joint frame and is normalized at build time.
// - The world pose of the end effector is
//     origin_0 * motion_0(q_0) * origin_1 * motion_1(q_1) * ... * ee_offset
//   where motion is a rotation about `axis` (revolute), a translation along it
//   (prismatic), or identity (fixed).
// - Angle columns follow the movable joints in traversal order.
enum class JointType : std::uint8_t {
  Revolute = 0,
  Prismatic = 1,
  Fixed = 2
};

// Advisory only; forward kinematics never clamps.
struct JointLimit {
  double lower = 0.0;
  double upper = 0.0;
  bool enabled = false;
};

struct Joint {
  std::string name;
  JointType type{JointType::Revolute};
  Transform origin = Transform::Identity();
  Vec3 axis = Vec3::UnitZ();
  JointLimit limit{};
};

class BATCHKIN_CORE_API KinematicChainModel {
public:
  KinematicChainModel() = default;

  // Number of movable (revolute + prismatic) joints.
  int ndof() const { return static_cast<int>(active_joints_.size()); }
  int num_joints() const { return static_cast<int>(joints_.size()); }

  const std::vector<Joint>& joints() const { return joints_; }
  const Joint& joint(int i) const { return joints_.at(static_cast<std::size_t>(i)); }

  // Chain index of the joint driven by angle column `col`.
  int active_joint_index(int col) const { return active_joints_.at(static_cast<std::size_t>(col)); }

  // Names of the movable joints in angle-column order.
  const std::vector<std::string>& joint_names() const { return joint_names_; }

  const Transform& ee_offset() const { return ee_offset_; }

  bool within_limits(const Eigen::VectorXd& q, double tol = 0.0) const;

  // Per-column bounds; unlimited joints report [-pi, pi].
  Eigen::VectorXd lower_limits() const;
  Eigen::VectorXd upper_limits() const;

private:
  friend class ChainBuilder;

  Status init(std::vector<Joint> joints, const Transform& ee_offset, const Thresholds& thr);
  Status validate(const Thresholds& thr) const;

  std::vector<Joint> joints_;
  std::vector<int> active_joints_;
  std::vector<std::string> joint_names_;
  Transform ee_offset_{Transform::Identity()};
};

class BATCHKIN_CORE_API ChainBuilder {
public:
  ChainBuilder& set_ee_offset(const Transform& ee_offset) {
    ee_offset_ = ee_offset;
    return *this;
  }

  ChainBuilder& add_revolute(std::string name,
                             const Transform& origin,
                             const Vec3& axis,
                             JointLimit limit = {});

  ChainBuilder& add_prismatic(std::string name,
                              const Transform& origin,
                              const Vec3& axis,
                              JointLimit limit = {});

  ChainBuilder& add_fixed(std::string name, const Transform& origin);

  ChainBuilder& add_joint(Joint joint);

  // Validates and builds the model. Any malformed joint, offset or limit yields
  // Status::Construction and leaves `out` untouched. A missing ee offset means identity.
  Status build(KinematicChainModel* out, const Thresholds& thr = kDefaultThresholds) const;

private:
  std::vector<Joint> joints_;
  std::optional<Transform> ee_offset_;
};

}  // namespace batchkin::core
