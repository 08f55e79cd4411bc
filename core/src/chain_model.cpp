#include "batchkin/core/model/chain_model.hpp"

#include "batchkin/core/common/logger.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace batchkin::core {

static inline bool isFiniteTransform(const Transform& T) {
  return T.matrix().allFinite();
}

static inline bool isRigid(const Transform& T, double tol) {
  const Mat3 R = T.linear();
  if (!(R.transpose() * R).isApprox(Mat3::Identity(), tol)) return false;
  return std::abs(R.determinant() - 1.0) <= tol;
}

static Status constructionError(const std::string& msg) {
  return logFailure(Status::Construction, "KinematicChainModel", msg);
}

Status KinematicChainModel::init(std::vector<Joint> joints,
                                 const Transform& ee_offset,
                                 const Thresholds& thr) {
  joints_ = std::move(joints);
  ee_offset_ = ee_offset;

  for (auto& j : joints_) {
    if (j.type == JointType::Fixed) {
      j.axis.setZero();
      j.limit = JointLimit{};
      continue;
    }
    const double n = j.axis.norm();
    if (std::isfinite(n) && n > thr.axis_norm_eps) j.axis /= n;
  }

  const Status st = validate(thr);
  if (!ok(st)) {
    joints_.clear();
    active_joints_.clear();
    joint_names_.clear();
    return st;
  }

  active_joints_.clear();
  joint_names_.clear();
  for (std::size_t i = 0; i < joints_.size(); ++i) {
    if (joints_[i].type == JointType::Fixed) continue;
    active_joints_.push_back(static_cast<int>(i));
    joint_names_.push_back(joints_[i].name);
  }

  if (shouldLog(LogLevel::Debug)) {
    log(LogLevel::Debug, "KinematicChainModel: " + std::to_string(joints_.size()) +
                         " joints, ndof " + std::to_string(active_joints_.size()));
  }
  return Status::Success;
}

Status KinematicChainModel::validate(const Thresholds& thr) const {
  if (joints_.empty()) {
    return constructionError("chain has no joints");
  }
  if (!isFiniteTransform(ee_offset_)) {
    return constructionError("ee offset is non-finite");
  }
  if (!isRigid(ee_offset_, thr.orthonormal_tol)) {
    return constructionError("ee offset rotation is not orthonormal");
  }

  std::unordered_set<std::string> names;
  for (const auto& j : joints_) {
    if (j.name.empty()) {
      return constructionError("joint name is empty");
    }
    if (!names.insert(j.name).second) {
      return constructionError("duplicate joint name: " + j.name);
    }
    if (!isFiniteTransform(j.origin)) {
      return constructionError("origin is non-finite for joint: " + j.name);
    }
    if (!isRigid(j.origin, thr.orthonormal_tol)) {
      return constructionError("origin rotation is not orthonormal for joint: " + j.name);
    }

    if (j.type == JointType::Revolute || j.type == JointType::Prismatic) {
      if (!j.axis.allFinite()) {
        return constructionError("axis is non-finite for joint: " + j.name);
      }
      if (std::abs(j.axis.norm() - 1.0) > thr.unit_norm_tol) {
        return constructionError("axis norm too small for joint: " + j.name);
      }
    }

    if (j.limit.enabled) {
      if (!std::isfinite(j.limit.lower) || !std::isfinite(j.limit.upper)) {
        return constructionError("limits are non-finite for joint: " + j.name);
      }
      if (j.limit.lower > j.limit.upper) {
        return constructionError("lower > upper for joint: " + j.name);
      }
    }
  }
  return Status::Success;
}

bool KinematicChainModel::within_limits(const Eigen::VectorXd& q, double tol) const {
  if (q.size() != ndof()) return false;

  for (int i = 0; i < ndof(); ++i) {
    const auto& lim = joint(active_joint_index(i)).limit;
    if (!lim.enabled) continue;

    const double qi = q(i);
    if (qi < lim.lower - tol) return false;
    if (qi > lim.upper + tol) return false;
  }
  return true;
}

Eigen::VectorXd KinematicChainModel::lower_limits() const {
  Eigen::VectorXd out(ndof());
  for (int i = 0; i < ndof(); ++i) {
    const auto& lim = joint(active_joint_index(i)).limit;
    out(i) = lim.enabled ? lim.lower : -M_PI;
  }
  return out;
}

Eigen::VectorXd KinematicChainModel::upper_limits() const {
  Eigen::VectorXd out(ndof());
  for (int i = 0; i < ndof(); ++i) {
    const auto& lim = joint(active_joint_index(i)).limit;
    out(i) = lim.enabled ? lim.upper : M_PI;
  }
  return out;
}

// -------- Builder --------

ChainBuilder& ChainBuilder::add_revolute(std::string name,
                                         const Transform& origin,
                                         const Vec3& axis,
                                         JointLimit limit) {
  Joint j;
  j.name = std::move(name);
  j.type = JointType::Revolute;
  j.origin = origin;
  j.axis = axis;
  j.limit = limit;
  joints_.push_back(std::move(j));
  return *this;
}

ChainBuilder& ChainBuilder::add_prismatic(std::string name,
                                          const Transform& origin,
                                          const Vec3& axis,
                                          JointLimit limit) {
  Joint j;
  j.name = std::move(name);
  j.type = JointType::Prismatic;
  j.origin = origin;
  j.axis = axis;
  j.limit = limit;
  joints_.push_back(std::move(j));
  return *this;
}

ChainBuilder& ChainBuilder::add_fixed(std::string name, const Transform& origin) {
  Joint j;
  j.name = std::move(name);
  j.type = JointType::Fixed;
  j.origin = origin;
  j.axis = Vec3::Zero();
  joints_.push_back(std::move(j));
  return *this;
}

ChainBuilder& ChainBuilder::add_joint(Joint joint) {
  joints_.push_back(std::move(joint));
  return *this;
}

Status ChainBuilder::build(KinematicChainModel* out, const Thresholds& thr) const {
  if (!out) {
    return logFailure(Status::InvalidParameter, "ChainBuilder", "output model is null");
  }
  KinematicChainModel model;
  const Status st = model.init(joints_, ee_offset_.value_or(Transform::Identity()), thr);
  if (!ok(st)) return st;
  *out = std::move(model);
  return Status::Success;
}

}  // namespace batchkin::core
