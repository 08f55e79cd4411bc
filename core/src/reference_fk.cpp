#include "batchkin/core/kinematics/reference_fk.hpp"

#include "batchkin/core/common/logger.hpp"

#include <Eigen/Geometry>

namespace batchkin::core {

ReferenceKinematics::ReferenceKinematics(KinematicChainModel model)
  : model_(std::move(model)) {}

static Transform jointMotion(const Joint& j, double q) {
  Transform T = Transform::Identity();

  if (j.type == JointType::Revolute) {
    T.linear() = Eigen::AngleAxisd(q, j.axis).toRotationMatrix();
  } else if (j.type == JointType::Prismatic) {
    T.translation() = j.axis * q;
  } else {
    // Fixed: identity
  }

  return T;
}

static Status checkConfiguration(const char* op, const KinematicChainModel& model,
                                 const Eigen::VectorXd& q) {
  if (q.size() != model.ndof()) {
    return logFailure(Status::Precondition, op, "q size mismatch");
  }
  if (!q.allFinite()) {
    return logFailure(Status::NonFinite, op, "q contains NaN/Inf");
  }
  return Status::Success;
}

Status ReferenceKinematics::forwardKinematics(const Eigen::VectorXd& q,
                                              Transform* g_base_ee) const {
  if (!g_base_ee) {
    return logFailure(Status::InvalidParameter, "forwardKinematics", "null output pointer");
  }
  const Status st = checkConfiguration("forwardKinematics", model_, q);
  if (!ok(st)) return st;

  Transform prod = Transform::Identity();
  int column = 0;
  for (const Joint& j : model_.joints()) {
    const double qi = (j.type == JointType::Fixed) ? 0.0 : q(column++);
    prod = prod * j.origin * jointMotion(j, qi);
  }

  *g_base_ee = prod * model_.ee_offset();
  return Status::Success;
}

Status ReferenceKinematics::computeSingle(const Eigen::VectorXd& q, Vec7* pose) const {
  if (!pose) {
    return logFailure(Status::InvalidParameter, "computeSingle", "null output pointer");
  }
  Transform g = Transform::Identity();
  const Status st = forwardKinematics(q, &g);
  if (!ok(st)) return st;
  *pose = poseFromTransform(g);
  return Status::Success;
}

Status ReferenceKinematics::forwardKinematicsAll(const Eigen::VectorXd& q,
                                                 std::vector<Transform>* intermediate_transforms) const {
  if (!intermediate_transforms) {
    return logFailure(Status::InvalidParameter, "forwardKinematicsAll", "null output pointer");
  }
  const Status st = checkConfiguration("forwardKinematicsAll", model_, q);
  if (!ok(st)) return st;

  intermediate_transforms->clear();
  intermediate_transforms->reserve(static_cast<std::size_t>(model_.num_joints()) + 2);
  intermediate_transforms->push_back(Transform::Identity());

  Transform prod = Transform::Identity();
  int column = 0;
  for (const Joint& j : model_.joints()) {
    const double qi = (j.type == JointType::Fixed) ? 0.0 : q(column++);
    prod = prod * j.origin * jointMotion(j, qi);
    intermediate_transforms->push_back(prod);
  }
  intermediate_transforms->push_back(prod * model_.ee_offset());
  return Status::Success;
}

}  // namespace batchkin::core
