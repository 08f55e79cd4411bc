#include "batchkin/core/kinematics/batch_fk.hpp"

#include "batchkin/core/common/logger.hpp"
#include "batchkin/core/math/batch.hpp"
#include "batchkin/core/math/rotation.hpp"

#include <cmath>
#include <string>

namespace batchkin::core {

namespace {

using Arr = Eigen::ArrayXd;

// A batch of 3-vectors as three contiguous component arrays.
struct Vec3Arr {
  Arr x, y, z;

  const Arr& operator[](int i) const { return i == 0 ? x : (i == 1 ? y : z); }
};

Vec3Arr cross(const Vec3Arr& a, const Vec3Arr& b) {
  return {a.y * b.z - a.z * b.y,
          a.z * b.x - a.x * b.z,
          a.x * b.y - a.y * b.x};
}

Arr entry(const BatchArray& T, int r, int c) {
  return T.col(tfIndex(r, c)).array();
}

Vec3Arr translationOf(const BatchArray& T) {
  return {entry(T, 0, 3), entry(T, 1, 3), entry(T, 2, 3)};
}

// R * a for a constant vector a, per sample.
Vec3Arr rotateConstant(const BatchArray& T, const Vec3& a) {
  return {entry(T, 0, 0) * a.x() + entry(T, 0, 1) * a.y() + entry(T, 0, 2) * a.z(),
          entry(T, 1, 0) * a.x() + entry(T, 1, 1) * a.y() + entry(T, 1, 2) * a.z(),
          entry(T, 2, 0) * a.x() + entry(T, 2, 1) * a.y() + entry(T, 2, 2) * a.z()};
}

BatchArray packVec3(const Vec3Arr& v) {
  BatchArray out(v.x.size(), 3);
  out.col(0) = v.x.matrix();
  out.col(1) = v.y.matrix();
  out.col(2) = v.z.matrix();
  return out;
}

Vec3Arr unpackVec3(const BatchArray& m) {
  return {m.col(0).array(), m.col(1).array(), m.col(2).array()};
}

// T <- T * Rot(a, theta). Rodrigues: M = c I + s [a]x + (1 - c) a a^T with c, s per sample.
void applyRevolute(BatchArray* T, const Vec3& a, const Arr& theta) {
  const Arr c = theta.cos();
  const Arr s = theta.sin();
  const Arr one_c = 1.0 - c;

  const double K[3][3] = {{0.0, -a.z(), a.y()},
                          {a.z(), 0.0, -a.x()},
                          {-a.y(), a.x(), 0.0}};
  Arr M[3][3];
  for (int k = 0; k < 3; ++k) {
    for (int j = 0; j < 3; ++j) {
      M[k][j] = one_c * (a(k) * a(j)) + s * K[k][j];
      if (k == j) M[k][j] += c;
    }
  }

  for (int r = 0; r < 3; ++r) {
    const Arr t0 = entry(*T, r, 0), t1 = entry(*T, r, 1), t2 = entry(*T, r, 2);
    for (int j = 0; j < 3; ++j) {
      T->col(tfIndex(r, j)) = (t0 * M[0][j] + t1 * M[1][j] + t2 * M[2][j]).matrix();
    }
  }
}

// T <- T * Trans(a * d).
void applyPrismatic(BatchArray* T, const Vec3& a, const Arr& d) {
  const Vec3Arr step = rotateConstant(*T, a);
  T->col(tfIndex(0, 3)) += (step.x * d).matrix();
  T->col(tfIndex(1, 3)) += (step.y * d).matrix();
  T->col(tfIndex(2, 3)) += (step.z * d).matrix();
}

void applyMotion(BatchArray* T, const Joint& j, const Arr& q) {
  if (j.type == JointType::Revolute) {
    applyRevolute(T, j.axis, q);
  } else if (j.type == JointType::Prismatic) {
    applyPrismatic(T, j.axis, q);
  }
}

}  // namespace

BatchForwardKinematics::BatchForwardKinematics(KinematicChainModel model)
  : model_(std::move(model)) {
  // Fold every constant transform into the stage that follows it.
  Transform pending = Transform::Identity();
  for (int i = 0; i < model_.num_joints(); ++i) {
    const Joint& j = model_.joint(i);
    pending = pending * j.origin;
    if (j.type == JointType::Fixed) continue;

    Stage st;
    st.pre = broadcastTransform(matrix4FromTransform(pending), 1);
    st.axis = j.axis;
    st.type = j.type;
    st.column = static_cast<int>(stages_.size());
    stages_.push_back(std::move(st));
    pending = Transform::Identity();
  }
  tail_ = broadcastTransform(matrix4FromTransform(pending * model_.ee_offset()), 1);
}

Status BatchForwardKinematics::checkAngles(const char* op, const BatchArray& angles) const {
  if (angles.rows() < 1) {
    return logFailure(Status::Precondition, op, "angle batch must have at least one row");
  }
  if (angles.cols() != model_.ndof()) {
    return logFailure(Status::Precondition, op,
                      "angle batch has " + std::to_string(angles.cols()) +
                      " columns, chain has ndof " + std::to_string(model_.ndof()));
  }
  if (!angles.allFinite()) {
    return logFailure(Status::NonFinite, op, "angle batch contains NaN/Inf");
  }
  return Status::Success;
}

Status BatchForwardKinematics::forward(const BatchArray& angles, ForwardCache* cache) const {
  const Eigen::Index n = angles.rows();

  cache->axes.clear();
  cache->origins.clear();
  cache->axes.reserve(stages_.size());
  cache->origins.reserve(stages_.size());

  BatchArray running = identityTransforms(n);
  bool first = true;
  for (const Stage& st : stages_) {
    if (first) {
      running = broadcastTransform(transformAt(st.pre, 0), n);
      first = false;
    } else {
      composeTransforms(running, st.pre, &running);
    }

    // The joint axis is invariant under the joint's own motion, so the frame before the
    // motion gives the world axis and origin used by the Jacobian.
    cache->axes.push_back(packVec3(rotateConstant(running, st.axis)));
    cache->origins.push_back(packVec3(translationOf(running)));

    const Arr q = angles.col(st.column).array();
    if (st.type == JointType::Revolute) {
      applyRevolute(&running, st.axis, q);
    } else {
      applyPrismatic(&running, st.axis, q);
    }
  }
  composeTransforms(running, tail_, &running);

  if (!running.allFinite()) {
    return logFailure(Status::NonFinite, "BatchForwardKinematics", "non-finite pose");
  }
  cache->tip = std::move(running);
  return Status::Success;
}

Status BatchForwardKinematics::compute(const BatchArray& angles,
                                       PoseFormat format,
                                       BatchArray* poses) const {
  if (!poses) return logFailure(Status::InvalidParameter, "compute", "null output");
  Status st = checkAngles("compute", angles);
  if (!ok(st)) return st;

  ForwardCache cache;
  st = forward(angles, &cache);
  if (!ok(st)) return st;

  if (format == PoseFormat::Homogeneous) {
    *poses = std::move(cache.tip);
    return Status::Success;
  }
  return homogeneousTransformToPose(cache.tip, poses);
}

Status BatchForwardKinematics::computeAll(const BatchArray& angles,
                                          std::vector<BatchArray>* frames) const {
  if (!frames) return logFailure(Status::InvalidParameter, "computeAll", "null output");
  const Status st = checkAngles("computeAll", angles);
  if (!ok(st)) return st;

  const Eigen::Index n = angles.rows();
  std::vector<BatchArray> out;
  out.reserve(static_cast<std::size_t>(model_.num_joints()) + 1);

  BatchArray running = identityTransforms(n);
  int column = 0;
  for (const Joint& j : model_.joints()) {
    composeTransforms(running, broadcastTransform(matrix4FromTransform(j.origin), 1), &running);
    if (j.type != JointType::Fixed) {
      applyMotion(&running, j, angles.col(column).array());
      ++column;
    }
    out.push_back(running);
  }
  composeTransforms(running, broadcastTransform(matrix4FromTransform(model_.ee_offset()), 1),
                    &running);
  if (!running.allFinite()) {
    return logFailure(Status::NonFinite, "computeAll", "non-finite pose");
  }
  out.push_back(std::move(running));

  *frames = std::move(out);
  return Status::Success;
}

Status BatchForwardKinematics::computeJacobian(const BatchArray& angles,
                                               BatchArray* jacobian) const {
  if (!jacobian) return logFailure(Status::InvalidParameter, "computeJacobian", "null output");
  Status st = checkAngles("computeJacobian", angles);
  if (!ok(st)) return st;

  ForwardCache cache;
  st = forward(angles, &cache);
  if (!ok(st)) return st;

  BatchArray pose;
  st = homogeneousTransformToPose(cache.tip, &pose);
  if (!ok(st)) return st;

  const int ndof = model_.ndof();
  const Vec3Arr p_ee = unpackVec3(pose.leftCols<3>());
  const Arr qw = pose.col(3).array();
  const Vec3Arr qv{pose.col(4).array(), pose.col(5).array(), pose.col(6).array()};

  BatchArray J = BatchArray::Zero(angles.rows(), kPoseWidth * ndof);
  for (std::size_t s = 0; s < stages_.size(); ++s) {
    const int j = stages_[s].column;
    const Vec3Arr w = unpackVec3(cache.axes[s]);

    if (stages_[s].type == JointType::Prismatic) {
      for (int r = 0; r < 3; ++r) J.col(r * ndof + j) = w[r].matrix();
      continue;
    }

    const Vec3Arr p_j = unpackVec3(cache.origins[s]);
    const Vec3Arr lever{p_ee.x - p_j.x, p_ee.y - p_j.y, p_ee.z - p_j.z};
    const Vec3Arr dp = cross(w, lever);
    for (int r = 0; r < 3; ++r) J.col(r * ndof + j) = dp[r].matrix();

    // 0.5 * (0, w) ⊗ (qw, qv)
    const Vec3Arr wxq = cross(w, qv);
    J.col(3 * ndof + j) = (-0.5 * (w.x * qv.x + w.y * qv.y + w.z * qv.z)).matrix();
    J.col(4 * ndof + j) = (0.5 * (qw * w.x + wxq.x)).matrix();
    J.col(5 * ndof + j) = (0.5 * (qw * w.y + wxq.y)).matrix();
    J.col(6 * ndof + j) = (0.5 * (qw * w.z + wxq.z)).matrix();
  }

  *jacobian = std::move(J);
  return Status::Success;
}

Status BatchForwardKinematics::backward(const BatchArray& angles,
                                        PoseFormat format,
                                        const BatchArray& grad_pose,
                                        BatchArray* grad_angles) const {
  const char* op = "backward";
  if (!grad_angles) return logFailure(Status::InvalidParameter, op, "null output");
  Status st = checkAngles(op, angles);
  if (!ok(st)) return st;
  const int width = (format == PoseFormat::Quaternion) ? kPoseWidth : kTransformWidth;
  st = checkBatch(op, grad_pose, width);
  if (!ok(st)) return st;
  if (grad_pose.rows() != angles.rows()) {
    return logFailure(Status::Precondition, op, "grad_pose batch size differs from angles");
  }

  const int ndof = model_.ndof();
  BatchArray grad = BatchArray::Zero(angles.rows(), ndof);

  if (format == PoseFormat::Quaternion) {
    BatchArray J;
    st = computeJacobian(angles, &J);
    if (!ok(st)) return st;
    for (int j = 0; j < ndof; ++j) {
      for (int r = 0; r < kPoseWidth; ++r) {
        grad.col(j).array() += grad_pose.col(r).array() * J.col(r * ndof + j).array();
      }
    }
    *grad_angles = std::move(grad);
    return Status::Success;
  }

  ForwardCache cache;
  st = forward(angles, &cache);
  if (!ok(st)) return st;

  const Vec3Arr t = translationOf(cache.tip);
  for (std::size_t s = 0; s < stages_.size(); ++s) {
    const int j = stages_[s].column;
    const Vec3Arr w = unpackVec3(cache.axes[s]);

    if (stages_[s].type == JointType::Prismatic) {
      for (int r = 0; r < 3; ++r) {
        grad.col(j).array() += entry(grad_pose, r, 3) * w[r];
      }
      continue;
    }

    // dR/dq = [w]x R,  dt/dq = w x (t - p_j)
    const Vec3Arr p_j = unpackVec3(cache.origins[s]);
    const Vec3Arr dt = cross(w, Vec3Arr{t.x - p_j.x, t.y - p_j.y, t.z - p_j.z});
    for (int c = 0; c < 3; ++c) {
      const Vec3Arr col{entry(cache.tip, 0, c), entry(cache.tip, 1, c), entry(cache.tip, 2, c)};
      const Vec3Arr dcol = cross(w, col);
      for (int r = 0; r < 3; ++r) {
        grad.col(j).array() += entry(grad_pose, r, c) * dcol[r];
      }
    }
    for (int r = 0; r < 3; ++r) {
      grad.col(j).array() += entry(grad_pose, r, 3) * dt[r];
    }
  }

  *grad_angles = std::move(grad);
  return Status::Success;
}

}  // namespace batchkin::core
