// Batched rotation algebra.
//
// Kernels pull each quaternion component / matrix entry out as a contiguous column array
// and combine them with Eigen array expressions, so no kernel loops over samples.
// - quaternion -> matrix is the closed-form expansion of a unit quaternion.
// - matrix -> quaternion is Shepperd's method; all four branches are evaluated as arrays
//   and the per-sample branch is chosen with select().
// - Inverse-trig arguments are clamped to [-1, 1] before acos.
#include "batchkin/core/math/rotation.hpp"

#include "batchkin/core/common/constants.hpp"
#include "batchkin/core/common/logger.hpp"
#include "batchkin/core/math/batch.hpp"

#include <cmath>

namespace batchkin::core {

namespace {

using Arr = Eigen::ArrayXd;
using Mask = Eigen::Array<bool, Eigen::Dynamic, 1>;

struct QuatCols {
  Arr w, x, y, z;
};

QuatCols splitQuat(const BatchArray& q) {
  return {q.col(0).array(), q.col(1).array(), q.col(2).array(), q.col(3).array()};
}

void storeQuat(const Arr& w, const Arr& x, const Arr& y, const Arr& z, BatchArray* out) {
  BatchArray q(w.size(), kQuatWidth);
  q.col(0) = w.matrix();
  q.col(1) = x.matrix();
  q.col(2) = y.matrix();
  q.col(3) = z.matrix();
  *out = std::move(q);
}

Arr rotCol(const BatchArray& R, int r, int c) {
  return R.col(rotIndex(r, c)).array();
}

// Normalized quaternions; rejects zero-norm rows.
Status normalizedQuat(const char* op, const BatchArray& q, BatchArray* out, Arr* norms) {
  Arr n = q.rowwise().norm().array();
  if ((n <= 0.0).any()) {
    return logFailure(Status::NonFinite, op, "zero-norm quaternion");
  }
  *out = (q.array().colwise() / n).matrix();
  if (norms) *norms = std::move(n);
  return Status::Success;
}

// d/da acos(a) = -1 / sqrt(1 - a^2), zeroed where it is unbounded.
Arr acosDerivative(const Arr& a, double eps) {
  const Arr one_minus = 1.0 - a.square();
  const Mask inside = one_minus > eps;
  return inside.select(-1.0 / one_minus.max(eps).sqrt(), Arr::Zero(a.size()));
}

}  // namespace

Status quaternionToRotationMatrix(const BatchArray& q, BatchArray* R) {
  if (!R) return logFailure(Status::InvalidParameter, "quaternionToRotationMatrix", "null output");
  const Status st = checkBatch("quaternionToRotationMatrix", q, kQuatWidth);
  if (!ok(st)) return st;

  const QuatCols c = splitQuat(q);
  const Arr xx = c.x * c.x, yy = c.y * c.y, zz = c.z * c.z;
  const Arr xy = c.x * c.y, xz = c.x * c.z, yz = c.y * c.z;
  const Arr wx = c.w * c.x, wy = c.w * c.y, wz = c.w * c.z;

  BatchArray out(q.rows(), kRotationWidth);
  out.col(rotIndex(0, 0)) = (1.0 - 2.0 * (yy + zz)).matrix();
  out.col(rotIndex(0, 1)) = (2.0 * (xy - wz)).matrix();
  out.col(rotIndex(0, 2)) = (2.0 * (xz + wy)).matrix();
  out.col(rotIndex(1, 0)) = (2.0 * (xy + wz)).matrix();
  out.col(rotIndex(1, 1)) = (1.0 - 2.0 * (xx + zz)).matrix();
  out.col(rotIndex(1, 2)) = (2.0 * (yz - wx)).matrix();
  out.col(rotIndex(2, 0)) = (2.0 * (xz - wy)).matrix();
  out.col(rotIndex(2, 1)) = (2.0 * (yz + wx)).matrix();
  out.col(rotIndex(2, 2)) = (1.0 - 2.0 * (xx + yy)).matrix();
  *R = std::move(out);
  return Status::Success;
}

Status rotationMatrixToQuaternion(const BatchArray& R, BatchArray* q) {
  if (!q) return logFailure(Status::InvalidParameter, "rotationMatrixToQuaternion", "null output");
  const Status st = checkBatch("rotationMatrixToQuaternion", R, kRotationWidth);
  if (!ok(st)) return st;

  const Arr r00 = rotCol(R, 0, 0), r01 = rotCol(R, 0, 1), r02 = rotCol(R, 0, 2);
  const Arr r10 = rotCol(R, 1, 0), r11 = rotCol(R, 1, 1), r12 = rotCol(R, 1, 2);
  const Arr r20 = rotCol(R, 2, 0), r21 = rotCol(R, 2, 1), r22 = rotCol(R, 2, 2);
  const Arr tr = r00 + r11 + r22;

  // Shepperd: pick the largest of (trace, r00, r11, r22) so the divisor s stays >= 1.
  const Mask use_w = (tr >= r00) && (tr >= r11) && (tr >= r22);
  const Mask use_x = (r00 > tr) && (r00 >= r11) && (r00 >= r22);
  const Mask use_y = (r11 > tr) && (r11 > r00) && (r11 >= r22);

  // Floors only matter for the branches select() discards.
  constexpr double kFloor = 1e-12;
  const Arr s_w = 2.0 * (1.0 + tr).max(kFloor).sqrt();
  const Arr s_x = 2.0 * (1.0 + r00 - r11 - r22).max(kFloor).sqrt();
  const Arr s_y = 2.0 * (1.0 + r11 - r00 - r22).max(kFloor).sqrt();
  const Arr s_z = 2.0 * (1.0 + r22 - r00 - r11).max(kFloor).sqrt();

  Arr w = use_w.select(0.25 * s_w,
          use_x.select((r21 - r12) / s_x,
          use_y.select((r02 - r20) / s_y, (r10 - r01) / s_z)));
  Arr x = use_w.select((r21 - r12) / s_w,
          use_x.select(0.25 * s_x,
          use_y.select((r01 + r10) / s_y, (r02 + r20) / s_z)));
  Arr y = use_w.select((r02 - r20) / s_w,
          use_x.select((r01 + r10) / s_x,
          use_y.select(0.25 * s_y, (r12 + r21) / s_z)));
  Arr z = use_w.select((r10 - r01) / s_w,
          use_x.select((r02 + r20) / s_x,
          use_y.select((r12 + r21) / s_y, 0.25 * s_z)));

  // Canonical sign w >= 0, unit norm.
  const Arr sign = (w < 0.0).select(Arr::Constant(w.size(), -1.0), Arr::Ones(w.size()));
  const Arr inv_norm = sign / (w.square() + x.square() + y.square() + z.square()).sqrt();
  w *= inv_norm;
  x *= inv_norm;
  y *= inv_norm;
  z *= inv_norm;

  storeQuat(w, x, y, z, q);
  return Status::Success;
}

Status rotationMatrixToHomogeneousTransform(const BatchArray& R,
                                            const BatchArray& t,
                                            BatchArray* T) {
  if (!T) {
    return logFailure(Status::InvalidParameter, "rotationMatrixToHomogeneousTransform",
                      "null output");
  }
  const Status st = checkBatchPair("rotationMatrixToHomogeneousTransform",
                                   R, kRotationWidth, t, kTranslationWidth);
  if (!ok(st)) return st;

  BatchArray out = BatchArray::Zero(R.rows(), kTransformWidth);
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) out.col(tfIndex(r, c)) = R.col(rotIndex(r, c));
    out.col(tfIndex(r, 3)) = t.col(r);
  }
  out.col(tfIndex(3, 3)).setOnes();
  *T = std::move(out);
  return Status::Success;
}

Status quaternionAndTranslationToHomogeneousTransform(const BatchArray& q,
                                                      const BatchArray& t,
                                                      BatchArray* T) {
  if (!T) {
    return logFailure(Status::InvalidParameter,
                      "quaternionAndTranslationToHomogeneousTransform", "null output");
  }
  const Status st = checkBatchPair("quaternionAndTranslationToHomogeneousTransform",
                                   q, kQuatWidth, t, kTranslationWidth);
  if (!ok(st)) return st;

  BatchArray R;
  const Status rs = quaternionToRotationMatrix(q, &R);
  if (!ok(rs)) return rs;
  return rotationMatrixToHomogeneousTransform(R, t, T);
}

Status homogeneousTransformToPose(const BatchArray& T, BatchArray* pose) {
  if (!pose) return logFailure(Status::InvalidParameter, "homogeneousTransformToPose", "null output");
  const Status st = checkBatch("homogeneousTransformToPose", T, kTransformWidth);
  if (!ok(st)) return st;

  BatchArray R(T.rows(), kRotationWidth);
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) R.col(rotIndex(r, c)) = T.col(tfIndex(r, c));
  }
  BatchArray q;
  const Status qs = rotationMatrixToQuaternion(R, &q);
  if (!ok(qs)) return qs;

  BatchArray out(T.rows(), kPoseWidth);
  for (int r = 0; r < 3; ++r) out.col(r) = T.col(tfIndex(r, 3));
  out.rightCols<4>() = q;
  *pose = std::move(out);
  return Status::Success;
}

Status quaternionConjugate(const BatchArray& q, BatchArray* q_conj) {
  if (!q_conj) return logFailure(Status::InvalidParameter, "quaternionConjugate", "null output");
  const Status st = checkBatch("quaternionConjugate", q, kQuatWidth);
  if (!ok(st)) return st;

  BatchArray out = q;
  out.rightCols<3>() *= -1.0;
  *q_conj = std::move(out);
  return Status::Success;
}

Status quaternionInverse(const BatchArray& q, BatchArray* q_inv) {
  if (!q_inv) return logFailure(Status::InvalidParameter, "quaternionInverse", "null output");
  const Status st = checkBatch("quaternionInverse", q, kQuatWidth);
  if (!ok(st)) return st;

  const Arr n2 = q.rowwise().squaredNorm().array();
  if ((n2 <= 0.0).any()) {
    return logFailure(Status::NonFinite, "quaternionInverse", "zero-norm quaternion");
  }
  BatchArray out = (q.array().colwise() / n2).matrix();
  out.rightCols<3>() *= -1.0;
  *q_inv = std::move(out);
  return Status::Success;
}

Status quaternionNorm(const BatchArray& q, ScalarBatch* norms) {
  if (!norms) return logFailure(Status::InvalidParameter, "quaternionNorm", "null output");
  const Status st = checkBatch("quaternionNorm", q, kQuatWidth);
  if (!ok(st)) return st;

  *norms = q.rowwise().norm();
  return Status::Success;
}

Status quaternionMultiply(const BatchArray& q1, const BatchArray& q2, BatchArray* product) {
  if (!product) return logFailure(Status::InvalidParameter, "quaternionMultiply", "null output");
  const Status st = checkBatchPair("quaternionMultiply", q1, kQuatWidth, q2, kQuatWidth);
  if (!ok(st)) return st;

  const QuatCols a = splitQuat(q1);
  const QuatCols b = splitQuat(q2);
  storeQuat(a.w * b.w - a.x * b.x - a.y * b.y - a.z * b.z,
            a.w * b.x + a.x * b.w + a.y * b.z - a.z * b.y,
            a.w * b.y - a.x * b.z + a.y * b.w + a.z * b.x,
            a.w * b.z + a.x * b.y - a.y * b.x + a.z * b.w,
            product);
  return Status::Success;
}

Status geodesicDistanceBetweenQuaternions(const BatchArray& q1,
                                          const BatchArray& q2,
                                          ScalarBatch* distance) {
  const char* op = "geodesicDistanceBetweenQuaternions";
  if (!distance) return logFailure(Status::InvalidParameter, op, "null output");
  Status st = checkBatchPair(op, q1, kQuatWidth, q2, kQuatWidth);
  if (!ok(st)) return st;

  BatchArray u1, u2;
  st = normalizedQuat(op, q1, &u1, nullptr);
  if (!ok(st)) return st;
  st = normalizedQuat(op, q2, &u2, nullptr);
  if (!ok(st)) return st;

  const Arr dot = (u1.array() * u2.array()).rowwise().sum();
  const Arr a = dot.abs().min(1.0);
  *distance = (2.0 * a.acos()).matrix();
  return Status::Success;
}

Status geodesicDistanceBetweenRotationMatrices(const BatchArray& R1,
                                               const BatchArray& R2,
                                               ScalarBatch* distance) {
  const char* op = "geodesicDistanceBetweenRotationMatrices";
  if (!distance) return logFailure(Status::InvalidParameter, op, "null output");
  const Status st = checkBatchPair(op, R1, kRotationWidth, R2, kRotationWidth);
  if (!ok(st)) return st;

  // trace(R1^T R2) is the elementwise inner product of R1 and R2.
  const Arr tr = (R1.array() * R2.array()).rowwise().sum();
  const Arr c = ((tr - 1.0) * 0.5).max(-1.0).min(1.0);
  *distance = c.acos().matrix();
  return Status::Success;
}

Status quaternionToRotationMatrixBackward(const BatchArray& q,
                                          const BatchArray& grad_R,
                                          BatchArray* grad_q) {
  const char* op = "quaternionToRotationMatrixBackward";
  if (!grad_q) return logFailure(Status::InvalidParameter, op, "null output");
  const Status st = checkBatchPair(op, q, kQuatWidth, grad_R, kRotationWidth);
  if (!ok(st)) return st;

  const QuatCols c = splitQuat(q);
  const Arr g00 = rotCol(grad_R, 0, 0), g01 = rotCol(grad_R, 0, 1), g02 = rotCol(grad_R, 0, 2);
  const Arr g10 = rotCol(grad_R, 1, 0), g11 = rotCol(grad_R, 1, 1), g12 = rotCol(grad_R, 1, 2);
  const Arr g20 = rotCol(grad_R, 2, 0), g21 = rotCol(grad_R, 2, 1), g22 = rotCol(grad_R, 2, 2);

  // Partials of the closed-form expansion, contracted with grad_R.
  const Arr dw = 2.0 * (c.z * (g10 - g01) + c.y * (g02 - g20) + c.x * (g21 - g12));
  const Arr dx = 2.0 * (c.y * (g01 + g10) + c.z * (g02 + g20) + c.w * (g21 - g12)) -
                 4.0 * c.x * (g11 + g22);
  const Arr dy = 2.0 * (c.x * (g01 + g10) + c.w * (g02 - g20) + c.z * (g12 + g21)) -
                 4.0 * c.y * (g00 + g22);
  const Arr dz = 2.0 * (c.w * (g10 - g01) + c.x * (g02 + g20) + c.y * (g12 + g21)) -
                 4.0 * c.z * (g00 + g11);

  storeQuat(dw, dx, dy, dz, grad_q);
  return Status::Success;
}

Status geodesicDistanceBetweenQuaternionsBackward(const BatchArray& q1,
                                                  const BatchArray& q2,
                                                  const ScalarBatch& grad_distance,
                                                  BatchArray* grad_q1,
                                                  BatchArray* grad_q2) {
  const char* op = "geodesicDistanceBetweenQuaternionsBackward";
  if (!grad_q1 || !grad_q2) return logFailure(Status::InvalidParameter, op, "null output");
  Status st = checkBatchPair(op, q1, kQuatWidth, q2, kQuatWidth);
  if (!ok(st)) return st;
  st = checkScalarBatch(op, grad_distance, q1.rows());
  if (!ok(st)) return st;

  BatchArray u1, u2;
  Arr n1, n2;
  st = normalizedQuat(op, q1, &u1, &n1);
  if (!ok(st)) return st;
  st = normalizedQuat(op, q2, &u2, &n2);
  if (!ok(st)) return st;

  const Arr dot = (u1.array() * u2.array()).rowwise().sum();
  const Arr a = dot.abs().min(1.0);

  // d = 2 acos(|c|); d|c|/dc is sign(c), taken as 0 at c == 0.
  const Arr sign = (dot > 0.0).select(Arr::Ones(dot.size()),
                   (dot < 0.0).select(Arr::Constant(dot.size(), -1.0), Arr::Zero(dot.size())));
  const Arr dd_dc = 2.0 * acosDerivative(a, kDefaultThresholds.acos_grad_eps) * sign *
                    grad_distance.array();

  // c = <u1, u2>, u = q / |q|  =>  dc/dq1 = (u2 - c u1) / |q1|.
  const BatchArray dc_dq1 = ((u2.array() - u1.array().colwise() * dot).colwise() / n1).matrix();
  const BatchArray dc_dq2 = ((u1.array() - u2.array().colwise() * dot).colwise() / n2).matrix();
  *grad_q1 = (dc_dq1.array().colwise() * dd_dc).matrix();
  *grad_q2 = (dc_dq2.array().colwise() * dd_dc).matrix();
  return Status::Success;
}

Status geodesicDistanceBetweenRotationMatricesBackward(const BatchArray& R1,
                                                       const BatchArray& R2,
                                                       const ScalarBatch& grad_distance,
                                                       BatchArray* grad_R1,
                                                       BatchArray* grad_R2) {
  const char* op = "geodesicDistanceBetweenRotationMatricesBackward";
  if (!grad_R1 || !grad_R2) return logFailure(Status::InvalidParameter, op, "null output");
  Status st = checkBatchPair(op, R1, kRotationWidth, R2, kRotationWidth);
  if (!ok(st)) return st;
  st = checkScalarBatch(op, grad_distance, R1.rows());
  if (!ok(st)) return st;

  const Arr tr = (R1.array() * R2.array()).rowwise().sum();
  const Arr c_raw = (tr - 1.0) * 0.5;
  const Mask clamped = (c_raw > 1.0) || (c_raw < -1.0);
  const Arr c = c_raw.max(-1.0).min(1.0);

  // d = acos(c), c = (tr - 1) / 2, d tr / dR1 = R2, d tr / dR2 = R1.
  const Arr dd_dtr = clamped.select(Arr::Zero(c.size()),
                                    0.5 * acosDerivative(c, kDefaultThresholds.acos_grad_eps)) *
                     grad_distance.array();
  *grad_R1 = (R2.array().colwise() * dd_dtr).matrix();
  *grad_R2 = (R1.array().colwise() * dd_dtr).matrix();
  return Status::Success;
}

}  // namespace batchkin::core
