#include "batchkin/core/math/types.hpp"

namespace batchkin::core {

Mat4 matrix4FromTransform(const Transform& T) {
  Mat4 out = Mat4::Identity();
  out.block<3, 3>(0, 0) = T.linear();
  out.block<3, 1>(0, 3) = T.translation();
  return out;
}

Mat3 rotationAt(const BatchArray& R, Eigen::Index i) {
  Mat3 m;
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) m(r, c) = R(i, rotIndex(r, c));
  }
  return m;
}

Mat4 transformAt(const BatchArray& T, Eigen::Index i) {
  Mat4 m;
  for (int r = 0; r < 4; ++r) {
    for (int c = 0; c < 4; ++c) m(r, c) = T(i, tfIndex(r, c));
  }
  return m;
}

void setRotationAt(BatchArray* R, Eigen::Index i, const Mat3& m) {
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) (*R)(i, rotIndex(r, c)) = m(r, c);
  }
}

Vec7 poseFromTransform(const Transform& T) {
  Quat q(T.linear());
  q.normalize();
  if (q.w() < 0.0) q.coeffs() *= -1.0;

  Vec7 out;
  out.head<3>() = T.translation();
  out(3) = q.w();
  out(4) = q.x();
  out(5) = q.y();
  out(6) = q.z();
  return out;
}

}  // namespace batchkin::core
