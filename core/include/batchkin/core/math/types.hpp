#pragma once
#include <Eigen/Core>
#include <Eigen/Geometry>

namespace batchkin::core {

// Fundamental math types and conventions used across the library.
// - `Transform` represents an SE(3) rigid transform and is composed by post-multiplication
//   (A * B applies B, then A).
// - Quaternions in batches are scalar-first [w, x, y, z] and follow the Hamilton product.
// - Units are meters and radians.
using Vec3 = Eigen::Vector3d;
using Mat3 = Eigen::Matrix3d;
using Mat4 = Eigen::Matrix4d;
using Quat = Eigen::Quaterniond;
using Vec7 = Eigen::Matrix<double, 7, 1>;

using Transform = Eigen::Isometry3d;

// Batched arrays. Rows are samples and the leading batch dimension is always present,
// even for a single sample. Trailing shapes are flattened row-major:
//   quaternion  (N,4)   [w x y z]
//   rotation    (N,3,3) -> (N,9)  [r00 r01 r02 r10 r11 r12 r20 r21 r22]
//   transform   (N,4,4) -> (N,16) row-major 4x4
//   translation (N,3)
//   pose        (N,7)   [x y z qw qx qy qz]
//   joints      (N,ndof)
using BatchArray = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using ScalarBatch = Eigen::VectorXd;

inline constexpr int kQuatWidth = 4;
inline constexpr int kRotationWidth = 9;
inline constexpr int kTransformWidth = 16;
inline constexpr int kTranslationWidth = 3;
inline constexpr int kPoseWidth = 7;

// Flat column index of element (r, c) in a (N,3,3) / (N,4,4) batch.
inline constexpr int rotIndex(int r, int c) { return 3 * r + c; }
inline constexpr int tfIndex(int r, int c) { return 4 * r + c; }

Mat4 matrix4FromTransform(const Transform& T);

// Per-sample views used by tests and the reference solver.
Mat3 rotationAt(const BatchArray& R, Eigen::Index i);
Mat4 transformAt(const BatchArray& T, Eigen::Index i);
void setRotationAt(BatchArray* R, Eigen::Index i, const Mat3& m);

// [x y z qw qx qy qz] for a single transform (w >= 0).
Vec7 poseFromTransform(const Transform& T);

}  // namespace batchkin::core
