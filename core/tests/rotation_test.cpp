#include <cassert>
#include <cmath>
#include <iostream>
#include <random>

#include <Eigen/Core>

#include "batchkin/core/common/logger.hpp"
#include "batchkin/core/math/batch.hpp"
#include "batchkin/core/math/rotation.hpp"

using batchkin::core::BatchArray;
using batchkin::core::ScalarBatch;
using batchkin::core::Mat3;
using batchkin::core::Status;
using batchkin::core::ok;
namespace bk = batchkin::core;

static bool near(double a, double b, double tol) {
  return std::abs(a - b) <= tol;
}

static BatchArray rows(std::initializer_list<std::initializer_list<double>> values) {
  BatchArray out(static_cast<Eigen::Index>(values.size()),
                 static_cast<Eigen::Index>(values.begin()->size()));
  Eigen::Index i = 0;
  for (const auto& r : values) {
    Eigen::Index j = 0;
    for (double v : r) out(i, j++) = v;
    ++i;
  }
  return out;
}

static BatchArray randomUnitQuaternions(Eigen::Index n, std::mt19937_64* rng) {
  std::normal_distribution<double> g(0.0, 1.0);
  BatchArray q(n, 4);
  for (Eigen::Index i = 0; i < n; ++i) {
    for (int k = 0; k < 4; ++k) q(i, k) = g(*rng);
    q.row(i).normalize();
  }
  return q;
}

static void test_quaternion_to_rotation_matrix() {
  // Identity maps to the exact identity.
  BatchArray R;
  assert(ok(bk::quaternionToRotationMatrix(rows({{1.0, 0.0, 0.0, 0.0}}), &R)));
  assert(R.rows() == 1 && R.cols() == 9);
  assert(bk::rotationAt(R, 0) == Mat3::Identity());

  // 180 deg about (0.924, 0.383, 0)
  assert(ok(bk::quaternionToRotationMatrix(rows({{0.0, 0.92387953, 0.38268343, 0.0}}), &R)));
  Mat3 expected;
  expected << 0.7071068, 0.7071068, 0.0,
              0.7071068, -0.7071068, 0.0,
              0.0, 0.0, -1.0;
  assert((bk::rotationAt(R, 0) - expected).cwiseAbs().maxCoeff() < 1e-6);
}

static void test_rotation_matrix_to_quaternion() {
  std::mt19937_64 rng(7);
  BatchArray q = randomUnitQuaternions(200, &rng);
  // Exercise every Shepperd branch explicitly.
  q.row(0) << 1.0, 0.0, 0.0, 0.0;
  q.row(1) << 0.0, 1.0, 0.0, 0.0;
  q.row(2) << 0.0, 0.0, 1.0, 0.0;
  q.row(3) << 0.0, 0.0, 0.0, 1.0;

  BatchArray R, q_back;
  assert(ok(bk::quaternionToRotationMatrix(q, &R)));
  assert(ok(bk::rotationMatrixToQuaternion(R, &q_back)));
  assert(q_back.rows() == q.rows());

  for (Eigen::Index i = 0; i < q.rows(); ++i) {
    assert(q_back(i, 0) >= 0.0);
    assert(near(q_back.row(i).norm(), 1.0, 1e-12));
    // Same rotation up to the sign of q.
    const double d = std::abs(q.row(i).dot(q_back.row(i)));
    assert(near(d, 1.0, 1e-9));
  }
}

static void test_homogeneous_transform() {
  const BatchArray q = rows({{1.0, 0.0, 0.0, 0.0}, {0.7071068, 0.0, 0.0, 0.7071068}});
  const BatchArray t = rows({{1.0, 2.0, 3.0}, {-1.0, 0.5, 0.0}});

  BatchArray T;
  assert(ok(bk::quaternionAndTranslationToHomogeneousTransform(q, t, &T)));
  assert(T.rows() == 2 && T.cols() == 16);
  for (Eigen::Index i = 0; i < 2; ++i) {
    const bk::Mat4 m = bk::transformAt(T, i);
    assert(m(3, 0) == 0.0 && m(3, 1) == 0.0 && m(3, 2) == 0.0 && m(3, 3) == 1.0);
    assert(m(0, 3) == t(i, 0) && m(1, 3) == t(i, 1) && m(2, 3) == t(i, 2));
  }
  // 90 deg about +z maps x to y.
  const bk::Mat4 m1 = bk::transformAt(T, 1);
  assert(near(m1(1, 0), 1.0, 1e-6));
  assert(near(m1(0, 1), -1.0, 1e-6));

  BatchArray pose;
  assert(ok(bk::homogeneousTransformToPose(T, &pose)));
  assert(pose.rows() == 2 && pose.cols() == 7);
  assert(near(pose(1, 0), -1.0, 1e-12));
  assert(near(pose(1, 3), 0.7071068, 1e-6));
  assert(near(pose(1, 6), 0.7071068, 1e-6));
}

static void test_geodesic_distance_between_quaternions() {
  // Rotation about +x by 0.25 rad
  ScalarBatch d;
  assert(ok(bk::geodesicDistanceBetweenQuaternions(rows({{1.0, 0.0, 0.0, 0.0}}),
                                                   rows({{0.9921977, 0.1246747, 0.0, 0.0}}),
                                                   &d)));
  assert(d.size() == 1);
  assert(near(d(0), 0.25, 1e-6));

  // Antipodal orientations: pi, never NaN.
  assert(ok(bk::geodesicDistanceBetweenQuaternions(rows({{1.0, 0.0, 0.0, 0.0}}),
                                                   rows({{0.0, 0.92387953, 0.38268343, 0.0}}),
                                                   &d)));
  assert(!std::isnan(d(0)));
  assert(near(d(0), M_PI, 1e-3));

  // q and -q are the same rotation; identity vs identity is exactly zero.
  assert(ok(bk::geodesicDistanceBetweenQuaternions(rows({{1.0, 0.0, 0.0, 0.0}, {0.5, 0.5, 0.5, 0.5}}),
                                                   rows({{1.0, 0.0, 0.0, 0.0}, {-0.5, -0.5, -0.5, -0.5}}),
                                                   &d)));
  assert(d(0) == 0.0);
  assert(d(1) >= 0.0 && d(1) < 1e-6);
}

static void test_geodesic_distance_between_rotation_matrices() {
  Mat3 Rz;
  Rz << 0.5403023, -0.8414710, 0.0,
        0.8414710, 0.5403023, 0.0,
        0.0, 0.0, 1.0;
  BatchArray R1 = bk::identityRotations(1);
  BatchArray R2(1, 9);
  bk::setRotationAt(&R2, 0, Rz);

  ScalarBatch d;
  assert(ok(bk::geodesicDistanceBetweenRotationMatrices(R1, R2, &d)));
  assert(near(d(0), 1.0, 5e-4));

  Mat3 Rpi;
  Rpi << 0.7071068, 0.7071068, 0.0,
         0.7071068, -0.7071068, 0.0,
         0.0, 0.0, -1.0;
  bk::setRotationAt(&R2, 0, Rpi);
  assert(ok(bk::geodesicDistanceBetweenRotationMatrices(R1, R2, &d)));
  assert(near(d(0), M_PI, 5e-4));

  assert(ok(bk::geodesicDistanceBetweenRotationMatrices(R1, R1, &d)));
  assert(d(0) == 0.0);
}

static void test_distance_agreement() {
  std::mt19937_64 rng(11);
  const BatchArray q1 = randomUnitQuaternions(500, &rng);
  const BatchArray q2 = randomUnitQuaternions(500, &rng);

  BatchArray R1, R2;
  assert(ok(bk::quaternionToRotationMatrix(q1, &R1)));
  assert(ok(bk::quaternionToRotationMatrix(q2, &R2)));

  ScalarBatch dq, dR;
  assert(ok(bk::geodesicDistanceBetweenQuaternions(q1, q2, &dq)));
  assert(ok(bk::geodesicDistanceBetweenRotationMatrices(R1, R2, &dR)));
  assert(dq.size() == 500 && dR.size() == 500);
  for (Eigen::Index i = 0; i < dq.size(); ++i) {
    assert(dq(i) >= 0.0 && dq(i) <= M_PI);
    assert(near(dq(i), dR(i), 5e-3));
  }
}

static void test_conjugate_inverse_norm_multiply() {
  // 90 deg about +z
  const BatchArray q0 = rows({{1, 0, 0, 0}, {0.7071068, 0, 0, 0.7071068}});
  BatchArray conj;
  assert(ok(bk::quaternionConjugate(q0, &conj)));
  assert(conj.rows() == 2 && conj.cols() == 4);
  assert((conj - rows({{1, 0, 0, 0}, {0.7071068, 0, 0, -0.7071068}})).cwiseAbs().maxCoeff() < 1e-12);

  ScalarBatch norms;
  assert(ok(bk::quaternionNorm(rows({{1, 0, 0, 0}, {0.7071068, 0, 0, 0.7071068}, {1, 1, 0, 0}}), &norms)));
  assert(norms.size() == 3);
  assert(near(norms(0), 1.0, 1e-7));
  assert(near(norms(1), 1.0, 1e-7));
  assert(near(norms(2), std::sqrt(2.0), 1e-12));

  const BatchArray q1s = rows({{1, 0, 0, 0},
                               {1, 0, 0, 0},
                               {0.7071068, 0, 0, 0.7071068},
                               {0, 0.7071068, 0, 0.7071068}});
  const BatchArray q2s = rows({{1, 0, 0, 0},
                               {0.7071068, 0, 0, 0.7071068},
                               {0.7071068, 0, 0, 0.7071068},
                               {0.7071068, 0, 0, 0.7071068}});
  const BatchArray expected = rows({{1, 0, 0, 0},
                                    {0.7071068, 0, 0, 0.7071068},
                                    {0, 0, 0, 1},
                                    {-0.5, 0.5, -0.5, 0.5}});
  BatchArray product;
  assert(ok(bk::quaternionMultiply(q1s, q2s, &product)));
  assert((product - expected).cwiseAbs().maxCoeff() < 1e-6);

  // Unit quaternions: inverse == conjugate and q ⊗ q* == 1.
  std::mt19937_64 rng(3);
  const BatchArray q = randomUnitQuaternions(64, &rng);
  BatchArray inv, qc, ident;
  assert(ok(bk::quaternionInverse(q, &inv)));
  assert(ok(bk::quaternionConjugate(q, &qc)));
  assert((inv - qc).cwiseAbs().maxCoeff() < 1e-12);
  assert(ok(bk::quaternionMultiply(q, qc, &ident)));
  for (Eigen::Index i = 0; i < ident.rows(); ++i) {
    assert(near(ident(i, 0), 1.0, 1e-12));
    assert(ident.row(i).tail<3>().cwiseAbs().maxCoeff() < 1e-12);
  }

  // Non-unit: q^-1 = q* / |q|^2
  assert(ok(bk::quaternionInverse(rows({{2, 0, 0, 0}}), &inv)));
  assert(near(inv(0, 0), 0.5, 1e-15));
}

static void test_gradients() {
  // Near-identical orientations: distance ~0 and the gradient stays finite.
  const BatchArray q1 = rows({{1.0, 0.0, 0.0, 0.0}});
  const BatchArray q2 = rows({{1.0, -0.000209831749089, -0.000002384310619, 0.000092415713879}});
  BatchArray m1, m2;
  assert(ok(bk::quaternionToRotationMatrix(q1, &m1)));
  assert(ok(bk::quaternionToRotationMatrix(q2, &m2)));

  ScalarBatch d;
  assert(ok(bk::geodesicDistanceBetweenRotationMatrices(m1, m2, &d)));
  assert(near(d(0), 0.0, 5e-4));

  const ScalarBatch g = ScalarBatch::Ones(1);  // d mean / d distance for N == 1
  BatchArray gR1, gR2, gq1, gq2;
  assert(ok(bk::geodesicDistanceBetweenRotationMatricesBackward(m1, m2, g, &gR1, &gR2)));
  assert(ok(bk::quaternionToRotationMatrixBackward(q1, gR1, &gq1)));
  assert(ok(bk::quaternionToRotationMatrixBackward(q2, gR2, &gq2)));
  assert(gq1.allFinite() && gq2.allFinite());

  // Identical inputs sit on the acos singularity: the gradient is defined as zero.
  assert(ok(bk::geodesicDistanceBetweenQuaternionsBackward(q1, q1, g, &gq1, &gq2)));
  assert(gq1.isZero() && gq2.isZero());

  // Finite-difference checks at generic points.
  const BatchArray a = rows({{0.9, 0.1, -0.3, 0.2}});
  const BatchArray b = rows({{0.4, -0.5, 0.6, 0.1}});
  const double eps = 1e-6;

  assert(ok(bk::geodesicDistanceBetweenQuaternionsBackward(a, b, g, &gq1, &gq2)));
  for (int k = 0; k < 4; ++k) {
    BatchArray ap = a, am = a;
    ap(0, k) += eps;
    am(0, k) -= eps;
    ScalarBatch dp, dm;
    assert(ok(bk::geodesicDistanceBetweenQuaternions(ap, b, &dp)));
    assert(ok(bk::geodesicDistanceBetweenQuaternions(am, b, &dm)));
    assert(near((dp(0) - dm(0)) / (2.0 * eps), gq1(0, k), 1e-6));
  }

  // d(sum R .* W)/dq through quaternionToRotationMatrix.
  BatchArray W(1, 9);
  W << 0.3, -1.0, 0.5, 2.0, 0.1, -0.7, 0.4, 0.9, -0.2;
  assert(ok(bk::quaternionToRotationMatrixBackward(a, W, &gq1)));
  for (int k = 0; k < 4; ++k) {
    BatchArray ap = a, am = a;
    ap(0, k) += eps;
    am(0, k) -= eps;
    BatchArray Rp, Rm;
    assert(ok(bk::quaternionToRotationMatrix(ap, &Rp)));
    assert(ok(bk::quaternionToRotationMatrix(am, &Rm)));
    const double fd = ((Rp - Rm).array() * W.array()).sum() / (2.0 * eps);
    assert(near(fd, gq1(0, k), 1e-6));
  }
}

static void test_precondition_rejection() {
  BatchArray R;
  ScalarBatch d;

  // No leading batch row.
  assert(bk::quaternionToRotationMatrix(BatchArray(0, 4), &R) == Status::Precondition);
  // Wrong trailing shape.
  assert(bk::quaternionToRotationMatrix(BatchArray::Zero(3, 3), &R) == Status::ShapeMismatch);
  assert(bk::geodesicDistanceBetweenRotationMatrices(BatchArray::Zero(1, 4),
                                                     BatchArray::Zero(1, 9), &d) ==
         Status::ShapeMismatch);
  // Batch sizes must agree.
  assert(bk::quaternionMultiply(BatchArray::Zero(3, 4), BatchArray::Zero(2, 4), &R) ==
         Status::Precondition);
  // Non-finite input.
  BatchArray q = rows({{1.0, 0.0, 0.0, 0.0}});
  q(0, 2) = std::nan("");
  assert(bk::quaternionNorm(q, &d) == Status::NonFinite);
  // Zero quaternion has no inverse.
  assert(bk::quaternionInverse(BatchArray::Zero(1, 4), &R) == Status::NonFinite);
  // Null output.
  assert(bk::quaternionConjugate(rows({{1, 0, 0, 0}}), nullptr) == Status::InvalidParameter);

  // Outputs are untouched on failure.
  BatchArray keep = rows({{5, 5, 5, 5}});
  assert(!ok(bk::quaternionConjugate(BatchArray::Zero(1, 3), &keep)));
  assert(keep(0, 0) == 5.0);
}

static void silentSink(bk::LogLevel, const std::string&) {}

int main() {
  test_quaternion_to_rotation_matrix();
  test_rotation_matrix_to_quaternion();
  test_homogeneous_transform();
  test_geodesic_distance_between_quaternions();
  test_geodesic_distance_between_rotation_matrices();
  test_distance_agreement();
  test_conjugate_inverse_norm_multiply();
  test_gradients();

  bk::setLogSink(&silentSink);
  test_precondition_rejection();
  bk::setLogSink(nullptr);

  std::cout << "batchkin_rotation_test: PASS\n";
  return 0;
}
