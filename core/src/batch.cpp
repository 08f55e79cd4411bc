// Batch validation and the batched 4x4 product used by the FK engine.
//
// Batched matrices are stored one sample per row, so every matrix entry is a column of
// the batch. A product is then 12 column-array expressions over all N samples.
#include "batchkin/core/math/batch.hpp"

#include "batchkin/core/common/logger.hpp"

#include <string>

namespace batchkin::core {

Status checkBatch(const char* op, const BatchArray& a, int width) {
  if (a.rows() < 1) {
    return logFailure(Status::Precondition, op, "batch must have at least one row");
  }
  if (a.cols() != width) {
    return logFailure(Status::ShapeMismatch, op,
                      "expected " + std::to_string(width) + " columns, got " +
                      std::to_string(a.cols()));
  }
  if (!a.allFinite()) {
    return logFailure(Status::NonFinite, op, "batch contains NaN/Inf");
  }
  return Status::Success;
}

Status checkBatchPair(const char* op,
                      const BatchArray& a, int width_a,
                      const BatchArray& b, int width_b) {
  Status st = checkBatch(op, a, width_a);
  if (!ok(st)) return st;
  st = checkBatch(op, b, width_b);
  if (!ok(st)) return st;
  if (a.rows() != b.rows()) {
    return logFailure(Status::Precondition, op,
                      "batch sizes differ: " + std::to_string(a.rows()) + " vs " +
                      std::to_string(b.rows()));
  }
  return Status::Success;
}

Status checkScalarBatch(const char* op, const ScalarBatch& s, Eigen::Index rows) {
  if (s.size() != rows) {
    return logFailure(Status::Precondition, op,
                      "scalar batch has " + std::to_string(s.size()) + " rows, expected " +
                      std::to_string(rows));
  }
  if (!s.allFinite()) {
    return logFailure(Status::NonFinite, op, "scalar batch contains NaN/Inf");
  }
  return Status::Success;
}

BatchArray identityRotations(Eigen::Index n) {
  BatchArray R = BatchArray::Zero(n, kRotationWidth);
  R.col(rotIndex(0, 0)).setOnes();
  R.col(rotIndex(1, 1)).setOnes();
  R.col(rotIndex(2, 2)).setOnes();
  return R;
}

BatchArray identityTransforms(Eigen::Index n) {
  BatchArray T = BatchArray::Zero(n, kTransformWidth);
  for (int k = 0; k < 4; ++k) T.col(tfIndex(k, k)).setOnes();
  return T;
}

BatchArray broadcastTransform(const Mat4& m, Eigen::Index n) {
  BatchArray T(n, kTransformWidth);
  for (int r = 0; r < 4; ++r) {
    for (int c = 0; c < 4; ++c) T.col(tfIndex(r, c)).setConstant(m(r, c));
  }
  return T;
}

void composeTransforms(const BatchArray& a, const BatchArray& b, BatchArray* out) {
  const Eigen::Index n = a.rows();
  const bool broadcast = b.rows() == 1 && n != 1;

  // `out` may alias `a` (running = running * local); write to a fresh buffer.
  BatchArray res(n, kTransformWidth);
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 4; ++c) {
      auto dst = res.col(tfIndex(r, c));
      if (broadcast) {
        dst = a.col(tfIndex(r, 0)) * b(0, tfIndex(0, c)) +
              a.col(tfIndex(r, 1)) * b(0, tfIndex(1, c)) +
              a.col(tfIndex(r, 2)) * b(0, tfIndex(2, c));
      } else {
        dst = (a.col(tfIndex(r, 0)).array() * b.col(tfIndex(0, c)).array() +
               a.col(tfIndex(r, 1)).array() * b.col(tfIndex(1, c)).array() +
               a.col(tfIndex(r, 2)).array() * b.col(tfIndex(2, c)).array()).matrix();
      }
      if (c == 3) dst += a.col(tfIndex(r, 3));
    }
  }
  res.col(tfIndex(3, 0)).setZero();
  res.col(tfIndex(3, 1)).setZero();
  res.col(tfIndex(3, 2)).setZero();
  res.col(tfIndex(3, 3)).setOnes();
  *out = std::move(res);
}

}  // namespace batchkin::core
