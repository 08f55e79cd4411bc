#pragma once
#include "batchkin/core/common/status.hpp"
#include "batchkin/core/math/types.hpp"

namespace batchkin::core {

// Entry checks shared by every batched operation. Each returns Success or the
// first violated precondition and logs one error line prefixed with `op`.
//
// - N >= 1                                     -> Precondition
// - cols == width                              -> ShapeMismatch
// - all entries finite                         -> NonFinite
Status checkBatch(const char* op, const BatchArray& a, int width);

// Same as checkBatch for both arguments, plus a.rows() == b.rows() -> Precondition.
Status checkBatchPair(const char* op,
                      const BatchArray& a, int width_a,
                      const BatchArray& b, int width_b);

Status checkScalarBatch(const char* op, const ScalarBatch& s, Eigen::Index rows);

// Identity rotation / transform broadcast to `n` rows.
BatchArray identityRotations(Eigen::Index n);
BatchArray identityTransforms(Eigen::Index n);

// Batched 4x4 product: out.row(i) = a(i) * b(i). `b` may have a single row, in which
// case it is broadcast across the batch. Each of the 12 non-trivial output entries is
// one column-array expression over the whole batch; the bottom row stays (0,0,0,1).
void composeTransforms(const BatchArray& a, const BatchArray& b, BatchArray* out);

// Row-broadcast of a single transform to `n` rows.
BatchArray broadcastTransform(const Mat4& m, Eigen::Index n);

}  // namespace batchkin::core
